#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace schemaport {

/**
 * @brief Abstract source database reader
 *
 * Each source kind reads its own catalog (ODBC catalog functions for
 * Access, sqlite_master and PRAGMAs for SQLite). Readers only report the
 * physical schema; refinement happens afterwards.
 *
 * All methods throw MigrationError on failure.
 */
class ISourceReader {
public:
    virtual ~ISourceReader() = default;

    /**
     * @brief User tables, system tables excluded
     */
    [[nodiscard]] virtual std::vector<std::string> list_tables() = 0;

    /**
     * @brief Physical columns in ordinal order, primary key and declared foreign keys
     */
    [[nodiscard]] virtual TableMetadata reflect_table(const std::string& table_name) = 0;

    /**
     * @brief Every row of the table, positional against table.columns
     */
    [[nodiscard]] virtual std::vector<Row> read_rows(const TableMetadata& table) = 0;
};

} // namespace schemaport
