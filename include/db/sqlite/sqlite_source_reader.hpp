#pragma once

#include "db/isource_reader.hpp"
#include "db/sqlite/sqlite_connection.hpp"

#include <memory>
#include <string>
#include <vector>

namespace schemaport {

/**
 * @brief Source reader over an existing SQLite file
 *
 * Reads the catalog from sqlite_master and the table_info / foreign_key_list
 * pragmas. The file is opened read-only.
 */
class SqliteSourceReader : public ISourceReader {
public:
    /**
     * @throws MigrationError (CONNECTION_ERROR) when the file cannot be opened
     */
    explicit SqliteSourceReader(const std::string& path);

    [[nodiscard]] std::vector<std::string> list_tables() override;
    [[nodiscard]] TableMetadata reflect_table(const std::string& table_name) override;
    [[nodiscard]] std::vector<Row> read_rows(const TableMetadata& table) override;

private:
    [[nodiscard]] std::vector<std::string> primary_key_of(const std::string& table_name);

    std::unique_ptr<SqliteConnection> conn_;
};

} // namespace schemaport
