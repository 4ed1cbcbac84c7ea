#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace schemaport {

/**
 * @brief Renders SQLite DDL and DML for refined tables
 *
 * Logical types map to SQLite declared types:
 *   IDENTIFIER -> CHAR(36)      DATE     -> DATE      DATETIME -> DATETIME
 *   BOOLEAN    -> BOOLEAN       ENUM     -> VARCHAR(n) with an optional CHECK
 *   INTEGER    -> INTEGER       FLOAT    -> FLOAT     NUMERIC  -> NUMERIC
 *   TEXT       -> VARCHAR/TEXT  BLOB     -> BLOB
 *
 * Indexes are never emitted; only primary and foreign keys.
 */
class DdlBuilder {
public:
    explicit DdlBuilder(const TargetConfig& config);

    [[nodiscard]] std::string create_table(const TableMetadata& table) const;

    /**
     * @brief INSERT with one positional parameter per column
     */
    [[nodiscard]] static std::string insert_statement(const std::string& table,
                                                      const std::vector<std::string>& columns);

    [[nodiscard]] static std::string column_type(const ColumnMetadata& column);

    /**
     * @brief CHECK (...) clause for an enum column, empty when it has no domain
     */
    [[nodiscard]] static std::string enum_check(const ColumnMetadata& column);

private:
    bool enum_constraints_;
    bool without_rowid_;
};

} // namespace schemaport
