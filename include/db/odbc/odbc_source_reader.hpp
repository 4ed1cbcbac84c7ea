#pragma once

#include "config/config_types.hpp"
#include "db/isource_reader.hpp"
#include "db/odbc/odbc_connection.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace schemaport {

/**
 * @brief Source reader for Access files through the ODBC catalog functions
 *
 * The Access driver does not implement SQLPrimaryKeys or SQLForeignKeys, so
 * both have fallbacks: primary keys come from the unique index named
 * "PrimaryKey" (SQLStatistics), foreign keys from MSysRelationships when the
 * driver is allowed to read it. When neither works the table has no declared
 * foreign keys and the relationship augmenter fills in the conventional ones.
 */
class OdbcSourceReader : public ISourceReader {
public:
    /**
     * @throws MigrationError (CONNECTION_ERROR) when the file cannot be opened
     */
    OdbcSourceReader(const std::string& path, const SourceConfig& config);

    [[nodiscard]] std::vector<std::string> list_tables() override;
    [[nodiscard]] TableMetadata reflect_table(const std::string& table_name) override;
    [[nodiscard]] std::vector<Row> read_rows(const TableMetadata& table) override;

private:
    [[nodiscard]] std::vector<std::string> primary_key_of(const std::string& table_name);
    [[nodiscard]] std::vector<std::string> primary_key_from_statistics(const std::string& table_name);

    struct ForeignKeyRow {
        std::string column;
        std::string target_table;
        std::string target_column;
    };
    [[nodiscard]] std::vector<ForeignKeyRow> foreign_keys_of(const std::string& table_name);
    [[nodiscard]] std::vector<ForeignKeyRow> foreign_keys_from_relationships(const std::string& table_name);

    std::unique_ptr<OdbcConnection> conn_;
};

} // namespace schemaport
