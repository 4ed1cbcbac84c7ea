#include "db/odbc/odbc_source_reader.hpp"
#include "db/odbc/access_type_map.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace schemaport {

namespace {

// Result-set columns of the catalog functions (0-based)
constexpr size_t kTablesName = 2;

constexpr size_t kColumnsName = 3;
constexpr size_t kColumnsDataType = 4;
constexpr size_t kColumnsTypeName = 5;
constexpr size_t kColumnsOrdinal = 16;

constexpr size_t kPkColumn = 3;
constexpr size_t kPkSeq = 4;

constexpr size_t kStatsIndexName = 5;
constexpr size_t kStatsOrdinal = 7;
constexpr size_t kStatsColumn = 8;

constexpr size_t kFkPkTable = 2;
constexpr size_t kFkPkColumn = 3;
constexpr size_t kFkFkColumn = 7;

constexpr const char* kPrimaryKeyIndex = "PrimaryKey";

std::string text_at(const Row& row, size_t index) {
    if (index >= row.size()) return "";
    if (const auto* s = std::get_if<std::string>(&row[index])) return *s;
    return "";
}

int64_t int_at(const Row& row, size_t index) {
    if (index >= row.size()) return 0;
    if (const auto* i = std::get_if<int64_t>(&row[index])) return *i;
    if (const auto* s = std::get_if<std::string>(&row[index])) {
        return utils::try_parse_int<int64_t>(*s).value_or(0);
    }
    return 0;
}

// Access quotes identifiers with brackets
std::string bracket(const std::string& name) {
    return "[" + name + "]";
}

SQLCHAR* sql_text(std::string& s) {
    return reinterpret_cast<SQLCHAR*>(s.data());
}

} // anonymous namespace

OdbcSourceReader::OdbcSourceReader(const std::string& path, const SourceConfig& config)
    : conn_(OdbcConnection::connect(path, config)) {}

std::vector<std::string> OdbcSourceReader::list_tables() {
    auto stmt = conn_->statement();
    std::string table_type = "TABLE";
    stmt.check(SQLTables(stmt.get(), nullptr, 0, nullptr, 0, nullptr, 0,
                         sql_text(table_type), SQL_NTS),
               ErrorCategory::CONNECTION_ERROR, "SQLTables");

    std::vector<std::string> tables;
    for (const auto& row : OdbcConnection::fetch_all(stmt)) {
        std::string name = text_at(row, kTablesName);
        if (name.empty() || utils::istarts_with(name, "MSys") || name.front() == '~') {
            continue;
        }
        tables.push_back(std::move(name));
    }
    std::sort(tables.begin(), tables.end());
    return tables;
}

TableMetadata OdbcSourceReader::reflect_table(const std::string& table_name) {
    std::vector<std::pair<int64_t, ColumnMetadata>> ordered;
    {
        auto stmt = conn_->statement();
        std::string name = table_name;
        stmt.check(SQLColumns(stmt.get(), nullptr, 0, nullptr, 0,
                              sql_text(name), SQL_NTS, nullptr, 0),
                   ErrorCategory::EXTRACTION_ERROR, std::format("SQLColumns({})", table_name));

        for (const auto& row : OdbcConnection::fetch_all(stmt)) {
            const auto sql_type = static_cast<SQLSMALLINT>(int_at(row, kColumnsDataType));
            ColumnMetadata column(text_at(row, kColumnsName),
                                  AccessTypeMap::build_type_info(sql_type, text_at(row, kColumnsTypeName)));
            ordered.emplace_back(int_at(row, kColumnsOrdinal), std::move(column));
        }
    }

    if (ordered.empty()) {
        throw MigrationError(ErrorCategory::EXTRACTION_ERROR,
            std::format("Cannot reflect table {}: no columns", table_name));
    }
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    TableMetadata table(table_name);
    for (auto& [ordinal, column] : ordered) {
        table.add_column(std::move(column));
    }

    const auto pk = primary_key_of(table_name);
    for (size_t i = 0; i < pk.size(); ++i) {
        if (auto* column = table.find_column(pk[i])) {
            column->is_primary_key = true;
            column->pk_position = static_cast<int>(i + 1);
        }
    }

    for (const auto& fk : foreign_keys_of(table_name)) {
        if (auto* column = table.find_column(fk.column)) {
            column->foreign_keys.emplace_back(fk.target_table, fk.target_column);
        }
    }
    return table;
}

std::vector<Row> OdbcSourceReader::read_rows(const TableMetadata& table) {
    std::string sql = "SELECT ";
    for (size_t i = 0; i < table.columns.size(); ++i) {
        if (i > 0) sql += ", ";
        sql += bracket(table.columns[i].name);
    }
    sql += " FROM ";
    sql += bracket(table.name);

    auto stmt = conn_->statement();
    stmt.check(SQLExecDirect(stmt.get(), sql_text(sql), SQL_NTS),
               ErrorCategory::EXTRACTION_ERROR, std::format("Reading {}", table.name));
    return OdbcConnection::fetch_all(stmt);
}

std::vector<std::string> OdbcSourceReader::primary_key_of(const std::string& table_name) {
    std::vector<std::pair<int64_t, std::string>> keyed;
    {
        auto stmt = conn_->statement();
        std::string name = table_name;
        const SQLRETURN ret = SQLPrimaryKeys(stmt.get(), nullptr, 0, nullptr, 0, sql_text(name), SQL_NTS);
        if (!SQL_SUCCEEDED(ret)) {
            utils::log::debug(std::format("SQLPrimaryKeys unavailable for {}: {}",
                                          table_name, stmt.diagnostics()));
            return primary_key_from_statistics(table_name);
        }
        for (const auto& row : OdbcConnection::fetch_all(stmt)) {
            keyed.emplace_back(int_at(row, kPkSeq), text_at(row, kPkColumn));
        }
    }

    if (keyed.empty()) {
        return primary_key_from_statistics(table_name);
    }
    std::sort(keyed.begin(), keyed.end());

    std::vector<std::string> result;
    for (auto& [seq, column] : keyed) {
        result.push_back(std::move(column));
    }
    return result;
}

std::vector<std::string> OdbcSourceReader::primary_key_from_statistics(const std::string& table_name) {
    auto stmt = conn_->statement();
    std::string name = table_name;
    const SQLRETURN ret = SQLStatistics(stmt.get(), nullptr, 0, nullptr, 0, sql_text(name), SQL_NTS,
                                        SQL_INDEX_UNIQUE, SQL_QUICK);
    if (!SQL_SUCCEEDED(ret)) {
        utils::log::warn(std::format("Cannot read indexes of {}: {}", table_name, stmt.diagnostics()));
        return {};
    }

    std::vector<std::pair<int64_t, std::string>> keyed;
    for (const auto& row : OdbcConnection::fetch_all(stmt)) {
        if (text_at(row, kStatsIndexName) == kPrimaryKeyIndex) {
            keyed.emplace_back(int_at(row, kStatsOrdinal), text_at(row, kStatsColumn));
        }
    }
    std::sort(keyed.begin(), keyed.end());

    std::vector<std::string> result;
    for (auto& [ordinal, column] : keyed) {
        result.push_back(std::move(column));
    }
    return result;
}

std::vector<OdbcSourceReader::ForeignKeyRow> OdbcSourceReader::foreign_keys_of(const std::string& table_name) {
    auto stmt = conn_->statement();
    std::string name = table_name;
    const SQLRETURN ret = SQLForeignKeys(stmt.get(),
                                         nullptr, 0, nullptr, 0, nullptr, 0,
                                         nullptr, 0, nullptr, 0, sql_text(name), SQL_NTS);
    if (!SQL_SUCCEEDED(ret)) {
        utils::log::debug(std::format("SQLForeignKeys unavailable for {}: {}",
                                      table_name, stmt.diagnostics()));
        return foreign_keys_from_relationships(table_name);
    }

    std::vector<ForeignKeyRow> result;
    for (const auto& row : OdbcConnection::fetch_all(stmt)) {
        result.push_back({text_at(row, kFkFkColumn), text_at(row, kFkPkTable), text_at(row, kFkPkColumn)});
    }
    return result;
}

std::vector<OdbcSourceReader::ForeignKeyRow> OdbcSourceReader::foreign_keys_from_relationships(
    const std::string& table_name) {

    const auto rs = conn_->execute(std::format(
        "SELECT szColumn, szReferencedObject, szReferencedColumn "
        "FROM MSysRelationships WHERE szObject = {}",
        utils::quote_literal(table_name)));
    if (!rs.success) {
        utils::log::debug(std::format("MSysRelationships not readable for {}: {}",
                                      table_name, rs.error_message));
        return {};
    }

    std::vector<ForeignKeyRow> result;
    for (const auto& row : rs.rows) {
        result.push_back({text_at(row, 0), text_at(row, 1), text_at(row, 2)});
    }
    return result;
}

} // namespace schemaport
