#include "db/sqlite/sqlite_source_reader.hpp"
#include "db/sqlite/sqlite_type_map.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace schemaport {

namespace {

// PRAGMA table_info columns
constexpr int kInfoName = 1;
constexpr int kInfoType = 2;
constexpr int kInfoPk = 5;

// PRAGMA foreign_key_list columns
constexpr int kFkTable = 2;
constexpr int kFkFrom = 3;
constexpr int kFkTo = 4;

std::string text_of(const FieldValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    return "";
}

int64_t int_of(const FieldValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return *i;
    return 0;
}

} // anonymous namespace

SqliteSourceReader::SqliteSourceReader(const std::string& path)
    : conn_(SqliteConnection::open(path, true)) {}

std::vector<std::string> SqliteSourceReader::list_tables() {
    static const std::string TABLES_QUERY =
        "SELECT name FROM sqlite_master "
        "WHERE type = 'table' AND name NOT LIKE 'sqlite_%' "
        "ORDER BY name";

    auto result = conn_->execute(TABLES_QUERY);
    if (!result.success) {
        throw MigrationError(ErrorCategory::CONNECTION_ERROR,
            std::format("Cannot list tables: {}", result.error_message));
    }

    std::vector<std::string> tables;
    tables.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        if (!row.empty()) {
            tables.push_back(text_of(row[0]));
        }
    }
    return tables;
}

TableMetadata SqliteSourceReader::reflect_table(const std::string& table_name) {
    const auto info = conn_->execute(
        std::format("PRAGMA table_info({})", utils::quote_identifier(table_name)));
    if (!info.success || info.rows.empty()) {
        throw MigrationError(ErrorCategory::EXTRACTION_ERROR,
            std::format("Cannot reflect table {}: {}", table_name,
                        info.success ? "no columns" : info.error_message));
    }

    TableMetadata table(table_name);
    for (const auto& row : info.rows) {
        if (row.size() <= static_cast<size_t>(kInfoPk)) continue;
        ColumnMetadata column(text_of(row[kInfoName]),
                              SqliteTypeMap::build_type_info(text_of(row[kInfoType])));
        column.pk_position = static_cast<int>(int_of(row[kInfoPk]));
        column.is_primary_key = column.pk_position > 0;
        table.add_column(std::move(column));
    }

    const auto fks = conn_->execute(
        std::format("PRAGMA foreign_key_list({})", utils::quote_identifier(table_name)));
    if (!fks.success) {
        utils::log::warn(std::format("Cannot read foreign keys of {}: {}",
                                     table_name, fks.error_message));
        return table;
    }

    for (const auto& row : fks.rows) {
        if (row.size() <= static_cast<size_t>(kFkTo)) continue;
        const std::string target_table = text_of(row[kFkTable]);
        const std::string from = text_of(row[kFkFrom]);
        std::string to = text_of(row[kFkTo]);

        // REFERENCES T without a column list points at T's primary key
        if (to.empty()) {
            const auto pk = primary_key_of(target_table);
            if (pk.empty()) {
                utils::log::warn(std::format(
                    "Foreign key {}.{} references {} which has no primary key",
                    table_name, from, target_table));
                continue;
            }
            to = pk.front();
        }

        if (auto* column = table.find_column(from)) {
            column->foreign_keys.emplace_back(target_table, to);
        }
    }
    return table;
}

std::vector<Row> SqliteSourceReader::read_rows(const TableMetadata& table) {
    std::string sql = "SELECT ";
    for (size_t i = 0; i < table.columns.size(); ++i) {
        if (i > 0) sql += ", ";
        sql += utils::quote_identifier(table.columns[i].name);
    }
    sql += " FROM ";
    sql += utils::quote_identifier(table.name);

    std::vector<Row> rows;
    try {
        auto stmt = conn_->prepare(sql);
        const int ncols = stmt.column_count();
        while (stmt.step()) {
            Row row;
            row.reserve(static_cast<size_t>(ncols));
            for (int c = 0; c < ncols; ++c) {
                row.push_back(stmt.column_value(c));
            }
            rows.push_back(std::move(row));
        }
    } catch (const MigrationError& e) {
        throw MigrationError(ErrorCategory::EXTRACTION_ERROR,
            std::format("Cannot read rows of {}: {}", table.name, e.what()));
    }
    return rows;
}

std::vector<std::string> SqliteSourceReader::primary_key_of(const std::string& table_name) {
    const auto info = conn_->execute(
        std::format("PRAGMA table_info({})", utils::quote_identifier(table_name)));

    std::vector<std::pair<int64_t, std::string>> keyed;
    if (info.success) {
        for (const auto& row : info.rows) {
            if (row.size() <= static_cast<size_t>(kInfoPk)) continue;
            if (const auto pos = int_of(row[kInfoPk]); pos > 0) {
                keyed.emplace_back(pos, text_of(row[kInfoName]));
            }
        }
    }
    std::sort(keyed.begin(), keyed.end());

    std::vector<std::string> result;
    result.reserve(keyed.size());
    for (auto& [pos, name] : keyed) {
        result.push_back(std::move(name));
    }
    return result;
}

} // namespace schemaport
