#include "migrate/ddl_builder.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace schemaport {

DdlBuilder::DdlBuilder(const TargetConfig& config)
    : enum_constraints_(config.enum_constraints),
      without_rowid_(config.without_rowid) {}

std::string DdlBuilder::column_type(const ColumnMetadata& column) {
    switch (column.logical) {
        case LogicalType::IDENTIFIER: return "CHAR(36)";
        case LogicalType::DATE:       return "DATE";
        case LogicalType::DATETIME:   return "DATETIME";
        case LogicalType::BOOLEAN:    return "BOOLEAN";
        case LogicalType::INTEGER:    return "INTEGER";
        case LogicalType::FLOAT:      return "FLOAT";
        case LogicalType::NUMERIC:    return "NUMERIC";
        case LogicalType::BLOB:       return "BLOB";
        case LogicalType::ENUM: {
            size_t width = 1;
            if (column.enum_domain) {
                for (const auto& value : *column.enum_domain) {
                    width = std::max(width, value.size());
                }
            }
            return std::format("VARCHAR({})", width);
        }
        case LogicalType::TEXT:
        default:
            switch (column.physical.generic_type) {
                case GenericColumnType::CHAR:
                case GenericColumnType::VARCHAR:
                    return "VARCHAR";
                default:
                    return "TEXT";
            }
    }
}

std::string DdlBuilder::enum_check(const ColumnMetadata& column) {
    if (column.logical != LogicalType::ENUM || !column.enum_domain || column.enum_domain->empty()) {
        return "";
    }

    std::string clause = std::format("CHECK ({} IN (", utils::quote_identifier(column.name));
    bool first = true;
    for (const auto& value : *column.enum_domain) {
        if (!first) clause += ", ";
        clause += utils::quote_literal(value);
        first = false;
    }
    clause += "))";
    return clause;
}

std::string DdlBuilder::create_table(const TableMetadata& table) const {
    std::vector<std::string> lines;
    lines.reserve(table.columns.size() + 2);

    for (const auto& column : table.columns) {
        std::string line = std::format("{} {}", utils::quote_identifier(column.name), column_type(column));
        if (!column.nullable) {
            line += " NOT NULL";
        }
        if (enum_constraints_) {
            if (auto check = enum_check(column); !check.empty()) {
                line += ' ';
                line += check;
            }
        }
        lines.push_back(std::move(line));
    }

    const auto pk = table.primary_key_columns();
    if (!pk.empty()) {
        std::string line = "PRIMARY KEY (";
        for (size_t i = 0; i < pk.size(); ++i) {
            if (i > 0) line += ", ";
            line += utils::quote_identifier(pk[i]);
        }
        line += ')';
        lines.push_back(std::move(line));
    }

    // One FOREIGN KEY clause per referenced (table, column), in column order
    for (const auto& column : table.columns) {
        for (const auto& fk : column.foreign_keys) {
            lines.push_back(std::format("FOREIGN KEY ({}) REFERENCES {} ({})",
                                        utils::quote_identifier(column.name),
                                        utils::quote_identifier(fk.table),
                                        utils::quote_identifier(fk.column)));
        }
    }

    std::string sql = std::format("CREATE TABLE {} (\n", utils::quote_identifier(table.name));
    for (size_t i = 0; i < lines.size(); ++i) {
        sql += "    ";
        sql += lines[i];
        if (i + 1 < lines.size()) sql += ',';
        sql += '\n';
    }
    sql += ')';
    if (without_rowid_ && table.without_rowid && !pk.empty()) {
        sql += " WITHOUT ROWID";
    }
    return sql;
}

std::string DdlBuilder::insert_statement(const std::string& table, const std::vector<std::string>& columns) {
    std::string names;
    std::string params;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
            names += ", ";
            params += ", ";
        }
        names += utils::quote_identifier(columns[i]);
        params += '?';
    }
    return std::format("INSERT INTO {} ({}) VALUES ({})", utils::quote_identifier(table), names, params);
}

} // namespace schemaport
