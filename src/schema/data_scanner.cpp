#include "schema/data_scanner.hpp"
#include "schema/value_caster.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <memory>

namespace schemaport {

DataScanner::DataScanner(const PatternConfig& patterns)
    : patterns_(patterns) {}

ScanResult DataScanner::scan(const TableMetadata& table, std::vector<Row> rows) const {
    ScanResult result;
    result.batch.table = table.name;
    result.batch.columns.reserve(table.columns.size());
    for (const auto& column : table.columns) {
        result.batch.columns.push_back(column.name);
    }

    const size_t width = table.columns.size();

    // Per-column flags resolved once, outside the row loop
    std::vector<bool> enum_like(width);
    for (size_t c = 0; c < width; ++c) {
        enum_like[c] = patterns_.is_enum(table.columns[c].name);
    }
    std::vector<size_t> failures(width, 0);

    for (size_t r = 0; r < rows.size(); ++r) {
        auto& row = rows[r];
        if (row.size() != width) {
            throw MigrationError(ErrorCategory::EXTRACTION_ERROR,
                std::format("Row {} of table {} has {} values, expected {}",
                    r, table.name, row.size(), width));
        }

        for (size_t c = 0; c < width; ++c) {
            const auto& column = table.columns[c];
            const bool was_null = is_null(row[c]);
            FieldValue value = ValueCaster::cast(column.logical, row[c]);

            if (is_null(value)) {
                if (!was_null) ++failures[c];
                result.nullables.insert(column.name);
            } else if (enum_like[c]) {
                if (const auto* s = std::get_if<std::string>(&value)) {
                    result.enums[column.name].insert(*s);
                }
            }
            row[c] = std::move(value);
        }
    }

    for (size_t c = 0; c < width; ++c) {
        if (failures[c] > 0) {
            utils::log::warn(std::format("{}.{}: {} value(s) could not be cast to {} and were stored as NULL",
                table.name, table.columns[c].name, failures[c],
                logical_type_to_string(table.columns[c].logical)));
            result.cast_failures += failures[c];
        }
    }

    result.batch.rows = std::move(rows);
    return result;
}

void DataScanner::apply(TableMetadata& table, const ScanResult& result) {
    for (auto& column : table.columns) {
        if (const auto it = result.enums.find(column.name); it != result.enums.end()) {
            column.logical = LogicalType::ENUM;
            column.enum_domain = std::make_shared<const EnumDomain>(it->second);
        }
        column.nullable = result.nullables.count(column.name) > 0;
    }
}

} // namespace schemaport
