#include "schema/type_refiner.hpp"
#include "core/utils.hpp"

#include <format>

namespace schemaport {

TypeRefiner::TypeRefiner(const PatternConfig& patterns, const std::vector<ColumnOverride>& overrides)
    : patterns_(patterns) {
    for (const auto& o : overrides) {
        overrides_[o.column] = o.type;
    }

    // Rules capture their inputs by value so a copied refiner stays valid
    rules_.push_back({"override",
        [overrides = overrides_](std::string_view name, const ColumnTypeInfo&) -> std::optional<LogicalType> {
            const auto it = overrides.find(std::string(name));
            if (it == overrides.end()) return std::nullopt;
            return it->second;
        }});

    rules_.push_back({"guid_suffix",
        [p = patterns_](std::string_view name, const ColumnTypeInfo&) -> std::optional<LogicalType> {
            if (p.is_guid(name)) return LogicalType::IDENTIFIER;
            return std::nullopt;
        }});

    rules_.push_back({"date_suffix",
        [p = patterns_](std::string_view name, const ColumnTypeInfo&) -> std::optional<LogicalType> {
            if (p.is_date(name)) return LogicalType::DATE;
            return std::nullopt;
        }});

    rules_.push_back({"bool_prefix",
        [p = patterns_](std::string_view name, const ColumnTypeInfo&) -> std::optional<LogicalType> {
            if (p.is_bool(name)) return LogicalType::BOOLEAN;
            return std::nullopt;
        }});

    rules_.push_back({"widen",
        [](std::string_view, const ColumnTypeInfo& physical) -> std::optional<LogicalType> {
            return widen(physical.generic_type);
        }});
}

LogicalType TypeRefiner::refine(std::string_view column_name, const ColumnTypeInfo& physical) const {
    for (const auto& rule : rules_) {
        if (const auto type = rule.apply(column_name, physical)) {
            return *type;
        }
    }
    return LogicalType::TEXT;
}

std::string_view TypeRefiner::decisive_rule(std::string_view column_name,
                                            const ColumnTypeInfo& physical) const {
    for (const auto& rule : rules_) {
        if (rule.apply(column_name, physical)) {
            return rule.name;
        }
    }
    return "none";
}

void TypeRefiner::refine_table(TableMetadata& table) const {
    for (auto& column : table.columns) {
        column.logical = refine(column.name, column.physical);
        utils::log::debug(std::format("Refined {}.{}: {} -> {} ({})",
            table.name, column.name,
            generic_column_type_to_string(column.physical.generic_type),
            logical_type_to_string(column.logical),
            decisive_rule(column.name, column.physical)));
    }
}

LogicalType TypeRefiner::widen(GenericColumnType physical) {
    switch (physical) {
        case GenericColumnType::TINYINT:
        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
        case GenericColumnType::BIGINT:
        case GenericColumnType::COUNTER:
            return LogicalType::INTEGER;
        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION:
            return LogicalType::FLOAT;
        case GenericColumnType::NUMERIC:
        case GenericColumnType::MONEY:
            return LogicalType::NUMERIC;
        case GenericColumnType::BOOLEAN:
            return LogicalType::BOOLEAN;
        case GenericColumnType::DATE:
            return LogicalType::DATE;
        case GenericColumnType::TIMESTAMP:
            return LogicalType::DATETIME;
        case GenericColumnType::UUID:
            return LogicalType::IDENTIFIER;
        case GenericColumnType::BLOB:
            return LogicalType::BLOB;
        case GenericColumnType::TIME:
        case GenericColumnType::TEXT:
        case GenericColumnType::VARCHAR:
        case GenericColumnType::CHAR:
        case GenericColumnType::UNKNOWN:
        default:
            return LogicalType::TEXT;
    }
}

} // namespace schemaport
