#pragma once

#include "config/config_types.hpp"
#include "core/column_type.hpp"
#include "core/types.hpp"
#include "schema/naming_patterns.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace schemaport {

/**
 * @brief Classifies physical columns into refined logical types
 *
 * Rules are evaluated in priority order; the first one that returns a
 * type wins:
 *   1. exact-name override
 *   2. identifier suffix  -> IDENTIFIER
 *   3. date suffix        -> DATE
 *   4. boolean prefix     -> BOOLEAN
 *   5. widen the physical type to its generic class (always matches)
 *
 * Refinement only looks at the name and the physical type, so it is pure
 * and re-running it on a refined column gives the same answer.
 */
class TypeRefiner {
public:
    using RuleFn = std::function<std::optional<LogicalType>(
        std::string_view column_name, const ColumnTypeInfo& physical)>;

    struct Rule {
        std::string name;
        RuleFn apply;
    };

    TypeRefiner(const PatternConfig& patterns, const std::vector<ColumnOverride>& overrides);

    [[nodiscard]] LogicalType refine(std::string_view column_name, const ColumnTypeInfo& physical) const;

    /**
     * @brief Name of the rule that decides this column (for diagnostics)
     */
    [[nodiscard]] std::string_view decisive_rule(std::string_view column_name,
                                                 const ColumnTypeInfo& physical) const;

    /**
     * @brief Set the logical type of every column in the table
     */
    void refine_table(TableMetadata& table) const;

    [[nodiscard]] const std::vector<Rule>& rules() const { return rules_; }

    /**
     * @brief Collapse a physical type to its generic logical class
     */
    [[nodiscard]] static LogicalType widen(GenericColumnType physical);

private:
    NamingPatterns patterns_;
    std::unordered_map<std::string, LogicalType> overrides_;
    std::vector<Rule> rules_;
};

} // namespace schemaport
