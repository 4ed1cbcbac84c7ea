#pragma once

#include "core/column_type.hpp"
#include "core/value.hpp"

namespace schemaport {

/**
 * @brief Value-level casts matching the refined column type
 *
 * A value that cannot be cast becomes NULL; casting never throws.
 */
class ValueCaster {
public:
    [[nodiscard]] static FieldValue cast(LogicalType type, const FieldValue& raw);

    /**
     * @brief Truthiness used for boolean columns
     *
     * Numbers are true when non-zero. Strings are false for "", "0",
     * "false", "no", "n", "f" and "off" (case-insensitive), true otherwise.
     */
    [[nodiscard]] static bool truthy(const FieldValue& raw);

    /**
     * @brief Identifier text: integers in decimal, GUID strings without braces
     */
    [[nodiscard]] static FieldValue to_identifier(const FieldValue& raw);
};

} // namespace schemaport
