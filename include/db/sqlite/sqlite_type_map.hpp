#pragma once

#include "core/column_type.hpp"

#include <string>
#include <string_view>

namespace schemaport {

/**
 * @brief SQLite type mapping utilities
 *
 * Maps declared column types (as written in CREATE TABLE) to
 * GenericColumnType. Names outside the known list fall back to SQLite's
 * own affinity rules.
 */
class SqliteTypeMap {
public:
    /**
     * @brief Map a declared type to GenericColumnType
     * @param declared_type Declared type, e.g. "VARCHAR(255)", "DATETIME", ""
     * @return Generic column type (UNKNOWN for an empty declaration)
     */
    [[nodiscard]] static GenericColumnType declared_type_to_generic(std::string_view declared_type);

    /**
     * @brief Build a full ColumnTypeInfo from a declared type
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(const std::string& declared_type);
};

} // namespace schemaport
