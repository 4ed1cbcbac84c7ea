#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace schemaport {

/**
 * @brief Database-agnostic physical column type classification
 *
 * Maps from vendor-specific types (Access/ODBC SQL types, SQLite declared
 * types). This is what reflection sees before any refinement.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    TINYINT,
    SMALLINT,
    INTEGER,
    BIGINT,
    COUNTER,

    // Floating point
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,
    MONEY,

    // String family
    TEXT,
    VARCHAR,
    CHAR,

    // Boolean
    BOOLEAN,

    // Date/Time
    DATE,
    TIME,
    TIMESTAMP,

    // Binary
    BLOB,

    // UUID
    UUID,
};

/**
 * @brief Extended column type info carrying both generic and vendor-specific data
 */
struct ColumnTypeInfo {
    GenericColumnType generic_type = GenericColumnType::UNKNOWN;
    int32_t vendor_type_id = 0;        // ODBC SQL type code, 0 for SQLite
    std::string vendor_type_name;      // "COUNTER", "VARCHAR(255)", etc.

    ColumnTypeInfo() = default;
    ColumnTypeInfo(GenericColumnType gt, int32_t vid, std::string vname)
        : generic_type(gt), vendor_type_id(vid), vendor_type_name(std::move(vname)) {}
};

[[nodiscard]] inline const char* generic_column_type_to_string(GenericColumnType type) {
    switch (type) {
        case GenericColumnType::UNKNOWN: return "UNKNOWN";
        case GenericColumnType::TINYINT: return "TINYINT";
        case GenericColumnType::SMALLINT: return "SMALLINT";
        case GenericColumnType::INTEGER: return "INTEGER";
        case GenericColumnType::BIGINT: return "BIGINT";
        case GenericColumnType::COUNTER: return "COUNTER";
        case GenericColumnType::REAL: return "REAL";
        case GenericColumnType::DOUBLE_PRECISION: return "DOUBLE_PRECISION";
        case GenericColumnType::NUMERIC: return "NUMERIC";
        case GenericColumnType::MONEY: return "MONEY";
        case GenericColumnType::TEXT: return "TEXT";
        case GenericColumnType::VARCHAR: return "VARCHAR";
        case GenericColumnType::CHAR: return "CHAR";
        case GenericColumnType::BOOLEAN: return "BOOLEAN";
        case GenericColumnType::DATE: return "DATE";
        case GenericColumnType::TIME: return "TIME";
        case GenericColumnType::TIMESTAMP: return "TIMESTAMP";
        case GenericColumnType::BLOB: return "BLOB";
        case GenericColumnType::UUID: return "UUID";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Refined logical column type
 *
 * Decided by the TypeRefiner from the column name and its GenericColumnType.
 * ENUM is only assigned after a full data scan has produced a domain.
 */
enum class LogicalType : uint8_t {
    IDENTIFIER,   // identifier-text (GUIDs, whatever the physical storage)
    DATE,
    DATETIME,
    BOOLEAN,
    ENUM,         // string restricted to an observed domain
    INTEGER,
    FLOAT,
    NUMERIC,
    TEXT,
    BLOB,
};

[[nodiscard]] inline std::string_view logical_type_to_string(LogicalType type) {
    switch (type) {
        case LogicalType::IDENTIFIER: return "identifier";
        case LogicalType::DATE:       return "date";
        case LogicalType::DATETIME:   return "datetime";
        case LogicalType::BOOLEAN:    return "boolean";
        case LogicalType::ENUM:       return "enum";
        case LogicalType::INTEGER:    return "integer";
        case LogicalType::FLOAT:      return "float";
        case LogicalType::NUMERIC:    return "numeric";
        case LogicalType::TEXT:       return "text";
        case LogicalType::BLOB:       return "blob";
        default:                      return "text";
    }
}

} // namespace schemaport
