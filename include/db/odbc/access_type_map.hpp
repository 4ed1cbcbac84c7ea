#pragma once

#include "core/column_type.hpp"

#include <sql.h>
#include <sqlext.h>

#include <string>

namespace schemaport {

/**
 * @brief Access type mapping utilities
 *
 * Maps the DATA_TYPE / TYPE_NAME pair reported by SQLColumns to
 * GenericColumnType. The type name disambiguates Access types that share
 * an ODBC code (COUNTER vs INTEGER, CURRENCY vs DECIMAL, GUID).
 */
class AccessTypeMap {
public:
    /**
     * @brief Map an ODBC SQL type code to GenericColumnType
     * @param sql_type SQL_* data type code
     * @return Generic column type
     */
    [[nodiscard]] static GenericColumnType sql_type_to_generic(SQLSMALLINT sql_type);

    /**
     * @brief Build a full ColumnTypeInfo from SQLColumns output
     * @param sql_type DATA_TYPE column
     * @param type_name TYPE_NAME column (e.g. "COUNTER", "LONGCHAR")
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(SQLSMALLINT sql_type, const std::string& type_name);
};

} // namespace schemaport
