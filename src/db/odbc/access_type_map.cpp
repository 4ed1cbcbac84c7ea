#include "db/odbc/access_type_map.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace schemaport {

GenericColumnType AccessTypeMap::sql_type_to_generic(SQLSMALLINT sql_type) {
    switch (sql_type) {
        case SQL_TINYINT:
            return GenericColumnType::TINYINT;
        case SQL_SMALLINT:
            return GenericColumnType::SMALLINT;
        case SQL_INTEGER:
            return GenericColumnType::INTEGER;
        case SQL_BIGINT:
            return GenericColumnType::BIGINT;
        case SQL_REAL:
            return GenericColumnType::REAL;
        case SQL_FLOAT:
        case SQL_DOUBLE:
            return GenericColumnType::DOUBLE_PRECISION;
        case SQL_DECIMAL:
        case SQL_NUMERIC:
            return GenericColumnType::NUMERIC;
        case SQL_CHAR:
        case SQL_WCHAR:
            return GenericColumnType::CHAR;
        case SQL_VARCHAR:
        case SQL_WVARCHAR:
            return GenericColumnType::VARCHAR;
        case SQL_LONGVARCHAR:
        case SQL_WLONGVARCHAR:
            return GenericColumnType::TEXT;
        case SQL_BIT:
            return GenericColumnType::BOOLEAN;
        case SQL_TYPE_DATE:
        case SQL_DATE:
            return GenericColumnType::DATE;
        case SQL_TYPE_TIME:
        case SQL_TIME:
            return GenericColumnType::TIME;
        case SQL_TYPE_TIMESTAMP:
        case SQL_TIMESTAMP:
            return GenericColumnType::TIMESTAMP;
        case SQL_BINARY:
        case SQL_VARBINARY:
        case SQL_LONGVARBINARY:
            return GenericColumnType::BLOB;
        case SQL_GUID:
            return GenericColumnType::UUID;
        default:
            return GenericColumnType::UNKNOWN;
    }
}

ColumnTypeInfo AccessTypeMap::build_type_info(SQLSMALLINT sql_type, const std::string& type_name) {
    ColumnTypeInfo info;
    info.vendor_type_id = sql_type;
    info.vendor_type_name = type_name;
    info.generic_type = sql_type_to_generic(sql_type);

    static const std::unordered_map<std::string, GenericColumnType> NAME_OVERRIDES = {
        {"counter", GenericColumnType::COUNTER},
        {"currency", GenericColumnType::MONEY},
        {"guid", GenericColumnType::UUID},
        {"longchar", GenericColumnType::TEXT},
        {"memo", GenericColumnType::TEXT},
        {"yesno", GenericColumnType::BOOLEAN},
    };

    if (const auto it = NAME_OVERRIDES.find(utils::to_lower(type_name)); it != NAME_OVERRIDES.end()) {
        info.generic_type = it->second;
    }
    return info;
}

} // namespace schemaport
