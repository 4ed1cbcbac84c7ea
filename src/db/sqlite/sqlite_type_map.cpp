#include "db/sqlite/sqlite_type_map.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace schemaport {

GenericColumnType SqliteTypeMap::declared_type_to_generic(std::string_view declared_type) {
    std::string lower = utils::trim(utils::to_lower(declared_type));
    if (lower.empty()) {
        return GenericColumnType::UNKNOWN;
    }

    // "varchar(255)" -> "varchar", "unsigned big int" kept whole
    if (const auto paren = lower.find('('); paren != std::string::npos) {
        lower = utils::trim(lower.substr(0, paren));
    }

    static const std::unordered_map<std::string, GenericColumnType> TYPE_MAP = {
        {"tinyint", GenericColumnType::TINYINT},
        {"byte", GenericColumnType::TINYINT},
        {"smallint", GenericColumnType::SMALLINT},
        {"short", GenericColumnType::SMALLINT},
        {"int", GenericColumnType::INTEGER},
        {"integer", GenericColumnType::INTEGER},
        {"mediumint", GenericColumnType::INTEGER},
        {"long", GenericColumnType::INTEGER},
        {"bigint", GenericColumnType::BIGINT},
        {"counter", GenericColumnType::COUNTER},
        {"autoincrement", GenericColumnType::COUNTER},
        {"real", GenericColumnType::REAL},
        {"float", GenericColumnType::REAL},
        {"single", GenericColumnType::REAL},
        {"double", GenericColumnType::DOUBLE_PRECISION},
        {"double precision", GenericColumnType::DOUBLE_PRECISION},
        {"decimal", GenericColumnType::NUMERIC},
        {"numeric", GenericColumnType::NUMERIC},
        {"money", GenericColumnType::MONEY},
        {"currency", GenericColumnType::MONEY},
        {"char", GenericColumnType::CHAR},
        {"character", GenericColumnType::CHAR},
        {"nchar", GenericColumnType::CHAR},
        {"varchar", GenericColumnType::VARCHAR},
        {"nvarchar", GenericColumnType::VARCHAR},
        {"text", GenericColumnType::TEXT},
        {"clob", GenericColumnType::TEXT},
        {"memo", GenericColumnType::TEXT},
        {"longtext", GenericColumnType::TEXT},
        {"boolean", GenericColumnType::BOOLEAN},
        {"bool", GenericColumnType::BOOLEAN},
        {"bit", GenericColumnType::BOOLEAN},
        {"yesno", GenericColumnType::BOOLEAN},
        {"date", GenericColumnType::DATE},
        {"time", GenericColumnType::TIME},
        {"datetime", GenericColumnType::TIMESTAMP},
        {"timestamp", GenericColumnType::TIMESTAMP},
        {"blob", GenericColumnType::BLOB},
        {"binary", GenericColumnType::BLOB},
        {"varbinary", GenericColumnType::BLOB},
        {"longbinary", GenericColumnType::BLOB},
        {"uuid", GenericColumnType::UUID},
        {"guid", GenericColumnType::UUID},
        {"uniqueidentifier", GenericColumnType::UUID},
    };

    if (const auto it = TYPE_MAP.find(lower); it != TYPE_MAP.end()) {
        return it->second;
    }

    // Affinity rules, in SQLite's order
    if (lower.find("int") != std::string::npos) return GenericColumnType::INTEGER;
    if (lower.find("char") != std::string::npos ||
        lower.find("clob") != std::string::npos ||
        lower.find("text") != std::string::npos) {
        return GenericColumnType::TEXT;
    }
    if (lower.find("blob") != std::string::npos) return GenericColumnType::BLOB;
    if (lower.find("real") != std::string::npos ||
        lower.find("floa") != std::string::npos ||
        lower.find("doub") != std::string::npos) {
        return GenericColumnType::DOUBLE_PRECISION;
    }
    return GenericColumnType::NUMERIC;
}

ColumnTypeInfo SqliteTypeMap::build_type_info(const std::string& declared_type) {
    ColumnTypeInfo info;
    info.vendor_type_id = 0;
    info.vendor_type_name = declared_type;
    info.generic_type = declared_type_to_generic(declared_type);
    return info;
}

} // namespace schemaport
