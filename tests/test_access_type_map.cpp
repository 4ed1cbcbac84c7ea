#include <catch2/catch_test_macros.hpp>
#include "db/odbc/access_type_map.hpp"
#include "schema/type_refiner.hpp"

using namespace schemaport;

TEST_CASE("AccessTypeMap: ODBC codes map to generic types", "[odbc][types]") {
    CHECK(AccessTypeMap::sql_type_to_generic(SQL_TINYINT) == GenericColumnType::TINYINT);
    CHECK(AccessTypeMap::sql_type_to_generic(SQL_SMALLINT) == GenericColumnType::SMALLINT);
    CHECK(AccessTypeMap::sql_type_to_generic(SQL_INTEGER) == GenericColumnType::INTEGER);
    CHECK(AccessTypeMap::sql_type_to_generic(SQL_REAL) == GenericColumnType::REAL);
    CHECK(AccessTypeMap::sql_type_to_generic(SQL_DOUBLE) == GenericColumnType::DOUBLE_PRECISION);
    CHECK(AccessTypeMap::sql_type_to_generic(SQL_NUMERIC) == GenericColumnType::NUMERIC);
    CHECK(AccessTypeMap::sql_type_to_generic(SQL_WVARCHAR) == GenericColumnType::VARCHAR);
    CHECK(AccessTypeMap::sql_type_to_generic(SQL_WLONGVARCHAR) == GenericColumnType::TEXT);
    CHECK(AccessTypeMap::sql_type_to_generic(SQL_BIT) == GenericColumnType::BOOLEAN);
    CHECK(AccessTypeMap::sql_type_to_generic(SQL_TYPE_TIMESTAMP) == GenericColumnType::TIMESTAMP);
    CHECK(AccessTypeMap::sql_type_to_generic(SQL_LONGVARBINARY) == GenericColumnType::BLOB);
    CHECK(AccessTypeMap::sql_type_to_generic(SQL_GUID) == GenericColumnType::UUID);
    CHECK(AccessTypeMap::sql_type_to_generic(SQL_UNKNOWN_TYPE) == GenericColumnType::UNKNOWN);
}

TEST_CASE("AccessTypeMap: Access type names override the shared ODBC code", "[odbc][types]") {
    const auto counter = AccessTypeMap::build_type_info(SQL_INTEGER, "COUNTER");
    CHECK(counter.generic_type == GenericColumnType::COUNTER);
    CHECK(counter.vendor_type_id == SQL_INTEGER);
    CHECK(counter.vendor_type_name == "COUNTER");

    CHECK(AccessTypeMap::build_type_info(SQL_NUMERIC, "CURRENCY").generic_type == GenericColumnType::MONEY);
    CHECK(AccessTypeMap::build_type_info(SQL_WCHAR, "GUID").generic_type == GenericColumnType::UUID);
    CHECK(AccessTypeMap::build_type_info(SQL_SMALLINT, "YESNO").generic_type == GenericColumnType::BOOLEAN);
    CHECK(AccessTypeMap::build_type_info(SQL_WLONGVARCHAR, "LongChar").generic_type == GenericColumnType::TEXT);
    CHECK(AccessTypeMap::build_type_info(SQL_INTEGER, "INTEGER").generic_type == GenericColumnType::INTEGER);
}

TEST_CASE("AccessTypeMap: overridden names widen to the expected logical types", "[odbc][types]") {
    CHECK(TypeRefiner::widen(AccessTypeMap::build_type_info(SQL_INTEGER, "COUNTER").generic_type) ==
          LogicalType::INTEGER);
    CHECK(TypeRefiner::widen(AccessTypeMap::build_type_info(SQL_NUMERIC, "CURRENCY").generic_type) ==
          LogicalType::NUMERIC);
    CHECK(TypeRefiner::widen(AccessTypeMap::build_type_info(SQL_WCHAR, "GUID").generic_type) ==
          LogicalType::IDENTIFIER);
    CHECK(TypeRefiner::widen(AccessTypeMap::build_type_info(SQL_SMALLINT, "YESNO").generic_type) ==
          LogicalType::BOOLEAN);
}
