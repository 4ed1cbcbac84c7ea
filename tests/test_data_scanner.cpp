#include <catch2/catch_test_macros.hpp>
#include "schema/data_scanner.hpp"
#include "core/error.hpp"

using namespace schemaport;

namespace {

TableMetadata make_table() {
    TableMetadata table("Variable");
    ColumnMetadata id("VariableID", ColumnTypeInfo(GenericColumnType::INTEGER, 0, "INTEGER"));
    id.logical = LogicalType::INTEGER;
    id.is_primary_key = true;
    table.add_column(std::move(id));

    ColumnMetadata type("VariableType", ColumnTypeInfo(GenericColumnType::VARCHAR, 0, "VARCHAR(20)"));
    type.logical = LogicalType::TEXT;
    table.add_column(std::move(type));

    ColumnMetadata date("ReleaseDate", ColumnTypeInfo(GenericColumnType::TEXT, 0, "TEXT"));
    date.logical = LogicalType::DATE;
    table.add_column(std::move(date));
    return table;
}

} // namespace

TEST_CASE("DataScanner: enum-like columns collect their full domain", "[scanner]") {
    DataScanner scanner{PatternConfig{}};
    auto table = make_table();

    std::vector<Row> rows = {
        {int64_t{1}, std::string("B"), std::string("2020-01-01")},
        {int64_t{2}, std::string("A"), std::string("2020-01-02")},
        {int64_t{3}, std::string("B"), std::string("2020-01-03")},
    };

    auto result = scanner.scan(table, std::move(rows));
    REQUIRE(result.enums.count("VariableType") == 1);
    CHECK(result.enums["VariableType"] == EnumDomain{"A", "B"});
    CHECK(result.enums.count("VariableID") == 0);
    CHECK(result.batch.rows.size() == 3);
    CHECK(result.batch.columns == std::vector<std::string>{"VariableID", "VariableType", "ReleaseDate"});
}

TEST_CASE("DataScanner: nullability follows observed nulls", "[scanner]") {
    DataScanner scanner{PatternConfig{}};
    auto table = make_table();

    std::vector<Row> rows = {
        {int64_t{1}, std::string("A"), std::monostate{}},
        {int64_t{2}, std::monostate{}, std::string("2020-01-02")},
    };

    auto result = scanner.scan(table, std::move(rows));
    DataScanner::apply(table, result);

    CHECK_FALSE(table.find_column("VariableID")->nullable);
    CHECK(table.find_column("VariableType")->nullable);
    CHECK(table.find_column("ReleaseDate")->nullable);
    CHECK(table.find_column("VariableType")->logical == LogicalType::ENUM);
    REQUIRE(table.find_column("VariableType")->enum_domain);
    CHECK(*table.find_column("VariableType")->enum_domain == EnumDomain{"A"});
}

TEST_CASE("DataScanner: failed casts are nulls and counted", "[scanner]") {
    DataScanner scanner{PatternConfig{}};
    auto table = make_table();

    std::vector<Row> rows = {
        {int64_t{1}, std::string("A"), std::string("garbage")},
        {int64_t{2}, std::string("A"), std::string("2021-12-31")},
    };

    auto result = scanner.scan(table, std::move(rows));
    CHECK(result.cast_failures == 1);
    CHECK(is_null(result.batch.rows[0][2]));
    CHECK(std::holds_alternative<Date>(result.batch.rows[1][2]));
    CHECK(result.nullables.count("ReleaseDate") == 1);
}

TEST_CASE("DataScanner: an empty table has no domains and no nullable columns", "[scanner]") {
    DataScanner scanner{PatternConfig{}};
    auto table = make_table();

    auto result = scanner.scan(table, {});
    CHECK(result.enums.empty());
    CHECK(result.nullables.empty());
    CHECK(result.batch.rows.empty());

    DataScanner::apply(table, result);
    CHECK(table.find_column("VariableType")->logical == LogicalType::TEXT);
}

TEST_CASE("DataScanner: a row of the wrong width is an extraction error", "[scanner]") {
    DataScanner scanner{PatternConfig{}};
    auto table = make_table();

    std::vector<Row> rows = {{int64_t{1}, std::string("A")}};
    try {
        (void)scanner.scan(table, std::move(rows));
        FAIL("expected MigrationError");
    } catch (const MigrationError& e) {
        CHECK(e.category() == ErrorCategory::EXTRACTION_ERROR);
    }
}

TEST_CASE("DataScanner: rescanning yields an identical domain", "[scanner]") {
    DataScanner scanner{PatternConfig{}};
    const auto table = make_table();

    const std::vector<Row> rows = {
        {int64_t{1}, std::string("B"), std::string("2020-01-01")},
        {int64_t{2}, std::monostate{}, std::string("not a date")},
        {int64_t{3}, std::string("A"), std::string("2020-01-03T10:30:00")},
    };

    const auto first = scanner.scan(table, rows);
    const auto again = scanner.scan(table, rows);
    CHECK(again.enums == first.enums);
    CHECK(again.nullables == first.nullables);
    CHECK(again.batch.rows == first.batch.rows);

    // Scanning already-cast rows changes nothing
    const auto recast = scanner.scan(table, first.batch.rows);
    CHECK(recast.enums == first.enums);
    CHECK(recast.nullables == first.nullables);
    CHECK(recast.batch.rows == first.batch.rows);
    CHECK(recast.cast_failures == 0);

    CHECK(first.enums.at("VariableType") == EnumDomain{"A", "B"});
    CHECK(first.nullables == ColumnNames{"VariableType", "ReleaseDate"});
}
