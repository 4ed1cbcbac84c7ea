#include <catch2/catch_test_macros.hpp>
#include "migrate/ddl_builder.hpp"

#include <memory>
#include <utility>

using namespace schemaport;

namespace {

TableMetadata make_item() {
    TableMetadata table("Item");

    ColumnMetadata id("ItemID", ColumnTypeInfo(GenericColumnType::INTEGER, 0, "INTEGER"));
    id.logical = LogicalType::INTEGER;
    id.is_primary_key = true;
    id.nullable = false;
    table.add_column(std::move(id));

    ColumnMetadata kind("ItemType", ColumnTypeInfo(GenericColumnType::VARCHAR, 0, "VARCHAR(10)"));
    kind.logical = LogicalType::ENUM;
    kind.enum_domain = std::make_shared<const EnumDomain>(EnumDomain{"A", "O'Brien"});
    table.add_column(std::move(kind));

    ColumnMetadata category("CategoryGUID", ColumnTypeInfo(GenericColumnType::VARCHAR, 0, "VARCHAR(36)"));
    category.logical = LogicalType::IDENTIFIER;
    category.nullable = false;
    category.foreign_keys.emplace_back("Category", "CategoryGUID");
    table.add_column(std::move(category));

    ColumnMetadata name("Name", ColumnTypeInfo(GenericColumnType::VARCHAR, 0, "VARCHAR(255)"));
    table.add_column(std::move(name));

    ColumnMetadata note("Note", ColumnTypeInfo(GenericColumnType::TEXT, 0, "TEXT"));
    table.add_column(std::move(note));

    table.without_rowid = true;
    return table;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("DdlBuilder: column types follow the logical type", "[ddl]") {
    const auto table = make_item();
    CHECK(DdlBuilder::column_type(*table.find_column("ItemID")) == "INTEGER");
    CHECK(DdlBuilder::column_type(*table.find_column("CategoryGUID")) == "CHAR(36)");
    CHECK(DdlBuilder::column_type(*table.find_column("ItemType")) == "VARCHAR(7)");
    CHECK(DdlBuilder::column_type(*table.find_column("Name")) == "VARCHAR");
    CHECK(DdlBuilder::column_type(*table.find_column("Note")) == "TEXT");
}

TEST_CASE("DdlBuilder: create table carries keys, nullability and enum checks", "[ddl]") {
    DdlBuilder builder{TargetConfig{}};
    const auto sql = builder.create_table(make_item());

    CHECK(contains(sql, "CREATE TABLE \"Item\" ("));
    CHECK(contains(sql, "\"ItemID\" INTEGER NOT NULL"));
    CHECK(contains(sql, "CHECK (\"ItemType\" IN ('A', 'O''Brien'))"));
    CHECK(contains(sql, "\"CategoryGUID\" CHAR(36) NOT NULL"));
    CHECK(contains(sql, "PRIMARY KEY (\"ItemID\")"));
    CHECK(contains(sql, "FOREIGN KEY (\"CategoryGUID\") REFERENCES \"Category\" (\"CategoryGUID\")"));
    CHECK(contains(sql, ") WITHOUT ROWID"));
    CHECK_FALSE(contains(sql, "INDEX"));
}

TEST_CASE("DdlBuilder: enum checks and WITHOUT ROWID can be turned off", "[ddl]") {
    TargetConfig config;
    config.enum_constraints = false;
    config.without_rowid = false;
    DdlBuilder builder{config};

    const auto sql = builder.create_table(make_item());
    CHECK_FALSE(contains(sql, "CHECK"));
    CHECK_FALSE(contains(sql, "WITHOUT ROWID"));
}

TEST_CASE("DdlBuilder: tables without a primary key keep their rowid", "[ddl]") {
    TableMetadata table("Log");
    ColumnMetadata message("Message", ColumnTypeInfo(GenericColumnType::TEXT, 0, "TEXT"));
    table.add_column(std::move(message));
    table.without_rowid = true;

    DdlBuilder builder{TargetConfig{}};
    const auto sql = builder.create_table(table);
    CHECK_FALSE(contains(sql, "PRIMARY KEY"));
    CHECK_FALSE(contains(sql, "WITHOUT ROWID"));
}

TEST_CASE("DdlBuilder: composite primary keys follow the key sequence", "[ddl]") {
    TableMetadata table("Membership");
    for (const auto& [name, position] : {std::pair{"GroupID", 2}, std::pair{"PersonID", 1}}) {
        ColumnMetadata column(name, ColumnTypeInfo(GenericColumnType::INTEGER, 0, "INTEGER"));
        column.logical = LogicalType::INTEGER;
        column.is_primary_key = true;
        column.pk_position = position;
        column.nullable = false;
        table.add_column(std::move(column));
    }

    DdlBuilder builder{TargetConfig{}};
    const auto sql = builder.create_table(table);
    CHECK(contains(sql, "PRIMARY KEY (\"PersonID\", \"GroupID\")"));
}

TEST_CASE("DdlBuilder: insert statement has one parameter per column", "[ddl]") {
    CHECK(DdlBuilder::insert_statement("Item", {"ItemID", "Name"}) ==
          "INSERT INTO \"Item\" (\"ItemID\", \"Name\") VALUES (?, ?)");
}
