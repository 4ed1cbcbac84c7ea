#include <catch2/catch_test_macros.hpp>
#include "db/sqlite/sqlite_source_reader.hpp"
#include "db/sqlite/sqlite_type_map.hpp"
#include "core/error.hpp"

#include <filesystem>

using namespace schemaport;

namespace {

// RAII temporary SQLite file populated with a small catalog
struct TmpDatabase {
    std::filesystem::path path;
    TmpDatabase() : path(std::filesystem::temp_directory_path() / "schemaport_test_reader.sqlite") {
        std::filesystem::remove(path);
        auto conn = SqliteConnection::open(path.string(), false);
        conn->exec(R"(
            CREATE TABLE Category (
                CategoryGUID VARCHAR(36) PRIMARY KEY,
                Label TEXT
            );
            CREATE TABLE Item (
                ItemID INTEGER PRIMARY KEY,
                CategoryGUID VARCHAR(36) REFERENCES Category (CategoryGUID),
                OwnerGUID VARCHAR(36) REFERENCES Category,
                Price CURRENCY,
                IsActive BIT
            );
            CREATE TABLE Membership (
                GroupID INTEGER,
                PersonID INTEGER,
                Role TEXT,
                PRIMARY KEY (PersonID, GroupID)
            );
            INSERT INTO Category VALUES ('c1', 'First');
            INSERT INTO Item VALUES (1, 'c1', NULL, 9.5, 1);
            INSERT INTO Item VALUES (2, NULL, 'c1', NULL, 0);
        )");
    }
    ~TmpDatabase() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("SqliteTypeMap: declared types map to generic types", "[sqlite][types]") {
    CHECK(SqliteTypeMap::declared_type_to_generic("VARCHAR(255)") == GenericColumnType::VARCHAR);
    CHECK(SqliteTypeMap::declared_type_to_generic("counter") == GenericColumnType::COUNTER);
    CHECK(SqliteTypeMap::declared_type_to_generic("CURRENCY") == GenericColumnType::MONEY);
    CHECK(SqliteTypeMap::declared_type_to_generic("YesNo") == GenericColumnType::BOOLEAN);
    CHECK(SqliteTypeMap::declared_type_to_generic("uniqueidentifier") == GenericColumnType::UUID);
    CHECK(SqliteTypeMap::declared_type_to_generic("DATETIME") == GenericColumnType::TIMESTAMP);
    CHECK(SqliteTypeMap::declared_type_to_generic("UNSIGNED BIG INT") == GenericColumnType::INTEGER);
    CHECK(SqliteTypeMap::declared_type_to_generic("") == GenericColumnType::UNKNOWN);
}

TEST_CASE("SqliteSourceReader: lists user tables in name order", "[sqlite][reader]") {
    TmpDatabase db;
    SqliteSourceReader reader(db.path.string());
    CHECK(reader.list_tables() == std::vector<std::string>{"Category", "Item", "Membership"});
}

TEST_CASE("SqliteSourceReader: reflects columns, keys and declared foreign keys", "[sqlite][reader]") {
    TmpDatabase db;
    SqliteSourceReader reader(db.path.string());

    auto item = reader.reflect_table("Item");
    REQUIRE(item.columns.size() == 5);
    CHECK(item.columns[0].name == "ItemID");
    CHECK(item.columns[0].is_primary_key);
    CHECK(item.columns[3].physical.generic_type == GenericColumnType::MONEY);
    CHECK(item.columns[4].physical.generic_type == GenericColumnType::BOOLEAN);

    const auto& category_fk = item.find_column("CategoryGUID")->foreign_keys;
    REQUIRE(category_fk.size() == 1);
    CHECK(category_fk[0].table == "Category");
    CHECK(category_fk[0].column == "CategoryGUID");
    CHECK_FALSE(category_fk[0].augmented);

    // No column list: resolved to the target's primary key
    const auto& owner_fk = item.find_column("OwnerGUID")->foreign_keys;
    REQUIRE(owner_fk.size() == 1);
    CHECK(owner_fk[0].column == "CategoryGUID");
}

TEST_CASE("SqliteSourceReader: composite keys keep the declared key order", "[sqlite][reader]") {
    TmpDatabase db;
    SqliteSourceReader reader(db.path.string());

    auto membership = reader.reflect_table("Membership");
    CHECK(membership.find_column("PersonID")->pk_position == 1);
    CHECK(membership.find_column("GroupID")->pk_position == 2);
    CHECK_FALSE(membership.find_column("Role")->is_primary_key);
    CHECK(membership.primary_key_columns() == std::vector<std::string>{"PersonID", "GroupID"});
}

TEST_CASE("SqliteSourceReader: reads rows positionally", "[sqlite][reader]") {
    TmpDatabase db;
    SqliteSourceReader reader(db.path.string());

    auto item = reader.reflect_table("Item");
    auto rows = reader.read_rows(item);
    REQUIRE(rows.size() == 2);
    CHECK(std::get<int64_t>(rows[0][0]) == 1);
    CHECK(std::get<std::string>(rows[0][1]) == "c1");
    CHECK(is_null(rows[1][1]));
}

TEST_CASE("SqliteSourceReader: unknown tables are extraction errors", "[sqlite][reader]") {
    TmpDatabase db;
    SqliteSourceReader reader(db.path.string());

    try {
        (void)reader.reflect_table("Missing");
        FAIL("expected MigrationError");
    } catch (const MigrationError& e) {
        CHECK(e.category() == ErrorCategory::EXTRACTION_ERROR);
    }
}

TEST_CASE("SqliteSourceReader: a missing file is a connection error", "[sqlite][reader]") {
    const auto missing = std::filesystem::temp_directory_path() / "schemaport_no_such_file.sqlite";
    std::filesystem::remove(missing);
    try {
        SqliteSourceReader reader(missing.string());
        FAIL("expected MigrationError");
    } catch (const MigrationError& e) {
        CHECK(e.category() == ErrorCategory::CONNECTION_ERROR);
    }
}
