#include <catch2/catch_test_macros.hpp>
#include "codegen/naming.hpp"

using namespace schemaport;

TEST_CASE("Naming: snake_case splits camel humps and acronyms", "[naming]") {
    CHECK(naming::snake_case("ConceptGUID") == "concept_guid");
    CHECK(naming::snake_case("RowGUID") == "row_guid");
    CHECK(naming::snake_case("ParentItemID") == "parent_item_id");
    CHECK(naming::snake_case("HTTPServer") == "http_server");
    CHECK(naming::snake_case("Item2Name") == "item2_name");
    CHECK(naming::snake_case("already_snake") == "already_snake");
    CHECK(naming::snake_case("") == "");
}

TEST_CASE("Naming: pascal_case capitalizes words and drops underscores", "[naming]") {
    CHECK(naming::pascal_case("Item") == "Item");
    CHECK(naming::pascal_case("table_group") == "TableGroup");
    CHECK(naming::pascal_case("_leading") == "Leading");
    CHECK(naming::pascal_case("ModuleVersion") == "ModuleVersion");
}

TEST_CASE("Naming: characters outside Python identifiers become underscores", "[naming]") {
    CHECK(naming::snake_case("Order Date") == "order_date");
    CHECK(naming::snake_case("Item-Code #2") == "item_code_2");
    CHECK(naming::snake_case("2ndPlace") == "_2nd_place");
    CHECK(naming::snake_case("Caf\xc3\xa9") == "caf_");
    CHECK(naming::pascal_case("Order Details") == "OrderDetails");
    CHECK(naming::pascal_case("Line-Item") == "LineItem");
    CHECK(naming::pascal_case("2019 Data") == "_2019Data");
    CHECK(naming::attribute_name("Class Name") == "class_name");
}

TEST_CASE("Naming: reserved words get a trailing underscore", "[naming]") {
    CHECK(naming::is_python_keyword("from"));
    CHECK(naming::is_python_keyword("None"));
    CHECK_FALSE(naming::is_python_keyword("type"));
    CHECK(naming::attribute_name("From") == "from_");
    CHECK(naming::attribute_name("Class") == "class_");
    CHECK(naming::attribute_name("Type") == "type");
}

TEST_CASE("Naming: pluralize", "[naming]") {
    CHECK(naming::pluralize("item") == "items");
    CHECK(naming::pluralize("class") == "classes");
    CHECK(naming::pluralize("box") == "boxes");
    CHECK(naming::pluralize("branch") == "branches");
    CHECK(naming::pluralize("category") == "categories");
    CHECK(naming::pluralize("key") == "keys");
}
