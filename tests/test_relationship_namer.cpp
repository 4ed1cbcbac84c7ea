#include <catch2/catch_test_macros.hpp>
#include "codegen/relationship_namer.hpp"

using namespace schemaport;

namespace {

TableMetadata table_with(const std::string& name, const std::vector<std::string>& columns,
                         const std::string& pk) {
    TableMetadata table(name);
    for (const auto& column : columns) {
        ColumnMetadata c(column, ColumnTypeInfo(GenericColumnType::INTEGER, 0, "INTEGER"));
        c.is_primary_key = column == pk;
        table.add_column(std::move(c));
    }
    return table;
}

} // namespace

TEST_CASE("RelationshipNamer: key suffixes are replaced or stripped", "[namer]") {
    RelationshipNamer namer{ModelConfig{}};
    CHECK(namer.relation_name("ConceptGUID") == "Concept");
    CHECK(namer.relation_name("ModuleVID") == "ModuleVersion");
    CHECK(namer.relation_name("ItemID") == "Item");
    CHECK(namer.relation_name("Code") == "Code");
    // The suffix alone is never stripped to nothing
    CHECK(namer.relation_name("ID") == "ID");
}

TEST_CASE("RelationshipNamer: plain references are named after the column", "[namer]") {
    RelationshipNamer namer{ModelConfig{}};
    auto owner = table_with("Item", {"ItemID", "CategoryGUID"}, "ItemID");
    const ForeignKeyRef fk("Category", "CategoryGUID");

    CHECK(namer.base_name(owner, *owner.find_column("CategoryGUID"), fk) == "Category");
    CHECK(namer.attribute_name(owner, *owner.find_column("CategoryGUID"), fk) == "category");
}

TEST_CASE("RelationshipNamer: configured relation names win", "[namer]") {
    RelationshipNamer namer{ModelConfig{}};
    auto owner = table_with("Item", {"ItemID", "RowGUID"}, "ItemID");
    const ForeignKeyRef fk("Concept", "ConceptGUID");

    CHECK(namer.attribute_name(owner, *owner.find_column("RowGUID"), fk) == "row_concept");
}

TEST_CASE("RelationshipNamer: key-to-key links use the target table name", "[namer]") {
    RelationshipNamer namer{ModelConfig{}};
    auto owner = table_with("Item", {"ItemID"}, "ItemID");
    const ForeignKeyRef fk("Concept", "ConceptGUID");

    CHECK(namer.base_name(owner, *owner.find_column("ItemID"), fk) == "Concept");
}

TEST_CASE("RelationshipNamer: unstripped names get the target or a prefix", "[namer]") {
    RelationshipNamer namer{ModelConfig{}};
    auto owner = table_with("Item", {"ItemID", "Owner", "Category"}, "ItemID");

    CHECK(namer.base_name(owner, *owner.find_column("Owner"), ForeignKeyRef("Person", "PersonID")) ==
          "OwnerPerson");
    CHECK(namer.base_name(owner, *owner.find_column("Category"), ForeignKeyRef("Category", "Code")) ==
          "RelatedCategory");
}

TEST_CASE("RelationshipNamer: self-references use the reserved token", "[namer]") {
    RelationshipNamer namer{ModelConfig{}};
    auto owner = table_with("Item", {"ItemID", "ParentItemID", "Code"}, "ItemID");

    const ForeignKeyRef to_pk("Item", "ItemID");
    CHECK(RelationshipNamer::is_self_reference(owner, *owner.find_column("ParentItemID"), to_pk));
    CHECK(namer.attribute_name(owner, *owner.find_column("ParentItemID"), to_pk) == "self");

    // Same table but a non-key target column is an ordinary reference
    const ForeignKeyRef to_code("Item", "Code");
    CHECK_FALSE(RelationshipNamer::is_self_reference(owner, *owner.find_column("ParentItemID"), to_code));
    CHECK(namer.attribute_name(owner, *owner.find_column("ParentItemID"), to_code) == "parent_item");
}

TEST_CASE("NameScope: collisions fall back to target-qualified names", "[namer]") {
    NameScope scope("Item");
    std::vector<std::string> collisions;

    CHECK(scope.claim("category", "category", collisions) == "category");
    CHECK(collisions.empty());

    CHECK(scope.claim("category", "category", collisions) == "category_category");
    CHECK(scope.claim("category", "category", collisions) == "category_category_2");
    CHECK(scope.claim("category", "category", collisions) == "category_category_3");
    CHECK(collisions.size() == 3);
    CHECK(scope.contains("category_category_2"));
}
