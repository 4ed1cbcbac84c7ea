#include <catch2/catch_test_macros.hpp>
#include "codegen/model_synthesizer.hpp"
#include "codegen/sqlalchemy_renderer.hpp"

#include <algorithm>
#include <memory>

using namespace schemaport;

namespace {

ColumnMetadata make_column(const std::string& name, LogicalType logical,
                           bool pk = false, bool nullable = true) {
    ColumnMetadata c(name, ColumnTypeInfo(GenericColumnType::TEXT, 0, "TEXT"));
    c.logical = logical;
    c.is_primary_key = pk;
    c.nullable = nullable;
    return c;
}

ColumnMetadata make_fk(const std::string& name, LogicalType logical, const std::string& table,
                       const std::string& column, bool nullable = true) {
    auto c = make_column(name, logical, false, nullable);
    c.foreign_keys.emplace_back(table, column);
    return c;
}

// Concept <- Category <- Item, with Item self-referencing through ParentItemID
Schema make_schema() {
    Schema schema;

    TableMetadata hub("Concept");
    hub.add_column(make_column("ConceptGUID", LogicalType::IDENTIFIER, true, false));
    schema.add_table(std::move(hub));

    TableMetadata category("Category");
    category.add_column(make_column("CategoryGUID", LogicalType::IDENTIFIER, true, false));
    category.add_column(make_fk("RowGUID", LogicalType::IDENTIFIER, "Concept", "ConceptGUID"));
    category.add_column(make_column("Label", LogicalType::TEXT));
    schema.add_table(std::move(category));

    TableMetadata item("Item");
    item.add_column(make_column("ItemID", LogicalType::INTEGER, true, false));
    item.add_column(make_fk("CategoryGUID", LogicalType::IDENTIFIER, "Category", "CategoryGUID", false));
    item.add_column(make_fk("ParentItemID", LogicalType::INTEGER, "Item", "ItemID"));
    auto type = make_column("ItemType", LogicalType::ENUM, false, false);
    type.enum_domain = std::make_shared<const EnumDomain>(EnumDomain{"B", "A"});
    item.add_column(std::move(type));
    schema.add_table(std::move(item));

    return schema;
}

const ModelPlan& model(const ModelFile& file, const std::string& table) {
    const auto it = std::find_if(file.models.begin(), file.models.end(),
        [&table](const ModelPlan& plan) { return plan.table == table; });
    REQUIRE(it != file.models.end());
    return *it;
}

const RelationshipPlan* relationship(const ModelPlan& plan, const std::string& attribute) {
    for (const auto& rel : plan.relationships) {
        if (rel.attribute == attribute) return &rel;
    }
    return nullptr;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("ModelSynthesizer: models follow dependency order", "[synthesizer]") {
    ModelSynthesizer synthesizer{ModelConfig{}};
    auto file = synthesizer.plan(make_schema());

    REQUIRE(file.models.size() == 3);
    CHECK(file.models[0].table == "Concept");
    CHECK(file.models[1].table == "Category");
    CHECK(file.models[2].table == "Item");
    CHECK(file.collisions.empty());
    CHECK(file.advisories.empty());
}

TEST_CASE("ModelSynthesizer: self-references get the reserved name and remote side", "[synthesizer]") {
    ModelSynthesizer synthesizer{ModelConfig{}};
    auto file = synthesizer.plan(make_schema());
    const auto& item = model(file, "Item");

    const auto* self = relationship(item, "self");
    REQUIRE(self);
    CHECK(self->target_class == "Item");
    CHECK(self->foreign_key == "parent_item_id");
    CHECK(self->remote_side == "item_id");
    CHECK(self->nullable);
    CHECK(self->back_populates == "items");

    const auto* children = relationship(item, "items");
    REQUIRE(children);
    CHECK(children->collection);
    CHECK(children->back_populates == "self");
}

TEST_CASE("ModelSynthesizer: references pair with collections on the target", "[synthesizer]") {
    ModelSynthesizer synthesizer{ModelConfig{}};
    auto file = synthesizer.plan(make_schema());

    const auto* forward = relationship(model(file, "Item"), "category");
    REQUIRE(forward);
    CHECK(forward->target_class == "Category");
    CHECK_FALSE(forward->nullable);
    CHECK(forward->back_populates == "items");

    const auto* reverse = relationship(model(file, "Category"), "items");
    REQUIRE(reverse);
    CHECK(reverse->collection);
    CHECK(reverse->target_class == "Item");
    CHECK(reverse->foreign_key == "Item.category_guid");
    CHECK(reverse->back_populates == "category");
}

TEST_CASE("ModelSynthesizer: the hub table gets no collections", "[synthesizer]") {
    ModelSynthesizer synthesizer{ModelConfig{}};
    auto file = synthesizer.plan(make_schema());

    CHECK(model(file, "Concept").relationships.empty());
    CHECK(model(file, "Concept").deferred_references);

    const auto* row_concept = relationship(model(file, "Category"), "row_concept");
    REQUIRE(row_concept);
    CHECK(row_concept->back_populates.empty());
}

TEST_CASE("ModelSynthesizer: foreign keys into later or same tables are deferred", "[synthesizer]") {
    ModelSynthesizer synthesizer{ModelConfig{}};
    auto file = synthesizer.plan(make_schema());
    const auto& item = model(file, "Item");

    REQUIRE(item.fields[1].foreign_keys.size() == 1);
    CHECK_FALSE(item.fields[1].foreign_keys[0].deferred);
    CHECK(item.fields[1].foreign_keys[0].attribute == "category_guid");

    REQUIRE(item.fields[2].foreign_keys.size() == 1);
    CHECK(item.fields[2].foreign_keys[0].deferred);
}

TEST_CASE("ModelSynthesizer: the hub table always quotes its references", "[synthesizer]") {
    Schema schema;
    TableMetadata lookup("Lookup");
    lookup.add_column(make_column("LookupID", LogicalType::INTEGER, true, false));
    schema.add_table(std::move(lookup));

    TableMetadata hub("Concept");
    hub.add_column(make_column("ConceptGUID", LogicalType::IDENTIFIER, true, false));
    hub.add_column(make_fk("LookupID", LogicalType::INTEGER, "Lookup", "LookupID"));
    schema.add_table(std::move(hub));

    ModelSynthesizer synthesizer{ModelConfig{}};
    const auto source = synthesizer.synthesize(schema);
    CHECK(contains(source, "# References are quoted to break circular dependencies"));
    CHECK(contains(source, "mapped_column(\"LookupID\", ForeignKey(\"Lookup.LookupID\"))"));
}

TEST_CASE("ModelSynthesizer: name clashes are renamed, never dropped", "[synthesizer]") {
    Schema schema;
    TableMetadata category("Category");
    category.add_column(make_column("CategoryGUID", LogicalType::IDENTIFIER, true, false));
    schema.add_table(std::move(category));

    TableMetadata product("Product");
    product.add_column(make_column("ProductID", LogicalType::INTEGER, true, false));
    product.add_column(make_column("Category", LogicalType::TEXT));
    product.add_column(make_fk("CategoryGUID", LogicalType::IDENTIFIER, "Category", "CategoryGUID"));
    schema.add_table(std::move(product));

    ModelSynthesizer synthesizer{ModelConfig{}};
    auto file = synthesizer.plan(schema);

    const auto& plan = model(file, "Product");
    CHECK(plan.fields[1].attribute == "category");
    REQUIRE(relationship(plan, "category_category"));
    REQUIRE(file.collisions.size() == 1);
    CHECK(contains(file.collisions[0], "category_category"));
}

TEST_CASE("ModelSynthesizer: several links to one table qualify the collections", "[synthesizer]") {
    Schema schema;
    TableMetadata item("Item");
    item.add_column(make_column("ItemID", LogicalType::INTEGER, true, false));
    schema.add_table(std::move(item));

    TableMetadata link("Link");
    link.add_column(make_column("LinkID", LogicalType::INTEGER, true, false));
    link.add_column(make_fk("SourceItemID", LogicalType::INTEGER, "Item", "ItemID"));
    link.add_column(make_fk("TargetItemID", LogicalType::INTEGER, "Item", "ItemID"));
    schema.add_table(std::move(link));

    ModelSynthesizer synthesizer{ModelConfig{}};
    auto file = synthesizer.plan(schema);

    const auto& owner = model(file, "Link");
    REQUIRE(relationship(owner, "source_item"));
    REQUIRE(relationship(owner, "target_item"));

    const auto& target = model(file, "Item");
    const auto* by_source = relationship(target, "links_by_source_item");
    const auto* by_target = relationship(target, "links_by_target_item");
    REQUIRE(by_source);
    REQUIRE(by_target);
    CHECK(by_source->back_populates == "source_item");
    CHECK(by_target->foreign_key == "Link.target_item_id");
}

TEST_CASE("ModelSynthesizer: reverse relationships can be turned off", "[synthesizer]") {
    ModelConfig config;
    config.reverse_relationships = false;
    ModelSynthesizer synthesizer{config};
    auto file = synthesizer.plan(make_schema());

    CHECK(model(file, "Category").relationships.size() == 1);
    for (const auto& rel : model(file, "Item").relationships) {
        CHECK_FALSE(rel.collection);
        CHECK(rel.back_populates.empty());
    }
}

TEST_CASE("ModelSynthesizer: tables without a primary key", "[synthesizer]") {
    Schema schema;
    TableMetadata log("Log");
    log.add_column(make_column("RowGUID", LogicalType::IDENTIFIER, false, false));
    log.add_column(make_column("Message", LogicalType::TEXT));
    schema.add_table(std::move(log));

    TableMetadata note("Note_2");
    note.add_column(make_column("Body", LogicalType::TEXT, false, false));
    schema.add_table(std::move(note));

    ModelSynthesizer synthesizer{ModelConfig{}};
    auto file = synthesizer.plan(schema);
    CHECK(model(file, "Log").kind == ModelKind::MAPPED_CLASS);
    CHECK(model(file, "Log").mapper_primary_key == "row_guid");
    CHECK(model(file, "Note_2").kind == ModelKind::TABLE);

    const auto source = SqlAlchemyRenderer(ModelConfig{}).render(file);
    CHECK(contains(source, "__mapper_args__: ClassVar = {\"primary_key\": (row_guid,)}"));
    CHECK(contains(source, "Note2 = AlchemyTable(\n"));
    CHECK(contains(source, "    Column(\"Body\", String, nullable=False),\n"));
    CHECK(contains(source, "from sqlalchemy import Column, String, Table as AlchemyTable\n"));
    CHECK(contains(source, "from typing import ClassVar\n"));
}

TEST_CASE("ModelSynthesizer: references to plain tables are reported, not related", "[synthesizer]") {
    Schema schema;
    TableMetadata note("Note");
    note.add_column(make_column("NoteID", LogicalType::INTEGER, false, false));
    note.add_column(make_column("Body", LogicalType::TEXT));
    schema.add_table(std::move(note));

    TableMetadata entry("Entry");
    entry.add_column(make_column("EntryID", LogicalType::INTEGER, true, false));
    entry.add_column(make_fk("NoteID", LogicalType::INTEGER, "Note", "NoteID"));
    schema.add_table(std::move(entry));

    ModelSynthesizer synthesizer{ModelConfig{}};
    auto file = synthesizer.plan(schema);
    CHECK(model(file, "Note").kind == ModelKind::TABLE);
    CHECK(model(file, "Entry").relationships.empty());
    REQUIRE(file.advisories.size() == 1);
    CHECK(contains(file.advisories[0], "Entry.NoteID"));
    CHECK(contains(file.advisories[0], "Note is not a mapped class"));
}

TEST_CASE("ModelSynthesizer: rendered source", "[synthesizer][render]") {
    ModelSynthesizer synthesizer{ModelConfig{}};
    const auto source = synthesizer.synthesize(make_schema());

    CHECK(source.rfind("\"\"\"SQLAlchemy models generated by schemaport.\"\"\"\n\nfrom __future__ import annotations\n", 0) == 0);
    CHECK(contains(source, "from sqlalchemy import Enum, ForeignKey\n"));
    CHECK(contains(source, "from sqlalchemy.orm import DeclarativeBase, Mapped, mapped_column, relationship\n"));
    CHECK(contains(source, "from typing import Literal\n"));
    CHECK(contains(source, "class DPM(DeclarativeBase):\n"));
    CHECK(contains(source, "class Item(DPM):\n"));
    CHECK(contains(source, "    __tablename__ = \"Item\"\n"));

    CHECK(contains(source, "    item_id: Mapped[int] = mapped_column(\"ItemID\", primary_key=True)\n"));
    CHECK(contains(source,
        "    category_guid: Mapped[str] = mapped_column(\"CategoryGUID\", ForeignKey(Category.category_guid))\n"));
    CHECK(contains(source,
        "    parent_item_id: Mapped[int | None] = mapped_column(\"ParentItemID\", ForeignKey(\"Item.ItemID\"))\n"));
    CHECK(contains(source,
        "    item_type: Mapped[Literal[\"A\", \"B\"]] = mapped_column(\"ItemType\", Enum(\"A\", \"B\"))\n"));
    CHECK(contains(source,
        "    self: Mapped[Item | None] = relationship(foreign_keys=parent_item_id, remote_side=item_id, "
        "back_populates=\"items\")\n"));
    CHECK(contains(source,
        "    items: Mapped[list[Item]] = relationship(foreign_keys=\"Item.category_guid\", "
        "back_populates=\"category\")\n"));
    CHECK(contains(source,
        "    row_concept: Mapped[Concept | None] = relationship(foreign_keys=row_guid)\n"));

    // Category is declared before Item
    CHECK(source.find("class Category(DPM)") < source.find("class Item(DPM)"));
}

TEST_CASE("ModelSynthesizer: output is deterministic", "[synthesizer][render]") {
    ModelSynthesizer synthesizer{ModelConfig{}};
    CHECK(synthesizer.synthesize(make_schema()) == synthesizer.synthesize(make_schema()));
}
