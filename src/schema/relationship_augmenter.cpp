#include "schema/relationship_augmenter.hpp"
#include "core/utils.hpp"

#include <format>

namespace schemaport {

RelationshipAugmenter::RelationshipAugmenter(std::vector<ForeignKeyMapping> mappings)
    : mappings_(std::move(mappings)) {}

Schema RelationshipAugmenter::augment(Schema schema) const {
    for (const auto& mapping : mappings_) {
        const auto* target = schema.find_table(mapping.target_table);
        if (!target || !target->find_column(mapping.target_column)) {
            utils::log::warn(std::format("Foreign key convention {} -> {}.{} skipped: target not in schema",
                mapping.column, mapping.target_table, mapping.target_column));
        }
    }

    size_t added = 0;
    for (size_t i = 0; i < schema.size(); ++i) {
        // Only foreign_keys is mutated; column and table indices stay valid
        added += augment_table(schema.at(i), schema);
    }
    utils::log::info(std::format("Relationship augmentation: {} foreign key(s) added", added));
    return schema;
}

size_t RelationshipAugmenter::augment_table(TableMetadata& table, const Schema& schema) const {
    size_t added = 0;
    for (const auto& mapping : mappings_) {
        auto* column = table.find_column(mapping.column);
        if (!column || !column->foreign_keys.empty()) {
            continue;
        }
        if (table.name == mapping.target_table && column->name == mapping.target_column) {
            continue;
        }
        const auto* target = schema.find_table(mapping.target_table);
        if (!target || !target->find_column(mapping.target_column)) {
            continue;
        }

        column->foreign_keys.emplace_back(mapping.target_table, mapping.target_column, true);
        ++added;
        utils::log::debug(std::format("Augmented foreign key {}.{} -> {}.{}",
            table.name, column->name, mapping.target_table, mapping.target_column));
    }
    return added;
}

} // namespace schemaport
