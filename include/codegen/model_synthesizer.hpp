#pragma once

#include "codegen/model_plan.hpp"
#include "codegen/relationship_namer.hpp"
#include "config/config_types.hpp"
#include "core/types.hpp"
#include "schema/dependency_orderer.hpp"

#include <string>

namespace schemaport {

/**
 * @brief Plans one model declaration per table and renders the model file
 *
 * Tables are emitted in dependency order and columns in ordinal order, so
 * identical schemas produce byte-identical output. Planning happens in
 * three passes:
 *   1. field attributes for every table (so foreign keys can name the
 *      referenced attribute whatever its emission position)
 *   2. owning-side relationships, one per foreign key
 *   3. collection relationships on the referenced side, paired through
 *      back_populates
 * Name clashes inside one class are resolved by NameScope and never drop a
 * relationship.
 */
class ModelSynthesizer {
public:
    explicit ModelSynthesizer(ModelConfig config);

    [[nodiscard]] ModelFile plan(const Schema& schema) const;
    [[nodiscard]] ModelFile plan(const Schema& schema, const TableOrder& order) const;

    /**
     * @brief Plan and render the complete model source
     */
    [[nodiscard]] std::string synthesize(const Schema& schema) const;

private:
    ModelConfig config_;
    RelationshipNamer namer_;
};

} // namespace schemaport
