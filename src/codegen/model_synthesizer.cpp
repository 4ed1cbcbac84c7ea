#include "codegen/model_synthesizer.hpp"
#include "codegen/naming.hpp"
#include "codegen/sqlalchemy_renderer.hpp"
#include "core/utils.hpp"

#include <format>
#include <map>
#include <unordered_map>
#include <utility>

namespace schemaport {

namespace {

// One owning-side relationship waiting for its collection partner
struct PendingReverse {
    size_t owner;
    size_t relationship;    // index into the owner's relationships
    size_t target;
    std::string column;     // FK column on the owner
    std::string fk_column;  // referenced column on the target
};

} // anonymous namespace

ModelSynthesizer::ModelSynthesizer(ModelConfig config)
    : config_(std::move(config)), namer_(config_) {}

ModelFile ModelSynthesizer::plan(const Schema& schema) const {
    return plan(schema, DependencyOrderer::order(schema));
}

ModelFile ModelSynthesizer::plan(const Schema& schema, const TableOrder& order) const {
    ModelFile file;
    file.advisories = order.advisories;

    const size_t n = schema.size();
    std::vector<size_t> position(n, 0);
    for (size_t pos = 0; pos < order.order.size(); ++pos) {
        position[order.order[pos]] = pos;
    }

    std::vector<ModelPlan> plans(n);
    std::vector<NameScope> scopes;
    scopes.reserve(n);
    for (size_t idx = 0; idx < n; ++idx) {
        scopes.emplace_back(schema.at(idx).name);
    }
    std::vector<std::unordered_map<std::string, std::string>> attributes(n);  // column -> attribute

    // Pass 1: fields
    for (const size_t idx : order.order) {
        const auto& table = schema.at(idx);
        auto& plan = plans[idx];
        auto& scope = scopes[idx];

        plan.table = table.name;
        plan.class_name = naming::pascal_case(table.name);
        plan.deferred_references = table.name == config_.hub_table;

        const bool has_identity = table.find_column(config_.identity_column) != nullptr;
        plan.kind = (table.has_primary_key() || has_identity) ? ModelKind::MAPPED_CLASS : ModelKind::TABLE;

        for (const auto& column : table.columns) {
            FieldPlan field;
            field.column = column.name;
            field.attribute = scope.claim(naming::attribute_name(column.name),
                                          naming::snake_case(table.name), file.collisions);
            field.type = column.logical;
            field.nullable = column.nullable;
            field.primary_key = column.is_primary_key;
            field.enum_domain = column.enum_domain;
            attributes[idx][column.name] = field.attribute;
            plan.fields.push_back(std::move(field));
        }

        if (!table.has_primary_key() && has_identity) {
            plan.mapper_primary_key = attributes[idx][config_.identity_column];
        }
    }

    // Foreign key targets
    for (const size_t idx : order.order) {
        const auto& table = schema.at(idx);
        auto& plan = plans[idx];
        for (size_t c = 0; c < table.columns.size(); ++c) {
            for (const auto& fk : table.columns[c].foreign_keys) {
                ForeignKeyTarget target;
                target.table = fk.table;
                target.column = fk.column;
                target.class_name = naming::pascal_case(fk.table);

                const auto target_idx = schema.index_of(fk.table);
                if (target_idx) {
                    const auto& attrs = attributes[*target_idx];
                    const auto it = attrs.find(fk.column);
                    target.attribute = it != attrs.end() ? it->second : naming::attribute_name(fk.column);
                } else {
                    target.attribute = naming::attribute_name(fk.column);
                }

                // Anything not emitted strictly earlier is referenced by name
                target.deferred = plan.deferred_references || !target_idx ||
                                  position[*target_idx] >= position[idx] ||
                                  plans[*target_idx].kind != ModelKind::MAPPED_CLASS;
                plan.fields[c].foreign_keys.push_back(std::move(target));
            }
        }
    }

    // Pass 2: owning-side relationships
    std::vector<PendingReverse> pending;
    for (const size_t idx : order.order) {
        const auto& table = schema.at(idx);
        auto& plan = plans[idx];
        if (plan.kind != ModelKind::MAPPED_CLASS) continue;

        // Relationships named after something other than their target come first
        for (const bool named_after_target : {false, true}) {
            for (const auto& column : table.columns) {
                for (const auto& fk : column.foreign_keys) {
                    if ((namer_.relation_name(column.name) == fk.table) != named_after_target) continue;

                    const auto target_idx = schema.index_of(fk.table);
                    if (!target_idx || plans[*target_idx].kind != ModelKind::MAPPED_CLASS) {
                        auto advisory = std::format("No relationship for {}.{}: {} is not a mapped class",
                                                    table.name, column.name, fk.table);
                        utils::log::warn(advisory);
                        file.advisories.push_back(std::move(advisory));
                        continue;
                    }

                    RelationshipPlan rel;
                    rel.attribute = scopes[idx].claim(
                        namer_.attribute_name(table, column, fk),
                        naming::snake_case(fk.table), file.collisions);
                    rel.target_class = naming::pascal_case(fk.table);
                    rel.foreign_key = attributes[idx][column.name];
                    rel.nullable = column.nullable;
                    if (*target_idx == idx) {
                        rel.remote_side = attributes[idx][fk.column];
                    }

                    pending.push_back({idx, plan.relationships.size(), *target_idx, column.name, fk.column});
                    plan.relationships.push_back(std::move(rel));
                }
            }
        }
    }

    // Pass 3: collection side
    if (config_.reverse_relationships) {
        std::map<std::pair<size_t, size_t>, size_t> links;   // (owner, target) -> count
        for (const auto& p : pending) {
            ++links[{p.owner, p.target}];
        }

        for (const auto& p : pending) {
            const auto& owner = schema.at(p.owner);
            const auto& target = schema.at(p.target);
            if (target.name == config_.hub_table) continue;
            if (p.owner == p.target && p.column == p.fk_column) continue;

            auto& forward = plans[p.owner].relationships[p.relationship];
            std::string preferred = naming::pluralize(naming::snake_case(owner.name));
            if (links[{p.owner, p.target}] > 1) {
                preferred += "_by_" + forward.attribute;
            }

            RelationshipPlan rel;
            rel.attribute = scopes[p.target].claim(
                preferred, naming::snake_case(owner.name), file.collisions);
            rel.target_class = plans[p.owner].class_name;
            rel.foreign_key = p.owner == p.target
                ? forward.foreign_key
                : std::format("{}.{}", plans[p.owner].class_name, forward.foreign_key);
            rel.collection = true;
            rel.back_populates = forward.attribute;
            forward.back_populates = rel.attribute;
            plans[p.target].relationships.push_back(std::move(rel));
        }
    }

    file.models.reserve(n);
    for (const size_t idx : order.order) {
        file.models.push_back(std::move(plans[idx]));
    }
    return file;
}

std::string ModelSynthesizer::synthesize(const Schema& schema) const {
    const auto file = plan(schema);
    return SqlAlchemyRenderer(config_).render(file);
}

} // namespace schemaport
