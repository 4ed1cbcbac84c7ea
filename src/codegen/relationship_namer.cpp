#include "codegen/relationship_namer.hpp"
#include "codegen/naming.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace schemaport {

// ============================================================================
// NameScope
// ============================================================================

std::string NameScope::claim(const std::string& preferred,
                             const std::string& target,
                             std::vector<std::string>& collisions) {
    if (reserve(preferred)) {
        return preferred;
    }

    std::string candidate = std::format("{}_{}", preferred, target);
    for (int n = 2; contains(candidate); ++n) {
        candidate = std::format("{}_{}_{}", preferred, target, n);
    }
    used_.insert(candidate);

    auto message = std::format("{}: {} already taken, renamed to {}", owner_, preferred, candidate);
    utils::log::warn(std::format("[{}] {}",
                                 error_category_to_string(ErrorCategory::SYNTHESIS_COLLISION), message));
    collisions.push_back(std::move(message));
    return candidate;
}

// ============================================================================
// RelationshipNamer
// ============================================================================

RelationshipNamer::RelationshipNamer(const ModelConfig& config)
    : config_(config) {}

std::string RelationshipNamer::relation_name(std::string_view column) const {
    for (const auto& [suffix, replacement] : config_.suffix_replacements) {
        if (column.size() > suffix.size() && column.ends_with(suffix)) {
            return std::string(column.substr(0, column.size() - suffix.size())) + replacement;
        }
    }
    for (const auto& suffix : config_.strip_suffixes) {
        if (column.size() > suffix.size() && column.ends_with(suffix)) {
            return std::string(column.substr(0, column.size() - suffix.size()));
        }
    }
    return std::string(column);
}

bool RelationshipNamer::is_self_reference(const TableMetadata& owner,
                                          const ColumnMetadata& column,
                                          const ForeignKeyRef& fk) {
    if (fk.table != owner.name) return false;
    if (fk.column == column.name) return true;
    const auto* target = owner.find_column(fk.column);
    return target != nullptr && target->is_primary_key;
}

std::string RelationshipNamer::base_name(const TableMetadata& owner,
                                         const ColumnMetadata& column,
                                         const ForeignKeyRef& fk) const {
    if (is_self_reference(owner, column, fk)) {
        return config_.self_reference_name;
    }

    std::string name;
    if (const auto it = config_.relation_names.find(column.name); it != config_.relation_names.end()) {
        name = it->second;
    } else {
        name = relation_name(column.name);
    }

    // Key-to-key links such as Item.ItemID -> Concept.ConceptGUID
    if (name == owner.name) {
        name = fk.table;
    }

    if (name == column.name) {
        if (name.find(fk.table) != std::string::npos) {
            name = config_.related_prefix + name;
        } else {
            name += fk.table;
        }
    }
    return name;
}

std::string RelationshipNamer::attribute_name(const TableMetadata& owner,
                                              const ColumnMetadata& column,
                                              const ForeignKeyRef& fk) const {
    return naming::attribute_name(base_name(owner, column, fk));
}

} // namespace schemaport
