#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace schemaport {

// ============================================================================
// Model Plan - what the renderer emits, with every name already decided
// ============================================================================

struct ForeignKeyTarget {
    std::string table;          // referenced table name
    std::string column;         // referenced column name
    std::string class_name;     // PascalCase class of the referenced table
    std::string attribute;      // snake_case attribute of the referenced column
    bool deferred = false;      // render as a quoted "Table.Column" string
};

struct FieldPlan {
    std::string attribute;      // Python attribute name
    std::string column;         // database column name
    LogicalType type = LogicalType::TEXT;
    bool nullable = true;
    bool primary_key = false;
    std::vector<ForeignKeyTarget> foreign_keys;
    std::shared_ptr<const EnumDomain> enum_domain;
};

struct RelationshipPlan {
    std::string attribute;          // unique within the owning class
    std::string target_class;
    std::string foreign_key;        // owning-side FK attribute, or "Class.attr" for collections
    std::string remote_side;        // set for many-to-one references into the same table
    std::string back_populates;     // partner attribute, empty when there is none
    bool collection = false;        // one-to-many side
    bool nullable = false;
};

enum class ModelKind {
    MAPPED_CLASS,   // declarative class
    TABLE,          // plain Table object (no primary key, no identity column)
};

struct ModelPlan {
    std::string table;
    std::string class_name;
    ModelKind kind = ModelKind::MAPPED_CLASS;
    bool deferred_references = false;   // hub table: all FK targets quoted
    std::string mapper_primary_key;     // identity attribute when the table has no PK
    std::vector<FieldPlan> fields;
    std::vector<RelationshipPlan> relationships;
};

struct ModelFile {
    std::vector<ModelPlan> models;          // in emission order
    std::vector<std::string> collisions;    // one entry per renamed attribute
    std::vector<std::string> advisories;    // cycle breaks, relationships left out
};

} // namespace schemaport
