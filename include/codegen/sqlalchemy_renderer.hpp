#pragma once

#include "codegen/model_plan.hpp"
#include "config/config_types.hpp"

#include <map>
#include <set>
#include <string>

namespace schemaport {

/**
 * @brief Renders a ModelFile as SQLAlchemy 2.0 declarative Python source
 *
 * Mapped classes use Mapped[...] annotations with mapped_column(); tables
 * without any key become plain Table objects bound to the base metadata.
 * Imports are collected while rendering and emitted sorted.
 */
class SqlAlchemyRenderer {
public:
    explicit SqlAlchemyRenderer(const ModelConfig& config);

    [[nodiscard]] std::string render(const ModelFile& file) const;

private:
    using Imports = std::map<std::string, std::set<std::string>>;

    [[nodiscard]] std::string render_class(const ModelPlan& plan, Imports& imports) const;
    [[nodiscard]] std::string render_table(const ModelPlan& plan, Imports& imports) const;
    [[nodiscard]] std::string render_field(const FieldPlan& field, Imports& imports) const;
    [[nodiscard]] std::string render_relationship(const RelationshipPlan& rel, Imports& imports) const;

    [[nodiscard]] static std::string python_type(const FieldPlan& field, Imports& imports);
    [[nodiscard]] static std::string sql_type(const FieldPlan& field, Imports& imports);
    [[nodiscard]] static std::string foreign_key(const ForeignKeyTarget& target, Imports& imports);

    ModelConfig config_;
};

/**
 * @brief Double-quoted Python string literal
 */
[[nodiscard]] std::string python_string(const std::string& value);

} // namespace schemaport
