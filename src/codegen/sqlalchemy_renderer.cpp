#include "codegen/sqlalchemy_renderer.hpp"
#include "codegen/naming.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <vector>

namespace schemaport {

namespace {

constexpr const char* kSqlAlchemy = "sqlalchemy";
constexpr const char* kOrm = "sqlalchemy.orm";
constexpr const char* kTyping = "typing";

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string enum_values(const EnumDomain& domain) {
    std::vector<std::string> values;
    values.reserve(domain.size());
    for (const auto& value : domain) {
        values.push_back(python_string(value));
    }
    return join(values, ", ");
}

bool has_domain(const FieldPlan& field) {
    return field.type == LogicalType::ENUM && field.enum_domain && !field.enum_domain->empty();
}

bool is_alpha_name(const std::string& name) {
    return !name.empty() && std::all_of(name.begin(), name.end(),
        [](unsigned char c) { return std::isalpha(c) != 0; });
}

} // anonymous namespace

std::string python_string(const std::string& value) {
    std::string out = "\"";
    for (const char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    out += '"';
    return out;
}

SqlAlchemyRenderer::SqlAlchemyRenderer(const ModelConfig& config)
    : config_(config) {}

std::string SqlAlchemyRenderer::render(const ModelFile& file) const {
    Imports imports;
    imports[kOrm].insert("DeclarativeBase");

    std::vector<std::string> models;
    models.reserve(file.models.size());
    for (const auto& plan : file.models) {
        models.push_back(plan.kind == ModelKind::MAPPED_CLASS
                             ? render_class(plan, imports)
                             : render_table(plan, imports));
    }

    std::string out = "\"\"\"SQLAlchemy models generated by schemaport.\"\"\"\n\n";
    out += "from __future__ import annotations\n\n";
    for (const auto& [module, names] : imports) {
        out += std::format("from {} import {}\n", module,
                           join(std::vector<std::string>(names.begin(), names.end()), ", "));
    }
    out += "\n\n";
    out += std::format("class {}(DeclarativeBase):\n", config_.base_class);
    out += std::format("{}\"\"\"Base class for all generated models.\"\"\"\n", config_.indent);

    for (const auto& model : models) {
        out += "\n\n";
        out += model;
    }
    return out;
}

std::string SqlAlchemyRenderer::render_class(const ModelPlan& plan, Imports& imports) const {
    const std::string& in = config_.indent;
    std::string out = std::format("class {}({}):", plan.class_name, config_.base_class);
    if (!is_alpha_name(plan.table)) {
        out += "  # noqa: N801";
    }
    out += '\n';
    out += std::format("{}\"\"\"Auto-generated model for the {} table.\"\"\"\n", in, plan.table);
    out += std::format("{}__tablename__ = {}\n\n", in, python_string(plan.table));

    if (plan.deferred_references) {
        out += std::format("{}# References are quoted to break circular dependencies\n", in);
    }
    for (const auto& field : plan.fields) {
        out += render_field(field, imports);
    }

    if (!plan.mapper_primary_key.empty()) {
        imports[kTyping].insert("ClassVar");
        out += std::format("\n{}__mapper_args__: ClassVar = {{\"primary_key\": ({},)}}\n",
                           in, plan.mapper_primary_key);
    }

    if (!plan.relationships.empty()) {
        out += '\n';
        for (const auto& rel : plan.relationships) {
            out += render_relationship(rel, imports);
        }
    }
    return out;
}

std::string SqlAlchemyRenderer::render_table(const ModelPlan& plan, Imports& imports) const {
    imports[kSqlAlchemy].insert("Column");
    imports[kSqlAlchemy].insert("Table as AlchemyTable");

    std::vector<std::string> lines;
    lines.push_back(python_string(plan.table));
    lines.push_back(config_.base_class + ".metadata");
    for (const auto& field : plan.fields) {
        std::vector<std::string> args{python_string(field.column), sql_type(field, imports)};
        for (const auto& fk : field.foreign_keys) {
            ForeignKeyTarget deferred = fk;
            deferred.deferred = true;
            args.push_back(foreign_key(deferred, imports));
        }
        if (field.primary_key) args.push_back("primary_key=True");
        if (!field.nullable) args.push_back("nullable=False");
        lines.push_back(std::format("Column({})", join(args, ", ")));
    }

    std::string out = std::format("{} = AlchemyTable(\n", plan.class_name);
    for (const auto& line : lines) {
        out += std::format("{}{},\n", config_.indent, line);
    }
    out += ")\n";
    return out;
}

std::string SqlAlchemyRenderer::render_field(const FieldPlan& field, Imports& imports) const {
    imports[kOrm].insert("Mapped");
    imports[kOrm].insert("mapped_column");

    std::vector<std::string> args{python_string(field.column)};
    if (has_domain(field)) {
        args.push_back(sql_type(field, imports));
    }
    for (const auto& fk : field.foreign_keys) {
        args.push_back(foreign_key(fk, imports));
    }
    if (field.primary_key) {
        args.push_back("primary_key=True");
    }

    return std::format("{}{}: Mapped[{}] = mapped_column({})\n",
                       config_.indent, field.attribute, python_type(field, imports), join(args, ", "));
}

std::string SqlAlchemyRenderer::render_relationship(const RelationshipPlan& rel, Imports& imports) const {
    imports[kOrm].insert("Mapped");
    imports[kOrm].insert("relationship");

    std::string annotation;
    if (rel.collection) {
        annotation = std::format("list[{}]", rel.target_class);
    } else if (rel.nullable) {
        annotation = std::format("{} | None", rel.target_class);
    } else {
        annotation = rel.target_class;
    }

    std::vector<std::string> args;
    // Collections on another class name the owning column as a string
    if (rel.collection && rel.foreign_key.find('.') != std::string::npos) {
        args.push_back(std::format("foreign_keys={}", python_string(rel.foreign_key)));
    } else {
        args.push_back(std::format("foreign_keys={}", rel.foreign_key));
    }
    if (!rel.remote_side.empty()) {
        args.push_back(std::format("remote_side={}", rel.remote_side));
    }
    if (!rel.back_populates.empty()) {
        args.push_back(std::format("back_populates={}", python_string(rel.back_populates)));
    }

    return std::format("{}{}: Mapped[{}] = relationship({})\n",
                       config_.indent, rel.attribute, annotation, join(args, ", "));
}

std::string SqlAlchemyRenderer::python_type(const FieldPlan& field, Imports& imports) {
    std::string type;
    switch (field.type) {
        case LogicalType::DATE:
            imports["datetime"].insert("date");
            type = "date";
            break;
        case LogicalType::DATETIME:
            imports["datetime"].insert("datetime");
            type = "datetime";
            break;
        case LogicalType::BOOLEAN:  type = "bool"; break;
        case LogicalType::INTEGER:  type = "int"; break;
        case LogicalType::FLOAT:    type = "float"; break;
        case LogicalType::NUMERIC:
            imports["decimal"].insert("Decimal");
            type = "Decimal";
            break;
        case LogicalType::BLOB:     type = "bytes"; break;
        case LogicalType::ENUM:
            if (has_domain(field)) {
                imports[kTyping].insert("Literal");
                type = std::format("Literal[{}]", enum_values(*field.enum_domain));
            } else {
                type = "str";
            }
            break;
        case LogicalType::IDENTIFIER:
        case LogicalType::TEXT:
        default:
            type = "str";
            break;
    }
    return field.nullable ? type + " | None" : type;
}

std::string SqlAlchemyRenderer::sql_type(const FieldPlan& field, Imports& imports) {
    std::string name;
    switch (field.type) {
        case LogicalType::DATE:     name = "Date"; break;
        case LogicalType::DATETIME: name = "DateTime"; break;
        case LogicalType::BOOLEAN:  name = "Boolean"; break;
        case LogicalType::INTEGER:  name = "Integer"; break;
        case LogicalType::FLOAT:    name = "Float"; break;
        case LogicalType::NUMERIC:  name = "Numeric"; break;
        case LogicalType::BLOB:     name = "LargeBinary"; break;
        case LogicalType::ENUM:
            if (has_domain(field)) {
                imports[kSqlAlchemy].insert("Enum");
                return std::format("Enum({})", enum_values(*field.enum_domain));
            }
            name = "String";
            break;
        case LogicalType::IDENTIFIER:
        case LogicalType::TEXT:
        default:
            name = "String";
            break;
    }
    imports[kSqlAlchemy].insert(name);
    return name;
}

std::string SqlAlchemyRenderer::foreign_key(const ForeignKeyTarget& target, Imports& imports) {
    imports[kSqlAlchemy].insert("ForeignKey");
    if (target.deferred) {
        return std::format("ForeignKey({})", python_string(target.table + "." + target.column));
    }
    return std::format("ForeignKey({}.{})", target.class_name, target.attribute);
}

} // namespace schemaport
