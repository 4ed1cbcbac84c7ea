#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace schemaport {

/**
 * @brief Attribute names already taken in one generated class
 *
 * claim() hands out the preferred name when it is free. Otherwise it tries
 * "<name>_<target>", then "<name>_<target>_2", "_3", ... and records each
 * rename as a collision.
 */
class NameScope {
public:
    explicit NameScope(std::string owner) : owner_(std::move(owner)) {}

    [[nodiscard]] bool contains(const std::string& name) const { return used_.count(name) > 0; }

    /**
     * @brief Take a name unconditionally
     * @return false if it was already taken
     */
    bool reserve(const std::string& name) { return used_.insert(name).second; }

    /**
     * @param preferred Snake-case attribute name
     * @param target Snake-case name of the referenced table, used as the first fallback
     * @param collisions Receives a message for every rename
     */
    [[nodiscard]] std::string claim(const std::string& preferred,
                                    const std::string& target,
                                    std::vector<std::string>& collisions);

private:
    std::string owner_;
    std::set<std::string> used_;
};

/**
 * @brief Derives relationship attribute names from foreign-key columns
 *
 * For a column on an owning table referencing target.column:
 *   1. configured relation name for the column, else strip a known suffix
 *      ("ConceptGUID" -> "Concept", "ItemVID" -> "ItemVersion",
 *      "ItemID" -> "Item")
 *   2. if that equals the owning table's name, use the target table's name
 *   3. if it still equals the column name: "Related<name>" when the target
 *      table's name occurs in it, else append the target table's name
 *   4. self-references use the reserved self token
 * The result is snake-cased with reserved words escaped.
 */
class RelationshipNamer {
public:
    explicit RelationshipNamer(const ModelConfig& config);

    /**
     * @brief Step 1 only: the column name with its key suffix replaced or removed
     */
    [[nodiscard]] std::string relation_name(std::string_view column) const;

    /**
     * @brief Steps 1-4, before snake-casing
     */
    [[nodiscard]] std::string base_name(const TableMetadata& owner,
                                        const ColumnMetadata& column,
                                        const ForeignKeyRef& fk) const;

    /**
     * @brief Final attribute name candidate (snake_case, keyword-safe)
     */
    [[nodiscard]] std::string attribute_name(const TableMetadata& owner,
                                             const ColumnMetadata& column,
                                             const ForeignKeyRef& fk) const;

    /**
     * @brief Target is the owning table and the referenced column is the
     *        column itself or part of the owning table's primary key
     */
    [[nodiscard]] static bool is_self_reference(const TableMetadata& owner,
                                                const ColumnMetadata& column,
                                                const ForeignKeyRef& fk);

private:
    ModelConfig config_;
};

} // namespace schemaport
