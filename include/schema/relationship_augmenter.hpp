#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <vector>

namespace schemaport {

/**
 * @brief Injects foreign keys the source only declares by naming convention
 *
 * For each (column -> table.column) mapping, any table that has the column
 * and no declared key on it gets an augmented ForeignKeyRef. Declared keys
 * are never replaced, and running it twice adds nothing the second time.
 */
class RelationshipAugmenter {
public:
    explicit RelationshipAugmenter(std::vector<ForeignKeyMapping> mappings);

    /**
     * @brief Return the schema with conventional foreign keys attached
     */
    [[nodiscard]] Schema augment(Schema schema) const;

    /**
     * @brief Augment a single table
     * @param schema Used to check that the mapping's target exists
     * @return Number of keys added
     */
    size_t augment_table(TableMetadata& table, const Schema& schema) const;

private:
    std::vector<ForeignKeyMapping> mappings_;
};

} // namespace schemaport
