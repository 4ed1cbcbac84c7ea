#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace schemaport {

struct TableOrder {
    std::vector<size_t> order;              // schema indices, each exactly once
    std::vector<std::string> cycle_breaks;  // tables emitted before all their dependencies
    std::vector<std::string> advisories;    // human-readable, one per cycle break
};

/**
 * @brief Orders tables so that referenced tables come first where possible
 *
 * Kahn's algorithm over table indices. Ready tables are taken in name order.
 * When tables remain but none is ready, the graph has a cycle: the
 * name-smallest remaining table is emitted anyway, an advisory is
 * recorded, and the sort continues. Never fails.
 */
class DependencyOrderer {
public:
    [[nodiscard]] static TableOrder order(const Schema& schema);

    /**
     * @brief Distinct referenced tables per table, self-references excluded
     *
     * Keys pointing at tables outside the schema are ignored.
     */
    [[nodiscard]] static std::vector<std::vector<size_t>> dependencies(const Schema& schema);
};

} // namespace schemaport
