#include "schema/dependency_orderer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <set>
#include <utility>

namespace schemaport {

std::vector<std::vector<size_t>> DependencyOrderer::dependencies(const Schema& schema) {
    std::vector<std::vector<size_t>> deps(schema.size());

    for (size_t i = 0; i < schema.size(); ++i) {
        std::set<size_t> referenced;
        for (const auto& column : schema.at(i).columns) {
            for (const auto& fk : column.foreign_keys) {
                const auto target = schema.index_of(fk.table);
                if (target && *target != i) {
                    referenced.insert(*target);
                }
            }
        }
        deps[i].assign(referenced.begin(), referenced.end());
    }
    return deps;
}

TableOrder DependencyOrderer::order(const Schema& schema) {
    const size_t n = schema.size();
    const auto deps = dependencies(schema);

    std::vector<size_t> remaining(n, 0);
    std::vector<std::vector<size_t>> dependents(n);
    for (size_t t = 0; t < n; ++t) {
        remaining[t] = deps[t].size();
        for (const size_t d : deps[t]) {
            dependents[d].push_back(t);
        }
    }

    const auto name_of = [&schema](size_t index) -> const std::string& {
        return schema.at(index).name;
    };

    // Ordered by name, so ties are broken the same way on every run
    std::set<std::pair<std::string, size_t>> ready;
    for (size_t t = 0; t < n; ++t) {
        if (remaining[t] == 0) {
            ready.emplace(name_of(t), t);
        }
    }

    TableOrder result;
    result.order.reserve(n);
    std::vector<bool> emitted(n, false);

    const auto emit = [&](size_t t) {
        emitted[t] = true;
        result.order.push_back(t);
        for (const size_t d : dependents[t]) {
            if (!emitted[d] && --remaining[d] == 0) {
                ready.emplace(name_of(d), d);
            }
        }
    };

    while (result.order.size() < n) {
        if (!ready.empty()) {
            const size_t t = ready.begin()->second;
            ready.erase(ready.begin());
            emit(t);
            continue;
        }

        // Every remaining table waits on another remaining table: break the cycle
        size_t pick = n;
        for (size_t t = 0; t < n; ++t) {
            if (!emitted[t] && (pick == n || name_of(t) < name_of(pick))) {
                pick = t;
            }
        }

        std::vector<std::string> waiting_on;
        for (const size_t d : deps[pick]) {
            if (!emitted[d]) waiting_on.push_back(name_of(d));
        }
        std::sort(waiting_on.begin(), waiting_on.end());

        std::string joined;
        for (const auto& name : waiting_on) {
            if (!joined.empty()) joined += ", ";
            joined += name;
        }

        auto advisory = std::format("Circular foreign keys: {} ordered before {}", name_of(pick), joined);
        utils::log::warn(advisory);
        result.advisories.push_back(std::move(advisory));
        result.cycle_breaks.push_back(name_of(pick));
        emit(pick);
    }

    return result;
}

} // namespace schemaport
