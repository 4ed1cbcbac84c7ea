#pragma once

#include "config/config_types.hpp"
#include "core/database_type.hpp"
#include "db/isource_reader.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace schemaport {

/**
 * @brief Registry for source readers
 *
 * Readers are registered at startup and looked up by DatabaseType.
 *
 * Usage:
 *   // Registration (in main.cpp):
 *   SourceRegistry::instance().register_reader(
 *       DatabaseType::SQLITE,
 *       [](const std::string& path, const SourceConfig& cfg) {
 *           return std::make_unique<SqliteSourceReader>(path);
 *       });
 *
 *   // Creation (in the converter):
 *   auto reader = SourceRegistry::instance().create(DatabaseType::SQLITE, path, cfg);
 */
class SourceRegistry {
public:
    using Factory = std::function<std::unique_ptr<ISourceReader>(
        const std::string& path, const SourceConfig& config)>;

    static SourceRegistry& instance() {
        static SourceRegistry registry;
        return registry;
    }

    void register_reader(DatabaseType type, Factory factory) {
        factories_[type] = std::move(factory);
    }

    [[nodiscard]] std::unique_ptr<ISourceReader> create(
        DatabaseType type, const std::string& path, const SourceConfig& config) const {
        const auto it = factories_.find(type);
        if (it == factories_.end()) {
            throw std::runtime_error(
                std::string("No reader registered for database type: ") +
                std::string(database_type_to_string(type)));
        }
        return it->second(path, config);
    }

    [[nodiscard]] bool has_reader(DatabaseType type) const {
        return factories_.count(type) > 0;
    }

private:
    SourceRegistry() = default;

    struct DatabaseTypeHash {
        size_t operator()(DatabaseType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

} // namespace schemaport
