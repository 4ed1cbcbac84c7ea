#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace schemaport {

namespace keys {
    inline constexpr std::string_view ACCESS = "access";
    inline constexpr std::string_view SQLITE = "sqlite";
}

/**
 * @brief Kinds of source database a reader can be registered for
 */
enum class DatabaseType {
    ACCESS,
    SQLITE,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::ACCESS: return keys::ACCESS;
        case DatabaseType::SQLITE: return keys::SQLITE;
        default: return "unknown";
    }
}

/**
 * @brief Infer the source kind from a file extension
 * @return Kind, or std::nullopt for an unrecognized extension
 */
[[nodiscard]] inline std::optional<DatabaseType> database_type_for_path(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".accdb" || ext == ".mdb") return DatabaseType::ACCESS;
    if (ext == ".sqlite" || ext == ".sqlite3" || ext == ".db") return DatabaseType::SQLITE;
    return std::nullopt;
}

} // namespace schemaport
