#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"

#include <filesystem>
#include <vector>

namespace schemaport {

/**
 * @brief Resolves a user-supplied path to one source database file
 *
 * A file path is taken as-is. A directory is searched recursively for files
 * with one of the configured extensions; candidates are considered in sorted
 * path order and the first whose stem contains the preferred keyword wins.
 * Without a keyword match the first candidate is used and a warning logged.
 */
class SourceLocator {
public:
    explicit SourceLocator(SourceConfig config) : config_(std::move(config)) {}

    /**
     * @return The chosen file, or NOT_FOUND
     */
    [[nodiscard]] Result<std::filesystem::path> locate(const std::filesystem::path& source) const;

    /**
     * @brief All candidate files under a directory, sorted
     */
    [[nodiscard]] std::vector<std::filesystem::path> candidates(const std::filesystem::path& directory) const;

private:
    [[nodiscard]] bool has_candidate_extension(const std::filesystem::path& path) const;

    SourceConfig config_;
};

} // namespace schemaport
