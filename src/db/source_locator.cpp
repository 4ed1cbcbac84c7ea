#include "db/source_locator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <system_error>

namespace schemaport {

Result<std::filesystem::path> SourceLocator::locate(const std::filesystem::path& source) const {
    std::error_code ec;
    if (std::filesystem::is_regular_file(source, ec)) {
        return Result<std::filesystem::path>::ok(source);
    }
    if (!std::filesystem::is_directory(source, ec)) {
        return Result<std::filesystem::path>::error(ErrorCategory::NOT_FOUND,
            std::format("Source path does not exist: {}", source.string()));
    }

    const auto files = candidates(source);
    if (files.empty()) {
        return Result<std::filesystem::path>::error(ErrorCategory::NOT_FOUND,
            std::format("No source database files found in {}", source.string()));
    }

    const std::string keyword = utils::to_lower(config_.preferred_keyword);
    if (!keyword.empty()) {
        for (const auto& file : files) {
            if (utils::to_lower(file.stem().string()).find(keyword) != std::string::npos) {
                return Result<std::filesystem::path>::ok(file);
            }
        }
    }

    utils::log::warn(std::format("No database matching '{}' found in {}, using first match: {}",
                                 config_.preferred_keyword, source.string(), files.front().string()));
    return Result<std::filesystem::path>::ok(files.front());
}

std::vector<std::filesystem::path> SourceLocator::candidates(const std::filesystem::path& directory) const {
    std::vector<std::filesystem::path> result;
    std::error_code ec;
    auto it = std::filesystem::recursive_directory_iterator(
        directory, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        utils::log::warn(std::format("Cannot search {}: {}", directory.string(), ec.message()));
        return result;
    }

    for (const auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            utils::log::warn(std::format("Error while searching {}: {}", directory.string(), ec.message()));
            break;
        }
        if (it->is_regular_file(ec) && has_candidate_extension(it->path())) {
            result.push_back(it->path());
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

bool SourceLocator::has_candidate_extension(const std::filesystem::path& path) const {
    const std::string ext = utils::to_lower(path.extension().string());
    return std::any_of(config_.extensions.begin(), config_.extensions.end(),
        [&ext](const std::string& candidate) { return utils::to_lower(candidate) == ext; });
}

} // namespace schemaport
