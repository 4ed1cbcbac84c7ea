#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "migrate/progress_reporter.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace schemaport {

struct ConversionSummary {
    std::filesystem::path source;
    std::filesystem::path database_file;
    std::filesystem::path model_file;
    size_t tables = 0;
    uint64_t rows = 0;
    std::map<std::string, uint64_t> table_rows;
    std::vector<SkippedTable> skipped;
    std::vector<std::string> advisories;    // cycle breaks
    std::vector<std::string> collisions;    // renamed model attributes
    size_t cast_failures = 0;
    std::chrono::milliseconds elapsed{0};
};

[[nodiscard]] nlohmann::json summary_to_json(const ConversionSummary& summary);

/**
 * @brief End-to-end migration of one source database
 *
 * locate -> reflect and scan -> augment -> order -> load -> synthesize.
 * The source reader is chosen from the SourceRegistry by file extension,
 * so readers must be registered before convert() is called.
 */
class Converter {
public:
    using CompletionCallback = std::function<void(const ConversionSummary&)>;

    Converter(ConversionConfig config, IProgressReporter& progress);

    /**
     * @param source Source file, or a directory to search
     * @param target_dir Directory receiving the database and model files
     */
    [[nodiscard]] Result<ConversionSummary> convert(const std::filesystem::path& source,
                                                    const std::filesystem::path& target_dir) const;

    void on_complete(CompletionCallback callback) { on_complete_ = std::move(callback); }

private:
    [[nodiscard]] Result<std::filesystem::path> write_model(const std::string& content,
                                                            const std::filesystem::path& path) const;
    void write_summary(const ConversionSummary& summary, const std::filesystem::path& target_dir) const;

    ConversionConfig config_;
    IProgressReporter& progress_;
    CompletionCallback on_complete_;
};

} // namespace schemaport
