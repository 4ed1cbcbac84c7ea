#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace schemaport {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads ConversionConfig from TOML
 *
 * Supports:
 * - ${VAR_NAME} expansion in string values
 * - include = "file.toml" / include = ["a.toml", "b.toml"] (paths relative to
 *   the including file; included files are the base, the includer wins)
 *
 * Every section is optional; missing keys keep the built-in defaults.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ConversionConfig config;

        static LoadResult ok(ConversionConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to the .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Parse a logical type name ("boolean", "datetime", ...)
     * @return Parsed type, std::nullopt for unknown names and for "enum"
     */
    [[nodiscard]] static std::optional<LogicalType> parse_logical_type(std::string_view name);

private:
    static LoadResult extract(const toml::table& root);

    static SourceConfig extract_source(const toml::table& root);
    static TargetConfig extract_target(const toml::table& root);
    static PatternConfig extract_patterns(const toml::table& root);
    static std::vector<ColumnOverride> extract_overrides(const toml::table& root, const ConversionConfig& defaults);
    static std::vector<ForeignKeyMapping> extract_foreign_keys(const toml::table& root, const ConversionConfig& defaults);
    static ModelConfig extract_model(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static ReportConfig extract_report(const toml::table& root);
};

} // namespace schemaport
