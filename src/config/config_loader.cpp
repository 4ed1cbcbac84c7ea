#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using namespace std::string_literals;

namespace schemaport {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// Replace `target` only when the key is present
void assign_string_array(const toml::table& tbl, const std::string_view key,
                         std::vector<std::string>& target) {
    if (tbl[key].as_array()) {
        target = toml_string_array(tbl, key);
    }
}

std::map<std::string, std::string> toml_string_map(const toml::table& tbl) {
    std::map<std::string, std::string> result;
    for (const auto& [k, v] : tbl) {
        if (v.is_string()) {
            result[std::string(k.str())] = v.as_string()->get();
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        return extract(parse_toml_file(config_path));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(
            std::format("Failed to parse config {}: {}", config_path, e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(
            std::format("Failed to load config {}: {}", config_path, e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        return extract(parse_toml_string(toml_content));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

std::optional<LogicalType> ConfigLoader::parse_logical_type(std::string_view name) {
    const std::string lower = utils::to_lower(name);

    static const std::unordered_map<std::string, LogicalType> lookup = {
        {"identifier", LogicalType::IDENTIFIER},
        {"guid",       LogicalType::IDENTIFIER},
        {"date",       LogicalType::DATE},
        {"datetime",   LogicalType::DATETIME},
        {"boolean",    LogicalType::BOOLEAN},
        {"bool",       LogicalType::BOOLEAN},
        {"integer",    LogicalType::INTEGER},
        {"float",      LogicalType::FLOAT},
        {"numeric",    LogicalType::NUMERIC},
        {"text",       LogicalType::TEXT},
        {"blob",       LogicalType::BLOB},
    };

    const auto it = lookup.find(lower);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

ConfigLoader::LoadResult ConfigLoader::extract(const toml::table& root) {
    const ConversionConfig defaults;

    ConversionConfig config;
    config.source = extract_source(root);
    config.target = extract_target(root);
    config.patterns = extract_patterns(root);
    config.overrides = extract_overrides(root, defaults);
    config.foreign_keys = extract_foreign_keys(root, defaults);
    config.model = extract_model(root);
    config.logging = extract_logging(root);
    config.report = extract_report(root);

    if (config.target.batch_size == 0) {
        return LoadResult::error("target.batch_size must be greater than zero");
    }
    if (config.target.database_file.empty() || config.target.model_file.empty()) {
        return LoadResult::error("target.database_file and target.model_file must not be empty");
    }
    if (!utils::log::parse_level(config.logging.level)) {
        return LoadResult::error(std::format("Unknown logging.level: {}", config.logging.level));
    }
    if (config.model.self_reference_name.empty()) {
        return LoadResult::error("model.self_reference_name must not be empty");
    }

    return LoadResult::ok(std::move(config));
}

// ---- Section extractors ----------------------------------------------------

SourceConfig ConfigLoader::extract_source(const toml::table& root) {
    SourceConfig cfg;
    const auto* source = root["source"].as_table();
    if (!source) return cfg;
    const auto& s = *source;

    if (s["extensions"].as_array()) {
        cfg.extensions.clear();
        for (const auto& ext : toml_string_array(s, "extensions")) {
            std::string lower = utils::to_lower(ext);
            if (!lower.empty() && lower.front() != '.') {
                lower.insert(lower.begin(), '.');
            }
            cfg.extensions.push_back(std::move(lower));
        }
    }
    cfg.preferred_keyword = s["preferred_keyword"].value_or(cfg.preferred_keyword);
    cfg.odbc_driver = s["odbc_driver"].value_or(cfg.odbc_driver);
    cfg.read_only = s["read_only"].value_or(cfg.read_only);
    return cfg;
}

TargetConfig ConfigLoader::extract_target(const toml::table& root) {
    TargetConfig cfg;
    const auto* target = root["target"].as_table();
    if (!target) return cfg;
    const auto& t = *target;

    cfg.database_file = t["database_file"].value_or(cfg.database_file);
    cfg.model_file = t["model_file"].value_or(cfg.model_file);
    cfg.overwrite = t["overwrite"].value_or(cfg.overwrite);
    cfg.without_rowid = t["without_rowid"].value_or(cfg.without_rowid);
    cfg.enum_constraints = t["enum_constraints"].value_or(cfg.enum_constraints);

    const int64_t batch_size = t["batch_size"].value_or(static_cast<int64_t>(cfg.batch_size));
    cfg.batch_size = batch_size > 0 ? static_cast<size_t>(batch_size) : 0;

    const std::string staging = t["staging"].value_or(cfg.stage_in_memory ? "memory"s : "file"s);
    if (staging == "memory") {
        cfg.stage_in_memory = true;
    } else if (staging == "file") {
        cfg.stage_in_memory = false;
    } else {
        throw std::runtime_error(
            std::format("target.staging must be \"memory\" or \"file\", got \"{}\"", staging));
    }
    return cfg;
}

PatternConfig ConfigLoader::extract_patterns(const toml::table& root) {
    PatternConfig cfg;
    const auto* patterns = root["patterns"].as_table();
    if (!patterns) return cfg;
    const auto& p = *patterns;

    assign_string_array(p, "enum_suffixes", cfg.enum_suffixes);
    assign_string_array(p, "guid_suffixes", cfg.guid_suffixes);
    assign_string_array(p, "bool_prefixes", cfg.bool_prefixes);
    assign_string_array(p, "date_suffixes", cfg.date_suffixes);
    return cfg;
}

std::vector<ColumnOverride> ConfigLoader::extract_overrides(
    const toml::table& root, const ConversionConfig& defaults) {

    const auto* arr = root["overrides"].as_array();
    if (!arr) return defaults.overrides;

    std::vector<ColumnOverride> result;
    result.reserve(arr->size());
    for (const auto& elem : *arr) {
        const auto* o = elem.as_table();
        if (!o) continue;

        std::string column = (*o)["column"].value_or(""s);
        if (column.empty()) continue;

        const std::string type_str = (*o)["type"].value_or(""s);
        const auto type = parse_logical_type(type_str);
        if (!type) {
            throw std::runtime_error(
                std::format("Unknown override type \"{}\" for column {}", type_str, column));
        }
        result.push_back({std::move(column), *type});
    }
    return result;
}

std::vector<ForeignKeyMapping> ConfigLoader::extract_foreign_keys(
    const toml::table& root, const ConversionConfig& defaults) {

    const auto* arr = root["foreign_keys"].as_array();
    if (!arr) return defaults.foreign_keys;

    std::vector<ForeignKeyMapping> result;
    result.reserve(arr->size());
    for (const auto& elem : *arr) {
        const auto* f = elem.as_table();
        if (!f) continue;

        ForeignKeyMapping mapping;
        mapping.column = (*f)["column"].value_or(""s);
        const std::string references = (*f)["references"].value_or(""s);
        const auto dot = references.find('.');
        if (mapping.column.empty() || dot == std::string::npos ||
            dot == 0 || dot + 1 == references.size()) {
            throw std::runtime_error(
                std::format("foreign_keys entry needs column and references = \"Table.Column\" (got \"{}\" -> \"{}\")",
                    mapping.column, references));
        }
        mapping.target_table = references.substr(0, dot);
        mapping.target_column = references.substr(dot + 1);
        result.push_back(std::move(mapping));
    }
    return result;
}

ModelConfig ConfigLoader::extract_model(const toml::table& root) {
    ModelConfig cfg;
    const auto* model = root["model"].as_table();
    if (!model) return cfg;
    const auto& m = *model;

    cfg.base_class = m["base_class"].value_or(cfg.base_class);
    cfg.indent = m["indent"].value_or(cfg.indent);
    cfg.hub_table = m["hub_table"].value_or(cfg.hub_table);
    cfg.identity_column = m["identity_column"].value_or(cfg.identity_column);
    cfg.self_reference_name = m["self_reference_name"].value_or(cfg.self_reference_name);
    cfg.related_prefix = m["related_prefix"].value_or(cfg.related_prefix);
    cfg.reverse_relationships = m["reverse_relationships"].value_or(cfg.reverse_relationships);
    assign_string_array(m, "strip_suffixes", cfg.strip_suffixes);

    if (const auto* replacements = m["suffix_replacements"].as_table()) {
        cfg.suffix_replacements = toml_string_map(*replacements);
    }
    if (const auto* names = m["relation_names"].as_table()) {
        cfg.relation_names = toml_string_map(*names);
    }
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

ReportConfig ConfigLoader::extract_report(const toml::table& root) {
    ReportConfig cfg;
    const auto* report = root["report"].as_table();
    if (!report) return cfg;

    cfg.summary_file = (*report)["summary_file"].value_or(""s);
    return cfg;
}

} // namespace schemaport
