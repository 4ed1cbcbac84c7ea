#include "config/config_loader.hpp"
#include "convert/converter.hpp"
#include "core/database_type.hpp"
#include "core/utils.hpp"
#include "db/source_registry.hpp"
#include "db/sqlite/sqlite_source_reader.hpp"
#include "migrate/progress_reporter.hpp"

#ifdef SCHEMAPORT_ENABLE_ODBC
#include "db/odbc/odbc_source_reader.hpp"
#endif

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace schemaport;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CommandLine {
    std::optional<std::string> config_file;
    bool overwrite = false;
    std::string source;
    std::string target_dir;
};

void print_usage(std::ostream& out) {
    out << "Usage: schemaport [--config <file>] [--overwrite] <source> <target-dir>\n"
           "\n"
           "  <source>      Access database file, or a directory to search\n"
           "  <target-dir>  Directory for the SQLite database and generated models\n"
           "\n"
           "  --config <file>  TOML configuration\n"
           "  --overwrite      Replace existing output files\n";
}

std::optional<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cmd;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a file argument\n";
                return std::nullopt;
            }
            cmd.config_file = argv[++i];
        } else if (arg == "--overwrite") {
            cmd.overwrite = true;
        } else if (arg.starts_with("--")) {
            std::cerr << std::format("Unknown option: {}\n", arg);
            return std::nullopt;
        } else {
            positional.emplace_back(arg);
        }
    }

    if (positional.size() != 2) {
        return std::nullopt;
    }
    cmd.source = positional[0];
    cmd.target_dir = positional[1];
    return cmd;
}

// =========================================================================
// Explicit Reader Registration (ensures linker includes reader objects)
// =========================================================================

void register_readers() {
    SourceRegistry::instance().register_reader(
        DatabaseType::SQLITE,
        [](const std::string& path, const SourceConfig&) {
            return std::make_unique<SqliteSourceReader>(path);
        });

    #ifdef SCHEMAPORT_ENABLE_ODBC
    SourceRegistry::instance().register_reader(
        DatabaseType::ACCESS,
        [](const std::string& path, const SourceConfig& config) {
            return std::make_unique<OdbcSourceReader>(path, config);
        });
    #endif
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(std::cout);
            return kExitOk;
        }
    }

    const auto cmd = parse_command_line(argc, argv);
    if (!cmd) {
        print_usage(std::cerr);
        return kExitUsage;
    }

    try {
        register_readers();

        ConversionConfig config;
        if (cmd->config_file) {
            auto loaded = ConfigLoader::load_from_file(*cmd->config_file);
            if (!loaded.success) {
                utils::log::error(std::format("[{}] {}",
                    error_category_to_string(ErrorCategory::CONFIG_ERROR), loaded.error_message));
                return kExitFailure;
            }
            config = std::move(loaded.config);
            utils::log::info(std::format("Configuration loaded from {}", *cmd->config_file));
        }
        if (cmd->overwrite) {
            config.target.overwrite = true;
        }
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        LoggingProgressReporter progress;
        Converter converter(std::move(config), progress);
        const auto result = converter.convert(cmd->source, cmd->target_dir);
        if (result.is_error()) {
            utils::log::error(std::format("[{}] {}",
                error_category_to_string(result.error_category()), result.error_message()));
            return kExitFailure;
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitFailure;
    }

    return kExitOk;
}
