#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace schemaport;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "schemaport_test_config") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

} // namespace

TEST_CASE("ConfigLoader: empty document keeps every default", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.source.extensions == std::vector<std::string>{".accdb", ".mdb"});
    CHECK(cfg.source.preferred_keyword == "dpm");
    CHECK(cfg.target.database_file == "dpm.sqlite");
    CHECK(cfg.target.model_file == "dpm.py");
    CHECK_FALSE(cfg.target.overwrite);
    CHECK(cfg.target.stage_in_memory);
    CHECK(cfg.patterns.guid_suffixes == std::vector<std::string>{"guid"});
    CHECK(cfg.overrides.size() == 4);
    CHECK(cfg.foreign_keys.size() == 2);
    CHECK(cfg.model.base_class == "DPM");
    CHECK(cfg.model.self_reference_name == "Self");
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.report.summary_file.empty());
}

TEST_CASE("ConfigLoader: sections override defaults", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[source]
extensions = ["MDB", ".sqlite"]
preferred_keyword = "release"

[target]
database_file = "out.db"
overwrite = true
batch_size = 1000
staging = "file"
enum_constraints = false

[patterns]
enum_suffixes = ["kind"]

[[overrides]]
column = "Flag"
type = "boolean"

[[foreign_keys]]
column = "OwnerID"
references = "Person.PersonID"

[model]
base_class = "Base"
reverse_relationships = false
strip_suffixes = ["Key"]

[model.relation_names]
OwnerID = "Holder"

[logging]
level = "debug"

[report]
summary_file = "summary.json"
)");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.source.extensions == std::vector<std::string>{".mdb", ".sqlite"});
    CHECK(cfg.source.preferred_keyword == "release");
    CHECK(cfg.target.database_file == "out.db");
    CHECK(cfg.target.model_file == "dpm.py");
    CHECK(cfg.target.overwrite);
    CHECK(cfg.target.batch_size == 1000);
    CHECK_FALSE(cfg.target.stage_in_memory);
    CHECK_FALSE(cfg.target.enum_constraints);
    CHECK(cfg.patterns.enum_suffixes == std::vector<std::string>{"kind"});
    CHECK(cfg.patterns.date_suffixes == std::vector<std::string>{"date"});

    REQUIRE(cfg.overrides.size() == 1);
    CHECK(cfg.overrides[0].column == "Flag");
    CHECK(cfg.overrides[0].type == LogicalType::BOOLEAN);

    REQUIRE(cfg.foreign_keys.size() == 1);
    CHECK(cfg.foreign_keys[0].target_table == "Person");
    CHECK(cfg.foreign_keys[0].target_column == "PersonID");

    CHECK(cfg.model.base_class == "Base");
    CHECK_FALSE(cfg.model.reverse_relationships);
    CHECK(cfg.model.strip_suffixes == std::vector<std::string>{"Key"});
    CHECK(cfg.model.relation_names.at("OwnerID") == "Holder");
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.report.summary_file == "summary.json");
}

TEST_CASE("ConfigLoader: invalid values are rejected", "[config]") {
    CHECK_FALSE(ConfigLoader::load_from_string("[target]\nbatch_size = 0\n").success);
    CHECK_FALSE(ConfigLoader::load_from_string("[target]\nstaging = \"disk\"\n").success);
    CHECK_FALSE(ConfigLoader::load_from_string("[logging]\nlevel = \"loud\"\n").success);
    CHECK_FALSE(ConfigLoader::load_from_string(
        "[[overrides]]\ncolumn = \"X\"\ntype = \"enum\"\n").success);
    CHECK_FALSE(ConfigLoader::load_from_string(
        "[[foreign_keys]]\ncolumn = \"X\"\nreferences = \"NoDot\"\n").success);

    auto malformed = ConfigLoader::load_from_string("[target\n");
    CHECK_FALSE(malformed.success);
    CHECK_FALSE(malformed.error_message.empty());
}

TEST_CASE("ConfigLoader: environment variables expand in strings", "[config]") {
    ::setenv("SCHEMAPORT_TEST_DB", "from_env.sqlite", 1);
    auto result = ConfigLoader::load_from_string(
        "[target]\ndatabase_file = \"${SCHEMAPORT_TEST_DB}\"\n");
    ::unsetenv("SCHEMAPORT_TEST_DB");

    REQUIRE(result.success);
    CHECK(result.config.target.database_file == "from_env.sqlite");
}

TEST_CASE("ConfigLoader: included files are the base, the includer wins", "[config][include]") {
    TmpDir tmp;
    tmp.file("base.toml", R"(
[target]
database_file = "base.sqlite"
model_file = "base.py"
)");
    auto main_path = tmp.file("main.toml", R"(
include = "base.toml"

[target]
database_file = "main.sqlite"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.target.database_file == "main.sqlite");
    CHECK(result.config.target.model_file == "base.py");
}

TEST_CASE("ConfigLoader: circular includes are detected", "[config][include]") {
    TmpDir tmp;
    tmp.file("a.toml", "include = \"b.toml\"\n");
    tmp.file("b.toml", "include = \"a.toml\"\n");

    auto result = ConfigLoader::load_from_file((tmp.path / "a.toml").string());
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Circular") != std::string::npos);
}

TEST_CASE("ConfigLoader: missing file is an error", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/schemaport.toml");
    CHECK_FALSE(result.success);
}
