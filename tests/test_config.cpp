#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <filesystem>
#include <fstream>

#include "termcode-patch/Config.h"
#include "termcode-patch/Tool.h"

using namespace termcode_patch;
using Catch::Matchers::WithinAbs;
namespace fs = std::filesystem;

// Helper to create a temp file with content
class TempFile {
public:
    TempFile(const std::string& content, const std::string& name = ".termcode-patch.toml") {
        path_ = fs::temp_directory_path() / ("termcode_patch_config_" + std::to_string(counter_++));
        fs::create_directories(path_);
        file_path_ = path_ / name;
        std::ofstream ofs(file_path_);
        ofs << content;
    }

    ~TempFile() {
        fs::remove_all(path_);
    }

    const fs::path& dir() const { return path_; }
    const fs::path& file() const { return file_path_; }

private:
    fs::path path_;
    fs::path file_path_;
    static inline int counter_ = 0;
};

// ============================================================================
// FileConfig Loading Tests
// ============================================================================

TEST_CASE("ConfigLoader::loadFile - parses apply section", "[config]") {
    TempFile temp(R"(
[apply]
three_way = false
whitespace_fix = false
fuzzy_threshold = 0.9
ignore_whitespace = false
strict_counts = true
)");

    DiagnosticCollector diag;
    auto config = ConfigLoader::loadFile(temp.file(), &diag);

    REQUIRE(config.has_value());
    CHECK(config->three_way == false);
    CHECK(config->whitespace_fix == false);
    REQUIRE(config->fuzzy_threshold.has_value());
    CHECK_THAT(*config->fuzzy_threshold, WithinAbs(0.9, 1e-12));
    CHECK(config->ignore_whitespace == false);
    CHECK(config->strict_counts == true);
    CHECK_FALSE(config->verbosity.has_value());
    CHECK(diag.warningCount() == 0);
}

TEST_CASE("ConfigLoader::loadFile - parses behavior section", "[config]") {
    TempFile temp("[behavior]\nverbosity = 2\n");

    auto config = ConfigLoader::loadFile(temp.file());

    REQUIRE(config.has_value());
    CHECK(config->verbosity == 2);
}

TEST_CASE("ConfigLoader::loadFile - integer threshold is accepted", "[config]") {
    TempFile temp("[apply]\nfuzzy_threshold = 1\n");

    auto config = ConfigLoader::loadFile(temp.file());

    REQUIRE(config.has_value());
    CHECK(config->fuzzy_threshold == 1.0);
}

TEST_CASE("ConfigLoader::loadFile - handles missing sections", "[config]") {
    TempFile temp("# only a comment\n");

    auto config = ConfigLoader::loadFile(temp.file());

    REQUIRE(config.has_value());
    CHECK(config->empty());
}

TEST_CASE("ConfigLoader::loadFile - invalid values warn and are ignored", "[config]") {
    TempFile temp(R"(
[apply]
fuzzy_threshold = 1.5
three_way = "yes"

[behavior]
verbosity = 7
)");

    DiagnosticCollector diag;
    auto config = ConfigLoader::loadFile(temp.file(), &diag);

    REQUIRE(config.has_value());
    CHECK_FALSE(config->fuzzy_threshold.has_value());
    CHECK_FALSE(config->three_way.has_value());
    CHECK_FALSE(config->verbosity.has_value());
    CHECK(diag.warningCount() == 3);
    CHECK(diag.countOfType("config") == 3);
    CHECK_FALSE(diag.hasErrors());
}

TEST_CASE("ConfigLoader::loadFile - returns nullopt on invalid TOML", "[config]") {
    TempFile temp("this is not valid toml [[[");

    DiagnosticCollector diag;
    auto config = ConfigLoader::loadFile(temp.file(), &diag);

    CHECK_FALSE(config.has_value());
    CHECK(diag.hasErrors());
    CHECK(diag.countOfType("config") == 1);
}

// ============================================================================
// Config Discovery Tests
// ============================================================================

TEST_CASE("ConfigLoader::findConfigFile - finds file in start dir", "[config]") {
    TempFile temp("[apply]\nthree_way = true\n");

    auto found = ConfigLoader::findConfigFile(temp.dir());

    REQUIRE(found.has_value());
    CHECK(*found == temp.file());
}

TEST_CASE("ConfigLoader::findConfigFile - finds file at the git root", "[config]") {
    TempFile temp("[behavior]\nverbosity = 0\n");
    fs::create_directories(temp.dir() / ".git");
    fs::path nested = temp.dir() / "src" / "deep";
    fs::create_directories(nested);

    auto root = ConfigLoader::findGitRoot(nested);
    REQUIRE(root.has_value());
    CHECK(fs::equivalent(*root, temp.dir()));

    auto found = ConfigLoader::findConfigFile(nested);
    REQUIRE(found.has_value());
    CHECK(fs::equivalent(*found, temp.file()));
}

TEST_CASE("ConfigLoader::findConfigFile - returns nullopt when not found", "[config]") {
    TempFile temp("", "unrelated.txt");

    auto found = ConfigLoader::findConfigFile(temp.dir());

    CHECK_FALSE(found.has_value());
}

// ============================================================================
// Config Merging Tests
// ============================================================================

TEST_CASE("ConfigLoader::merge - uses defaults when no config", "[config]") {
    PatchToolOptions cli_options;
    auto merged = ConfigLoader::merge(std::nullopt, cli_options);

    CHECK(merged.three_way == true);
    CHECK(merged.whitespace_fix == true);
    CHECK(merged.fuzzy_threshold == 0.8);
    CHECK(merged.ignore_whitespace == true);
    CHECK(merged.strict_counts == false);
    CHECK(merged.verbosity == 1);
    CHECK(merged.dry_run == false);
}

TEST_CASE("ConfigLoader::merge - file config overrides defaults", "[config]") {
    FileConfig file_config;
    file_config.three_way = false;
    file_config.fuzzy_threshold = 0.6;
    file_config.verbosity = 0;

    PatchToolOptions cli_options;
    auto merged = ConfigLoader::merge(file_config, cli_options);

    CHECK(merged.three_way == false);
    CHECK(merged.fuzzy_threshold == 0.6);
    CHECK(merged.verbosity == 0);
    CHECK(merged.whitespace_fix == true);  // untouched default
}

TEST_CASE("ConfigLoader::merge - CLI overrides file config", "[config]") {
    FileConfig file_config;
    file_config.three_way = true;
    file_config.fuzzy_threshold = 0.6;
    file_config.strict_counts = false;
    file_config.verbosity = 0;

    PatchToolOptions cli_options;
    cli_options.three_way = false;
    cli_options.hunk.fuzzy_threshold = 0.95;
    cli_options.hunk.strict_counts = true;
    cli_options.verbosity = 2;
    cli_options.dry_run = true;

    SECTION("only explicit flags win") {
        CliFlags flags;
        flags.has_three_way = true;
        flags.has_verbosity = true;

        auto merged = ConfigLoader::merge(file_config, cli_options, flags);

        CHECK(merged.three_way == false);
        CHECK(merged.verbosity == 2);
        CHECK(merged.fuzzy_threshold == 0.6);
        CHECK(merged.strict_counts == false);
        CHECK(merged.dry_run == false);
    }

    SECTION("all flags") {
        CliFlags flags;
        flags.has_three_way = true;
        flags.has_fuzzy_threshold = true;
        flags.has_strict_counts = true;
        flags.has_verbosity = true;
        flags.has_dry_run = true;

        auto merged = ConfigLoader::merge(file_config, cli_options, flags);

        CHECK(merged.three_way == false);
        CHECK(merged.fuzzy_threshold == 0.95);
        CHECK(merged.strict_counts == true);
        CHECK(merged.verbosity == 2);
        CHECK(merged.dry_run == true);
    }
}

TEST_CASE("MergedConfig::toToolOptions - converts correctly", "[config]") {
    MergedConfig merged;
    merged.three_way = false;
    merged.whitespace_fix = false;
    merged.fuzzy_threshold = 0.7;
    merged.ignore_whitespace = false;
    merged.strict_counts = true;
    merged.verbosity = 2;
    merged.dry_run = true;

    auto opts = merged.toToolOptions();

    CHECK(opts.three_way == false);
    CHECK(opts.whitespace_fix == false);
    CHECK(opts.hunk.fuzzy_threshold == 0.7);
    CHECK(opts.hunk.ignore_whitespace == false);
    CHECK(opts.hunk.strict_counts == true);
    CHECK(opts.verbosity == 2);
    CHECK(opts.dry_run == true);
}
