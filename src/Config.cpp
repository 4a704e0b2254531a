#include "termcode-patch/Config.h"
#include "termcode-patch/Tool.h"

#include <toml++/toml.hpp>

namespace termcode_patch {

// ============================================================================
// MergedConfig implementation
// ============================================================================

PatchToolOptions MergedConfig::toToolOptions() const {
    PatchToolOptions opts;
    opts.three_way = three_way;
    opts.whitespace_fix = whitespace_fix;
    opts.hunk.fuzzy_threshold = fuzzy_threshold;
    opts.hunk.ignore_whitespace = ignore_whitespace;
    opts.hunk.strict_counts = strict_counts;
    opts.verbosity = verbosity;
    opts.dry_run = dry_run;
    return opts;
}

// ============================================================================
// ConfigLoader implementation
// ============================================================================

std::optional<std::filesystem::path> ConfigLoader::findGitRoot(
    const std::filesystem::path& start_dir) {

    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path current = fs::absolute(start_dir, ec);
    if (ec) {
        return std::nullopt;
    }

    // Walk up the directory tree looking for .git
    while (!current.empty() && current.has_parent_path()) {
        if (fs::exists(current / ".git", ec)) {
            return current;
        }

        fs::path parent = current.parent_path();
        if (parent == current) {
            break;  // Reached filesystem root
        }
        current = parent;
    }

    return std::nullopt;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(
    const std::filesystem::path& start_dir) {

    namespace fs = std::filesystem;
    std::error_code ec;

    // 1. Check starting directory
    fs::path config_in_start = start_dir / CONFIG_FILENAME;
    if (fs::exists(config_in_start, ec)) {
        return config_in_start;
    }

    // 2. Check git repository root
    if (auto git_root = findGitRoot(start_dir)) {
        fs::path config_in_git = *git_root / CONFIG_FILENAME;
        if (fs::exists(config_in_git, ec)) {
            return config_in_git;
        }
    }

    return std::nullopt;
}

namespace {

void readBool(const toml::table& section, const char* key,
              std::optional<bool>& out, const std::string& source,
              DiagnosticCollector* diagnostics) {
    auto node = section[key];
    if (!node) {
        return;
    }
    if (auto val = node.as_boolean()) {
        out = val->get();
    } else if (diagnostics) {
        diagnostics->addWarning(std::string("Expected a boolean for '") + key + "'",
                                source, 0, "config");
    }
}

} // namespace

std::optional<FileConfig> ConfigLoader::loadFile(
    const std::filesystem::path& config_path,
    DiagnosticCollector* diagnostics) {

    FileConfig config;
    const std::string source = config_path.string();

    try {
        toml::table tbl = toml::parse_file(source);

        // [apply] section
        if (auto apply = tbl["apply"].as_table()) {
            readBool(*apply, "three_way", config.three_way, source, diagnostics);
            readBool(*apply, "whitespace_fix", config.whitespace_fix, source, diagnostics);
            readBool(*apply, "ignore_whitespace", config.ignore_whitespace, source, diagnostics);
            readBool(*apply, "strict_counts", config.strict_counts, source, diagnostics);

            // fuzzy_threshold (integers 0 and 1 are accepted too)
            auto threshold_node = (*apply)["fuzzy_threshold"];
            std::optional<double> threshold;
            if (auto val = threshold_node.as_floating_point()) {
                threshold = val->get();
            } else if (auto ival = threshold_node.as_integer()) {
                threshold = static_cast<double>(ival->get());
            }
            if (threshold && *threshold >= 0.0 && *threshold <= 1.0) {
                config.fuzzy_threshold = threshold;
            } else if (threshold_node && diagnostics) {
                diagnostics->addWarning(
                    "fuzzy_threshold must be a number between 0 and 1; using default",
                    source, 0, "config");
            }
        }

        // [behavior] section
        if (auto behavior = tbl["behavior"].as_table()) {
            auto verbosity_node = (*behavior)["verbosity"];
            auto val = verbosity_node.as_integer();
            if (val && val->get() >= 0 && val->get() <= 2) {
                config.verbosity = static_cast<int>(val->get());
            } else if (verbosity_node && diagnostics) {
                diagnostics->addWarning(
                    "verbosity must be 0, 1 or 2; using default",
                    source, 0, "config");
            }
        }

        return config;

    } catch (const toml::parse_error& err) {
        if (diagnostics) {
            diagnostics->addError(
                std::string("Failed to parse config file: ") + std::string(err.description()),
                source,
                err.source().begin.line,
                "config");
        }
        return std::nullopt;
    }
}

MergedConfig ConfigLoader::merge(
    const std::optional<FileConfig>& file_config,
    const PatchToolOptions& cli_options,
    const CliFlags& cli_flags) {

    MergedConfig result;

    // Start with defaults (already set in MergedConfig struct)

    // Layer 1: File config
    if (file_config) {
        if (file_config->three_way) {
            result.three_way = *file_config->three_way;
        }
        if (file_config->whitespace_fix) {
            result.whitespace_fix = *file_config->whitespace_fix;
        }
        if (file_config->fuzzy_threshold) {
            result.fuzzy_threshold = *file_config->fuzzy_threshold;
        }
        if (file_config->ignore_whitespace) {
            result.ignore_whitespace = *file_config->ignore_whitespace;
        }
        if (file_config->strict_counts) {
            result.strict_counts = *file_config->strict_counts;
        }
        if (file_config->verbosity) {
            result.verbosity = *file_config->verbosity;
        }
    }

    // Layer 2: CLI options (highest priority, only when explicitly given)
    if (cli_flags.has_three_way) {
        result.three_way = cli_options.three_way;
    }
    if (cli_flags.has_fuzzy_threshold) {
        result.fuzzy_threshold = cli_options.hunk.fuzzy_threshold;
    }
    if (cli_flags.has_strict_counts) {
        result.strict_counts = cli_options.hunk.strict_counts;
    }
    if (cli_flags.has_verbosity) {
        result.verbosity = cli_options.verbosity;
    }
    if (cli_flags.has_dry_run) {
        result.dry_run = cli_options.dry_run;
    }

    return result;
}

} // namespace termcode_patch
