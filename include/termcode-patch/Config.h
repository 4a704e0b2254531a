#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "Diagnostics.h"

namespace termcode_patch {

/// Configuration loaded from a .termcode-patch.toml file.
/// All fields are optional - missing values use defaults during merge.
struct FileConfig {
    // [apply] section
    std::optional<bool> three_way;          ///< Try `git apply --3way` first
    std::optional<bool> whitespace_fix;     ///< Pass --whitespace=fix
    std::optional<double> fuzzy_threshold;  ///< Minimum similarity in [0, 1]
    std::optional<bool> ignore_whitespace;  ///< Compare trimmed lines
    std::optional<bool> strict_counts;      ///< Validate hunk header counts

    // [behavior] section
    std::optional<int> verbosity;           ///< 0=quiet, 1=normal, 2=verbose

    /// Check if any configuration was loaded
    [[nodiscard]] bool empty() const {
        return !three_way && !whitespace_fix && !fuzzy_threshold &&
               !ignore_whitespace && !strict_counts && !verbosity;
    }
};

/// Tracks which CLI options were explicitly specified (vs using defaults).
/// Used for priority-based merging.
struct CliFlags {
    bool has_three_way = false;
    bool has_fuzzy_threshold = false;
    bool has_strict_counts = false;
    bool has_verbosity = false;
    bool has_dry_run = false;
};

/// Final merged configuration with all values resolved.
/// Priority: CLI > file > defaults
struct MergedConfig {
    bool three_way = true;
    bool whitespace_fix = true;
    double fuzzy_threshold = 0.8;
    bool ignore_whitespace = true;
    bool strict_counts = false;
    int verbosity = 1;
    bool dry_run = false;

    /// Convert to PatchToolOptions (for use with PatchTool)
    [[nodiscard]] struct PatchToolOptions toToolOptions() const;
};

/// Loads and merges configuration from multiple sources.
class ConfigLoader {
public:
    static constexpr const char* CONFIG_FILENAME = ".termcode-patch.toml";

    /// Find the configuration file by searching:
    /// 1. Starting directory (typically the repository root given to the tool)
    /// 2. Git repository root
    /// Returns the path if found, nullopt otherwise.
    [[nodiscard]] static std::optional<std::filesystem::path> findConfigFile(
        const std::filesystem::path& start_dir = std::filesystem::current_path());

    /// Find the git repository root by searching upward for .git
    [[nodiscard]] static std::optional<std::filesystem::path> findGitRoot(
        const std::filesystem::path& start_dir);

    /// Load and parse a TOML configuration file.
    /// Out-of-range values are dropped with a "config" warning.
    /// @param config_path Path to the .termcode-patch.toml file
    /// @param diagnostics Optional collector for parse errors
    /// @return Parsed config or nullopt on error
    [[nodiscard]] static std::optional<FileConfig> loadFile(
        const std::filesystem::path& config_path,
        DiagnosticCollector* diagnostics = nullptr);

    /// Merge configurations with priority: CLI > file > defaults.
    /// @param file_config Config from .termcode-patch.toml (lowest priority)
    /// @param cli_options Options parsed from command line (highest priority)
    /// @param cli_flags Which CLI options were explicitly set
    [[nodiscard]] static MergedConfig merge(
        const std::optional<FileConfig>& file_config,
        const struct PatchToolOptions& cli_options,
        const CliFlags& cli_flags = {});
};

} // namespace termcode_patch
