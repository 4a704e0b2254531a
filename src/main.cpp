#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include <fmt/format.h>

#include "slang/util/CommandLine.h"
#include "slang/util/OS.h"

#include "termcode-patch/Config.h"
#include "termcode-patch/ConflictExtractor.h"
#include "termcode-patch/Constants.h"
#include "termcode-patch/Diagnostics.h"
#include "termcode-patch/HunkSelector.h"
#include "termcode-patch/PatchParser.h"
#include "termcode-patch/Tool.h"
#include "termcode-patch/VersionControl.h"

using namespace slang;
using namespace termcode_patch;

namespace fs = std::filesystem;

static bool readPatch(const std::string& source, std::string& text) {
    std::stringstream buffer;
    if (source == "-") {
        buffer << std::cin.rdbuf();
    } else {
        std::ifstream file(source, std::ios::binary);
        if (!file) {
            return false;
        }
        buffer << file.rdbuf();
    }
    text = buffer.str();
    return true;
}

static void printConflicts(const std::vector<ConflictInfo>& conflicts) {
    for (const auto& c : conflicts) {
        OS::print(fmt::format("{}:{}: {} conflict: {}\n",
                              c.file, c.line, toString(c.kind), c.message));
    }
}

static void printDiagnostics(const DiagnosticCollector& diagnostics, int verbosity) {
    DiagnosticLevel min_level = verbosity >= 2 ? DiagnosticLevel::Note
                              : verbosity == 1 ? DiagnosticLevel::Warning
                                               : DiagnosticLevel::Error;
    std::string text = diagnostics.format(min_level);
    if (!text.empty()) {
        OS::printE(text);
    }
}

int main(int argc, char* argv[]) {
    CommandLine cmdLine;

    // ========================================================================
    // Options
    // ========================================================================

    std::optional<bool> showHelp;
    std::optional<bool> showVersion;
    cmdLine.add("-h,--help", showHelp, "Display available options");
    cmdLine.add("--version", showVersion, "Display version information and exit");

    std::optional<std::string> repoDir;
    cmdLine.add("--repo", repoDir, "Repository root the patch applies to (default: current directory)",
                "<dir>");

    // Modes
    std::optional<bool> dryRun;
    std::optional<bool> interactive;
    std::optional<bool> listMode;
    std::optional<bool> conflictsMode;
    cmdLine.add("--dry-run", dryRun, "Report what would be applied without writing files");
    cmdLine.add("-i,--interactive", interactive,
                "Review hunks one by one (s/n/p/a/q) before applying");
    cmdLine.add("--list", listMode, "Print the files and hunks in the patch and exit");
    cmdLine.add("--conflicts", conflictsMode,
                "Only scan the repository for merge conflict markers");

    // Application tolerances
    std::optional<bool> noThreeWay;
    std::optional<bool> strictCounts;
    std::optional<double> fuzzyThreshold;
    cmdLine.add("--no-three-way", noThreeWay,
                "Skip 'git apply --3way' and apply hunks directly");
    cmdLine.add("--strict-counts", strictCounts,
                "Reject hunks whose line counts disagree with their header");
    cmdLine.add("--fuzzy-threshold", fuzzyThreshold,
                "Minimum similarity (0-1) for a drifted context line to match", "<f>");

    // Verbosity
    std::optional<bool> verbose;
    std::optional<bool> quiet;
    cmdLine.add("--verbose", verbose, "Show fallback reasons and per-file progress");
    cmdLine.add("-q,--quiet", quiet, "Suppress non-error output");

    std::vector<std::string> positional;
    cmdLine.setPositional(positional, "patch-file");

    // ========================================================================
    // Parse command line
    // ========================================================================

    if (!cmdLine.parse(argc, argv)) {
        for (const auto& err : cmdLine.getErrors()) {
            OS::printE(fmt::format("error: {}\n", err));
        }
        return 2;
    }

    if (showHelp == true) {
        OS::print(cmdLine.getHelpText("termcode-patch - apply unified diffs to a source tree"));
        return 0;
    }

    if (showVersion == true) {
        OS::print(fmt::format("termcode-patch version {}\n", VERSION));
        return 0;
    }

    if (fuzzyThreshold && (*fuzzyThreshold < 0.0 || *fuzzyThreshold > 1.0)) {
        OS::printE("error: --fuzzy-threshold must be between 0 and 1\n");
        return 2;
    }

    std::error_code ec;
    fs::path repo_root = repoDir ? fs::path(*repoDir) : fs::current_path(ec);
    if (ec || !fs::is_directory(repo_root, ec)) {
        OS::printE(fmt::format("error: repository root '{}' is not a directory\n",
                               repo_root.string()));
        return 2;
    }

    // ========================================================================
    // Load configuration file (.termcode-patch.toml)
    // ========================================================================

    DiagnosticCollector config_diagnostics;
    std::optional<FileConfig> file_config;
    if (auto config_path = ConfigLoader::findConfigFile(repo_root)) {
        file_config = ConfigLoader::loadFile(*config_path, &config_diagnostics);
    }

    // Config issues are always shown
    if (config_diagnostics.warningCount() > 0 || config_diagnostics.hasErrors()) {
        OS::printE(config_diagnostics.format());
    }
    if (config_diagnostics.hasErrors()) {
        return 2;
    }

    // ========================================================================
    // Build tool options (merging CLI > config file > defaults)
    // ========================================================================

    CliFlags cli_flags;
    cli_flags.has_three_way = noThreeWay.has_value();
    cli_flags.has_fuzzy_threshold = fuzzyThreshold.has_value();
    cli_flags.has_strict_counts = strictCounts.has_value();
    cli_flags.has_verbosity = verbose.has_value() || quiet.has_value();
    cli_flags.has_dry_run = dryRun.has_value();

    PatchTool::Options cli_options;
    cli_options.three_way = !noThreeWay.value_or(false);
    cli_options.hunk.fuzzy_threshold = fuzzyThreshold.value_or(DEFAULT_FUZZY_THRESHOLD);
    cli_options.hunk.strict_counts = strictCounts.value_or(false);
    cli_options.verbosity = quiet.value_or(false) ? 0 : (verbose.value_or(false) ? 2 : 1);
    cli_options.dry_run = dryRun.value_or(false);

    MergedConfig merged = ConfigLoader::merge(file_config, cli_options, cli_flags);
    PatchTool::Options options = merged.toToolOptions();
    int verbosity = options.verbosity;

    GitVersionControl git;

    // ========================================================================
    // Conflict scan mode
    // ========================================================================

    if (conflictsMode == true) {
        DiagnosticCollector diagnostics;
        ConflictExtractor extractor(git, &diagnostics);
        auto conflicts = extractor.findConflicts(repo_root);
        printConflicts(conflicts);
        printDiagnostics(diagnostics, verbosity);
        if (verbosity >= 1) {
            OS::print(fmt::format("{} conflict(s) found\n", conflicts.size()));
        }
        return conflicts.empty() ? 0 : 1;
    }

    // ========================================================================
    // Read the patch
    // ========================================================================

    if (positional.size() != 1) {
        OS::printE("error: expected exactly one patch file (use '-' for stdin)\n");
        OS::printE("Run with --help for usage information\n");
        return 2;
    }

    const std::string& source = positional.front();
    if (interactive == true && source == "-") {
        OS::printE("error: --interactive reads commands from stdin; pass the patch as a file\n");
        return 2;
    }

    std::string patch_text;
    if (!readPatch(source, patch_text)) {
        OS::printE(fmt::format("error: cannot read patch '{}'\n", source));
        return 1;
    }

    // ========================================================================
    // List mode
    // ========================================================================

    if (listMode == true) {
        DiagnosticCollector diagnostics;
        for (const auto& fd : parsePatch(patch_text, &diagnostics)) {
            OS::print(fmt::format("{} ({}, {} hunk(s))\n",
                                  fd.file, toString(fd.operation), fd.hunks.size()));
            for (const auto& hunk : fd.hunks) {
                OS::print(fmt::format("  {}\n", hunk.header));
            }
        }
        printDiagnostics(diagnostics, verbosity);
        return diagnostics.hasErrors() ? 1 : 0;
    }

    // ========================================================================
    // Interactive review
    // ========================================================================

    if (interactive == true) {
        HunkSelector selector;
        selector.parseForReview(patch_text);
        selector.run(std::cin, std::cout);

        patch_text = selector.renderFiltered();
        if (patch_text.empty()) {
            if (verbosity >= 1) {
                OS::print("No changes selected; nothing applied\n");
            }
            return 0;
        }
    }

    // ========================================================================
    // Apply
    // ========================================================================

    PatchTool tool(git, options);
    DiffResult result = tool.applyPatch(repo_root, patch_text);

    if (verbosity >= 1) {
        std::string verb = options.dry_run ? "would apply" : "applied";
        for (const auto& file : result.applied) {
            OS::print(fmt::format("{} {}\n", verb, file));
        }
        for (const auto& file : result.rejected) {
            OS::print(fmt::format("rejected {}\n", file));
        }
    }

    printConflicts(result.conflicts);

    // Verbose mode shows these as notes in the diagnostics below
    if (verbosity == 1) {
        for (const auto& warning : result.warnings) {
            OS::printE(fmt::format("warning: {}\n", warning));
        }
    }

    printDiagnostics(tool.diagnostics(), verbosity);

    if (verbosity >= 1) {
        OS::print(fmt::format("\nSummary: {} file(s) {}, {} rejected, {} conflict(s) [{}]\n",
                              result.applied.size(),
                              options.dry_run ? "would be applied" : "applied",
                              result.rejected.size(), result.conflicts.size(),
                              toString(result.strategy)));
    }

    bool any_errors = !result.clean() || tool.diagnostics().hasErrors();
    return any_errors ? 1 : 0;
}
