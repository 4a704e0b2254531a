#pragma once

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

#include "Diagnostics.h"
#include "HunkApplier.h"
#include "Patch.h"
#include "VersionControl.h"
#include "Writer.h"

namespace termcode_patch {

/// Configuration options for PatchTool
/// NOTE: In production, values are set from MergedConfig via toToolOptions().
///       Defaults here are for direct use (e.g., tests).
struct PatchToolOptions {
    bool three_way = true;          ///< Try the version-control three-way apply first
    bool whitespace_fix = true;
    HunkApplyOptions hunk;          ///< Tolerances for the manual fallback
    int verbosity = 1;
    bool dry_run = false;           ///< Compute the outcome without touching files
};

/// The version-control tool applied the patch (possibly leaving conflicts).
struct DelegatedSuccess {
    std::vector<std::string> files;
    std::string output;
    std::vector<std::string> conflicted;    ///< Patch files the merge left unmerged
};

/// The version-control tool refused the patch; the tree is unchanged.
struct DelegatedFailure {
    std::string reason;
};

using DelegatedOutcome = std::variant<DelegatedSuccess, DelegatedFailure>;

/// Main orchestrator for patch application.
/// Hands the patch to the version-control tool first and falls back to
/// parsing it and splicing hunks file by file. Every failure is scoped to
/// one file and recorded in the returned DiffResult; nothing aborts the batch.
class PatchTool {
public:
    using Options = PatchToolOptions;

    explicit PatchTool(VersionControl& vcs);
    PatchTool(VersionControl& vcs, const Options& options);

    // Non-copyable
    PatchTool(const PatchTool&) = delete;
    PatchTool& operator=(const PatchTool&) = delete;

    /// Apply unified-diff text to the tree rooted at repo_root.
    [[nodiscard]] DiffResult applyPatch(const std::filesystem::path& repo_root,
                                        const std::string& patch_text);

    /// Write the patch to a temporary file and run the three-way apply.
    /// The temporary file is removed whatever the outcome. A non-zero exit
    /// counts as a conflicted merge only if files named in the patch became
    /// unmerged during this call; anything else is a DelegatedFailure.
    [[nodiscard]] DelegatedOutcome tryDelegated(const std::filesystem::path& repo_root,
                                                const std::string& patch_text);

    /// Apply already-parsed file diffs hunk by hunk.
    [[nodiscard]] DiffResult applyManually(const std::filesystem::path& repo_root,
                                           const std::vector<FileDiff>& files);

    /// Apply one file's hunks. The file is written only if every hunk lands.
    [[nodiscard]] ApplyOutcome applyFile(WorkspaceWriter& workspace,
                                         const FileDiff& file_diff);

    [[nodiscard]] DiagnosticCollector& diagnostics() { return diagnostics_; }
    [[nodiscard]] const DiagnosticCollector& diagnostics() const { return diagnostics_; }

    [[nodiscard]] const Options& options() const { return options_; }

    void setOptions(const Options& options) { options_ = options; }

private:
    VersionControl& vcs_;
    Options options_;
    DiagnosticCollector diagnostics_;
};

} // namespace termcode_patch
