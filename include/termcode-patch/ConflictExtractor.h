#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "Diagnostics.h"
#include "Patch.h"
#include "VersionControl.h"

namespace termcode_patch {

/// Locates conflict-marker blocks left behind by a three-way merge.
class ConflictExtractor {
public:
    explicit ConflictExtractor(VersionControl& vcs,
                               DiagnosticCollector* diagnostics = nullptr);

    /// Scan every unmerged file reported by the version-control tool.
    /// Files that cannot be read are skipped with an "io" warning.
    [[nodiscard]] std::vector<ConflictInfo> findConflicts(
        const std::filesystem::path& repo_root);

    /// Scan only the given repository-relative files.
    [[nodiscard]] std::vector<ConflictInfo> scanFiles(
        const std::filesystem::path& repo_root,
        const std::vector<std::string>& files);

    /// Extract `<<<<<<< / ======= / >>>>>>>` blocks from file content.
    /// A diff3 base section (`|||||||`) is dropped from `original`.
    [[nodiscard]] static std::vector<ConflictInfo> scanContent(
        const std::string& file,
        const std::string& content);

private:
    VersionControl& vcs_;
    DiagnosticCollector* diagnostics_;
};

/// Convenience wrapper around ConflictExtractor::findConflicts.
[[nodiscard]] std::vector<ConflictInfo> findConflicts(const std::filesystem::path& repo_root,
                                                      VersionControl& vcs);

} // namespace termcode_patch
