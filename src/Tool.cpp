#include "termcode-patch/Tool.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <random>
#include <set>
#include <sstream>

#include "termcode-patch/ConflictExtractor.h"
#include "termcode-patch/Constants.h"
#include "termcode-patch/PatchParser.h"

namespace termcode_patch {

namespace fs = std::filesystem;

// ============================================================================
// Temporary patch file
// ============================================================================

namespace {

/// Owns a uniquely named file in the system temp directory and removes it
/// when it goes out of scope.
class TempPatchFile {
public:
    TempPatchFile() {
        std::error_code ec;
        fs::path dir = fs::temp_directory_path(ec);
        if (ec) {
            dir = fs::current_path();
        }
        std::mt19937_64 rng{std::random_device{}()};
        auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        path_ = dir / (std::string(TEMP_PATCH_PREFIX) + std::to_string(now) + "_" +
                       std::to_string(rng()) + ".patch");
    }

    ~TempPatchFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    TempPatchFile(const TempPatchFile&) = delete;
    TempPatchFile& operator=(const TempPatchFile&) = delete;

    bool write(const std::string& content) {
        std::ofstream ofs(path_, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return false;
        }
        ofs << content;
        ofs.flush();
        return static_cast<bool>(ofs);
    }

    [[nodiscard]] const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

std::string firstLine(const std::string& text) {
    auto pos = text.find('\n');
    return pos == std::string::npos ? text : text.substr(0, pos);
}

bool isBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

/// `warning:` lines printed by the version-control tool
std::vector<std::string> toolWarnings(const std::string& output) {
    std::vector<std::string> warnings;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.starts_with("warning: ")) {
            warnings.push_back(line.substr(9));
        }
    }
    return warnings;
}

/// Every path the patch touches (old and new side of each file block)
std::set<std::string> patchPaths(const std::string& patch_text) {
    std::set<std::string> paths;
    for (const auto& fd : parsePatch(patch_text)) {
        paths.insert(fd.file);
        paths.insert(fd.old_path);
        paths.insert(fd.new_path);
    }
    return paths;
}

} // namespace

// ============================================================================
// PatchTool Implementation
// ============================================================================

PatchTool::PatchTool(VersionControl& vcs)
    : vcs_(vcs)
    , options_{} {
}

PatchTool::PatchTool(VersionControl& vcs, const Options& options)
    : vcs_(vcs)
    , options_(options) {
}

DiffResult PatchTool::applyPatch(const fs::path& repo_root, const std::string& patch_text) {
    DiffResult result;

    if (isBlank(patch_text)) {
        diagnostics_.addWarning("Patch is empty; nothing to apply", "", 0, "parse");
        return result;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Delegated attempt (skipped in dry-run mode: it mutates the tree)
    // ─────────────────────────────────────────────────────────────────────────
    if (options_.three_way && !options_.dry_run) {
        DelegatedOutcome delegated = tryDelegated(repo_root, patch_text);

        if (auto* success = std::get_if<DelegatedSuccess>(&delegated)) {
            result.strategy = ApplyStrategy::Delegated;
            result.applied = success->files;
            result.warnings = toolWarnings(success->output);

            if (result.applied.empty()) {
                // Nothing staged: report the files named in the patch.
                for (const auto& fd : parsePatch(patch_text)) {
                    result.applied.push_back(fd.file);
                }
            }

            ConflictExtractor extractor(vcs_, &diagnostics_);
            result.conflicts = extractor.scanFiles(repo_root, success->conflicted);
            for (const auto& conflict : result.conflicts) {
                diagnostics_.addNote(conflict.message, conflict.file,
                                     static_cast<size_t>(conflict.line), "conflict");
            }
            return result;
        }

        result.fallback_reason = std::get<DelegatedFailure>(delegated).reason;
        diagnostics_.addNote("Three-way apply failed, applying hunks manually: " +
                             result.fallback_reason, "", 0, "fallback");
    } else {
        result.fallback_reason = options_.dry_run ? "dry run" : "three-way apply disabled";
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Manual fallback
    // ─────────────────────────────────────────────────────────────────────────
    PatchParser parser(&diagnostics_);
    std::vector<FileDiff> files = parser.parse(patch_text);
    if (files.empty()) {
        diagnostics_.addWarning("No file blocks found in patch", "", 0, "parse");
        return result;
    }

    DiffResult manual = applyManually(repo_root, files);
    manual.fallback_reason = std::move(result.fallback_reason);
    return manual;
}

DelegatedOutcome PatchTool::tryDelegated(const fs::path& repo_root,
                                         const std::string& patch_text) {
    TempPatchFile temp;
    if (!temp.write(patch_text)) {
        return DelegatedFailure{"cannot write temporary patch file " + temp.path().string()};
    }

    std::set<std::string> touched = patchPaths(patch_text);
    auto inPatch = [&](const std::vector<std::string>& files) {
        std::vector<std::string> kept;
        for (const auto& file : files) {
            if (touched.count(file) > 0) {
                kept.push_back(file);
            }
        }
        return kept;
    };

    // Files already unmerged before this call belong to someone else.
    std::vector<std::string> before = vcs_.listUnmergedFiles(repo_root);
    std::set<std::string> already_unmerged(before.begin(), before.end());

    CommandResult applied = vcs_.apply(repo_root, temp.path(),
                                       /*three_way=*/true, options_.whitespace_fix);
    if (applied.ok()) {
        return DelegatedSuccess{inPatch(vcs_.listStagedFiles(repo_root)), applied.output, {}};
    }

    // A three-way merge that produced conflicts still exits non-zero, but the
    // tree now holds its result. Report it rather than re-applying on top.
    std::vector<std::string> conflicted;
    for (const auto& file : inPatch(vcs_.listUnmergedFiles(repo_root))) {
        if (already_unmerged.count(file) == 0) {
            conflicted.push_back(file);
        }
    }
    if (!conflicted.empty()) {
        std::vector<std::string> files = inPatch(vcs_.listStagedFiles(repo_root));
        for (const auto& file : conflicted) {
            if (std::find(files.begin(), files.end(), file) == files.end()) {
                files.push_back(file);
            }
        }
        return DelegatedSuccess{files, applied.output, conflicted};
    }

    std::string reason = firstLine(applied.output);
    if (reason.empty()) {
        reason = "exit code " + std::to_string(applied.exit_code);
    }
    return DelegatedFailure{reason};
}

DiffResult PatchTool::applyManually(const fs::path& repo_root,
                                    const std::vector<FileDiff>& files) {
    DiffResult result;
    result.strategy = ApplyStrategy::Manual;
    WorkspaceWriter workspace(repo_root);

    for (const auto& fd : files) {
        ApplyOutcome outcome = applyFile(workspace, fd);

        for (const auto& warning : outcome.warnings) {
            result.warnings.push_back(fd.file + ": " + warning.message);
            diagnostics_.addNote(warning.message, fd.file, 0, warning.type);
        }
        result.conflicts.insert(result.conflicts.end(),
                                outcome.conflicts.begin(), outcome.conflicts.end());

        if (outcome.success) {
            result.applied.push_back(fd.file);
            diagnostics_.addNote(std::string(options_.dry_run ? "would apply " : "applied ") +
                                 toString(fd.operation), fd.file);
        } else {
            result.rejected.push_back(fd.file);
            diagnostics_.addError(outcome.error.value_or("rejected"), fd.file, 0,
                                  outcome.error_type.empty() ? "io" : outcome.error_type);
        }
    }

    return result;
}

ApplyOutcome PatchTool::applyFile(WorkspaceWriter& workspace, const FileDiff& fd) {
    ApplyOutcome outcome;
    std::string error;
    bool dry_run = options_.dry_run;

    auto reject = [&](const std::string& message, const std::string& type = "io") {
        outcome.success = false;
        outcome.error = message;
        outcome.error_type = type;
        return outcome;
    };

    try {
        // ─────────────────────────────────────────────────────────────────────
        // Delete
        // ─────────────────────────────────────────────────────────────────────
        if (fd.operation == FileOperation::Delete) {
            if (dry_run) {
                if (!workspace.exists(fd.file)) {
                    return reject("cannot remove '" + fd.file + "': no such file");
                }
            } else if (!workspace.removeFile(fd.file, &error)) {
                return reject(error);
            }
            outcome.success = true;
            return outcome;
        }

        // ─────────────────────────────────────────────────────────────────────
        // Create / Modify / Rename: load the source content
        // ─────────────────────────────────────────────────────────────────────
        if (fd.operation == FileOperation::Modify && fd.hunks.empty()) {
            return reject("no hunks to apply");
        }

        const std::string& source =
            fd.operation == FileOperation::Rename ? fd.old_path : fd.file;

        std::string content;
        if (!workspace.resolve(source, &error) || !workspace.resolve(fd.file, &error)) {
            return reject(error);
        }
        if (workspace.exists(source)) {
            if (!workspace.readFile(source, content, &error)) {
                return reject(error);
            }
            if (fd.operation == FileOperation::Create) {
                outcome.warnings.push_back({"io", "file already exists; applying hunks to its content"});
            }
        } else if (fd.operation != FileOperation::Create) {
            outcome.warnings.push_back({"io", "'" + source + "' does not exist; treating it as empty"});
        }

        // ─────────────────────────────────────────────────────────────────────
        // Apply hunks in source order on an owned buffer
        // ─────────────────────────────────────────────────────────────────────
        std::vector<std::string> lines = splitLines(content);
        HunkApplier applier(options_.hunk);
        ApplyOutcome applied = applier.applyAll(lines, fd.hunks, fd.file);

        outcome.warnings.insert(outcome.warnings.end(),
                                applied.warnings.begin(), applied.warnings.end());
        outcome.conflicts = std::move(applied.conflicts);
        if (!applied.success) {
            return reject(applied.error.value_or("hunk failed to apply"), applied.error_type);
        }

        // ─────────────────────────────────────────────────────────────────────
        // Write output
        // ─────────────────────────────────────────────────────────────────────
        if (!dry_run) {
            if (!workspace.writeFile(fd.file, joinLines(lines), &error)) {
                return reject(error);
            }
            if (fd.operation == FileOperation::Rename && source != fd.file &&
                workspace.exists(source) && !workspace.removeFile(source, &error)) {
                outcome.warnings.push_back({"io", error});
            }
        }

        outcome.success = true;
        return outcome;

    } catch (const std::exception& e) {
        return reject(std::string("unexpected failure: ") + e.what());
    }
}

} // namespace termcode_patch
