#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace termcode_patch {

/// Exit status and captured output of an external command.
struct CommandResult {
    int exit_code = -1;
    std::string output;

    [[nodiscard]] bool ok() const { return exit_code == 0; }
};

/// Run a command through the shell, capturing stdout. With merge_stderr the
/// command's stderr is captured too, otherwise it is discarded.
/// Never throws; a command that cannot be started reports exit_code -1.
[[nodiscard]] CommandResult runCommand(const std::string& command, bool merge_stderr = true);

/// Quote an argument for a POSIX shell ('...' with embedded quotes escaped).
[[nodiscard]] std::string shellQuote(const std::string& arg);

/// Narrow interface to the version-control tool. Keeping it abstract lets the
/// apply engine run against an in-memory fake in tests.
class VersionControl {
public:
    virtual ~VersionControl() = default;

    /// Apply a patch file to the working tree.
    /// @param three_way Fall back to a three-way merge using blob ids in the patch
    /// @param whitespace_fix Fix whitespace errors in added lines
    virtual CommandResult apply(const std::filesystem::path& repo_root,
                                const std::filesystem::path& patch_file,
                                bool three_way,
                                bool whitespace_fix) = 0;

    /// Paths (relative to repo_root) with staged changes.
    virtual std::vector<std::string> listStagedFiles(const std::filesystem::path& repo_root) = 0;

    /// Paths (relative to repo_root) left in an unmerged state.
    virtual std::vector<std::string> listUnmergedFiles(const std::filesystem::path& repo_root) = 0;
};

/// VersionControl backed by the `git` executable.
class GitVersionControl : public VersionControl {
public:
    explicit GitVersionControl(std::string executable = "git");

    CommandResult apply(const std::filesystem::path& repo_root,
                        const std::filesystem::path& patch_file,
                        bool three_way,
                        bool whitespace_fix) override;

    std::vector<std::string> listStagedFiles(const std::filesystem::path& repo_root) override;

    std::vector<std::string> listUnmergedFiles(const std::filesystem::path& repo_root) override;

private:
    [[nodiscard]] std::string command(const std::filesystem::path& repo_root,
                                      const std::string& args) const;

    std::vector<std::string> listFiles(const std::filesystem::path& repo_root,
                                       const std::string& args);

    std::string executable_;
};

} // namespace termcode_patch
