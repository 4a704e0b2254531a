#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace termcode_patch {

/// Reads, writes and removes files addressed relative to a workspace root.
/// Paths that are absolute or escape the root via ".." are refused.
/// Failures return false and describe the problem through `error`.
class WorkspaceWriter {
public:
    explicit WorkspaceWriter(std::filesystem::path root);

    /// Resolve a patch-relative path to a location under the root.
    [[nodiscard]] std::optional<std::filesystem::path> resolve(
        const std::string& relative,
        std::string* error = nullptr) const;

    /// Check whether a regular file exists at the relative path.
    [[nodiscard]] bool exists(const std::string& relative) const;

    /// Read a whole file as bytes.
    bool readFile(const std::string& relative, std::string& content,
                  std::string* error = nullptr) const;

    /// Write content, creating parent directories as needed.
    bool writeFile(const std::string& relative, const std::string& content,
                   std::string* error = nullptr);

    /// Remove a file. Removing a file that does not exist is an error.
    bool removeFile(const std::string& relative, std::string* error = nullptr);

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

} // namespace termcode_patch
