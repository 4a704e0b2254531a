#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Diagnostics.h"
#include "Patch.h"

namespace termcode_patch {

/// Parses unified-diff text (as produced by `git diff` or an LLM) into
/// FileDiff/Hunk/DiffLine values.
///
/// Parsing is permissive: prose before, between or after file blocks is
/// ignored, and file blocks whose `diff --git` header cannot be read are
/// skipped with a "parse" warning. The parser never throws; text without
/// any recognizable file block yields an empty result.
class PatchParser {
public:
    explicit PatchParser(DiagnosticCollector* diagnostics = nullptr);

    /// Parse a complete patch.
    [[nodiscard]] std::vector<FileDiff> parse(std::string_view text);

    /// Parse a `@@ -a[,b] +c[,d] @@ context` header. Missing counts default to 1.
    /// @return Hunk with header fields set and no body lines, or nullopt
    [[nodiscard]] static std::optional<Hunk> parseHunkHeader(std::string_view line);

    /// Split the path pair of a `diff --git a/<old> b/<new>` line.
    [[nodiscard]] static std::optional<std::pair<std::string, std::string>>
    parseFileHeader(std::string_view line);

private:
    DiagnosticCollector* diagnostics_;
};

/// Convenience wrapper around PatchParser::parse.
[[nodiscard]] std::vector<FileDiff> parsePatch(std::string_view text,
                                               DiagnosticCollector* diagnostics = nullptr);

} // namespace termcode_patch
