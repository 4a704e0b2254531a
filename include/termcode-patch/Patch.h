#pragma once

#include <optional>
#include <string>
#include <vector>

namespace termcode_patch {

/// What a file block does to its target.
enum class FileOperation {
    Create,
    Modify,
    Delete,
    Rename
};

/// Tag of a single hunk body line.
enum class LineKind {
    Add,
    Remove,
    Context
};

/// One body line of a hunk.
/// Remove/Context lines carry the old line number, Add/Context the new one.
struct DiffLine {
    LineKind kind = LineKind::Context;
    std::string content;                ///< Line text without its prefix character
    std::optional<int> old_line_number;
    std::optional<int> new_line_number;

    /// Prefix character used when the line is rendered back into a patch
    [[nodiscard]] char prefix() const;
};

/// A contiguous change region anchored by its `@@` header.
struct Hunk {
    int old_start = 0;
    int old_count = 1;
    int new_start = 0;
    int new_count = 1;
    std::string context;        ///< Trailing text after the closing `@@`
    std::string header;         ///< The `@@` line exactly as it appeared
    std::vector<DiffLine> lines;

    /// Number of Context + Remove lines (lines consumed from the old file)
    [[nodiscard]] int oldLineTally() const;

    /// Number of Context + Add lines (lines produced in the new file)
    [[nodiscard]] int newLineTally() const;

    /// Render the header and body in unified-diff form, each line newline-terminated
    [[nodiscard]] std::string render() const;
};

/// All hunks for one file in a patch.
struct FileDiff {
    std::string file;           ///< Path the change lands on (new path, or old path for deletes)
    std::string old_path;
    std::string new_path;
    FileOperation operation = FileOperation::Modify;
    std::vector<std::string> header_lines;  ///< `diff --git` line plus metadata, verbatim
    std::vector<Hunk> hunks;
};

// ============================================================================
// Outcomes
// ============================================================================

enum class ConflictKind {
    Merge,      ///< Conflict markers left by a three-way merge
    Context,    ///< Expected context differs from the file beyond tolerance
    Whitespace  ///< Expected context differs only in whitespace (strict mode)
};

struct ConflictInfo {
    std::string file;
    int line = 0;
    ConflictKind kind = ConflictKind::Context;
    std::string message;
    std::optional<std::string> original;  ///< "ours" side or the expected line
    std::optional<std::string> incoming;  ///< "theirs" side or the actual line
};

/// Non-fatal finding raised while applying hunks.
struct ApplyWarning {
    std::string type;       ///< Diagnostic category: "fuzzy", "count", "io"
    std::string message;
};

/// Result of applying one file's hunks.
struct ApplyOutcome {
    bool success = false;
    std::vector<ConflictInfo> conflicts;
    std::vector<ApplyWarning> warnings;
    std::optional<std::string> error;
    std::string error_type;     ///< Diagnostic category of `error`
};

/// How the patch ended up being applied.
enum class ApplyStrategy {
    None,       ///< Nothing to apply
    Delegated,  ///< Version-control three-way apply succeeded
    Manual      ///< Hunk-by-hunk fallback
};

/// Whole-patch outcome.
struct DiffResult {
    std::vector<std::string> applied;
    std::vector<std::string> rejected;
    std::vector<ConflictInfo> conflicts;
    std::vector<std::string> warnings;
    ApplyStrategy strategy = ApplyStrategy::None;
    std::string fallback_reason;    ///< Why the delegated attempt was not used

    [[nodiscard]] bool clean() const { return rejected.empty() && conflicts.empty(); }
};

[[nodiscard]] const char* toString(FileOperation op);
[[nodiscard]] const char* toString(ConflictKind kind);
[[nodiscard]] const char* toString(ApplyStrategy strategy);

/// Split text on '\n'. A trailing newline yields a final empty element,
/// so joinLines(splitLines(s)) == s for every s.
[[nodiscard]] std::vector<std::string> splitLines(const std::string& text);

[[nodiscard]] std::string joinLines(const std::vector<std::string>& lines);

} // namespace termcode_patch
