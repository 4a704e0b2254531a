#pragma once

#include <optional>
#include <string>
#include <vector>

#include "Constants.h"
#include "Patch.h"

namespace termcode_patch {

/// Tolerances used when matching a hunk against file content.
struct HunkApplyOptions {
    double fuzzy_threshold = DEFAULT_FUZZY_THRESHOLD;
    bool ignore_whitespace = true;  ///< Compare trimmed lines
    bool strict_counts = false;     ///< Reject hunks whose body disagrees with the header counts
};

/// Outcome of applying one hunk.
struct HunkResult {
    bool success = false;
    int new_offset = 0;             ///< Offset to pass to the next hunk of the same file
    std::vector<ConflictInfo> conflicts;
    std::vector<ApplyWarning> warnings;
    std::optional<std::string> error;
    std::string error_type;         ///< Diagnostic category of `error`
};

/// Applies hunks to an in-memory line buffer.
///
/// Hunk headers refer to line numbers in the original file. Each applied
/// hunk shifts every later line by (added - removed), so callers thread the
/// returned offset into the next hunk of the same file, in source order.
class HunkApplier {
public:
    explicit HunkApplier(HunkApplyOptions options = {});

    /// Apply one hunk. On failure the buffer is left untouched.
    /// @param lines Buffer to modify (one element per line, no terminators)
    /// @param hunk Parsed hunk
    /// @param running_offset Net line delta from earlier hunks in this file
    /// @param file Path used in conflict records
    [[nodiscard]] HunkResult apply(std::vector<std::string>& lines,
                                   const Hunk& hunk,
                                   int running_offset,
                                   const std::string& file = "") const;

    /// Apply every hunk in order. Either all hunks land or the buffer is
    /// left as it was; the first failing hunk stops the file.
    [[nodiscard]] ApplyOutcome applyAll(std::vector<std::string>& lines,
                                        const std::vector<Hunk>& hunks,
                                        const std::string& file = "") const;

    [[nodiscard]] const HunkApplyOptions& options() const { return options_; }

private:
    HunkApplyOptions options_;
};

/// Free-function form of HunkApplier::apply with default tolerances.
[[nodiscard]] HunkResult applyHunk(std::vector<std::string>& lines,
                                   const Hunk& hunk,
                                   int running_offset,
                                   const HunkApplyOptions& options = {});

} // namespace termcode_patch
