#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "Diagnostics.h"
#include "Patch.h"

namespace termcode_patch {

/// A hunk offered for review, with its owning file and selection state.
/// A file block without hunks (pure rename, empty new file, mode change) is
/// offered as one metadata-only entry so it survives filtering.
struct HunkSelection {
    std::string id;             ///< "hunk-1", ... or "file-1", ... in patch order
    std::string file_path;
    std::vector<std::string> file_header;  ///< Owning file's `diff --git` and metadata lines
    Hunk hunk;
    bool selected = true;
    bool metadata_only = false;  ///< No hunk; selecting it keeps the header alone
};

/// Counts shown when a review session ends.
struct SelectionSummary {
    size_t total_hunks = 0;      ///< Metadata-only entries are not counted
    size_t selected_hunks = 0;
    std::vector<std::string> affected_files;  ///< Files with at least one selected entry
};

/// Per-hunk accept/reject review of a patch.
///
/// The selector only filters: renderFiltered() regenerates patch text holding
/// each file's header lines and its selected hunks, with hunk headers and
/// bodies copied verbatim. That text goes back through the normal
/// parse-and-apply pipeline.
class HunkSelector {
public:
    explicit HunkSelector(DiagnosticCollector* diagnostics = nullptr);

    /// Parse patch text and reset the review set. Every entry starts selected.
    /// @return Number of entries available for review
    size_t parseForReview(std::string_view patch_text);

    [[nodiscard]] const std::vector<HunkSelection>& selections() const { return selections_; }

    /// Flip the selection of the hunk with the given id.
    /// @return false if no hunk has that id
    bool toggle(const std::string& id);

    void selectAll();
    void deselectAll();

    /// Deselect everything if all hunks are selected, otherwise select all.
    void toggleAll();

    // Cursor used by the command loop
    [[nodiscard]] size_t current() const { return current_; }
    void toggleCurrent();
    void next();
    void prev();

    [[nodiscard]] SelectionSummary getSelectionSummary() const;

    /// Patch text with only the selected entries. Files without a selected
    /// entry are left out entirely.
    [[nodiscard]] std::string renderFiltered() const;

    /// Line-oriented review loop: reads one command per line from `in` and
    /// writes prompts to `out`. Returns when `q` is entered or input ends.
    ///   s / space  toggle current hunk
    ///   n / p      next / previous hunk
    ///   a          toggle all hunks
    ///   q          finish
    void run(std::istream& in, std::ostream& out);

private:
    void describeCurrent(std::ostream& out) const;

    std::vector<HunkSelection> selections_;
    size_t current_ = 0;
    DiagnosticCollector* diagnostics_;
};

/// Parse patch text into a review set (all hunks selected).
[[nodiscard]] std::vector<HunkSelection> parseForReview(std::string_view patch_text);

/// Regenerate patch text from a review set. Files are emitted in the order
/// they first appear, each under its verbatim header lines.
[[nodiscard]] std::string renderFiltered(const std::vector<HunkSelection>& selections);

} // namespace termcode_patch
