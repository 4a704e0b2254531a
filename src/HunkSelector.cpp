#include "termcode-patch/HunkSelector.h"

#include <algorithm>
#include <istream>
#include <ostream>
#include <set>

#include "termcode-patch/PatchParser.h"

namespace termcode_patch {

// ============================================================================
// HunkSelector Implementation
// ============================================================================

HunkSelector::HunkSelector(DiagnosticCollector* diagnostics)
    : diagnostics_(diagnostics) {
}

size_t HunkSelector::parseForReview(std::string_view patch_text) {
    selections_.clear();
    current_ = 0;

    PatchParser parser(diagnostics_);
    size_t next_id = 1;
    size_t next_file_id = 1;
    for (auto& fd : parser.parse(patch_text)) {
        if (fd.hunks.empty()) {
            HunkSelection sel;
            sel.id = "file-" + std::to_string(next_file_id++);
            sel.file_path = fd.file;
            sel.file_header = fd.header_lines;
            sel.metadata_only = true;
            selections_.push_back(std::move(sel));
            continue;
        }
        for (auto& hunk : fd.hunks) {
            HunkSelection sel;
            sel.id = "hunk-" + std::to_string(next_id++);
            sel.file_path = fd.file;
            sel.file_header = fd.header_lines;
            sel.hunk = std::move(hunk);
            selections_.push_back(std::move(sel));
        }
    }
    return selections_.size();
}

bool HunkSelector::toggle(const std::string& id) {
    auto it = std::find_if(selections_.begin(), selections_.end(),
                           [&](const HunkSelection& s) { return s.id == id; });
    if (it == selections_.end()) {
        return false;
    }
    it->selected = !it->selected;
    return true;
}

void HunkSelector::selectAll() {
    for (auto& sel : selections_) {
        sel.selected = true;
    }
}

void HunkSelector::deselectAll() {
    for (auto& sel : selections_) {
        sel.selected = false;
    }
}

void HunkSelector::toggleAll() {
    bool all_selected = std::all_of(selections_.begin(), selections_.end(),
                                    [](const HunkSelection& s) { return s.selected; });
    if (all_selected) {
        deselectAll();
    } else {
        selectAll();
    }
}

void HunkSelector::toggleCurrent() {
    if (current_ < selections_.size()) {
        selections_[current_].selected = !selections_[current_].selected;
    }
}

void HunkSelector::next() {
    if (current_ + 1 < selections_.size()) {
        ++current_;
    }
}

void HunkSelector::prev() {
    if (current_ > 0) {
        --current_;
    }
}

SelectionSummary HunkSelector::getSelectionSummary() const {
    SelectionSummary summary;
    for (const auto& sel : selections_) {
        if (!sel.metadata_only) {
            ++summary.total_hunks;
        }
        if (!sel.selected) {
            continue;
        }
        if (!sel.metadata_only) {
            ++summary.selected_hunks;
        }
        if (std::find(summary.affected_files.begin(), summary.affected_files.end(),
                      sel.file_path) == summary.affected_files.end()) {
            summary.affected_files.push_back(sel.file_path);
        }
    }
    return summary;
}

std::string HunkSelector::renderFiltered() const {
    return termcode_patch::renderFiltered(selections_);
}

// ============================================================================
// Command loop
// ============================================================================

void HunkSelector::describeCurrent(std::ostream& out) const {
    if (selections_.empty()) {
        out << "No hunks to review.\n";
        return;
    }
    const auto& sel = selections_[current_];
    out << "\n[" << (current_ + 1) << "/" << selections_.size() << "] "
        << sel.file_path << " (" << sel.id << ") "
        << (sel.selected ? "[selected]" : "[skipped]") << "\n";
    if (sel.metadata_only) {
        for (const auto& line : sel.file_header) {
            out << line << "\n";
        }
        return;
    }
    out << sel.hunk.render();
}

void HunkSelector::run(std::istream& in, std::ostream& out) {
    describeCurrent(out);
    if (selections_.empty()) {
        return;
    }

    std::string command;
    while (true) {
        out << "(s)elect, (n)ext, (p)rev, (a)ll, (q)uit > " << std::flush;
        if (!std::getline(in, command)) {
            out << "\n";
            break;  // End of input finishes the review
        }
        if (!command.empty() && command.back() == '\r') {
            command.pop_back();
        }

        if (command == "s" || command == " ") {
            toggleCurrent();
        } else if (command == "n") {
            next();
        } else if (command == "p") {
            prev();
        } else if (command == "a") {
            toggleAll();
        } else if (command == "q") {
            break;
        } else {
            out << "Unknown command '" << command << "'. Use s, n, p, a or q.\n";
            continue;
        }
        describeCurrent(out);
    }

    SelectionSummary summary = getSelectionSummary();
    out << "Selected " << summary.selected_hunks << " of " << summary.total_hunks
        << " hunk(s) in " << summary.affected_files.size() << " file(s)\n";
}

// ============================================================================
// Free functions
// ============================================================================

std::vector<HunkSelection> parseForReview(std::string_view patch_text) {
    HunkSelector selector;
    selector.parseForReview(patch_text);
    return selector.selections();
}

std::string renderFiltered(const std::vector<HunkSelection>& selections) {
    // Files in first-appearance order
    std::vector<std::string> order;
    std::set<std::string> seen;
    for (const auto& sel : selections) {
        if (sel.selected && seen.insert(sel.file_path).second) {
            order.push_back(sel.file_path);
        }
    }

    std::string out;
    for (const auto& file : order) {
        bool header_written = false;
        for (const auto& sel : selections) {
            if (sel.file_path != file || !sel.selected) {
                continue;
            }
            if (!header_written) {
                for (const auto& line : sel.file_header) {
                    out += line;
                    out += '\n';
                }
                header_written = true;
            }
            if (!sel.metadata_only) {
                out += sel.hunk.render();
            }
        }
    }
    return out;
}

} // namespace termcode_patch
