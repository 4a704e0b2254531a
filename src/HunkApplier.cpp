#include "termcode-patch/HunkApplier.h"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "termcode-patch/Similarity.h"

namespace termcode_patch {

// ============================================================================
// Helpers
// ============================================================================

static std::string_view trim(std::string_view s) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

static std::string stripWhitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            out += c;
        }
    }
    return out;
}

static std::string percent(double score) {
    return std::to_string(static_cast<int>(std::lround(score * 100.0))) + "%";
}

// ============================================================================
// HunkApplier Implementation
// ============================================================================

HunkApplier::HunkApplier(HunkApplyOptions options)
    : options_(options) {
}

HunkResult HunkApplier::apply(std::vector<std::string>& lines,
                              const Hunk& hunk,
                              int running_offset,
                              const std::string& file) const {
    HunkResult result;
    result.new_offset = running_offset;

    auto fail = [&](int line, ConflictKind kind, const std::string& message,
                    std::optional<std::string> expected,
                    std::optional<std::string> actual) {
        ConflictInfo conflict;
        conflict.file = file;
        conflict.line = line;
        conflict.kind = kind;
        conflict.message = message;
        conflict.original = std::move(expected);
        conflict.incoming = std::move(actual);
        result.conflicts.push_back(std::move(conflict));
        result.error = message;
        result.error_type = kind == ConflictKind::Whitespace ? "whitespace" : "context";
        result.success = false;
        return result;
    };

    // ─────────────────────────────────────────────────────────────────────────
    // Header count validation
    // ─────────────────────────────────────────────────────────────────────────
    int old_tally = hunk.oldLineTally();
    int new_tally = hunk.newLineTally();
    if (old_tally != hunk.old_count || new_tally != hunk.new_count) {
        std::string message = "hunk " + hunk.header + " declares " +
            std::to_string(hunk.old_count) + "/" + std::to_string(hunk.new_count) +
            " lines but body has " + std::to_string(old_tally) + "/" +
            std::to_string(new_tally);
        if (options_.strict_counts) {
            result.error = message;
            result.error_type = "count";
            return result;
        }
        result.warnings.push_back({"count", message});
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Locate the hunk in the current buffer
    // ─────────────────────────────────────────────────────────────────────────
    std::vector<const DiffLine*> old_side;
    std::vector<std::string> replacement;
    for (const auto& line : hunk.lines) {
        if (line.kind != LineKind::Add) {
            old_side.push_back(&line);
        }
        if (line.kind != LineKind::Remove) {
            replacement.push_back(line.content);
        }
    }

    // A hunk with nothing to match inserts after line old_start.
    long start = old_side.empty()
        ? static_cast<long>(hunk.old_start) + running_offset
        : static_cast<long>(hunk.old_start) - 1 + running_offset;
    if (old_side.empty() && start < 0) {
        start = 0;
    }
    if (start < 0 || start > static_cast<long>(lines.size())) {
        return fail(static_cast<int>(start + 1), ConflictKind::Context,
                    "hunk " + hunk.header + " starts outside the file (" +
                    std::to_string(lines.size()) + " lines)",
                    std::nullopt, std::nullopt);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Verify context and removed lines
    // ─────────────────────────────────────────────────────────────────────────
    for (size_t i = 0; i < old_side.size(); ++i) {
        size_t idx = static_cast<size_t>(start) + i;
        int line_no = static_cast<int>(idx) + 1;
        const std::string& expected = old_side[i]->content;

        if (idx >= lines.size()) {
            return fail(line_no, ConflictKind::Context,
                        "context mismatch at line " + std::to_string(line_no) +
                        ": expected '" + expected + "' but reached end of file",
                        expected, std::nullopt);
        }

        const std::string& actual = lines[idx];
        std::string_view lhs = expected;
        std::string_view rhs = actual;

        if (options_.ignore_whitespace) {
            lhs = trim(lhs);
            rhs = trim(rhs);
        } else if (lhs != rhs && stripWhitespace(lhs) == stripWhitespace(rhs)) {
            return fail(line_no, ConflictKind::Whitespace,
                        "whitespace mismatch at line " + std::to_string(line_no),
                        expected, actual);
        }

        if (lhs == rhs) {
            continue;
        }

        double score = similarity(lhs, rhs);
        if (meetsThreshold(score, options_.fuzzy_threshold)) {
            result.warnings.push_back({"fuzzy", "fuzzy matched line " + std::to_string(line_no) +
                                                " (" + percent(score) + " similar)"});
            continue;
        }

        return fail(line_no, ConflictKind::Context,
                    "context mismatch at line " + std::to_string(line_no) +
                    ": expected '" + expected + "', found '" + actual + "' (" +
                    percent(score) + " similar)",
                    expected, actual);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Splice replacement block
    // ─────────────────────────────────────────────────────────────────────────
    auto first = lines.begin() + start;
    auto last = first + static_cast<long>(old_side.size());
    first = lines.erase(first, last);
    lines.insert(first, replacement.begin(), replacement.end());

    result.success = true;
    result.new_offset = running_offset +
        static_cast<int>(replacement.size()) - static_cast<int>(old_side.size());
    return result;
}

ApplyOutcome HunkApplier::applyAll(std::vector<std::string>& lines,
                                   const std::vector<Hunk>& hunks,
                                   const std::string& file) const {
    ApplyOutcome outcome;
    std::vector<std::string> working = lines;
    int offset = 0;

    for (const auto& hunk : hunks) {
        HunkResult hr = apply(working, hunk, offset, file);
        outcome.warnings.insert(outcome.warnings.end(),
                                hr.warnings.begin(), hr.warnings.end());
        outcome.conflicts.insert(outcome.conflicts.end(),
                                 hr.conflicts.begin(), hr.conflicts.end());
        if (!hr.success) {
            outcome.success = false;
            outcome.error = hr.error;
            outcome.error_type = hr.error_type;
            return outcome;
        }
        offset = hr.new_offset;
    }

    lines = std::move(working);
    outcome.success = true;
    return outcome;
}

HunkResult applyHunk(std::vector<std::string>& lines,
                     const Hunk& hunk,
                     int running_offset,
                     const HunkApplyOptions& options) {
    return HunkApplier(options).apply(lines, hunk, running_offset);
}

} // namespace termcode_patch
