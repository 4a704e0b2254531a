#include "termcode-patch/PatchParser.h"

#include <charconv>
#include <regex>

#include "termcode-patch/Constants.h"

namespace termcode_patch {

// ============================================================================
// Helpers
// ============================================================================

static std::string_view stripCarriageReturn(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

static bool parseNumber(const std::ssub_match& match, int& out) {
    const char* first = &*match.first;
    const char* last = first + match.length();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

/// Metadata lines kept verbatim between `diff --git` and the first hunk.
static bool isMetadataLine(std::string_view line) {
    static constexpr std::string_view prefixes[] = {
        "index ", "old mode ", "new mode ", "new file mode ", "deleted file mode ",
        "similarity index ", "dissimilarity index ", "rename from ", "rename to ",
        "copy from ", "copy to ", "--- ", "+++ ",
    };
    for (auto prefix : prefixes) {
        if (line.starts_with(prefix)) {
            return true;
        }
    }
    return false;
}

/// Strip the `a/` or `b/` prefix from a `---`/`+++` path, dropping any
/// tab-separated timestamp.
static std::string headerPath(std::string_view rest) {
    auto tab = rest.find('\t');
    if (tab != std::string_view::npos) {
        rest = rest.substr(0, tab);
    }
    if (rest.starts_with("a/") || rest.starts_with("b/")) {
        rest.remove_prefix(2);
    }
    return std::string(rest);
}

// ============================================================================
// PatchParser Implementation
// ============================================================================

PatchParser::PatchParser(DiagnosticCollector* diagnostics)
    : diagnostics_(diagnostics) {
}

std::optional<Hunk> PatchParser::parseHunkHeader(std::string_view line) {
    static const std::regex hunk_re(
        R"(^@@ -(\d+)(?:,(\d+))? \+(\d+)(?:,(\d+))? @@ ?(.*)$)");

    std::string text(stripCarriageReturn(line));
    std::smatch match;
    if (!std::regex_match(text, match, hunk_re)) {
        return std::nullopt;
    }

    Hunk hunk;
    if (!parseNumber(match[1], hunk.old_start) || !parseNumber(match[3], hunk.new_start)) {
        return std::nullopt;
    }
    if (match[2].matched && !parseNumber(match[2], hunk.old_count)) {
        return std::nullopt;
    }
    if (match[4].matched && !parseNumber(match[4], hunk.new_count)) {
        return std::nullopt;
    }
    hunk.context = match[5].str();
    hunk.header = text;
    return hunk;
}

std::optional<std::pair<std::string, std::string>>
PatchParser::parseFileHeader(std::string_view line) {
    static const std::regex header_re(R"(^diff --git a/(.+?) b/(.+)$)");

    std::string text(stripCarriageReturn(line));
    std::smatch match;
    if (!std::regex_match(text, match, header_re)) {
        return std::nullopt;
    }
    return std::make_pair(match[1].str(), match[2].str());
}

std::vector<FileDiff> PatchParser::parse(std::string_view text) {
    std::vector<FileDiff> files;

    // Per-file state
    std::optional<FileDiff> current;
    bool is_new = false;
    bool is_deleted = false;
    bool is_renamed = false;

    // Per-hunk state
    bool in_hunk = false;
    int old_line = 0;
    int new_line = 0;

    size_t preamble_lines = 0;
    size_t line_number = 0;

    auto finishFile = [&]() {
        if (!current) {
            return;
        }
        if (is_new) {
            current->operation = FileOperation::Create;
        } else if (is_deleted) {
            current->operation = FileOperation::Delete;
        } else if (is_renamed || current->old_path != current->new_path) {
            current->operation = FileOperation::Rename;
        } else {
            current->operation = FileOperation::Modify;
        }
        current->file = current->operation == FileOperation::Delete
            ? current->old_path : current->new_path;
        files.push_back(std::move(*current));
        current.reset();
    };

    std::string buffer(text);
    std::vector<std::string> lines = splitLines(buffer);
    for (size_t index = 0; index < lines.size(); ++index) {
        ++line_number;
        std::string_view line(lines[index]);

        // ─────────────────────────────────────────────────────────────────────
        // File header
        // ─────────────────────────────────────────────────────────────────────
        if (line.starts_with(markers::DIFF_GIT)) {
            finishFile();
            in_hunk = false;
            is_new = is_deleted = is_renamed = false;

            auto paths = parseFileHeader(line);
            if (!paths) {
                if (diagnostics_) {
                    diagnostics_->addWarning(
                        "Unreadable file header, skipping block: " + std::string(line),
                        "", line_number, "parse");
                }
                continue;
            }

            current.emplace();
            current->old_path = paths->first;
            current->new_path = paths->second;
            current->header_lines.emplace_back(stripCarriageReturn(line));
            continue;
        }

        if (!current) {
            if (!line.empty()) {
                ++preamble_lines;
            }
            continue;
        }

        // ─────────────────────────────────────────────────────────────────────
        // Hunk body
        // ─────────────────────────────────────────────────────────────────────
        if (in_hunk) {
            char tag = line.empty() ? '\0' : line.front();

            // A blank context line whose leading space was stripped. It only
            // counts while the header still expects more lines, and the empty
            // string after the final newline is never a line.
            const Hunk& open = current->hunks.back();
            bool blank = line.empty() || line == "\r";
            bool short_of_header = open.oldLineTally() < open.old_count ||
                                   open.newLineTally() < open.new_count;
            if (blank && short_of_header && index + 1 < lines.size()) {
                DiffLine dl;
                dl.kind = LineKind::Context;
                dl.content = std::string(line);
                dl.old_line_number = old_line++;
                dl.new_line_number = new_line++;
                current->hunks.back().lines.push_back(std::move(dl));
                continue;
            }

            if (tag == '+' || tag == '-' || tag == ' ') {
                DiffLine dl;
                dl.content = std::string(line.substr(1));
                if (tag == '+') {
                    dl.kind = LineKind::Add;
                    dl.new_line_number = new_line++;
                } else if (tag == '-') {
                    dl.kind = LineKind::Remove;
                    dl.old_line_number = old_line++;
                } else {
                    dl.kind = LineKind::Context;
                    dl.old_line_number = old_line++;
                    dl.new_line_number = new_line++;
                }
                current->hunks.back().lines.push_back(std::move(dl));
                continue;
            }
            if (line.starts_with(markers::NO_NEWLINE)) {
                continue;
            }
            in_hunk = false;
            // Fall through: the line may be the next hunk header.
        }

        if (line.starts_with(markers::HUNK)) {
            auto hunk = parseHunkHeader(line);
            if (!hunk) {
                if (diagnostics_) {
                    diagnostics_->addWarning(
                        "Malformed hunk header ignored: " + std::string(line),
                        current->new_path, line_number, "parse");
                }
                continue;
            }
            old_line = hunk->old_start;
            new_line = hunk->new_start;
            current->hunks.push_back(std::move(*hunk));
            in_hunk = true;
            continue;
        }

        // ─────────────────────────────────────────────────────────────────────
        // Metadata between the file header and the first hunk
        // ─────────────────────────────────────────────────────────────────────
        if (!current->hunks.empty() || !isMetadataLine(line)) {
            continue;
        }

        std::string_view meta = stripCarriageReturn(line);
        current->header_lines.emplace_back(meta);

        if (meta.starts_with(markers::NEW_FILE_MODE)) {
            is_new = true;
        } else if (meta.starts_with(markers::DELETED_FILE_MODE)) {
            is_deleted = true;
        } else if (meta.starts_with(markers::RENAME_FROM)) {
            is_renamed = true;
            current->old_path = std::string(meta.substr(markers::RENAME_FROM.size()));
        } else if (meta.starts_with(markers::RENAME_TO)) {
            is_renamed = true;
            current->new_path = std::string(meta.substr(markers::RENAME_TO.size()));
        } else if (meta.starts_with(markers::OLD_FILE)) {
            if (headerPath(meta.substr(markers::OLD_FILE.size())) == markers::DEV_NULL) {
                is_new = true;
            }
        } else if (meta.starts_with(markers::NEW_FILE)) {
            if (headerPath(meta.substr(markers::NEW_FILE.size())) == markers::DEV_NULL) {
                is_deleted = true;
            }
        }
    }

    finishFile();

    if (diagnostics_ && preamble_lines > 0) {
        diagnostics_->addNote(
            "Ignored " + std::to_string(preamble_lines) +
            " line(s) of text outside any file block", "", 0, "parse");
    }

    return files;
}

std::vector<FileDiff> parsePatch(std::string_view text, DiagnosticCollector* diagnostics) {
    PatchParser parser(diagnostics);
    return parser.parse(text);
}

} // namespace termcode_patch
