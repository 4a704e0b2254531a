#include "termcode-patch/ConflictExtractor.h"

#include "termcode-patch/Constants.h"
#include "termcode-patch/Writer.h"

namespace termcode_patch {

ConflictExtractor::ConflictExtractor(VersionControl& vcs, DiagnosticCollector* diagnostics)
    : vcs_(vcs)
    , diagnostics_(diagnostics) {
}

std::vector<ConflictInfo> ConflictExtractor::findConflicts(
    const std::filesystem::path& repo_root) {
    return scanFiles(repo_root, vcs_.listUnmergedFiles(repo_root));
}

std::vector<ConflictInfo> ConflictExtractor::scanFiles(
    const std::filesystem::path& repo_root,
    const std::vector<std::string>& files) {

    std::vector<ConflictInfo> conflicts;
    WorkspaceWriter workspace(repo_root);

    for (const auto& file : files) {
        std::string content;
        std::string error;
        if (!workspace.readFile(file, content, &error)) {
            if (diagnostics_) {
                diagnostics_->addWarning("Skipping unreadable unmerged file: " + error,
                                         file, 0, "io");
            }
            continue;
        }

        auto found = scanContent(file, content);
        conflicts.insert(conflicts.end(),
                         std::make_move_iterator(found.begin()),
                         std::make_move_iterator(found.end()));
    }

    return conflicts;
}

std::vector<ConflictInfo> ConflictExtractor::scanContent(const std::string& file,
                                                         const std::string& content) {
    enum class Section { None, Original, Base, Incoming };

    std::vector<ConflictInfo> conflicts;
    Section section = Section::None;
    ConflictInfo current;
    std::vector<std::string> original;
    std::vector<std::string> incoming;

    auto lines = splitLines(content);
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = lines[i];
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.starts_with(markers::CONFLICT_BEGIN)) {
            // A new block before the previous one closed: keep the partial block.
            if (section != Section::None) {
                current.original = joinLines(original);
                current.incoming = joinLines(incoming);
                current.message += " (unterminated)";
                conflicts.push_back(current);
            }
            section = Section::Original;
            original.clear();
            incoming.clear();
            current = ConflictInfo{};
            current.file = file;
            current.line = static_cast<int>(i) + 1;
            current.kind = ConflictKind::Merge;
            current.message = "merge conflict markers at line " + std::to_string(i + 1);
            continue;
        }

        switch (section) {
            case Section::None:
                break;
            case Section::Original:
                if (line.starts_with(markers::CONFLICT_BASE)) {
                    section = Section::Base;
                } else if (line.starts_with(markers::CONFLICT_SEPARATOR)) {
                    section = Section::Incoming;
                } else {
                    original.push_back(line);
                }
                break;
            case Section::Base:
                if (line.starts_with(markers::CONFLICT_SEPARATOR)) {
                    section = Section::Incoming;
                }
                break;
            case Section::Incoming:
                if (line.starts_with(markers::CONFLICT_END)) {
                    current.original = joinLines(original);
                    current.incoming = joinLines(incoming);
                    conflicts.push_back(current);
                    section = Section::None;
                } else {
                    incoming.push_back(line);
                }
                break;
        }
    }

    if (section != Section::None) {
        current.original = joinLines(original);
        current.incoming = joinLines(incoming);
        current.message += " (unterminated)";
        conflicts.push_back(current);
    }

    return conflicts;
}

std::vector<ConflictInfo> findConflicts(const std::filesystem::path& repo_root,
                                        VersionControl& vcs) {
    ConflictExtractor extractor(vcs);
    return extractor.findConflicts(repo_root);
}

} // namespace termcode_patch
