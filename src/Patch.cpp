#include "termcode-patch/Patch.h"

#include <sstream>

namespace termcode_patch {

char DiffLine::prefix() const {
    switch (kind) {
        case LineKind::Add: return '+';
        case LineKind::Remove: return '-';
        case LineKind::Context: return ' ';
    }
    return ' ';
}

int Hunk::oldLineTally() const {
    int count = 0;
    for (const auto& line : lines) {
        if (line.kind != LineKind::Add) {
            ++count;
        }
    }
    return count;
}

int Hunk::newLineTally() const {
    int count = 0;
    for (const auto& line : lines) {
        if (line.kind != LineKind::Remove) {
            ++count;
        }
    }
    return count;
}

std::string Hunk::render() const {
    std::ostringstream oss;
    if (!header.empty()) {
        oss << header << "\n";
    } else {
        oss << "@@ -" << old_start << "," << old_count
            << " +" << new_start << "," << new_count << " @@";
        if (!context.empty()) {
            oss << " " << context;
        }
        oss << "\n";
    }
    for (const auto& line : lines) {
        oss << line.prefix() << line.content << "\n";
    }
    return oss.str();
}

const char* toString(FileOperation op) {
    switch (op) {
        case FileOperation::Create: return "create";
        case FileOperation::Modify: return "modify";
        case FileOperation::Delete: return "delete";
        case FileOperation::Rename: return "rename";
    }
    return "modify";
}

const char* toString(ConflictKind kind) {
    switch (kind) {
        case ConflictKind::Merge: return "merge";
        case ConflictKind::Context: return "context";
        case ConflictKind::Whitespace: return "whitespace";
    }
    return "context";
}

const char* toString(ApplyStrategy strategy) {
    switch (strategy) {
        case ApplyStrategy::None: return "none";
        case ApplyStrategy::Delegated: return "three-way";
        case ApplyStrategy::Manual: return "manual";
    }
    return "none";
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t pos = text.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            result += '\n';
        }
        result += lines[i];
    }
    return result;
}

} // namespace termcode_patch
