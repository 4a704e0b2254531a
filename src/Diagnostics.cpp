#include "termcode-patch/Diagnostics.h"

#include <sstream>

namespace termcode_patch {

void DiagnosticCollector::addNote(const std::string& msg,
                                  const std::string& file,
                                  size_t line,
                                  const std::string& type) {
    diagnostics_.emplace_back(DiagnosticLevel::Note, msg, file, line, type);
}

void DiagnosticCollector::addWarning(const std::string& msg,
                                     const std::string& file,
                                     size_t line,
                                     const std::string& type) {
    diagnostics_.emplace_back(DiagnosticLevel::Warning, msg, file, line, type);
    ++warning_count_;
}

void DiagnosticCollector::addError(const std::string& msg,
                                   const std::string& file,
                                   size_t line,
                                   const std::string& type) {
    diagnostics_.emplace_back(DiagnosticLevel::Error, msg, file, line, type);
    ++error_count_;
}

size_t DiagnosticCollector::countOfType(const std::string& type) const {
    size_t count = 0;
    for (const auto& diag : diagnostics_) {
        if (diag.type == type) {
            ++count;
        }
    }
    return count;
}

void DiagnosticCollector::clear() {
    diagnostics_.clear();
    error_count_ = 0;
    warning_count_ = 0;
}

static const char* levelName(DiagnosticLevel level) {
    switch (level) {
        case DiagnosticLevel::Note: return "note";
        case DiagnosticLevel::Warning: return "warning";
        case DiagnosticLevel::Error: return "error";
    }
    return "error";
}

std::string DiagnosticCollector::format(DiagnosticLevel min_level) const {
    std::ostringstream oss;

    for (const auto& diag : diagnostics_) {
        if (diag.level < min_level) {
            continue;
        }

        // Format: file:line: level: message
        if (!diag.file_path.empty()) {
            oss << diag.file_path;
            if (diag.line_number > 0) {
                oss << ":" << diag.line_number;
            }
            oss << ": ";
        }

        oss << levelName(diag.level) << ": " << diag.message << "\n";
    }

    return oss.str();
}

} // namespace termcode_patch
