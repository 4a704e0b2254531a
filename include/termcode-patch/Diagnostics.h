#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace termcode_patch {

/// Diagnostic severity level
enum class DiagnosticLevel {
    Note,
    Warning,
    Error
};

/// A single diagnostic message with location information
struct Diagnostic {
    DiagnosticLevel level;
    std::string message;
    std::string file_path;
    size_t line_number = 0;
    std::string type;  // Category: "parse", "fallback", "context", "io", etc.

    Diagnostic(DiagnosticLevel lvl, std::string msg,
               std::string file = "", size_t line = 0,
               std::string diag_type = "")
        : level(lvl)
        , message(std::move(msg))
        , file_path(std::move(file))
        , line_number(line)
        , type(std::move(diag_type)) {}
};

/// Collects notes, warnings and errors without throwing exceptions.
/// Library code records here; only the CLI decides what gets printed.
class DiagnosticCollector {
public:
    DiagnosticCollector() = default;

    /// Add an informational note (shown in verbose mode)
    void addNote(const std::string& msg,
                 const std::string& file = "",
                 size_t line = 0,
                 const std::string& type = "");

    /// Add a warning diagnostic
    void addWarning(const std::string& msg,
                    const std::string& file = "",
                    size_t line = 0,
                    const std::string& type = "");

    /// Add an error diagnostic
    void addError(const std::string& msg,
                  const std::string& file = "",
                  size_t line = 0,
                  const std::string& type = "");

    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    [[nodiscard]] bool hasErrors() const { return error_count_ > 0; }

    [[nodiscard]] size_t errorCount() const { return error_count_; }

    [[nodiscard]] size_t warningCount() const { return warning_count_; }

    /// Count diagnostics of a given category
    [[nodiscard]] size_t countOfType(const std::string& type) const;

    void clear();

    /// Format diagnostics at or above min_level, one per line.
    [[nodiscard]] std::string format(DiagnosticLevel min_level = DiagnosticLevel::Warning) const;

private:
    std::vector<Diagnostic> diagnostics_;
    size_t error_count_ = 0;
    size_t warning_count_ = 0;
};

} // namespace termcode_patch
