#pragma once

#include <string>
#include <string_view>

namespace termcode_patch {

/// Line prefixes recognized in unified-diff text.
namespace markers {

// ============================================================================
// File Header Markers
// ============================================================================

inline constexpr std::string_view DIFF_GIT = "diff --git ";
inline constexpr std::string_view NEW_FILE_MODE = "new file mode";
inline constexpr std::string_view DELETED_FILE_MODE = "deleted file mode";
inline constexpr std::string_view RENAME_FROM = "rename from ";
inline constexpr std::string_view RENAME_TO = "rename to ";
inline constexpr std::string_view OLD_FILE = "--- ";
inline constexpr std::string_view NEW_FILE = "+++ ";
inline constexpr std::string_view DEV_NULL = "/dev/null";

/// Hunk header prefix (`@@ -a,b +c,d @@`)
inline constexpr std::string_view HUNK = "@@";

/// `\ No newline at end of file`
inline constexpr std::string_view NO_NEWLINE = "\\";

// ============================================================================
// Merge Conflict Markers
// ============================================================================

inline constexpr std::string_view CONFLICT_BEGIN = "<<<<<<<";
inline constexpr std::string_view CONFLICT_BASE = "|||||||";
inline constexpr std::string_view CONFLICT_SEPARATOR = "=======";
inline constexpr std::string_view CONFLICT_END = ">>>>>>>";

} // namespace markers

// ============================================================================
// Defaults
// ============================================================================

/// Minimum similarity for accepting a drifted context/remove line
inline constexpr double DEFAULT_FUZZY_THRESHOLD = 0.8;

/// Prefix of the transient patch file handed to the version-control tool
inline constexpr std::string_view TEMP_PATCH_PREFIX = "termcode-patch-";

inline constexpr std::string_view VERSION = "0.1.0";

} // namespace termcode_patch
