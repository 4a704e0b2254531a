#pragma once

#include <cstddef>
#include <string_view>

namespace termcode_patch {

/// Levenshtein distance (single-character insert, delete, substitute).
[[nodiscard]] size_t editDistance(std::string_view a, std::string_view b);

/// Normalized similarity: 1 - editDistance / max(len). Two empty strings
/// compare as 1.0.
/// @return Score in [0, 1]
[[nodiscard]] double similarity(std::string_view expected, std::string_view actual);

/// True when score reaches threshold, tolerating floating-point noise so
/// that e.g. 4/5 counts as meeting 0.8.
[[nodiscard]] bool meetsThreshold(double score, double threshold);

} // namespace termcode_patch
