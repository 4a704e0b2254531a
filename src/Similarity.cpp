#include "termcode-patch/Similarity.h"

#include <algorithm>
#include <vector>

namespace termcode_patch {

size_t editDistance(std::string_view a, std::string_view b) {
    if (a.size() < b.size()) {
        std::swap(a, b);
    }
    if (b.empty()) {
        return a.size();
    }

    // Two-row dynamic programming over the shorter string
    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> curr(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) {
        prev[j] = j;
    }

    for (size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }

    return prev[b.size()];
}

double similarity(std::string_view expected, std::string_view actual) {
    size_t longest = std::max(expected.size(), actual.size());
    if (longest == 0) {
        return 1.0;
    }
    return 1.0 - static_cast<double>(editDistance(expected, actual)) /
                 static_cast<double>(longest);
}

bool meetsThreshold(double score, double threshold) {
    constexpr double kEpsilon = 1e-9;
    return score + kEpsilon >= threshold;
}

} // namespace termcode_patch
