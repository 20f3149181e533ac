// File: src/similarity/dtw_scorer.cpp
#include "similarity/dtw_scorer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace trendsketch {

float DTWScorer::LocalCostOf(const Point2D& a, const Point2D& b) const {
    float diff = a.y - b.y;
    if (cost_ == LocalCost::SQUARED) {
        return diff * diff;
    }
    return std::fabs(diff);
}

float DTWScorer::Compute(const Curve& a, const Curve& b) const {
    if (a.empty() || b.empty()) {
        throw ContractViolation("DTW requires non-empty curves");
    }
    if (a.size() != b.size()) {
        throw ContractViolation("DTW requires curves of equal length (" +
                                std::to_string(a.size()) + " vs " +
                                std::to_string(b.size()) + ")");
    }

    const size_t n = a.size();
    const size_t m = b.size();
    const float inf = std::numeric_limits<float>::infinity();

    // Two rows of the (n+1) x (m+1) cumulative cost table
    std::vector<float> previous(m + 1, inf);
    std::vector<float> current(m + 1, inf);
    previous[0] = 0.0f;

    for (size_t i = 1; i <= n; ++i) {
        current[0] = inf;
        for (size_t j = 1; j <= m; ++j) {
            float cost = LocalCostOf(a[i - 1], b[j - 1]);
            float best = std::min(previous[j],          // insertion
                         std::min(current[j - 1],       // deletion
                                  previous[j - 1]));    // match
            current[j] = cost + best;
        }
        std::swap(previous, current);
    }

    return previous[m];
}

} // namespace trendsketch
