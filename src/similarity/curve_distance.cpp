// File: src/similarity/curve_distance.cpp
#include "similarity/curve_distance.hpp"

namespace trendsketch {

std::vector<float> CurveDistance::ComputeBatch(
        const Curve& query,
        const std::vector<Curve>& candidates) const {
    std::vector<float> results;
    results.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        results.push_back(Compute(query, candidate));
    }

    return results;
}

} // namespace trendsketch
