// File: src/similarity/dtw_scorer.hpp
#pragma once

#include "similarity/curve_distance.hpp"
#include <string>

namespace trendsketch {

/// Dynamic Time Warping distance on curve amplitude
///
/// Aligns two equal-length curves allowing local stretching along the
/// index axis. Only the Y component contributes to the local cost; X is
/// what the warping is allowed to absorb.
///
///   dtw[0][0] = 0, other border cells = +inf
///   dtw[i][j] = cost(i,j) + min(dtw[i-1][j], dtw[i][j-1], dtw[i-1][j-1])
///
/// Result is dtw[n][m]. Complexity O(n*m) time, O(m) memory.
///
/// Both curves must be non-empty and of the same length; the search
/// service guarantees this by resampling everything to the same count.
class DTWScorer : public CurveDistance {
public:
    explicit DTWScorer(LocalCost cost = LocalCost::ABSOLUTE) : cost_(cost) {}

    /// @throws ContractViolation if the curves are empty or differ in length
    float Compute(const Curve& a, const Curve& b) const override;

    std::string GetName() const override { return "DTW"; }
    bool IsSymmetric() const override { return true; }

    LocalCost GetLocalCost() const { return cost_; }

private:
    LocalCost cost_;

    float LocalCostOf(const Point2D& a, const Point2D& b) const;
};

} // namespace trendsketch
