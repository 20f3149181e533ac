// File: src/similarity/curve_distance.hpp
#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace trendsketch {

/// Abstract base class for curve distances
///
/// Defines the interface for comparing two resampled curves.
/// Distances are non-negative where:
/// - 0.0 = identical shape
/// - larger = less similar
class CurveDistance {
public:
    virtual ~CurveDistance() = default;

    /// Compute distance between two curves
    /// @param a First curve
    /// @param b Second curve
    /// @return Distance >= 0
    virtual float Compute(const Curve& a, const Curve& b) const = 0;

    /// Compute distance between query and multiple candidates (batch)
    /// Default implementation calls Compute for each candidate
    /// @param query Query curve
    /// @param candidates Candidate curves
    /// @return Vector of distances, one per candidate
    virtual std::vector<float> ComputeBatch(
        const Curve& query,
        const std::vector<Curve>& candidates) const;

    /// Get the name of this distance
    virtual std::string GetName() const = 0;

    /// Check if distance is symmetric: d(a,b) == d(b,a)
    virtual bool IsSymmetric() const { return true; }
};

} // namespace trendsketch
