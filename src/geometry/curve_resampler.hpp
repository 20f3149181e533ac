// File: src/geometry/curve_resampler.hpp
#pragma once

#include "core/types.hpp"
#include <cstddef>

namespace trendsketch {

/// CurveResampler - arc-length uniform resampling of a polyline
///
/// Produces exactly n points spaced evenly by cumulative path distance.
/// The first and last output points are copies of the first and last
/// input points. Curves with fewer than two points are returned unchanged,
/// and a curve of zero length yields n copies of its first point.
class CurveResampler {
public:
    /// Resample a curve to n points
    /// @param curve Input polyline
    /// @param n Number of output points (must be >= 2)
    /// @return Resampled curve
    /// @throws std::invalid_argument if n < 2
    static Curve Resample(const Curve& curve, size_t n);

    /// Total Euclidean length of the polyline
    static float PathLength(const Curve& curve);
};

} // namespace trendsketch
