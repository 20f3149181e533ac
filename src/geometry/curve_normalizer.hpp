// File: src/geometry/curve_normalizer.hpp
#pragma once

#include "core/types.hpp"
#include <vector>

namespace trendsketch {

/// CurveNormalizer - maps point sequences into the unit square
///
/// Each axis is rescaled independently to [0,1] using its min/max.
/// An axis whose range is zero (all values identical) maps to 0 on
/// that axis instead of dividing by zero.
///
/// In SCREEN space the Y axis is inverted after rescaling so that
/// visually higher points (smaller pixel Y) get larger normalized Y.
/// A horizontal screen stroke therefore sits at y = 1.
class CurveNormalizer {
public:
    /// Normalize a point sequence
    /// @param points Input points (may be empty)
    /// @param space Source coordinate space, controls Y inversion
    /// @return Curve with all coordinates in [0,1]
    static Curve Normalize(const std::vector<Point2D>& points, CoordinateSpace space);

    /// Normalize a value series sampled on a uniform period axis
    ///
    /// x = i / (len - 1) (0 for a single sample), y rescaled with the same
    /// degenerate-range rule as Normalize, no inversion.
    /// @param values Series values in period order
    /// @return Normalized curve, one point per value
    static Curve NormalizeValues(const std::vector<double>& values);

    /// Normalized curve of a time series (values in sample order)
    static Curve NormalizeSeries(const TimeSeries& series);
};

} // namespace trendsketch
