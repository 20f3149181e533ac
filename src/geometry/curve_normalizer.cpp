// File: src/geometry/curve_normalizer.cpp
#include "geometry/curve_normalizer.hpp"
#include <algorithm>

namespace trendsketch {

namespace {

// Rescale into [0,1]; a zero range collapses to 0
template<typename T>
float Rescale(T value, T min_value, T max_value) {
    T range = max_value - min_value;
    if (range == T(0)) {
        return 0.0f;
    }
    float ratio = static_cast<float>((value - min_value) / range);
    return std::min(1.0f, std::max(0.0f, ratio));
}

} // namespace

Curve CurveNormalizer::Normalize(const std::vector<Point2D>& points, CoordinateSpace space) {
    Curve result;
    if (points.empty()) {
        return result;
    }

    auto x_range = std::minmax_element(points.begin(), points.end(),
        [](const Point2D& a, const Point2D& b) { return a.x < b.x; });
    auto y_range = std::minmax_element(points.begin(), points.end(),
        [](const Point2D& a, const Point2D& b) { return a.y < b.y; });

    const float min_x = x_range.first->x;
    const float max_x = x_range.second->x;
    const float min_y = y_range.first->y;
    const float max_y = y_range.second->y;

    result.reserve(points.size());
    for (const auto& point : points) {
        float x = Rescale(point.x, min_x, max_x);
        float y = Rescale(point.y, min_y, max_y);

        // Canvas Y grows downward
        if (space == CoordinateSpace::SCREEN) {
            y = 1.0f - y;
        }

        result.emplace_back(x, y);
    }

    return result;
}

Curve CurveNormalizer::NormalizeValues(const std::vector<double>& values) {
    Curve result;
    if (values.empty()) {
        return result;
    }

    auto range = std::minmax_element(values.begin(), values.end());
    const double min_value = *range.first;
    const double max_value = *range.second;
    const size_t last = values.size() - 1;

    result.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        float x = (last == 0) ? 0.0f
                              : static_cast<float>(i) / static_cast<float>(last);
        float y = Rescale(values[i], min_value, max_value);
        result.emplace_back(x, y);
    }

    return result;
}

Curve CurveNormalizer::NormalizeSeries(const TimeSeries& series) {
    return NormalizeValues(series.Values());
}

} // namespace trendsketch
