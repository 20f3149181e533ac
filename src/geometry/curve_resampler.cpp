// File: src/geometry/curve_resampler.cpp
#include "geometry/curve_resampler.hpp"
#include <stdexcept>

namespace trendsketch {

float CurveResampler::PathLength(const Curve& curve) {
    float length = 0.0f;
    for (size_t i = 1; i < curve.size(); ++i) {
        length += curve[i - 1].DistanceTo(curve[i]);
    }
    return length;
}

Curve CurveResampler::Resample(const Curve& curve, size_t n) {
    if (n < 2) {
        throw std::invalid_argument("Resample point count must be at least 2");
    }

    if (curve.size() <= 1) {
        return curve;
    }

    const float total_length = PathLength(curve);
    if (total_length <= 0.0f) {
        // All points coincide
        return Curve(n, curve.front());
    }

    const float step = total_length / static_cast<float>(n - 1);

    Curve result;
    result.reserve(n);
    result.push_back(curve.front());

    // Arc length accumulated up to curve[segment - 1]
    float walked = 0.0f;
    size_t segment = 1;

    for (size_t i = 1; i + 1 < n; ++i) {
        const float target = static_cast<float>(i) * step;
        bool placed = false;

        while (segment < curve.size()) {
            const Point2D& from = curve[segment - 1];
            const Point2D& to = curve[segment];
            const float segment_length = from.DistanceTo(to);

            if (walked + segment_length >= target) {
                float t = (segment_length > 0.0f)
                              ? (target - walked) / segment_length
                              : 0.0f;
                result.emplace_back(from.x + t * (to.x - from.x),
                                    from.y + t * (to.y - from.y));
                placed = true;
                break;
            }

            walked += segment_length;
            ++segment;
        }

        // Rounding left the target just past the end of the path
        if (!placed) {
            result.push_back(curve.back());
        }
    }

    result.push_back(curve.back());
    return result;
}

} // namespace trendsketch
