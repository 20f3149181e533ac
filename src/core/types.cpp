// File: src/core/types.cpp
#include "core/types.hpp"
#include <sstream>
#include <cmath>
#include <algorithm>
#include <cctype>

namespace trendsketch {

namespace {

// Enum names are matched case-insensitively ("sales" == "SALES")
std::string ToUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

} // namespace

// Point2D implementations

float Point2D::DistanceTo(const Point2D& other) const {
    float dx = other.x - x;
    float dy = other.y - y;
    return std::sqrt(dx * dx + dy * dy);
}

std::string Point2D::ToString() const {
    std::ostringstream oss;
    oss << "(" << x << ", " << y << ")";
    return oss.str();
}

// Enum implementations

const char* ToString(CoordinateSpace space) {
    switch (space) {
        case CoordinateSpace::SCREEN: return "SCREEN";
        case CoordinateSpace::VALUE: return "VALUE";
        default: return "UNKNOWN";
    }
}

CoordinateSpace ParseCoordinateSpace(const std::string& str) {
    std::string upper = ToUpper(str);
    if (upper == "SCREEN") return CoordinateSpace::SCREEN;
    if (upper == "VALUE") return CoordinateSpace::VALUE;
    throw std::invalid_argument("Unknown CoordinateSpace: " + str);
}

const char* ToString(LocalCost cost) {
    switch (cost) {
        case LocalCost::ABSOLUTE: return "ABSOLUTE";
        case LocalCost::SQUARED: return "SQUARED";
        default: return "UNKNOWN";
    }
}

LocalCost ParseLocalCost(const std::string& str) {
    std::string upper = ToUpper(str);
    if (upper == "ABSOLUTE") return LocalCost::ABSOLUTE;
    if (upper == "SQUARED") return LocalCost::SQUARED;
    throw std::invalid_argument("Unknown LocalCost: " + str);
}

const char* ToString(PatternKind kind) {
    switch (kind) {
        case PatternKind::TREND: return "TREND";
        case PatternKind::SHAPE: return "SHAPE";
        case PatternKind::VALUE: return "VALUE";
        default: return "UNKNOWN";
    }
}

PatternKind ParsePatternKind(const std::string& str) {
    std::string upper = ToUpper(str);
    if (upper == "TREND") return PatternKind::TREND;
    if (upper == "SHAPE") return PatternKind::SHAPE;
    if (upper == "VALUE") return PatternKind::VALUE;
    throw std::invalid_argument("Unknown PatternKind: " + str);
}

const char* ToString(ValueMeasure measure) {
    switch (measure) {
        case ValueMeasure::SALES: return "SALES";
        case ValueMeasure::QUANTITY: return "QUANTITY";
        case ValueMeasure::PROFIT: return "PROFIT";
        default: return "UNKNOWN";
    }
}

ValueMeasure ParseValueMeasure(const std::string& str) {
    std::string upper = ToUpper(str);
    if (upper == "SALES") return ValueMeasure::SALES;
    if (upper == "QUANTITY") return ValueMeasure::QUANTITY;
    if (upper == "PROFIT") return ValueMeasure::PROFIT;
    throw std::invalid_argument("Unknown ValueMeasure: " + str);
}

// TimeSeries implementations

size_t TimeSeries::NonZeroCount() const {
    return static_cast<size_t>(std::count_if(
        samples.begin(), samples.end(),
        [](const SeriesSample& s) { return s.value != 0.0; }));
}

std::vector<double> TimeSeries::Values() const {
    std::vector<double> values;
    values.reserve(samples.size());
    for (const auto& sample : samples) {
        values.push_back(sample.value);
    }
    return values;
}

} // namespace trendsketch
