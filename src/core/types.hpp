// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace trendsketch {

// Point2D: real-valued coordinate pair
// Meaning depends on context: screen pixels, or (period, amplitude)
struct Point2D {
    float x{0.0f};
    float y{0.0f};

    Point2D() = default;
    Point2D(float x_, float y_) : x(x_), y(y_) {}

    // Euclidean distance to another point
    float DistanceTo(const Point2D& other) const;

    bool operator==(const Point2D& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point2D& other) const { return !(*this == other); }

    std::string ToString() const;
};

// Ordered point sequence (raw stroke, normalized or resampled curve)
using Curve = std::vector<Point2D>;

// Pointer positions of one drag gesture, in host pixels
using RawStroke = std::vector<Point2D>;

// CoordinateSpace: where a point sequence comes from
enum class CoordinateSpace : uint8_t {
    SCREEN = 0,  // Y grows downward, inverted during normalization
    VALUE = 1,   // Y is an amplitude, kept as is
};

const char* ToString(CoordinateSpace space);
CoordinateSpace ParseCoordinateSpace(const std::string& str);

// LocalCost: per-cell cost used by DTW (amplitude only)
enum class LocalCost : uint8_t {
    ABSOLUTE = 0,  // |a.y - b.y|
    SQUARED = 1,   // (a.y - b.y)^2
};

const char* ToString(LocalCost cost);
LocalCost ParseLocalCost(const std::string& str);

// PatternKind: pattern family selected by the user when drawing.
// Reserved: it is carried through a search but does not change scoring.
enum class PatternKind : uint8_t {
    TREND = 0,
    SHAPE = 1,
    VALUE = 2,
};

const char* ToString(PatternKind kind);
PatternKind ParsePatternKind(const std::string& str);

// ValueMeasure: which transaction quantity a series aggregates
enum class ValueMeasure : uint8_t {
    SALES = 0,     // quantity * unit price
    QUANTITY = 1,
    PROFIT = 2,
};

const char* ToString(ValueMeasure measure);
ValueMeasure ParseValueMeasure(const std::string& str);

// Raw order line handed over by the data source
struct TransactionRecord {
    std::string order_date;   // ISO date, "YYYY-MM-DD..."
    std::string entity;       // product name
    std::string category;
    double quantity{0.0};
    double unit_price{0.0};
    double profit{0.0};
};

// One observation of a series on the shared period axis
struct SeriesSample {
    size_t period_index{0};
    double value{0.0};

    SeriesSample() = default;
    SeriesSample(size_t index, double v) : period_index(index), value(v) {}
};

// Per-entity time series, immutable after corpus load
struct TimeSeries {
    std::string entity_key;
    std::string category;
    std::vector<SeriesSample> samples;
    double total_value{0.0};

    // Number of periods holding a non-zero value
    size_t NonZeroCount() const;

    // Raw values in period order
    std::vector<double> Values() const;
};

// One ranked search hit
struct MatchResult {
    std::string entity_key;
    std::string category;
    double total_value{0.0};
    float dtw_distance{0.0f};
    float match_quality{0.0f};   // 0..100, presentation only
    Curve display_series;        // normalized, not resampled
};

using RankedMatches = std::vector<MatchResult>;

// Raised when upstream data or a caller breaks an interface contract
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& what)
        : std::logic_error(what) {}

    ContractViolation(const std::string& what, std::string entity_key)
        : std::logic_error(what), entity_key_(std::move(entity_key)) {}

    // Offending entity, empty when not entity-specific
    const std::string& GetEntityKey() const { return entity_key_; }

private:
    std::string entity_key_;
};

} // namespace trendsketch
