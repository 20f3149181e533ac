// File: tests/geometry/curve_normalizer_test.cpp
#include "geometry/curve_normalizer.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <random>

namespace trendsketch {
namespace {

// ============================================================================
// Screen Space
// ============================================================================

TEST(CurveNormalizerTest, ScreenSpaceInvertsY) {
    // Rising line drawn on a canvas: pixel Y decreases to the right
    std::vector<Point2D> points{{10.0f, 100.0f}, {20.0f, 50.0f}, {30.0f, 0.0f}};

    Curve curve = CurveNormalizer::Normalize(points, CoordinateSpace::SCREEN);

    ASSERT_EQ(3u, curve.size());
    EXPECT_FLOAT_EQ(0.0f, curve[0].x);
    EXPECT_FLOAT_EQ(0.5f, curve[1].x);
    EXPECT_FLOAT_EQ(1.0f, curve[2].x);
    EXPECT_FLOAT_EQ(0.0f, curve[0].y);
    EXPECT_FLOAT_EQ(0.5f, curve[1].y);
    EXPECT_FLOAT_EQ(1.0f, curve[2].y);
}

TEST(CurveNormalizerTest, ValueSpaceKeepsY) {
    std::vector<Point2D> points{{10.0f, 100.0f}, {20.0f, 50.0f}, {30.0f, 0.0f}};

    Curve curve = CurveNormalizer::Normalize(points, CoordinateSpace::VALUE);

    ASSERT_EQ(3u, curve.size());
    EXPECT_FLOAT_EQ(1.0f, curve[0].y);
    EXPECT_FLOAT_EQ(0.5f, curve[1].y);
    EXPECT_FLOAT_EQ(0.0f, curve[2].y);
}

TEST(CurveNormalizerTest, FlatYMapsToZeroInValueSpace) {
    std::vector<Point2D> points{{0.0f, 7.0f}, {5.0f, 7.0f}, {10.0f, 7.0f}};

    Curve curve = CurveNormalizer::Normalize(points, CoordinateSpace::VALUE);

    ASSERT_EQ(3u, curve.size());
    for (const auto& p : curve) {
        EXPECT_FLOAT_EQ(0.0f, p.y);
        EXPECT_FALSE(std::isnan(p.x));
    }
}

TEST(CurveNormalizerTest, HorizontalScreenStrokeIsInverted) {
    std::vector<Point2D> points{{0.0f, 100.0f}, {10.0f, 100.0f}, {20.0f, 100.0f}, {30.0f, 100.0f}};

    Curve curve = CurveNormalizer::Normalize(points, CoordinateSpace::SCREEN);

    ASSERT_EQ(4u, curve.size());
    for (const auto& p : curve) {
        EXPECT_FLOAT_EQ(1.0f, p.y);
        EXPECT_FALSE(std::isnan(p.x));
    }
    EXPECT_FLOAT_EQ(0.0f, curve.front().x);
    EXPECT_FLOAT_EQ(1.0f, curve.back().x);
}

TEST(CurveNormalizerTest, FlatXMapsToZero) {
    std::vector<Point2D> points{{4.0f, 0.0f}, {4.0f, 10.0f}};

    Curve curve = CurveNormalizer::Normalize(points, CoordinateSpace::VALUE);

    ASSERT_EQ(2u, curve.size());
    EXPECT_FLOAT_EQ(0.0f, curve[0].x);
    EXPECT_FLOAT_EQ(0.0f, curve[1].x);
    EXPECT_FLOAT_EQ(1.0f, curve[1].y);
}

TEST(CurveNormalizerTest, SinglePointCollapses) {
    Curve value = CurveNormalizer::Normalize({{123.0f, 456.0f}}, CoordinateSpace::VALUE);
    ASSERT_EQ(1u, value.size());
    EXPECT_EQ(Point2D(0.0f, 0.0f), value[0]);

    Curve screen = CurveNormalizer::Normalize({{123.0f, 456.0f}}, CoordinateSpace::SCREEN);
    ASSERT_EQ(1u, screen.size());
    EXPECT_EQ(Point2D(0.0f, 1.0f), screen[0]);
}

TEST(CurveNormalizerTest, EmptyInputGivesEmptyCurve) {
    EXPECT_TRUE(CurveNormalizer::Normalize({}, CoordinateSpace::SCREEN).empty());
    EXPECT_TRUE(CurveNormalizer::NormalizeValues({}).empty());
}

TEST(CurveNormalizerTest, OutputStaysInUnitSquareAndSpansIt) {
    std::mt19937 rng(42);
    std::uniform_real_distribution<float> dist(-500.0f, 500.0f);

    std::vector<Point2D> points;
    for (int i = 0; i < 50; ++i) {
        points.emplace_back(dist(rng), dist(rng));
    }

    for (auto space : {CoordinateSpace::SCREEN, CoordinateSpace::VALUE}) {
        Curve curve = CurveNormalizer::Normalize(points, space);
        ASSERT_EQ(points.size(), curve.size());

        float min_x = 1.0f, max_x = 0.0f, min_y = 1.0f, max_y = 0.0f;
        for (const auto& p : curve) {
            EXPECT_GE(p.x, 0.0f);
            EXPECT_LE(p.x, 1.0f);
            EXPECT_GE(p.y, 0.0f);
            EXPECT_LE(p.y, 1.0f);
            min_x = std::min(min_x, p.x);
            max_x = std::max(max_x, p.x);
            min_y = std::min(min_y, p.y);
            max_y = std::max(max_y, p.y);
        }
        EXPECT_FLOAT_EQ(0.0f, min_x);
        EXPECT_FLOAT_EQ(1.0f, max_x);
        EXPECT_FLOAT_EQ(0.0f, min_y);
        EXPECT_FLOAT_EQ(1.0f, max_y);
    }
}

TEST(CurveNormalizerTest, InputNotModified) {
    std::vector<Point2D> points{{10.0f, 100.0f}, {20.0f, 50.0f}};
    std::vector<Point2D> copy = points;

    CurveNormalizer::Normalize(points, CoordinateSpace::SCREEN);

    EXPECT_EQ(copy, points);
}

// ============================================================================
// Value Series
// ============================================================================

TEST(CurveNormalizerTest, NormalizeValuesUsesUniformX) {
    Curve curve = CurveNormalizer::NormalizeValues({0.0, 50.0, 100.0, 25.0, 75.0});

    ASSERT_EQ(5u, curve.size());
    EXPECT_FLOAT_EQ(0.0f, curve[0].x);
    EXPECT_FLOAT_EQ(0.25f, curve[1].x);
    EXPECT_FLOAT_EQ(0.5f, curve[2].x);
    EXPECT_FLOAT_EQ(0.75f, curve[3].x);
    EXPECT_FLOAT_EQ(1.0f, curve[4].x);

    EXPECT_FLOAT_EQ(0.0f, curve[0].y);
    EXPECT_FLOAT_EQ(0.5f, curve[1].y);
    EXPECT_FLOAT_EQ(1.0f, curve[2].y);
    EXPECT_FLOAT_EQ(0.25f, curve[3].y);
    EXPECT_FLOAT_EQ(0.75f, curve[4].y);
}

TEST(CurveNormalizerTest, ConstantValuesAreFlatAtZero) {
    Curve curve = CurveNormalizer::NormalizeValues({5.0, 5.0, 5.0});

    ASSERT_EQ(3u, curve.size());
    for (const auto& p : curve) {
        EXPECT_FLOAT_EQ(0.0f, p.y);
        EXPECT_FALSE(std::isnan(p.y));
    }
    EXPECT_FLOAT_EQ(0.5f, curve[1].x);
}

TEST(CurveNormalizerTest, SingleValue) {
    Curve curve = CurveNormalizer::NormalizeValues({42.0});
    ASSERT_EQ(1u, curve.size());
    EXPECT_EQ(Point2D(0.0f, 0.0f), curve[0]);
}

TEST(CurveNormalizerTest, NormalizeSeriesMatchesValues) {
    TimeSeries series;
    series.entity_key = "Widget";
    series.samples = {{0, 10.0}, {1, 30.0}, {2, 20.0}};

    EXPECT_EQ(CurveNormalizer::NormalizeValues({10.0, 30.0, 20.0}),
              CurveNormalizer::NormalizeSeries(series));
}

} // namespace
} // namespace trendsketch
