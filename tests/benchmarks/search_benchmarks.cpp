// File: tests/benchmarks/search_benchmarks.cpp
//
// Performance benchmarks for curve preparation and ranked search

#include <gtest/gtest.h>
#include <chrono>
#include <iostream>
#include <random>
#include "geometry/curve_normalizer.hpp"
#include "geometry/curve_resampler.hpp"
#include "search/pattern_search_service.hpp"
#include "similarity/dtw_scorer.hpp"

using namespace trendsketch;
using namespace std::chrono;

// ============================================================================
// Benchmark Helper
// ============================================================================

struct BenchmarkTimer {
    using TimePoint = high_resolution_clock::time_point;
    TimePoint start;

    BenchmarkTimer() : start(high_resolution_clock::now()) {}

    double ElapsedMs() const {
        auto end = high_resolution_clock::now();
        return duration_cast<duration<double, std::milli>>(end - start).count();
    }
};

SeriesCorpusIndex CreateCorpus(size_t series_count, size_t periods) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> dist(1.0, 1000.0);

    std::vector<std::string> keys;
    for (size_t p = 0; p < periods; ++p) {
        keys.push_back("P" + std::to_string(p));
    }

    std::vector<TimeSeries> series;
    series.reserve(series_count);
    for (size_t i = 0; i < series_count; ++i) {
        TimeSeries s;
        s.entity_key = "Entity " + std::to_string(i);
        s.category = (i % 4 == 0) ? "Tech" : "Office";
        for (size_t p = 0; p < periods; ++p) {
            double value = dist(rng);
            s.samples.emplace_back(p, value);
            s.total_value += value;
        }
        series.push_back(std::move(s));
    }
    return SeriesCorpusIndex(std::move(keys), std::move(series));
}

RawStroke CreateStroke(size_t points) {
    RawStroke stroke;
    for (size_t i = 0; i < points; ++i) {
        float t = static_cast<float>(i) / static_cast<float>(points - 1);
        stroke.emplace_back(600.0f * t, 300.0f - 250.0f * t * t);
    }
    return stroke;
}

// ============================================================================
// Curve Benchmarks
// ============================================================================

TEST(CurveBenchmark, NormalizeAndResample_10000_Strokes) {
    RawStroke stroke = CreateStroke(200);

    BenchmarkTimer timer;
    for (size_t i = 0; i < 10000; ++i) {
        Curve curve = CurveNormalizer::Normalize(stroke, CoordinateSpace::SCREEN);
        Curve resampled = CurveResampler::Resample(curve, 20);
        ASSERT_EQ(20u, resampled.size());
    }

    double elapsed = timer.ElapsedMs();
    std::cout << "Normalize+Resample (10000 x 200 points): " << elapsed << "ms" << std::endl;

    EXPECT_LT(elapsed, 2000.0);
}

TEST(CurveBenchmark, DTW_100000_Pairs) {
    DTWScorer scorer;
    Curve a = CurveResampler::Resample(
        CurveNormalizer::Normalize(CreateStroke(50), CoordinateSpace::SCREEN), 20);
    Curve b = CurveNormalizer::NormalizeValues({5, 3, 8, 1, 9, 2, 7, 4, 6, 5, 3, 8});
    b = CurveResampler::Resample(b, 20);

    BenchmarkTimer timer;
    float total = 0.0f;
    for (size_t i = 0; i < 100000; ++i) {
        total += scorer.Compute(a, b);
    }

    double elapsed = timer.ElapsedMs();
    double ops_per_sec = (100000.0 / elapsed) * 1000.0;
    std::cout << "DTW 20x20 (100000): " << elapsed << "ms, "
              << ops_per_sec << " ops/sec" << std::endl;

    EXPECT_GT(total, 0.0f);
    EXPECT_LT(elapsed, 5000.0);
}

// ============================================================================
// Search Benchmarks
// ============================================================================

TEST(SearchBenchmark, Search_10000_Series_Sequential) {
    SeriesCorpusIndex corpus = CreateCorpus(10000, 24);
    PatternSearchService service;

    BenchmarkTimer timer;
    auto response = service.SearchDetailed(CreateStroke(40), corpus, kAllCategories, 10);
    double elapsed = timer.ElapsedMs();

    std::cout << "Search 10000 series (1 thread): " << elapsed << "ms" << std::endl;

    EXPECT_EQ(10u, response.matches.size());
    EXPECT_LT(elapsed, 5000.0);
}

TEST(SearchBenchmark, Search_10000_Series_Parallel) {
    SeriesCorpusIndex corpus = CreateCorpus(10000, 24);

    SearchConfig config;
    config.worker_threads = 4;
    PatternSearchService service(config);

    BenchmarkTimer timer;
    auto response = service.SearchDetailed(CreateStroke(40), corpus, kAllCategories, 10);
    double elapsed = timer.ElapsedMs();

    std::cout << "Search 10000 series (" << response.stats.workers_used << " threads): "
              << elapsed << "ms" << std::endl;

    EXPECT_EQ(10u, response.matches.size());
    EXPECT_LT(elapsed, 5000.0);
}
