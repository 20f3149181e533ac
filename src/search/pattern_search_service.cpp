// File: src/search/pattern_search_service.cpp
#include "search/pattern_search_service.hpp"
#include "geometry/curve_normalizer.hpp"
#include "geometry/curve_resampler.hpp"
#include "search/worker_group.hpp"
#include "similarity/dtw_scorer.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <queue>
#include <stdexcept>
#include <thread>

namespace trendsketch {

namespace {

// Candidate position and its distance
struct Scored {
    size_t order;
    float distance;

    Scored(size_t o, float d) : order(o), distance(d) {}

    // Worst candidate on top of the heap: larger distance, then later order
    bool operator<(const Scored& other) const {
        if (distance != other.distance) {
            return distance < other.distance;
        }
        return order < other.order;
    }
};

} // namespace

const char* ToString(SearchStatus status) {
    switch (status) {
        case SearchStatus::OK: return "OK";
        case SearchStatus::INSUFFICIENT_INPUT: return "INSUFFICIENT_INPUT";
        case SearchStatus::EMPTY_CORPUS: return "EMPTY_CORPUS";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Construction
// ============================================================================

PatternSearchService::PatternSearchService(const SearchConfig& config)
    : PatternSearchService(config, std::make_shared<DTWScorer>(config.local_cost)) {
}

PatternSearchService::PatternSearchService(const SearchConfig& config,
                                           std::shared_ptr<const CurveDistance> distance)
    : config_(config), distance_(std::move(distance)) {
    if (!distance_) {
        throw std::invalid_argument("Distance cannot be null");
    }
    ValidateConfig(config_);
}

void PatternSearchService::ValidateConfig(const SearchConfig& config) {
    if (config.resample_point_count < 2) {
        throw std::invalid_argument("resample_point_count must be at least 2");
    }
    if (config.min_draw_points < 2) {
        throw std::invalid_argument("min_draw_points must be at least 2");
    }
    if (config.match_quality_scale <= 0.0f) {
        throw std::invalid_argument("match_quality_scale must be greater than 0");
    }
    if (config.worker_threads == 0) {
        throw std::invalid_argument("worker_threads must be at least 1");
    }
}

// ============================================================================
// Curve preparation
// ============================================================================

Curve PatternSearchService::PrepareStroke(const RawStroke& stroke) const {
    Curve normalized = CurveNormalizer::Normalize(stroke, CoordinateSpace::SCREEN);
    return CurveResampler::Resample(normalized, config_.resample_point_count);
}

Curve PatternSearchService::PrepareSeries(const TimeSeries& series) const {
    Curve normalized = CurveNormalizer::NormalizeSeries(series);

    // Zero or one period: a flat curve of the query's length
    if (normalized.size() < 2) {
        Point2D point = normalized.empty() ? Point2D() : normalized.front();
        return Curve(config_.resample_point_count, point);
    }
    return CurveResampler::Resample(normalized, config_.resample_point_count);
}

float PatternSearchService::MatchQuality(float distance, float scale) {
    float quality = 100.0f - distance * scale;
    return std::min(100.0f, std::max(0.0f, quality));
}

// ============================================================================
// Search
// ============================================================================

RankedMatches PatternSearchService::Search(const RawStroke& stroke,
                                           const SeriesCorpusIndex& corpus,
                                           const std::string& category) const {
    return Search(stroke, corpus, category, config_.top_k);
}

RankedMatches PatternSearchService::Search(const RawStroke& stroke,
                                           const SeriesCorpusIndex& corpus,
                                           const std::string& category,
                                           size_t top_k) const {
    return SearchDetailed(stroke, corpus, category, top_k).matches;
}

SearchResponse PatternSearchService::SearchDetailed(const RawStroke& stroke,
                                                    const SeriesCorpusIndex& corpus,
                                                    const std::string& category,
                                                    size_t top_k,
                                                    PatternKind kind) const {
    auto start = std::chrono::steady_clock::now();

    SearchResponse response;
    response.kind = kind;
    response.stats.series_considered = corpus.Size();

    if (stroke.size() < config_.min_draw_points) {
        response.status = SearchStatus::INSUFFICIENT_INPUT;
        return response;
    }

    std::vector<TimeSeries> eligible = corpus.EligibleSeries(category);
    if (eligible.empty()) {
        response.status = SearchStatus::EMPTY_CORPUS;
        return response;
    }

    Curve query = PrepareStroke(stroke);
    std::vector<float> distances = ScoreAll(query, eligible, response.stats.workers_used);
    response.stats.series_scored = eligible.size();

    // Bounded max-heap keeps the top_k best
    std::priority_queue<Scored> top;
    if (top_k > 0) {
        for (size_t i = 0; i < distances.size(); ++i) {
            top.emplace(i, distances[i]);
            if (top.size() > top_k) {
                top.pop();
            }
        }
    }

    std::vector<Scored> ranked;
    ranked.reserve(top.size());
    while (!top.empty()) {
        ranked.push_back(top.top());
        top.pop();
    }
    std::reverse(ranked.begin(), ranked.end());

    response.matches.reserve(ranked.size());
    for (const auto& scored : ranked) {
        const TimeSeries& series = eligible[scored.order];

        MatchResult match;
        match.entity_key = series.entity_key;
        match.category = series.category;
        match.total_value = series.total_value;
        match.dtw_distance = scored.distance;
        match.match_quality = MatchQuality(scored.distance, config_.match_quality_scale);
        match.display_series = CurveNormalizer::NormalizeSeries(series);
        response.matches.push_back(std::move(match));
    }

    response.stats.results_returned = response.matches.size();
    if (!response.matches.empty()) {
        response.stats.best_distance = response.matches.front().dtw_distance;
        response.stats.worst_distance = response.matches.back().dtw_distance;
    }

    auto elapsed = std::chrono::steady_clock::now() - start;
    response.stats.elapsed_ms =
        std::chrono::duration<double, std::milli>(elapsed).count();
    return response;
}

// ============================================================================
// Scoring
// ============================================================================

void PatternSearchService::ScoreRange(const Curve& query,
                                      const std::vector<TimeSeries>& candidates,
                                      size_t begin, size_t end,
                                      std::vector<float>& distances) const {
    for (size_t i = begin; i < end; ++i) {
        distances[i] = distance_->Compute(query, PrepareSeries(candidates[i]));
    }
}

std::vector<float> PatternSearchService::ScoreAll(const Curve& query,
                                                  const std::vector<TimeSeries>& candidates,
                                                  size_t& workers_used) const {
    std::vector<float> distances(candidates.size(), 0.0f);

    size_t workers = std::min(config_.worker_threads, candidates.size());
    if (workers <= 1 || candidates.size() < config_.parallel_threshold) {
        workers_used = 1;
        ScoreRange(query, candidates, 0, candidates.size(), distances);
        return distances;
    }

    // Each worker owns a disjoint slice of distances
    std::vector<std::exception_ptr> errors(workers);
    WorkerGroup group(workers);

    const size_t chunk = (candidates.size() + workers - 1) / workers;
    for (size_t w = 0; w < workers; ++w) {
        size_t begin = w * chunk;
        size_t end = std::min(candidates.size(), begin + chunk);
        if (begin >= end) {
            break;
        }

        group.Spawn([this, &query, &candidates, &distances, &errors, w, begin, end]() {
            try {
                ScoreRange(query, candidates, begin, end, distances);
            } catch (...) {
                errors[w] = std::current_exception();
            }
        });
    }

    group.JoinAll();
    workers_used = group.Size();

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    return distances;
}

} // namespace trendsketch
