// File: src/search/pattern_search_service.hpp
#pragma once

#include "core/types.hpp"
#include "corpus/series_corpus_index.hpp"
#include "similarity/curve_distance.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace trendsketch {

/// Search configuration
struct SearchConfig {
    /// Points every curve is resampled to before scoring
    size_t resample_point_count{20};

    /// Maximum number of results to return
    size_t top_k{10};

    /// Strokes shorter than this are not searched
    size_t min_draw_points{5};

    /// match_quality = clamp(100 - distance * scale, 0, 100)
    float match_quality_scale{20.0f};

    /// Per-cell DTW cost
    LocalCost local_cost{LocalCost::ABSOLUTE};

    /// Scoring threads (1 = score on the calling thread)
    size_t worker_threads{1};

    /// Minimum eligible series before scoring fans out to workers
    size_t parallel_threshold{256};

    /// Default configuration
    static SearchConfig Default() {
        return SearchConfig{};
    }

    /// Top-K configuration
    static SearchConfig TopK(size_t k) {
        SearchConfig config;
        config.top_k = k;
        return config;
    }
};

/// Outcome of a search attempt
enum class SearchStatus {
    OK,                   ///< Corpus was scored (result may still be short)
    INSUFFICIENT_INPUT,   ///< Stroke below min_draw_points, nothing scored
    EMPTY_CORPUS,         ///< No series passed category and support filters
};

const char* ToString(SearchStatus status);

/// Search statistics
struct SearchStats {
    size_t series_considered{0};   ///< Series in the corpus
    size_t series_scored{0};       ///< Series that passed the filters
    size_t results_returned{0};
    float best_distance{0.0f};
    float worst_distance{0.0f};
    size_t workers_used{0};
    double elapsed_ms{0.0};
};

/// Full answer of SearchDetailed
struct SearchResponse {
    SearchStatus status{SearchStatus::OK};
    PatternKind kind{PatternKind::TREND};
    RankedMatches matches;
    SearchStats stats;
};

/// PatternSearchService - ranks corpus series by shape similarity to a stroke
///
/// The stroke is normalized in screen space and resampled once; every
/// eligible series is normalized as a value series, resampled to the same
/// point count and scored with the configured curve distance (DTW by
/// default). Results are ordered by ascending distance; equal distances
/// keep corpus insertion order.
///
/// The service holds no per-search state. Neither the stroke nor the
/// corpus is modified, so one service can serve concurrent callers.
class PatternSearchService {
public:
    /// Constructor with the default DTW distance
    /// @param config Search configuration
    /// @throws std::invalid_argument on an invalid configuration
    explicit PatternSearchService(const SearchConfig& config = SearchConfig::Default());

    /// Constructor with a custom distance
    /// @throws std::invalid_argument if distance is null or config is invalid
    PatternSearchService(const SearchConfig& config,
                         std::shared_ptr<const CurveDistance> distance);

    /// Search with the configured top-K
    /// @param stroke Screen-space stroke
    /// @param corpus Corpus to search
    /// @param category Category label or "All"
    /// @return Ranked matches, empty when nothing could be searched
    RankedMatches Search(const RawStroke& stroke,
                         const SeriesCorpusIndex& corpus,
                         const std::string& category = kAllCategories) const;

    /// Search with an explicit top-K
    RankedMatches Search(const RawStroke& stroke,
                         const SeriesCorpusIndex& corpus,
                         const std::string& category,
                         size_t top_k) const;

    /// Search returning status and statistics alongside the matches
    /// @param kind Pattern family chosen by the user, reported back unchanged
    SearchResponse SearchDetailed(const RawStroke& stroke,
                                  const SeriesCorpusIndex& corpus,
                                  const std::string& category,
                                  size_t top_k,
                                  PatternKind kind = PatternKind::TREND) const;

    /// Normalize and resample a stroke the way Search does
    Curve PrepareStroke(const RawStroke& stroke) const;

    /// Normalize and resample a series the way Search does
    Curve PrepareSeries(const TimeSeries& series) const;

    /// Presentation transform of a distance into 0..100
    static float MatchQuality(float distance, float scale);

    const SearchConfig& GetConfig() const { return config_; }
    std::shared_ptr<const CurveDistance> GetDistance() const { return distance_; }

private:
    SearchConfig config_;
    std::shared_ptr<const CurveDistance> distance_;

    /// Distance of every candidate to the query, in candidate order
    std::vector<float> ScoreAll(const Curve& query,
                                const std::vector<TimeSeries>& candidates,
                                size_t& workers_used) const;

    void ScoreRange(const Curve& query,
                    const std::vector<TimeSeries>& candidates,
                    size_t begin, size_t end,
                    std::vector<float>& distances) const;

    static void ValidateConfig(const SearchConfig& config);
};

} // namespace trendsketch
