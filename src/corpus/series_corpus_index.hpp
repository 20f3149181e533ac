// File: src/corpus/series_corpus_index.hpp
#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trendsketch {

/// Category name that disables category filtering
inline constexpr const char* kAllCategories = "All";

/// Minimum support thresholds for searchable series
///
/// A series is eligible when its number of non-zero periods is at least
/// min(min_periods, period_count * fraction).
struct SupportPolicy {
    size_t min_periods{5};
    double fraction{0.5};

    /// Required non-zero period count for a corpus of period_count periods
    double RequiredPeriods(size_t period_count) const;
};

/// SeriesCorpusIndex - immutable collection of prepared time series
///
/// Built once per dataset from aligned series: every series carries one
/// sample per period key, in period order. All queries are read-only, so
/// a built index can be shared between concurrent searches.
class SeriesCorpusIndex {
public:
    /// Build an index
    /// @param period_keys Corpus-wide period keys in chronological order
    /// @param series Prepared series (insertion order is preserved)
    /// @param policy Minimum support thresholds
    /// @throws ContractViolation if a series is misaligned with the period
    ///         axis or an entity key appears twice
    SeriesCorpusIndex(std::vector<std::string> period_keys,
                      std::vector<TimeSeries> series,
                      SupportPolicy policy = SupportPolicy{});

    /// Series whose category equals the given label ("All" = every series)
    std::vector<TimeSeries> FilterByCategory(const std::string& category) const;

    /// Minimum support rule with the default policy
    static bool MinimumSupportFilter(const TimeSeries& series, size_t period_count);

    /// Minimum support rule with an explicit policy
    static bool MinimumSupportFilter(const TimeSeries& series, size_t period_count,
                                     const SupportPolicy& policy);

    /// Category filter followed by this index's support filter
    std::vector<TimeSeries> EligibleSeries(const std::string& category) const;

    /// "All" followed by distinct categories in first-seen order
    std::vector<std::string> GetCategories() const;

    /// Look up a series by entity key
    std::optional<TimeSeries> FindByKey(const std::string& entity_key) const;

    const std::vector<std::string>& GetPeriodKeys() const { return period_keys_; }
    size_t GetPeriodCount() const { return period_keys_.size(); }
    const std::vector<TimeSeries>& GetSeries() const { return series_; }
    const SupportPolicy& GetSupportPolicy() const { return policy_; }

    size_t Size() const { return series_.size(); }
    bool Empty() const { return series_.empty(); }

private:
    std::vector<std::string> period_keys_;
    std::vector<TimeSeries> series_;
    SupportPolicy policy_;

    // entity key -> position in series_
    std::unordered_map<std::string, size_t> key_index_;

    void Validate() const;
};

} // namespace trendsketch
