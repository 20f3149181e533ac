// File: src/corpus/series_corpus_index.cpp
#include "corpus/series_corpus_index.hpp"
#include <algorithm>
#include <unordered_set>

namespace trendsketch {

double SupportPolicy::RequiredPeriods(size_t period_count) const {
    return std::min(static_cast<double>(min_periods),
                    static_cast<double>(period_count) * fraction);
}

SeriesCorpusIndex::SeriesCorpusIndex(std::vector<std::string> period_keys,
                                     std::vector<TimeSeries> series,
                                     SupportPolicy policy)
    : period_keys_(std::move(period_keys)),
      series_(std::move(series)),
      policy_(policy) {
    Validate();

    key_index_.reserve(series_.size());
    for (size_t i = 0; i < series_.size(); ++i) {
        key_index_.emplace(series_[i].entity_key, i);
    }
}

void SeriesCorpusIndex::Validate() const {
    const size_t period_count = period_keys_.size();
    std::unordered_set<std::string> seen;

    for (const auto& series : series_) {
        if (!seen.insert(series.entity_key).second) {
            throw ContractViolation("Duplicate entity key in corpus: " + series.entity_key,
                                    series.entity_key);
        }

        if (series.samples.size() != period_count) {
            throw ContractViolation(
                "Series '" + series.entity_key + "' has " +
                std::to_string(series.samples.size()) + " samples, expected " +
                std::to_string(period_count),
                series.entity_key);
        }

        for (size_t i = 0; i < series.samples.size(); ++i) {
            if (series.samples[i].period_index != i) {
                throw ContractViolation(
                    "Series '" + series.entity_key + "' is misaligned at period " +
                    std::to_string(i),
                    series.entity_key);
            }
        }
    }
}

std::vector<TimeSeries> SeriesCorpusIndex::FilterByCategory(const std::string& category) const {
    if (category == kAllCategories) {
        return series_;
    }

    std::vector<TimeSeries> result;
    for (const auto& series : series_) {
        if (series.category == category) {
            result.push_back(series);
        }
    }
    return result;
}

bool SeriesCorpusIndex::MinimumSupportFilter(const TimeSeries& series, size_t period_count) {
    return MinimumSupportFilter(series, period_count, SupportPolicy{});
}

bool SeriesCorpusIndex::MinimumSupportFilter(const TimeSeries& series, size_t period_count,
                                             const SupportPolicy& policy) {
    return static_cast<double>(series.NonZeroCount()) >= policy.RequiredPeriods(period_count);
}

std::vector<TimeSeries> SeriesCorpusIndex::EligibleSeries(const std::string& category) const {
    std::vector<TimeSeries> result;
    const size_t period_count = GetPeriodCount();

    for (const auto& series : series_) {
        if (category != kAllCategories && series.category != category) {
            continue;
        }
        if (!MinimumSupportFilter(series, period_count, policy_)) {
            continue;
        }
        result.push_back(series);
    }
    return result;
}

std::vector<std::string> SeriesCorpusIndex::GetCategories() const {
    std::vector<std::string> categories{kAllCategories};
    std::unordered_set<std::string> seen;

    for (const auto& series : series_) {
        if (series.category.empty()) {
            continue;
        }
        if (seen.insert(series.category).second) {
            categories.push_back(series.category);
        }
    }
    return categories;
}

std::optional<TimeSeries> SeriesCorpusIndex::FindByKey(const std::string& entity_key) const {
    auto it = key_index_.find(entity_key);
    if (it == key_index_.end()) {
        return std::nullopt;
    }
    return series_[it->second];
}

} // namespace trendsketch
