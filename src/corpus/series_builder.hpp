// File: src/corpus/series_builder.hpp
#pragma once

#include "core/types.hpp"
#include "corpus/series_corpus_index.hpp"
#include <memory>
#include <string>
#include <vector>

namespace trendsketch {

/// Aligned series ready to be indexed
struct PreparedCorpus {
    std::vector<std::string> period_keys;   // "YYYY-MM", chronological
    std::vector<TimeSeries> series;         // first-appearance order
};

/// SeriesBuilder - turns transaction records into monthly series
///
/// Records are grouped by entity and calendar month. Every entity gets a
/// value for every month seen anywhere in the input (0 when it had no
/// orders that month), so all series share one period axis.
class SeriesBuilder {
public:
    /// Builder configuration
    struct Config {
        /// Quantity aggregated per period
        ValueMeasure measure{ValueMeasure::SALES};

        /// Category assigned to records without one
        std::string unknown_category{"Unknown"};
    };

    SeriesBuilder() = default;
    explicit SeriesBuilder(const Config& config) : config_(config) {}

    /// Group records into aligned series
    /// Records missing an order date or entity are skipped.
    /// @throws std::invalid_argument on a malformed order date
    PreparedCorpus Build(const std::vector<TransactionRecord>& records) const;

    /// Build and index in one step
    std::shared_ptr<const SeriesCorpusIndex> BuildIndex(
        const std::vector<TransactionRecord>& records,
        const SupportPolicy& policy = SupportPolicy{}) const;

    /// Month key ("YYYY-MM") of an ISO date string
    /// @throws std::invalid_argument if the prefix is not a valid year-month
    static std::string MonthKey(const std::string& order_date);

    /// Value contributed by one record under a measure
    static double RecordValue(const TransactionRecord& record, ValueMeasure measure);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace trendsketch
