// File: src/corpus/corpus_registry.hpp
#pragma once

#include "corpus/series_corpus_index.hpp"
#include <cstdint>
#include <memory>
#include <mutex>

namespace trendsketch {

/// CorpusRegistry - holds the index currently used for searches
///
/// An index is never modified after it is published. Loading a new
/// dataset builds a fresh index and swaps the pointer; searches that
/// already hold the previous index keep it alive until they finish.
class CorpusRegistry {
public:
    CorpusRegistry() = default;

    /// Construct with an initial index
    explicit CorpusRegistry(std::shared_ptr<const SeriesCorpusIndex> index);

    // Prevent copying (owns a mutex)
    CorpusRegistry(const CorpusRegistry&) = delete;
    CorpusRegistry& operator=(const CorpusRegistry&) = delete;

    /// Snapshot of the current index (may be null before the first load)
    std::shared_ptr<const SeriesCorpusIndex> Current() const;

    /// Publish a new index
    /// @return The index that was replaced
    std::shared_ptr<const SeriesCorpusIndex> Swap(std::shared_ptr<const SeriesCorpusIndex> index);

    /// Number of successful swaps
    uint64_t GetGeneration() const;

    bool HasCorpus() const { return Current() != nullptr; }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const SeriesCorpusIndex> current_;
    uint64_t generation_{0};
};

} // namespace trendsketch
