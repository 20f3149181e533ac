// File: src/corpus/corpus_registry.cpp
#include "corpus/corpus_registry.hpp"

namespace trendsketch {

CorpusRegistry::CorpusRegistry(std::shared_ptr<const SeriesCorpusIndex> index)
    : current_(std::move(index)) {
    if (current_) {
        generation_ = 1;
    }
}

std::shared_ptr<const SeriesCorpusIndex> CorpusRegistry::Current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::shared_ptr<const SeriesCorpusIndex> CorpusRegistry::Swap(
        std::shared_ptr<const SeriesCorpusIndex> index) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.swap(index);
    ++generation_;
    return index;
}

uint64_t CorpusRegistry::GetGeneration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

} // namespace trendsketch
