// File: src/search/worker_group.hpp
#pragma once

#include <thread>
#include <utility>
#include <vector>

namespace trendsketch {

/// Owns a set of worker threads and joins every started one on destruction
///
/// If Spawn throws (thread creation failed), the threads already running are
/// still joined while the exception unwinds.
class WorkerGroup {
public:
    WorkerGroup() = default;
    explicit WorkerGroup(size_t capacity) { threads_.reserve(capacity); }

    ~WorkerGroup() { JoinAll(); }

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    /// Start a worker running task
    /// @throws std::system_error if the thread cannot be created
    template <typename Task>
    void Spawn(Task&& task) {
        threads_.emplace_back(std::forward<Task>(task));
    }

    /// Wait for every started worker
    void JoinAll() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    size_t Size() const { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

} // namespace trendsketch
