/**
 * @file batch_runner.hpp
 * @brief Bounded pool of std::jthread workers feeding runs through one Harness.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "harness/harness.hpp"

#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace sandbox_harness {

/**
 * @brief Runs at most max_concurrent payloads at a time.
 *
 * Each submission stages its own payload file, so concurrent runs never
 * share a binary or stdin. The destructor finishes everything already
 * queued before joining the workers.
 */
class BatchRunner {
public:
    BatchRunner(const Harness& harness, size_t max_concurrent);
    ~BatchRunner();

    // Non-copyable, non-movable
    BatchRunner(const BatchRunner&) = delete;
    BatchRunner& operator=(const BatchRunner&) = delete;

    /// Queue one run; the future resolves when it completes or fails.
    std::future<Result<ExecutionResult>> submit(std::string payload, ExecutionLimits limits);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t worker_count() const noexcept;

private:
    struct PendingRun {
        std::string payload;
        ExecutionLimits limits;
        std::promise<Result<ExecutionResult>> promise;
    };

    void worker_loop(std::stop_token stop);

    const Harness& harness_;
    std::queue<PendingRun> queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_runs_{0};
    std::vector<std::jthread> workers_;   // last: joined before the queue is destroyed
};

}  // namespace sandbox_harness
