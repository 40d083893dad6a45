/**
 * @file batch_runner.cpp
 * @brief BatchRunner implementation.
 */

#include "harness/batch_runner.hpp"

namespace sandbox_harness {

BatchRunner::BatchRunner(const Harness& harness, size_t max_concurrent)
    : harness_(harness) {
    if (max_concurrent == 0) max_concurrent = 1;

    workers_.reserve(max_concurrent);
    for (size_t i = 0; i < max_concurrent; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

BatchRunner::~BatchRunner() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    workers_.clear();  // joins
}

std::future<Result<ExecutionResult>> BatchRunner::submit(std::string payload,
                                                         ExecutionLimits limits) {
    std::promise<Result<ExecutionResult>> promise;
    auto future = promise.get_future();
    {
        std::lock_guard lock(queue_mutex_);
        queue_.push(PendingRun{std::move(payload), std::move(limits), std::move(promise)});
    }
    queue_cv_.notify_one();
    return future;
}

void BatchRunner::worker_loop(std::stop_token stop) {
    while (true) {
        PendingRun run;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !queue_.empty(); });

            // Drain what was queued before shutdown, then exit.
            if (queue_.empty()) {
                if (stop.stop_requested()) return;
                continue;
            }

            run = std::move(queue_.front());
            queue_.pop();
        }

        ++active_runs_;
        try {
            run.promise.set_value(harness_.run(run.payload, run.limits));
        } catch (...) {
            run.promise.set_exception(std::current_exception());
        }
        --active_runs_;
    }
}

size_t BatchRunner::active_count() const noexcept {
    return active_runs_.load();
}

size_t BatchRunner::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return queue_.size();
}

size_t BatchRunner::worker_count() const noexcept {
    return workers_.size();
}

}  // namespace sandbox_harness
