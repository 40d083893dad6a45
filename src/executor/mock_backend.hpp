/**
 * @file mock_backend.hpp
 * @brief Scripted executor backend for tests and dry runs.
 */

#pragma once

#include "executor/backend.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sandbox_harness {

/**
 * @brief One recorded call to MockBackend::invoke().
 */
struct RecordedInvocation {
    InvocationSpec spec;
    std::string stdin_bytes;
    std::chrono::milliseconds timeout{0};
    bool payload_existed{false};   ///< staged file was on disk during the call
};

/**
 * @brief Returns predetermined outputs instead of launching anything.
 *
 * Responses are consumed in push order; once the queue is empty the static
 * response is returned. A handler, when set, takes precedence over both.
 * Thread-safe: concurrent harness runs may share one MockBackend.
 */
class MockBackend : public IExecutorBackend {
public:
    using Handler = std::function<Result<ProcessOutput>(const InvocationSpec&, std::string_view)>;

    MockBackend();

    Result<ProcessOutput> invoke(const InvocationSpec& spec,
                                 std::string_view stdin_bytes,
                                 std::chrono::milliseconds timeout) override;
    bool available() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

    // Test helpers: configure what invoke() returns
    void push_response(Result<ProcessOutput> response);
    void set_static_response(ProcessOutput output);
    void set_handler(Handler handler);
    void set_available(bool available);

    [[nodiscard]] std::vector<RecordedInvocation> invocations() const;
    [[nodiscard]] size_t invocation_count() const;

private:
    mutable std::mutex mutex_;
    std::deque<Result<ProcessOutput>> responses_;
    ProcessOutput static_response_;
    Handler handler_;
    bool available_{true};
    std::vector<RecordedInvocation> invocations_;
};

}  // namespace sandbox_harness
