/**
 * @file mock_backend.cpp
 * @brief MockBackend — predetermined executor outputs.
 */

#include "executor/mock_backend.hpp"

#include <filesystem>

namespace sandbox_harness {

MockBackend::MockBackend() {
    static_response_.exit_code = 0;
    static_response_.stderr_bytes =
        "\n{\"instructions\": 1000, \"memory_peak_kb\": 1024, \"limit_reached\": false}\n";
}

Result<ProcessOutput> MockBackend::invoke(const InvocationSpec& spec,
                                          std::string_view stdin_bytes,
                                          std::chrono::milliseconds timeout) {
    Handler handler;
    {
        std::lock_guard lock(mutex_);
        std::error_code ec;
        invocations_.push_back(RecordedInvocation{
            .spec = spec,
            .stdin_bytes = std::string{stdin_bytes},
            .timeout = timeout,
            .payload_existed = std::filesystem::exists(spec.payload_mount.source, ec),
        });

        if (!handler_ && !responses_.empty()) {
            auto response = std::move(responses_.front());
            responses_.pop_front();
            return response;
        }
        if (!handler_) return static_response_;
        handler = handler_;
    }
    return handler(spec, stdin_bytes);
}

bool MockBackend::available() {
    std::lock_guard lock(mutex_);
    return available_;
}

void MockBackend::push_response(Result<ProcessOutput> response) {
    std::lock_guard lock(mutex_);
    responses_.push_back(std::move(response));
}

void MockBackend::set_static_response(ProcessOutput output) {
    std::lock_guard lock(mutex_);
    static_response_ = std::move(output);
}

void MockBackend::set_handler(Handler handler) {
    std::lock_guard lock(mutex_);
    handler_ = std::move(handler);
}

void MockBackend::set_available(bool available) {
    std::lock_guard lock(mutex_);
    available_ = available;
}

std::vector<RecordedInvocation> MockBackend::invocations() const {
    std::lock_guard lock(mutex_);
    return invocations_;
}

size_t MockBackend::invocation_count() const {
    std::lock_guard lock(mutex_);
    return invocations_.size();
}

}  // namespace sandbox_harness
