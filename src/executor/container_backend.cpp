/**
 * @file container_backend.cpp
 * @brief ContainerBackend — engine CLI invocation and post-timeout container removal.
 */

#include "executor/container_backend.hpp"

namespace sandbox_harness {

namespace {
constexpr std::string_view COMPONENT = "container";
}

ContainerBackend::ContainerBackend(std::string engine,
                                   Logger* logger,
                                   std::chrono::milliseconds cleanup_timeout)
    : engine_(std::move(engine)), logger_(logger), cleanup_timeout_(cleanup_timeout) {}

Result<ProcessOutput> ContainerBackend::invoke(const InvocationSpec& spec,
                                               std::string_view stdin_bytes,
                                               std::chrono::milliseconds timeout) {
    auto argv = to_engine_argv(engine_, spec);
    auto result = run_process(argv, stdin_bytes, timeout);

    if (!result && result.error().kind == ErrorKind::Timeout && !spec.container_name.empty()) {
        remove_container(spec.container_name);
    }
    return result;
}

bool ContainerBackend::available() {
    auto result = run_process({engine_, "info"}, {}, PROBE_TIMEOUT);
    if (!result) {
        if (logger_) logger_->warn(COMPONENT, engine_ + " probe failed: " + result.error().message);
        return false;
    }
    return result->exit_code == 0;
}

void ContainerBackend::remove_container(const std::string& container_name) {
    auto result = run_process({engine_, "rm", "-f", container_name}, {}, cleanup_timeout_);
    if (!result) {
        if (logger_) {
            logger_->warn(COMPONENT, "Removing container " + container_name
                          + " failed: " + result.error().message);
        }
        return;
    }
    if (result->exit_code != 0) {
        // "No such container" is expected when the client died before creating it.
        if (logger_) {
            logger_->warn(COMPONENT, "Removing container " + container_name + " exited "
                          + std::to_string(result->exit_code) + ": " + result->stderr_bytes);
        }
        return;
    }
    if (logger_) logger_->debug(COMPONENT, "Removed container " + container_name);
}

}  // namespace sandbox_harness
