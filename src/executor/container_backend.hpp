/**
 * @file container_backend.hpp
 * @brief Executor backend driving a docker-compatible engine CLI.
 */

#pragma once

#include "core/logger.hpp"
#include "executor/backend.hpp"

#include <chrono>
#include <string>

namespace sandbox_harness {

/**
 * @brief Runs invocations as `<engine> run --rm -i ... <image>`.
 *
 * Killing the engine client on timeout does not stop the container it
 * started, so a timed-out run is followed by `<engine> rm -f <name>`.
 */
class ContainerBackend : public IExecutorBackend {
public:
    static constexpr std::chrono::milliseconds DEFAULT_CLEANUP_TIMEOUT{10'000};
    static constexpr std::chrono::milliseconds PROBE_TIMEOUT{10'000};

    explicit ContainerBackend(std::string engine,
                              Logger* logger = nullptr,
                              std::chrono::milliseconds cleanup_timeout = DEFAULT_CLEANUP_TIMEOUT);

    Result<ProcessOutput> invoke(const InvocationSpec& spec,
                                 std::string_view stdin_bytes,
                                 std::chrono::milliseconds timeout) override;

    /// `<engine> info` exits 0.
    bool available() override;

    [[nodiscard]] std::string_view name() const noexcept override { return engine_; }

private:
    void remove_container(const std::string& container_name);

    std::string engine_;
    Logger* logger_;
    std::chrono::milliseconds cleanup_timeout_;
};

}  // namespace sandbox_harness
