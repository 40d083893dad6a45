/**
 * @file harness.hpp
 * @brief Caller-facing entry point: run one untrusted binary and measure it.
 *
 * Pipeline per run:
 *   validate → stage payload → translate limits → invoke backend
 *            → extract telemetry → assemble result
 *
 * The staged payload is owned by a scope inside run(), so it is removed on
 * every exit path, including timeouts, launch failures and exceptions.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/backend.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace sandbox_harness {

class Harness {
public:
    /**
     * @param config   executor, isolation, staging and limit settings
     * @param backend  runtime that actually executes invocations
     * @param logger   optional; nothing is logged when null
     */
    Harness(Config config, std::unique_ptr<IExecutorBackend> backend, Logger* logger = nullptr);

    // Non-copyable
    Harness(const Harness&) = delete;
    Harness& operator=(const Harness&) = delete;

    /**
     * @brief Execute @p payload under @p limits.
     *
     * Safe to call concurrently from several threads. Fails with
     * InvalidLimits, Staging, Launch or Timeout; a non-zero guest exit code
     * and missing telemetry are reported inside the ExecutionResult.
     */
    Result<ExecutionResult> run(std::string_view payload, const ExecutionLimits& limits) const;

    /// Execute with the configured default limits and empty stdin.
    Result<ExecutionResult> run(std::string_view payload) const;

    /// Reject limits and payloads before anything touches the filesystem.
    Result<void> validate(std::string_view payload, const ExecutionLimits& limits) const;

    /// Backend health probe.
    [[nodiscard]] bool healthy() const;

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    void log(LogLevel level, const std::string& message) const;

    Config config_;
    std::unique_ptr<IExecutorBackend> backend_;
    Logger* logger_;
};

}  // namespace sandbox_harness
