/**
 * @file backend.hpp
 * @brief IExecutorBackend — the swap point between the harness and an isolated runtime.
 *
 * A backend receives a fully translated InvocationSpec and returns the raw
 * exit code and byte streams. It never looks inside stderr; splitting the
 * telemetry epilogue off is the extractor's job.
 */

#pragma once

#include "core/result.hpp"
#include "executor/limit_translator.hpp"
#include "executor/process.hpp"

#include <chrono>
#include <string_view>

namespace sandbox_harness {

class IExecutorBackend {
public:
    virtual ~IExecutorBackend() = default;

    /**
     * @brief Run one invocation to completion or @p timeout.
     *
     * On ErrorKind::Timeout every process and container belonging to the
     * invocation must already be gone when this returns.
     */
    virtual Result<ProcessOutput> invoke(const InvocationSpec& spec,
                                         std::string_view stdin_bytes,
                                         std::chrono::milliseconds timeout) = 0;

    /// Cheap health probe: can invocations be launched at all?
    virtual bool available() = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace sandbox_harness
