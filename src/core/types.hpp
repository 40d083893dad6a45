/**
 * @file types.hpp
 * @brief Vocabulary types shared by every SandboxHarness module.
 *
 * ExecutionLimits goes in, ExecutionResult comes out. TelemetryRecord is the
 * typed form of the epilogue the executor appends to its stderr. All types
 * are plain values with every field explicitly defaulted, so the all-default
 * telemetry fallback is simply TelemetryRecord{}.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>

namespace sandbox_harness {

// ─────────────────────────────────────────────
// Aliases
// ─────────────────────────────────────────────

/// Raw byte sequence. std::string is used as a byte container; no encoding assumed.
using Bytes = std::string;
using WallTime = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Execution Limits
// ─────────────────────────────────────────────

/**
 * @brief Resource ceilings for one run.
 *
 * Passed by const reference into Harness::run and never modified there.
 */
struct ExecutionLimits {
    static constexpr uint64_t DEFAULT_INSTRUCTION_LIMIT = 10'000'000;
    static constexpr uint32_t DEFAULT_MEMORY_LIMIT_MB = 256;
    static constexpr double DEFAULT_TIMEOUT_SECONDS = 30.0;

    uint64_t instruction_limit{DEFAULT_INSTRUCTION_LIMIT};
    uint32_t memory_limit_mb{DEFAULT_MEMORY_LIMIT_MB};
    double timeout_seconds{DEFAULT_TIMEOUT_SECONDS};
    Bytes stdin_bytes;

    /// Truncated to whole milliseconds; saturates at milliseconds::max().
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept {
        const double ms = timeout_seconds * 1000.0;
        if (!(ms > 0.0)) return std::chrono::milliseconds{0};
        if (ms >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return std::chrono::milliseconds::max();
        }
        return std::chrono::milliseconds{static_cast<int64_t>(ms)};
    }
};

// ─────────────────────────────────────────────
// Telemetry
// ─────────────────────────────────────────────

using SyscallBreakdown = std::map<std::string, uint64_t>;

/**
 * @brief Measurements reported by the executor for one guest run.
 *
 * Field names in comments are the executor's wire names.
 */
struct TelemetryRecord {
    uint64_t instructions{0};          ///< instructions (required on the wire)
    uint64_t memory_peak_kb{0};        ///< memory_peak_kb (required)
    bool limit_reached{false};         ///< limit_reached (required)

    uint64_t syscalls{0};              ///< syscalls
    uint64_t syscall_cost{0};          ///< syscall_cost
    std::optional<SyscallBreakdown> syscall_breakdown;  ///< syscall_breakdown

    // Executor process footprint (reference only, not the guest)
    uint64_t memory_rss_kb{0};
    uint64_t memory_hwm_kb{0};
    uint64_t memory_data_kb{0};
    uint64_t memory_stack_kb{0};

    uint64_t io_read_bytes{0};
    uint64_t io_write_bytes{0};

    // Guest allocations
    uint64_t guest_mmap_bytes{0};
    uint64_t guest_mmap_peak{0};
    uint64_t guest_heap_bytes{0};

    bool operator==(const TelemetryRecord&) const = default;
};

// ─────────────────────────────────────────────
// Execution Result
// ─────────────────────────────────────────────

/**
 * @brief Outcome of one completed run.
 *
 * stderr_bytes never contains the telemetry epilogue. telemetry is always
 * fully populated; telemetry_present tells whether it came from the executor
 * or is the all-default fallback.
 */
struct ExecutionResult {
    int exit_code{0};
    Bytes stdout_bytes;
    Bytes stderr_bytes;
    TelemetryRecord telemetry;
    bool telemetry_present{false};
    WallTime wall_time{0};
};

}  // namespace sandbox_harness
