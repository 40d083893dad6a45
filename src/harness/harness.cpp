/**
 * @file harness.cpp
 * @brief Harness::run() — orchestration of stager, translator, backend and extractor.
 */

#include "harness/harness.hpp"

#include "executor/limit_translator.hpp"
#include "harness/result_assembler.hpp"
#include "staging/staged_payload.hpp"
#include "telemetry/telemetry_extractor.hpp"

#include <cmath>
#include <random>

namespace sandbox_harness {

namespace {

constexpr std::string_view COMPONENT = "harness";

/// Seeded per call so no state is shared between runs.
std::string fresh_container_name(const std::string& prefix) {
    std::random_device device;
    std::mt19937_64 rng{(static_cast<uint64_t>(device()) << 32) ^ device()};
    return make_container_name(prefix, rng);
}

}  // anonymous namespace

Harness::Harness(Config config, std::unique_ptr<IExecutorBackend> backend, Logger* logger)
    : config_(std::move(config)), backend_(std::move(backend)), logger_(logger) {}

void Harness::log(LogLevel level, const std::string& message) const {
    if (logger_) logger_->log(level, COMPONENT, message);
}

Result<void> Harness::validate(std::string_view payload, const ExecutionLimits& limits) const {
    if (payload.empty()) {
        return HarnessError{ErrorKind::InvalidLimits, "Payload is empty"};
    }
    if (payload.size() > config_.limits.max_binary_size) {
        return HarnessError{ErrorKind::InvalidLimits,
                            "Binary too large: " + std::to_string(payload.size())
                            + " bytes (max " + std::to_string(config_.limits.max_binary_size) + ")"};
    }
    if (limits.instruction_limit == 0) {
        return HarnessError{ErrorKind::InvalidLimits, "Instruction limit must be positive"};
    }
    if (limits.instruction_limit > config_.limits.max_instruction_limit) {
        return HarnessError{ErrorKind::InvalidLimits,
                            "Instruction limit too high: " + std::to_string(limits.instruction_limit)
                            + " (max " + std::to_string(config_.limits.max_instruction_limit) + ")"};
    }
    if (limits.memory_limit_mb == 0) {
        return HarnessError{ErrorKind::InvalidLimits, "Memory limit must be positive"};
    }
    if (!std::isfinite(limits.timeout_seconds) || limits.timeout_seconds <= 0.0
        || limits.timeout().count() == 0) {
        return HarnessError{ErrorKind::InvalidLimits, "Timeout must be a positive number of seconds"};
    }
    if (limits.timeout_seconds > config_.limits.max_timeout_sec) {
        return HarnessError{ErrorKind::InvalidLimits,
                            "Timeout too long: " + std::to_string(limits.timeout_seconds)
                            + " s (max " + std::to_string(config_.limits.max_timeout_sec) + " s)"};
    }
    return {};
}

Result<ExecutionResult> Harness::run(std::string_view payload) const {
    return run(payload, config_.default_limits());
}

Result<ExecutionResult> Harness::run(std::string_view payload, const ExecutionLimits& limits) const {
    if (auto valid = validate(payload, limits); !valid) {
        log(LogLevel::Warn, "Rejected run: " + valid.error().message);
        return valid.error();
    }

    auto staged = StagedPayload::create(payload, config_.staging.dir);
    if (!staged) {
        log(LogLevel::Error, staged.error().message);
        return staged.error();
    }
    log(LogLevel::Debug, "Staged " + std::to_string(staged->size()) + " bytes at "
                         + staged->path().string());

    auto spec = translate_limits(limits, staged->path(), config_.executor, config_.isolation,
                                 fresh_container_name(config_.executor.container_prefix));

    log(LogLevel::Info, "Launching " + spec.container_name + " via "
                        + std::string{backend_->name()}
                        + " (limit " + std::to_string(limits.instruction_limit)
                        + " instructions, " + std::to_string(limits.memory_limit_mb) + " MB, "
                        + std::to_string(limits.timeout().count()) + " ms)");

    auto raw = backend_->invoke(spec, limits.stdin_bytes, limits.timeout());
    if (!raw) {
        const auto& err = raw.error();
        log(err.kind == ErrorKind::Timeout ? LogLevel::Warn : LogLevel::Error,
            spec.container_name + ": " + err.message);
        return err;
    }

    auto extraction = extract_telemetry(raw->stderr_bytes);
    if (!extraction.found) {
        log(LogLevel::Warn, spec.container_name
                            + ": no usable telemetry record in executor stderr, using defaults");
    }

    auto result = assemble_result(raw->exit_code, std::move(raw->stdout_bytes),
                                  std::move(extraction), raw->elapsed);

    log(LogLevel::Info, spec.container_name + " finished: exit " + std::to_string(result.exit_code)
                        + ", " + std::to_string(result.telemetry.instructions) + " instructions"
                        + (result.telemetry.limit_reached ? " (limit reached)" : "")
                        + ", " + std::to_string(result.wall_time.count()) + " ms");
    return result;
}

bool Harness::healthy() const {
    return backend_->available();
}

}  // namespace sandbox_harness
