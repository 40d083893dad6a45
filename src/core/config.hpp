/**
 * @file config.hpp
 * @brief Harness configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace sandbox_harness {

struct ExecutorSettings {
    std::string engine = "docker";              ///< Container engine CLI
    std::string image = "sandbox";              ///< Executor image
    std::string binary_mount = "/work/binary";  ///< In-sandbox payload path
    std::string container_prefix = "sbx";
};

struct LimitSettings {
    uint64_t instruction_limit = ExecutionLimits::DEFAULT_INSTRUCTION_LIMIT;
    uint32_t memory_limit_mb = ExecutionLimits::DEFAULT_MEMORY_LIMIT_MB;
    double timeout_sec = ExecutionLimits::DEFAULT_TIMEOUT_SECONDS;
    uint64_t max_instruction_limit = 1'000'000'000'000;
    double max_timeout_sec = 86'400.0;
    uint64_t max_binary_size = 100ULL * 1024 * 1024;
};

struct IsolationSettings {
    uint32_t tmp_size_mb = 64;   ///< exec-permitted scratch at /tmp
    uint32_t var_size_mb = 16;   ///< non-exec scratch at /var
};

struct StagingSettings {
    std::filesystem::path dir;   ///< empty = system temp directory
};

struct BatchSettings {
    static constexpr uint32_t MAX_CONCURRENT = 256;

    uint32_t max_concurrent = 4;   ///< 1..MAX_CONCURRENT
};

struct LoggingSettings {
    std::filesystem::path log_dir;   ///< empty = stderr
    std::string log_level = "info";
};

/**
 * @brief Top-level harness configuration.
 */
struct Config {
    ExecutorSettings executor;
    LimitSettings limits;
    IsolationSettings isolation;
    StagingSettings staging;
    BatchSettings batch;
    LoggingSettings logging;

    /// Limits a caller gets when it supplies none.
    [[nodiscard]] ExecutionLimits default_limits() const;
};

/**
 * @brief Load configuration from a TOML file. Missing keys keep their defaults.
 *
 * Fails with ErrorKind::Config when the file is missing or unparseable, or
 * when a key has the wrong type or a value outside its range (negative,
 * zero where a positive value is needed, or too large for its field).
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace sandbox_harness
