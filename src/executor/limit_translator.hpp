/**
 * @file limit_translator.hpp
 * @brief Pure mapping from ExecutionLimits to executor invocation parameters.
 *
 * translate_limits() decides *what* the executor is told; to_engine_argv()
 * decides *how* that is spelled for a docker-compatible engine CLI. Both are
 * side-effect free so the isolation defaults can be asserted in unit tests.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace sandbox_harness {

/**
 * @brief A size-bounded tmpfs scratch mount inside the sandbox.
 */
struct ScratchMount {
    std::string target;
    uint32_t size_mb{0};
    bool executable{false};

    bool operator==(const ScratchMount&) const = default;
};

/**
 * @brief Read-only bind of a host file into the sandbox.
 */
struct BindMount {
    std::filesystem::path source;
    std::string target;
    bool read_only{true};

    bool operator==(const BindMount&) const = default;
};

/**
 * @brief Everything the executor is told about one run.
 */
struct InvocationSpec {
    std::string image;
    std::string container_name;

    bool network_disabled{true};
    bool read_only_root{true};
    uint32_t memory_limit_mb{0};
    uint32_t memory_swap_limit_mb{0};   ///< equal to memory_limit_mb: no swap headroom

    std::vector<ScratchMount> scratch_mounts;
    std::vector<std::pair<std::string, std::string>> environment;
    BindMount payload_mount;
};

/// Environment variable carrying the instruction ceiling to the executor.
inline constexpr const char* INSTRUCTION_LIMIT_ENV = "LIMIT";

/**
 * @brief Translate @p limits into an invocation for the payload at @p payload_path.
 */
[[nodiscard]] InvocationSpec translate_limits(const ExecutionLimits& limits,
                                              const std::filesystem::path& payload_path,
                                              const ExecutorSettings& executor,
                                              const IsolationSettings& isolation,
                                              std::string container_name);

/**
 * @brief Render @p spec as a docker-compatible `run` command line.
 *
 * argv[0] is @p engine; the image is the last element.
 */
[[nodiscard]] std::vector<std::string> to_engine_argv(const std::string& engine,
                                                      const InvocationSpec& spec);

/**
 * @brief Fresh container name: <prefix>-<pid>-<16 hex digits>.
 *
 * Draws from @p rng, so callers own the randomness; no shared counter.
 */
[[nodiscard]] std::string make_container_name(const std::string& prefix, std::mt19937_64& rng);

}  // namespace sandbox_harness
