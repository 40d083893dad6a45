/**
 * @file limit_translator.cpp
 * @brief translate_limits() and the docker-style argv rendering.
 */

#include "executor/limit_translator.hpp"

#include <cstdio>
#include <unistd.h>

namespace sandbox_harness {

InvocationSpec translate_limits(const ExecutionLimits& limits,
                                const std::filesystem::path& payload_path,
                                const ExecutorSettings& executor,
                                const IsolationSettings& isolation,
                                std::string container_name) {
    InvocationSpec spec;
    spec.image = executor.image;
    spec.container_name = std::move(container_name);

    // Fixed isolation defaults; callers cannot relax these.
    spec.network_disabled = true;
    spec.read_only_root = true;
    spec.scratch_mounts = {
        ScratchMount{.target = "/tmp", .size_mb = isolation.tmp_size_mb, .executable = true},
        ScratchMount{.target = "/var", .size_mb = isolation.var_size_mb, .executable = false},
    };

    spec.memory_limit_mb = limits.memory_limit_mb;
    spec.memory_swap_limit_mb = limits.memory_limit_mb;

    spec.environment.emplace_back(INSTRUCTION_LIMIT_ENV, std::to_string(limits.instruction_limit));

    spec.payload_mount = BindMount{
        .source = payload_path,
        .target = executor.binary_mount,
        .read_only = true,
    };
    return spec;
}

std::vector<std::string> to_engine_argv(const std::string& engine,
                                        const InvocationSpec& spec) {
    std::vector<std::string> argv{
        engine,
        "run",
        "--rm",
        "-i",
    };

    if (!spec.container_name.empty()) {
        argv.push_back("--name=" + spec.container_name);
    }

    argv.push_back("--memory=" + std::to_string(spec.memory_limit_mb) + "m");
    argv.push_back("--memory-swap=" + std::to_string(spec.memory_swap_limit_mb) + "m");

    if (spec.network_disabled) argv.emplace_back("--network=none");
    if (spec.read_only_root) argv.emplace_back("--read-only");

    for (const auto& mount : spec.scratch_mounts) {
        std::string opts = mount.executable ? "rw,exec,nosuid" : "rw,nosuid";
        argv.push_back("--tmpfs=" + mount.target + ":" + opts
                       + ",size=" + std::to_string(mount.size_mb) + "m");
    }

    for (const auto& [key, value] : spec.environment) {
        argv.emplace_back("-e");
        argv.push_back(key + "=" + value);
    }

    argv.emplace_back("-v");
    argv.push_back(spec.payload_mount.source.string() + ":" + spec.payload_mount.target
                   + (spec.payload_mount.read_only ? ":ro" : ""));

    argv.push_back(spec.image);
    return argv;
}

std::string make_container_name(const std::string& prefix, std::mt19937_64& rng) {
    char suffix[17];
    std::snprintf(suffix, sizeof(suffix), "%016llx",
                  static_cast<unsigned long long>(rng()));
    return prefix + "-" + std::to_string(::getpid()) + "-" + suffix;
}

}  // namespace sandbox_harness
