/**
 * @file main.cpp
 * @brief sandbox_run — execute binaries under the harness and report measurements.
 *
 * Wires Config → Logger → ContainerBackend → Harness → BatchRunner, runs every
 * binary named on the command line concurrently, then prints one report per
 * binary in command-line order.
 */

#include "app/cli.hpp"
#include "core/config.hpp"
#include "core/log_sinks.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/container_backend.hpp"
#include "harness/batch_runner.hpp"
#include "harness/harness.hpp"
#include "telemetry/telemetry_extractor.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace sandbox_harness;

namespace {

constexpr int EXIT_ALL_OK = 0;
constexpr int EXIT_RUN_FAILED = 1;
constexpr int EXIT_USAGE = 2;

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

std::string dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void report_json(const std::filesystem::path& binary, const Result<ExecutionResult>& result) {
    nlohmann::json j;
    j["binary"] = binary.string();
    if (result) {
        j["status"] = "ok";
        j["exit_code"] = result->exit_code;
        j["stdout"] = result->stdout_bytes;
        j["stderr"] = result->stderr_bytes;
        j["wall_time_ms"] = result->wall_time.count();
        j["telemetry_present"] = result->telemetry_present;
        j["telemetry"] = to_json(result->telemetry);
    } else {
        const auto& err = result.error();
        j["status"] = "error";
        j["error_kind"] = std::string{to_string(err.kind)};
        j["message"] = err.message;
        if (err.partial) {
            j["stdout"] = err.partial->stdout_bytes;
            j["stderr"] = err.partial->stderr_bytes;
        }
    }
    std::cout << dump(j) << "\n";
}

void report_text(const std::filesystem::path& binary, const Result<ExecutionResult>& result) {
    std::cout << "== " << binary.string() << "\n";
    if (!result) {
        const auto& err = result.error();
        std::cout << "Error (" << to_string(err.kind) << "): " << err.message << "\n";
        return;
    }
    const auto& r = *result;
    std::cout << "Exit code: " << r.exit_code << "\n"
              << "Instructions: " << r.telemetry.instructions << "\n"
              << "Memory peak: " << r.telemetry.memory_peak_kb << " KB\n"
              << "Guest heap: " << r.telemetry.guest_heap_bytes << " bytes, mmap peak "
              << r.telemetry.guest_mmap_peak << " bytes\n"
              << "Syscalls: " << r.telemetry.syscalls << "\n"
              << "Limit reached: " << (r.telemetry.limit_reached ? "true" : "false") << "\n"
              << "Wall time: " << r.wall_time.count() << " ms\n";
    if (!r.telemetry_present) std::cout << "Telemetry: missing (defaults reported)\n";
    if (!r.stdout_bytes.empty()) std::cout << "Stdout: " << r.stdout_bytes << "\n";
    if (!r.stderr_bytes.empty()) std::cout << "Stderr: " << r.stderr_bytes << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(std::vector<std::string>(argv + 1, argv + argc), std::cerr);
    if (!parsed) {
        print_usage(std::cerr);
        return EXIT_USAGE;
    }
    if (parsed->help) {
        print_usage(std::cout);
        return EXIT_ALL_OK;
    }
    auto& args = *parsed;

    // Load configuration
    Config config = default_config();
    if (args.config_path) {
        auto config_result = load_config(*args.config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << "\n";
            return EXIT_USAGE;
        }
        config = std::move(*config_result);
    }

    // Apply CLI overrides
    if (!args.image.empty()) config.executor.image = args.image;
    if (!args.engine.empty()) config.executor.engine = args.engine;
    if (!args.log_level.empty()) config.logging.log_level = args.log_level;

    auto level = parse_log_level(config.logging.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << config.logging.log_level << "\n";
        return EXIT_USAGE;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.logging.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.logging.log_dir, "sandbox_harness");
    } else {
        log_sink = std::make_unique<StderrSink>();
    }
    Logger logger(std::move(log_sink), *level);

    Harness harness(config, std::make_unique<ContainerBackend>(config.executor.engine, &logger),
                    &logger);

    if (args.check) {
        bool ok = harness.healthy();
        std::cout << config.executor.engine << (ok ? " is available" : " is not available") << "\n";
        return ok ? EXIT_ALL_OK : EXIT_RUN_FAILED;
    }

    if (args.binaries.empty()) {
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    ExecutionLimits limits = config.default_limits();
    if (args.instruction_limit) limits.instruction_limit = *args.instruction_limit;
    if (args.memory_limit_mb) limits.memory_limit_mb = *args.memory_limit_mb;
    if (args.timeout_sec) limits.timeout_seconds = *args.timeout_sec;
    if (args.stdin_file) {
        auto bytes = read_file(*args.stdin_file);
        if (!bytes) {
            std::cerr << "Cannot read stdin file: " << args.stdin_file->string() << "\n";
            return EXIT_USAGE;
        }
        limits.stdin_bytes = std::move(*bytes);
    }

    // ── Run all binaries ─────────────────────
    std::vector<std::future<Result<ExecutionResult>>> pending;
    std::vector<std::filesystem::path> submitted;
    int exit_status = EXIT_ALL_OK;
    {
        BatchRunner runner(harness, config.batch.max_concurrent);
        for (const auto& binary : args.binaries) {
            auto payload = read_file(binary);
            if (!payload) {
                logger.error("cli", "Cannot read binary: " + binary.string());
                exit_status = EXIT_RUN_FAILED;
                continue;
            }
            pending.push_back(runner.submit(std::move(*payload), limits));
            submitted.push_back(binary);
        }

        for (size_t i = 0; i < pending.size(); ++i) {
            auto result = pending[i].get();
            if (!result) exit_status = EXIT_RUN_FAILED;
            if (args.json) {
                report_json(submitted[i], result);
            } else {
                report_text(submitted[i], result);
            }
        }
    }

    logger.flush();
    return exit_status;
}
