/**
 * @file test_container_backend.cpp
 * @brief ContainerBackend and the full Harness pipeline against a fake engine CLI.
 *
 * The fake engine is a shell script that understands `info`, `rm` and `run`.
 * For `run` it parses the docker-style flags, reads the mounted payload and
 * behaves according to a mode file, appending a telemetry epilogue the way
 * the real executor does.
 */

#include "core/log_sinks.hpp"
#include "executor/container_backend.hpp"
#include "executor/limit_translator.hpp"
#include "harness/batch_runner.hpp"
#include "harness/harness.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace sandbox_harness;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

constexpr const char* FAKE_ENGINE = R"SH(#!/bin/sh
state="$(dirname "$0")"
mode="$(cat "$state/mode" 2>/dev/null)"
cmd="$1"; shift

case "$cmd" in
  info)
    [ "$mode" = "down" ] && exit 1
    exit 0
    ;;
  rm)
    echo "$@" >> "$state/removed"
    exit 0
    ;;
  run)
    printf '%s\n' "$@" > "$state/argv"
    limit=0
    prev=""
    for a in "$@"; do
      if [ "$prev" = "-e" ]; then
        case "$a" in LIMIT=*) limit="${a#LIMIT=}" ;; esac
      fi
      if [ "$prev" = "-v" ]; then
        cp "${a%%:*}" "$state/payload_seen"
      fi
      prev="$a"
    done
    case "$mode" in
      hang)
        printf 'started'
        sleep 30
        ;;
      crash)
        echo "Segmentation fault" >&2
        exit 139
        ;;
      limit)
        printf 'partial'
        printf 'guest says hi\n{"instructions": %s, "memory_peak_kb": 96, "limit_reached": true}\n' "$limit" >&2
        exit 0
        ;;
      *)
        cat
        printf 'guest warning' >&2
        printf '\n{"instructions": %s, "memory_peak_kb": 1536, "limit_reached": false, "syscalls": 4, "syscall_breakdown": {"read": 2, "write": 2}}\n' "$limit" >&2
        exit 0
        ;;
    esac
    ;;
esac
exit 125
)SH";

}  // namespace

class ContainerBackendTest : public ::testing::Test {
protected:
    fs::path engine_dir_;
    fs::path staging_dir_;
    fs::path engine_;

    void SetUp() override {
        engine_dir_ = fs::temp_directory_path() / "sbx_fake_engine";
        staging_dir_ = fs::temp_directory_path() / "sbx_fake_staging";
        fs::remove_all(engine_dir_);
        fs::remove_all(staging_dir_);
        fs::create_directories(engine_dir_);
        fs::create_directories(staging_dir_);

        engine_ = engine_dir_ / "engine";
        {
            std::ofstream script(engine_);
            script << FAKE_ENGINE;
        }
        fs::permissions(engine_, fs::perms::owner_all | fs::perms::group_read
                                     | fs::perms::group_exec | fs::perms::others_read
                                     | fs::perms::others_exec);
    }

    void TearDown() override {
        fs::remove_all(engine_dir_);
        fs::remove_all(staging_dir_);
    }

    void set_mode(const std::string& mode) {
        std::ofstream(engine_dir_ / "mode") << mode;
    }

    std::string state_file(const std::string& name) const {
        std::ifstream in(engine_dir_ / name, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    Config config() const {
        Config c = default_config();
        c.executor.engine = engine_.string();
        c.executor.image = "sandbox:test";
        c.staging.dir = staging_dir_;
        return c;
    }

    size_t staged_files() const {
        return static_cast<size_t>(std::distance(fs::directory_iterator(staging_dir_),
                                                 fs::directory_iterator()));
    }

    static ExecutionLimits limits(double timeout_seconds = 10.0) {
        ExecutionLimits l;
        l.instruction_limit = 5000;
        l.memory_limit_mb = 128;
        l.timeout_seconds = timeout_seconds;
        return l;
    }
};

// ─────────────────────────────────────────────
// ContainerBackend
// ─────────────────────────────────────────────

TEST_F(ContainerBackendTest, AvailableWhenInfoSucceeds) {
    ContainerBackend backend(engine_.string());
    EXPECT_TRUE(backend.available());
    set_mode("down");
    EXPECT_FALSE(backend.available());
}

TEST_F(ContainerBackendTest, UnavailableWhenEngineMissing) {
    auto sink = std::make_unique<MemorySink>();
    auto* log = sink.get();
    Logger logger(std::move(sink));

    ContainerBackend backend((engine_dir_ / "no-such-engine").string(), &logger);
    EXPECT_FALSE(backend.available());
    EXPECT_FALSE(log->lines().empty());
}

TEST_F(ContainerBackendTest, InvokePassesDockerStyleArguments) {
    ContainerBackend backend(engine_.string());
    fs::path payload = engine_dir_ / "payload.bin";
    std::ofstream(payload) << "binary";

    auto spec = translate_limits(limits(), payload, config().executor, IsolationSettings{},
                                 "sbx-test-1");
    auto result = backend.invoke(spec, "stdin data", 10s);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->stdout_bytes, "stdin data");

    auto argv = state_file("argv");
    EXPECT_NE(argv.find("--rm\n"), std::string::npos);
    EXPECT_NE(argv.find("--name=sbx-test-1\n"), std::string::npos);
    EXPECT_NE(argv.find("--memory=128m\n"), std::string::npos);
    EXPECT_NE(argv.find("--memory-swap=128m\n"), std::string::npos);
    EXPECT_NE(argv.find("--network=none\n"), std::string::npos);
    EXPECT_NE(argv.find("--read-only\n"), std::string::npos);
    EXPECT_NE(argv.find("LIMIT=5000\n"), std::string::npos);
    EXPECT_NE(argv.find(payload.string() + ":/work/binary:ro\n"), std::string::npos);
    EXPECT_EQ(state_file("payload_seen"), "binary");
}

TEST_F(ContainerBackendTest, TimeoutRemovesNamedContainer) {
    set_mode("hang");
    ContainerBackend backend(engine_.string());
    fs::path payload = engine_dir_ / "payload.bin";
    std::ofstream(payload) << "binary";

    auto spec = translate_limits(limits(), payload, config().executor, IsolationSettings{},
                                 "sbx-test-hang");
    auto result = backend.invoke(spec, {}, 400ms);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Timeout);
    EXPECT_EQ(state_file("removed"), "-f sbx-test-hang\n");
}

// ─────────────────────────────────────────────
// Harness end to end
// ─────────────────────────────────────────────

TEST_F(ContainerBackendTest, HarnessRunExtractsTelemetry) {
    Harness harness(config(), std::make_unique<ContainerBackend>(engine_.string()));

    auto l = limits();
    l.stdin_bytes = "hello from stdin";
    auto result = harness.run("\x7f" "ELF fake payload", l);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(result->exit_code, 0);
    EXPECT_EQ(result->stdout_bytes, "hello from stdin");
    EXPECT_EQ(result->stderr_bytes, "guest warning");
    EXPECT_TRUE(result->telemetry_present);
    EXPECT_EQ(result->telemetry.instructions, 5000u);
    EXPECT_EQ(result->telemetry.memory_peak_kb, 1536u);
    EXPECT_EQ(result->telemetry.syscalls, 4u);
    ASSERT_TRUE(result->telemetry.syscall_breakdown.has_value());
    EXPECT_EQ(result->telemetry.syscall_breakdown->at("write"), 2u);

    EXPECT_EQ(state_file("payload_seen"), "\x7f" "ELF fake payload");
    EXPECT_EQ(staged_files(), 0u);
}

TEST_F(ContainerBackendTest, HarnessReportsLimitReached) {
    set_mode("limit");
    Harness harness(config(), std::make_unique<ContainerBackend>(engine_.string()));

    auto result = harness.run("payload", limits());
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result->telemetry.limit_reached);
    EXPECT_EQ(result->stdout_bytes, "partial");
    EXPECT_EQ(result->stderr_bytes, "guest says hi");
}

TEST_F(ContainerBackendTest, HarnessCrashWithoutTelemetry) {
    set_mode("crash");
    Harness harness(config(), std::make_unique<ContainerBackend>(engine_.string()));

    auto result = harness.run("payload", limits());
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->exit_code, 139);
    EXPECT_FALSE(result->telemetry_present);
    EXPECT_EQ(result->telemetry, TelemetryRecord{});
    EXPECT_EQ(result->stderr_bytes, "Segmentation fault\n");
    EXPECT_EQ(staged_files(), 0u);
}

TEST_F(ContainerBackendTest, HarnessTimeoutCleansUpEverything) {
    set_mode("hang");
    Harness harness(config(), std::make_unique<ContainerBackend>(engine_.string()));

    auto result = harness.run("payload", limits(0.5));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Timeout);
    ASSERT_TRUE(result.error().partial.has_value());
    EXPECT_EQ(result.error().partial->stdout_bytes, "started");

    auto removed = state_file("removed");
    EXPECT_TRUE(removed.starts_with("-f sbx-")) << removed;
    EXPECT_EQ(staged_files(), 0u);
}

TEST_F(ContainerBackendTest, HarnessMissingEngineIsLaunchError) {
    auto c = config();
    c.executor.engine = (engine_dir_ / "no-such-engine").string();
    Harness harness(c, std::make_unique<ContainerBackend>(c.executor.engine));

    auto result = harness.run("payload", limits());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Launch);
    EXPECT_EQ(staged_files(), 0u);
}

TEST_F(ContainerBackendTest, BatchOfRealRuns) {
    Harness harness(config(), std::make_unique<ContainerBackend>(engine_.string()));
    BatchRunner runner(harness, 3);

    std::vector<std::future<Result<ExecutionResult>>> futures;
    for (int i = 0; i < 6; ++i) {
        auto l = limits();
        l.stdin_bytes = "run " + std::to_string(i);
        futures.push_back(runner.submit("payload", l));
    }
    for (int i = 0; i < 6; ++i) {
        auto result = futures[i].get();
        ASSERT_TRUE(result.has_value()) << result.error().message;
        EXPECT_EQ(result->stdout_bytes, "run " + std::to_string(i));
        EXPECT_TRUE(result->telemetry_present);
    }
}
