/**
 * @file test_harness.cpp
 * @brief Harness pipeline tests against MockBackend.
 */

#include "core/log_sinks.hpp"
#include "executor/limit_translator.hpp"
#include "executor/mock_backend.hpp"
#include "harness/harness.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <set>
#include <stdexcept>

using namespace sandbox_harness;

namespace fs = std::filesystem;

class HarnessTest : public ::testing::Test {
protected:
    fs::path staging_dir_;
    MockBackend* backend_ = nullptr;   // owned by harness_
    MemorySink* log_ = nullptr;        // owned by logger_
    std::unique_ptr<Logger> logger_;
    std::unique_ptr<Harness> harness_;

    void SetUp() override {
        staging_dir_ = fs::temp_directory_path() / "sbx_test_harness";
        fs::remove_all(staging_dir_);
        fs::create_directories(staging_dir_);

        auto sink = std::make_unique<MemorySink>();
        log_ = sink.get();
        logger_ = std::make_unique<Logger>(std::move(sink), LogLevel::Debug);

        Config config = default_config();
        config.staging.dir = staging_dir_;
        config.limits.max_binary_size = 1024;
        config.limits.max_instruction_limit = 1'000'000;

        auto backend = std::make_unique<MockBackend>();
        backend_ = backend.get();
        harness_ = std::make_unique<Harness>(config, std::move(backend), logger_.get());
    }

    void TearDown() override {
        harness_.reset();
        fs::remove_all(staging_dir_);
    }

    size_t staged_files() const {
        return static_cast<size_t>(std::distance(fs::directory_iterator(staging_dir_),
                                                 fs::directory_iterator()));
    }

    static ProcessOutput output(int exit_code, std::string out, std::string err) {
        ProcessOutput p;
        p.exit_code = exit_code;
        p.stdout_bytes = std::move(out);
        p.stderr_bytes = std::move(err);
        p.elapsed = WallTime{12};
        return p;
    }

    static ExecutionLimits limits(uint64_t instructions = 1000) {
        ExecutionLimits l;
        l.instruction_limit = instructions;
        l.memory_limit_mb = 64;
        l.timeout_seconds = 1.5;
        return l;
    }
};

// ─────────────────────────────────────────────
// Successful runs
// ─────────────────────────────────────────────

TEST_F(HarnessTest, SuccessfulRunWithTelemetry) {
    backend_->push_response(output(0, "Hello, World!\n",
        "debug line\n{\"instructions\": 4242, \"memory_peak_kb\": 512, \"limit_reached\": false,"
        " \"syscalls\": 3}\n"));

    auto result = harness_->run("\x7f" "ELF", limits());
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(result->exit_code, 0);
    EXPECT_EQ(result->stdout_bytes, "Hello, World!\n");
    EXPECT_EQ(result->stderr_bytes, "debug line");
    EXPECT_TRUE(result->telemetry_present);
    EXPECT_EQ(result->telemetry.instructions, 4242u);
    EXPECT_EQ(result->telemetry.memory_peak_kb, 512u);
    EXPECT_EQ(result->telemetry.syscalls, 3u);
    EXPECT_EQ(result->wall_time, WallTime{12});
}

TEST_F(HarnessTest, BackendReceivesTranslatedLimitsAndStdin) {
    auto l = limits(777);
    l.stdin_bytes = "input bytes";
    ASSERT_TRUE(harness_->run("payload", l).has_value());

    auto calls = backend_->invocations();
    ASSERT_EQ(calls.size(), 1u);
    const auto& call = calls[0];
    EXPECT_EQ(call.stdin_bytes, "input bytes");
    EXPECT_EQ(call.timeout, std::chrono::milliseconds{1500});
    EXPECT_EQ(call.spec.memory_limit_mb, 64u);
    EXPECT_EQ(call.spec.memory_swap_limit_mb, 64u);
    EXPECT_TRUE(call.spec.network_disabled);
    EXPECT_TRUE(call.spec.read_only_root);
    ASSERT_EQ(call.spec.environment.size(), 1u);
    EXPECT_EQ(call.spec.environment[0].second, "777");
    EXPECT_EQ(call.spec.payload_mount.target, "/work/binary");
    EXPECT_TRUE(call.spec.container_name.starts_with("sbx-"));
}

TEST_F(HarnessTest, PayloadStagedDuringRunAndRemovedAfter) {
    std::string seen_contents;
    backend_->set_handler([&seen_contents](const InvocationSpec& spec, std::string_view)
                              -> Result<ProcessOutput> {
        std::ifstream in(spec.payload_mount.source, std::ios::binary);
        seen_contents.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        return ProcessOutput{};
    });

    ASSERT_TRUE(harness_->run("exact payload bytes", limits()).has_value());
    EXPECT_EQ(seen_contents, "exact payload bytes");
    EXPECT_TRUE(backend_->invocations()[0].payload_existed);
    EXPECT_EQ(staged_files(), 0u);
}

TEST_F(HarnessTest, EachRunGetsItsOwnPayloadAndName) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(harness_->run("payload", limits()).has_value());
    }
    std::set<fs::path> paths;
    std::set<std::string> names;
    for (const auto& call : backend_->invocations()) {
        paths.insert(call.spec.payload_mount.source);
        names.insert(call.spec.container_name);
    }
    EXPECT_EQ(paths.size(), 5u);
    EXPECT_EQ(names.size(), 5u);
}

TEST_F(HarnessTest, RunWithoutLimitsUsesConfiguredDefaults) {
    ASSERT_TRUE(harness_->run("payload").has_value());
    auto call = backend_->invocations().at(0);
    EXPECT_EQ(call.spec.memory_limit_mb, ExecutionLimits::DEFAULT_MEMORY_LIMIT_MB);
    EXPECT_EQ(call.timeout, std::chrono::milliseconds{30'000});
    EXPECT_TRUE(call.stdin_bytes.empty());
}

TEST_F(HarnessTest, MissingTelemetryFallsBackToDefaults) {
    backend_->push_response(output(1, "", "Segmentation fault\n"));

    auto result = harness_->run("payload", limits());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exit_code, 1);
    EXPECT_FALSE(result->telemetry_present);
    EXPECT_EQ(result->telemetry, TelemetryRecord{});
    EXPECT_EQ(result->stderr_bytes, "Segmentation fault\n");

    bool warned = false;
    for (const auto& line : log_->lines()) {
        if (line.find("no usable telemetry") != std::string::npos) warned = true;
    }
    EXPECT_TRUE(warned);
}

TEST_F(HarnessTest, NonZeroExitIsStillAResult) {
    backend_->push_response(output(42, "", ""));
    auto result = harness_->run("payload", limits());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exit_code, 42);
}

// ─────────────────────────────────────────────
// Failure paths
// ─────────────────────────────────────────────

TEST_F(HarnessTest, TimeoutPropagatesWithPartialOutput) {
    backend_->push_response(HarnessError{ErrorKind::Timeout, "Execution timed out after 1500 ms",
                                         PartialOutput{"partial", ""}});

    auto result = harness_->run("payload", limits());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Timeout);
    ASSERT_TRUE(result.error().partial.has_value());
    EXPECT_EQ(result.error().partial->stdout_bytes, "partial");
    EXPECT_EQ(staged_files(), 0u);
}

TEST_F(HarnessTest, LaunchFailurePropagates) {
    backend_->push_response(HarnessError{ErrorKind::Launch, "Failed to launch docker"});

    auto result = harness_->run("payload", limits());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Launch);
    EXPECT_EQ(staged_files(), 0u);
}

TEST_F(HarnessTest, BackendExceptionStillRemovesPayload) {
    backend_->set_handler([](const InvocationSpec&, std::string_view) -> Result<ProcessOutput> {
        throw std::runtime_error("backend exploded");
    });

    EXPECT_THROW((void)harness_->run("payload", limits()), std::runtime_error);
    EXPECT_EQ(staged_files(), 0u);
}

TEST_F(HarnessTest, StagingFailureNeverReachesBackend) {
    fs::remove_all(staging_dir_);

    auto result = harness_->run("payload", limits());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Staging);
    EXPECT_EQ(backend_->invocation_count(), 0u);

    fs::create_directories(staging_dir_);
}

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

TEST_F(HarnessTest, RejectsInvalidRequests) {
    auto expect_invalid = [this](std::string_view payload, const ExecutionLimits& l) {
        auto result = harness_->run(payload, l);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::InvalidLimits) << result.error().message;
    };

    expect_invalid("", limits());
    expect_invalid(std::string(1025, 'x'), limits());
    expect_invalid("payload", limits(0));
    expect_invalid("payload", limits(1'000'001));

    auto no_memory = limits();
    no_memory.memory_limit_mb = 0;
    expect_invalid("payload", no_memory);

    for (double timeout : {0.0, -1.0, 0.0001, std::numeric_limits<double>::infinity(),
                           std::nan(""), 86'400.5, 1e10, 1e300}) {
        auto l = limits();
        l.timeout_seconds = timeout;
        expect_invalid("payload", l);
    }

    EXPECT_EQ(backend_->invocation_count(), 0u);
    EXPECT_EQ(staged_files(), 0u);
}

TEST_F(HarnessTest, AcceptsBoundaryValues) {
    EXPECT_TRUE(harness_->validate(std::string(1024, 'x'), limits()).has_value());
    EXPECT_TRUE(harness_->validate("p", limits(1'000'000)).has_value());
    EXPECT_TRUE(harness_->validate("p", limits(1)).has_value());

    auto longest = limits();
    longest.timeout_seconds = 86'400.0;
    EXPECT_TRUE(harness_->validate("p", longest).has_value());
}

TEST_F(HarnessTest, HealthFollowsBackend) {
    EXPECT_TRUE(harness_->healthy());
    backend_->set_available(false);
    EXPECT_FALSE(harness_->healthy());
}
