#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

#include <unistd.h>

#include "harness/HarnessConfig.hpp"
#include "harness/ProcessRunner.hpp"

using namespace improver;
using namespace std::chrono_literals;

TEST(ProcessRunnerTest, StartsNotRun) {
    ProcessRunner runner;
    EXPECT_EQ(runner.state(), RunState::NotRun);
}

TEST(ProcessRunnerTest, CapturesStreamsSeparately) {
    ProcessRunner runner(5000ms);
    auto res = runner.run("/bin/sh", {"-c", "printf 'to out\\n'; printf 'to err\\n' >&2"});
    ASSERT_TRUE(res.has_value()) << res.error().message;

    EXPECT_EQ(res.value().exitCode, 0);
    EXPECT_EQ(res.value().out, "to out\n");
    EXPECT_EQ(res.value().err, "to err\n");
    EXPECT_EQ(runner.state(), RunState::Completed);
}

TEST(ProcessRunnerTest, ReportsExitCode) {
    ProcessRunner runner(5000ms);
    auto res = runner.run("/bin/sh", {"-c", "exit 3"});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().exitCode, 3);
}

TEST(ProcessRunnerTest, PassesArgumentsVerbatim) {
    ProcessRunner runner(5000ms);
    auto res = runner.run("/bin/sh", {"-c", "printf '%s|' \"$@\"", "sh", "a b", "", "-h"});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().out, "a b||-h|");
}

TEST(ProcessRunnerTest, SignalledChildReportsSignalCode) {
    ProcessRunner runner(5000ms);
    auto res = runner.run("/bin/sh", {"-c", "kill -TERM $$"});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().exitCode, 128 + 15);
}

TEST(ProcessRunnerTest, MissingExecutableExits127) {
    ProcessRunner runner(5000ms);
    auto res = runner.run("/nonexistent/improver-binary", {});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().exitCode, 127);
    EXPECT_EQ(res.value().out, "");
}

TEST(ProcessRunnerTest, LargeOutputDoesNotDeadlock) {
    ProcessRunner runner(10000ms);
    // Both pipes well past their kernel buffer size
    auto res = runner.run("/bin/sh", {"-c", "head -c 200000 /dev/zero; head -c 200000 /dev/zero >&2"});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().out.size(), 200000u);
    EXPECT_EQ(res.value().err.size(), 200000u);
}

TEST(ProcessRunnerTest, TimeoutKillsChild) {
    ProcessRunner runner(200ms);
    auto start = std::chrono::steady_clock::now();
    auto res = runner.run("/bin/sleep", {"10"});
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::HarnessTimeout);
    EXPECT_EQ(runner.state(), RunState::TimedOut);
    EXPECT_LT(elapsed, 5s);
}

// Timeouts past what poll() can take in one call still let the child finish
TEST(ProcessRunnerTest, TimeoutAboveIntRangeCompletes) {
    for (const char* value : {"4294967297", "3000000000"}) {
        ProcessRunner runner(HarnessConfig::parseTimeout(value));
        auto res = runner.run("/bin/sh", {"-c", "sleep 0.2; echo hi"});
        ASSERT_TRUE(res.has_value()) << value << ": " << res.error().message;
        EXPECT_EQ(res.value().exitCode, 0) << value;
        EXPECT_EQ(res.value().out, "hi\n") << value;
        EXPECT_EQ(runner.state(), RunState::Completed) << value;
    }
}

TEST(ProcessRunnerTest, TimeoutKillsGrandchildren) {
    namespace fs = std::filesystem;
    fs::path marker = fs::temp_directory_path() / ("improver_runner_" + std::to_string(::getpid()) + ".marker");
    fs::remove(marker);

    ProcessRunner runner(200ms);
    auto res = runner.run("/bin/sh", {"-c", "(sleep 1; touch '" + marker.string() + "') & sleep 10"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::HarnessTimeout);

    // The background subshell would have created the marker by now
    std::this_thread::sleep_for(1500ms);
    EXPECT_FALSE(fs::exists(marker));
    fs::remove(marker);
}

TEST(ProcessRunnerTest, RunnerIsSingleUse) {
    ProcessRunner runner(5000ms);
    ASSERT_TRUE(runner.run("/bin/sh", {"-c", "true"}).has_value());

    auto again = runner.run("/bin/sh", {"-c", "true"});
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::InternalError);
    EXPECT_EQ(runner.state(), RunState::Completed);
}

TEST(ProcessRunnerTest, StateNames) {
    EXPECT_STREQ(runStateName(RunState::NotRun), "NOT_RUN");
    EXPECT_STREQ(runStateName(RunState::Running), "RUNNING");
    EXPECT_STREQ(runStateName(RunState::Completed), "COMPLETED");
    EXPECT_STREQ(runStateName(RunState::TimedOut), "TIMED_OUT");
}
