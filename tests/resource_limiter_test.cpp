#include <gtest/gtest.h>

#include <csignal>
#include <thread>

#include "sandbox/resource_limiter.hpp"
#include "test_support.hpp"
#include "utils/errors.hpp"

namespace codeexec::sandbox {
namespace {

using namespace std::chrono_literals;

class ResourceLimiterTest : public ::testing::Test {
protected:
    ResourceLimiterTest()
        : work_("limiter-test") {}

    Invocation Shell(const std::string& script) const {
        Invocation invocation{};
        invocation.program = "/bin/sh";
        invocation.args = {"-c", script};
        invocation.working_dir = work_.Path();
        invocation.environment = {{"PATH", "/usr/bin:/bin"}};
        return invocation;
    }

    ScopedTempDir work_;
};

TEST_F(ResourceLimiterTest, CapturesOutputAndExitCode) {
    ResourceLimiter limiter(ResourceLimits{});
    const auto result = limiter.Run(Shell("echo out; echo err >&2; exit 3"));
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.output, "out\n");
    EXPECT_EQ(result.error, "err\n");
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.cpu_limit_exceeded);
}

TEST_F(ResourceLimiterTest, FeedsStdin) {
    ResourceLimiter limiter(ResourceLimits{});
    auto invocation = Shell("cat");
    invocation.stdin_data = "line one\nline two\n";
    const auto result = limiter.Run(invocation);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "line one\nline two\n");
}

TEST_F(ResourceLimiterTest, EmptyStdinReadsEof) {
    ResourceLimiter limiter(ResourceLimits{});
    const auto result = limiter.Run(Shell("cat; echo done"));
    EXPECT_EQ(result.output, "done\n");
}

TEST_F(ResourceLimiterTest, RunsInWorkingDirectoryWithGivenEnvironmentOnly) {
    ::setenv("CODEEXEC_LIMITER_LEAK", "leaked", 1);
    ResourceLimiter limiter(ResourceLimits{});
    auto invocation = Shell("pwd; echo \"[$CODEEXEC_LIMITER_LEAK][$GREETING]\"");
    invocation.environment["GREETING"] = "hello";
    const auto result = limiter.Run(invocation);
    ::unsetenv("CODEEXEC_LIMITER_LEAK");
    EXPECT_EQ(result.output, std::filesystem::canonical(work_.Path()).string() + "\n[][hello]\n");
}

TEST_F(ResourceLimiterTest, WallTimeoutKillsProcess) {
    ResourceLimits limits{};
    limits.wall_timeout = 500ms;
    ResourceLimiter limiter(limits);
    const auto started = std::chrono::steady_clock::now();
    const auto result = limiter.Run(Shell("echo started; sleep 30"));
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.term_signal, SIGKILL);
    EXPECT_EQ(result.output, "started\n");
    EXPECT_LT(elapsed, 5s);
    EXPECT_GE(result.duration, 500ms);
}

TEST_F(ResourceLimiterTest, BackgroundChildrenAreKilledAfterNormalExit) {
    ResourceLimiter limiter(ResourceLimits{});
    const auto result = limiter.Run(Shell("sleep 30 >/dev/null 2>&1 & echo $!"));
    ASSERT_EQ(result.exit_code, 0);
    const int child = std::stoi(result.output);
    bool alive = true;
    for (int i = 0; i < 100 && alive; ++i) {
        alive = codeexec::testing::ProcessAlive(child);
        if (alive) {
            std::this_thread::sleep_for(20ms);
        }
    }
    EXPECT_FALSE(alive);
}

TEST_F(ResourceLimiterTest, BackgroundChildrenAreKilledOnTimeout) {
    ResourceLimits limits{};
    limits.wall_timeout = 500ms;
    ResourceLimiter limiter(limits);
    const auto result = limiter.Run(Shell("sleep 30 & echo $!; wait"));
    ASSERT_TRUE(result.timed_out);
    const int child = std::stoi(result.output);
    bool alive = true;
    for (int i = 0; i < 100 && alive; ++i) {
        alive = codeexec::testing::ProcessAlive(child);
        if (alive) {
            std::this_thread::sleep_for(20ms);
        }
    }
    EXPECT_FALSE(alive);
}

TEST_F(ResourceLimiterTest, CpuLimitIsReported) {
    ResourceLimits limits{};
    limits.cpu_seconds = 1;
    limits.wall_timeout = 20s;
    ResourceLimiter limiter(limits);
    const auto result = limiter.Run(Shell("while :; do :; done"));
    EXPECT_FALSE(result.timed_out);
    EXPECT_TRUE(result.cpu_limit_exceeded);
    EXPECT_GE(result.cpu_time, 900ms);
}

TEST_F(ResourceLimiterTest, FileSizeLimitIsReported) {
    ResourceLimits limits{};
    limits.max_file_size_bytes = 1024;
    ResourceLimiter limiter(limits);
    const auto result = limiter.Run(Shell("head -c 65536 /dev/zero > big.bin"));
    EXPECT_TRUE(result.file_size_limit_exceeded);
    EXPECT_LE(std::filesystem::file_size(work_.Path() / "big.bin"), 1024u);
}

TEST_F(ResourceLimiterTest, OutputIsCapped) {
    ResourceLimits limits{};
    limits.max_output_bytes = 16;
    ResourceLimiter limiter(limits);
    const auto result = limiter.Run(Shell("head -c 1000 /dev/zero | tr '\\0' a; echo short >&2"));
    EXPECT_EQ(result.output, std::string(16, 'a'));
    EXPECT_TRUE(result.output_truncated);
    EXPECT_EQ(result.error, "short\n");
    EXPECT_FALSE(result.error_truncated);
}

TEST_F(ResourceLimiterTest, MissingProgramIsInternalError) {
    ResourceLimiter limiter(ResourceLimits{});
    auto invocation = Shell("true");
    invocation.program = "/nonexistent/interpreter";
    try {
        limiter.Run(invocation);
        FAIL() << "expected ServiceError";
    } catch (const utils::ServiceError& ex) {
        EXPECT_EQ(ex.Code(), utils::ErrorCode::kInternalError);
    }
}

}  // namespace
}  // namespace codeexec::sandbox
