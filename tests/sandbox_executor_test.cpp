#include <gtest/gtest.h>

#include "sandbox/sandbox_executor.hpp"
#include "test_support.hpp"

namespace remex::sandbox {
namespace {

ExecutionOptions ShellOptions() {
    ExecutionOptions options{};
    options.env["PATH"] = "/usr/bin:/bin";
    options.timeout_ms = 5000;
    return options;
}

UnprocessedExecResult RunShell(const std::string& script, const ExecutionOptions& options) {
    return SandboxExecutor().Run("/bin/sh", {"-c", script}, options);
}

TEST(SandboxExecutorTest, CapturesOutputAndExitCode) {
    const auto result = RunShell("echo out; echo err >&2; exit 3", ShellOptions());
    EXPECT_EQ(result.code, 3);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.truncated);
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
}

TEST(SandboxExecutorTest, FeedsStdin) {
    auto options = ShellOptions();
    options.input = "hello\n";
    const auto result = RunShell("read line; echo \"got $line\"", options);
    EXPECT_EQ(result.code, 0);
    EXPECT_EQ(result.stdout_text, "got hello\n");
}

TEST(SandboxExecutorTest, DoesNotInheritTheWorkerEnvironment) {
    testing::ScopedEnv leak("REMEX_TEST_SECRET", "leaked");
    auto options = ShellOptions();
    options.env["VISIBLE"] = "yes";
    const auto result = RunShell("echo \"${REMEX_TEST_SECRET:-unset} $VISIBLE\"", options);
    EXPECT_EQ(result.stdout_text, "unset yes\n");
}

TEST(SandboxExecutorTest, DerivesLibraryPathHomeAndWorkingDirectory) {
    utils::TempDirectory home("remex-home-");
    auto options = ShellOptions();
    options.ld_path = {"/opt/a", "/opt/b"};
    options.app_home = home.Path().string();
    const auto result = RunShell("echo \"$LD_LIBRARY_PATH\"; echo \"$HOME\"; pwd", options);
    const auto canonical_home = std::filesystem::canonical(home.Path()).string();
    EXPECT_EQ(result.stdout_text,
              "/opt/a:/opt/b\n" + home.Path().string() + "\n" + canonical_home + "\n");
}

TEST(SandboxExecutorTest, KillsProcessesThatOverrunTheTimeout) {
    auto options = ShellOptions();
    options.timeout_ms = 200;
    const auto start = std::chrono::steady_clock::now();
    const auto result = RunShell("echo started; sleep 5; echo finished", options);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_NE(result.code, 0);
    EXPECT_EQ(result.stdout_text, "started\n");
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(SandboxExecutorTest, CapsCapturedOutput) {
    auto options = ShellOptions();
    options.max_output_bytes = 1024;
    const auto result = RunShell("while :; do echo 0123456789abcdef; done", options);
    EXPECT_TRUE(result.truncated);
    EXPECT_FALSE(result.timed_out);
    EXPECT_LE(result.stdout_text.size() + result.stderr_text.size(), 1024u);
}

TEST(SandboxExecutorTest, FastWriterIsCappedOnRead) {
    auto options = ShellOptions();
    options.max_output_bytes = 64;
    const auto result = RunShell("yes; yes >&2", options);
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.stdout_text.size(), 64u);
    EXPECT_TRUE(result.stderr_text.empty());
}

TEST(SandboxExecutorTest, CapOutputSharesOneBudget) {
    UnprocessedExecResult result{};
    result.stdout_text = std::string(10, 'o');
    result.stderr_text = std::string(10, 'e');
    CapOutput(result, 15);
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.stdout_text, std::string(10, 'o'));
    EXPECT_EQ(result.stderr_text, std::string(5, 'e'));

    UnprocessedExecResult small{};
    small.stdout_text = "ok";
    CapOutput(small, 15);
    EXPECT_FALSE(small.truncated);
}

TEST(SandboxExecutorTest, MissingBinaryIsALaunchFailure) {
    EXPECT_THROW(SandboxExecutor().Run("/nonexistent/remex-program", {}, ShellOptions()), ExecFailure);
}

}  // namespace
}  // namespace remex::sandbox
