#include <gtest/gtest.h>

#include "cache/package_errors.hpp"
#include "sandbox/execution_environment.hpp"
#include "test_support.hpp"

namespace remex::sandbox {
namespace {

std::string StdoutText(const BasicExecutionResult& result) {
    std::string text;
    for (const auto& line : result.stdout_lines) {
        if (!text.empty()) {
            text += "\n";
        }
        text += line.text;
    }
    return text;
}

queue::ExecutionParams WithEnv(std::vector<queue::RuntimeToolOption> variables) {
    queue::ExecutionParams params{};
    params.runtime_tools.push_back(queue::EnvInjection{std::move(variables)});
    return params;
}

class LocalExecutionEnvironmentTest : public ::testing::Test {
protected:
    BasicExecutionResult RunBundle(const std::string& script, const queue::ExecutionParams& params) {
        testing::PutScriptBundle(cache_, "bundle", script);
        LocalExecutionEnvironment environment(cache_, settings_);
        environment.DownloadExecutablePackage("bundle");
        return environment.Execute(params);
    }

    utils::TempDirectory cache_dir_{"remex-cache-"};
    cache::DiskCache cache_{cache_dir_.Path()};
    EnvironmentSettings settings_{};
};

TEST_F(LocalExecutionEnvironmentTest, RunsTheBundledExecutable) {
    queue::ExecutionParams params{};
    params.args = std::string("--version 'two words'");
    const auto result = RunBundle("echo \"version 1.0 $1 [$2]\"", params);
    EXPECT_EQ(result.code, 0);
    EXPECT_TRUE(result.did_execute);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(StdoutText(result), "version 1.0 --version [two words]");
    EXPECT_GE(result.process_execution_result_time, 0.0);
}

TEST_F(LocalExecutionEnvironmentTest, CallerEnvWinsOverSanitizerHints) {
    const auto result = RunBundle("echo \"$ASAN_OPTIONS|$UBSAN_OPTIONS\"",
                                  WithEnv({{"ASAN_OPTIONS", "detect_leaks=0"}}));
    EXPECT_EQ(StdoutText(result), "detect_leaks=0|color=always");
}

TEST_F(LocalExecutionEnvironmentTest, SanitizerHintsCanBeDisabled) {
    settings_.sanitizer_env_hints = false;
    const auto result = RunBundle("echo \"${ASAN_OPTIONS:-none}\"", {});
    EXPECT_EQ(StdoutText(result), "none");
}

TEST_F(LocalExecutionEnvironmentTest, PathHintIsAppendedToCallerPath) {
    const auto result = RunBundle("echo \"$PATH\"", WithEnv({{"PATH", "/custom/bin"}}));
    EXPECT_EQ(StdoutText(result), "/custom/bin:/usr/bin:/bin");

    const auto plain = RunBundle("echo \"$PATH\"", {});
    EXPECT_EQ(StdoutText(plain), "/usr/bin:/bin");
}

TEST_F(LocalExecutionEnvironmentTest, RunsInsideItsOwnWorkingDirectory) {
    testing::PutScriptBundle(cache_, "bundle", "pwd; ls example.cpp");
    std::filesystem::path dir;
    {
        LocalExecutionEnvironment environment(cache_, settings_);
        environment.DownloadExecutablePackage("bundle");
        dir = environment.DirPath();
        const auto result = environment.Execute({});
        EXPECT_EQ(result.code, 0);
        EXPECT_EQ(StdoutText(result),
                  std::filesystem::canonical(dir).string() + "\nexample.cpp");
    }
    EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST_F(LocalExecutionEnvironmentTest, TimeoutIsAResultNotAnError) {
    settings_.timeout_ms = 200;
    const auto result = RunBundle("sleep 5", {});
    EXPECT_TRUE(result.timed_out);
    EXPECT_NE(result.code, 0);
    EXPECT_TRUE(result.did_execute);
}

TEST_F(LocalExecutionEnvironmentTest, MissingHeaptrackFallsBackToPlainRun) {
    settings_.heaptrack.heaptrack_path = "/nonexistent/heaptrack";
    settings_.heaptrack.heaptrack_print_path = "/nonexistent/heaptrack_print";
    queue::ExecutionParams params{};
    params.runtime_tools.push_back(queue::ProfilerWrap{"heaptrack", {}});
    const auto result = RunBundle("echo plain", params);
    EXPECT_EQ(StdoutText(result), "plain");
}

class HeaptrackEnvironmentTest : public LocalExecutionEnvironmentTest {
protected:
    void SetUp() override {
        // stand-ins: record by running the target, print a fixed report
        testing::WriteScript(tools_.Path() / "heaptrack",
                             "shift\n"
                             "shift\n"
                             "out=\"$1\"\n"
                             "shift\n"
                             "\"$@\"\n"
                             "code=$?\n"
                             "echo recorded > \"$out.1.zst\"\n"
                             "exit $code");
        testing::WriteScript(tools_.Path() / "heaptrack_print",
                             "echo \"peak heap memory at /app/example.cpp:3\"\n"
                             "i=0\n"
                             "while [ $i -lt 50 ]; do echo \"  allocation at /app/example.cpp:$i\"; i=$((i+1)); done");
        settings_.heaptrack.heaptrack_path = (tools_.Path() / "heaptrack").string();
        settings_.heaptrack.heaptrack_print_path = (tools_.Path() / "heaptrack_print").string();
    }

    static queue::ExecutionParams WithHeaptrack() {
        queue::ExecutionParams params{};
        params.runtime_tools.push_back(queue::ProfilerWrap{"heaptrack", {}});
        return params;
    }

    static std::size_t TextBytes(const BasicExecutionResult& result) {
        std::size_t bytes = 0;
        for (const auto& line : result.stdout_lines) {
            bytes += line.text.size();
        }
        for (const auto& line : result.stderr_lines) {
            bytes += line.text.size();
        }
        return bytes;
    }

    utils::TempDirectory tools_{"remex-tools-"};
};

TEST_F(HeaptrackEnvironmentTest, AppendsTheReportToStderr) {
    const auto result = RunBundle("echo \"program output\"", WithHeaptrack());
    EXPECT_EQ(result.code, 0);
    EXPECT_FALSE(result.truncated);
    EXPECT_EQ(StdoutText(result), "program output");
    ASSERT_EQ(result.stderr_lines.size(), 51u);
    ASSERT_TRUE(result.stderr_lines[0].tag.has_value());
    EXPECT_EQ(result.stderr_lines[0].tag->file, "/app/example.cpp");
    EXPECT_EQ(result.stderr_lines[0].tag->line, 3);
}

TEST_F(HeaptrackEnvironmentTest, ReportStaysWithinTheOutputCap) {
    settings_.max_output_bytes = 256;
    const auto result = RunBundle("echo \"program output\"", WithHeaptrack());
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(StdoutText(result), "program output");
    EXPECT_FALSE(result.stderr_lines.empty());
    EXPECT_LE(TextBytes(result), 256u);
}

TEST_F(HeaptrackEnvironmentTest, WrappedRunKeepsTheCallerPath) {
    auto params = WithEnv({{"PATH", "/custom/bin"}});
    params.runtime_tools.push_back(queue::ProfilerWrap{"heaptrack", {{"summary", "none"}}});
    const auto result = RunBundle("echo \"$PATH\"", params);
    const auto path = StdoutText(result);
    EXPECT_EQ(path.rfind("/custom/bin:/usr/bin:/bin", 0), 0u) << path;
}

TEST_F(LocalExecutionEnvironmentTest, LaunchFailureBecomesAResult) {
    LocalExecutionEnvironment environment(cache_, settings_);
    ExecutableExecutionOptions options{};
    const auto result = environment.ExecBinary("/nonexistent/remex-program", options, "/tmp");
    EXPECT_NE(result.code, 0);
    EXPECT_FALSE(result.did_execute);
    EXPECT_FALSE(result.stderr_lines.empty());
}

TEST_F(LocalExecutionEnvironmentTest, CacheMissIsReported) {
    LocalExecutionEnvironment environment(cache_, settings_);
    EXPECT_THROW(environment.DownloadExecutablePackage("missing"), cache::CacheMissError);
}

TEST_F(LocalExecutionEnvironmentTest, ExecuteBeforeDownloadIsAProgrammingError) {
    LocalExecutionEnvironment environment(cache_, settings_);
    EXPECT_THROW(environment.Execute({}), std::logic_error);
}

}  // namespace
}  // namespace remex::sandbox
