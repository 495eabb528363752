#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "queue/remote_execution_message.hpp"

namespace remex::sandbox {

struct ExecutionOptions {
    std::map<std::string, std::string> env;
    int timeout_ms = 2000;
    int max_output_bytes = 32 * 1024;
    std::vector<std::string> ld_path;
    std::string input;
    std::string custom_cwd;
    std::string app_home;
};

// What a caller hands the environment for one executable run.
struct ExecutableExecutionOptions {
    std::vector<std::string> args;
    std::string stdin_input;
    std::map<std::string, std::string> env;
    std::vector<std::string> ld_path;
    std::vector<queue::RuntimeTool> runtime_tools;
};

struct UnprocessedExecResult {
    int code = -1;
    bool timed_out = false;
    bool truncated = false;
    std::string stdout_text;
    std::string stderr_text;
    long long exec_time_ms = 0;
};

struct SourceTag {
    std::string file;
    int line = 0;
    int column = 0;
};

struct OutputLine {
    std::string text;
    std::optional<SourceTag> tag;
};

struct BasicExecutionResult {
    int code = -1;
    bool timed_out = false;
    bool truncated = false;
    bool did_execute = false;
    std::vector<OutputLine> stdout_lines;
    std::vector<OutputLine> stderr_lines;
    long long exec_time_ms = 0;
    double process_execution_result_time = 0.0;
    long long package_download_and_unzip_ms = 0;
    // set when the request failed before anything ran
    std::string error;
    std::string error_kind;
};

}  // namespace remex::sandbox
