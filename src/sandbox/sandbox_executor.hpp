#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "sandbox/exec_types.hpp"

namespace remex::sandbox {

// Launch failure (missing binary, permission denied). Carries the shape of a
// result so callers can turn it into one.
class ExecFailure : public std::runtime_error {
public:
    ExecFailure(int code, std::string stdout_text, std::string stderr_text)
        : std::runtime_error(stderr_text)
        , code_(code)
        , stdout_(std::move(stdout_text))
        , stderr_(std::move(stderr_text)) {}

    int Code() const { return code_; }
    const std::string& Stdout() const { return stdout_; }
    const std::string& Stderr() const { return stderr_; }

private:
    int code_;
    std::string stdout_;
    std::string stderr_;
};

struct SandboxSettings {
    // "none" or "nsjail"
    std::string type = "none";
    std::string nsjail_path = "nsjail";
    std::string nsjail_config;
};

// Trims stdout then stderr to `max_output_bytes` combined and sets
// `truncated` when anything was cut.
void CapOutput(UnprocessedExecResult& result, int max_output_bytes);

class SandboxExecutor {
public:
    explicit SandboxExecutor(SandboxSettings settings = {});

    // Runs with exactly options.env (plus LD_LIBRARY_PATH/HOME derived from
    // the options), nothing inherited. Throws ExecFailure if the process
    // cannot be started.
    UnprocessedExecResult Run(const std::string& executable,
                              const std::vector<std::string>& args,
                              const ExecutionOptions& options) const;

    const SandboxSettings& Settings() const { return settings_; }

private:
    SandboxSettings settings_;
};

}  // namespace remex::sandbox
