#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "queue/remote_execution_message.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace remex::sandbox {

struct HeaptrackSettings {
    std::string heaptrack_path;
    std::string heaptrack_print_path;
};

// Runs the target under `heaptrack --record-only` and appends the
// heaptrack_print report to the captured output. Tool options:
//   summary = stderr (default) | stdout | none
//   details = yes | no (default)
class HeaptrackWrapper {
public:
    HeaptrackWrapper(std::filesystem::path work_dir,
                     const SandboxExecutor& sandbox,
                     HeaptrackSettings settings,
                     std::vector<queue::RuntimeToolOption> options);

    static bool IsSupported(const HeaptrackSettings& settings);

    UnprocessedExecResult Exec(const std::string& executable,
                               const std::vector<std::string>& args,
                               const ExecutionOptions& options) const;

private:
    std::string Option(const std::string& name, const std::string& fallback) const;
    std::filesystem::path FindRecording() const;
    std::string PrintReport(const std::filesystem::path& recording, const ExecutionOptions& options) const;

    std::filesystem::path work_dir_;
    const SandboxExecutor& sandbox_;
    HeaptrackSettings settings_;
    std::vector<queue::RuntimeToolOption> options_;
};

}  // namespace remex::sandbox
