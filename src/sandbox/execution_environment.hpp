#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cache/cache_client.hpp"
#include "cache/package_loader.hpp"
#include "cache/packager.hpp"
#include "config/config_schema.hpp"
#include "queue/remote_execution_message.hpp"
#include "sandbox/exec_types.hpp"
#include "sandbox/heaptrack_wrapper.hpp"
#include "sandbox/output_parser.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "utils/common.hpp"

namespace remex::sandbox {

// One request's run: fetch a bundle, then execute it.
class ExecutionEnvironment {
public:
    virtual ~ExecutionEnvironment() = default;

    // Throws cache::PackageError.
    virtual void DownloadExecutablePackage(const std::string& hash) = 0;
    // Never throws for execution problems; they come back as results.
    virtual BasicExecutionResult Execute(const queue::ExecutionParams& params) = 0;
};

struct EnvironmentSettings {
    int timeout_ms = 2000;
    int max_output_bytes = 32 * 1024;
    bool sanitizer_env_hints = true;
    SandboxSettings sandbox;
    HeaptrackSettings heaptrack;

    static EnvironmentSettings FromConfig(const config::Config& config);
};

class LocalExecutionEnvironment : public ExecutionEnvironment {
public:
    LocalExecutionEnvironment(cache::CacheClient& cache, EnvironmentSettings settings);

    void DownloadExecutablePackage(const std::string& hash) override;
    BasicExecutionResult Execute(const queue::ExecutionParams& params) override;

    // args, stdin, runtime `env` entries and the bundle PATH hint/ld paths
    ExecutableExecutionOptions GetDefaultExecOptions(const queue::ExecutionParams& params) const;

    BasicExecutionResult ExecBinary(const std::string& executable,
                                    const ExecutableExecutionOptions& execute_parameters,
                                    const std::string& home_dir) const;

    static BasicExecutionResult ProcessUserExecutableExecutionResult(
        const UnprocessedExecResult& input,
        const std::vector<LineParseOption>& stderr_parse_options);

    const std::optional<cache::BundleMetadata>& Bundle() const { return bundle_; }
    std::filesystem::path DirPath() const;

private:
    BasicExecutionResult ExecBinaryMaybeWrapped(const std::string& executable,
                                                const std::vector<std::string>& args,
                                                ExecutionOptions& exec_options,
                                                const ExecutableExecutionOptions& execute_parameters,
                                                const std::string& home_dir) const;

    cache::CacheClient& cache_;
    cache::Packager packager_;
    EnvironmentSettings settings_;
    SandboxExecutor sandbox_;
    std::unique_ptr<utils::TempDirectory> dir_;
    std::optional<cache::BundleMetadata> bundle_;
};

// Runtime `env` entries, in order; later entries win.
void SetEnvironmentVariablesFromRuntime(const std::vector<queue::RuntimeTool>& tools,
                                        std::map<std::string, std::string>& env);

}  // namespace remex::sandbox
