#include "sandbox/execution_environment.hpp"

#include <chrono>
#include <stdexcept>

#include "utils/logging.hpp"

namespace remex::sandbox {
namespace {

constexpr const char* kTempPrefix = "remex-run-";
constexpr const char* kPathDelimiter = ":";

const std::map<std::string, std::string>& SanitizerEnvHints() {
    static const std::map<std::string, std::string> kHints = {
        {"ASAN_OPTIONS", "color=always"},
        {"UBSAN_OPTIONS", "color=always"},
        {"MSAN_OPTIONS", "color=always"},
        {"LSAN_OPTIONS", "color=always"}
    };
    return kHints;
}

const queue::ProfilerWrap* FindHeaptrack(const std::vector<queue::RuntimeTool>& tools) {
    const queue::ProfilerWrap* found = nullptr;
    for (const auto& tool : tools) {
        if (const auto* wrap = std::get_if<queue::ProfilerWrap>(&tool)) {
            if (wrap->tool == queue::runtime_tool_name::kHeaptrack) {
                found = wrap;
            }
        }
    }
    return found;
}

}  // namespace

EnvironmentSettings EnvironmentSettings::FromConfig(const config::Config& config) {
    EnvironmentSettings settings{};
    settings.timeout_ms = config.execution.timeout_ms;
    settings.max_output_bytes = config.execution.max_output_bytes;
    settings.sanitizer_env_hints = config.execution.sanitizer_env_hints;
    settings.sandbox.type = config.execution.sandbox_type;
    settings.sandbox.nsjail_path = config.execution.nsjail_path;
    settings.sandbox.nsjail_config = config.execution.nsjail_config;
    settings.heaptrack.heaptrack_path = config.execution.heaptrack_path;
    settings.heaptrack.heaptrack_print_path = config.execution.heaptrack_print_path;
    return settings;
}

void SetEnvironmentVariablesFromRuntime(const std::vector<queue::RuntimeTool>& tools,
                                        std::map<std::string, std::string>& env) {
    for (const auto& tool : tools) {
        if (const auto* injection = std::get_if<queue::EnvInjection>(&tool)) {
            for (const auto& variable : injection->variables) {
                if (!variable.name.empty()) {
                    env[variable.name] = variable.value;
                }
            }
        }
    }
}

LocalExecutionEnvironment::LocalExecutionEnvironment(cache::CacheClient& cache, EnvironmentSettings settings)
    : cache_(cache)
    , settings_(std::move(settings))
    , sandbox_(settings_.sandbox) {}

std::filesystem::path LocalExecutionEnvironment::DirPath() const {
    return dir_ ? dir_->Path() : std::filesystem::path();
}

void LocalExecutionEnvironment::DownloadExecutablePackage(const std::string& hash) {
    // fresh directory per request, removed with the environment
    dir_ = std::make_unique<utils::TempDirectory>(kTempPrefix);
    bundle_ = cache::FetchAndUnpack(cache_, packager_, hash, dir_->Path());
    utils::LogDebug("execution", "package ready", {
        {"hash", hash},
        {"dir", dir_->Path().string()},
        {"ms", std::to_string(bundle_->package_download_and_unzip_ms)}});
}

ExecutableExecutionOptions LocalExecutionEnvironment::GetDefaultExecOptions(
    const queue::ExecutionParams& params) const {
    ExecutableExecutionOptions options{};
    options.args = ResolveArgs(params);
    options.stdin_input = params.stdin_input;
    options.runtime_tools = params.runtime_tools;

    SetEnvironmentVariablesFromRuntime(params.runtime_tools, options.env);

    if (bundle_ && !bundle_->path_hint.empty()) {
        auto& path = options.env["PATH"];
        path = path.empty() ? bundle_->path_hint : path + kPathDelimiter + bundle_->path_hint;
    }
    if (bundle_) {
        options.ld_path = bundle_->prepared_ld_paths;
    }
    return options;
}

BasicExecutionResult LocalExecutionEnvironment::Execute(const queue::ExecutionParams& params) {
    if (!bundle_ || !dir_) {
        throw std::logic_error("Execute called before DownloadExecutablePackage");
    }
    auto result = ExecBinary(bundle_->executable_filename.string(),
                             GetDefaultExecOptions(params),
                             dir_->Path().string());
    result.package_download_and_unzip_ms = bundle_->package_download_and_unzip_ms;
    return result;
}

BasicExecutionResult LocalExecutionEnvironment::ExecBinary(
    const std::string& executable,
    const ExecutableExecutionOptions& execute_parameters,
    const std::string& home_dir) const {
    try {
        ExecutionOptions exec_options{};
        exec_options.max_output_bytes = settings_.max_output_bytes;
        exec_options.timeout_ms = settings_.timeout_ms;
        exec_options.ld_path = execute_parameters.ld_path;
        exec_options.input = execute_parameters.stdin_input;
        exec_options.custom_cwd = home_dir;
        exec_options.app_home = home_dir;

        if (settings_.sanitizer_env_hints) {
            exec_options.env = SanitizerEnvHints();
        }
        for (const auto& [key, value] : execute_parameters.env) {
            exec_options.env[key] = value;
        }

        return ExecBinaryMaybeWrapped(
            executable,
            execute_parameters.args,
            exec_options,
            execute_parameters,
            home_dir);
    } catch (const ExecFailure& ex) {
        UnprocessedExecResult failed{};
        failed.code = ex.Code();
        failed.stdout_text = ex.Stdout();
        failed.stderr_text = ex.Stderr();
        auto result = ProcessUserExecutableExecutionResult(failed, {});
        result.did_execute = false;
        return result;
    } catch (const std::exception& ex) {
        utils::LogError("execution", "unexpected execution failure",
                        {{"executable", executable}, {"error", ex.what()}});
        BasicExecutionResult result{};
        result.code = -1;
        result.stderr_lines = ParseOutput(ex.what());
        return result;
    }
}

BasicExecutionResult LocalExecutionEnvironment::ExecBinaryMaybeWrapped(
    const std::string& executable,
    const std::vector<std::string>& args,
    ExecutionOptions& exec_options,
    const ExecutableExecutionOptions& execute_parameters,
    const std::string& home_dir) const {
    const auto* run_with_heaptrack = FindHeaptrack(execute_parameters.runtime_tools);
    if (run_with_heaptrack && HeaptrackWrapper::IsSupported(settings_.heaptrack)) {
        HeaptrackWrapper wrapper(home_dir, sandbox_, settings_.heaptrack, run_with_heaptrack->options);
        const auto exec_result = wrapper.Exec(executable, args, exec_options);
        return ProcessUserExecutableExecutionResult(exec_result, {LineParseOption::kAtFileLine});
    }
    if (run_with_heaptrack) {
        utils::LogInfo("execution", "heaptrack requested but not available; running plain");
    }
    const auto exec_result = sandbox_.Run(executable, args, exec_options);
    return ProcessUserExecutableExecutionResult(exec_result, {});
}

BasicExecutionResult LocalExecutionEnvironment::ProcessUserExecutableExecutionResult(
    const UnprocessedExecResult& input,
    const std::vector<LineParseOption>& stderr_parse_options) {
    const auto start = std::chrono::steady_clock::now();
    BasicExecutionResult result{};
    result.code = input.code;
    result.timed_out = input.timed_out;
    result.truncated = input.truncated;
    result.did_execute = true;
    result.exec_time_ms = input.exec_time_ms;
    result.stdout_lines = ParseOutput(input.stdout_text);
    result.stderr_lines = ParseOutput(input.stderr_text, stderr_parse_options);
    const auto end = std::chrono::steady_clock::now();
    result.process_execution_result_time =
        std::chrono::duration<double, std::milli>(end - start).count();
    return result;
}

}  // namespace remex::sandbox
