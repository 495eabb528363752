#include "sandbox/sandbox_executor.hpp"

#include <algorithm>
#include <boost/process.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace remex::sandbox {
namespace bp = boost::process;
namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);
constexpr auto kTerminateGrace = std::chrono::milliseconds(500);

std::map<std::string, std::string> BuildEnvironment(const ExecutionOptions& options) {
    auto env = options.env;
    if (!options.ld_path.empty()) {
        auto ld_library_path = utils::Join(options.ld_path, ":");
        auto it = env.find("LD_LIBRARY_PATH");
        if (it != env.end() && !it->second.empty()) {
            ld_library_path += ":" + it->second;
        }
        env["LD_LIBRARY_PATH"] = ld_library_path;
    }
    if (!options.app_home.empty() && env.find("HOME") == env.end()) {
        env["HOME"] = options.app_home;
    }
    return env;
}

std::uintmax_t FileSize(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : size;
}

// Reads at most `limit` bytes; the files can grow far past the cap between
// polls.
std::string ReadPrefix(const std::filesystem::path& path, std::size_t limit) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::string data(limit, '\0');
    input.read(data.data(), static_cast<std::streamsize>(limit));
    data.resize(static_cast<std::size_t>(input.gcount()));
    return data;
}

bool WaitFor(pid_t pid, int& status, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0) {
            return false;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    return false;
}

}  // namespace

void CapOutput(UnprocessedExecResult& result, int max_output_bytes) {
    auto budget = static_cast<std::size_t>(std::max(max_output_bytes, 0));
    const auto keep = [&budget](std::string& text) {
        if (text.size() <= budget) {
            budget -= text.size();
            return false;
        }
        text.resize(budget);
        budget = 0;
        return true;
    };
    const bool cut_stdout = keep(result.stdout_text);
    const bool cut_stderr = keep(result.stderr_text);
    if (cut_stdout || cut_stderr) {
        result.truncated = true;
    }
}

SandboxExecutor::SandboxExecutor(SandboxSettings settings)
    : settings_(std::move(settings)) {}

UnprocessedExecResult SandboxExecutor::Run(const std::string& executable,
                                           const std::vector<std::string>& args,
                                           const ExecutionOptions& options) const {
    UnprocessedExecResult result{};
    utils::TempDirectory io_dir("remex-io-");
    const auto stdin_path = io_dir.Path() / "stdin";
    const auto stdout_path = io_dir.Path() / "stdout";
    const auto stderr_path = io_dir.Path() / "stderr";
    if (!utils::WriteFile(stdin_path, options.input)) {
        throw ExecFailure(-1, "", "Error: cannot stage stdin for " + executable);
    }

    const auto variables = BuildEnvironment(options);
    bp::environment env = boost::this_process::environment();
    env.clear();
    for (const auto& [key, value] : variables) {
        env[key] = value;
    }

    std::string working_dir = options.custom_cwd;
    if (working_dir.empty()) {
        working_dir = options.app_home;
    }
    if (working_dir.empty()) {
        working_dir = std::filesystem::path(executable).parent_path().string();
    }

    std::string program = executable;
    std::vector<std::string> argv = args;
    if (settings_.type == "nsjail") {
        program = settings_.nsjail_path;
        argv.clear();
        if (!settings_.nsjail_config.empty()) {
            argv.insert(argv.end(), {"--config", settings_.nsjail_config});
        }
        argv.insert(argv.end(), {"--quiet", "--cwd", working_dir});
        for (const auto& [key, value] : variables) {
            argv.insert(argv.end(), {"--env", key + "=" + value});
        }
        argv.push_back("--");
        argv.push_back(executable);
        argv.insert(argv.end(), args.begin(), args.end());
    }

    const auto max_output = static_cast<std::uintmax_t>(std::max(options.max_output_bytes, 0));
    const auto start = std::chrono::steady_clock::now();
    try {
        bp::group group;
        bp::child child_process(
            bp::exe = program,
            bp::args = argv,
            env,
            bp::start_dir = working_dir,
            bp::std_in < stdin_path.string(),
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            group);

        const auto deadline = start + std::chrono::milliseconds(options.timeout_ms);
        bool finished = false;
        bool overflowed = false;
        int status = 0;
        const pid_t pid = child_process.id();
        while (true) {
            const auto waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                finished = true;
                break;
            }
            if (waited < 0) {
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
                break;
            }
            if (FileSize(stdout_path) + FileSize(stderr_path) > max_output) {
                overflowed = true;
                break;
            }
            std::this_thread::sleep_for(kPollInterval);
        }

        if (!finished && (result.timed_out || overflowed)) {
            ::killpg(pid, SIGTERM);
            finished = WaitFor(pid, status, kTerminateGrace);
            if (!finished) {
                std::error_code ec;
                group.terminate(ec);
                finished = ::waitpid(pid, &status, 0) == pid;
            }
        }

        if (finished) {
            if (WIFEXITED(status)) {
                result.code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.code = 128 + WTERMSIG(status);
            }
        }
        if (result.timed_out && result.code == 0) {
            result.code = 124;
        }
    } catch (const bp::process_error& ex) {
        throw ExecFailure(ex.code().value() != 0 ? ex.code().value() : -1,
                          "",
                          std::string("Error: exec failed: ") + ex.what());
    }
    const auto end = std::chrono::steady_clock::now();
    result.exec_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    result.stdout_text = ReadPrefix(stdout_path, static_cast<std::size_t>(max_output) + 1);
    result.stderr_text = ReadPrefix(stderr_path, static_cast<std::size_t>(max_output) + 1);
    CapOutput(result, options.max_output_bytes);

    utils::LogDebug("sandbox", "process finished", {
        {"executable", executable},
        {"code", std::to_string(result.code)},
        {"timed_out", result.timed_out ? "true" : "false"},
        {"truncated", result.truncated ? "true" : "false"},
        {"ms", std::to_string(result.exec_time_ms)}});
    return result;
}

}  // namespace remex::sandbox
