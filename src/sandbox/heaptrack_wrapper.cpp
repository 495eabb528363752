#include "sandbox/heaptrack_wrapper.hpp"

#include <system_error>

#include "utils/logging.hpp"

namespace remex::sandbox {
namespace {

constexpr const char* kRecordingPrefix = "heaptrack";
constexpr const char* kToolsPath = "/usr/local/bin:/usr/bin:/bin";

}  // namespace

HeaptrackWrapper::HeaptrackWrapper(std::filesystem::path work_dir,
                                   const SandboxExecutor& sandbox,
                                   HeaptrackSettings settings,
                                   std::vector<queue::RuntimeToolOption> options)
    : work_dir_(std::move(work_dir))
    , sandbox_(sandbox)
    , settings_(std::move(settings))
    , options_(std::move(options)) {}

bool HeaptrackWrapper::IsSupported(const HeaptrackSettings& settings) {
    if (settings.heaptrack_path.empty() || settings.heaptrack_print_path.empty()) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(settings.heaptrack_path, ec) &&
        std::filesystem::is_regular_file(settings.heaptrack_print_path, ec);
}

std::string HeaptrackWrapper::Option(const std::string& name, const std::string& fallback) const {
    for (const auto& option : options_) {
        if (option.name == name && !option.value.empty()) {
            return option.value;
        }
    }
    return fallback;
}

UnprocessedExecResult HeaptrackWrapper::Exec(const std::string& executable,
                                             const std::vector<std::string>& args,
                                             const ExecutionOptions& options) const {
    // heaptrack is a shell script and needs the usual tools next to the
    // program's own PATH
    auto wrapped_options = options;
    auto& path = wrapped_options.env["PATH"];
    path = path.empty() ? kToolsPath : path + ":" + kToolsPath;

    std::vector<std::string> wrapped_args = {
        "--record-only",
        "--output",
        (work_dir_ / kRecordingPrefix).string(),
        executable
    };
    wrapped_args.insert(wrapped_args.end(), args.begin(), args.end());

    auto result = sandbox_.Run(settings_.heaptrack_path, wrapped_args, wrapped_options);

    const auto destination = Option("summary", "stderr");
    if (destination == "none") {
        return result;
    }
    const auto recording = FindRecording();
    if (recording.empty()) {
        utils::LogWarn("heaptrack", "no recording produced", {{"dir", work_dir_.string()}});
        return result;
    }
    const auto report = PrintReport(recording, wrapped_options);
    auto& target = destination == "stdout" ? result.stdout_text : result.stderr_text;
    if (!target.empty() && target.back() != '\n') {
        target.push_back('\n');
    }
    target += report;
    CapOutput(result, options.max_output_bytes);
    return result;
}

std::filesystem::path HeaptrackWrapper::FindRecording() const {
    std::filesystem::path newest;
    std::filesystem::file_time_type newest_time{};
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(work_dir_, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const auto name = entry.path().filename().string();
        if (name.rfind(kRecordingPrefix, 0) != 0) {
            continue;
        }
        const auto time = entry.last_write_time(ec);
        if (newest.empty() || time > newest_time) {
            newest = entry.path();
            newest_time = time;
        }
    }
    return newest;
}

std::string HeaptrackWrapper::PrintReport(const std::filesystem::path& recording,
                                          const ExecutionOptions& options) const {
    std::vector<std::string> args;
    if (Option("details", "no") != "yes") {
        args = {"--print-peaks", "0", "--print-allocators", "0", "--print-temporary", "0"};
    } else {
        args = {"--print-leaks", "1"};
    }
    args.push_back(recording.string());

    auto print_options = options;
    print_options.input.clear();
    print_options.custom_cwd = work_dir_.string();
    try {
        const auto printed = sandbox_.Run(settings_.heaptrack_print_path, args, print_options);
        if (printed.code != 0) {
            utils::LogWarn("heaptrack", "heaptrack_print failed", {
                {"code", std::to_string(printed.code)},
                {"stderr", printed.stderr_text}});
        }
        return printed.stdout_text;
    } catch (const ExecFailure& ex) {
        utils::LogWarn("heaptrack", "heaptrack_print could not start", {{"error", ex.what()}});
        return {};
    }
}

}  // namespace remex::sandbox
