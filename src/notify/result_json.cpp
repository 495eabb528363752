#include "notify/result_json.hpp"

namespace remex::notify {

nlohmann::json ToJson(const sandbox::OutputLine& line) {
    nlohmann::json json = {{"text", line.text}};
    if (line.tag) {
        nlohmann::json tag = {{"line", line.tag->line}, {"column", line.tag->column}};
        if (!line.tag->file.empty()) {
            tag["file"] = line.tag->file;
        }
        json["tag"] = std::move(tag);
    }
    return json;
}

nlohmann::json ToJson(const sandbox::BasicExecutionResult& result) {
    nlohmann::json stdout_lines = nlohmann::json::array();
    for (const auto& line : result.stdout_lines) {
        stdout_lines.push_back(ToJson(line));
    }
    nlohmann::json stderr_lines = nlohmann::json::array();
    for (const auto& line : result.stderr_lines) {
        stderr_lines.push_back(ToJson(line));
    }

    nlohmann::json json = {
        {"code", result.code},
        {"timedOut", result.timed_out},
        {"truncated", result.truncated},
        {"didExecute", result.did_execute},
        {"stdout", std::move(stdout_lines)},
        {"stderr", std::move(stderr_lines)},
        {"execTime", result.exec_time_ms},
        {"processExecutionResultTime", result.process_execution_result_time},
        {"buildResult", {{"packageDownloadAndUnzipTime", result.package_download_and_unzip_ms}}}
    };
    if (!result.error.empty()) {
        json["error"] = result.error;
    }
    if (!result.error_kind.empty()) {
        json["errorKind"] = result.error_kind;
    }
    return json;
}

sandbox::BasicExecutionResult FailureResult(const std::string& error, const std::string& error_kind) {
    sandbox::BasicExecutionResult result{};
    result.code = -1;
    result.did_execute = false;
    result.error = error;
    result.error_kind = error_kind;
    result.stderr_lines.push_back(sandbox::OutputLine{error, std::nullopt});
    return result;
}

}  // namespace remex::notify
