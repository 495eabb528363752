#include "queue/remote_execution_message.hpp"

namespace remex::queue {
namespace {

nlohmann::json OptionsToJson(const std::vector<RuntimeToolOption>& options) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& option : options) {
        json.push_back({{"name", option.name}, {"value", option.value}});
    }
    return json;
}

std::vector<RuntimeToolOption> OptionsFromJson(const nlohmann::json& json) {
    std::vector<RuntimeToolOption> options;
    if (!json.is_array()) {
        return options;
    }
    for (const auto& item : json) {
        if (!item.is_object()) {
            continue;
        }
        RuntimeToolOption option{};
        option.name = item.value("name", "");
        if (item.contains("value")) {
            option.value = item["value"].is_string() ? item["value"].get<std::string>()
                                                     : item["value"].dump();
        }
        options.push_back(std::move(option));
    }
    return options;
}

struct RuntimeToolToJson {
    nlohmann::json operator()(const EnvInjection& tool) const {
        return {{"name", runtime_tool_name::kEnv}, {"options", OptionsToJson(tool.variables)}};
    }
    nlohmann::json operator()(const ProfilerWrap& tool) const {
        return {{"name", tool.tool}, {"options", OptionsToJson(tool.options)}};
    }
    nlohmann::json operator()(const UnknownTool& tool) const {
        return {{"name", tool.name}, {"options", OptionsToJson(tool.options)}};
    }
};

RuntimeTool RuntimeToolFromJson(const nlohmann::json& json) {
    const auto name = json.value("name", "");
    auto options = json.contains("options") ? OptionsFromJson(json["options"])
                                            : std::vector<RuntimeToolOption>{};
    if (name == runtime_tool_name::kEnv) {
        return EnvInjection{std::move(options)};
    }
    if (name == runtime_tool_name::kHeaptrack) {
        return ProfilerWrap{name, std::move(options)};
    }
    return UnknownTool{name, std::move(options)};
}

}  // namespace

nlohmann::json ToJson(const ExecutionParams& params) {
    nlohmann::json json = nlohmann::json::object();
    if (const auto* list = std::get_if<std::vector<std::string>>(&params.args)) {
        json["args"] = *list;
    } else {
        json["args"] = std::get<std::string>(params.args);
    }
    json["stdin"] = params.stdin_input;
    json["runtimeTools"] = nlohmann::json::array();
    for (const auto& tool : params.runtime_tools) {
        json["runtimeTools"].push_back(std::visit(RuntimeToolToJson{}, tool));
    }
    return json;
}

ExecutionParams ExecutionParamsFromJson(const nlohmann::json& json) {
    ExecutionParams params{};
    if (!json.is_object()) {
        return params;
    }
    if (json.contains("args")) {
        const auto& args = json["args"];
        if (args.is_string()) {
            params.args = args.get<std::string>();
        } else if (args.is_array()) {
            std::vector<std::string> list;
            for (const auto& item : args) {
                if (!item.is_string()) {
                    throw MessageFormatError("params.args must contain strings");
                }
                list.push_back(item.get<std::string>());
            }
            params.args = std::move(list);
        } else if (!args.is_null()) {
            throw MessageFormatError("params.args must be a string or an array");
        }
    }
    if (json.contains("stdin") && json["stdin"].is_string()) {
        params.stdin_input = json["stdin"].get<std::string>();
    }
    if (json.contains("runtimeTools") && json["runtimeTools"].is_array()) {
        for (const auto& item : json["runtimeTools"]) {
            if (item.is_object()) {
                params.runtime_tools.push_back(RuntimeToolFromJson(item));
            }
        }
    }
    return params;
}

nlohmann::json ToJson(const RemoteExecutionMessage& message) {
    return {
        {"guid", message.guid},
        {"hash", message.hash},
        {"params", ToJson(message.params)}
    };
}

RemoteExecutionMessage RemoteExecutionMessageFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw MessageFormatError("message body is not an object");
    }
    if (!json.contains("guid") || !json["guid"].is_string()) {
        throw MessageFormatError("message has no guid");
    }
    if (!json.contains("hash") || !json["hash"].is_string()) {
        throw MessageFormatError("message has no hash");
    }
    RemoteExecutionMessage message{};
    message.guid = json["guid"].get<std::string>();
    message.hash = json["hash"].get<std::string>();
    if (json.contains("params")) {
        try {
            message.params = ExecutionParamsFromJson(json["params"]);
        } catch (const nlohmann::json::exception& ex) {
            throw MessageFormatError(std::string("message params are malformed: ") + ex.what());
        }
    }
    return message;
}

std::string Serialize(const RemoteExecutionMessage& message) {
    return ToJson(message).dump();
}

RemoteExecutionMessage Deserialize(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        throw MessageFormatError("message body is not valid json");
    }
    return RemoteExecutionMessageFromJson(json);
}

}  // namespace remex::queue
