#pragma once

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"

namespace remex::queue {

class MessageFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace runtime_tool_name {
constexpr const char* kEnv = "env";
constexpr const char* kHeaptrack = "heaptrack";
}  // namespace runtime_tool_name

struct RuntimeToolOption {
    std::string name;
    std::string value;
};

// `env`: name/value pairs injected into the sandbox environment.
struct EnvInjection {
    std::vector<RuntimeToolOption> variables;
};

// Profiling tool wrapping the launch (currently `heaptrack`).
struct ProfilerWrap {
    std::string tool;
    std::vector<RuntimeToolOption> options;
};

// Tags this build does not know; carried along and ignored by execution.
struct UnknownTool {
    std::string name;
    std::vector<RuntimeToolOption> options;
};

using RuntimeTool = std::variant<EnvInjection, ProfilerWrap, UnknownTool>;

struct ExecutionParams {
    // Either an argv list or a single string tokenized at execution time.
    std::variant<std::vector<std::string>, std::string> args = std::vector<std::string>{};
    std::string stdin_input;
    std::vector<RuntimeTool> runtime_tools;
};

struct RemoteExecutionMessage {
    std::string guid;
    std::string hash;
    ExecutionParams params;
};

nlohmann::json ToJson(const ExecutionParams& params);
ExecutionParams ExecutionParamsFromJson(const nlohmann::json& json);

nlohmann::json ToJson(const RemoteExecutionMessage& message);
RemoteExecutionMessage RemoteExecutionMessageFromJson(const nlohmann::json& json);

// Canonical text encoding; identical messages produce identical bytes.
std::string Serialize(const RemoteExecutionMessage& message);
// Throws MessageFormatError.
RemoteExecutionMessage Deserialize(const std::string& body);

}  // namespace remex::queue
