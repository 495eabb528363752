#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "sandbox/exec_types.hpp"

namespace remex::notify {

nlohmann::json ToJson(const sandbox::OutputLine& line);
nlohmann::json ToJson(const sandbox::BasicExecutionResult& result);

// Result for a request that failed before its executable ran.
sandbox::BasicExecutionResult FailureResult(const std::string& error, const std::string& error_kind);

}  // namespace remex::notify
