#include "routing/execution_triple.hpp"

#include <algorithm>
#include <cctype>
#include <sys/utsname.h>

#include "config/config_schema.hpp"

namespace remex::routing {
namespace {

constexpr const char* kChannelSuffix = ".fifo";

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string NormalizeMachine(const std::string& machine) {
    const auto lowered = ToLower(machine);
    if (lowered == "x86_64" || lowered == "amd64") {
        return instruction_set::kAmd64;
    }
    if (lowered == "aarch64" || lowered == "arm64") {
        return instruction_set::kAarch64;
    }
    return lowered;
}

}  // namespace

ExecutionTriple::ExecutionTriple()
    : instruction_set_(instruction_set::kAmd64)
    , os_("linux")
    , specialty_(specialty::kCpu) {}

ExecutionTriple::ExecutionTriple(std::string instruction_set, std::string os, std::string specialty)
    : instruction_set_(std::move(instruction_set))
    , os_(std::move(os))
    , specialty_(std::move(specialty)) {}

std::string ExecutionTriple::ToString() const {
    return instruction_set_ + "-" + os_ + "-" + specialty_;
}

std::optional<ExecutionTriple> ExecutionTriple::Parse(const std::string& value) {
    const auto first = value.find('-');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto second = value.find('-', first + 1);
    if (second == std::string::npos || value.find('-', second + 1) != std::string::npos) {
        return std::nullopt;
    }
    auto isa = value.substr(0, first);
    auto os = value.substr(first + 1, second - first - 1);
    auto spec = value.substr(second + 1);
    if (isa.empty() || os.empty() || spec.empty()) {
        return std::nullopt;
    }
    return ExecutionTriple(std::move(isa), std::move(os), std::move(spec));
}

ExecutionTriple ExecutionTriple::ForCurrentHost() {
    ExecutionTriple triple;
    struct utsname info {};
    if (::uname(&info) == 0) {
        triple.instruction_set_ = NormalizeMachine(info.machine);
        triple.os_ = ToLower(info.sysname);
    }
    return triple;
}

std::string RoutingKey(const std::string& base, const ExecutionTriple& triple) {
    if (base.empty()) {
        throw config::ConfigError("execqueue.queueUrl property required");
    }
    if (triple.InstructionSet().empty() || triple.OperatingSystem().empty() ||
        triple.Specialty().empty()) {
        throw config::ConfigError("execution triple has an empty field: " + triple.ToString());
    }
    return base + "-" + triple.ToString() + kChannelSuffix;
}

}  // namespace remex::routing
