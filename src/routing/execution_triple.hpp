#pragma once

#include <optional>
#include <string>

namespace remex::routing {

namespace instruction_set {
constexpr const char* kAmd64 = "amd64";
constexpr const char* kAarch64 = "aarch64";
}  // namespace instruction_set

namespace specialty {
constexpr const char* kCpu = "cpu";
constexpr const char* kNvGpu = "nvgpu";
constexpr const char* kAmdGpu = "amdgpu";
}  // namespace specialty

// Routing key for a class of compatible execution hosts.
class ExecutionTriple {
public:
    ExecutionTriple();
    ExecutionTriple(std::string instruction_set, std::string os, std::string specialty);

    const std::string& InstructionSet() const { return instruction_set_; }
    const std::string& OperatingSystem() const { return os_; }
    const std::string& Specialty() const { return specialty_; }

    // "isa-os-specialty"
    std::string ToString() const;

    static std::optional<ExecutionTriple> Parse(const std::string& value);
    static ExecutionTriple ForCurrentHost();

    bool operator==(const ExecutionTriple& other) const = default;

private:
    std::string instruction_set_;
    std::string os_;
    std::string specialty_;
};

// Queue partition for `triple` below `base`. Throws config::ConfigError on an
// empty base or an empty field.
std::string RoutingKey(const std::string& base, const ExecutionTriple& triple);

}  // namespace remex::routing
