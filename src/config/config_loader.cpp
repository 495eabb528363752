#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace remex::config {
namespace {

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = utils::GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return utils::GetEnv(secondary);
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = utils::GetEnv("REMEX_CONFIG");
    if (!explicit_path.empty()) {
        return utils::ExpandHome(explicit_path);
    }
    return utils::GetHomePath() / ".remex" / "config.json";
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyInt(int& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplyBool(bool& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("execqueue") && data["execqueue"].is_object()) {
        const auto& queue = data["execqueue"];
        ApplyString(config.execqueue.queue_url, queue, "queueUrl");
        ApplyString(config.execqueue.dead_letter_url, queue, "deadLetterUrl");
        ApplyInt(config.execqueue.visibility_timeout_s, queue, "visibilityTimeoutS");
        ApplyInt(config.execqueue.poll_interval_ms, queue, "pollIntervalMs");
        ApplyInt(config.execqueue.startup_delay_ms, queue, "startupDelayMs");
    }

    if (data.contains("execution") && data["execution"].is_object()) {
        const auto& execution = data["execution"];
        ApplyInt(config.execution.timeout_ms, execution, "binaryExecTimeoutMs");
        ApplyInt(config.execution.max_output_bytes, execution, "maxExecutableOutputSize");
        ApplyString(config.execution.sandbox_type, execution, "sandboxType");
        ApplyString(config.execution.nsjail_path, execution, "nsjailPath");
        ApplyString(config.execution.nsjail_config, execution, "nsjailConfig");
        ApplyBool(config.execution.sanitizer_env_hints, execution, "sanitizerEnvHints");
        ApplyString(config.execution.heaptrack_path, execution, "heaptrackPath");
        ApplyString(config.execution.heaptrack_print_path, execution, "heaptrackPrintPath");
    }

    if (data.contains("cache") && data["cache"].is_object()) {
        ApplyString(config.cache.dir, data["cache"], "dir");
    }

    if (data.contains("events") && data["events"].is_object()) {
        const auto& events = data["events"];
        ApplyString(config.events.url, events, "url");
        ApplyInt(config.events.timeout_ms, events, "timeoutMs");
        ApplyBool(config.events.dedup_guids, events, "dedupGuids");
        ApplyInt(config.events.dedup_capacity, events, "dedupCapacity");
    }

    if (data.contains("worker") && data["worker"].is_object()) {
        const auto& worker = data["worker"];
        ApplyString(config.worker.instruction_set, worker, "instructionSet");
        ApplyString(config.worker.os, worker, "os");
        ApplyString(config.worker.specialty, worker, "specialty");
    }

    if (data.contains("broker") && data["broker"].is_object()) {
        const auto& broker = data["broker"];
        ApplyString(config.broker.host, broker, "host");
        ApplyInt(config.broker.port, broker, "port");
        ApplyInt(config.broker.dedup_window_s, broker, "dedupWindowS");
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void OverrideString(std::string& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = value;
    }
}

void OverrideInt(int& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void OverrideBool(bool& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseBool(value);
    }
}

void ApplyEnvOverrides(Config& config) {
    OverrideString(config.execqueue.queue_url,
                   "REMEX_EXECQUEUE__QUEUE_URL", "REMEX_EXECQUEUE_QUEUE_URL");
    OverrideString(config.execqueue.dead_letter_url,
                   "REMEX_EXECQUEUE__DEAD_LETTER_URL", "REMEX_EXECQUEUE_DEAD_LETTER_URL");
    OverrideInt(config.execqueue.visibility_timeout_s,
                "REMEX_EXECQUEUE__VISIBILITY_TIMEOUT_S", "REMEX_EXECQUEUE_VISIBILITY_TIMEOUT_S");
    OverrideInt(config.execqueue.poll_interval_ms,
                "REMEX_EXECQUEUE__POLL_INTERVAL_MS", "REMEX_EXECQUEUE_POLL_INTERVAL_MS");
    OverrideInt(config.execqueue.startup_delay_ms,
                "REMEX_EXECQUEUE__STARTUP_DELAY_MS", "REMEX_EXECQUEUE_STARTUP_DELAY_MS");

    OverrideInt(config.execution.timeout_ms,
                "REMEX_EXECUTION__BINARY_EXEC_TIMEOUT_MS", "REMEX_EXECUTION_TIMEOUT_MS");
    OverrideInt(config.execution.max_output_bytes,
                "REMEX_EXECUTION__MAX_EXECUTABLE_OUTPUT_SIZE", "REMEX_EXECUTION_MAX_OUTPUT_BYTES");
    OverrideString(config.execution.sandbox_type,
                   "REMEX_EXECUTION__SANDBOX_TYPE", "REMEX_EXECUTION_SANDBOX_TYPE");
    OverrideString(config.execution.nsjail_path,
                   "REMEX_EXECUTION__NSJAIL_PATH", "REMEX_EXECUTION_NSJAIL_PATH");
    OverrideString(config.execution.nsjail_config,
                   "REMEX_EXECUTION__NSJAIL_CONFIG", "REMEX_EXECUTION_NSJAIL_CONFIG");
    OverrideBool(config.execution.sanitizer_env_hints,
                 "REMEX_EXECUTION__SANITIZER_ENV_HINTS", "REMEX_EXECUTION_SANITIZER_ENV_HINTS");
    OverrideString(config.execution.heaptrack_path,
                   "REMEX_EXECUTION__HEAPTRACK_PATH", "REMEX_EXECUTION_HEAPTRACK_PATH");
    OverrideString(config.execution.heaptrack_print_path,
                   "REMEX_EXECUTION__HEAPTRACK_PRINT_PATH", "REMEX_EXECUTION_HEAPTRACK_PRINT_PATH");

    OverrideString(config.cache.dir, "REMEX_CACHE__DIR", "REMEX_CACHE_DIR");

    OverrideString(config.events.url, "REMEX_EVENTS__URL", "REMEX_EVENTS_URL");
    OverrideInt(config.events.timeout_ms, "REMEX_EVENTS__TIMEOUT_MS", "REMEX_EVENTS_TIMEOUT_MS");
    OverrideBool(config.events.dedup_guids, "REMEX_EVENTS__DEDUP_GUIDS", "REMEX_EVENTS_DEDUP_GUIDS");
    OverrideInt(config.events.dedup_capacity,
                "REMEX_EVENTS__DEDUP_CAPACITY", "REMEX_EVENTS_DEDUP_CAPACITY");

    OverrideString(config.worker.instruction_set,
                   "REMEX_WORKER__INSTRUCTION_SET", "REMEX_WORKER_INSTRUCTION_SET");
    OverrideString(config.worker.os, "REMEX_WORKER__OS", "REMEX_WORKER_OS");
    OverrideString(config.worker.specialty, "REMEX_WORKER__SPECIALTY", "REMEX_WORKER_SPECIALTY");

    OverrideString(config.broker.host, "REMEX_BROKER__HOST", "REMEX_BROKER_HOST");
    OverrideInt(config.broker.port, "REMEX_BROKER__PORT", "REMEX_BROKER_PORT");
    OverrideInt(config.broker.dedup_window_s,
                "REMEX_BROKER__DEDUP_WINDOW_S", "REMEX_BROKER_DEDUP_WINDOW_S");

    OverrideString(config.logging.level, "REMEX_LOGGING__LEVEL", "REMEX_LOG_LEVEL");
}

}  // namespace

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "ignoring malformed config file",
                           {{"path", path.string()}, {"error", ex.what()}});
        }
    }

    ApplyEnvOverrides(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFromFile(GetConfigPath());
}

void ValidateWorkerConfig(const Config& config) {
    if (config.execqueue.queue_url.empty()) {
        throw ConfigError("execqueue.queueUrl property required");
    }
    if (config.execution.timeout_ms <= 0) {
        throw ConfigError("execution.binaryExecTimeoutMs must be positive");
    }
    if (config.execution.max_output_bytes <= 0) {
        throw ConfigError("execution.maxExecutableOutputSize must be positive");
    }
    if (config.execution.sandbox_type != "none" && config.execution.sandbox_type != "nsjail") {
        throw ConfigError("unsupported execution.sandboxType: " + config.execution.sandbox_type);
    }
}

}  // namespace remex::config
