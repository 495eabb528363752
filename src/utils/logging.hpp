#pragma once

#include <string>
#include <unordered_map>

namespace remex::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

struct LogMessage {
    LogLevel level = LogLevel::kInfo;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[tag] message k=v ..." to stderr.
void Log(const LogMessage& msg);

void LogDebug(const std::string& tag,
              const std::string& message,
              std::unordered_map<std::string, std::string> fields = {});
void LogInfo(const std::string& tag,
             const std::string& message,
             std::unordered_map<std::string, std::string> fields = {});
void LogWarn(const std::string& tag,
             const std::string& message,
             std::unordered_map<std::string, std::string> fields = {});
void LogError(const std::string& tag,
              const std::string& message,
              std::unordered_map<std::string, std::string> fields = {});

}  // namespace remex::utils
