#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>

namespace remex::utils {
namespace {

std::mutex g_log_mutex;
LogConfig g_log_config{};

void Emit(LogLevel level,
          const std::string& tag,
          const std::string& message,
          std::unordered_map<std::string, std::string> fields) {
    LogMessage msg{};
    msg.level = level;
    msg.tag = tag;
    msg.message = message;
    msg.fields = std::move(fields);
    Log(msg);
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_config = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_log_config;
}

void Log(const LogMessage& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(msg.level) < static_cast<int>(g_log_config.min_level)) {
        return;
    }
    std::cerr << "[" << (msg.tag.empty() ? "remex" : msg.tag) << "] ";
    if (msg.level == LogLevel::kWarn || msg.level == LogLevel::kError) {
        std::cerr << ToString(msg.level) << " ";
    }
    std::cerr << msg.message;
    // fields in key order
    const std::map<std::string, std::string> ordered(msg.fields.begin(), msg.fields.end());
    for (const auto& [key, value] : ordered) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

void LogDebug(const std::string& tag,
              const std::string& message,
              std::unordered_map<std::string, std::string> fields) {
    Emit(LogLevel::kDebug, tag, message, std::move(fields));
}

void LogInfo(const std::string& tag,
             const std::string& message,
             std::unordered_map<std::string, std::string> fields) {
    Emit(LogLevel::kInfo, tag, message, std::move(fields));
}

void LogWarn(const std::string& tag,
             const std::string& message,
             std::unordered_map<std::string, std::string> fields) {
    Emit(LogLevel::kWarn, tag, message, std::move(fields));
}

void LogError(const std::string& tag,
              const std::string& message,
              std::unordered_map<std::string, std::string> fields) {
    Emit(LogLevel::kError, tag, message, std::move(fields));
}

}  // namespace remex::utils
