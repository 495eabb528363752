#pragma once

#include <stdexcept>
#include <string>

namespace remex::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ExecQueueConfig {
    std::string queue_url;
    std::string dead_letter_url;
    int visibility_timeout_s = 30;
    int poll_interval_ms = 500;
    int startup_delay_ms = 1500;
};

struct ExecutionConfig {
    int timeout_ms = 2000;
    int max_output_bytes = 32 * 1024;
    std::string sandbox_type = "none";
    std::string nsjail_path = "nsjail";
    std::string nsjail_config;
    bool sanitizer_env_hints = true;
    std::string heaptrack_path;
    std::string heaptrack_print_path;
};

struct CacheConfig {
    std::string dir = "~/.remex/cache";
};

struct EventsConfig {
    std::string url;
    int timeout_ms = 5000;
    bool dedup_guids = false;
    int dedup_capacity = 4096;
};

struct WorkerConfig {
    std::string instruction_set;
    std::string os;
    std::string specialty;
};

struct BrokerConfig {
    std::string host = "127.0.0.1";
    int port = 9324;
    int dedup_window_s = 300;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    ExecQueueConfig execqueue;
    ExecutionConfig execution;
    CacheConfig cache;
    EventsConfig events;
    WorkerConfig worker;
    BrokerConfig broker;
    LoggingConfig logging;
};

}  // namespace remex::config
