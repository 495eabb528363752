#include <gtest/gtest.h>

#include "config/config_loader.hpp"
#include "test_support.hpp"
#include "utils/common.hpp"

namespace remex::config {
namespace {

TEST(ConfigLoaderTest, MissingFileYieldsDefaults) {
    utils::TempDirectory dir("remex-config-");
    const auto config = LoadConfigFromFile(dir.Path() / "absent.json");
    EXPECT_TRUE(config.execqueue.queue_url.empty());
    EXPECT_EQ(config.execqueue.poll_interval_ms, 500);
    EXPECT_EQ(config.execqueue.startup_delay_ms, 1500);
    EXPECT_EQ(config.execution.timeout_ms, 2000);
    EXPECT_EQ(config.execution.max_output_bytes, 32768);
    EXPECT_EQ(config.execution.sandbox_type, "none");
    EXPECT_EQ(config.broker.port, 9324);
}

TEST(ConfigLoaderTest, ReadsSectionsFromFile) {
    utils::TempDirectory dir("remex-config-");
    const auto path = dir.Path() / "config.json";
    utils::WriteFile(path, R"({
        "execqueue": {"queueUrl": "http://127.0.0.1:9324/queues/exec", "pollIntervalMs": 100},
        "execution": {"binaryExecTimeoutMs": 5000, "sandboxType": "nsjail"},
        "events": {"url": "ws://localhost:1234/events", "dedupGuids": true},
        "worker": {"instructionSet": "aarch64"}
    })");
    const auto config = LoadConfigFromFile(path);
    EXPECT_EQ(config.execqueue.queue_url, "http://127.0.0.1:9324/queues/exec");
    EXPECT_EQ(config.execqueue.poll_interval_ms, 100);
    EXPECT_EQ(config.execution.timeout_ms, 5000);
    EXPECT_EQ(config.execution.sandbox_type, "nsjail");
    EXPECT_EQ(config.events.url, "ws://localhost:1234/events");
    EXPECT_TRUE(config.events.dedup_guids);
    EXPECT_EQ(config.worker.instruction_set, "aarch64");
}

TEST(ConfigLoaderTest, MalformedFileKeepsDefaults) {
    utils::TempDirectory dir("remex-config-");
    const auto path = dir.Path() / "config.json";
    utils::WriteFile(path, "{ not json");
    const auto config = LoadConfigFromFile(path);
    EXPECT_EQ(config.execution.timeout_ms, 2000);
}

TEST(ConfigLoaderTest, EnvironmentOverridesFile) {
    utils::TempDirectory dir("remex-config-");
    const auto path = dir.Path() / "config.json";
    utils::WriteFile(path, R"({"execqueue": {"queueUrl": "from-file"}})");
    testing::ScopedEnv queue_url("REMEX_EXECQUEUE__QUEUE_URL", "from-env");
    testing::ScopedEnv timeout("REMEX_EXECUTION_TIMEOUT_MS", "750");
    const auto config = LoadConfigFromFile(path);
    EXPECT_EQ(config.execqueue.queue_url, "from-env");
    EXPECT_EQ(config.execution.timeout_ms, 750);
}

TEST(ConfigLoaderTest, WorkerNeedsAQueueUrl) {
    Config config{};
    EXPECT_THROW(ValidateWorkerConfig(config), ConfigError);
    config.execqueue.queue_url = "http://127.0.0.1:9324/queues/exec";
    EXPECT_NO_THROW(ValidateWorkerConfig(config));
    config.execution.sandbox_type = "docker";
    EXPECT_THROW(ValidateWorkerConfig(config), ConfigError);
}

}  // namespace
}  // namespace remex::config
