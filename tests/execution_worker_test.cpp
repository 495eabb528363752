#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "queue/memory_broker.hpp"
#include "test_support.hpp"
#include "worker/execution_worker.hpp"

namespace remex::worker {
namespace {

using namespace std::chrono_literals;

constexpr const char* kBase = "http://broker/queues/exec";

queue::RemoteExecutionMessage Message(const std::string& guid,
                                      const std::string& hash,
                                      std::vector<std::string> args = {}) {
    queue::RemoteExecutionMessage message{};
    message.guid = guid;
    message.hash = hash;
    message.params.args = std::move(args);
    return message;
}

class ExecutionWorkerTest : public ::testing::Test {
protected:
    ExecutionWorkerTest()
        : queue_(broker_, kBase, triple_)
        , requester_(broker_, kBase) {
        settings_.timeout_ms = 2000;
    }

    std::unique_ptr<ExecutionWorker> MakeWorker(WorkerOptions options = {}) {
        return std::make_unique<ExecutionWorker>(
            queue_,
            [this]() {
                return std::make_unique<sandbox::LocalExecutionEnvironment>(cache_, settings_);
            },
            testing::RecordingNotifierFactory(log_),
            options);
    }

    const routing::ExecutionTriple triple_{"x86_64", "linux", "default"};
    queue::InMemoryBroker broker_;
    queue::WorkerQueue queue_;
    queue::ExecuteRequester requester_;
    utils::TempDirectory cache_dir_{"remex-cache-"};
    cache::DiskCache cache_{cache_dir_.Path()};
    sandbox::EnvironmentSettings settings_{};
    std::shared_ptr<testing::NotificationLog> log_ = std::make_shared<testing::NotificationLog>();
};

TEST_F(ExecutionWorkerTest, RunsRequestAndDeliversResult) {
    testing::PutScriptBundle(cache_, "abc123",
                             "if [ \"$1\" = --version ]; then echo \"tool 1.2.3\"; fi");
    requester_.Push(triple_, Message("g1", "abc123", {"--version"}));

    auto worker = MakeWorker();
    EXPECT_TRUE(worker->RunOnce());

    const auto sent = log_->Sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].guid, "g1");
    EXPECT_EQ(sent[0].result["code"], 0);
    EXPECT_EQ(sent[0].result["didExecute"], true);
    EXPECT_EQ(testing::JoinLines(sent[0].result["stdout"]), "tool 1.2.3");
    EXPECT_EQ(log_->CloseCount(), 1);
    EXPECT_FALSE(worker->RunOnce());
}

TEST_F(ExecutionWorkerTest, CacheMissDeliversFailureAndLoopContinues) {
    requester_.Push(triple_, Message("g1", "abc123", {"--version"}));
    auto worker = MakeWorker();
    EXPECT_TRUE(worker->RunOnce());

    auto sent = log_->Sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].guid, "g1");
    EXPECT_EQ(sent[0].result["didExecute"], false);
    EXPECT_EQ(sent[0].result["errorKind"], "cache-miss");

    testing::PutScriptBundle(cache_, "def456", "echo second");
    requester_.Push(triple_, Message("g2", "def456"));
    EXPECT_TRUE(worker->RunOnce());
    sent = log_->Sent();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[1].guid, "g2");
    EXPECT_EQ(testing::JoinLines(sent[1].result["stdout"]), "second");
}

TEST_F(ExecutionWorkerTest, CorruptPackageIsReportedDistinctly) {
    ASSERT_TRUE(cache_.Put("broken", "not a tarball"));
    requester_.Push(triple_, Message("g1", "broken"));
    auto worker = MakeWorker();
    EXPECT_TRUE(worker->RunOnce());
    const auto sent = log_->Sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].result["errorKind"], "unpack-failed");
}

TEST_F(ExecutionWorkerTest, TimedOutRunIsDeliveredAsAResult) {
    settings_.timeout_ms = 200;
    testing::PutScriptBundle(cache_, "slow", "sleep 5");
    requester_.Push(triple_, Message("g1", "slow"));

    auto worker = MakeWorker();
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(worker->RunOnce());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);

    const auto sent = log_->Sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].result["timedOut"], true);
    EXPECT_NE(sent[0].result["code"], 0);
    EXPECT_FALSE(worker->RunOnce());
}

TEST_F(ExecutionWorkerTest, IdenticalPushesAreProcessedOnce) {
    testing::PutScriptBundle(cache_, "abc123", "echo once");
    const auto message = Message("g1", "abc123", {"--version"});
    EXPECT_FALSE(requester_.Push(triple_, message).duplicate);
    EXPECT_TRUE(requester_.Push(triple_, message).duplicate);

    auto first = MakeWorker();
    auto second = MakeWorker();
    EXPECT_TRUE(first->RunOnce());
    EXPECT_FALSE(second->RunOnce());
    EXPECT_FALSE(first->RunOnce());
    EXPECT_EQ(log_->Sent().size(), 1u);
}

TEST_F(ExecutionWorkerTest, LedgerSkipsGuidsAlreadyAnswered) {
    testing::PutScriptBundle(cache_, "abc123", "echo once");
    notify::SentGuidLedger ledger(16);
    WorkerOptions options{};
    options.ledger = &ledger;
    auto worker = MakeWorker(options);

    requester_.Push(triple_, Message("g1", "abc123", {"a"}));
    requester_.Push(triple_, Message("g1", "abc123", {"b"}));
    EXPECT_TRUE(worker->RunOnce());
    EXPECT_TRUE(worker->RunOnce());
    EXPECT_EQ(log_->Sent().size(), 1u);
    EXPECT_TRUE(ledger.Contains("g1"));
}

TEST_F(ExecutionWorkerTest, UndecodableMessageDoesNotStopTheLoop) {
    broker_.Send(queue_.GetQueueUrl(triple_), "garbage", queue::kMessageGroupId, "x");
    testing::PutScriptBundle(cache_, "abc123", "echo ok");
    requester_.Push(triple_, Message("g1", "abc123"));

    auto worker = MakeWorker();
    EXPECT_FALSE(worker->RunOnce());
    EXPECT_TRUE(worker->RunOnce());
    EXPECT_EQ(log_->Sent().size(), 1u);
}

TEST_F(ExecutionWorkerTest, BackgroundLoopPollsUntilStopped) {
    testing::PutScriptBundle(cache_, "abc123", "echo background");
    WorkerOptions options{};
    options.startup_delay = 20ms;
    options.poll_interval = 20ms;
    auto worker = MakeWorker(options);
    worker->Start();
    EXPECT_TRUE(worker->Running());

    requester_.Push(triple_, Message("g1", "abc123"));
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (log_->Sent().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    worker->Stop();
    EXPECT_FALSE(worker->Running());

    const auto sent = log_->Sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(testing::JoinLines(sent[0].result["stdout"]), "background");
}

TEST_F(ExecutionWorkerTest, StopInterruptsStartupDelay) {
    WorkerOptions options{};
    options.startup_delay = 10s;
    auto worker = MakeWorker(options);
    worker->Start();
    const auto start = std::chrono::steady_clock::now();
    worker->Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

}  // namespace
}  // namespace remex::worker
