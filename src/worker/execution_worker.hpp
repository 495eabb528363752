#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "notify/result_notifier.hpp"
#include "notify/sent_guid_ledger.hpp"
#include "queue/execution_queue.hpp"
#include "sandbox/execution_environment.hpp"

namespace remex::worker {

using EnvironmentFactory = std::function<std::unique_ptr<sandbox::ExecutionEnvironment>()>;

struct WorkerOptions {
    std::chrono::milliseconds startup_delay{1500};
    std::chrono::milliseconds poll_interval{500};
    // Optional; guids found here are acknowledged without running again.
    notify::SentGuidLedger* ledger = nullptr;
};

// Sequential pop -> fetch -> execute -> notify loop for one triple.
class ExecutionWorker {
public:
    ExecutionWorker(queue::WorkerQueue& queue,
                    EnvironmentFactory environment_factory,
                    notify::NotifierFactory notifier_factory,
                    WorkerOptions options = {});
    ~ExecutionWorker();

    void Start();
    void Stop();
    bool Running() const { return running_; }

    // One iteration. Returns true when a request was taken off the queue.
    bool RunOnce();

private:
    void RunLoop();
    // false when Stop() interrupted the wait
    bool WaitFor(std::chrono::milliseconds duration);
    sandbox::BasicExecutionResult Process(const queue::RemoteExecutionMessage& message);
    void Deliver(const std::string& guid, const sandbox::BasicExecutionResult& result);

    queue::WorkerQueue& queue_;
    EnvironmentFactory environment_factory_;
    notify::NotifierFactory notifier_factory_;
    WorkerOptions options_;

    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
};

}  // namespace remex::worker
