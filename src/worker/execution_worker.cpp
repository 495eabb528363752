#include "worker/execution_worker.hpp"

#include "cache/package_errors.hpp"
#include "notify/result_json.hpp"
#include "utils/logging.hpp"

namespace remex::worker {
namespace {

constexpr const char* kInternalErrorKind = "internal";

}  // namespace

ExecutionWorker::ExecutionWorker(queue::WorkerQueue& queue,
                                 EnvironmentFactory environment_factory,
                                 notify::NotifierFactory notifier_factory,
                                 WorkerOptions options)
    : queue_(queue)
    , environment_factory_(std::move(environment_factory))
    , notifier_factory_(std::move(notifier_factory))
    , options_(options) {}

ExecutionWorker::~ExecutionWorker() {
    Stop();
}

void ExecutionWorker::Start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread([this]() { RunLoop(); });
}

void ExecutionWorker::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool ExecutionWorker::WaitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, duration, [this]() { return !running_; });
    return running_;
}

void ExecutionWorker::RunLoop() {
    utils::LogInfo("worker", "started", {{"triple", queue_.Triple().ToString()}});
    if (!WaitFor(options_.startup_delay)) {
        return;
    }
    while (running_) {
        const bool consumed = RunOnce();
        if (!consumed && !WaitFor(options_.poll_interval)) {
            break;
        }
    }
    utils::LogInfo("worker", "stopped", {{"triple", queue_.Triple().ToString()}});
}

bool ExecutionWorker::RunOnce() {
    std::optional<queue::RemoteExecutionMessage> message;
    try {
        message = queue_.Pop();
    } catch (const std::exception& ex) {
        utils::LogError("worker", "queue pop failed", {{"error", ex.what()}});
        return false;
    }
    if (!message) {
        return false;
    }
    if (message->guid.empty()) {
        utils::LogWarn("worker", "message without guid skipped", {{"hash", message->hash}});
        return true;
    }
    if (options_.ledger && options_.ledger->Contains(message->guid)) {
        utils::LogInfo("worker", "already answered, skipping", {{"guid", message->guid}});
        return true;
    }

    utils::LogDebug("worker", "processing", {{"guid", message->guid}, {"hash", message->hash}});
    const auto result = Process(*message);
    Deliver(message->guid, result);
    if (options_.ledger) {
        options_.ledger->Record(message->guid);
    }
    return true;
}

sandbox::BasicExecutionResult ExecutionWorker::Process(const queue::RemoteExecutionMessage& message) {
    try {
        auto environment = environment_factory_();
        environment->DownloadExecutablePackage(message.hash);
        return environment->Execute(message.params);
    } catch (const cache::PackageError& ex) {
        utils::LogWarn("worker", "package unusable", {
            {"guid", message.guid},
            {"hash", message.hash},
            {"kind", ex.Kind()},
            {"error", ex.what()}});
        return notify::FailureResult(ex.what(), ex.Kind());
    } catch (const std::exception& ex) {
        utils::LogError("worker", "request failed", {
            {"guid", message.guid},
            {"hash", message.hash},
            {"error", ex.what()}});
        return notify::FailureResult(ex.what(), kInternalErrorKind);
    }
}

void ExecutionWorker::Deliver(const std::string& guid, const sandbox::BasicExecutionResult& result) {
    try {
        auto notifier = notifier_factory_();
        if (!notifier) {
            utils::LogWarn("worker", "no notifier; result dropped", {{"guid", guid}});
            return;
        }
        notifier->Send(guid, notify::ToJson(result));
        notifier->Close();
    } catch (const std::exception& ex) {
        utils::LogError("worker", "result delivery failed", {{"guid", guid}, {"error", ex.what()}});
    }
}

}  // namespace remex::worker
