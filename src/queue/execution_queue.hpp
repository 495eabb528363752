#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "queue/queue_broker.hpp"
#include "queue/remote_execution_message.hpp"
#include "routing/execution_triple.hpp"

namespace remex::queue {

constexpr const char* kMessageGroupId = "default";

// Deterministic dedup key for a serialized message body.
std::string DeduplicationId(const std::string& body);

class ExecuteQueueBase {
public:
    // Throws config::ConfigError on an empty queue_url.
    ExecuteQueueBase(QueueBroker& broker, std::string queue_url);
    virtual ~ExecuteQueueBase() = default;

    std::string GetQueueUrl(const routing::ExecutionTriple& triple) const;

protected:
    QueueBroker& broker_;
    std::string queue_url_;
};

class ExecuteRequester : public ExecuteQueueBase {
public:
    using ExecuteQueueBase::ExecuteQueueBase;

    SendReceipt Push(const routing::ExecutionTriple& triple, const RemoteExecutionMessage& message);
};

class WorkerQueue : public ExecuteQueueBase {
public:
    WorkerQueue(QueueBroker& broker,
                std::string queue_url,
                routing::ExecutionTriple triple,
                std::chrono::milliseconds visibility = std::chrono::seconds(30),
                std::string dead_letter_url = {});

    // At most one message. Whatever was received is acknowledged before
    // returning; an undecodable body yields std::nullopt.
    std::optional<RemoteExecutionMessage> Pop();

    const routing::ExecutionTriple& Triple() const { return triple_; }

private:
    void DeadLetter(const std::string& body);

    routing::ExecutionTriple triple_;
    std::chrono::milliseconds visibility_;
    std::string dead_letter_url_;
};

}  // namespace remex::queue
