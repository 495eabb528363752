#include "queue/execution_queue.hpp"

#include "config/config_schema.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace remex::queue {

std::string DeduplicationId(const std::string& body) {
    return utils::Sha256Hex(body);
}

ExecuteQueueBase::ExecuteQueueBase(QueueBroker& broker, std::string queue_url)
    : broker_(broker)
    , queue_url_(std::move(queue_url)) {
    if (queue_url_.empty()) {
        throw config::ConfigError("execqueue.queueUrl property required");
    }
}

std::string ExecuteQueueBase::GetQueueUrl(const routing::ExecutionTriple& triple) const {
    return routing::RoutingKey(queue_url_, triple);
}

SendReceipt ExecuteRequester::Push(const routing::ExecutionTriple& triple,
                                   const RemoteExecutionMessage& message) {
    const auto body = Serialize(message);
    const auto url = GetQueueUrl(triple);
    auto receipt = broker_.Send(url, body, kMessageGroupId, DeduplicationId(body));
    utils::LogDebug("queue", "pushed", {
        {"queue", url},
        {"guid", message.guid},
        {"message_id", receipt.message_id},
        {"duplicate", receipt.duplicate ? "true" : "false"}});
    return receipt;
}

WorkerQueue::WorkerQueue(QueueBroker& broker,
                         std::string queue_url,
                         routing::ExecutionTriple triple,
                         std::chrono::milliseconds visibility,
                         std::string dead_letter_url)
    : ExecuteQueueBase(broker, std::move(queue_url))
    , triple_(std::move(triple))
    , visibility_(visibility)
    , dead_letter_url_(std::move(dead_letter_url)) {}

std::optional<RemoteExecutionMessage> WorkerQueue::Pop() {
    const auto url = GetQueueUrl(triple_);
    auto queued_messages = broker_.Receive(url, 1, visibility_);
    if (queued_messages.size() != 1) {
        return std::nullopt;
    }
    const auto& queued_message = queued_messages.front();

    std::optional<RemoteExecutionMessage> message;
    try {
        message = Deserialize(queued_message.body);
    } catch (const MessageFormatError& ex) {
        utils::LogWarn("queue", "dropping undecodable message", {
            {"queue", url},
            {"message_id", queued_message.message_id},
            {"error", ex.what()}});
        DeadLetter(queued_message.body);
    } catch (const std::exception& ex) {
        utils::LogError("queue", "failed to decode message", {
            {"queue", url},
            {"message_id", queued_message.message_id},
            {"error", ex.what()}});
        DeadLetter(queued_message.body);
    }

    if (!queued_message.receipt_handle.empty() &&
        !broker_.Delete(url, queued_message.receipt_handle)) {
        utils::LogWarn("queue", "failed to acknowledge message", {
            {"queue", url},
            {"message_id", queued_message.message_id}});
    }
    return message;
}

void WorkerQueue::DeadLetter(const std::string& body) {
    if (dead_letter_url_.empty()) {
        return;
    }
    try {
        broker_.Send(dead_letter_url_, body, kMessageGroupId, DeduplicationId(body));
    } catch (const BrokerError& ex) {
        utils::LogError("queue", "failed to forward message to dead letter queue", {
            {"queue", dead_letter_url_},
            {"error", ex.what()}});
    }
}

}  // namespace remex::queue
