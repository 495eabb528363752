#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace remex::queue {

class BrokerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SendReceipt {
    std::string message_id;
    // true when the dedup id matched a message still inside the window
    bool duplicate = false;
};

struct ReceivedMessage {
    std::string message_id;
    std::string body;
    std::string receipt_handle;
};

// FIFO, per-queue, deduplicating, at-least-once message channel. Queues are
// addressed by their full routing key/url. Implementations are safe to share
// between threads.
class QueueBroker {
public:
    virtual ~QueueBroker() = default;

    virtual SendReceipt Send(const std::string& queue,
                             const std::string& body,
                             const std::string& group_id,
                             const std::string& dedup_id) = 0;

    // Hidden messages become visible again after `visibility` unless deleted.
    virtual std::vector<ReceivedMessage> Receive(const std::string& queue,
                                                 std::size_t max_messages,
                                                 std::chrono::milliseconds visibility) = 0;

    // false when the receipt is unknown or expired
    virtual bool Delete(const std::string& queue, const std::string& receipt_handle) = 0;
};

}  // namespace remex::queue
