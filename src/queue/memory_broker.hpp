#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

#include "queue/queue_broker.hpp"

namespace remex::queue {

class InMemoryBroker : public QueueBroker {
public:
    explicit InMemoryBroker(std::chrono::milliseconds dedup_window = std::chrono::minutes(5));

    SendReceipt Send(const std::string& queue,
                     const std::string& body,
                     const std::string& group_id,
                     const std::string& dedup_id) override;
    std::vector<ReceivedMessage> Receive(const std::string& queue,
                                         std::size_t max_messages,
                                         std::chrono::milliseconds visibility) override;
    bool Delete(const std::string& queue, const std::string& receipt_handle) override;

    // Messages not yet deleted, visible or in flight.
    std::size_t Size(const std::string& queue) const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        std::string message_id;
        std::string body;
        std::string group_id;
        std::string receipt_handle;
        Clock::time_point invisible_until{};
    };

    struct Queue {
        std::deque<Entry> entries;
        std::unordered_map<std::string, std::pair<std::string, Clock::time_point>> dedup;
    };

    void PurgeDedup(Queue& queue, Clock::time_point now);

    std::chrono::milliseconds dedup_window_;
    std::unordered_map<std::string, Queue> queues_;
    mutable std::mutex mutex_;
};

}  // namespace remex::queue
