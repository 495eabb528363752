#include "queue/memory_broker.hpp"

#include <algorithm>
#include <unordered_set>

#include "utils/common.hpp"

namespace remex::queue {

InMemoryBroker::InMemoryBroker(std::chrono::milliseconds dedup_window)
    : dedup_window_(dedup_window) {}

void InMemoryBroker::PurgeDedup(Queue& queue, Clock::time_point now) {
    for (auto it = queue.dedup.begin(); it != queue.dedup.end();) {
        if (it->second.second <= now) {
            it = queue.dedup.erase(it);
        } else {
            ++it;
        }
    }
}

SendReceipt InMemoryBroker::Send(const std::string& queue,
                                 const std::string& body,
                                 const std::string& group_id,
                                 const std::string& dedup_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& target = queues_[queue];
    const auto now = Clock::now();
    PurgeDedup(target, now);

    if (!dedup_id.empty()) {
        auto it = target.dedup.find(dedup_id);
        if (it != target.dedup.end()) {
            return SendReceipt{it->second.first, true};
        }
    }

    Entry entry{};
    entry.message_id = utils::RandomHex(16);
    entry.body = body;
    entry.group_id = group_id;
    target.entries.push_back(entry);
    if (!dedup_id.empty()) {
        target.dedup[dedup_id] = {entry.message_id, now + dedup_window_};
    }
    return SendReceipt{entry.message_id, false};
}

std::vector<ReceivedMessage> InMemoryBroker::Receive(const std::string& queue,
                                                     std::size_t max_messages,
                                                     std::chrono::milliseconds visibility) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ReceivedMessage> received;
    auto it = queues_.find(queue);
    if (it == queues_.end() || max_messages == 0) {
        return received;
    }
    const auto now = Clock::now();
    auto& entries = it->second.entries;

    // a group with a message in flight hands out nothing until it is resolved
    std::unordered_set<std::string> blocked_groups;
    for (auto& entry : entries) {
        if (!entry.receipt_handle.empty() && entry.invisible_until > now) {
            blocked_groups.insert(entry.group_id);
        } else if (!entry.receipt_handle.empty()) {
            entry.receipt_handle.clear();
        }
    }

    for (auto& entry : entries) {
        if (received.size() >= max_messages) {
            break;
        }
        if (!entry.receipt_handle.empty() || blocked_groups.count(entry.group_id) > 0) {
            continue;
        }
        entry.receipt_handle = utils::RandomHex(16);
        entry.invisible_until = now + visibility;
        received.push_back(ReceivedMessage{entry.message_id, entry.body, entry.receipt_handle});
    }
    return received;
}

bool InMemoryBroker::Delete(const std::string& queue, const std::string& receipt_handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(queue);
    if (it == queues_.end() || receipt_handle.empty()) {
        return false;
    }
    const auto now = Clock::now();
    auto& entries = it->second.entries;
    auto found = std::find_if(entries.begin(), entries.end(), [&](const Entry& entry) {
        return entry.receipt_handle == receipt_handle;
    });
    if (found == entries.end() || found->invisible_until <= now) {
        return false;
    }
    entries.erase(found);
    return true;
}

std::size_t InMemoryBroker::Size(const std::string& queue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(queue);
    return it == queues_.end() ? 0 : it->second.entries.size();
}

}  // namespace remex::queue
