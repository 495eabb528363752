#include "notify/sent_guid_ledger.hpp"

namespace remex::notify {

SentGuidLedger::SentGuidLedger(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool SentGuidLedger::Contains(const std::string& guid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return guids_.count(guid) > 0;
}

void SentGuidLedger::Record(const std::string& guid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!guids_.insert(guid).second) {
        return;
    }
    order_.push_back(guid);
    while (order_.size() > capacity_) {
        guids_.erase(order_.front());
        order_.pop_front();
    }
}

std::size_t SentGuidLedger::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

}  // namespace remex::notify
