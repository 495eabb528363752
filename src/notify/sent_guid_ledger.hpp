#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>

namespace remex::notify {

// Bounded record of guids this worker already answered. Oldest entries are
// forgotten first once capacity is reached.
class SentGuidLedger {
public:
    explicit SentGuidLedger(std::size_t capacity = 4096);

    bool Contains(const std::string& guid) const;
    void Record(const std::string& guid);
    std::size_t Size() const;

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<std::string> order_;
    std::unordered_set<std::string> guids_;
};

}  // namespace remex::notify
