#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

struct OperationLogEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string operation;
    std::map<std::string, std::string> details;
};

// Bounded in-memory record of controller operations. Oldest entries are
// evicted once capacity is reached.
class OperationLog {
public:
    static constexpr std::size_t kDefaultCapacity = 100;

    explicit OperationLog(std::size_t capacity = kDefaultCapacity);

    void append(std::string operation, std::map<std::string, std::string> details);
    std::vector<OperationLogEntry> entries() const;
    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<OperationLogEntry> entries_;
};
