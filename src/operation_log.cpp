#include "operation_log.hpp"
#include <stdexcept>

OperationLog::OperationLog(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("Operation log capacity must be positive");
    }
}

void OperationLog::append(std::string operation, std::map<std::string, std::string> details) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back({std::chrono::system_clock::now(), std::move(operation), std::move(details)});
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

std::vector<OperationLogEntry> OperationLog::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {entries_.begin(), entries_.end()};
}

std::size_t OperationLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}
