#include "NotificationQueue.hpp"
#include <spdlog/spdlog.h>

namespace ada_mcp {

NotificationQueue::NotificationQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void NotificationQueue::push(json message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (messages_.size() >= capacity_) {
            messages_.pop_front();
            if (dropped_++ == 0) {
                spdlog::warn("Notification queue full ({} messages), dropping oldest", capacity_);
            }
        }
        messages_.push_back(std::move(message));
    }
    cv_.notify_one();
}

std::optional<json> NotificationQueue::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !messages_.empty() || closed_; });
    if (messages_.empty()) {
        return std::nullopt;
    }
    json message = std::move(messages_.front());
    messages_.pop_front();
    return message;
}

void NotificationQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool NotificationQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t NotificationQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

std::size_t NotificationQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace ada_mcp
