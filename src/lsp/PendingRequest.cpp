#include "PendingRequest.hpp"
#include <stdexcept>

namespace ada_mcp {

PendingRequest::PendingRequest(std::int64_t id, std::string method, Clock::time_point deadline)
    : id_(id),
      method_(std::move(method)),
      submitted_at_(Clock::now()),
      deadline_(deadline) {}

bool PendingRequest::resolve(json result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (resolved_) {
            return false;
        }
        result_ = std::move(result);
        resolved_ = true;
    }
    cv_.notify_all();
    return true;
}

bool PendingRequest::fail(LspError error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (resolved_) {
            return false;
        }
        error_.emplace(std::move(error));
        resolved_ = true;
    }
    cv_.notify_all();
    return true;
}

bool PendingRequest::is_resolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolved_;
}

bool PendingRequest::wait_until(Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_until(lock, deadline, [this] { return resolved_; });
}

json PendingRequest::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!resolved_) {
        throw std::logic_error("PendingRequest " + std::to_string(id_) + " is not resolved");
    }
    if (error_) {
        throw *error_;
    }
    return result_;
}

} // namespace ada_mcp
