#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace ada_mcp {

using json = nlohmann::json;

/**
 * @brief Bounded FIFO of unsolicited server messages
 *
 * Messages are delivered in the order the server emitted them. When full the
 * oldest message is dropped. A consumer may stop reading and resume later;
 * the queue lives as long as its instance, across process restarts, and
 * ends once close() is called and the remaining messages are drained.
 */
class NotificationQueue {
public:
    explicit NotificationQueue(std::size_t capacity = 1024);

    void push(json message);

    /**
     * @brief Wait for the next message
     * @return The message, or nullopt on timeout or when closed and drained
     */
    std::optional<json> next(std::chrono::milliseconds timeout);

    void close();
    bool is_closed() const;
    std::size_t size() const;
    std::size_t dropped() const;

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<json> messages_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace ada_mcp
