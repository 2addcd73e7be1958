#pragma once

#include "lsp/Errors.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace ada_mcp {

using Clock = std::chrono::steady_clock;

/**
 * @brief Single-assignment result slot for one in-flight request
 *
 * Exactly one of the response path, the timeout path or the crash path
 * resolves the slot. The first resolve wins; later attempts return false
 * and leave the stored outcome untouched.
 */
class PendingRequest {
public:
    PendingRequest(std::int64_t id, std::string method, Clock::time_point deadline);

    std::int64_t id() const { return id_; }
    const std::string& method() const { return method_; }
    Clock::time_point submitted_at() const { return submitted_at_; }
    Clock::time_point deadline() const { return deadline_; }

    /**
     * @brief Store a successful result
     * @return true if this call resolved the slot
     */
    bool resolve(json result);

    /**
     * @brief Store a failure
     * @return true if this call resolved the slot
     */
    bool fail(LspError error);

    bool is_resolved() const;

    /**
     * @brief Block until resolved or until the deadline passes
     * @return true if resolved
     */
    bool wait_until(Clock::time_point deadline);

    /**
     * @brief Return the stored result or throw the stored error
     *
     * Must only be called once the slot is resolved.
     */
    json get() const;

private:
    std::int64_t id_;
    std::string method_;
    Clock::time_point submitted_at_;
    Clock::time_point deadline_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool resolved_ = false;
    json result_;
    std::optional<LspError> error_;
};

} // namespace ada_mcp
