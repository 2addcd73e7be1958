#pragma once

#include "lsp/Errors.hpp"
#include "lsp/FramedTransport.hpp"
#include "lsp/PendingRequest.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ada_mcp {

/**
 * @brief JSON-RPC 2.0 client bound to one process session
 *
 * Assigns strictly increasing request ids (never reused for the lifetime of
 * the client), correlates responses by id, forwards unsolicited messages to a
 * notification handler, and enforces per-call deadlines. A single background
 * read loop owns the read side of the transport.
 *
 * call() may be used from any number of threads concurrently. Requests are
 * written in call order; responses may arrive in any order.
 *
 * Writes are bounded too. A peer that stops reading its input makes the write
 * time out; the client then drops the connection, because the peer may hold
 * a partial frame.
 */
class RpcClient {
public:
    using NotificationHandler = std::function<void(const json& message)>;
    using DisconnectHandler = std::function<void(const std::string& reason)>;

    explicit RpcClient(std::shared_ptr<FramedTransport> transport);
    ~RpcClient();

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    /**
     * @brief Install the sink for server notifications; call before start_reading()
     */
    void set_notification_handler(NotificationHandler handler);

    /**
     * @brief Deadline for notifications and replies to server requests; call before start_reading()
     */
    void set_write_timeout(std::chrono::milliseconds timeout) { write_timeout_ = timeout; }

    /**
     * @brief Start the background read loop
     * @param on_disconnect Invoked from the read loop once the stream ends
     *        unexpectedly (not invoked after close())
     */
    void start_reading(DisconnectHandler on_disconnect = {});

    /**
     * @brief Send a request and wait for its response
     * @param method JSON-RPC method name
     * @param params Request parameters (omitted from the message when null)
     * @param timeout Maximum time to get the request written and answered
     * @return The "result" member of the response
     * @throws LspError Protocol, Timeout, Disconnected or Shutdown
     */
    json call(const std::string& method, const json& params, std::chrono::milliseconds timeout);

    /**
     * @brief Send a notification (no response expected)
     * @throws LspError Disconnected if the stream is gone, Timeout if the
     *         write does not complete within the write timeout
     */
    void notify(const std::string& method, const json& params);
    void notify(const std::string& method, const json& params, std::chrono::milliseconds timeout);

    /**
     * @brief Route one decoded message: response, server request or notification
     *
     * Called by the read loop. A response whose id is not pending (never sent,
     * or already resolved by a timeout) is discarded.
     */
    void dispatch(const json& message);

    /**
     * @brief Fail every pending request with the given error kind
     * @return Number of requests this call resolved
     */
    std::size_t fail_all(ErrorKind kind, const std::string& reason);

    /**
     * @brief Close the transport, stop the read loop and fail pending requests
     * @param kind Error kind reported to still-pending callers
     */
    void close(ErrorKind kind = ErrorKind::Shutdown);

    std::size_t pending_count() const;
    std::int64_t last_request_id() const { return next_id_.load(); }
    bool is_connected() const { return connected_.load(); }

private:
    void read_loop();
    void handle_response(const json& message);
    void handle_server_request(const json& message);
    void send(const json& message);

    /**
     * @brief Write one message; send_mutex_ must be held
     * @throws LspError Timeout (connection dropped) or Disconnected
     */
    void write_locked(const json& message, Clock::time_point deadline, const std::string& what);

    std::shared_ptr<FramedTransport> transport_;
    NotificationHandler notification_handler_;
    DisconnectHandler disconnect_handler_;
    std::chrono::milliseconds write_timeout_{30000};

    std::atomic<std::int64_t> next_id_{0};
    std::atomic<bool> connected_{true};
    std::atomic<bool> closing_{false};

    std::timed_mutex send_mutex_;  // keeps id order equal to write order
    mutable std::mutex pending_mutex_;
    std::map<std::int64_t, std::shared_ptr<PendingRequest>> pending_;

    std::thread reader_;
};

} // namespace ada_mcp
