#include "RpcClient.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace ada_mcp {

RpcClient::RpcClient(std::shared_ptr<FramedTransport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
}

RpcClient::~RpcClient() {
    close(ErrorKind::Shutdown);
}

void RpcClient::set_notification_handler(NotificationHandler handler) {
    notification_handler_ = std::move(handler);
}

void RpcClient::start_reading(DisconnectHandler on_disconnect) {
    if (reader_.joinable()) {
        throw std::logic_error("RpcClient read loop already started");
    }
    disconnect_handler_ = std::move(on_disconnect);
    reader_ = std::thread([this] { read_loop(); });
}

json RpcClient::call(const std::string& method, const json& params, std::chrono::milliseconds timeout) {
    if (method.empty()) {
        throw std::invalid_argument("Method name cannot be empty");
    }

    auto deadline = Clock::now() + timeout;
    std::shared_ptr<PendingRequest> request;

    {
        std::unique_lock<std::timed_mutex> send_lock(send_mutex_, std::defer_lock);
        if (!send_lock.try_lock_until(deadline)) {
            throw LspError(ErrorKind::Timeout, "Request " + method + " timed out waiting to be sent");
        }

        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            if (!connected_) {
                throw LspError(ErrorKind::Disconnected, "Cannot send " + method + ": not connected");
            }
            request = std::make_shared<PendingRequest>(++next_id_, method, deadline);
            pending_[request->id()] = request;
        }

        json message = {
            {"jsonrpc", "2.0"},
            {"id", request->id()},
            {"method", method}
        };
        if (!params.is_null()) {
            message["params"] = params;
        }

        spdlog::debug("Sending request {}: {}", request->id(), method);
        try {
            write_locked(message, deadline, method);
        } catch (const LspError& e) {
            {
                std::lock_guard<std::mutex> lock(pending_mutex_);
                pending_.erase(request->id());
            }
            request->fail(e);
        }
    }

    if (!request->wait_until(deadline)) {
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_.erase(request->id());
        }
        // A response racing with the deadline wins if it got here first
        if (request->fail(LspError(ErrorKind::Timeout,
                                   "Request " + method + " timed out after " +
                                   std::to_string(timeout.count()) + "ms"))) {
            spdlog::warn("Request {} ({}) timed out", request->id(), method);
        }
    }

    return request->get();
}

void RpcClient::notify(const std::string& method, const json& params) {
    notify(method, params, write_timeout_);
}

void RpcClient::notify(const std::string& method, const json& params, std::chrono::milliseconds timeout) {
    if (!connected_) {
        throw LspError(ErrorKind::Disconnected, "Cannot send " + method + ": not connected");
    }

    json message = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    if (!params.is_null()) {
        message["params"] = params;
    }

    spdlog::debug("Sending notification: {}", method);
    auto deadline = Clock::now() + timeout;
    std::unique_lock<std::timed_mutex> send_lock(send_mutex_, std::defer_lock);
    if (!send_lock.try_lock_until(deadline)) {
        throw LspError(ErrorKind::Timeout, "Notification " + method + " timed out waiting to be sent");
    }
    write_locked(message, deadline, method);
}

void RpcClient::send(const json& message) {
    auto deadline = Clock::now() + write_timeout_;
    std::unique_lock<std::timed_mutex> send_lock(send_mutex_, std::defer_lock);
    if (!send_lock.try_lock_until(deadline)) {
        throw LspError(ErrorKind::Timeout, "Reply timed out waiting to be sent");
    }
    write_locked(message, deadline, "reply");
}

void RpcClient::write_locked(const json& message, Clock::time_point deadline, const std::string& what) {
    try {
        transport_->write_message(message, deadline);
    } catch (const std::system_error& e) {
        if (e.code() == std::errc::timed_out) {
            // The peer is not draining its input and may hold half a frame
            spdlog::warn("Language server stopped reading while sending {}; dropping connection", what);
            transport_->close();
            throw LspError(ErrorKind::Timeout, "Failed to send " + what + ": " + e.what());
        }
        throw LspError(closing_ ? ErrorKind::Shutdown : ErrorKind::Disconnected,
                       "Failed to send " + what + ": " + e.what());
    } catch (const std::exception& e) {
        throw LspError(closing_ ? ErrorKind::Shutdown : ErrorKind::Disconnected,
                       "Failed to send " + what + ": " + e.what());
    }
}

void RpcClient::dispatch(const json& message) {
    bool has_id = message.contains("id") && !message["id"].is_null();
    bool has_method = message.contains("method");

    if (has_id && has_method) {
        handle_server_request(message);
    } else if (has_id) {
        handle_response(message);
    } else if (has_method) {
        if (notification_handler_) {
            try {
                notification_handler_(message);
            } catch (const std::exception& e) {
                spdlog::error("Notification handler failed for {}: {}",
                              message["method"].dump(), e.what());
            }
        }
    } else {
        spdlog::warn("Ignoring message without id or method: {}", message.dump());
    }
}

void RpcClient::handle_response(const json& message) {
    const json& id_value = message["id"];
    if (!id_value.is_number_integer()) {
        spdlog::warn("Ignoring response with non-integer id: {}", id_value.dump());
        return;
    }

    std::int64_t id = id_value.get<std::int64_t>();
    std::shared_ptr<PendingRequest> request;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id);
        if (it != pending_.end()) {
            request = it->second;
            pending_.erase(it);
        }
    }

    if (!request) {
        spdlog::debug("Discarding response for unknown or expired request {}", id);
        return;
    }

    bool resolved = false;
    if (message.contains("error") && !message["error"].is_object()) {
        resolved = request->fail(LspError(-1, message["error"].dump(), json()));
    } else if (message.contains("error")) {
        const json& error = message["error"];
        int code = error.value("code", -1);
        std::string text = error.value("message", std::string("Unknown error"));
        json data = error.contains("data") ? error["data"] : json();
        resolved = request->fail(LspError(code, text, std::move(data)));
    } else {
        resolved = request->resolve(message.value("result", json()));
    }

    if (!resolved) {
        spdlog::debug("Response for request {} arrived after it was resolved", id);
    }
}

void RpcClient::handle_server_request(const json& message) {
    std::string method = message["method"].is_string() ? message["method"].get<std::string>() : "";
    spdlog::debug("Server request {}: {}", message["id"].dump(), method);

    json result;
    if (method == "workspace/configuration") {
        result = json::array();
        std::size_t items = 0;
        if (message.contains("params") && message["params"].contains("items") &&
            message["params"]["items"].is_array()) {
            items = message["params"]["items"].size();
        }
        for (std::size_t i = 0; i < items; ++i) {
            result.push_back(nullptr);
        }
    }

    json response = {
        {"jsonrpc", "2.0"},
        {"id", message["id"]},
        {"result", result}
    };

    try {
        send(response);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to answer server request {}: {}", method, e.what());
    }
}

std::size_t RpcClient::fail_all(ErrorKind kind, const std::string& reason) {
    std::vector<std::shared_ptr<PendingRequest>> requests;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        for (auto& [id, request] : pending_) {
            requests.push_back(request);
        }
        pending_.clear();
    }

    std::size_t failed = 0;
    for (auto& request : requests) {
        if (request->fail(LspError(kind, request->method() + ": " + reason))) {
            ++failed;
        }
    }

    if (failed > 0) {
        spdlog::info("Failed {} pending request(s) ({}): {}", failed, to_string(kind), reason);
    }
    return failed;
}

void RpcClient::read_loop() {
    std::string reason = "stream closed";

    while (!closing_) {
        try {
            json message = transport_->read_message();
            if (message.is_null()) {
                break;
            }
            dispatch(message);
        } catch (const FramingError& e) {
            if (e.recoverable()) {
                spdlog::error("Dropping malformed frame: {}", e.what());
                continue;
            }
            spdlog::error("Framing error, closing connection: {}", e.what());
            reason = e.what();
            break;
        } catch (const std::exception& e) {
            spdlog::error("Error in read loop: {}", e.what());
            reason = e.what();
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        connected_ = false;
    }

    if (closing_) {
        return;
    }

    spdlog::info("Language server connection lost: {}", reason);
    fail_all(ErrorKind::Disconnected, reason);

    if (disconnect_handler_) {
        disconnect_handler_(reason);
    }
}

void RpcClient::close(ErrorKind kind) {
    bool already_closing = closing_.exchange(true);

    if (!already_closing) {
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            connected_ = false;
        }
        transport_->close();
    }

    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }

    fail_all(kind, "connection closed");
}

std::size_t RpcClient::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

} // namespace ada_mcp
