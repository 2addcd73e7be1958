#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace ada_mcp {

using json = nlohmann::json;

/**
 * @brief Failure categories surfaced by the language-server core
 */
enum class ErrorKind {
    Startup,        // spawn or handshake failed
    Protocol,       // server answered with a JSON-RPC error object
    Timeout,        // request deadline elapsed
    Disconnected,   // process died or stream closed while request was pending
    PoolExhausted,  // no instance could be evicted within the acquire timeout
    Dead,           // instance exhausted its restart budget
    Shutdown        // instance was shut down while request was pending
};

const char* to_string(ErrorKind kind);

/**
 * @brief Error raised by RPC calls, instances and the pool
 *
 * Protocol errors additionally carry the JSON-RPC error code, message and data.
 */
class LspError : public std::runtime_error {
public:
    LspError(ErrorKind kind, const std::string& message);
    LspError(int code, const std::string& message, json data);

    ErrorKind kind() const { return kind_; }
    int code() const { return code_; }
    const json& data() const { return data_; }

    /**
     * @brief Render as a JSON object for tool results
     */
    json to_json() const;

private:
    ErrorKind kind_;
    int code_ = 0;
    json data_;
};

/**
 * @brief Error raised by the framed transport when a frame cannot be decoded
 */
class FramingError : public std::runtime_error {
public:
    enum class Reason {
        BadHeader,  // header line unparsable or Content-Length missing
        Truncated,  // stream closed inside a frame
        Oversize,   // declared length above the transport limit
        BadBody     // body is not a well-formed JSON message
    };

    FramingError(Reason reason, const std::string& message)
        : std::runtime_error(message), reason_(reason) {}

    Reason reason() const { return reason_; }

    /**
     * @brief True if the frame was consumed and the stream is still in sync
     */
    bool recoverable() const { return reason_ == Reason::BadBody; }

private:
    Reason reason_;
};

} // namespace ada_mcp
