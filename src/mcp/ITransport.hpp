#pragma once

#include <nlohmann/json.hpp>

namespace ada_mcp {

using json = nlohmann::json;

/**
 * @brief Abstract interface for JSON-RPC message transports
 *
 * Implementations turn a byte stream into discrete JSON messages and back:
 * newline-delimited for the agent side (StdioTransport), Content-Length framed
 * for the language-server side (FramedTransport).
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next JSON-RPC message from transport
     *
     * Blocks until a complete message is available.
     * @return JSON message, or null JSON once the stream has ended
     */
    virtual json read_message() = 0;

    /**
     * @brief Write JSON-RPC message to transport
     * @param message JSON message to write
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;

    /**
     * @brief Release the underlying stream and wake a blocked reader
     */
    virtual void close() {}
};

} // namespace ada_mcp
