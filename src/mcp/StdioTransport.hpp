#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace ada_mcp {

/**
 * @brief Agent-side transport using standard input/output streams
 *
 * Reads JSON messages line-by-line from stdin and writes them line-by-line
 * to stdout with flush. Nothing else may write to stdout; logs go to stderr.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    /**
     * @brief Read the next non-blank line as JSON
     * @return Message, or null JSON at end of input
     * @throws json::parse_error if the line is not valid JSON
     */
    json read_message() override;
    /**
     * @brief Write one message as a single line and flush
     *
     * Writes are serialized so replies from several threads never interleave.
     * Messages written after close() are dropped.
     */
    void write_message(const json& message) override;
    bool is_open() const override;

    /**
     * @brief Stop reading and writing; the streams themselves stay untouched
     */
    void close() override;

private:
    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;
    std::atomic<bool> closed_{false};
};

} // namespace ada_mcp
