#pragma once

#include "mcp/ITransport.hpp"
#include "lsp/ByteStream.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace ada_mcp {

/**
 * @brief Content-Length framed JSON transport (LSP base protocol)
 *
 * Each frame is a block of "Name: value" header lines terminated by an empty
 * line, followed by exactly Content-Length bytes of JSON body. read_message()
 * never returns a partial message. The transport knows nothing about
 * request/response correlation.
 */
class FramedTransport : public ITransport {
public:
    static constexpr std::size_t kMaxContentLength = 64u * 1024u * 1024u;

    explicit FramedTransport(std::shared_ptr<IByteStream> stream,
                             std::size_t max_content_length = kMaxContentLength);

    /**
     * @brief Read the next complete frame
     * @return Decoded message, or null JSON on clean end of stream
     * @throws FramingError on bad header, oversize frame, truncated frame or bad body
     */
    json read_message() override;

    /**
     * @brief Encode and write one frame; safe to call from several threads
     * @throws std::system_error if the stream is closed
     */
    void write_message(const json& message) override;

    /**
     * @brief Write one frame, giving up once the deadline passes
     *
     * The deadline covers waiting for other writers as well as the write itself.
     * After a timeout the peer may hold a partial frame.
     * @throws std::system_error ETIMEDOUT on deadline, EPIPE if the stream is closed
     */
    void write_message(const json& message, IByteStream::Deadline deadline);

    bool is_open() const override;
    void close() override;

    /**
     * @brief Encode a message as a complete frame
     */
    static std::string encode(const json& message);

private:
    /**
     * @brief Pull more bytes into the read buffer
     * @return false on end of stream
     */
    bool fill();

    /**
     * @brief Read one header line without its CRLF terminator
     * @return false on end of stream before any byte of the line
     */
    bool read_line(std::string& line, bool inside_frame);

    std::shared_ptr<IByteStream> stream_;
    std::size_t max_content_length_;
    std::string buffer_;
    std::size_t offset_ = 0;
    std::timed_mutex write_mutex_;
};

} // namespace ada_mcp
