#pragma once

#include <chrono>
#include <cstddef>

namespace ada_mcp {

/**
 * @brief Abstract duplex byte stream connected to an external process
 *
 * The read side has a single reader; writes may come from several threads
 * and are serialized by the caller (FramedTransport).
 */
class IByteStream {
public:
    virtual ~IByteStream() = default;

    /**
     * @brief Read up to max_len bytes, blocking until at least one is available
     * @return Number of bytes read, 0 on end of stream or after close()
     */
    virtual std::size_t read_some(char* buffer, std::size_t max_len) = 0;

    using Deadline = std::chrono::steady_clock::time_point;

    /**
     * @brief Write all bytes, giving up once the deadline passes
     *
     * A timed-out write may have sent part of the data.
     * @throws std::system_error EPIPE if the peer is gone or close() was called,
     *         ETIMEDOUT if the peer did not take the bytes before the deadline
     */
    virtual void write_all(const char* data, std::size_t len, Deadline deadline) = 0;

    void write_all(const char* data, std::size_t len) {
        write_all(data, len, Deadline::max());
    }

    /**
     * @brief Close both directions and wake up a blocked reader or writer
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

} // namespace ada_mcp
