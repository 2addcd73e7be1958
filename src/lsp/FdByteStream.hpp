#pragma once

#include "ByteStream.hpp"
#include <atomic>
#include <mutex>

namespace ada_mcp {

/**
 * @brief Byte stream over a pair of pipe file descriptors
 *
 * Reads and writes poll their descriptor together with an internal wake pipe
 * so that close() can interrupt a reader or writer blocked on another thread.
 * The write descriptor is non-blocking; a write waits for POLLOUT only until
 * its deadline. Takes ownership of both descriptors.
 */
class FdByteStream : public IByteStream {
public:
    /**
     * @param read_fd Descriptor to read from (child's stdout)
     * @param write_fd Descriptor to write to (child's stdin)
     */
    FdByteStream(int read_fd, int write_fd);
    ~FdByteStream() override;

    FdByteStream(const FdByteStream&) = delete;
    FdByteStream& operator=(const FdByteStream&) = delete;

    using IByteStream::write_all;

    std::size_t read_some(char* buffer, std::size_t max_len) override;
    void write_all(const char* data, std::size_t len, Deadline deadline) override;
    void close() override;
    bool is_open() const override;

private:
    void close_descriptors();

    int read_fd_;
    int write_fd_;
    int wake_pipe_[2] = {-1, -1};
    std::atomic<bool> open_{true};
    std::mutex write_mutex_;  // guards write_fd_; held for a whole write_all
    std::mutex close_mutex_;
};

} // namespace ada_mcp
