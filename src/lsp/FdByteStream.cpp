#include "FdByteStream.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <system_error>
#include <unistd.h>

namespace ada_mcp {

FdByteStream::FdByteStream(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd) {
    if (::pipe2(wake_pipe_, O_CLOEXEC) != 0) {
        int err = errno;
        ::close(read_fd_);
        ::close(write_fd_);
        throw std::system_error(err, std::generic_category(), "failed to create wake pipe");
    }

    int flags = ::fcntl(write_fd_, F_GETFL);
    if (flags < 0 || ::fcntl(write_fd_, F_SETFL, flags | O_NONBLOCK) != 0) {
        int err = errno;
        close_descriptors();
        throw std::system_error(err, std::generic_category(), "failed to make write pipe non-blocking");
    }
}

FdByteStream::~FdByteStream() {
    close();
    close_descriptors();
}

std::size_t FdByteStream::read_some(char* buffer, std::size_t max_len) {
    while (open_) {
        pollfd fds[2] = {
            {read_fd_, POLLIN, 0},
            {wake_pipe_[0], POLLIN, 0}
        };

        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("FdByteStream: poll failed: {}", std::strerror(errno));
            return 0;
        }

        if (fds[1].revents != 0) {
            // close() requested
            return 0;
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = ::read(read_fd_, buffer, max_len);
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                spdlog::error("FdByteStream: read failed: {}", std::strerror(errno));
                return 0;
            }
            return static_cast<std::size_t>(n);
        }
    }
    return 0;
}

void FdByteStream::write_all(const char* data, std::size_t len, Deadline deadline) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    std::size_t written = 0;
    while (written < len) {
        if (!open_ || write_fd_ < 0) {
            throw std::system_error(EPIPE, std::generic_category(), "stream closed");
        }

        ssize_t n = ::write(write_fd_, data + written, len - written);
        if (n >= 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            throw std::system_error(errno, std::generic_category(), "write to process failed");
        }

        // Pipe full: wait for room, for close() or for the deadline
        int timeout_ms = -1;
        if (deadline != Deadline::max()) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                throw std::system_error(ETIMEDOUT, std::generic_category(),
                                        "write to process timed out after " + std::to_string(written) +
                                        " of " + std::to_string(len) + " bytes");
            }
            timeout_ms = static_cast<int>(std::min<long long>(remaining.count() + 1, INT_MAX));
        }

        pollfd fds[2] = {
            {write_fd_, POLLOUT, 0},
            {wake_pipe_[0], POLLIN, 0}
        };
        if (::poll(fds, 2, timeout_ms) < 0 && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "poll on write pipe failed");
        }
        if (fds[1].revents != 0) {
            throw std::system_error(EPIPE, std::generic_category(), "stream closed");
        }
    }
}

void FdByteStream::close() {
    {
        std::lock_guard<std::mutex> lock(close_mutex_);
        if (!open_.exchange(false)) {
            return;
        }

        char wake = 1;
        if (::write(wake_pipe_[1], &wake, 1) < 0) {
            spdlog::warn("FdByteStream: wake pipe write failed: {}", std::strerror(errno));
        }
    }

    // A writer blocked in poll() sees the wake pipe and releases the lock
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (write_fd_ >= 0) {
        ::close(write_fd_);
        write_fd_ = -1;
    }
}

bool FdByteStream::is_open() const {
    return open_;
}

void FdByteStream::close_descriptors() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    for (int* fd : {&read_fd_, &write_fd_, &wake_pipe_[0], &wake_pipe_[1]}) {
        if (*fd >= 0) {
            ::close(*fd);
            *fd = -1;
        }
    }
}

} // namespace ada_mcp
