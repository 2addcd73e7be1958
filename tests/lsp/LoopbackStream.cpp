#include "LoopbackStream.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace ada_mcp {

void ByteChannel::write(const char* data, std::size_t len) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw std::system_error(EPIPE, std::generic_category(), "loopback channel closed");
        }
        bytes_.append(data, len);
    }
    cv_.notify_all();
}

std::size_t ByteChannel::read(char* buffer, std::size_t max_len) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !bytes_.empty() || closed_; });
    if (bytes_.empty()) {
        return 0;
    }
    std::size_t n = std::min(max_len, bytes_.size());
    std::memcpy(buffer, bytes_.data(), n);
    bytes_.erase(0, n);
    return n;
}

void ByteChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ByteChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

LoopbackStream::LoopbackStream(std::shared_ptr<ByteChannel> in, std::shared_ptr<ByteChannel> out)
    : in_(std::move(in)), out_(std::move(out)) {}

std::size_t LoopbackStream::read_some(char* buffer, std::size_t max_len) {
    return in_->read(buffer, max_len);
}

void LoopbackStream::write_all(const char* data, std::size_t len, Deadline /*deadline*/) {
    out_->write(data, len);
}

void LoopbackStream::close() {
    in_->close();
    out_->close();
}

bool LoopbackStream::is_open() const {
    return !in_->closed() && !out_->closed();
}

std::pair<std::shared_ptr<LoopbackStream>, std::shared_ptr<LoopbackStream>> make_loopback_pair() {
    auto to_server = std::make_shared<ByteChannel>();
    auto to_client = std::make_shared<ByteChannel>();
    return {
        std::make_shared<LoopbackStream>(to_client, to_server),
        std::make_shared<LoopbackStream>(to_server, to_client)
    };
}

} // namespace ada_mcp
