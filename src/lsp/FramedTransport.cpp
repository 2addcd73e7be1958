#include "FramedTransport.hpp"
#include "lsp/Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <stdexcept>
#include <system_error>

namespace ada_mcp {

namespace {

constexpr std::size_t kReadChunk = 8192;
constexpr std::size_t kMaxHeaderLine = 8192;

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::size_t parse_content_length(const std::string& value) {
    if (value.empty() || value.size() > 19 ||
        !std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw FramingError(FramingError::Reason::BadHeader,
                           "Invalid Content-Length header: '" + value + "'");
    }
    return static_cast<std::size_t>(std::stoull(value));
}

} // namespace

FramedTransport::FramedTransport(std::shared_ptr<IByteStream> stream, std::size_t max_content_length)
    : stream_(std::move(stream)), max_content_length_(max_content_length) {
    if (!stream_) {
        throw std::invalid_argument("Stream cannot be null");
    }
}

std::string FramedTransport::encode(const json& message) {
    std::string body = message.dump();
    std::string frame = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
    frame += body;
    return frame;
}

void FramedTransport::write_message(const json& message) {
    write_message(message, IByteStream::Deadline::max());
}

void FramedTransport::write_message(const json& message, IByteStream::Deadline deadline) {
    std::string frame = encode(message);

    std::unique_lock<std::timed_mutex> lock(write_mutex_, std::defer_lock);
    if (deadline == IByteStream::Deadline::max()) {
        lock.lock();
    } else if (!lock.try_lock_until(deadline)) {
        throw std::system_error(ETIMEDOUT, std::generic_category(), "timed out waiting to write");
    }

    stream_->write_all(frame.data(), frame.size(), deadline);
    spdlog::trace("FramedTransport wrote {} bytes", frame.size());
}

bool FramedTransport::fill() {
    // Drop consumed bytes before growing the buffer
    if (offset_ > 0) {
        buffer_.erase(0, offset_);
        offset_ = 0;
    }

    char chunk[kReadChunk];
    std::size_t n = stream_->read_some(chunk, sizeof(chunk));
    if (n == 0) {
        return false;
    }
    buffer_.append(chunk, n);
    return true;
}

bool FramedTransport::read_line(std::string& line, bool inside_frame) {
    while (true) {
        auto newline = buffer_.find('\n', offset_);
        if (newline != std::string::npos) {
            line.assign(buffer_, offset_, newline - offset_);
            offset_ = newline + 1;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }

        if (buffer_.size() - offset_ > kMaxHeaderLine) {
            throw FramingError(FramingError::Reason::BadHeader, "Header line too long");
        }

        if (!fill()) {
            if (inside_frame || buffer_.size() > offset_) {
                throw FramingError(FramingError::Reason::Truncated,
                                   "Stream closed inside frame header");
            }
            return false;
        }
    }
}

json FramedTransport::read_message() {
    std::string line;
    bool saw_header = false;
    bool have_length = false;
    std::size_t content_length = 0;

    while (true) {
        if (!read_line(line, saw_header)) {
            spdlog::debug("FramedTransport: end of stream");
            return json();
        }

        if (line.empty()) {
            if (!saw_header) {
                continue;  // stray separator between frames
            }
            break;
        }

        saw_header = true;
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            throw FramingError(FramingError::Reason::BadHeader, "Malformed header line: '" + line + "'");
        }

        std::string name = to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));

        if (name == "content-length") {
            content_length = parse_content_length(value);
            have_length = true;
        }
        // Content-Type and unknown headers are ignored
    }

    if (!have_length) {
        throw FramingError(FramingError::Reason::BadHeader, "Missing Content-Length header");
    }
    if (content_length > max_content_length_) {
        throw FramingError(FramingError::Reason::Oversize,
                           "Content-Length " + std::to_string(content_length) + " exceeds limit");
    }

    while (buffer_.size() - offset_ < content_length) {
        if (!fill()) {
            throw FramingError(FramingError::Reason::Truncated,
                               "Stream closed after " + std::to_string(buffer_.size() - offset_) +
                               " of " + std::to_string(content_length) + " body bytes");
        }
    }

    std::string body = buffer_.substr(offset_, content_length);
    offset_ += content_length;

    json message;
    try {
        message = json::parse(body);
    } catch (const json::parse_error& e) {
        throw FramingError(FramingError::Reason::BadBody, std::string("JSON parse error: ") + e.what());
    }

    if (!message.is_object()) {
        throw FramingError(FramingError::Reason::BadBody, "Message body is not a JSON object");
    }

    return message;
}

bool FramedTransport::is_open() const {
    return stream_->is_open();
}

void FramedTransport::close() {
    stream_->close();
}

} // namespace ada_mcp
