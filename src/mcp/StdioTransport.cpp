#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace ada_mcp {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

json StdioTransport::read_message() {
    std::string line;

    while (!closed_ && std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        spdlog::trace("Read message: {}", line);
        return json::parse(line);
    }

    if (closed_) {
        spdlog::debug("Transport closed");
    } else if (in_.eof()) {
        spdlog::debug("Reached end of input stream");
    } else {
        spdlog::error("Error reading from input stream");
    }
    return json();
}

void StdioTransport::write_message(const json& message) {
    std::string serialized = message.dump();
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_) {
        spdlog::debug("Dropping message written after close: {}", serialized);
        return;
    }
    out_ << serialized << std::endl;
    spdlog::trace("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return !closed_ && in_.good() && out_.good();
}

void StdioTransport::close() {
    closed_ = true;
}

} // namespace ada_mcp
