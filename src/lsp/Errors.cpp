#include "Errors.hpp"

namespace ada_mcp {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Startup: return "startup";
        case ErrorKind::Protocol: return "protocol";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Disconnected: return "disconnected";
        case ErrorKind::PoolExhausted: return "pool_exhausted";
        case ErrorKind::Dead: return "dead";
        case ErrorKind::Shutdown: return "shutdown";
    }
    return "unknown";
}

LspError::LspError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

LspError::LspError(int code, const std::string& message, json data)
    : std::runtime_error(message),
      kind_(ErrorKind::Protocol),
      code_(code),
      data_(std::move(data)) {}

json LspError::to_json() const {
    json result = {
        {"error", what()},
        {"kind", to_string(kind_)}
    };
    if (kind_ == ErrorKind::Protocol) {
        result["code"] = code_;
        if (!data_.is_null()) {
            result["data"] = data_;
        }
    }
    return result;
}

} // namespace ada_mcp
