#include "Uri.hpp"
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace ada_mcp {

std::string file_to_uri(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    std::string raw = absolute.lexically_normal().generic_string();

    std::string uri = "file://";
    for (unsigned char c : raw) {
        if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~') {
            uri += static_cast<char>(c);
        } else {
            char escaped[4];
            std::snprintf(escaped, sizeof(escaped), "%%%02X", c);
            uri += escaped;
        }
    }
    return uri;
}

std::filesystem::path uri_to_file(const std::string& uri) {
    const std::string scheme = "file://";
    if (uri.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("Expected file:// URI, got: " + uri);
    }

    std::string encoded = uri.substr(scheme.size());
    // Skip an authority component such as "localhost"
    if (!encoded.empty() && encoded.front() != '/') {
        auto slash = encoded.find('/');
        encoded = slash == std::string::npos ? "/" : encoded.substr(slash);
    }

    std::string decoded;
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.size() &&
            std::isxdigit(static_cast<unsigned char>(encoded[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(encoded[i + 2]))) {
            decoded += static_cast<char>(std::stoi(encoded.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            decoded += encoded[i];
        }
    }
    return std::filesystem::path(decoded);
}

} // namespace ada_mcp
