#include "DiagnosticsStore.hpp"
#include <spdlog/spdlog.h>

namespace ada_mcp {

void DiagnosticsStore::publish(const json& params) {
    if (!params.is_object()) {
        return;
    }

    std::string uri = params.value("uri", std::string());
    json diagnostics = params.value("diagnostics", json::array());
    if (!diagnostics.is_array()) {
        diagnostics = json::array();
    }

    spdlog::debug("Received {} diagnostics for {}", diagnostics.size(), uri);

    std::lock_guard<std::mutex> lock(mutex_);
    by_uri_[uri] = std::move(diagnostics);
}

json DiagnosticsStore::get(const std::optional<std::string>& uri, std::optional<int> severity) const {
    json result = json::object();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [doc, diagnostics] : by_uri_) {
        if (uri && doc != *uri) {
            continue;
        }

        json filtered = json::array();
        for (const auto& diagnostic : diagnostics) {
            if (!severity || (diagnostic.is_object() && diagnostic.value("severity", 1) == *severity)) {
                filtered.push_back(diagnostic);
            }
        }
        result[doc] = std::move(filtered);
    }

    if (uri && !result.contains(*uri)) {
        result[*uri] = json::array();
    }
    return result;
}

void DiagnosticsStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    by_uri_.clear();
}

std::size_t DiagnosticsStore::document_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_uri_.size();
}

} // namespace ada_mcp
