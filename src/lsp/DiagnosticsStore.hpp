#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace ada_mcp {

using json = nlohmann::json;

/**
 * @brief Latest diagnostics pushed by the server, keyed by document URI
 */
class DiagnosticsStore {
public:
    /**
     * @brief Apply a textDocument/publishDiagnostics parameter object
     */
    void publish(const json& params);

    /**
     * @brief Return diagnostics grouped by URI
     * @param uri Restrict to one document
     * @param severity Keep only diagnostics with this LSP severity (1 error .. 4 hint)
     * @return Object mapping URI to an array of diagnostics
     */
    json get(const std::optional<std::string>& uri = std::nullopt,
             std::optional<int> severity = std::nullopt) const;

    void clear();
    std::size_t document_count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, json> by_uri_;
};

} // namespace ada_mcp
