#pragma once

#include "lsp/InstancePool.hpp"
#include "lsp/ResponseCache.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace ada_mcp {

using json = nlohmann::json;

/**
 * @brief Per-request options of Broker::submit
 */
struct RequestOptions {
    std::optional<std::chrono::milliseconds> timeout;  // broker default if omitted
    bool cacheable = false;                            // read-only request, may be served from cache
    std::optional<std::chrono::milliseconds> ttl;      // cache default if omitted
};

struct BrokerConfig {
    std::optional<std::filesystem::path> project_root;  // force one root for every file
    std::chrono::milliseconds request_timeout{30000};
};

/**
 * @brief Entry point for tool handlers: routes requests through cache and pool
 *
 * submit() consults the cache for cacheable requests, otherwise leases the
 * instance for the project root from the pool and sends the request. Method
 * bodies are opaque; only the result of a successful cacheable call is stored.
 */
class Broker {
public:
    Broker(BrokerConfig config, std::shared_ptr<InstancePool> pool, std::shared_ptr<ResponseCache> cache);

    /**
     * @brief Send a request to the language server of a project
     *
     * @param project_root Project root directory
     * @param method LSP method name
     * @param params Request parameters
     * @param options Timeout and caching options
     * @return The "result" member of the response
     * @throws LspError on any failure kind
     * @throws std::invalid_argument if method is empty
     */
    json submit(const std::filesystem::path& project_root,
                const std::string& method,
                const json& params,
                const RequestOptions& options = {});

    /**
     * @brief Send a notification to the language server of a project
     */
    void notify(const std::filesystem::path& project_root, const std::string& method, const json& params);

    /**
     * @brief Project root serving a file, honoring a forced root
     */
    std::filesystem::path resolve_root(const std::filesystem::path& file) const;

    /**
     * @brief Make sure the server has the current content of a file
     *
     * Opens the file in its project's instance. If the file changed since it
     * was last sent, the project's cached responses are dropped.
     *
     * @return Project root of the file
     */
    std::filesystem::path open_document(const std::filesystem::path& file);

    /**
     * @brief Drop cached responses of a project
     * @return Number of entries removed
     */
    std::size_t invalidate(const std::filesystem::path& project_root);

    /**
     * @brief Diagnostics last published by the project's server
     */
    json diagnostics(const std::filesystem::path& project_root,
                     const std::optional<std::string>& uri = std::nullopt,
                     std::optional<int> severity = std::nullopt);

    /**
     * @brief Pool and cache statistics
     */
    json stats() const;

    void shutdown_all();

    InstancePool& pool() { return *pool_; }
    ResponseCache& cache() { return *cache_; }
    const BrokerConfig& config() const { return config_; }

private:
    BrokerConfig config_;
    std::shared_ptr<InstancePool> pool_;
    std::shared_ptr<ResponseCache> cache_;
};

} // namespace ada_mcp
