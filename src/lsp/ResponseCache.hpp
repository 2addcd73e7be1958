#pragma once

#include "lsp/PendingRequest.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>

namespace ada_mcp {

using json = nlohmann::json;

struct CacheConfig {
    std::chrono::milliseconds ttl{5000};
    std::size_t max_entries = 1000;
};

/**
 * @brief Counters for cache effectiveness
 */
struct CacheStats {
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t evictions = 0;

    double hit_rate() const {
        std::size_t total = hits + misses;
        return total > 0 ? static_cast<double>(hits) * 100.0 / static_cast<double>(total) : 0.0;
    }
};

/**
 * @brief Time-bounded memo of read-only language-server responses
 *
 * Keyed by (project root, method, canonical parameter encoding). A value put
 * with ttl T is returned unchanged before T has elapsed and is absent from T
 * on. Entries are never mutated; a put for an existing key replaces it.
 * The cache never talks to a language server itself.
 */
class ResponseCache {
public:
    using TimeSource = std::function<Clock::time_point()>;

    explicit ResponseCache(CacheConfig config = {}, TimeSource now = &Clock::now);

    std::optional<json> get(const std::string& project, const std::string& method, const json& params);

    /**
     * @brief Store a value
     * @param ttl Lifetime of this entry; the configured default if omitted
     */
    void put(const std::string& project,
             const std::string& method,
             const json& params,
             json value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    /**
     * @brief Drop every entry of one project
     * @return Number of entries removed
     */
    std::size_t invalidate(const std::string& project);

    /**
     * @brief Drop the entries of one project whose parameters name a document URI
     * @return Number of entries removed
     */
    std::size_t invalidate_document(const std::string& project, const std::string& uri);

    void clear();

    std::size_t size() const;
    CacheStats stats() const;
    void reset_stats();
    json stats_json() const;

    std::chrono::milliseconds default_ttl() const { return config_.ttl; }

    /**
     * @brief Deterministic encoding of request parameters
     *
     * Object members are emitted in sorted key order, so equal parameters
     * always produce equal keys.
     */
    static std::string canonical_params(const json& params);

private:
    struct Key {
        std::string project;
        std::string method;
        std::string params;

        bool operator<(const Key& other) const {
            return std::tie(project, method, params) < std::tie(other.project, other.method, other.params);
        }
    };

    struct Entry {
        std::shared_ptr<const json> value;
        Clock::time_point created_at;
        Clock::time_point expires_at;
        std::string document_uri;
    };

    /**
     * @brief Make room for one more entry (lock held)
     */
    void evict_for_insert();

    CacheConfig config_;
    TimeSource now_;

    mutable std::mutex mutex_;
    std::map<Key, Entry> entries_;
    CacheStats stats_;
};

} // namespace ada_mcp
