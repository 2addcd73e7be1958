#include "ResponseCache.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace ada_mcp {

ResponseCache::ResponseCache(CacheConfig config, TimeSource now)
    : config_(config), now_(std::move(now)) {
    if (!now_) {
        throw std::invalid_argument("Time source cannot be null");
    }
    if (config_.max_entries == 0) {
        throw std::invalid_argument("Cache must hold at least one entry");
    }
}

std::string ResponseCache::canonical_params(const json& params) {
    // nlohmann::json stores objects in a std::map, so dump() is key-sorted
    return params.dump();
}

std::optional<json> ResponseCache::get(const std::string& project, const std::string& method, const json& params) {
    Key key{project, method, canonical_params(params)};

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++stats_.misses;
        return std::nullopt;
    }

    if (now_() >= it->second.expires_at) {
        entries_.erase(it);
        ++stats_.misses;
        ++stats_.evictions;
        spdlog::trace("Cache entry expired: {} {}", project, method);
        return std::nullopt;
    }

    ++stats_.hits;
    spdlog::debug("Cache hit for {} in {}", method, project);
    return *it->second.value;
}

void ResponseCache::put(const std::string& project,
                        const std::string& method,
                        const json& params,
                        json value,
                        std::optional<std::chrono::milliseconds> ttl) {
    Key key{project, method, canonical_params(params)};
    auto now = now_();

    Entry entry;
    entry.value = std::make_shared<const json>(std::move(value));
    entry.created_at = now;
    entry.expires_at = now + ttl.value_or(config_.ttl);
    if (params.is_object() && params.contains("textDocument") && params["textDocument"].is_object()) {
        entry.document_uri = params["textDocument"].value("uri", std::string());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.find(key) == entries_.end() && entries_.size() >= config_.max_entries) {
        evict_for_insert();
    }
    entries_[key] = std::move(entry);
}

void ResponseCache::evict_for_insert() {
    auto now = now_();
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.expires_at) {
            it = entries_.erase(it);
            ++stats_.evictions;
        } else {
            ++it;
        }
    }

    if (entries_.size() >= config_.max_entries) {
        auto soonest = std::min_element(entries_.begin(), entries_.end(),
            [](const auto& a, const auto& b) { return a.second.expires_at < b.second.expires_at; });
        entries_.erase(soonest);
        ++stats_.evictions;
    }
}

std::size_t ResponseCache::invalidate(const std::string& project) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    auto it = entries_.lower_bound(Key{project, "", ""});
    while (it != entries_.end() && it->first.project == project) {
        it = entries_.erase(it);
        ++removed;
    }
    stats_.evictions += removed;
    if (removed > 0) {
        spdlog::debug("Invalidated {} cache entries for {}", removed, project);
    }
    return removed;
}

std::size_t ResponseCache::invalidate_document(const std::string& project, const std::string& uri) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    auto it = entries_.lower_bound(Key{project, "", ""});
    while (it != entries_.end() && it->first.project == project) {
        if (it->second.document_uri == uri) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    stats_.evictions += removed;
    return removed;
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.evictions += entries_.size();
    entries_.clear();
}

std::size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

CacheStats ResponseCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void ResponseCache::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = CacheStats{};
}

json ResponseCache::stats_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"size", entries_.size()},
        {"hits", stats_.hits},
        {"misses", stats_.misses},
        {"evictions", stats_.evictions},
        {"hit_rate", stats_.hit_rate()}
    };
}

} // namespace ada_mcp
