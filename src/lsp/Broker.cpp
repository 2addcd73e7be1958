#include "Broker.hpp"
#include "lsp/ProjectLocator.hpp"
#include "lsp/Uri.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ada_mcp {

Broker::Broker(BrokerConfig config, std::shared_ptr<InstancePool> pool, std::shared_ptr<ResponseCache> cache)
    : config_(std::move(config)), pool_(std::move(pool)), cache_(std::move(cache)) {
    if (!pool_) {
        throw std::invalid_argument("Instance pool cannot be null");
    }
    if (!cache_) {
        throw std::invalid_argument("Response cache cannot be null");
    }
}

json Broker::submit(const std::filesystem::path& project_root,
                    const std::string& method,
                    const json& params,
                    const RequestOptions& options) {
    if (method.empty()) {
        throw std::invalid_argument("Method name cannot be empty");
    }

    std::string key = ProjectLocator::normalize_root(project_root);

    if (options.cacheable) {
        if (auto cached = cache_->get(key, method, params)) {
            return *cached;
        }
    }

    auto lease = pool_->acquire(key);
    json result = lease->request(method, params, options.timeout.value_or(config_.request_timeout));

    if (options.cacheable) {
        cache_->put(key, method, params, result, options.ttl);
    }
    return result;
}

void Broker::notify(const std::filesystem::path& project_root, const std::string& method, const json& params) {
    if (method.empty()) {
        throw std::invalid_argument("Method name cannot be empty");
    }
    auto lease = pool_->acquire(project_root);
    lease->notify(method, params);
}

std::filesystem::path Broker::resolve_root(const std::filesystem::path& file) const {
    if (config_.project_root) {
        return *config_.project_root;
    }
    return ProjectLocator::find_project_root(file);
}

std::filesystem::path Broker::open_document(const std::filesystem::path& file) {
    auto absolute = std::filesystem::absolute(file);
    auto root = std::filesystem::path(ProjectLocator::normalize_root(resolve_root(absolute)));

    auto lease = pool_->acquire(root);
    if (lease->ensure_document_open(absolute)) {
        std::size_t dropped = cache_->invalidate(root.string());
        spdlog::debug("{} changed on disk, dropped {} cached responses", file_to_uri(absolute), dropped);
    }
    return root;
}

std::size_t Broker::invalidate(const std::filesystem::path& project_root) {
    return cache_->invalidate(ProjectLocator::normalize_root(project_root));
}

json Broker::diagnostics(const std::filesystem::path& project_root,
                         const std::optional<std::string>& uri,
                         std::optional<int> severity) {
    auto lease = pool_->acquire(project_root);
    return lease->diagnostics().get(uri, severity);
}

json Broker::stats() const {
    json result = pool_->stats();
    result["cache"] = cache_->stats_json();
    return result;
}

void Broker::shutdown_all() {
    pool_->shutdown_all();
    cache_->clear();
}

} // namespace ada_mcp
