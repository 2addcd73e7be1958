#pragma once

#include "lsp/Instance.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ada_mcp {

struct PoolConfig {
    std::size_t max_instances = 3;
    std::chrono::milliseconds acquire_timeout{60000};
    std::chrono::milliseconds idle_timeout{300000};  // 0 disables idle reaping
    std::chrono::milliseconds reap_interval{60000};
};

class InstancePool;

/**
 * @brief Scoped use of a pooled instance; releases it on destruction
 */
class InstanceLease {
public:
    InstanceLease() = default;
    InstanceLease(InstancePool* pool, std::shared_ptr<Instance> instance);
    ~InstanceLease();

    InstanceLease(InstanceLease&& other) noexcept;
    InstanceLease& operator=(InstanceLease&& other) noexcept;
    InstanceLease(const InstanceLease&) = delete;
    InstanceLease& operator=(const InstanceLease&) = delete;

    Instance* operator->() const { return instance_.get(); }
    Instance& operator*() const { return *instance_; }
    Instance* get() const { return instance_.get(); }
    explicit operator bool() const { return instance_ != nullptr; }

    /**
     * @brief Return the instance to the pool early
     */
    void release();

private:
    InstancePool* pool_ = nullptr;
    std::shared_ptr<Instance> instance_;
};

/**
 * @brief Bounded set of language-server instances, one per project root
 *
 * Instances are created lazily on first acquire and stay resident between
 * calls. When the bound is reached, the least recently used idle instance is
 * shut down to make room; an instance that is leased or has pending requests
 * is never evicted. Concurrent acquires for the same root share one spawn.
 */
class InstancePool {
public:
    using InstanceFactory = std::function<std::shared_ptr<Instance>(const std::filesystem::path& root)>;

    /**
     * @param config Pool bounds and timeouts
     * @param factory Creates an unstarted instance for a root
     */
    InstancePool(PoolConfig config, InstanceFactory factory);

    /**
     * @brief Convenience constructor creating instances from a shared configuration
     */
    InstancePool(PoolConfig config, InstanceConfig instance_config, std::shared_ptr<IProcessLauncher> launcher);

    ~InstancePool();

    InstancePool(const InstancePool&) = delete;
    InstancePool& operator=(const InstancePool&) = delete;

    /**
     * @brief Get a Ready instance for a project root, starting one if needed
     *
     * Waits for an instance of the same root that is starting or restarting
     * instead of spawning a second one. Dead instances are replaced.
     *
     * @throws LspError Startup if the new instance fails its handshake,
     *         PoolExhausted if nothing could be evicted before the acquire timeout,
     *         Timeout if the instance did not become Ready in time,
     *         Shutdown once shutdown_all() has run
     */
    InstanceLease acquire(const std::filesystem::path& project_root);

    /**
     * @brief Mark one use of the instance finished and update its LRU position
     */
    void release(Instance& instance);

    /**
     * @brief Shut down instances idle for longer than the idle timeout
     * @return Number of instances shut down
     */
    std::size_t reap_idle();

    /**
     * @brief Drain and terminate every instance; later acquires fail with Shutdown
     */
    void shutdown_all();

    std::size_t size() const;
    bool contains(const std::filesystem::path& project_root) const;
    json stats() const;

    const PoolConfig& config() const { return config_; }

private:
    struct Slot {
        std::shared_ptr<Instance> instance;
        int leases = 0;
        bool starting = true;
    };

    std::size_t live_count() const { return slots_.size() + retiring_; }

    /**
     * @brief Remove a slot and shut its instance down outside the lock
     */
    void retire(std::map<std::string, Slot>::iterator it, std::unique_lock<std::mutex>& lock,
                const char* why);

    void reaper_loop();

    PoolConfig config_;
    InstanceFactory factory_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Slot> slots_;
    std::size_t retiring_ = 0;
    bool shutting_down_ = false;

    std::thread reaper_;
};

} // namespace ada_mcp
