#include "InstancePool.hpp"
#include "lsp/ProjectLocator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace ada_mcp {

namespace {
constexpr std::chrono::milliseconds kBusyRecheck{50};
}

InstanceLease::InstanceLease(InstancePool* pool, std::shared_ptr<Instance> instance)
    : pool_(pool), instance_(std::move(instance)) {}

InstanceLease::~InstanceLease() {
    release();
}

InstanceLease::InstanceLease(InstanceLease&& other) noexcept
    : pool_(other.pool_), instance_(std::move(other.instance_)) {
    other.pool_ = nullptr;
}

InstanceLease& InstanceLease::operator=(InstanceLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        instance_ = std::move(other.instance_);
        other.pool_ = nullptr;
    }
    return *this;
}

void InstanceLease::release() {
    if (pool_ && instance_) {
        pool_->release(*instance_);
    }
    pool_ = nullptr;
    instance_.reset();
}

InstancePool::InstancePool(PoolConfig config, InstanceFactory factory)
    : config_(config), factory_(std::move(factory)) {
    if (config_.max_instances == 0) {
        throw std::invalid_argument("Pool must allow at least one instance");
    }
    if (!factory_) {
        throw std::invalid_argument("Instance factory cannot be null");
    }

    if (config_.idle_timeout.count() > 0) {
        reaper_ = std::thread([this] { reaper_loop(); });
    }
    spdlog::info("InstancePool initialized (max {} instances)", config_.max_instances);
}

InstancePool::InstancePool(PoolConfig config, InstanceConfig instance_config,
                           std::shared_ptr<IProcessLauncher> launcher)
    : InstancePool(config, [instance_config, launcher](const std::filesystem::path& root) {
          return std::make_shared<Instance>(root, instance_config, launcher);
      }) {}

InstancePool::~InstancePool() {
    shutdown_all();
}

InstanceLease InstancePool::acquire(const std::filesystem::path& project_root) {
    std::string key = ProjectLocator::normalize_root(project_root);
    auto deadline = Clock::now() + config_.acquire_timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (shutting_down_) {
            throw LspError(ErrorKind::Shutdown, "Instance pool is shut down");
        }

        auto it = slots_.find(key);
        if (it != slots_.end()) {
            Slot& slot = it->second;

            if (slot.starting) {
                spdlog::debug("Waiting for instance of {} to finish starting", key);
                if (cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
                    slots_.count(key) && slots_[key].starting) {
                    throw LspError(ErrorKind::Timeout, "Timed out waiting for " + key + " to start");
                }
                continue;
            }

            InstanceState state = slot.instance->state();
            if (state == InstanceState::Dead || state == InstanceState::ShuttingDown) {
                spdlog::warn("Instance for {} is {}, replacing it", key, to_string(state));
                retire(it, lock, "dead");
                continue;
            }

            ++slot.leases;
            slot.instance->touch();
            InstanceLease lease(this, slot.instance);
            lock.unlock();

            // Degraded or Restarting: wait for the restart to finish
            InstanceState settled = lease->wait_settled(deadline);
            if (settled == InstanceState::Ready) {
                spdlog::debug("Reusing instance for {}", key);
                return lease;
            }
            lease.release();
            if (settled != InstanceState::Dead) {
                throw LspError(ErrorKind::Timeout, "Instance for " + key + " did not become ready (" +
                               to_string(settled) + ")");
            }
            lock.lock();
            continue;
        }

        if (live_count() >= config_.max_instances) {
            auto victim = slots_.end();
            for (auto candidate = slots_.begin(); candidate != slots_.end(); ++candidate) {
                const Slot& slot = candidate->second;
                if (slot.starting || slot.leases > 0 || slot.instance->pending_count() > 0) {
                    continue;
                }
                if (victim == slots_.end() ||
                    slot.instance->last_activity() < victim->second.instance->last_activity()) {
                    victim = candidate;
                }
            }

            if (victim != slots_.end()) {
                spdlog::info("Evicting instance for {} (least recently used)", victim->first);
                retire(victim, lock, "evicted");
                continue;
            }

            if (Clock::now() >= deadline) {
                throw LspError(ErrorKind::PoolExhausted,
                               "All " + std::to_string(config_.max_instances) +
                               " instances are busy; cannot start one for " + key);
            }

            // Finishing requests do not signal the pool, so look again periodically
            spdlog::debug("Pool full ({} instances), waiting for one to become idle", live_count());
            cv_.wait_until(lock, std::min(deadline, Clock::now() + kBusyRecheck));
            continue;
        }

        spdlog::info("Creating new instance for project: {}", key);
        auto instance = factory_(std::filesystem::path(key));
        slots_[key] = Slot{instance, 1, true};
        lock.unlock();

        try {
            instance->start();
        } catch (const std::exception& e) {
            spdlog::error("Failed to start instance for {}: {}", key, e.what());
            lock.lock();
            auto failed = slots_.find(key);
            if (failed != slots_.end() && failed->second.instance == instance) {
                slots_.erase(failed);
            }
            cv_.notify_all();
            throw;
        }

        lock.lock();
        auto started = slots_.find(key);
        if (started != slots_.end() && started->second.instance == instance) {
            started->second.starting = false;
        }
        cv_.notify_all();
        return InstanceLease(this, instance);
    }
}

void InstancePool::release(Instance& instance) {
    instance.touch();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(instance.root().string());
        if (it != slots_.end() && it->second.instance.get() == &instance && it->second.leases > 0) {
            --it->second.leases;
        }
    }
    cv_.notify_all();
}

void InstancePool::retire(std::map<std::string, Slot>::iterator it, std::unique_lock<std::mutex>& lock,
                          const char* why) {
    auto instance = std::move(it->second.instance);
    std::string key = it->first;
    slots_.erase(it);
    ++retiring_;
    lock.unlock();

    spdlog::debug("Retiring instance for {} ({})", key, why);
    instance->shutdown();
    instance.reset();

    lock.lock();
    --retiring_;
    cv_.notify_all();
}

std::size_t InstancePool::reap_idle() {
    std::size_t reaped = 0;
    std::unique_lock<std::mutex> lock(mutex_);
    auto now = Clock::now();

    for (auto it = slots_.begin(); it != slots_.end();) {
        const Slot& slot = it->second;
        bool idle = !slot.starting && slot.leases == 0 && slot.instance->pending_count() == 0 &&
                    now - slot.instance->last_activity() > config_.idle_timeout;
        if (!idle) {
            ++it;
            continue;
        }

        std::string key = it->first;
        spdlog::info("Instance for {} idle for more than {}s, shutting down", key,
                     std::chrono::duration_cast<std::chrono::seconds>(config_.idle_timeout).count());
        retire(it, lock, "idle");
        ++reaped;
        it = slots_.upper_bound(key);
    }
    return reaped;
}

void InstancePool::reaper_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutting_down_) {
        cv_.wait_for(lock, config_.reap_interval, [this] { return shutting_down_; });
        if (shutting_down_) {
            break;
        }
        lock.unlock();
        reap_idle();
        lock.lock();
    }
}

void InstancePool::shutdown_all() {
    std::vector<std::shared_ptr<Instance>> instances;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        shutting_down_ = true;
        cv_.notify_all();

        // Let in-progress spawns finish so nothing is left half-started
        cv_.wait(lock, [this] {
            for (const auto& [key, slot] : slots_) {
                if (slot.starting) {
                    return false;
                }
            }
            return true;
        });

        for (auto& [key, slot] : slots_) {
            instances.push_back(std::move(slot.instance));
        }
        slots_.clear();
    }
    cv_.notify_all();

    if (reaper_.joinable()) {
        reaper_.join();
    }

    if (!instances.empty()) {
        spdlog::info("Shutting down {} instance(s)", instances.size());
    }
    for (auto& instance : instances) {
        instance->shutdown();
    }
}

std::size_t InstancePool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

bool InstancePool::contains(const std::filesystem::path& project_root) const {
    std::string key = ProjectLocator::normalize_root(project_root);
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.count(key) > 0;
}

json InstancePool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json projects = json::array();
    for (const auto& [key, slot] : slots_) {
        if (slot.starting) {
            projects.push_back({{"project", key}, {"state", to_string(InstanceState::Starting)}});
        } else {
            json entry = slot.instance->to_json();
            entry["leases"] = slot.leases;
            projects.push_back(entry);
        }
    }
    return {
        {"active_instances", slots_.size()},
        {"max_instances", config_.max_instances},
        {"projects", projects}
    };
}

} // namespace ada_mcp
