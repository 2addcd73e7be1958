#pragma once

#include "lsp/DiagnosticsStore.hpp"
#include "lsp/Errors.hpp"
#include "lsp/NotificationQueue.hpp"
#include "lsp/PendingRequest.hpp"
#include "lsp/Process.hpp"
#include "lsp/RestartPolicy.hpp"
#include "lsp/RpcClient.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ada_mcp {

/**
 * @brief Lifecycle of one supervised language-server session
 *
 * Starting -> Ready -> (Degraded -> Restarting -> Ready)* -> ShuttingDown -> Dead
 */
enum class InstanceState {
    Starting,
    Ready,
    Degraded,
    Restarting,
    ShuttingDown,
    Dead
};

const char* to_string(InstanceState state);

/**
 * @brief Per-instance settings, filled from the command line
 */
struct InstanceConfig {
    std::string executable = "ada_language_server";
    std::vector<std::string> args;
    std::string project_file;  // preferred GPR file name relative to the root

    std::chrono::milliseconds startup_timeout{30000};
    std::chrono::milliseconds request_timeout{30000};  // bounds notification writes
    std::chrono::milliseconds shutdown_grace{5000};    // bounds the whole graceful exit

    std::chrono::milliseconds probe_interval{2000};  // 0 disables liveness probing
    std::string probe_method;                        // empty: process liveness only
    std::chrono::milliseconds probe_timeout{5000};

    std::chrono::milliseconds stable_after{30000};   // crash counter resets after this long Ready
    RestartPolicy restart;
    std::size_t notification_capacity = 1024;
};

/**
 * @brief Discrete input to the lifecycle state machine
 */
struct LifecycleEvent {
    enum class Type {
        ProcessExited,  // stream closed or process reaped
        ProbeFailed,    // liveness probe timed out
        BackoffElapsed  // restart delay is over
    };

    Type type;
    std::uint64_t session = 0;  // session the event refers to; stale events are ignored
    std::string detail;
};

/**
 * @brief Snapshot passed to the lifecycle observer on every state change
 */
struct StateTransition {
    InstanceState from;
    InstanceState to;
    int consecutive_crashes;
    std::chrono::milliseconds backoff;
    std::string reason;
};

/**
 * @brief One external language-server process bound to one project root
 *
 * Owns spawn, handshake, health monitoring, crash recovery with exponential
 * backoff, and graceful shutdown. Recovery is an explicit state machine fed
 * by LifecycleEvents from the read loop, the liveness probe and the backoff
 * timer; post_event() lets tests drive it directly.
 */
class Instance {
public:
    using Observer = std::function<void(const StateTransition&)>;

    Instance(std::filesystem::path root,
             InstanceConfig config,
             std::shared_ptr<IProcessLauncher> launcher);
    ~Instance();

    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

    /**
     * @brief Spawn the process and complete the initialize handshake
     * @throws LspError Startup on failure; the instance is then Dead
     */
    void start();

    /**
     * @brief Send a request, waiting for the instance to be Ready first
     * @throws LspError Protocol, Timeout, Disconnected, Dead or Shutdown
     */
    json request(const std::string& method, const json& params, std::chrono::milliseconds timeout);

    /**
     * @brief Send a notification to the Ready process
     * @throws LspError Disconnected, Dead or Shutdown if not Ready
     */
    void notify(const std::string& method, const json& params);

    /**
     * @brief Open a document in the server, or resend it if it changed on disk
     * @return true if the document content changed since it was last sent
     */
    bool ensure_document_open(const std::filesystem::path& file);

    /**
     * @brief Graceful shutdown: "shutdown" request, "exit", grace period, then kill
     *
     * Fails still-pending requests with Shutdown. Idempotent.
     */
    void shutdown();

    /**
     * @brief Feed an event to the state machine
     */
    void post_event(LifecycleEvent event);

    /**
     * @brief Wait until the instance is Ready, Dead or shutting down
     * @return The state at wake-up, which may still be transient on timeout
     */
    InstanceState wait_settled(Clock::time_point deadline) const;

    void set_observer(Observer observer);

    InstanceState state() const;
    const std::filesystem::path& root() const { return root_; }
    std::uint64_t session() const;
    int consecutive_crashes() const;
    int restart_count() const;
    std::chrono::milliseconds current_backoff() const;
    json server_capabilities() const;

    /**
     * @brief Requests in flight or waiting for the instance to become Ready
     */
    int pending_count() const { return active_calls_.load(); }

    Clock::time_point last_activity() const;
    void touch();

    std::shared_ptr<NotificationQueue> notifications() const { return notifications_; }
    DiagnosticsStore& diagnostics() { return diagnostics_; }

    json to_json() const;

private:
    struct Session {
        std::uint64_t id = 0;
        std::unique_ptr<ILspProcess> process;
        std::shared_ptr<RpcClient> client;
        json capabilities;
    };

    struct OpenDocument {
        std::uint64_t session = 0;
        int version = 1;
        std::filesystem::file_time_type mtime;
    };

    class ActiveCall;

    /**
     * @brief Launch a process and run the handshake; no lock held
     * @throws LspError Startup
     */
    Session spawn_session();

    /**
     * @brief Install a freshly started session and become Ready (lock held)
     */
    void install_session(Session session);

    static void teardown(std::shared_ptr<RpcClient> client,
                         std::unique_ptr<ILspProcess> process,
                         ErrorKind kind);

    void supervise();
    void handle_event(const LifecycleEvent& event, std::unique_lock<std::mutex>& lock);
    void handle_crash(const LifecycleEvent& event, std::unique_lock<std::mutex>& lock);
    void handle_backoff_elapsed(std::unique_lock<std::mutex>& lock);
    void run_probe(std::unique_lock<std::mutex>& lock);
    void set_state(InstanceState to, const std::string& reason);
    void on_notification(const json& message);

    std::filesystem::path root_;
    InstanceConfig config_;
    std::shared_ptr<IProcessLauncher> launcher_;

    mutable std::mutex mutex_;
    mutable std::condition_variable state_cv_;
    std::condition_variable events_cv_;

    InstanceState state_ = InstanceState::Starting;
    std::string dead_reason_;
    Session session_;
    std::atomic<std::uint64_t> next_session_id_{0};

    int consecutive_crashes_ = 0;
    int restart_count_ = 0;
    std::chrono::milliseconds backoff_{0};
    std::optional<Clock::time_point> restart_at_;
    Clock::time_point ready_since_;
    Clock::time_point next_probe_;
    Clock::time_point last_activity_;

    std::deque<LifecycleEvent> events_;
    bool stop_supervisor_ = false;
    std::thread supervisor_;
    Observer observer_;

    std::atomic<int> active_calls_{0};

    std::mutex documents_mutex_;
    std::map<std::string, OpenDocument> open_documents_;

    std::shared_ptr<NotificationQueue> notifications_;
    DiagnosticsStore diagnostics_;
};

} // namespace ada_mcp
