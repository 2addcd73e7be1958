#include "Instance.hpp"
#include "lsp/FramedTransport.hpp"
#include "lsp/Handshake.hpp"
#include "lsp/ProjectLocator.hpp"
#include "lsp/Uri.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace ada_mcp {

const char* to_string(InstanceState state) {
    switch (state) {
        case InstanceState::Starting: return "starting";
        case InstanceState::Ready: return "ready";
        case InstanceState::Degraded: return "degraded";
        case InstanceState::Restarting: return "restarting";
        case InstanceState::ShuttingDown: return "shutting_down";
        case InstanceState::Dead: return "dead";
    }
    return "unknown";
}

/**
 * @brief Counts a caller as pending for the lifetime of one request
 */
class Instance::ActiveCall {
public:
    explicit ActiveCall(Instance& instance) : instance_(instance) {
        ++instance_.active_calls_;
        instance_.touch();
    }
    ~ActiveCall() {
        instance_.touch();
        --instance_.active_calls_;
    }

private:
    Instance& instance_;
};

Instance::Instance(std::filesystem::path root,
                   InstanceConfig config,
                   std::shared_ptr<IProcessLauncher> launcher)
    : root_(std::move(root)),
      config_(std::move(config)),
      launcher_(std::move(launcher)),
      last_activity_(Clock::now()),
      notifications_(std::make_shared<NotificationQueue>(config_.notification_capacity)) {
    if (!launcher_) {
        throw std::invalid_argument("Process launcher cannot be null");
    }
}

Instance::~Instance() {
    shutdown();
}

void Instance::set_observer(Observer observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

void Instance::set_state(InstanceState to, const std::string& reason) {
    InstanceState from = state_;
    state_ = to;

    if (to == InstanceState::Dead || to == InstanceState::Degraded) {
        spdlog::warn("Instance {}: {} -> {} ({})", root_.string(), to_string(from), to_string(to), reason);
    } else {
        spdlog::info("Instance {}: {} -> {}{}", root_.string(), to_string(from), to_string(to),
                     reason.empty() ? "" : " (" + reason + ")");
    }

    state_cv_.notify_all();
    if (observer_) {
        observer_(StateTransition{from, to, consecutive_crashes_, backoff_, reason});
    }
}

void Instance::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != InstanceState::Starting || supervisor_.joinable()) {
            throw std::logic_error("Instance for " + root_.string() + " already started");
        }
    }

    Session session;
    try {
        session = spawn_session();
    } catch (const LspError& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        dead_reason_ = e.what();
        set_state(InstanceState::Dead, e.what());
        notifications_->close();
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    install_session(std::move(session));
    set_state(InstanceState::Ready, "handshake complete");
    supervisor_ = std::thread([this] { supervise(); });
}

Instance::Session Instance::spawn_session() {
    Session session;
    session.id = ++next_session_id_;

    ProcessSpec spec{config_.executable, config_.args, root_};
    session.process = launcher_->launch(spec);

    auto transport = std::make_shared<FramedTransport>(session.process->stream());
    session.client = std::make_shared<RpcClient>(transport);
    session.client->set_write_timeout(config_.request_timeout);
    session.client->set_notification_handler([this](const json& message) { on_notification(message); });

    std::uint64_t id = session.id;
    session.client->start_reading([this, id](const std::string& reason) {
        post_event(LifecycleEvent{LifecycleEvent::Type::ProcessExited, id, reason});
    });

    try {
        auto project_file = ProjectLocator::find_project_file(root_, config_.project_file);
        if (!project_file) {
            spdlog::warn("No GPR project file in {}; indexing disabled", root_.string());
        }

        json result = session.client->call(
            "initialize",
            build_initialize_params(root_, project_file, static_cast<int>(::getpid())),
            config_.startup_timeout);
        session.capabilities = result.is_object() ? result.value("capabilities", json::object())
                                                  : json::object();
        session.client->notify("initialized", json::object());

        if (project_file) {
            std::ifstream in(*project_file);
            std::stringstream text;
            text << in.rdbuf();
            session.client->notify("textDocument/didOpen", {
                {"textDocument", {
                    {"uri", file_to_uri(*project_file)},
                    {"languageId", "gpr"},
                    {"version", 1},
                    {"text", text.str()}
                }}
            });
        }
    } catch (const std::exception& e) {
        teardown(std::move(session.client), std::move(session.process), ErrorKind::Startup);
        throw LspError(ErrorKind::Startup,
                       "Handshake with " + config_.executable + " for " + root_.string() +
                       " failed: " + e.what());
    }

    spdlog::info("Language server initialized for {} (session {})", root_.string(), session.id);
    return session;
}

void Instance::install_session(Session session) {
    session_ = std::move(session);
    ready_since_ = Clock::now();
    next_probe_ = ready_since_ + config_.probe_interval;
    restart_at_.reset();
}

void Instance::teardown(std::shared_ptr<RpcClient> client,
                        std::unique_ptr<ILspProcess> process,
                        ErrorKind kind) {
    if (client) {
        client->close(kind);
    }
    if (process && process->is_running()) {
        process->kill();
        if (!process->wait_for_exit(std::chrono::milliseconds(2000))) {
            spdlog::error("Process {} did not exit after SIGKILL", process->pid());
        }
    }
}

void Instance::post_event(LifecycleEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    events_cv_.notify_all();
}

void Instance::supervise() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stop_supervisor_ && state_ != InstanceState::Dead) {
        if (!events_.empty()) {
            LifecycleEvent event = std::move(events_.front());
            events_.pop_front();
            handle_event(event, lock);
            continue;
        }

        std::optional<Clock::time_point> wake;
        auto consider = [&wake](Clock::time_point t) {
            if (!wake || t < *wake) {
                wake = t;
            }
        };

        if (state_ == InstanceState::Degraded && restart_at_) {
            consider(*restart_at_);
        }
        if (state_ == InstanceState::Ready) {
            if (config_.probe_interval.count() > 0) {
                consider(next_probe_);
            }
            if (consecutive_crashes_ > 0) {
                consider(ready_since_ + config_.stable_after);
            }
        }

        auto has_work = [this] { return stop_supervisor_ || !events_.empty(); };
        if (wake) {
            events_cv_.wait_until(lock, *wake, has_work);
        } else {
            events_cv_.wait(lock, has_work);
        }
        if (stop_supervisor_ || !events_.empty()) {
            continue;
        }

        auto now = Clock::now();
        if (state_ == InstanceState::Degraded && restart_at_ && now >= *restart_at_) {
            events_.push_back(LifecycleEvent{LifecycleEvent::Type::BackoffElapsed, session_.id, ""});
            continue;
        }
        if (state_ == InstanceState::Ready && consecutive_crashes_ > 0 &&
            now - ready_since_ >= config_.stable_after) {
            spdlog::info("Instance {} stable after restart, resetting crash counter", root_.string());
            consecutive_crashes_ = 0;
            backoff_ = std::chrono::milliseconds(0);
        }
        if (state_ == InstanceState::Ready && config_.probe_interval.count() > 0 && now >= next_probe_) {
            next_probe_ = now + config_.probe_interval;
            run_probe(lock);
        }
    }

    spdlog::debug("Supervisor for {} exiting", root_.string());
}

void Instance::handle_event(const LifecycleEvent& event, std::unique_lock<std::mutex>& lock) {
    switch (event.type) {
        case LifecycleEvent::Type::ProcessExited:
        case LifecycleEvent::Type::ProbeFailed:
            handle_crash(event, lock);
            break;
        case LifecycleEvent::Type::BackoffElapsed:
            handle_backoff_elapsed(lock);
            break;
    }
}

void Instance::handle_crash(const LifecycleEvent& event, std::unique_lock<std::mutex>& lock) {
    if (state_ != InstanceState::Ready || event.session != session_.id) {
        spdlog::debug("Ignoring stale lifecycle event for {} (session {}, current {}, state {})",
                      root_.string(), event.session, session_.id, to_string(state_));
        return;
    }

    std::string reason = event.detail.empty() ? "process exited" : event.detail;
    if (event.type == LifecycleEvent::Type::ProbeFailed) {
        reason = "health probe failed: " + reason;
    }

    auto client = std::move(session_.client);
    auto process = std::move(session_.process);

    ++consecutive_crashes_;
    bool give_up = config_.restart.exhausted(consecutive_crashes_);
    if (!give_up) {
        backoff_ = config_.restart.delay_for(consecutive_crashes_);
        restart_at_ = Clock::now() + backoff_;
    }
    set_state(InstanceState::Degraded, reason);

    // Fail in-flight work before the potentially slow teardown
    lock.unlock();
    if (client) {
        client->fail_all(ErrorKind::Disconnected, reason);
    }
    teardown(std::move(client), std::move(process), ErrorKind::Disconnected);
    lock.lock();

    if (stop_supervisor_) {
        return;
    }

    if (give_up) {
        dead_reason_ = "restart budget exhausted after " + std::to_string(consecutive_crashes_ - 1) +
                       " restart(s): " + reason;
        spdlog::error("Language server for {} crashed {} times, giving up",
                      root_.string(), consecutive_crashes_);
        set_state(InstanceState::Dead, dead_reason_);
        notifications_->close();
        return;
    }

    spdlog::info("Restarting language server for {} in {}ms (attempt {}/{})",
                 root_.string(), backoff_.count(), consecutive_crashes_, config_.restart.max_attempts);
}

void Instance::handle_backoff_elapsed(std::unique_lock<std::mutex>& lock) {
    if (state_ != InstanceState::Degraded) {
        return;
    }

    restart_at_.reset();
    set_state(InstanceState::Restarting, "attempt " + std::to_string(consecutive_crashes_));

    lock.unlock();
    Session session;
    std::string failure;
    try {
        session = spawn_session();
    } catch (const LspError& e) {
        failure = e.what();
    }
    lock.lock();

    if (stop_supervisor_) {
        if (failure.empty()) {
            lock.unlock();
            teardown(std::move(session.client), std::move(session.process), ErrorKind::Shutdown);
            lock.lock();
        }
        return;
    }

    if (failure.empty()) {
        install_session(std::move(session));
        ++restart_count_;
        set_state(InstanceState::Ready, "restart #" + std::to_string(restart_count_));
        return;
    }

    ++consecutive_crashes_;
    if (config_.restart.exhausted(consecutive_crashes_)) {
        dead_reason_ = "restart budget exhausted: " + failure;
        set_state(InstanceState::Dead, dead_reason_);
        notifications_->close();
        return;
    }

    backoff_ = config_.restart.delay_for(consecutive_crashes_);
    restart_at_ = Clock::now() + backoff_;
    set_state(InstanceState::Degraded, "restart failed: " + failure);
}

void Instance::run_probe(std::unique_lock<std::mutex>& lock) {
    std::uint64_t id = session_.id;

    if (session_.process && !session_.process->is_running()) {
        auto status = session_.process->wait_for_exit(std::chrono::milliseconds(0));
        events_.push_back(LifecycleEvent{
            LifecycleEvent::Type::ProcessExited, id,
            status ? "process " + status->describe() : "process exited"});
        return;
    }

    if (config_.probe_method.empty() || !session_.client) {
        return;
    }

    auto client = session_.client;
    lock.unlock();
    bool failed = false;
    std::string detail;
    try {
        client->call(config_.probe_method, json::object(), config_.probe_timeout);
    } catch (const LspError& e) {
        // An error answer still proves the server is alive
        if (e.kind() == ErrorKind::Timeout) {
            failed = true;
            detail = e.what();
        }
    }
    lock.lock();

    if (failed) {
        events_.push_back(LifecycleEvent{LifecycleEvent::Type::ProbeFailed, id, detail});
    }
}

InstanceState Instance::wait_settled(Clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    state_cv_.wait_until(lock, deadline, [this] {
        return state_ == InstanceState::Ready || state_ == InstanceState::Dead ||
               state_ == InstanceState::ShuttingDown;
    });
    return state_;
}

json Instance::request(const std::string& method, const json& params, std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    ActiveCall active(*this);

    std::shared_ptr<RpcClient> client;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        state_cv_.wait_until(lock, deadline, [this] {
            return state_ == InstanceState::Ready || state_ == InstanceState::Dead ||
                   state_ == InstanceState::ShuttingDown;
        });

        switch (state_) {
            case InstanceState::Ready:
                client = session_.client;
                break;
            case InstanceState::Dead:
                throw LspError(ErrorKind::Dead, "Language server for " + root_.string() +
                               " is dead: " + dead_reason_);
            case InstanceState::ShuttingDown:
                throw LspError(ErrorKind::Shutdown, "Language server for " + root_.string() +
                               " is shutting down");
            default:
                throw LspError(ErrorKind::Timeout, "Request " + method + " timed out waiting for " +
                               root_.string() + " to become ready (" + to_string(state_) + ")");
        }
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (remaining.count() <= 0) {
        throw LspError(ErrorKind::Timeout, "Request " + method + " timed out before it was sent");
    }
    return client->call(method, params, remaining);
}

void Instance::notify(const std::string& method, const json& params) {
    std::shared_ptr<RpcClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == InstanceState::Dead) {
            throw LspError(ErrorKind::Dead, "Language server for " + root_.string() + " is dead: " + dead_reason_);
        }
        if (state_ == InstanceState::ShuttingDown) {
            throw LspError(ErrorKind::Shutdown, "Language server for " + root_.string() + " is shutting down");
        }
        if (state_ != InstanceState::Ready) {
            throw LspError(ErrorKind::Disconnected, "Language server for " + root_.string() + " is " +
                           to_string(state_));
        }
        client = session_.client;
    }
    touch();
    client->notify(method, params);
}

bool Instance::ensure_document_open(const std::filesystem::path& file) {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(file, ec);
    if (ec) {
        spdlog::warn("File not found: {}", file.string());
        return false;
    }

    std::string uri = file_to_uri(file);
    std::uint64_t current = session();

    std::optional<OpenDocument> known;
    {
        std::lock_guard<std::mutex> lock(documents_mutex_);
        auto it = open_documents_.find(uri);
        if (it != open_documents_.end() && it->second.session == current) {
            if (it->second.mtime == mtime) {
                return false;
            }
            known = it->second;
        }
    }

    std::ifstream in(file);
    std::stringstream text;
    text << in.rdbuf();

    OpenDocument doc{current, 1, mtime};
    if (!known) {
        notify("textDocument/didOpen", {
            {"textDocument", {
                {"uri", uri},
                {"languageId", language_id_for(file)},
                {"version", doc.version},
                {"text", text.str()}
            }}
        });
    } else {
        doc.version = known->version + 1;
        notify("textDocument/didChange", {
            {"textDocument", {{"uri", uri}, {"version", doc.version}}},
            {"contentChanges", json::array({{{"text", text.str()}}})}
        });
        spdlog::debug("Resent changed document {} (version {})", uri, doc.version);
    }

    std::lock_guard<std::mutex> lock(documents_mutex_);
    open_documents_[uri] = doc;
    return known.has_value();
}

void Instance::on_notification(const json& message) {
    std::string method = message.value("method", std::string());
    json params = message.value("params", json::object());

    if (method == "textDocument/publishDiagnostics") {
        diagnostics_.publish(params);
    } else if (method == "window/logMessage" && params.is_object()) {
        int type = params.value("type", 4);
        std::string text = params.value("message", std::string());
        switch (type) {
            case 1: spdlog::error("ALS: {}", text); break;
            case 2: spdlog::warn("ALS: {}", text); break;
            case 3: spdlog::info("ALS: {}", text); break;
            default: spdlog::debug("ALS: {}", text); break;
        }
    } else if (method == "window/showMessage" && params.is_object()) {
        spdlog::info("ALS message: {}", params.value("message", std::string()));
    } else {
        spdlog::trace("Notification: {}", method);
    }

    notifications_->push(message);
}

void Instance::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == InstanceState::ShuttingDown) {
            return;
        }
        stop_supervisor_ = true;
        if (state_ != InstanceState::Dead) {
            set_state(InstanceState::ShuttingDown, "shutdown requested");
        }
    }
    events_cv_.notify_all();

    if (supervisor_.joinable()) {
        supervisor_.join();
    }

    std::shared_ptr<RpcClient> client;
    std::unique_ptr<ILspProcess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == InstanceState::Dead && !session_.client && !session_.process) {
            notifications_->close();
            return;
        }
        client = std::move(session_.client);
        process = std::move(session_.process);
    }

    // One grace period covers the shutdown request, exit and the wait for the process
    auto grace_end = Clock::now() + config_.shutdown_grace;
    auto grace_left = [grace_end] {
        return std::max(std::chrono::milliseconds(0),
                        std::chrono::duration_cast<std::chrono::milliseconds>(grace_end - Clock::now()));
    };

    if (client) {
        client->fail_all(ErrorKind::Shutdown, "instance shutting down");
        if (client->is_connected()) {
            try {
                client->call("shutdown", json(), grace_left());
                client->notify("exit", json(), grace_left());
            } catch (const LspError& e) {
                spdlog::warn("Error during graceful shutdown of {}: {}", root_.string(), e.what());
            }
        }
    }

    if (process && !process->wait_for_exit(grace_left())) {
        spdlog::warn("Language server for {} did not exit gracefully, terminating", root_.string());
        process->terminate();
        if (!process->wait_for_exit(std::chrono::milliseconds(1000))) {
            process->kill();
            if (!process->wait_for_exit(std::chrono::milliseconds(2000))) {
                spdlog::error("Language server pid {} for {} survived SIGKILL", process->pid(), root_.string());
            }
        }
    }

    teardown(std::move(client), std::move(process), ErrorKind::Shutdown);
    notifications_->close();

    std::lock_guard<std::mutex> lock(mutex_);
    dead_reason_ = "shut down";
    set_state(InstanceState::Dead, "shutdown complete");
}

InstanceState Instance::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::uint64_t Instance::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.id;
}

int Instance::consecutive_crashes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_crashes_;
}

int Instance::restart_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return restart_count_;
}

std::chrono::milliseconds Instance::current_backoff() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backoff_;
}

json Instance::server_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.capabilities;
}

Clock::time_point Instance::last_activity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

void Instance::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_activity_ = Clock::now();
}

json Instance::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - last_activity_);
    json result = {
        {"project", root_.string()},
        {"state", to_string(state_)},
        {"idle_seconds", static_cast<double>(idle.count()) / 1000.0},
        {"pending", active_calls_.load()},
        {"restarts", restart_count_},
        {"consecutive_crashes", consecutive_crashes_}
    };
    if (session_.process) {
        result["pid"] = session_.process->pid();
    }
    if (state_ == InstanceState::Dead && !dead_reason_.empty()) {
        result["reason"] = dead_reason_;
    }
    return result;
}

} // namespace ada_mcp
