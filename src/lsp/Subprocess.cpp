#include "Subprocess.hpp"
#include "lsp/Errors.hpp"
#include "lsp/FdByteStream.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace ada_mcp {

std::string ExitStatus::describe() const {
    if (signal != 0) {
        return "killed by signal " + std::to_string(signal);
    }
    return "exited with code " + std::to_string(exit_code);
}

namespace {

ExitStatus decode_wait_status(int status) {
    ExitStatus result;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = -1;
    }
    return result;
}

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

} // namespace

Subprocess::Subprocess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd)
    : pid_(pid),
      stream_(std::make_shared<FdByteStream>(stdout_fd, stdin_fd)) {
    stderr_reader_ = std::thread([this, stderr_fd] { drain_stderr(stderr_fd); });
}

Subprocess::~Subprocess() {
    if (is_running()) {
        kill();
        if (!wait_for_exit(std::chrono::milliseconds(2000))) {
            spdlog::error("Process {} not reaped after SIGKILL", pid_);
        }
    }
    stream_->close();
    if (stderr_reader_.joinable()) {
        stderr_reader_.join();
    }
}

bool Subprocess::poll_exit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exit_status_) {
        return true;
    }

    int status = 0;
    pid_t rc = ::waitpid(pid_, &status, WNOHANG);
    if (rc == pid_) {
        exit_status_ = decode_wait_status(status);
        spdlog::info("Process {} {}", pid_, exit_status_->describe());
        return true;
    }
    if (rc < 0 && errno == ECHILD) {
        // Already reaped elsewhere; treat as gone
        exit_status_ = ExitStatus{-1, 0};
        return true;
    }
    return false;
}

bool Subprocess::is_running() {
    return !poll_exit();
}

std::optional<ExitStatus> Subprocess::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!poll_exit()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_status_;
}

void Subprocess::terminate() {
    if (is_running()) {
        spdlog::debug("Sending SIGTERM to process {}", pid_);
        ::kill(pid_, SIGTERM);
    }
}

void Subprocess::kill() {
    if (is_running()) {
        spdlog::warn("Sending SIGKILL to process {}", pid_);
        ::kill(pid_, SIGKILL);
    }
}

void Subprocess::drain_stderr(int fd) {
    std::string pending;
    char buffer[4096];

    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        pending.append(buffer, static_cast<std::size_t>(n));

        std::size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (!line.empty()) {
                spdlog::debug("[lsp {} stderr] {}", pid_, line);
            }
        }
    }

    if (!pending.empty()) {
        spdlog::debug("[lsp {} stderr] {}", pid_, pending);
    }
    ::close(fd);
}

SubprocessLauncher::SubprocessLauncher() {
    // Writing to a dead child must surface as EPIPE, not kill the broker
    std::signal(SIGPIPE, SIG_IGN);
}

std::unique_ptr<ILspProcess> SubprocessLauncher::launch(const ProcessSpec& spec) {
    if (spec.executable.empty()) {
        throw LspError(ErrorKind::Startup, "No executable configured");
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // reports exec failure back to the parent

    // All ends are close-on-exec; dup2 clears the flag on the child's stdio
    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        std::string reason = std::strerror(errno);
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        throw LspError(ErrorKind::Startup, "Failed to create pipes: " + reason);
    }

    std::vector<std::string> argv_storage;
    argv_storage.push_back(spec.executable);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::string workdir = spec.working_directory.string();

    pid_t pid = ::fork();
    if (pid < 0) {
        std::string reason = std::strerror(errno);
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        throw LspError(ErrorKind::Startup, "fork failed: " + reason);
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::signal(SIGPIPE, SIG_DFL);

        int err = 0;
        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            err = errno;
        } else {
            ::execvp(argv[0], argv.data());
            err = errno;
        }
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (n > 0) {
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw LspError(ErrorKind::Startup,
                       "Failed to start " + spec.executable + " in " + workdir + ": " +
                       std::strerror(child_errno));
    }

    spdlog::info("Started {} (pid {}) in {}", spec.executable, pid, workdir);
    return std::make_unique<Subprocess>(pid, in_pipe[1], out_pipe[0], err_pipe[0]);
}

} // namespace ada_mcp
