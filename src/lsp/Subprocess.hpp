#pragma once

#include "lsp/Process.hpp"
#include <mutex>
#include <sys/types.h>
#include <thread>

namespace ada_mcp {

/**
 * @brief POSIX child process with piped stdin/stdout/stderr
 *
 * stderr is drained on a background thread and forwarded to the debug log so
 * a chatty server can never block on a full pipe. The destructor kills and
 * reaps the child if it is still running.
 */
class Subprocess : public ILspProcess {
public:
    Subprocess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);
    ~Subprocess() override;

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    std::shared_ptr<IByteStream> stream() override { return stream_; }
    bool is_running() override;
    std::optional<ExitStatus> wait_for_exit(std::chrono::milliseconds timeout) override;
    void terminate() override;
    void kill() override;
    int pid() const override { return static_cast<int>(pid_); }

private:
    /**
     * @brief Reap the child without blocking
     * @return true if it has exited
     */
    bool poll_exit();
    void drain_stderr(int fd);

    pid_t pid_;
    std::shared_ptr<IByteStream> stream_;
    std::thread stderr_reader_;

    std::mutex mutex_;
    std::optional<ExitStatus> exit_status_;
};

/**
 * @brief Launches real subprocesses with fork/exec
 */
class SubprocessLauncher : public IProcessLauncher {
public:
    SubprocessLauncher();

    std::unique_ptr<ILspProcess> launch(const ProcessSpec& spec) override;
};

} // namespace ada_mcp
