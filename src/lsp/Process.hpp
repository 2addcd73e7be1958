#pragma once

#include "lsp/ByteStream.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ada_mcp {

/**
 * @brief What to run for one language-server session
 */
struct ProcessSpec {
    std::string executable;
    std::vector<std::string> args;
    std::filesystem::path working_directory;
};

/**
 * @brief How a process ended
 */
struct ExitStatus {
    int exit_code = 0;
    int signal = 0;  // non-zero if killed by a signal

    std::string describe() const;
};

/**
 * @brief A running external process with a duplex stdio stream
 */
class ILspProcess {
public:
    virtual ~ILspProcess() = default;

    /**
     * @brief Stream writing to the process's stdin and reading its stdout
     */
    virtual std::shared_ptr<IByteStream> stream() = 0;

    virtual bool is_running() = 0;

    /**
     * @brief Wait for the process to exit
     * @return Exit status, or nullopt if still running after timeout
     */
    virtual std::optional<ExitStatus> wait_for_exit(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Ask the process to stop (SIGTERM)
     */
    virtual void terminate() = 0;

    /**
     * @brief Force the process to stop (SIGKILL)
     */
    virtual void kill() = 0;

    virtual int pid() const = 0;
};

/**
 * @brief Factory for processes; the seam used to replace real subprocesses in tests
 */
class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    /**
     * @throws LspError Startup if the process cannot be started
     */
    virtual std::unique_ptr<ILspProcess> launch(const ProcessSpec& spec) = 0;
};

} // namespace ada_mcp
