#include "lsp/Subprocess.hpp"
#include "lsp/Errors.hpp"
#include "lsp/FramedTransport.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <future>
#include <string>
#include <system_error>
#include <thread>

using namespace ada_mcp;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

std::string read_exactly(IByteStream& stream, std::size_t n) {
    std::string result;
    char buffer[256];
    while (result.size() < n) {
        std::size_t got = stream.read_some(buffer, std::min(sizeof(buffer), n - result.size()));
        if (got == 0) {
            break;
        }
        result.append(buffer, got);
    }
    return result;
}

bool eventually_written(const std::atomic<std::size_t>& written) {
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (written.load() < 100) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

} // namespace

TEST(SubprocessTest, EchoThroughCat) {
    SubprocessLauncher launcher;
    auto process = launcher.launch({"/bin/cat", {}, fs::temp_directory_path()});

    EXPECT_GT(process->pid(), 0);
    EXPECT_TRUE(process->is_running());

    std::string message = "hello over a pipe\n";
    process->stream()->write_all(message.data(), message.size());
    EXPECT_EQ(read_exactly(*process->stream(), message.size()), message);

    process->stream()->close();
    auto status = process->wait_for_exit(2s);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->exit_code, 0);
    EXPECT_FALSE(process->is_running());
}

TEST(SubprocessTest, FramedMessageRoundTripThroughCat) {
    SubprocessLauncher launcher;
    auto process = launcher.launch({"cat", {}, {}});
    FramedTransport transport(process->stream());

    json message = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}};
    transport.write_message(message);

    EXPECT_EQ(transport.read_message(), message);

    process->terminate();
    EXPECT_TRUE(process->wait_for_exit(2s).has_value());
}

TEST(SubprocessTest, ExitCodeReported) {
    SubprocessLauncher launcher;
    auto process = launcher.launch({"/bin/sh", {"-c", "exit 3"}, {}});

    auto status = process->wait_for_exit(2s);

    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->exit_code, 3);
    EXPECT_EQ(status->signal, 0);
    EXPECT_EQ(status->describe(), "exited with code 3");
}

TEST(SubprocessTest, WorkingDirectoryApplied) {
    fs::path dir = fs::temp_directory_path() / "subprocess_test_cwd";
    fs::create_directories(dir);
    SubprocessLauncher launcher;
    auto process = launcher.launch({"/bin/sh", {"-c", "pwd"}, dir});

    std::string output = read_exactly(*process->stream(), fs::canonical(dir).string().size() + 1);

    EXPECT_EQ(output, fs::canonical(dir).string() + "\n");
    EXPECT_TRUE(process->wait_for_exit(2s).has_value());
    fs::remove_all(dir);
}

TEST(SubprocessTest, KillReportsSignal) {
    SubprocessLauncher launcher;
    auto process = launcher.launch({"/bin/sh", {"-c", "sleep 30"}, {}});

    EXPECT_FALSE(process->wait_for_exit(50ms).has_value());
    process->kill();

    auto status = process->wait_for_exit(2s);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->signal, SIGKILL);
}

TEST(SubprocessTest, MissingExecutableIsStartupError) {
    SubprocessLauncher launcher;

    try {
        launcher.launch({"/nonexistent/ada_language_server", {}, {}});
        FAIL() << "Expected LspError";
    } catch (const LspError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Startup);
        EXPECT_NE(std::string(e.what()).find("/nonexistent/ada_language_server"), std::string::npos);
    }
}

TEST(SubprocessTest, EmptyExecutableIsStartupError) {
    SubprocessLauncher launcher;

    EXPECT_THROW(launcher.launch({"", {}, {}}), LspError);
}

TEST(SubprocessTest, MissingWorkingDirectoryIsStartupError) {
    SubprocessLauncher launcher;

    EXPECT_THROW(launcher.launch({"/bin/cat", {}, "/nonexistent/project/root"}), LspError);
}

TEST(FdByteStreamTest, WriteToReaderThatNeverReadsTimesOut) {
    SubprocessLauncher launcher;
    auto process = launcher.launch({"/bin/sleep", {"5"}, {}});
    std::string payload(1024 * 1024, 'x');

    auto started = std::chrono::steady_clock::now();
    try {
        process->stream()->write_all(payload.data(), payload.size(), started + 200ms);
        FAIL() << "Expected std::system_error";
    } catch (const std::system_error& e) {
        EXPECT_TRUE(e.code() == std::errc::timed_out) << e.what();
    }
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_GE(elapsed, 150ms);
    EXPECT_LT(elapsed, 2s);
    EXPECT_TRUE(process->is_running());

    process->kill();
    EXPECT_TRUE(process->wait_for_exit(2s).has_value());
}

TEST(FdByteStreamTest, CloseWakesBlockedWriter) {
    SubprocessLauncher launcher;
    auto process = launcher.launch({"/bin/sleep", {"5"}, {}});
    auto stream = process->stream();

    auto writer = std::async(std::launch::async, [stream] {
        std::string payload(1024 * 1024, 'x');
        try {
            stream->write_all(payload.data(), payload.size());
        } catch (const std::system_error& e) {
            return e.code();
        }
        return std::error_code();
    });
    ASSERT_EQ(writer.wait_for(200ms), std::future_status::timeout);

    stream->close();

    ASSERT_EQ(writer.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(writer.get() == std::errc::broken_pipe);
    EXPECT_FALSE(stream->is_open());

    process->kill();
    EXPECT_TRUE(process->wait_for_exit(2s).has_value());
}

TEST(FdByteStreamTest, CloseDuringWritesEndsWriterCleanly) {
    SubprocessLauncher launcher;
    auto process = launcher.launch({"/bin/sh", {"-c", "cat > /dev/null"}, {}});
    auto stream = process->stream();

    std::atomic<std::size_t> written{0};
    auto writer = std::async(std::launch::async, [stream, &written] {
        try {
            while (true) {
                stream->write_all("x", 1, std::chrono::steady_clock::now() + 1s);
                ++written;
            }
        } catch (const std::system_error& e) {
            return e.code();
        }
    });
    ASSERT_TRUE(eventually_written(written));

    stream->close();

    ASSERT_EQ(writer.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(writer.get() == std::errc::broken_pipe);

    // cat sees end of input once the write side is closed
    auto status = process->wait_for_exit(2s);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->exit_code, 0);
}
