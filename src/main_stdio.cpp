#include "lsp/Broker.hpp"
#include "lsp/InstancePool.hpp"
#include "lsp/ResponseCache.hpp"
#include "lsp/Subprocess.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/DiagnosticsTool.hpp"
#include "tools/DocumentSymbolsTool.hpp"
#include "tools/FindReferencesTool.hpp"
#include "tools/GotoDefinitionTool.hpp"
#include "tools/HoverTool.hpp"
#include "tools/PoolStatusTool.hpp"
#include "tools/WorkspaceSymbolsTool.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <unistd.h>

namespace {
    std::atomic<bool> shutdown_requested{false};
    ada_mcp::MCPServer* global_server = nullptr;

    void signal_handler(int signal) {
        shutdown_requested = true;
        if (global_server) {
            global_server->stop();
        }
        // Unblock the stdin read so the main loop can observe the stop
        std::signal(signal, SIG_DFL);
        ::close(STDIN_FILENO);
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    template <typename Tool>
    void register_broker_tool(ada_mcp::MCPServer& server, std::shared_ptr<ada_mcp::Broker> broker) {
        auto tool = std::make_shared<Tool>(std::move(broker));
        server.register_tool(Tool::get_info(), [tool](const nlohmann::json& args) {
            return tool->execute(args);
        });
    }
}

int main(int argc, char** argv) {
    CLI::App app{"MCP Stdio Server - Ada Language Server broker"};

    const std::map<std::string, spdlog::level::level_enum> log_levels = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical}
    };
    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info")
        ->check(CLI::IsMember(log_levels));

    std::string als_path = "ada_language_server";
    app.add_option("--als-path", als_path, "Ada Language Server executable")
        ->envname("ALS_PATH")
        ->default_val("ada_language_server");

    std::string project_root;
    app.add_option("--project-root", project_root, "Use this project root for every request")
        ->envname("ADA_PROJECT_ROOT");

    std::string project_file;
    app.add_option("--project-file", project_file, "GPR project file name relative to the project root")
        ->envname("ADA_PROJECT_FILE");

    std::size_t max_instances = 3;
    app.add_option("--max-instances", max_instances, "Maximum number of live language servers")
        ->default_val(3)
        ->check(CLI::PositiveNumber);

    double request_timeout = 30.0;
    app.add_option("--request-timeout", request_timeout, "Default request timeout in seconds")
        ->default_val(30.0)
        ->check(CLI::PositiveNumber);

    double startup_timeout = 30.0;
    app.add_option("--startup-timeout", startup_timeout, "Initialize handshake timeout in seconds")
        ->default_val(30.0)
        ->check(CLI::PositiveNumber);

    double cache_ttl = 5.0;
    app.add_option("--cache-ttl", cache_ttl, "Response cache time-to-live in seconds")
        ->envname("ADA_MCP_CACHE_TTL")
        ->default_val(5.0)
        ->check(CLI::NonNegativeNumber);

    int max_restarts = 5;
    app.add_option("--max-restarts", max_restarts, "Restarts attempted before an instance is declared dead")
        ->default_val(5)
        ->check(CLI::NonNegativeNumber);

    double backoff_base = 1.0;
    app.add_option("--backoff-base", backoff_base, "First restart delay in seconds")
        ->default_val(1.0)
        ->check(CLI::NonNegativeNumber);

    double backoff_max = 60.0;
    app.add_option("--backoff-max", backoff_max, "Maximum restart delay in seconds")
        ->default_val(60.0)
        ->check(CLI::NonNegativeNumber);

    double idle_timeout = 300.0;
    app.add_option("--idle-timeout", idle_timeout, "Shut down instances idle this many seconds (0 disables)")
        ->default_val(300.0)
        ->check(CLI::NonNegativeNumber);

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << ada_mcp::kServerName << " version " << ada_mcp::kServerVersion << std::endl;
        return 0;
    }

    // stdout carries the MCP protocol, so logs go to stderr
    auto logger = spdlog::stderr_color_mt("ada-mcp");
    spdlog::set_default_logger(logger);

    spdlog::set_level(log_levels.at(log_level));

    auto seconds = [](double value) {
        return std::chrono::milliseconds(static_cast<long long>(value * 1000.0));
    };

    spdlog::info("Starting {} {}", ada_mcp::kServerName, ada_mcp::kServerVersion);
    spdlog::info("Log level: {}", log_level);

    try {
        setup_signal_handlers();

        ada_mcp::InstanceConfig instance_config;
        instance_config.executable = als_path;
        instance_config.project_file = project_file;
        instance_config.startup_timeout = seconds(startup_timeout);
        instance_config.request_timeout = seconds(request_timeout);
        instance_config.restart.base_delay = seconds(backoff_base);
        instance_config.restart.max_delay = seconds(backoff_max);
        instance_config.restart.max_attempts = max_restarts;

        ada_mcp::PoolConfig pool_config;
        pool_config.max_instances = max_instances;
        pool_config.idle_timeout = seconds(idle_timeout);

        ada_mcp::CacheConfig cache_config;
        cache_config.ttl = seconds(cache_ttl);

        ada_mcp::BrokerConfig broker_config;
        broker_config.request_timeout = seconds(request_timeout);
        if (!project_root.empty()) {
            broker_config.project_root = std::filesystem::absolute(project_root);
            spdlog::info("Project root forced to {}", broker_config.project_root->string());
        }

        auto launcher = std::make_shared<ada_mcp::SubprocessLauncher>();
        auto pool = std::make_shared<ada_mcp::InstancePool>(pool_config, instance_config, launcher);
        auto cache = std::make_shared<ada_mcp::ResponseCache>(cache_config);
        auto broker = std::make_shared<ada_mcp::Broker>(broker_config, pool, cache);

        auto transport = std::make_unique<ada_mcp::StdioTransport>();
        auto server = std::make_unique<ada_mcp::MCPServer>(std::move(transport));
        global_server = server.get();
        server->set_instructions(
            "Semantic navigation for Ada projects backed by the Ada Language Server. "
            "Lines and columns are 1-based. The project root is found by walking up from "
            "the file to the nearest *.gpr or alire.toml; the first call on a project "
            "starts its language server and may take a while.");

        register_broker_tool<ada_mcp::GotoDefinitionTool>(*server, broker);
        register_broker_tool<ada_mcp::FindReferencesTool>(*server, broker);
        register_broker_tool<ada_mcp::HoverTool>(*server, broker);
        register_broker_tool<ada_mcp::DocumentSymbolsTool>(*server, broker);
        register_broker_tool<ada_mcp::WorkspaceSymbolsTool>(*server, broker);
        register_broker_tool<ada_mcp::DiagnosticsTool>(*server, broker);
        register_broker_tool<ada_mcp::PoolStatusTool>(*server, broker);

        spdlog::info("All tools registered, starting server");

        // Run server (blocks until stopped or stdin closes)
        server->run();

        global_server = nullptr;
        if (shutdown_requested) {
            spdlog::info("Shutdown requested by signal");
        }
        broker->shutdown_all();
        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        global_server = nullptr;
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
