#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ada_mcp {

using json = nlohmann::json;

inline constexpr const char* kServerName = "ada-mcp";
inline constexpr const char* kServerVersion = "0.3.0";

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief Function signature for tool execution
 * @param args JSON object with tool arguments
 * @return JSON result, or an object with an "error" member
 */
using ToolHandler = std::function<json(const json& args)>;

/**
 * @brief Agent-facing MCP server implementing JSON-RPC 2.0
 *
 * Requests are routed through a method table: initialize, ping, tools/list
 * and tools/call. Notifications never produce a reply; the only one acted on
 * is notifications/initialized.
 *
 * Tool results are returned twice: as pretty-printed text content for
 * clients that only read text, and as structuredContent when the result is
 * an object. A result carrying "error" is flagged with isError.
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server with transport
     * @param transport Unique pointer to transport implementation
     * @throws std::invalid_argument if transport is null
     */
    explicit MCPServer(std::unique_ptr<ITransport> transport);

    /**
     * @brief Register a tool with handler
     * @throws std::invalid_argument on an empty name or null handler
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief Usage hints returned to the client in the initialize result
     */
    void set_instructions(std::string instructions);

    /**
     * @brief Start server main loop
     *
     * Blocks until stop() is called or the transport reaches end of input.
     */
    void run();

    /**
     * @brief Signal server to stop after the current message
     */
    void stop();

    bool is_running() const { return running_; }
    bool is_initialized() const { return initialized_; }

    /**
     * @brief Protocol version agreed during initialize (empty before)
     */
    std::string protocol_version() const;

    /**
     * @brief Protocol versions this server speaks, newest first
     */
    static const std::vector<std::string>& supported_versions();

private:
    using MethodHandler = std::function<json(const json& params)>;

    struct RegisteredTool {
        ToolInfo info;
        ToolHandler handler;
    };

    /**
     * @brief Handle one incoming JSON-RPC message
     * @return Response message, or null JSON for notifications
     */
    json handle_message(const json& message);

    void handle_notification(const std::string& method, const json& params);

    json handle_initialize(const json& params);
    json handle_tools_list(const json& params);
    json handle_tools_call(const json& params);

    static json make_result(const json& id, json result);
    static json make_error(const json& id, int code, const std::string& message);

    std::unique_ptr<ITransport> transport_;
    std::map<std::string, MethodHandler> methods_;
    std::map<std::string, RegisteredTool> tools_;
    std::string instructions_;
    std::string protocol_version_;
    std::atomic<bool> running_{false};
    std::atomic<bool> initialized_{false};
};

} // namespace ada_mcp
