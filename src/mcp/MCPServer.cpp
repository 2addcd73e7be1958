#include "MCPServer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace ada_mcp {

namespace {

// JSON-RPC 2.0 error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

} // namespace

MCPServer::MCPServer(std::unique_ptr<ITransport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }

    methods_["initialize"] = [this](const json& params) { return handle_initialize(params); };
    methods_["ping"] = [](const json&) { return json::object(); };
    methods_["tools/list"] = [this](const json& params) { return handle_tools_list(params); };
    methods_["tools/call"] = [this](const json& params) { return handle_tools_call(params); };

    spdlog::info("MCPServer initialized");
}

const std::vector<std::string>& MCPServer::supported_versions() {
    static const std::vector<std::string> versions = {"2025-06-18", "2025-03-26", "2024-11-05"};
    return versions;
}

void MCPServer::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }

    if (tools_.count(info.name)) {
        spdlog::warn("Tool {} registered twice, replacing the earlier handler", info.name);
    }
    tools_[info.name] = RegisteredTool{info, std::move(handler)};
    spdlog::info("Registered tool: {}", info.name);
}

void MCPServer::set_instructions(std::string instructions) {
    instructions_ = std::move(instructions);
}

std::string MCPServer::protocol_version() const {
    return protocol_version_;
}

void MCPServer::run() {
    running_ = true;
    spdlog::info("MCPServer starting main loop with {} tools", tools_.size());

    while (running_ && transport_->is_open()) {
        json response;
        try {
            json message = transport_->read_message();
            if (message.is_null()) {
                spdlog::info("Input closed, stopping server");
                break;
            }
            response = handle_message(message);
        } catch (const json::parse_error& e) {
            spdlog::error("Malformed message: {}", e.what());
            response = make_error(json(), kParseError, std::string("Parse error: ") + e.what());
        } catch (const std::exception& e) {
            spdlog::error("Error reading message: {}", e.what());
            if (!transport_->is_open()) {
                break;
            }
            response = make_error(json(), kInternalError, std::string("Internal error: ") + e.what());
        }

        if (!response.is_null()) {
            transport_->write_message(response);
        }
    }

    running_ = false;
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    spdlog::info("MCPServer stop requested");
    running_ = false;
}

json MCPServer::handle_message(const json& message) {
    if (!message.is_object() || message.value("jsonrpc", json()) != "2.0") {
        return make_error(message.is_object() ? message.value("id", json()) : json(),
                          kInvalidRequest, "Invalid Request: missing or invalid jsonrpc field");
    }

    bool is_notification = !message.contains("id");
    json id = message.value("id", json());

    if (!message.contains("method") || !message["method"].is_string()) {
        // Responses to requests we never send end up here as well
        if (is_notification) {
            spdlog::debug("Ignoring message without method");
            return json();
        }
        return make_error(id, kInvalidRequest, "Invalid Request: missing method field");
    }

    std::string method = message["method"];
    json params = message.value("params", json::object());

    if (is_notification) {
        handle_notification(method, params);
        return json();
    }

    spdlog::debug("Handling request: method={}, id={}", method, id.dump());

    auto it = methods_.find(method);
    if (it == methods_.end()) {
        return make_error(id, kMethodNotFound, "Method not found: " + method);
    }

    try {
        return make_result(id, it->second(params));
    } catch (const std::invalid_argument& e) {
        spdlog::warn("Invalid params for {}: {}", method, e.what());
        return make_error(id, kInvalidParams, std::string("Invalid params: ") + e.what());
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", method, e.what());
        return make_error(id, kInternalError, std::string("Internal error: ") + e.what());
    }
}

void MCPServer::handle_notification(const std::string& method, const json& /*params*/) {
    if (method == "notifications/initialized") {
        initialized_ = true;
        spdlog::info("Client sent initialized notification, server is ready");
        return;
    }
    spdlog::debug("Ignoring notification: {}", method);
}

json MCPServer::handle_initialize(const json& params) {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        spdlog::info("Client: {} version {}",
                     params["clientInfo"].value("name", "unknown"),
                     params["clientInfo"].value("version", "unknown"));
    }

    // Answer with the client's version when we speak it, otherwise our newest
    const auto& versions = supported_versions();
    std::string requested = params.value("protocolVersion", std::string());
    protocol_version_ = std::find(versions.begin(), versions.end(), requested) != versions.end()
        ? requested
        : versions.front();
    if (!requested.empty() && requested != protocol_version_) {
        spdlog::warn("Client asked for protocol {}, offering {}", requested, protocol_version_);
    }

    json result = {
        {"protocolVersion", protocol_version_},
        {"capabilities", {
            {"tools", {{"listChanged", false}}}
        }},
        {"serverInfo", {
            {"name", kServerName},
            {"version", kServerVersion}
        }}
    };
    if (!instructions_.empty()) {
        result["instructions"] = instructions_;
    }
    return result;
}

json MCPServer::handle_tools_list(const json& /*params*/) {
    json tools = json::array();
    for (const auto& [name, tool] : tools_) {
        tools.push_back({
            {"name", name},
            {"description", tool.info.description},
            {"inputSchema", tool.info.input_schema}
        });
    }

    spdlog::debug("Returning {} tools", tools.size());
    return {{"tools", tools}};
}

json MCPServer::handle_tools_call(const json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        throw std::invalid_argument("Missing required parameter: name");
    }

    std::string tool_name = params["name"];
    auto it = tools_.find(tool_name);
    if (it == tools_.end()) {
        throw std::invalid_argument("Unknown tool: " + tool_name);
    }

    json arguments = params.value("arguments", json::object());
    if (!arguments.is_object()) {
        throw std::invalid_argument("Tool arguments must be an object");
    }

    spdlog::debug("Calling tool: {} with args: {}", tool_name, arguments.dump());
    auto started = std::chrono::steady_clock::now();

    json result = it->second.handler(arguments);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    bool is_error = result.is_object() && result.contains("error");
    if (is_error) {
        spdlog::warn("Tool {} failed after {} ms: {}", tool_name, elapsed.count(), result["error"].dump());
    } else {
        spdlog::debug("Tool {} finished in {} ms", tool_name, elapsed.count());
    }

    json reply = {
        {"content", json::array({
            {{"type", "text"}, {"text", result.dump(2)}}
        })},
        {"isError", is_error}
    };
    if (result.is_object()) {
        reply["structuredContent"] = result;
    }
    return reply;
}

json MCPServer::make_result(const json& id, json result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", std::move(result)}
    };
}

json MCPServer::make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

} // namespace ada_mcp
