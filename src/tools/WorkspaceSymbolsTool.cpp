#include "tools/WorkspaceSymbolsTool.hpp"
#include "tools/ToolSupport.hpp"
#include "lsp/Errors.hpp"
#include "lsp/Uri.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace ada_mcp {

namespace ts = tool_support;

WorkspaceSymbolsTool::WorkspaceSymbolsTool(std::shared_ptr<Broker> broker)
    : broker_(std::move(broker)) {
}

ToolInfo WorkspaceSymbolsTool::get_info() {
    ToolInfo info;
    info.name = "ada_workspace_symbols";
    info.description = "Search Ada symbols by name across a project";

    info.input_schema = {
        {"type", "object"},
        {"properties", {
            {"query", {
                {"type", "string"},
                {"description", "Symbol name or prefix to search for"}
            }},
            {"kind", {
                {"type", "string"},
                {"enum", json::array({"all", "package", "procedure", "function", "type", "variable", "constant"})},
                {"default", "all"},
                {"description", "Filter by symbol kind"}
            }},
            {"limit", {
                {"type", "integer"},
                {"minimum", 1},
                {"default", 50},
                {"description", "Maximum number of results"}
            }},
            {"project", {
                {"type", "string"},
                {"description", "Optional: any path inside the project (default: current directory)"}
            }}
        }},
        {"required", json::array({"query"})}
    };

    return info;
}

std::set<int> WorkspaceSymbolsTool::kind_filter(const std::string& kind) {
    std::string lower = kind;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // SymbolKind: 2 module, 3 namespace, 4 package, 5 class, 6 method, 8 field,
    // 10 enum, 11 interface, 12 function, 13 variable, 14 constant, 23 struct
    if (lower == "all") return {};
    if (lower == "package") return {2, 3, 4};
    if (lower == "procedure" || lower == "function") return {6, 12};
    if (lower == "type") return {5, 10, 11, 23};
    if (lower == "variable") return {8, 13, 14};
    if (lower == "constant") return {14};
    throw std::invalid_argument("Unknown symbol kind filter: " + kind);
}

json WorkspaceSymbolsTool::execute(const json& args) {
    try {
        if (!args.contains("query") || !args["query"].is_string()) {
            throw std::invalid_argument("Missing required parameter: query");
        }
        std::string query = args["query"].get<std::string>();
        std::set<int> kinds = kind_filter(args.value("kind", std::string("all")));
        int limit = args.value("limit", 50);
        if (limit < 1) {
            throw std::invalid_argument("Parameter limit must be at least 1");
        }

        std::filesystem::path project = args.contains("project") && args["project"].is_string()
            ? std::filesystem::path(args["project"].get<std::string>())
            : std::filesystem::current_path();
        auto root = broker_->resolve_root(std::filesystem::absolute(project));

        json result = broker_->submit(root, "workspace/symbol", {{"query", query}},
                                      RequestOptions{std::nullopt, true, std::nullopt});

        json symbols = json::array();
        std::size_t matched = 0;
        if (result.is_array()) {
            for (const auto& item : result) {
                int kind = item.value("kind", 0);
                if (!kinds.empty() && kinds.count(kind) == 0) {
                    continue;
                }
                ++matched;
                if (symbols.size() >= static_cast<std::size_t>(limit)) {
                    continue;
                }

                json location = item.value("location", json::object());
                json start = location.value("range", json::object()).value("start", json::object());
                std::string uri = location.value("uri", std::string());

                symbols.push_back({
                    {"name", item.value("name", std::string())},
                    {"kind", ts::symbol_kind_name(kind)},
                    {"file", uri.empty() ? std::string() : uri_to_file(uri).string()},
                    {"line", start.value("line", 0) + 1},
                    {"column", start.value("character", 0) + 1},
                    {"containerName", item.value("containerName", std::string())}
                });
            }
        }

        return {
            {"symbols", symbols},
            {"count", symbols.size()},
            {"truncated", matched > symbols.size()}
        };

    } catch (const LspError& e) {
        spdlog::error("ada_workspace_symbols failed: {}", e.what());
        return ts::error_result(e);
    } catch (const std::invalid_argument& e) {
        return ts::error_result(e);
    }
}

} // namespace ada_mcp
