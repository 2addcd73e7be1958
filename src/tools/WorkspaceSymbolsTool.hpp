#pragma once

#include "lsp/Broker.hpp"
#include "mcp/MCPServer.hpp"
#include <memory>
#include <set>
#include <string>

namespace ada_mcp {

/**
 * @brief MCP tool searching symbols by name across a project
 *
 * The project is given by any path inside it; without one the forced project
 * root or the current directory is used. Results can be filtered by a coarse
 * kind ("package", "function", "type", ...) and are capped at a limit.
 */
class WorkspaceSymbolsTool {
public:
    explicit WorkspaceSymbolsTool(std::shared_ptr<Broker> broker);

    static ToolInfo get_info();

    /**
     * @param args JSON object with query, kind, limit and project
     * @return {"symbols": [...], "count": N, "truncated": bool} or error
     */
    json execute(const json& args);

private:
    /**
     * @brief SymbolKind values accepted by a kind filter; empty means all
     * @throws std::invalid_argument for an unknown filter
     */
    static std::set<int> kind_filter(const std::string& kind);

    std::shared_ptr<Broker> broker_;
};

} // namespace ada_mcp
