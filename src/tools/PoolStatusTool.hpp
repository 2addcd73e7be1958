#pragma once

#include "lsp/Broker.hpp"
#include "mcp/MCPServer.hpp"
#include <memory>

namespace ada_mcp {

/**
 * @brief MCP tool reporting live language-server instances and cache statistics
 */
class PoolStatusTool {
public:
    explicit PoolStatusTool(std::shared_ptr<Broker> broker);

    static ToolInfo get_info();
    json execute(const json& args);

private:
    std::shared_ptr<Broker> broker_;
};

} // namespace ada_mcp
