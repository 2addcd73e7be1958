#pragma once

#include "lsp/Broker.hpp"
#include "mcp/MCPServer.hpp"
#include <memory>

namespace ada_mcp {

/**
 * @brief MCP tool jumping from a symbol usage to its definition
 *
 * Sends textDocument/definition for a 1-based file position and returns the
 * first location found, with a preview of the target line.
 */
class GotoDefinitionTool {
public:
    /**
     * @brief Construct tool with broker reference
     * @param broker Entry point to the language-server pool
     */
    explicit GotoDefinitionTool(std::shared_ptr<Broker> broker);

    /**
     * @brief Get tool metadata and JSON schema
     * @return ToolInfo with name, description, and input schema
     */
    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with file, line and column
     * @return {"found": bool, "file", "line", "column", "preview"} or error
     */
    json execute(const json& args);

private:
    std::shared_ptr<Broker> broker_;
};

} // namespace ada_mcp
