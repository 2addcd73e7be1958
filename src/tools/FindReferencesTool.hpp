#pragma once

#include "lsp/Broker.hpp"
#include "mcp/MCPServer.hpp"
#include <memory>

namespace ada_mcp {

/**
 * @brief MCP tool listing every reference to the symbol at a file position
 *
 * Useful for:
 * - Impact analysis before changing a subprogram profile
 * - Finding callers of a procedure across the project
 */
class FindReferencesTool {
public:
    explicit FindReferencesTool(std::shared_ptr<Broker> broker);

    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with file, line, column and include_declaration
     * @return {"references": [...], "count": N} or error
     */
    json execute(const json& args);

private:
    std::shared_ptr<Broker> broker_;
};

} // namespace ada_mcp
