#pragma once

#include "lsp/Broker.hpp"
#include "mcp/MCPServer.hpp"
#include <memory>

namespace ada_mcp {

/**
 * @brief MCP tool returning type information and documentation for a symbol
 */
class HoverTool {
public:
    explicit HoverTool(std::shared_ptr<Broker> broker);

    static ToolInfo get_info();

    /**
     * @return {"found": bool, "contents": text} or error
     */
    json execute(const json& args);

private:
    /**
     * @brief Flatten MarkupContent, MarkedString or MarkedString[] to text
     */
    static std::string contents_to_text(const json& contents);

    std::shared_ptr<Broker> broker_;
};

} // namespace ada_mcp
