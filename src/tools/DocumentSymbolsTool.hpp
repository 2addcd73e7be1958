#pragma once

#include "lsp/Broker.hpp"
#include "mcp/MCPServer.hpp"
#include <memory>

namespace ada_mcp {

/**
 * @brief MCP tool listing the symbols declared in one Ada file
 *
 * Accepts both hierarchical DocumentSymbol results (children are kept) and
 * flat SymbolInformation results.
 */
class DocumentSymbolsTool {
public:
    explicit DocumentSymbolsTool(std::shared_ptr<Broker> broker);

    static ToolInfo get_info();

    /**
     * @param args JSON object with file
     * @return {"symbols": [...]} or error
     */
    json execute(const json& args);

private:
    static json convert_document_symbol(const json& item);
    static json convert_symbol_information(const json& item);

    std::shared_ptr<Broker> broker_;
};

} // namespace ada_mcp
