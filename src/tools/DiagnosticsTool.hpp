#pragma once

#include "lsp/Broker.hpp"
#include "mcp/MCPServer.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace ada_mcp {

/**
 * @brief MCP tool reporting compiler errors and warnings
 *
 * Diagnostics are pushed by the language server after a document is opened
 * or changed; this tool reads the latest set kept by the project's instance.
 * Passing a file opens it first, so its diagnostics get computed.
 */
class DiagnosticsTool {
public:
    explicit DiagnosticsTool(std::shared_ptr<Broker> broker);

    static ToolInfo get_info();

    /**
     * @param args JSON object with optional file, project and severity
     * @return {"diagnostics": [...], "errorCount", "warningCount", "hintCount", "totalCount"}
     */
    json execute(const json& args);

private:
    /**
     * @brief Severities accepted by a filter; empty means all
     * @throws std::invalid_argument for an unknown filter
     */
    static std::set<int> severity_filter(const std::string& severity);

    std::shared_ptr<Broker> broker_;
};

} // namespace ada_mcp
