#include "tools/GotoDefinitionTool.hpp"
#include "tools/ToolSupport.hpp"
#include "lsp/Errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ada_mcp {

namespace ts = tool_support;

GotoDefinitionTool::GotoDefinitionTool(std::shared_ptr<Broker> broker)
    : broker_(std::move(broker)) {
}

ToolInfo GotoDefinitionTool::get_info() {
    ToolInfo info;
    info.name = "ada_goto_definition";
    info.description = "Navigate to the definition of the Ada symbol at a file position";

    info.input_schema = {
        {"type", "object"},
        {"properties", {
            {"file", {
                {"type", "string"},
                {"description", "Path to the Ada source file"}
            }},
            {"line", {
                {"type", "integer"},
                {"minimum", 1},
                {"description", "1-based line number"}
            }},
            {"column", {
                {"type", "integer"},
                {"minimum", 1},
                {"description", "1-based column number"}
            }}
        }},
        {"required", json::array({"file", "line", "column"})}
    };

    return info;
}

json GotoDefinitionTool::execute(const json& args) {
    try {
        std::string file = ts::require_string(args, "file");
        int line = ts::require_position(args, "line");
        int column = ts::require_position(args, "column");

        auto root = broker_->open_document(file);
        json result = broker_->submit(root, "textDocument/definition",
                                      ts::text_document_position(file, line, column),
                                      RequestOptions{std::nullopt, true, std::nullopt});

        // Either a single location or an array of them
        json location = result.is_array() ? (result.empty() ? json() : result[0]) : result;
        if (location.is_null() || !location.is_object()) {
            return {{"found", false}};
        }

        json found = ts::location_to_json(location);
        found["found"] = true;
        return found;

    } catch (const LspError& e) {
        spdlog::error("ada_goto_definition failed: {}", e.what());
        return ts::error_result(e);
    } catch (const std::invalid_argument& e) {
        return ts::error_result(e);
    }
}

} // namespace ada_mcp
