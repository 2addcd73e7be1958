#include "tools/HoverTool.hpp"
#include "tools/ToolSupport.hpp"
#include "lsp/Errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ada_mcp {

namespace ts = tool_support;

HoverTool::HoverTool(std::shared_ptr<Broker> broker)
    : broker_(std::move(broker)) {
}

ToolInfo HoverTool::get_info() {
    ToolInfo info;
    info.name = "ada_hover";
    info.description = "Get type information and documentation for the Ada symbol at a file position";

    info.input_schema = {
        {"type", "object"},
        {"properties", {
            {"file", {{"type", "string"}, {"description", "Path to the Ada source file"}}},
            {"line", {{"type", "integer"}, {"minimum", 1}, {"description", "1-based line number"}}},
            {"column", {{"type", "integer"}, {"minimum", 1}, {"description", "1-based column number"}}}
        }},
        {"required", json::array({"file", "line", "column"})}
    };

    return info;
}

std::string HoverTool::contents_to_text(const json& contents) {
    if (contents.is_string()) {
        return contents.get<std::string>();
    }
    if (contents.is_object()) {
        return contents.contains("value") && contents["value"].is_string() ? contents["value"].get<std::string>()
                                                                      : contents.dump();
    }
    if (contents.is_array()) {
        std::string text;
        for (const auto& part : contents) {
            if (!text.empty()) {
                text += "\n";
            }
            text += contents_to_text(part);
        }
        return text;
    }
    return "";
}

json HoverTool::execute(const json& args) {
    try {
        std::string file = ts::require_string(args, "file");
        int line = ts::require_position(args, "line");
        int column = ts::require_position(args, "column");

        auto root = broker_->open_document(file);
        json result = broker_->submit(root, "textDocument/hover",
                                      ts::text_document_position(file, line, column),
                                      RequestOptions{std::nullopt, true, std::nullopt});

        if (!result.is_object() || !result.contains("contents")) {
            return {{"found", false}};
        }

        return {
            {"found", true},
            {"contents", contents_to_text(result["contents"])}
        };

    } catch (const LspError& e) {
        spdlog::error("ada_hover failed: {}", e.what());
        return ts::error_result(e);
    } catch (const std::invalid_argument& e) {
        return ts::error_result(e);
    }
}

} // namespace ada_mcp
