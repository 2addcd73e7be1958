#include "tools/FindReferencesTool.hpp"
#include "tools/ToolSupport.hpp"
#include "lsp/Errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ada_mcp {

namespace ts = tool_support;

FindReferencesTool::FindReferencesTool(std::shared_ptr<Broker> broker)
    : broker_(std::move(broker)) {
}

ToolInfo FindReferencesTool::get_info() {
    ToolInfo info;
    info.name = "ada_find_references";
    info.description = "Find all references to the Ada symbol at a file position across the project";

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
            }},
            {"include_declaration", {
                {"type", "boolean"},
                {"default", true},
                {"description", "Include the declaration itself in the results"}
            }}
        }},
        {"required", json::array({"file", "line", "column"})}
    };

    return info;
}

json FindReferencesTool::execute(const json& args) {
    try {
        std::string file = ts::require_string(args, "file");
        int line = ts::require_position(args, "line");
        int column = ts::require_position(args, "column");
        bool include_declaration = args.value("include_declaration", true);

        json params = ts::text_document_position(file, line, column);
        params["context"] = {{"includeDeclaration", include_declaration}};

        auto root = broker_->open_document(file);
        json result = broker_->submit(root, "textDocument/references", params,
                                      RequestOptions{std::nullopt, true, std::nullopt});

        json references = json::array();
        if (result.is_array()) {
            for (const auto& location : result) {
                references.push_back(ts::location_to_json(location));
            }
        }

        return {
            {"references", references},
            {"count", references.size()}
        };

    } catch (const LspError& e) {
        spdlog::error("ada_find_references failed: {}", e.what());
        return ts::error_result(e);
    } catch (const std::invalid_argument& e) {
        return ts::error_result(e);
    }
}

} // namespace ada_mcp
