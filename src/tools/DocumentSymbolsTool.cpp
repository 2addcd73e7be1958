#include "tools/DocumentSymbolsTool.hpp"
#include "tools/ToolSupport.hpp"
#include "lsp/Errors.hpp"
#include "lsp/Uri.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ada_mcp {

namespace ts = tool_support;

DocumentSymbolsTool::DocumentSymbolsTool(std::shared_ptr<Broker> broker)
    : broker_(std::move(broker)) {
}

ToolInfo DocumentSymbolsTool::get_info() {
    ToolInfo info;
    info.name = "ada_document_symbols";
    info.description = "List packages, subprograms, types and objects declared in an Ada file";

    info.input_schema = {
        {"type", "object"},
        {"properties", {
            {"file", {
                {"type", "string"},
                {"description", "Path to the Ada source file"}
            }}
        }},
        {"required", json::array({"file"})}
    };

    return info;
}

json DocumentSymbolsTool::convert_document_symbol(const json& item) {
    json range = item.value("range", json::object());
    json selection = item.value("selectionRange", range);
    json start = selection.value("start", json::object());

    json symbol = {
        {"name", item.value("name", std::string())},
        {"kind", ts::symbol_kind_name(item.value("kind", 0))},
        {"line", start.value("line", 0) + 1},
        {"column", start.value("character", 0) + 1},
        {"range", {
            {"start", range.value("start", json::object()).value("line", 0) + 1},
            {"end", range.value("end", json::object()).value("line", 0) + 1}
        }}
    };

    if (item.contains("detail") && item["detail"].is_string()) {
        symbol["detail"] = item["detail"];
    }

    if (item.contains("children") && item["children"].is_array() && !item["children"].empty()) {
        json children = json::array();
        for (const auto& child : item["children"]) {
            children.push_back(convert_document_symbol(child));
        }
        symbol["children"] = children;
    }

    return symbol;
}

json DocumentSymbolsTool::convert_symbol_information(const json& item) {
    json location = item.value("location", json::object());
    json start = location.value("range", json::object()).value("start", json::object());
    std::string uri = location.value("uri", std::string());

    return {
        {"name", item.value("name", std::string())},
        {"kind", ts::symbol_kind_name(item.value("kind", 0))},
        {"file", uri.empty() ? std::string() : uri_to_file(uri).string()},
        {"line", start.value("line", 0) + 1},
        {"column", start.value("character", 0) + 1},
        {"containerName", item.value("containerName", std::string())}
    };
}

json DocumentSymbolsTool::execute(const json& args) {
    try {
        std::string file = ts::require_string(args, "file");

        auto root = broker_->open_document(file);
        json result = broker_->submit(root, "textDocument/documentSymbol",
                                      {{"textDocument", {{"uri", file_to_uri(file)}}}},
                                      RequestOptions{std::nullopt, true, std::nullopt});

        json symbols = json::array();
        if (result.is_array()) {
            for (const auto& item : result) {
                symbols.push_back(item.contains("location") ? convert_symbol_information(item)
                                                            : convert_document_symbol(item));
            }
        }

        return {{"symbols", symbols}};

    } catch (const LspError& e) {
        spdlog::error("ada_document_symbols failed: {}", e.what());
        return ts::error_result(e);
    } catch (const std::invalid_argument& e) {
        return ts::error_result(e);
    }
}

} // namespace ada_mcp
