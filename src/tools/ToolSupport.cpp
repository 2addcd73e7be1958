#include "tools/ToolSupport.hpp"
#include "lsp/Errors.hpp"
#include "lsp/Uri.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace ada_mcp {
namespace tool_support {

std::string require_string(const json& args, const std::string& name) {
    if (!args.contains(name) || !args[name].is_string() || args[name].get<std::string>().empty()) {
        throw std::invalid_argument("Missing required parameter: " + name);
    }
    return args[name].get<std::string>();
}

int require_position(const json& args, const std::string& name) {
    if (!args.contains(name) || !args[name].is_number_integer()) {
        throw std::invalid_argument("Missing required parameter: " + name);
    }
    int value = args[name].get<int>();
    if (value < 1) {
        throw std::invalid_argument("Parameter " + name + " is 1-based and must be at least 1");
    }
    return value;
}

json text_document_position(const std::filesystem::path& file, int line, int column) {
    return {
        {"textDocument", {{"uri", file_to_uri(file)}}},
        {"position", {{"line", line - 1}, {"character", column - 1}}}
    };
}

json location_to_json(const json& location) {
    std::string uri;
    json range;

    // LocationLink carries targetUri, Location carries uri
    if (location.contains("targetUri")) {
        uri = location.value("targetUri", std::string());
        range = location.contains("targetSelectionRange") ? location["targetSelectionRange"]
                                                          : location.value("targetRange", json::object());
    } else {
        uri = location.value("uri", std::string());
        range = location.value("range", json::object());
    }

    json start = range.value("start", json::object());
    int line = start.value("line", 0);
    int character = start.value("character", 0);

    std::string file;
    if (!uri.empty()) {
        file = uri_to_file(uri).string();
    }

    return {
        {"file", file},
        {"line", line + 1},
        {"column", character + 1},
        {"preview", file.empty() ? std::string() : line_preview(file, line)}
    };
}

std::string line_preview(const std::filesystem::path& file, int line_0based) {
    if (line_0based < 0) {
        return "";
    }
    std::ifstream in(file);
    if (!in) {
        return "";
    }

    std::string line;
    for (int i = 0; i <= line_0based; ++i) {
        if (!std::getline(in, line)) {
            return "";
        }
    }
    auto end = line.find_last_not_of(" \t\r");
    return end == std::string::npos ? "" : line.substr(0, end + 1);
}

std::string symbol_kind_name(int kind) {
    static const char* const names[] = {
        "file", "module", "namespace", "package", "class", "method", "property",
        "field", "constructor", "enum", "interface", "function", "variable",
        "constant", "string", "number", "boolean", "array", "object", "key",
        "null", "enumMember", "struct", "event", "operator", "typeParameter"
    };
    if (kind >= 1 && kind <= static_cast<int>(std::size(names))) {
        return names[kind - 1];
    }
    return "unknown(" + std::to_string(kind) + ")";
}

std::string severity_name(int severity) {
    switch (severity) {
        case 1: return "error";
        case 2: return "warning";
        case 3: return "info";
        case 4: return "hint";
        default: return "unknown";
    }
}

json error_result(const std::exception& e) {
    if (const auto* lsp = dynamic_cast<const LspError*>(&e)) {
        return lsp->to_json();
    }
    return {{"error", e.what()}};
}

} // namespace tool_support
} // namespace ada_mcp
