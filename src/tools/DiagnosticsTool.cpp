#include "tools/DiagnosticsTool.hpp"
#include "tools/ToolSupport.hpp"
#include "lsp/Errors.hpp"
#include "lsp/Uri.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>

namespace ada_mcp {

namespace ts = tool_support;

DiagnosticsTool::DiagnosticsTool(std::shared_ptr<Broker> broker)
    : broker_(std::move(broker)) {
}

ToolInfo DiagnosticsTool::get_info() {
    ToolInfo info;
    info.name = "ada_diagnostics";
    info.description = "Get compiler errors and warnings reported by the Ada Language Server";

    info.input_schema = {
        {"type", "object"},
        {"properties", {
            {"file", {
                {"type", "string"},
                {"description", "Optional: only diagnostics of this file"}
            }},
            {"project", {
                {"type", "string"},
                {"description", "Optional: any path inside the project (default: current directory)"}
            }},
            {"severity", {
                {"type", "string"},
                {"enum", json::array({"all", "error", "warning", "info", "hint"})},
                {"default", "all"},
                {"description", "Filter by severity"}
            }}
        }}
    };

    return info;
}

std::set<int> DiagnosticsTool::severity_filter(const std::string& severity) {
    if (severity == "all") return {};
    if (severity == "error") return {1};
    if (severity == "warning") return {2};
    if (severity == "info") return {3};
    if (severity == "hint") return {3, 4};
    throw std::invalid_argument("Unknown severity filter: " + severity);
}

json DiagnosticsTool::execute(const json& args) {
    try {
        std::set<int> severities = severity_filter(args.value("severity", std::string("all")));

        std::filesystem::path root;
        std::optional<std::string> uri;
        if (args.contains("file") && args["file"].is_string()) {
            std::string file = args["file"].get<std::string>();
            root = broker_->open_document(file);
            uri = file_to_uri(file);
        } else {
            std::filesystem::path project = args.contains("project") && args["project"].is_string()
                ? std::filesystem::path(args["project"].get<std::string>())
                : std::filesystem::current_path();
            root = broker_->resolve_root(std::filesystem::absolute(project));
        }

        std::optional<int> single;
        if (severities.size() == 1) {
            single = *severities.begin();
        }
        json by_uri = broker_->diagnostics(root, uri, single);

        json diagnostics = json::array();
        int errors = 0;
        int warnings = 0;
        int hints = 0;

        for (const auto& [doc_uri, items] : by_uri.items()) {
            std::string file = uri_to_file(doc_uri).string();
            for (const auto& diag : items) {
                int severity = diag.value("severity", 1);
                if (!severities.empty() && severities.count(severity) == 0) {
                    continue;
                }

                switch (severity) {
                    case 1: ++errors; break;
                    case 2: ++warnings; break;
                    default: ++hints; break;
                }

                json range = diag.value("range", json::object());
                json start = range.value("start", json::object());
                json end = range.value("end", json::object());

                diagnostics.push_back({
                    {"file", file},
                    {"line", start.value("line", 0) + 1},
                    {"column", start.value("character", 0) + 1},
                    {"endLine", end.value("line", 0) + 1},
                    {"endColumn", end.value("character", 0) + 1},
                    {"severity", ts::severity_name(severity)},
                    {"message", diag.value("message", std::string())},
                    {"code", diag.value("code", json())},
                    {"source", diag.value("source", std::string("ada"))}
                });
            }
        }

        return {
            {"diagnostics", diagnostics},
            {"errorCount", errors},
            {"warningCount", warnings},
            {"hintCount", hints},
            {"totalCount", diagnostics.size()}
        };

    } catch (const LspError& e) {
        spdlog::error("ada_diagnostics failed: {}", e.what());
        return ts::error_result(e);
    } catch (const std::invalid_argument& e) {
        return ts::error_result(e);
    }
}

} // namespace ada_mcp
