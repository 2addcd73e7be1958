#include "Handshake.hpp"
#include "lsp/Uri.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace ada_mcp {

json build_initialize_params(const std::filesystem::path& root,
                             const std::optional<std::filesystem::path>& project_file,
                             int process_id) {
    std::string root_uri = file_to_uri(root);
    std::string root_name = root.filename().string();
    if (root_name.empty()) {
        root_name = root.string();
    }

    json capabilities = {
        {"textDocument", {
            {"definition", {{"dynamicRegistration", true}, {"linkSupport", true}}},
            {"references", {{"dynamicRegistration", true}}},
            {"hover", {
                {"dynamicRegistration", true},
                {"contentFormat", json::array({"plaintext", "markdown"})}
            }},
            {"documentSymbol", {
                {"dynamicRegistration", true},
                {"hierarchicalDocumentSymbolSupport", true}
            }},
            {"completion", {
                {"dynamicRegistration", true},
                {"completionItem", {
                    {"snippetSupport", false},
                    {"documentationFormat", json::array({"plaintext", "markdown"})}
                }}
            }},
            {"publishDiagnostics", {{"relatedInformation", true}}},
            {"callHierarchy", {{"dynamicRegistration", true}}},
            {"rename", {{"dynamicRegistration", true}, {"prepareSupport", true}}}
        }},
        {"workspace", {
            {"workspaceFolders", true},
            {"symbol", {{"dynamicRegistration", true}}}
        }}
    };

    json init_options = json::object();
    if (project_file) {
        init_options["projectFile"] = project_file->string();
    } else {
        init_options["enableIndexing"] = false;
    }

    return {
        {"processId", process_id},
        {"capabilities", capabilities},
        {"rootUri", root_uri},
        {"rootPath", root.string()},
        {"workspaceFolders", json::array({{{"uri", root_uri}, {"name", root_name}}})},
        {"initializationOptions", init_options}
    };
}

const char* language_id_for(const std::filesystem::path& file) {
    std::string ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".gpr") {
        return "gpr";
    }
    return "ada";
}

} // namespace ada_mcp
