#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>

namespace ada_mcp {

using json = nlohmann::json;

/**
 * @brief Build the parameters of the LSP "initialize" request
 *
 * Declares the client capabilities the broker relies on. With a project file
 * the server is pointed at it; without one indexing is disabled so the server
 * does not crawl an arbitrary workspace.
 *
 * @param root Project root directory
 * @param project_file GPR project file, if one was found
 * @param process_id Process id reported to the server
 */
json build_initialize_params(const std::filesystem::path& root,
                             const std::optional<std::filesystem::path>& project_file,
                             int process_id);

/**
 * @brief Language id for textDocument/didOpen based on the file extension
 */
const char* language_id_for(const std::filesystem::path& file);

} // namespace ada_mcp
