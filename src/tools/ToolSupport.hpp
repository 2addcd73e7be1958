#pragma once

#include <nlohmann/json.hpp>
#include <exception>
#include <filesystem>
#include <string>

namespace ada_mcp {

using json = nlohmann::json;

/**
 * @brief Helpers shared by the language-server tools
 *
 * Tool arguments use 1-based lines and columns; the wire protocol uses
 * 0-based positions. Everything crossing that boundary goes through here.
 */
namespace tool_support {

/**
 * @brief Read a required string argument
 * @throws std::invalid_argument if missing or not a string
 */
std::string require_string(const json& args, const std::string& name);

/**
 * @brief Read a required 1-based position argument
 * @throws std::invalid_argument if missing, not an integer or below 1
 */
int require_position(const json& args, const std::string& name);

/**
 * @brief {"textDocument": {"uri"}, "position": {"line", "character"}} from 1-based coordinates
 */
json text_document_position(const std::filesystem::path& file, int line, int column);

/**
 * @brief Reshape a Location or LocationLink into {file, line, column, preview}
 */
json location_to_json(const json& location);

/**
 * @brief One line of a file without trailing whitespace, or "" if unavailable
 */
std::string line_preview(const std::filesystem::path& file, int line_0based);

/**
 * @brief Readable name of an LSP SymbolKind
 */
std::string symbol_kind_name(int kind);

/**
 * @brief Readable name of an LSP DiagnosticSeverity
 */
std::string severity_name(int severity);

/**
 * @brief Tool result describing a failure
 *
 * Carries "error" with the message, and "kind" when the failure came from
 * the language-server core.
 */
json error_result(const std::exception& e);

} // namespace tool_support

} // namespace ada_mcp
