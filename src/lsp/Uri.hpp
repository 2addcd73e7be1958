#pragma once

#include <filesystem>
#include <string>

namespace ada_mcp {

/**
 * @brief Convert an absolute or relative path to a file:// URI
 *
 * Characters outside the unreserved set and '/' are percent-encoded.
 */
std::string file_to_uri(const std::filesystem::path& path);

/**
 * @brief Convert a file:// URI back to a filesystem path
 * @throws std::invalid_argument if the URI does not use the file scheme
 */
std::filesystem::path uri_to_file(const std::string& uri);

} // namespace ada_mcp
