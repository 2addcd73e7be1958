#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ada_mcp {

/**
 * @brief Maps source files to Ada project roots and project files
 *
 * A project root is the nearest ancestor directory holding a GPR project
 * file ("*.gpr") or an Alire manifest ("alire.toml").
 */
class ProjectLocator {
public:
    /**
     * @brief Find the project root for a file or directory
     *
     * @param path Source file or directory (need not exist)
     * @return Nearest ancestor with a project marker, else the path's own directory
     */
    static std::filesystem::path find_project_root(const std::filesystem::path& path);

    /**
     * @brief Find the GPR project file inside a root
     *
     * Prefers a hand-written project over the "alire*" wrapper Alire generates.
     *
     * @param root Project root directory
     * @param preferred Explicit project file name relative to root, used if it exists
     * @return Path to the project file, or nullopt if none is found
     */
    static std::optional<std::filesystem::path> find_project_file(
        const std::filesystem::path& root,
        const std::string& preferred = ""
    );

    /**
     * @brief Normalize a root path so one project maps to one pool key
     */
    static std::string normalize_root(const std::filesystem::path& root);

private:
    /**
     * @brief Check if directory contains a project marker
     */
    static bool has_project_marker(const std::filesystem::path& dir);

    /**
     * @brief Check if filename matches glob pattern
     *
     * Supports simple wildcards: *.gpr, alire*, etc.
     */
    static bool matches_pattern(const std::filesystem::path& path, const std::string& pattern);
};

} // namespace ada_mcp
