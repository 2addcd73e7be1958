#include "ProjectLocator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <regex>
#include <vector>

namespace ada_mcp {

bool ProjectLocator::matches_pattern(const std::filesystem::path& path, const std::string& pattern) {
    // Convert glob pattern to regex
    // Example: "*.gpr" -> ".*\.gpr"
    std::string escaped;
    for (char c : pattern) {
        if (c == '*') {
            escaped += ".*";
        } else if (c == '.') {
            escaped += "\\.";
        } else if (c == '?') {
            escaped += ".";
        } else {
            escaped += c;
        }
    }

    std::regex re("^" + escaped + "$", std::regex::icase);
    return std::regex_match(path.filename().string(), re);
}

bool ProjectLocator::has_project_marker(const std::filesystem::path& dir) {
    std::error_code ec;
    if (std::filesystem::exists(dir / "alire.toml", ec)) {
        return true;
    }

    try {
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && matches_pattern(entry.path(), "*.gpr")) {
                return true;
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::debug("Cannot scan {}: {}", dir.string(), e.what());
    }
    return false;
}

std::filesystem::path ProjectLocator::find_project_root(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    absolute = absolute.lexically_normal();

    std::filesystem::path start = std::filesystem::is_directory(absolute, ec)
        ? absolute
        : absolute.parent_path();

    for (auto dir = start; !dir.empty(); dir = dir.parent_path()) {
        if (std::filesystem::is_directory(dir, ec) && has_project_marker(dir)) {
            spdlog::debug("Project root for {}: {}", path.string(), dir.string());
            return dir;
        }
        if (dir == dir.root_path()) {
            break;
        }
    }

    spdlog::debug("No project marker above {}, using {}", path.string(), start.string());
    return start;
}

std::optional<std::filesystem::path> ProjectLocator::find_project_file(
    const std::filesystem::path& root,
    const std::string& preferred
) {
    std::error_code ec;
    if (!preferred.empty()) {
        auto candidate = root / preferred;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
        spdlog::warn("Configured project file {} not found", candidate.string());
    }

    std::vector<std::filesystem::path> gpr_files;
    try {
        for (const auto& entry : std::filesystem::directory_iterator(root)) {
            if (entry.is_regular_file() && matches_pattern(entry.path(), "*.gpr")) {
                gpr_files.push_back(entry.path());
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::warn("Error scanning project root {}: {}", root.string(), e.what());
        return std::nullopt;
    }

    if (gpr_files.empty()) {
        return std::nullopt;
    }

    std::sort(gpr_files.begin(), gpr_files.end());
    for (const auto& gpr : gpr_files) {
        if (!matches_pattern(gpr, "alire*")) {
            return gpr;
        }
    }
    return gpr_files.front();
}

std::string ProjectLocator::normalize_root(const std::filesystem::path& root) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        canonical = std::filesystem::absolute(root, ec).lexically_normal();
    }
    std::string normalized = canonical.string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

} // namespace ada_mcp
