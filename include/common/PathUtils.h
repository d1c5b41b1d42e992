#pragma once

#include <string>
#include <filesystem>

namespace gridpilot {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable
    static std::filesystem::path getExecutableDir();

    // Resolve a path relative to the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    static std::filesystem::path getConfigDir();

    static std::filesystem::path getLogsDir();
};

} // namespace utils
} // namespace gridpilot
