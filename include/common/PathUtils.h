#pragma once

#include <string>
#include <filesystem>

namespace stocktrade {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable (falls back to cwd)
    static std::filesystem::path getExecutableDir();

    // Relative paths are resolved against the current directory first,
    // then against the executable directory.
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    static std::filesystem::path getConfigDir();
    static std::filesystem::path getLogsDir();
};

} // namespace utils
} // namespace stocktrade
