#include "common/PathUtils.h"

#include <system_error>

namespace stocktrade {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    std::filesystem::path cwd_candidate = std::filesystem::current_path() / relative_path;
    std::error_code ec;
    if (std::filesystem::exists(cwd_candidate, ec)) {
        return cwd_candidate;
    }
    auto exe_candidate = getExecutableDir() / relative_path;
    if (std::filesystem::exists(exe_candidate, ec)) {
        return exe_candidate;
    }
    return cwd_candidate;
}

std::filesystem::path PathUtils::getConfigDir() {
    return resolveRelativePath("config");
}

std::filesystem::path PathUtils::getLogsDir() {
    return resolveRelativePath("logs");
}

} // namespace utils
} // namespace stocktrade
