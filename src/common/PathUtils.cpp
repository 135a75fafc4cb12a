#include "common/PathUtils.h"

#include <system_error>

namespace regimetrader {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    return getExecutableDir() / relative_path;
}

std::filesystem::path PathUtils::resolveExistingPath(const std::string& path) {
    const std::filesystem::path p(path);
    if (p.is_absolute()) {
        return p;
    }

    std::error_code ec;
    const auto beside_exe = resolveRelativePath(path);
    if (std::filesystem::exists(beside_exe, ec)) {
        return beside_exe;
    }
    return std::filesystem::current_path() / p;
}

} // namespace utils
} // namespace regimetrader
