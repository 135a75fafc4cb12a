#pragma once

#include <string>
#include <filesystem>

namespace regimetrader {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable (falls back to CWD)
    static std::filesystem::path getExecutableDir();

    // Resolve relative to the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    // Existing file relative to the executable, else relative to CWD
    static std::filesystem::path resolveExistingPath(const std::string& path);
};

} // namespace utils
} // namespace regimetrader
