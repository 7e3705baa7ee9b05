#pragma once

#include <string>
#include <filesystem>

namespace banditlab {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable (falls back to the CWD).
    static std::filesystem::path getExecutableDir();

    // Relative paths resolve against the CWD when the target exists there,
    // otherwise against the executable directory. Absolute paths pass through.
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace banditlab
