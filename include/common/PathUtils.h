#pragma once

#include <string>
#include <filesystem>

namespace quantsim {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable (current directory if it cannot be resolved)
    static std::filesystem::path getExecutableDir();

    // Executable-relative path to an absolute one
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    // Absolute paths as-is; relative ones against the working directory if they
    // exist there, otherwise against the executable directory
    static std::filesystem::path resolveInputPath(const std::string& path);
};

} // namespace utils
} // namespace quantsim
