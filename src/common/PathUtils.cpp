#include "common/PathUtils.h"

#ifdef _WIN32
#include <Windows.h>
#endif

#include <system_error>

namespace signaldesk {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
#ifdef _WIN32
    char buffer[MAX_PATH];
    const DWORD size = GetModuleFileNameA(NULL, buffer, MAX_PATH);
    if (size == 0 || size == MAX_PATH) {
        return std::filesystem::current_path();
    }
    return std::filesystem::path(std::string(buffer, size)).parent_path();
#else
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
#endif
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    const std::filesystem::path relative(relative_path);
    if (relative.is_absolute()) {
        return relative;
    }

    std::error_code ec;
    const auto from_cwd = std::filesystem::absolute(relative, ec);
    if (!ec && std::filesystem::exists(from_cwd, ec)) {
        return from_cwd;
    }
    return getExecutableDir() / relative;
}

} // namespace utils
} // namespace signaldesk
