#pragma once

#include <string>
#include <filesystem>

namespace signaldesk {
namespace utils {

class PathUtils {
public:
    // 실행 파일의 디렉토리 경로 반환 (알 수 없으면 현재 디렉토리)
    static std::filesystem::path getExecutableDir();

    // 상대 경로 해석: 현재 디렉토리에 있으면 그 경로, 없으면 실행 파일 기준
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace signaldesk
