#include "common/Logger.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

using namespace signaldesk;

int main() {
    std::cout << "[TEST] Starting Logger Test..." << std::endl;

    // 1. 콘솔 sink 대상 선택
    {
        const auto err_sink = Logger::createConsoleSink(true);
        assert(std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(err_sink) != nullptr);
        assert(std::dynamic_pointer_cast<spdlog::sinks::stdout_color_sink_mt>(err_sink) == nullptr);

        const auto out_sink = Logger::createConsoleSink(false);
        assert(std::dynamic_pointer_cast<spdlog::sinks::stdout_color_sink_mt>(out_sink) != nullptr);
        assert(std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(out_sink) == nullptr);
    }

    // 2. initialize 전 호출은 무시
    {
        assert(!Logger::getInstance().isInitialized());
        LOG_WARN("ignored before initialize {}", 1);
        Logger::getInstance().logTrade("OPEN", "t-0", "BTC/USD", "BUY", 1.0, 1.0, 0.0);
    }

    // 3. stderr 콘솔로 초기화해도 파일 로그는 그대로
    {
        const auto dir = std::filesystem::temp_directory_path() / "signaldesk_test_logger";
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);

        Logger::getInstance().initialize(dir.string(), "warn", true);
        assert(Logger::getInstance().isInitialized());

        LOG_INFO("below level");
        LOG_WARN("console on stderr {}", 42);
        spdlog::get("main")->flush();

        const auto log_file = dir / "signaldesk.log";
        assert(std::filesystem::exists(log_file));
        std::ifstream in(log_file);
        const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(content.find("console on stderr 42") != std::string::npos);
        assert(content.find("below level") == std::string::npos);

        spdlog::drop_all();
    }

    std::cout << "[TEST] Logger Test PASSED!" << std::endl;
    return 0;
}
