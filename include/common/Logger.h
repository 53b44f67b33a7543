#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace signaldesk {

class Logger {
public:
    static Logger& getInstance();

    // initialize() 전에는 모든 로그 호출이 무시된다 (테스트/라이브러리 사용 시)
    // console_to_stderr: stdout 을 데이터 출력(--json)에 양보할 때
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info",
                    bool console_to_stderr = false);
    bool isInitialized() const { return initialized_; }

    static spdlog::sink_ptr createConsoleSink(bool to_stderr);

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // trades.log 한 줄: event,trade_id,symbol,direction,price,quantity,pnl
    void logTrade(const std::string& event, const std::string& trade_id,
                  const std::string& symbol, const std::string& direction,
                  double price, double quantity, double pnl);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) signaldesk::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) signaldesk::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) signaldesk::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) signaldesk::Logger::getInstance().error(__VA_ARGS__)

} // namespace signaldesk
