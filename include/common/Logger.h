#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace riskbook {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    bool isInitialized() const { return initialized_; }

    // "trace" / "debug" / "info" / "warn" / "error" / "off"
    void setLevel(const std::string& level);

    // 가변 인자 템플릿 대신 직접 spdlog 사용
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

    // 청산 1건 = trades.log 1줄 (CSV)
    void logTrade(const std::string& symbol, const std::string& side,
                  double entry_price, double exit_price, double quantity,
                  const std::string& pnl, const std::string& exit_reason);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_INFO(...) riskbook::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) riskbook::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) riskbook::Logger::getInstance().error(__VA_ARGS__)

} // namespace riskbook
