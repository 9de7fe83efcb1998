#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace quantsim {

class Logger {
public:
    static Logger& getInstance();
    // console_to_stderr keeps stdout free for machine-readable output
    void initialize(const std::string& log_dir = "logs", bool console_to_stderr = false);

    // "debug" | "info" | "warn" | "error" | "off"
    void setLevel(const std::string& level);

    bool isInitialized() const { return initialized_; }

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

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) quantsim::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) quantsim::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) quantsim::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) quantsim::Logger::getInstance().error(__VA_ARGS__)

} // namespace quantsim
