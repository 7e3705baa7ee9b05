#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace banditlab {

class Logger {
public:
    static Logger& getInstance();
    // console=false keeps stdout clean (e.g. for --json output).
    void initialize(const std::string& log_dir = "logs", bool console = true);
    void setLevel(const std::string& level);

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

    // One line per finished comparison trial: policy,trial,total_reward,final_regret
    void logTrial(const std::string& policy, int trial, double total_reward, double final_regret);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> results_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) banditlab::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) banditlab::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) banditlab::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) banditlab::Logger::getInstance().error(__VA_ARGS__)

} // namespace banditlab
