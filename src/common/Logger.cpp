#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace banditlab {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, bool console) {
    if (initialized_) return;

    std::filesystem::path logs_path;
    if (std::filesystem::path(log_dir).is_absolute()) {
        logs_path = log_dir;
    } else {
        logs_path = utils::PathUtils::getExecutableDir() / log_dir;
    }

    try {
        std::filesystem::create_directories(logs_path);

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logs_path.string() + "/banditlab.log", 1024 * 1024 * 10, 3
        );
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        std::vector<spdlog::sink_ptr> sinks{file_sink};
        if (console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::info);
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        results_logger_ = spdlog::rotating_logger_mt(
            "results", logs_path.string() + "/results.log", 1024 * 1024 * 10, 3
        );
        results_logger_->set_pattern("%v");

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::setLevel(const std::string& level) {
    if (!main_logger_) {
        return;
    }
    main_logger_->set_level(spdlog::level::from_str(level));
}

void Logger::logTrial(const std::string& policy, int trial, double total_reward, double final_regret) {
    if (results_logger_) {
        std::ostringstream oss;
        oss << policy << "," << trial << ","
            << std::fixed << std::setprecision(0) << total_reward << ","
            << std::fixed << std::setprecision(6) << final_regret;
        results_logger_->info(oss.str());
    }
}

} // namespace banditlab
