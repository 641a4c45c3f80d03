#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <vector>

namespace blast::utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {
    std::mutex init_mutex;

    std::shared_ptr<spdlog::logger> make_logger(spdlog::level::level_enum level, bool log_to_file) {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(console_sink);

        // File sink (optional)
        if (log_to_file) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                "blast-cache.log",
                1024 * 1024 * 10,  // 10MB
                3                  // 3 rotating files
            );
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("blast", sinks.begin(), sinks.end());
        logger->set_level(level);

        // Flush on error or higher
        logger->flush_on(spdlog::level::err);
        return logger;
    }
}

void Logger::init(const std::string& level, bool log_to_file) {
    auto logger = make_logger(parse_level(level), log_to_file);
    std::lock_guard<std::mutex> lock(init_mutex);
    logger_ = logger;
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard<std::mutex> lock(init_mutex);
    if (!logger_) {
        logger_ = make_logger(spdlog::level::info, false);
    }
    return logger_;
}

spdlog::level::level_enum Logger::parse_level(const std::string& level) {
    if (level == "trace") {
        return spdlog::level::trace;
    } else if (level == "debug") {
        return spdlog::level::debug;
    } else if (level == "info") {
        return spdlog::level::info;
    } else if (level == "warn") {
        return spdlog::level::warn;
    } else if (level == "error") {
        return spdlog::level::err;
    } else if (level == "critical") {
        return spdlog::level::critical;
    } else if (level == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace blast::utils
