#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace blast::utils {

/**
 * Logging system wrapper around spdlog
 */
class Logger {
public:
    /**
     * Initialize the logging system
     * @param level Log level (trace, debug, info, warn, error, critical, off)
     * @param log_to_file Whether to log to blast-cache.log in addition to console
     */
    static void init(const std::string& level = "info", bool log_to_file = false);

    /**
     * Get the logger instance, initializing it with defaults on first use
     */
    static std::shared_ptr<spdlog::logger> get();

    /**
     * Parse a level name, falling back to info for unknown names
     */
    static spdlog::level::level_enum parse_level(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace blast::utils

// Convenience macros
#define BLAST_LOG_TRACE(...)    blast::utils::Logger::get()->trace(__VA_ARGS__)
#define BLAST_LOG_DEBUG(...)    blast::utils::Logger::get()->debug(__VA_ARGS__)
#define BLAST_LOG_INFO(...)     blast::utils::Logger::get()->info(__VA_ARGS__)
#define BLAST_LOG_WARN(...)     blast::utils::Logger::get()->warn(__VA_ARGS__)
#define BLAST_LOG_ERROR(...)    blast::utils::Logger::get()->error(__VA_ARGS__)
#define BLAST_LOG_CRITICAL(...) blast::utils::Logger::get()->critical(__VA_ARGS__)
