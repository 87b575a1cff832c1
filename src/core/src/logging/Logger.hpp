/**
 * @file Logger.hpp
 * @brief Logging framework wrapper using spdlog
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace rtos_config {

class Logger {
public:
    /**
     * Initialize the logging system
     * @param log_file Path to log file (empty: console only)
     * @param level Log level (trace, debug, info, warn, error)
     * @param max_size Maximum file size in bytes (default 10MB)
     * @param max_files Maximum number of rotated files
     */
    static void init(const std::string& log_file = "logs/rtos_config.log",
                     const std::string& level = "info",
                     size_t max_size = 10 * 1024 * 1024,
                     size_t max_files = 5);

    static bool isInitialized() { return s_initialized; }

    /**
     * Change the level of an initialized logger
     */
    static void setLevel(const std::string& level);

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static spdlog::level::level_enum parseLevel(const std::string& level);

    static std::shared_ptr<spdlog::logger> s_logger;
    static bool s_initialized;
};

} // namespace rtos_config

// Convenience macros
#define LOG_TRACE(...) ::rtos_config::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::rtos_config::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  ::rtos_config::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  ::rtos_config::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::rtos_config::Logger::get()->error(__VA_ARGS__)
