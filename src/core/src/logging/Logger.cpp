/**
 * @file Logger.cpp
 * @brief Logger implementation
 */

#include "Logger.hpp"
#include <vector>
#include <filesystem>
#include <iostream>

namespace rtos_config {

std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;
bool Logger::s_initialized = false;

void Logger::init(const std::string& log_file,
                  const std::string& level,
                  size_t max_size,
                  size_t max_files) {
    if (s_initialized) {
        return;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (colored)
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);

        // File sink (rotating)
        if (!log_file.empty()) {
            std::filesystem::path log_path(log_file);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, max_size, max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(file_sink);
        }

        s_logger = std::make_shared<spdlog::logger>("rtos_config", sinks.begin(), sinks.end());
        s_logger->set_level(parseLevel(level));

        // Flush on warn or above
        s_logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(s_logger);

        s_initialized = true;

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::setLevel(const std::string& level) {
    get()->set_level(parseLevel(level));
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!s_initialized) {
        init(); // Initialize with defaults
    }
    if (!s_logger) {
        // File sink could not be created; keep logging to the console
        s_logger = spdlog::stdout_color_mt("rtos_config_console");
        s_initialized = true;
    }
    return s_logger;
}

spdlog::level::level_enum Logger::parseLevel(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace rtos_config
