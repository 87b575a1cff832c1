/**
 * @file SystemConfig.hpp
 * @brief Front-end configuration data structures
 */

#pragma once

#include <string>

namespace rtos_config {
namespace config {

/**
 * Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/rtos_config.log";
    int max_size_mb = 10;
    int max_files = 5;
};

/**
 * Tokenizer / parser limits
 */
struct ParserConfig {
    int max_nesting_depth = 64;
};

/**
 * Complete front-end configuration
 */
struct SystemConfig {
    std::string version = "1.0.0";
    LoggingConfig logging;
    ParserConfig parser;
};

} // namespace config
} // namespace rtos_config
