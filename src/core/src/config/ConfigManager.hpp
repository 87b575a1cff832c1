/**
 * @file ConfigManager.hpp
 * @brief Configuration manager - loads front-end settings and application descriptions
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "SystemConfig.hpp"
#include "parser/AST.hpp"

namespace rtos_config {
namespace config {

/**
 * Configuration Manager (Singleton)
 *
 * Holds the front-end settings (system_config.yaml) and the last
 * application description parsed with them. Every public method locks,
 * so it may be shared by several front-end threads.
 */
class ConfigManager {
public:
    /**
     * Get singleton instance
     */
    static ConfigManager& instance();

    // Delete copy/move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * Load front-end configuration from YAML file
     * @param filepath Path to system_config.yaml
     * @return true if loaded successfully
     */
    bool loadSystemConfig(const std::string& filepath);

    /**
     * Read and parse an application description file
     * @param filepath Path to the description (one brace-delimited block)
     * @return true if the file was parsed into an App
     */
    bool loadApplication(const std::string& filepath);

    /**
     * Parse an application description held in memory
     * @param source Raw description text
     * @param origin Name used in log messages
     * @return true if the text was parsed into an App
     */
    bool parseApplication(const std::string& source, const std::string& origin = "<memory>");

    /**
     * Forget the current application and its errors
     */
    void clearApplication();

    /**
     * Get front-end configuration (copy, taken under the lock)
     */
    SystemConfig systemConfig() const;

    /**
     * Last successfully parsed application, if any
     */
    std::optional<parser::App> application() const;

    /**
     * Error chain of the last failed load, outermost note first
     */
    std::vector<std::string> lastErrors() const;

    /**
     * Get configuration as JSON (for the code generator)
     */
    std::string applicationToJson() const;
    std::string systemConfigToJson() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;

    void applyLoggingConfig() const;

    SystemConfig m_system_config;
    std::optional<parser::App> m_application;
    std::vector<std::string> m_errors;
    mutable std::mutex m_mutex;
};

} // namespace config
} // namespace rtos_config
