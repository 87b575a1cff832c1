/**
 * @file ConfigManager.cpp
 * @brief Configuration manager implementation
 */

#include "ConfigManager.hpp"
#include "../logging/Logger.hpp"
#include "parser/Parser.hpp"
#include "syntax/TokenPrinter.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>
#include <sstream>

namespace rtos_config {
namespace config {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

json staticsToJson(const parser::Statics& statics) {
    json j = json::object();
    for (const auto& [name, item] : statics) {
        j[name] = {
            {"ty", syntax::toString(item.ty)},
            {"expr", syntax::toString(item.expr)}
        };
    }
    return j;
}

json identsToJson(const parser::Idents& idents) {
    json j = json::array();
    for (const auto& ident : idents) {
        j.push_back(ident);
    }
    return j;
}

} // namespace

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadSystemConfig(const std::string& filepath) {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        if (!fs::exists(filepath)) {
            LOG_ERROR("System config file not found: {}", filepath);
            return false;
        }

        LOG_INFO("Loading system config from: {}", filepath);

        YAML::Node config = YAML::LoadFile(filepath);
        YAML::Node system = config["system"];

        if (!system) {
            LOG_ERROR("Missing 'system' section in config");
            return false;
        }

        SystemConfig loaded;
        loaded.version = system["version"].as<std::string>("1.0.0");

        // Logging settings
        if (system["logging"]) {
            auto logging = system["logging"];
            loaded.logging.level = logging["level"].as<std::string>("info");
            loaded.logging.file = logging["file"].as<std::string>("logs/rtos_config.log");
            loaded.logging.max_size_mb = logging["max_size_mb"].as<int>(10);
            loaded.logging.max_files = logging["max_files"].as<int>(5);
        }

        // Parser settings
        if (system["parser"]) {
            auto limits = system["parser"];
            loaded.parser.max_nesting_depth = limits["max_nesting_depth"].as<int>(64);
        }

        if (loaded.parser.max_nesting_depth < 1) {
            LOG_ERROR("Invalid parser.max_nesting_depth: {}", loaded.parser.max_nesting_depth);
            return false;
        }

        m_system_config = loaded;
        applyLoggingConfig();

        LOG_INFO("System config loaded: version {}", m_system_config.version);
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in system config: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading system config: {}", e.what());
        return false;
    }
}

bool ConfigManager::loadApplication(const std::string& filepath) {
    std::string source;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::error_code ec;
        if (!fs::exists(filepath, ec)) {
            LOG_ERROR("Application file not found: {}", filepath);
            m_application.reset();
            m_errors = {"application file not found: " + filepath};
            return false;
        }

        std::ifstream in(filepath);
        if (!in) {
            LOG_ERROR("Cannot open application file: {}", filepath);
            m_application.reset();
            m_errors = {"cannot open application file: " + filepath};
            return false;
        }

        std::ostringstream buffer;
        buffer << in.rdbuf();
        source = buffer.str();
    }

    return parseApplication(source, filepath);
}

bool ConfigManager::parseApplication(const std::string& source, const std::string& origin) {
    std::lock_guard<std::mutex> lock(m_mutex);

    LOG_INFO("Parsing application description from: {}", origin);

    syntax::LexerOptions options;
    options.max_nesting_depth = m_system_config.parser.max_nesting_depth;

    auto appParser = parser::Parser::fromSource(source, options);
    auto app = appParser.parse();

    if (!app) {
        m_application.reset();
        m_errors = appParser.getErrors();
        for (const auto& note : m_errors) {
            LOG_ERROR("  {}", note);
        }
        return false;
    }

    m_application = std::move(app);
    m_errors.clear();

    LOG_INFO("Application loaded: {} resources, {} tasks",
             m_application->resources.size(), m_application->tasks.size());
    return true;
}

void ConfigManager::clearApplication() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_application.reset();
    m_errors.clear();
}

SystemConfig ConfigManager::systemConfig() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_system_config;
}

std::optional<parser::App> ConfigManager::application() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_application;
}

std::vector<std::string> ConfigManager::lastErrors() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errors;
}

void ConfigManager::applyLoggingConfig() const {
    const auto& logging = m_system_config.logging;
    if (!Logger::isInitialized()) {
        Logger::init(logging.file,
                     logging.level,
                     static_cast<size_t>(logging.max_size_mb) * 1024 * 1024,
                     static_cast<size_t>(logging.max_files));
    } else {
        Logger::setLevel(logging.level);
    }
}

std::string ConfigManager::applicationToJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_application) {
        return json().dump();
    }

    const parser::App& app = *m_application;

    json j;
    j["device"] = syntax::toString(app.device);
    j["init"] = {{"path", syntax::toString(app.init.path)}};
    j["idle"] = {
        {"path", syntax::toString(app.idle.path)},
        {"locals", staticsToJson(app.idle.locals)},
        {"resources", identsToJson(app.idle.resources)}
    };
    j["resources"] = staticsToJson(app.resources);

    // Absent enabled/priority stay null: defaults belong to the code generator
    j["tasks"] = json::object();
    for (const auto& [name, task] : app.tasks) {
        json t;
        t["enabled"] = task.enabled ? json(*task.enabled) : json(nullptr);
        t["priority"] = task.priority ? json(static_cast<int>(*task.priority)) : json(nullptr);
        t["resources"] = identsToJson(task.resources);
        j["tasks"][name] = t;
    }

    return j.dump();
}

std::string ConfigManager::systemConfigToJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    json j;
    j["version"] = m_system_config.version;

    j["logging"] = {
        {"level", m_system_config.logging.level},
        {"file", m_system_config.logging.file},
        {"max_size_mb", m_system_config.logging.max_size_mb},
        {"max_files", m_system_config.logging.max_files}
    };

    j["parser"] = {
        {"max_nesting_depth", m_system_config.parser.max_nesting_depth}
    };

    return j.dump();
}

} // namespace config
} // namespace rtos_config
