/**
 * @file ConfigManager.cpp
 * @brief Implementation of the ConfigManager class
 */

#include "../config/ConfigManager.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace SpreadArb {

ConfigManager::ConfigManager(const std::string& configFilePath, std::shared_ptr<Logger> logger)
    : m_configFilePath(configFilePath), m_config(json::object()), m_logger(logger) {
    m_logger->info("ConfigManager initialized with config file: {}", configFilePath);
}

bool ConfigManager::loadConfig() {
    try {
        std::ifstream configFile(m_configFilePath);
        if (!configFile.is_open()) {
            m_logger->error("Failed to open configuration file: {}", m_configFilePath);
            return false;
        }

        configFile >> m_config;

        m_logger->info("Configuration loaded successfully from {}", m_configFilePath);
        return true;
    } catch (const std::exception& e) {
        m_logger->error("Exception while loading configuration: {}", e.what());
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& content) {
    try {
        m_config = json::parse(content);
        return true;
    } catch (const std::exception& e) {
        m_logger->error("Exception while parsing configuration: {}", e.what());
        return false;
    }
}

std::string ConfigManager::getStringValue(const std::string& key, const std::string& defaultValue) const {
    try {
        auto path = toPointer(key);
        if (m_config.contains(path)) {
            return m_config.at(path).get<std::string>();
        }
    } catch (const std::exception& e) {
        m_logger->warn("Exception while getting string value for key {}: {}", key, e.what());
    }
    return defaultValue;
}

int ConfigManager::getIntValue(const std::string& key, int defaultValue) const {
    try {
        auto path = toPointer(key);
        if (m_config.contains(path)) {
            return m_config.at(path).get<int>();
        }
    } catch (const std::exception& e) {
        m_logger->warn("Exception while getting int value for key {}: {}", key, e.what());
    }
    return defaultValue;
}

double ConfigManager::getDoubleValue(const std::string& key, double defaultValue) const {
    try {
        auto path = toPointer(key);
        if (m_config.contains(path)) {
            return m_config.at(path).get<double>();
        }
    } catch (const std::exception& e) {
        m_logger->warn("Exception while getting double value for key {}: {}", key, e.what());
    }
    return defaultValue;
}

bool ConfigManager::getBoolValue(const std::string& key, bool defaultValue) const {
    try {
        auto path = toPointer(key);
        if (m_config.contains(path)) {
            return m_config.at(path).get<bool>();
        }
    } catch (const std::exception& e) {
        m_logger->warn("Exception while getting bool value for key {}: {}", key, e.what());
    }
    return defaultValue;
}

std::vector<std::string> ConfigManager::getStringArray(const std::string& key) const {
    std::vector<std::string> result;
    try {
        auto path = toPointer(key);
        if (m_config.contains(path) && m_config.at(path).is_array()) {
            for (const auto& item : m_config.at(path)) {
                result.push_back(item.get<std::string>());
            }
        }
    } catch (const std::exception& e) {
        m_logger->warn("Exception while getting string array for key {}: {}", key, e.what());
    }
    return result;
}

std::string ConfigManager::getEnvOrString(const std::string& envName, const std::string& key,
                                          const std::string& defaultValue) const {
    std::string value = readEnv(envName);
    if (!value.empty()) {
        return value;
    }
    return getStringValue(key, defaultValue);
}

double ConfigManager::getEnvOrDouble(const std::string& envName, const std::string& key,
                                     double defaultValue) const {
    std::string value = readEnv(envName);
    if (!value.empty()) {
        try {
            size_t consumed = 0;
            double parsed = std::stod(value, &consumed);
            if (consumed == value.size()) {
                return parsed;
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        m_logger->warn("Ignoring non-numeric value '{}' in environment variable {}", value, envName);
    }
    return getDoubleValue(key, defaultValue);
}

bool ConfigManager::getEnvOrBool(const std::string& envName, const std::string& key,
                                 bool defaultValue) const {
    std::string value = readEnv(envName);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    if (!value.empty()) {
        m_logger->warn("Ignoring unrecognised flag '{}' in environment variable {}", value, envName);
    }
    return getBoolValue(key, defaultValue);
}

json::json_pointer ConfigManager::toPointer(const std::string& key) {
    return json::json_pointer(key.empty() ? "" : "/" + key);
}

std::string ConfigManager::readEnv(const std::string& envName) {
    const char* value = std::getenv(envName.c_str());
    return value ? std::string(value) : std::string();
}

}  // namespace SpreadArb
