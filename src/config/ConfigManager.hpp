/**
 * @file ConfigManager.hpp
 * @brief Handles all configuration parameters for the spread scanner
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <nlohmann/json.hpp>
#include "../utils/Logger.hpp"

namespace SpreadArb {

using json = nlohmann::json;

/**
 * @class ConfigManager
 * @brief JSON configuration addressed by slash-separated keys
 *
 * Keys are JSON pointers without the leading slash, e.g. "trading/fill_type".
 * The getEnvOr* family lets deployment secrets and mode switches be
 * supplied through the process environment instead of the file.
 */
class ConfigManager {
public:
    /**
     * @brief Constructor
     * @param configFilePath Path to the configuration file
     * @param logger Logger instance
     */
    ConfigManager(const std::string& configFilePath, std::shared_ptr<Logger> logger);

    /**
     * @brief Load configuration from file
     * @return true if successful, false otherwise
     */
    bool loadConfig();

    /**
     * @brief Load configuration from an in-memory JSON document
     * @param content JSON text
     * @return true if successful, false otherwise
     */
    bool loadFromString(const std::string& content);

    std::string getStringValue(const std::string& key, const std::string& defaultValue = "") const;
    int getIntValue(const std::string& key, int defaultValue = 0) const;
    double getDoubleValue(const std::string& key, double defaultValue = 0.0) const;
    bool getBoolValue(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Get a vector of strings from the configuration
     * @param key Configuration key
     * @return The configuration value, empty when absent
     */
    std::vector<std::string> getStringArray(const std::string& key) const;

    /**
     * @brief Read an environment variable first, then the configuration
     * @param envName Environment variable name
     * @param key Configuration key used when the variable is unset
     * @param defaultValue Value used when neither is present
     * @return Resolved value
     */
    std::string getEnvOrString(const std::string& envName, const std::string& key,
                               const std::string& defaultValue = "") const;

    /**
     * @brief Environment-first lookup for a double, see getEnvOrString
     *
     * A variable that does not parse as a number is logged and ignored.
     */
    double getEnvOrDouble(const std::string& envName, const std::string& key, double defaultValue) const;

    /**
     * @brief Environment-first lookup for a flag
     *
     * "1", "true", "yes" and "on" (any case) are true; "0", "false", "no"
     * and "off" are false; anything else falls through to the file.
     */
    bool getEnvOrBool(const std::string& envName, const std::string& key, bool defaultValue) const;

private:
    /**
     * @brief Convert a slash-separated key to a JSON pointer
     */
    static json::json_pointer toPointer(const std::string& key);

    /**
     * @brief Look up an environment variable
     * @return Value, or empty string when unset
     */
    static std::string readEnv(const std::string& envName);

    std::string m_configFilePath;     ///< Path to the configuration file
    json m_config;                    ///< Configuration data
    std::shared_ptr<Logger> m_logger; ///< Logger instance
};

}  // namespace SpreadArb
