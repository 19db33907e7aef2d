/**
 * @file config_manager.h
 * @brief Process-wide configuration for the validation library
 *
 * A key resolves to its in-process override (set()) if there is one,
 * otherwise to the environment variable of the same name.
 */

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace person::common {

/**
 * @brief Resolved logger settings
 */
struct LogSettings {
    std::string name = "person-validation";
    std::string level = "info";
    bool logToFile = false;
    std::string logFile;
};

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> overrides_;
    mutable std::mutex mutex_;

    ConfigManager() = default;

    std::optional<std::string> lookup(const std::string& key) const;

public:
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/1/yes/on and false/0/no/off (case-insensitive).
     * Anything else yields defaultValue and logs a warning.
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /// @brief True if the key has an override or an environment value
    bool has(const std::string& key) const;

    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove the override set via set()
     *
     * An environment variable of the same name is not affected and becomes
     * visible again.
     */
    void unset(const std::string& key);

    /**
     * @brief Logger settings from LOG_NAME, LOG_LEVEL, LOG_TO_FILE and LOG_FILE
     *
     * Missing keys keep the LogSettings defaults.
     */
    LogSettings logSettings() const;

    static constexpr const char* LOG_NAME = "LOG_NAME";
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_TO_FILE = "LOG_TO_FILE";
    static constexpr const char* LOG_FILE = "LOG_FILE";
};

} // namespace person::common
