/**
 * @file config_manager.cpp
 */

#include "person/common/config_manager.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace person::common {

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

std::optional<std::string> ConfigManager::lookup(const std::string& key) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = overrides_.find(key);
        if (it != overrides_.end()) {
            return it->second;
        }
    }
    if (const char* env = std::getenv(key.c_str())) {
        return std::string(env);
    }
    return std::nullopt;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    return lookup(key).value_or(defaultValue);
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    auto value = lookup(key);
    if (!value || value->empty()) {
        return defaultValue;
    }

    std::string lowered = *value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") return true;
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") return false;

    spdlog::warn("Config '{}' is not a boolean: '{}' (using {})", key, *value, defaultValue);
    return defaultValue;
}

bool ConfigManager::has(const std::string& key) const {
    return lookup(key).has_value();
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_[key] = value;
}

void ConfigManager::unset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_.erase(key);
}

LogSettings ConfigManager::logSettings() const {
    LogSettings settings;
    settings.name = getString(LOG_NAME, settings.name);
    settings.level = getString(LOG_LEVEL, settings.level);
    settings.logToFile = getBool(LOG_TO_FILE, settings.logToFile);
    settings.logFile = getString(LOG_FILE, settings.logFile);
    return settings;
}

} // namespace person::common
