/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>

namespace Traverse {

class JsonValue;

/**
 * @brief Thread-safe category/key settings store loaded from JSON
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/traverse.json");
 *   PhysicsWorld world(PhysicsSettings::fromSettings(settings));
 *   Mover mover(world, MoverSettings::fromSettings(settings));
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    /**
     * @brief Gets the singleton instance of SettingsManager
     * @return Reference to the SettingsManager singleton instance
     */
    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    /**
     * @brief Supported setting value types
     */
    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Merges settings from a JSON file of {"category": {"key": value}} objects
     * @param filepath Path to the JSON settings file
     * @return true if loading successful, false otherwise (settings left untouched)
     */
    bool loadFromFile(const std::string& filepath);

    // Same as loadFromFile() for an in-memory document
    bool loadFromString(const std::string& json);

    /**
     * @brief Saves current settings to a JSON file
     * @param filepath Path to save the JSON settings file
     * @return true if saving successful, false otherwise
     */
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Gets a typed setting value with optional default
     * @tparam T Type of the setting (int, float, bool, or std::string)
     * @param category Setting category (e.g., "physics", "mover")
     * @param key Setting key within the category
     * @param defaultValue Value to return if setting doesn't exist or has another type
     * @return The setting value or defaultValue if not found
     *
     * A float lookup also accepts an int value, since whole numbers in JSON
     * are stored as int.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll();

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    /**
     * @brief Thread-safe read-write lock
     * Allows multiple concurrent reads or single write
     */
    mutable std::shared_mutex m_settingsMutex;

    bool applyDocument(const JsonValue& root, const std::string& source);

    // Delete copy constructor and assignment operator
    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

// Template implementations must be in header for linking

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }

    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    const SettingValue& value = keyIt->second;
    if constexpr (std::is_same_v<T, float>) {
        if (const float* f = std::get_if<float>(&value)) {
            return *f;
        }
        if (const int* i = std::get_if<int>(&value)) {
            return static_cast<float>(*i);
        }
        return defaultValue;
    } else if constexpr (std::is_same_v<T, int> || std::is_same_v<T, bool> ||
                         std::is_same_v<T, std::string>) {
        if (const T* typed = std::get_if<T>(&value)) {
            return *typed;
        }
        return defaultValue;
    } else {
        // Unsupported type, return default
        return defaultValue;
    }
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        // Unsupported type
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings[category][key] = std::move(settingValue);
    return true;
}

} // namespace Traverse

#endif // SETTINGS_MANAGER_HPP
