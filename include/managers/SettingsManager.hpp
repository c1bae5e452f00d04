/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <cmath>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace PetDock {

/**
 * @brief Category/key settings store with JSON persistence
 *
 * Holds the window geometry, hotkey, snapshot feed and per-companion
 * display settings. Categories map one-to-one to top level JSON objects:
 *
 *   { "window": { "width": 800 }, "companion.abc": { "x": 120.5 } }
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile(prefPath + "settings.json");
 *   float width = settings.get<float>("window", "width", 800.0f);
 *   settings.set("window", "width", 640.0f);
 *   settings.saveToFile(prefPath + "settings.json");
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Callback function type for change notifications
     * @param category The category that changed
     * @param key The setting key that changed
     * @param newValue The new value of the setting
     */
    using ChangeCallback = std::function<void(const std::string& category,
                                              const std::string& key,
                                              const SettingValue& newValue)>;

    /**
     * @brief Merges settings from a JSON file into the store
     * @param filepath Path to the JSON settings file
     * @return false if the file is missing or malformed; the store is unchanged
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Writes every category to a JSON file, creating parent directories
     * @return true if saving successful, false otherwise
     */
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Gets a typed setting value with optional default
     * @tparam T int, float, bool or std::string
     * @return The setting value or defaultValue if missing or of another type
     *
     * int and float are interchangeable: a whole number written as 120 in
     * the file still reads back as 120.0f.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Sets a typed setting value and notifies listeners
     * @return false for unsupported types
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    /**
     * @brief Registers a callback for setting changes
     * @param category Category to watch (empty string watches all categories)
     * @return Callback ID that can be used to unregister
     */
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t callbackId);

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;
    mutable std::shared_mutex m_settingsMutex;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };
    std::vector<ListenerInfo> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextCallbackId = 0;

    void notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue);

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

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

    const SettingValue& stored = keyIt->second;
    if constexpr (std::is_same_v<T, float>) {
        if (const float* value = std::get_if<float>(&stored)) {
            return *value;
        }
        if (const int* value = std::get_if<int>(&stored)) {
            return static_cast<float>(*value);
        }
    } else if constexpr (std::is_same_v<T, int>) {
        if (const int* value = std::get_if<int>(&stored)) {
            return *value;
        }
        if (const float* value = std::get_if<float>(&stored)) {
            return static_cast<int>(std::lround(*value));
        }
    } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* value = std::get_if<T>(&stored)) {
            return *value;
        }
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_same_v<T, double>) {
        settingValue = static_cast<float>(value);
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
        m_settings[category][key] = settingValue;
    }

    // Outside the lock so listeners may read settings back
    notifyListeners(category, key, settingValue);
    return true;
}

} // namespace PetDock

#endif // SETTINGS_MANAGER_HPP
