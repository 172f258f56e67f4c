/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace Wayfarer {

/**
 * @brief Resolved application settings; every field has its default
 */
struct GameSettings {
    // graphics
    int tileSize{40};
    bool vsync{true};
    int maxFps{60};
    // engine
    int stepDelayMs{100};
    // animation
    bool clouds{false};
    bool waves{false};
    bool river{false};
    uint32_t animationSeed{0};  // 0 = random

    bool operator==(const GameSettings&) const = default;
};

/**
 * @brief Category/key settings store with JSON persistence
 *
 * Values are int, float, bool or string. Reads take a shared lock, writes an
 * exclusive one; change listeners run after the write lock is released.
 * getGameSettings() resolves the keys Wayfarer reads into one validated
 * struct.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   int tileSize = settings.get<int>("graphics", "tile_size", 40);
 *   settings.set("animation", "clouds", true);
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    /**
     * @brief Merge a JSON file of {category: {key: value}} objects into the store
     *
     * Whole numbers load as int, other numbers as float. Arrays, objects and
     * null below the category level are skipped with a warning.
     * @return false if the file is missing, malformed, or not an object
     */
    bool loadFromFile(const std::string& filepath);

    // Whole store as indented JSON
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Typed read; a missing key or a type mismatch yields defaultValue
     *
     * float reads also accept stored ints.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @return false for types outside SettingValue
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;

    // Removing the last key of a category drops the category
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    /**
     * @brief Watch one category, or every category with an empty name
     * @return id for unregisterChangeListener()
     */
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t callbackId);

    // Both sorted by name
    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

    /**
     * @brief Resolve and validate the keys Wayfarer reads
     *
     * Missing keys take their defaults. Out-of-range values are logged and
     * replaced by the default (tile_size < 8, max_fps < 1, step_delay_ms < 0,
     * negative seed).
     */
    GameSettings getGameSettings() const;

    /**
     * @brief Write every Wayfarer key that is not set yet with its default
     * @return number of keys added
     */
    size_t applyDefaults();

private:
    SettingsManager() = default;
    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    std::optional<SettingValue> lookup(const std::string& category, const std::string& key) const;
    void store(const std::string& category, const std::string& key, SettingValue value);

    using Category = std::map<std::string, SettingValue>;
    std::map<std::string, Category> m_categories;
    mutable std::shared_mutex m_storeMutex;

    struct Listener {
        std::string category;  // empty = all
        ChangeCallback callback;
    };
    std::map<size_t, Listener> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextListenerId{0};
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    const std::optional<SettingValue> value = lookup(category, key);
    if (!value) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, float>) {
        if (const int* whole = std::get_if<int>(&*value)) {
            return static_cast<float>(*whole);
        }
    }
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* typed = std::get_if<T>(&*value)) {
            return *typed;
        }
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        store(category, key, SettingValue{value});
        return true;
    } else if constexpr (std::is_convertible_v<const T&, std::string>) {
        store(category, key, SettingValue{std::string(value)});
        return true;
    } else {
        return false;
    }
}

} // namespace Wayfarer

#endif // SETTINGS_MANAGER_HPP
