/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <format>
#include <fstream>
#include <limits>

namespace Wayfarer {

namespace {

std::optional<SettingsManager::SettingValue> fromJson(const JsonValue& value) {
    if (value.isBool()) {
        return value.asBool();
    }
    if (value.isString()) {
        return value.asString();
    }
    if (value.isNumber()) {
        const double number = value.asNumber();
        const bool whole = number == std::floor(number) &&
                           std::fabs(number) <= static_cast<double>(std::numeric_limits<int>::max());
        if (whole) {
            return static_cast<int>(number);
        }
        return static_cast<float>(number);
    }
    return std::nullopt;
}

JsonValue toJson(const SettingsManager::SettingValue& value) {
    return std::visit([](const auto& held) { return JsonValue(held); }, value);
}

} // namespace

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR(std::format("Failed to load {}: {}", filepath, reader.getLastError()));
        return false;
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        SETTINGS_ERROR(std::format("{}: root is not a JSON object", filepath));
        return false;
    }

    size_t loaded = 0;
    {
        std::unique_lock<std::shared_mutex> lock(m_storeMutex);
        for (const auto& [categoryName, categoryValue] : root.asObject()) {
            if (!categoryValue.isObject()) {
                SETTINGS_WARNING(std::format("Skipping '{}': category is not an object", categoryName));
                continue;
            }
            for (const auto& [key, jsonValue] : categoryValue.asObject()) {
                std::optional<SettingValue> value = fromJson(jsonValue);
                if (!value) {
                    SETTINGS_WARNING(std::format("Skipping '{}.{}': unsupported value type", categoryName, key));
                    continue;
                }
                m_categories[categoryName][key] = std::move(*value);
                ++loaded;
            }
        }
    }

    SETTINGS_INFO(std::format("Loaded {} settings from {}", loaded, filepath));
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonObject root;
    {
        std::shared_lock<std::shared_mutex> lock(m_storeMutex);
        for (const auto& [categoryName, category] : m_categories) {
            JsonObject entries;
            for (const auto& [key, value] : category) {
                entries.emplace(key, toJson(value));
            }
            root.emplace(categoryName, JsonValue(std::move(entries)));
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR(std::format("Cannot open {} for writing", filepath));
        return false;
    }
    file << JsonValue(std::move(root)).toString(2) << '\n';
    if (!file) {
        SETTINGS_ERROR(std::format("Write to {} failed", filepath));
        return false;
    }

    SETTINGS_INFO(std::format("Saved settings to {}", filepath));
    return true;
}

std::optional<SettingsManager::SettingValue> SettingsManager::lookup(const std::string& category,
                                                                     const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_storeMutex);
    const auto categoryIt = m_categories.find(category);
    if (categoryIt == m_categories.end()) {
        return std::nullopt;
    }
    const auto valueIt = categoryIt->second.find(key);
    if (valueIt == categoryIt->second.end()) {
        return std::nullopt;
    }
    return valueIt->second;
}

void SettingsManager::store(const std::string& category, const std::string& key, SettingValue value) {
    {
        std::unique_lock<std::shared_mutex> lock(m_storeMutex);
        m_categories[category][key] = value;
    }

    // Listeners may read or write settings, so neither lock is held while they run
    std::vector<ChangeCallback> interested;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const auto& [id, listener] : m_listeners) {
            if (listener.category.empty() || listener.category == category) {
                interested.push_back(listener.callback);
            }
        }
    }
    for (const auto& callback : interested) {
        callback(category, key, value);
    }
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    return lookup(category, key).has_value();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_storeMutex);
    const auto categoryIt = m_categories.find(category);
    if (categoryIt == m_categories.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }
    if (categoryIt->second.empty()) {
        m_categories.erase(categoryIt);
    }
    return true;
}

bool SettingsManager::clearCategory(const std::string& category) {
    std::unique_lock<std::shared_mutex> lock(m_storeMutex);
    return m_categories.erase(category) > 0;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_storeMutex);
    m_categories.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category, ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    const size_t id = m_nextListenerId++;
    m_listeners.emplace(id, Listener{category, std::move(callback)});
    return id;
}

void SettingsManager::unregisterChangeListener(size_t callbackId) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    m_listeners.erase(callbackId);
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_storeMutex);
    std::vector<std::string> names;
    names.reserve(m_categories.size());
    for (const auto& entry : m_categories) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_storeMutex);
    std::vector<std::string> keys;
    if (const auto it = m_categories.find(category); it != m_categories.end()) {
        keys.reserve(it->second.size());
        for (const auto& entry : it->second) {
            keys.push_back(entry.first);
        }
    }
    return keys;
}

GameSettings SettingsManager::getGameSettings() const {
    GameSettings defaults;
    GameSettings resolved;

    resolved.tileSize = get<int>("graphics", "tile_size", defaults.tileSize);
    if (resolved.tileSize < 8) {
        SETTINGS_WARNING(std::format("graphics.tile_size {} too small, using {}", resolved.tileSize, defaults.tileSize));
        resolved.tileSize = defaults.tileSize;
    }

    resolved.vsync = get<bool>("graphics", "vsync", defaults.vsync);

    resolved.maxFps = get<int>("graphics", "max_fps", defaults.maxFps);
    if (resolved.maxFps < 1) {
        SETTINGS_WARNING(std::format("graphics.max_fps {} invalid, using {}", resolved.maxFps, defaults.maxFps));
        resolved.maxFps = defaults.maxFps;
    }

    resolved.stepDelayMs = get<int>("engine", "step_delay_ms", defaults.stepDelayMs);
    if (resolved.stepDelayMs < 0) {
        SETTINGS_WARNING(std::format("engine.step_delay_ms {} negative, using {}", resolved.stepDelayMs, defaults.stepDelayMs));
        resolved.stepDelayMs = defaults.stepDelayMs;
    }

    resolved.clouds = get<bool>("animation", "clouds", defaults.clouds);
    resolved.waves = get<bool>("animation", "waves", defaults.waves);
    resolved.river = get<bool>("animation", "river", defaults.river);

    const int seed = get<int>("animation", "seed", 0);
    if (seed < 0) {
        SETTINGS_WARNING(std::format("animation.seed {} negative, using a random seed", seed));
    }
    resolved.animationSeed = seed > 0 ? static_cast<uint32_t>(seed) : 0u;

    return resolved;
}

size_t SettingsManager::applyDefaults() {
    const GameSettings defaults;
    size_t added = 0;

    auto setIfMissing = [this, &added](const std::string& category, const std::string& key, const auto& value) {
        if (!has(category, key)) {
            set(category, key, value);
            ++added;
        }
    };

    setIfMissing("graphics", "tile_size", defaults.tileSize);
    setIfMissing("graphics", "vsync", defaults.vsync);
    setIfMissing("graphics", "max_fps", defaults.maxFps);
    setIfMissing("engine", "step_delay_ms", defaults.stepDelayMs);
    setIfMissing("animation", "clouds", defaults.clouds);
    setIfMissing("animation", "waves", defaults.waves);
    setIfMissing("animation", "river", defaults.river);
    setIfMissing("animation", "seed", static_cast<int>(defaults.animationSeed));

    return added;
}

} // namespace Wayfarer
