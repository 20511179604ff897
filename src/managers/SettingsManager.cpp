/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>

namespace StrataEngine {

namespace {
// Whole numbers are stored as int so that get<int> works on them
SettingsManager::SettingValue fromJson(const JsonValue& value, bool& ok) {
    ok = true;
    if (value.isBool()) {
        return value.asBool();
    }
    if (value.isNumber()) {
        double num = value.asNumber();
        if (std::floor(num) == num && std::abs(num) < 2147483647.0) {
            return static_cast<int>(num);
        }
        return static_cast<float>(num);
    }
    if (value.isString()) {
        return value.asString();
    }
    ok = false;
    return 0;
}

JsonValue toJson(const SettingsManager::SettingValue& value) {
    return std::visit([](const auto& v) -> JsonValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, float>) {
            return JsonValue(static_cast<double>(v));
        } else {
            return JsonValue(v);
        }
    }, value);
}
} // namespace

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR(std::format("Failed to load settings from {}: {}", filepath, reader.getLastError()));
        return false;
    }
    if (!applyRoot(reader.getRoot())) {
        return false;
    }
    SETTINGS_INFO(std::format("Loaded settings from {}", filepath));
    return true;
}

bool SettingsManager::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse settings: " + reader.getLastError());
        return false;
    }
    return applyRoot(reader.getRoot());
}

bool SettingsManager::applyRoot(const JsonValue& root) {
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings root must be an object of categories");
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    for (const auto& [category, entries] : root.asObject()) {
        if (!entries.isObject()) {
            SETTINGS_WARN(std::format("Skipping category '{}': not an object", category));
            continue;
        }
        for (const auto& [key, value] : entries.asObject()) {
            bool ok = false;
            SettingValue converted = fromJson(value, ok);
            if (!ok) {
                SETTINGS_WARN(std::format("Skipping {}.{}: unsupported value type", category, key));
                continue;
            }
            m_settings[category][key] = std::move(converted);
        }
    }
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonValue root{JsonObject{}};
    {
        std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
        for (const auto& [category, entries] : m_settings) {
            JsonValue& section = root[category];
            section = JsonValue(JsonObject{});
            for (const auto& [key, value] : entries) {
                section[key] = toJson(value);
            }
        }
    }

    const std::filesystem::path path(filepath);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            SETTINGS_ERROR(std::format("Cannot create directory for {}: {}", filepath, ec.message()));
            return false;
        }
    }

    std::ofstream file(filepath, std::ios::trunc);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }
    file << root.toString(2) << '\n';
    if (!file.good()) {
        SETTINGS_ERROR("Failed writing settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO(std::format("Saved settings to {}", filepath));
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    auto it = m_settings.find(category);
    return it != m_settings.end() && it->second.count(key) > 0;
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    auto it = m_settings.find(category);
    if (it == m_settings.end()) {
        return false;
    }
    bool removed = it->second.erase(key) > 0;
    if (it->second.empty()) {
        m_settings.erase(it);
    }
    return removed;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, entries] : m_settings) {
        categories.push_back(category);
    }
    return categories;
}

} // namespace StrataEngine
