/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>
#include <tuple>

namespace ArenaEngine {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR(std::format("Failed to load settings from file: {} - {}", filepath, reader.getLastError()));
        return false;
    }
    return applyDocument(reader.getRoot(), filepath);
}

bool SettingsManager::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR(std::format("Failed to parse settings: {}", reader.getLastError()));
        return false;
    }
    return applyDocument(reader.getRoot(), "<string>");
}

bool SettingsManager::applyDocument(const JsonValue& root, const std::string& source) {
    const JsonObject* rootObj = root.tryAsObject();
    if (rootObj == nullptr) {
        SETTINGS_ERROR(std::format("Settings root is not a JSON object: {}", source));
        return false;
    }

    std::vector<std::tuple<std::string, std::string, SettingValue>> changed;
    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

        for (const auto& [categoryName, categoryValue] : *rootObj) {
            const JsonObject* categoryObj = categoryValue.tryAsObject();
            if (categoryObj == nullptr) {
                SETTINGS_WARNING(std::format("Category '{}' is not an object, skipping", categoryName));
                continue;
            }

            for (const auto& [key, value] : *categoryObj) {
                SettingValue settingValue;
                if (value.isBool()) {
                    settingValue = value.asBool();
                } else if (value.isNumber()) {
                    double numValue = value.asNumber();
                    if (std::floor(numValue) == numValue &&
                        std::abs(numValue) <= 2147483647.0) {
                        settingValue = static_cast<int>(numValue);
                    } else {
                        settingValue = static_cast<float>(numValue);
                    }
                } else if (value.isString()) {
                    settingValue = value.asString();
                } else if (const JsonArray* list = value.tryAsArray()) {
                    // String lists are stored in their comma separated form
                    std::string joined;
                    for (const auto& entry : *list) {
                        if (!entry.isString()) {
                            continue;
                        }
                        if (!joined.empty()) {
                            joined += ',';
                        }
                        joined += entry.asString();
                    }
                    settingValue = joined;
                } else {
                    SETTINGS_WARNING(std::format("Unsupported value type for setting '{}.{}', skipping", categoryName, key));
                    continue;
                }

                m_settings[categoryName][key] = settingValue;
                changed.emplace_back(categoryName, key, settingValue);
            }
        }
    }

    for (const auto& [category, key, value] : changed) {
        notifyListeners(category, key, value);
    }

    SETTINGS_INFO(std::format("Loaded {} settings from {}", changed.size(), source));
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonObject document;
    {
        std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
        for (const auto& [categoryName, categorySettings] : m_settings) {
            JsonObject category;
            for (const auto& [key, value] : categorySettings) {
                category[key] = std::visit([](const auto& arg) {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (std::is_same_v<T, float>) {
                        return JsonValue(static_cast<double>(arg));
                    } else {
                        return JsonValue(arg);
                    }
                }, value);
            }
            document[categoryName] = JsonValue(std::move(category));
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR(std::format("Failed to open settings file for writing: {}", filepath));
        return false;
    }

    file << JsonValue(std::move(document)).toString() << '\n';
    if (!file.good()) {
        SETTINGS_ERROR(std::format("Failed to write settings file: {}", filepath));
        return false;
    }

    SETTINGS_INFO(std::format("Saved settings to file: {}", filepath));
    return true;
}

std::vector<std::string> SettingsManager::getList(const std::string& category, const std::string& key) const {
    std::vector<std::string> entries;
    std::stringstream stream(get<std::string>(category, key, ""));
    std::string entry;
    while (std::getline(stream, entry, ',')) {
        auto first = entry.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        auto last = entry.find_last_not_of(" \t");
        entries.push_back(entry.substr(first, last - first + 1));
    }
    return entries;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }

    return categoryIt->second.find(key) != categoryIt->second.end();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }

    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

bool SettingsManager::clearCategory(const std::string& category) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    return m_settings.erase(category) > 0;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category, ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);

    size_t id = m_nextCallbackId++;
    m_listeners.push_back({id, category, std::move(callback)});
    return id;
}

void SettingsManager::unregisterChangeListener(size_t callbackId) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);

    std::erase_if(m_listeners, [callbackId](const ListenerInfo& info) {
        return info.id == callbackId;
    });
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    std::sort(categories.begin(), categories.end());
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return {};
    }

    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void SettingsManager::notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);

    for (const auto& listener : m_listeners) {
        if (listener.category.empty() || listener.category == category) {
            listener.callback(category, key, newValue);
        }
    }
}

} // namespace ArenaEngine
