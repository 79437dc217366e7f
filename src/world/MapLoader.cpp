/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/MapLoader.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <filesystem>
#include <format>

namespace ArenaEngine {

std::optional<GameMap> MapLoader::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        MAP_ERROR(std::format("Failed to load map file: {} - {}", path, reader.getLastError()));
        return std::nullopt;
    }

    const std::string stem = std::filesystem::path(path).stem().string();
    return fromJson(reader.getRoot(), stem);
}

std::optional<GameMap> MapLoader::loadFromString(const std::string& json, const std::string& fallbackName) {
    JsonReader reader;
    if (!reader.parse(json)) {
        MAP_ERROR(std::format("Failed to parse map '{}': {}", fallbackName, reader.getLastError()));
        return std::nullopt;
    }
    return fromJson(reader.getRoot(), fallbackName);
}

std::string MapLoader::resolvePath(const std::string& mapPath, const std::string& mapName) {
    return (std::filesystem::path(mapPath) / (mapName + ".json")).string();
}

std::optional<MapLocation> MapLoader::parseLocation(const JsonValue& value) {
    if (!value.isArray() || value.size() != 2 || !value[0].isNumber() || !value[1].isNumber()) {
        return std::nullopt;
    }
    return MapLocation(value[0].asInt(), value[1].asInt());
}

std::optional<GameMap> MapLoader::fromJson(const JsonValue& root, const std::string& fallbackName) {
    if (!root.isObject()) {
        MAP_ERROR(std::format("Map '{}': root JSON is not an object", fallbackName));
        return std::nullopt;
    }

    const std::string name = root["name"].tryAsString().value_or(fallbackName);

    auto width = root["width"].tryAsInt();
    auto height = root["height"].tryAsInt();
    if (!width || !height) {
        MAP_ERROR(std::format("Map '{}': missing or invalid 'width'/'height'", name));
        return std::nullopt;
    }

    const auto seed = static_cast<uint32_t>(root["seed"].tryAsNumber().value_or(0.0));
    GameMap map(name, *width, *height, seed);

    if (auto roundCap = root["round_cap"].tryAsInt()) {
        map.setRoundCap(*roundCap);
    }

    if (const JsonArray* rows = root["terrain"].tryAsArray()) {
        for (size_t y = 0; y < rows->size(); ++y) {
            auto row = (*rows)[y].tryAsString();
            if (!row) {
                MAP_ERROR(std::format("Map '{}': terrain row {} is not a string", name, y));
                return std::nullopt;
            }
            for (size_t x = 0; x < row->size(); ++x) {
                const MapLocation loc(static_cast<int32_t>(x), static_cast<int32_t>(y));
                switch ((*row)[x]) {
                    case '.':
                        break;
                    case '#':
                        map.setTerrain(loc, TerrainTile::VOID);
                        break;
                    default:
                        MAP_ERROR(std::format("Map '{}': unknown terrain '{}' at ({}, {})", name, (*row)[x], x, y));
                        return std::nullopt;
                }
            }
        }
    }

    if (const JsonArray* rows = root["ore"].tryAsArray()) {
        for (size_t y = 0; y < rows->size(); ++y) {
            const JsonArray* cells = (*rows)[y].tryAsArray();
            if (cells == nullptr) {
                MAP_ERROR(std::format("Map '{}': ore row {} is not an array", name, y));
                return std::nullopt;
            }
            for (size_t x = 0; x < cells->size(); ++x) {
                map.setInitialOre(MapLocation(static_cast<int32_t>(x), static_cast<int32_t>(y)),
                                  (*cells)[x].tryAsNumber().value_or(0.0));
            }
        }
    }

    const JsonValue& hq = root["hq"];
    for (Team team : {Team::A, Team::B}) {
        const char* key = EntityTraits::teamToString(team);
        auto loc = parseLocation(hq[key]);
        if (!loc) {
            MAP_ERROR(std::format("Map '{}': missing or invalid HQ location for team {}", name, key));
            return std::nullopt;
        }
        map.setHQLocation(team, *loc);

        if (const JsonArray* towers = root["towers"][key].tryAsArray()) {
            for (const auto& entry : *towers) {
                auto towerLoc = parseLocation(entry);
                if (!towerLoc) {
                    MAP_ERROR(std::format("Map '{}': invalid tower location for team {}", name, key));
                    return std::nullopt;
                }
                map.addTowerLocation(team, *towerLoc);
            }
        }
    }

    MAP_INFO(std::format("Loaded map '{}' ({}x{}, seed {})", name, map.getWidth(), map.getHeight(), seed));
    return map;
}

} // namespace ArenaEngine
