/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/GameMap.hpp"
#include <algorithm>
#include <format>
#include <set>

namespace ArenaEngine {

GameMap::GameMap(std::string name, int32_t width, int32_t height, uint32_t seed)
    : m_name(std::move(name)), m_width(width), m_height(height), m_seed(seed) {
    if (m_width > 0 && m_height > 0) {
        const size_t tiles = static_cast<size_t>(m_width) * static_cast<size_t>(m_height);
        m_terrain.assign(tiles, TerrainTile::NORMAL);
        m_ore.assign(tiles, 0.0);
    }
}

TerrainTile GameMap::getTerrain(const MapLocation& loc) const {
    if (!onMap(loc)) {
        return TerrainTile::OFF_MAP;
    }
    return m_terrain[indexOf(loc)];
}

void GameMap::setTerrain(const MapLocation& loc, TerrainTile tile) {
    if (onMap(loc) && tile != TerrainTile::OFF_MAP) {
        m_terrain[indexOf(loc)] = tile;
    }
}

double GameMap::getInitialOre(const MapLocation& loc) const {
    if (!onMap(loc)) {
        return 0.0;
    }
    return m_ore[indexOf(loc)];
}

void GameMap::setInitialOre(const MapLocation& loc, double ore) {
    if (onMap(loc)) {
        m_ore[indexOf(loc)] = std::max(0.0, ore);
    }
}

std::optional<MapLocation> GameMap::getHQLocation(Team team) const {
    if (team == Team::NEUTRAL) {
        return std::nullopt;
    }
    return m_hqLocations[EntityTraits::teamIndex(team)];
}

void GameMap::setHQLocation(Team team, const MapLocation& loc) {
    if (team != Team::NEUTRAL) {
        m_hqLocations[EntityTraits::teamIndex(team)] = loc;
    }
}

const std::vector<MapLocation>& GameMap::getTowerLocations(Team team) const {
    static const std::vector<MapLocation> none;
    if (team == Team::NEUTRAL) {
        return none;
    }
    return m_towerLocations[EntityTraits::teamIndex(team)];
}

void GameMap::addTowerLocation(Team team, const MapLocation& loc) {
    if (team != Team::NEUTRAL) {
        m_towerLocations[EntityTraits::teamIndex(team)].push_back(loc);
    }
}

std::optional<std::string> GameMap::validate() const {
    if (m_width <= 0 || m_height <= 0) {
        return std::format("map '{}' has non-positive size {}x{}", m_name, m_width, m_height);
    }

    std::set<MapLocation> used;
    auto checkSite = [&](Team team, const MapLocation& loc, const char* what) -> std::optional<std::string> {
        if (!onMap(loc)) {
            return std::format("map '{}': {} of team {} at ({}, {}) is off the map",
                               m_name, what, EntityTraits::teamToString(team), loc.x, loc.y);
        }
        if (getTerrain(loc) == TerrainTile::VOID) {
            return std::format("map '{}': {} of team {} at ({}, {}) is on void terrain",
                               m_name, what, EntityTraits::teamToString(team), loc.x, loc.y);
        }
        if (!used.insert(loc).second) {
            return std::format("map '{}': {} of team {} at ({}, {}) overlaps another start site",
                               m_name, what, EntityTraits::teamToString(team), loc.x, loc.y);
        }
        return std::nullopt;
    };

    for (Team team : {Team::A, Team::B}) {
        auto hq = getHQLocation(team);
        if (!hq) {
            return std::format("map '{}' has no HQ for team {}", m_name, EntityTraits::teamToString(team));
        }
        if (auto error = checkSite(team, *hq, "HQ")) {
            return error;
        }
        for (const auto& tower : getTowerLocations(team)) {
            if (auto error = checkSite(team, tower, "tower")) {
                return error;
            }
        }
    }
    return std::nullopt;
}

} // namespace ArenaEngine
