/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_MAP_HPP
#define GAME_MAP_HPP

#include "entities/EntityKind.hpp"
#include "utils/MapLocation.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ArenaEngine {

enum class TerrainTile : uint8_t {
    NORMAL = 0,
    VOID = 1,     // Impassable for ground entities, air may cross
    OFF_MAP = 2
};

inline std::ostream& operator<<(std::ostream& os, TerrainTile tile) {
    switch (tile) {
        case TerrainTile::NORMAL:  return os << "NORMAL";
        case TerrainTile::VOID:    return os << "VOID";
        case TerrainTile::OFF_MAP: return os << "OFF_MAP";
        default:                   return os << "UNKNOWN";
    }
}

/**
 * @brief Static description of an arena: size, terrain, ore and start sites
 *
 * The map is immutable once a match starts. Ore that robots mine is
 * tracked by GameWorld on its own copy of the grid.
 */
class GameMap {
public:
    GameMap() = default;
    GameMap(std::string name, int32_t width, int32_t height, uint32_t seed);

    const std::string& getName() const { return m_name; }
    int32_t getWidth() const { return m_width; }
    int32_t getHeight() const { return m_height; }
    uint32_t getSeed() const { return m_seed; }

    /// Round cap stored in the map file, overrides the configured cap
    std::optional<int32_t> getRoundCap() const { return m_roundCap; }
    void setRoundCap(std::optional<int32_t> roundCap) { m_roundCap = roundCap; }

    bool onMap(const MapLocation& loc) const {
        return loc.x >= 0 && loc.y >= 0 && loc.x < m_width && loc.y < m_height;
    }

    TerrainTile getTerrain(const MapLocation& loc) const;
    void setTerrain(const MapLocation& loc, TerrainTile tile);

    double getInitialOre(const MapLocation& loc) const;
    void setInitialOre(const MapLocation& loc, double ore);

    std::optional<MapLocation> getHQLocation(Team team) const;
    void setHQLocation(Team team, const MapLocation& loc);

    const std::vector<MapLocation>& getTowerLocations(Team team) const;
    void addTowerLocation(Team team, const MapLocation& loc);

    /**
     * @brief Checks that a match can be started on this map
     * @return Description of the first problem found, or nullopt if usable
     */
    std::optional<std::string> validate() const;

private:
    std::string m_name;
    int32_t m_width{0};
    int32_t m_height{0};
    uint32_t m_seed{0};
    std::optional<int32_t> m_roundCap;

    // Row-major, width * height
    std::vector<TerrainTile> m_terrain;
    std::vector<double> m_ore;

    std::array<std::optional<MapLocation>, 2> m_hqLocations{};
    std::array<std::vector<MapLocation>, 2> m_towerLocations{};

    size_t indexOf(const MapLocation& loc) const {
        return static_cast<size_t>(loc.y) * static_cast<size_t>(m_width) + static_cast<size_t>(loc.x);
    }
};

} // namespace ArenaEngine

#endif // GAME_MAP_HPP
