/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_HASH_HPP
#define SPATIAL_HASH_HPP

#include "entities/Entity.hpp"
#include "utils/MapLocation.hpp"
#include "world/Region.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace ArenaEngine {

/**
 * @brief Bucketed index of entity tile positions for area queries
 *
 * Entities are points on the integer grid, so each id lives in exactly one
 * cell. Cells are square blocks of cellSize tiles. The index holds ids and
 * locations only; EntityDataManager re-indexes on every location write.
 */
class SpatialHash {
public:
    explicit SpatialHash(int32_t cellSize = 8);

    void insert(EntityID id, const MapLocation& location);
    void remove(EntityID id);
    void update(EntityID id, const MapLocation& location);

    /**
     * @brief Collects ids whose indexed location lies inside the region
     * @param out Cleared, then filled in unspecified order
     */
    void query(const Region& area, std::vector<EntityID>& out) const;

    void clear();

    size_t size() const { return m_positions.size(); }
    int32_t getCellSize() const { return m_cellSize; }

private:
    struct CellCoord { int32_t x; int32_t y; };
    struct CellCoordHash {
        size_t operator()(const CellCoord& c) const noexcept {
            return (static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32) ^
                   static_cast<uint32_t>(c.y);
        }
    };
    struct CellCoordEq {
        bool operator()(const CellCoord& a, const CellCoord& b) const noexcept {
            return a.x == b.x && a.y == b.y;
        }
    };

    // A cell rarely holds more than a handful of robots
    using CellVector = boost::container::small_vector<EntityID, 8>;

    int32_t m_cellSize{8};
    std::unordered_map<EntityID, MapLocation> m_positions;
    std::unordered_map<CellCoord, CellVector, CellCoordHash, CellCoordEq> m_cells;

    CellCoord cellFor(const MapLocation& location) const;
    void removeFromCell(const CellCoord& cell, EntityID id);
};

} // namespace ArenaEngine

#endif // SPATIAL_HASH_HPP
