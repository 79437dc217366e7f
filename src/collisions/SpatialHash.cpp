/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/SpatialHash.hpp"
#include <algorithm>

namespace ArenaEngine {

namespace {
// Floor division so negative coordinates map to their own cells
int32_t floorDiv(int32_t value, int32_t divisor) {
    int32_t q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --q;
    }
    return q;
}
} // namespace

SpatialHash::SpatialHash(int32_t cellSize)
    : m_cellSize(std::max(1, cellSize)) {}

SpatialHash::CellCoord SpatialHash::cellFor(const MapLocation& location) const {
    return CellCoord{floorDiv(location.x, m_cellSize), floorDiv(location.y, m_cellSize)};
}

void SpatialHash::insert(EntityID id, const MapLocation& location) {
    auto it = m_positions.find(id);
    if (it != m_positions.end()) {
        update(id, location);
        return;
    }
    m_positions.emplace(id, location);
    m_cells[cellFor(location)].push_back(id);
}

void SpatialHash::remove(EntityID id) {
    auto it = m_positions.find(id);
    if (it == m_positions.end()) return;
    removeFromCell(cellFor(it->second), id);
    m_positions.erase(it);
}

void SpatialHash::update(EntityID id, const MapLocation& location) {
    auto it = m_positions.find(id);
    if (it == m_positions.end()) {
        insert(id, location);
        return;
    }

    const CellCoord oldCell = cellFor(it->second);
    const CellCoord newCell = cellFor(location);
    it->second = location;

    // Early exit if the entity stayed inside its cell
    if (CellCoordEq{}(oldCell, newCell)) {
        return;
    }

    removeFromCell(oldCell, id);
    m_cells[newCell].push_back(id);
}

void SpatialHash::query(const Region& area, std::vector<EntityID>& out) const {
    out.clear();

    const CellCoord minCell = cellFor(area.getMin());
    const CellCoord maxCell = cellFor(area.getMax());

    for (int32_t y = minCell.y; y <= maxCell.y; ++y) {
        for (int32_t x = minCell.x; x <= maxCell.x; ++x) {
            auto it = m_cells.find(CellCoord{x, y});
            if (it == m_cells.end()) continue;

            for (EntityID id : it->second) {
                auto pos = m_positions.find(id);
                if (pos != m_positions.end() && area.contains(pos->second)) {
                    out.push_back(id);
                }
            }
        }
    }
}

void SpatialHash::clear() {
    m_cells.clear();
    m_positions.clear();
}

void SpatialHash::removeFromCell(const CellCoord& cell, EntityID id) {
    auto cit = m_cells.find(cell);
    if (cit == m_cells.end()) return;
    auto& v = cit->second;
    v.erase(std::remove(v.begin(), v.end(), id), v.end());
    if (v.empty()) m_cells.erase(cit);
}

} // namespace ArenaEngine
