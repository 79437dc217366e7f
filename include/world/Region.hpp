/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REGION_HPP
#define REGION_HPP

#include "utils/MapLocation.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace ArenaEngine {

/**
 * @brief Circular or rectangular area of tiles used by entity queries
 *
 * A circle contains every tile whose squared distance to the center is at
 * most radiusSquared. A rectangle is inclusive on both corners.
 */
class Region {
public:
    enum class Shape : uint8_t { Circle, Rectangle };

    static Region circle(const MapLocation& center, int32_t radiusSquared) {
        Region region;
        region.m_shape = Shape::Circle;
        region.m_center = center;
        region.m_radiusSquared = std::max(0, radiusSquared);
        const auto reach = static_cast<int32_t>(std::sqrt(static_cast<double>(region.m_radiusSquared)));
        region.m_min = MapLocation(center.x - reach, center.y - reach);
        region.m_max = MapLocation(center.x + reach, center.y + reach);
        return region;
    }

    static Region rectangle(const MapLocation& cornerA, const MapLocation& cornerB) {
        Region region;
        region.m_shape = Shape::Rectangle;
        region.m_min = MapLocation(std::min(cornerA.x, cornerB.x), std::min(cornerA.y, cornerB.y));
        region.m_max = MapLocation(std::max(cornerA.x, cornerB.x), std::max(cornerA.y, cornerB.y));
        region.m_center = MapLocation((region.m_min.x + region.m_max.x) / 2,
                                      (region.m_min.y + region.m_max.y) / 2);
        return region;
    }

    bool contains(const MapLocation& loc) const {
        if (loc.x < m_min.x || loc.x > m_max.x || loc.y < m_min.y || loc.y > m_max.y) {
            return false;
        }
        if (m_shape == Shape::Circle) {
            return m_center.distanceSquaredTo(loc) <= m_radiusSquared;
        }
        return true;
    }

    Shape getShape() const { return m_shape; }
    const MapLocation& getCenter() const { return m_center; }
    int32_t getRadiusSquared() const { return m_radiusSquared; }

    // Inclusive bounding box
    const MapLocation& getMin() const { return m_min; }
    const MapLocation& getMax() const { return m_max; }

private:
    Region() = default;

    Shape m_shape{Shape::Circle};
    MapLocation m_center;
    int32_t m_radiusSquared{0};
    MapLocation m_min;
    MapLocation m_max;
};

} // namespace ArenaEngine

#endif // REGION_HPP
