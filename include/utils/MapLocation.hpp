/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MAP_LOCATION_HPP
#define MAP_LOCATION_HPP

#include "utils/Vector2D.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>

namespace ArenaEngine {

/**
 * @brief Compass directions on the arena grid
 *
 * NORTH points towards decreasing y. NONE and OMNI are not movement
 * directions; add() leaves the location unchanged for them.
 */
enum class Direction : uint8_t {
    NORTH = 0,
    NORTH_EAST,
    EAST,
    SOUTH_EAST,
    SOUTH,
    SOUTH_WEST,
    WEST,
    NORTH_WEST,
    NONE,
    OMNI
};

inline constexpr std::array<Direction, 8> ALL_DIRECTIONS{
    Direction::NORTH, Direction::NORTH_EAST, Direction::EAST,
    Direction::SOUTH_EAST, Direction::SOUTH, Direction::SOUTH_WEST,
    Direction::WEST, Direction::NORTH_WEST};

namespace DirectionUtils {

constexpr int dx(Direction dir) noexcept {
    switch (dir) {
        case Direction::NORTH_EAST:
        case Direction::EAST:
        case Direction::SOUTH_EAST: return 1;
        case Direction::SOUTH_WEST:
        case Direction::WEST:
        case Direction::NORTH_WEST: return -1;
        default:                    return 0;
    }
}

constexpr int dy(Direction dir) noexcept {
    switch (dir) {
        case Direction::NORTH:
        case Direction::NORTH_EAST:
        case Direction::NORTH_WEST: return -1;
        case Direction::SOUTH_EAST:
        case Direction::SOUTH:
        case Direction::SOUTH_WEST: return 1;
        default:                    return 0;
    }
}

constexpr bool isMovement(Direction dir) noexcept {
    return dir != Direction::NONE && dir != Direction::OMNI;
}

constexpr Direction rotateLeft(Direction dir) noexcept {
    if (!isMovement(dir)) {
        return dir;
    }
    return static_cast<Direction>((static_cast<uint8_t>(dir) + 7) % 8);
}

constexpr Direction rotateRight(Direction dir) noexcept {
    if (!isMovement(dir)) {
        return dir;
    }
    return static_cast<Direction>((static_cast<uint8_t>(dir) + 1) % 8);
}

constexpr const char* toString(Direction dir) noexcept {
    switch (dir) {
        case Direction::NORTH:      return "NORTH";
        case Direction::NORTH_EAST: return "NORTH_EAST";
        case Direction::EAST:       return "EAST";
        case Direction::SOUTH_EAST: return "SOUTH_EAST";
        case Direction::SOUTH:      return "SOUTH";
        case Direction::SOUTH_WEST: return "SOUTH_WEST";
        case Direction::WEST:       return "WEST";
        case Direction::NORTH_WEST: return "NORTH_WEST";
        case Direction::NONE:       return "NONE";
        case Direction::OMNI:       return "OMNI";
        default:                    return "Unknown";
    }
}

} // namespace DirectionUtils

/**
 * @brief Integer grid coordinate of a tile
 */
struct MapLocation {
    int32_t x{0};
    int32_t y{0};

    constexpr MapLocation() noexcept = default;
    constexpr MapLocation(int32_t px, int32_t py) noexcept : x(px), y(py) {}

    [[nodiscard]] constexpr MapLocation add(Direction dir, int32_t steps = 1) const noexcept {
        return MapLocation(x + DirectionUtils::dx(dir) * steps,
                           y + DirectionUtils::dy(dir) * steps);
    }

    [[nodiscard]] constexpr int32_t distanceSquaredTo(const MapLocation& other) const noexcept {
        const int32_t ddx = other.x - x;
        const int32_t ddy = other.y - y;
        return ddx * ddx + ddy * ddy;
    }

    /**
     * @brief Sign-based direction towards another tile
     * @return OMNI when both locations are equal
     */
    [[nodiscard]] constexpr Direction directionTo(const MapLocation& other) const noexcept {
        const int sx = (other.x > x) - (other.x < x);
        const int sy = (other.y > y) - (other.y < y);
        for (Direction dir : ALL_DIRECTIONS) {
            if (DirectionUtils::dx(dir) == sx && DirectionUtils::dy(dir) == sy) {
                return dir;
            }
        }
        return Direction::OMNI;
    }

    [[nodiscard]] Vector2D toVector() const {
        return Vector2D(static_cast<float>(x), static_cast<float>(y));
    }

    constexpr bool operator==(const MapLocation& other) const noexcept {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const MapLocation& other) const noexcept {
        return !(*this == other);
    }

    // Row-major ordering, used by the occupancy index
    constexpr bool operator<(const MapLocation& other) const noexcept {
        return y < other.y || (y == other.y && x < other.x);
    }
};

struct MapLocationHash {
    size_t operator()(const MapLocation& loc) const noexcept {
        return std::hash<uint64_t>{}(
            (static_cast<uint64_t>(static_cast<uint32_t>(loc.x)) << 32) ^
            static_cast<uint32_t>(loc.y));
    }
};

inline std::ostream& operator<<(std::ostream& os, const MapLocation& loc) {
    return os << "[" << loc.x << ", " << loc.y << "]";
}

inline std::ostream& operator<<(std::ostream& os, Direction dir) {
    return os << DirectionUtils::toString(dir);
}

} // namespace ArenaEngine

#endif // MAP_LOCATION_HPP
