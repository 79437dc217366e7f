/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_CONSTANTS_HPP
#define GAME_CONSTANTS_HPP

#include <cstddef>
#include <cstdint>
#include <ostream>

namespace ArenaEngine {

namespace GameConstants {

// Broadcast channels per team, valid ids are [0, BROADCAST_MAX_CHANNELS)
inline constexpr int32_t BROADCAST_MAX_CHANNELS = 65536;

// Length of the per-team memory carried between matches of a series
inline constexpr size_t TEAM_MEMORY_LENGTH = 32;

inline constexpr size_t INDICATOR_STRING_COUNT = 3;

// Ore moved from a tile per mine() call, doubled once Pickaxe is researched
inline constexpr double MINE_RATE = 2.0;

// Turns a spawner waits before it can spawn or build again
inline constexpr int32_t SPAWN_COOLDOWN = 1;

inline constexpr int32_t EXPLOSION_RADIUS_SQUARED = 2;
inline constexpr int32_t MISSILE_LIFESPAN = 5;

// Sensor radius² bonus granted by the Vision upgrade
inline constexpr int32_t VISION_SENSOR_BONUS = 11;

inline constexpr int32_t DEFAULT_ROUND_CAP = 2000;
inline constexpr int32_t DEFAULT_OPERATION_BUDGET = 10000;
inline constexpr double DEFAULT_ORE_INCOME = 5.0;
inline constexpr double DEFAULT_STARTING_ORE = 500.0;

} // namespace GameConstants

/**
 * @brief Operation costs charged against a robot's per-round budget
 *
 * Every call on the RobotController charges one of these. Free getters
 * (own id, own location, round number) cost nothing.
 */
namespace OperationCost {

inline constexpr int32_t FREE = 0;
inline constexpr int32_t GLOBAL_QUERY = 1;
inline constexpr int32_t SENSE_NEARBY = 100;
inline constexpr int32_t SENSE_LOCATION = 25;
inline constexpr int32_t MOVE = 25;
inline constexpr int32_t ATTACK = 25;
inline constexpr int32_t SPAWN = 50;
inline constexpr int32_t BUILD = 50;
inline constexpr int32_t MINE = 25;
inline constexpr int32_t LAUNCH = 25;
inline constexpr int32_t EXPLODE = 10;
inline constexpr int32_t BROADCAST = 25;
inline constexpr int32_t READ_BROADCAST = 5;
inline constexpr int32_t RESEARCH = 25;
inline constexpr int32_t TEAM_MEMORY = 5;
inline constexpr int32_t INDICATOR = 1;

} // namespace OperationCost

/**
 * @brief Research tracks available to an HQ
 */
enum class Upgrade : uint8_t {
    Pickaxe = 0,
    Vision = 1,
    Nuke = 2,
    COUNT
};

namespace UpgradeTraits {

/// Rounds of research needed to complete the upgrade
constexpr int32_t roundsToComplete(Upgrade upgrade) noexcept {
    switch (upgrade) {
        case Upgrade::Pickaxe: return 25;
        case Upgrade::Vision:  return 25;
        case Upgrade::Nuke:    return 200;
        default:               return 0;
    }
}

constexpr const char* toString(Upgrade upgrade) noexcept {
    switch (upgrade) {
        case Upgrade::Pickaxe: return "Pickaxe";
        case Upgrade::Vision:  return "Vision";
        case Upgrade::Nuke:    return "Nuke";
        default:               return "Unknown";
    }
}

} // namespace UpgradeTraits

inline std::ostream& operator<<(std::ostream& os, Upgrade upgrade) {
    return os << UpgradeTraits::toString(upgrade);
}

} // namespace ArenaEngine

#endif // GAME_CONSTANTS_HPP
