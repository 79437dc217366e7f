/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_KIND_HPP
#define ENTITY_KIND_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace ArenaEngine {

enum class Team : uint8_t {
    A = 0,
    B = 1,
    NEUTRAL = 2
};

/**
 * @brief Vertical layer an entity occupies
 *
 * Ground and air entities can share a tile; two entities on the same
 * tier cannot.
 */
enum class HeightTier : uint8_t {
    Ground = 0,
    Air = 1
};

/**
 * @brief Closed set of entity types
 *
 * Dispatch is done on this tag plus the KindStats table rather than
 * through a class hierarchy.
 */
enum class EntityKind : uint8_t {
    // Structures
    HQ = 0,
    Tower = 1,
    SupplyDepot = 2,
    Barracks = 3,

    // Units
    Beaver = 4,
    Miner = 5,
    Soldier = 6,
    Drone = 7,

    // Projectiles
    Missile = 8,

    COUNT
};

inline constexpr size_t ENTITY_KIND_COUNT = static_cast<size_t>(EntityKind::COUNT);

/**
 * @brief Static per-kind combat and economy values
 *
 * A delay of 0 means the kind never performs that action.
 */
struct KindStats {
    int32_t maxHealth;
    int32_t attackPower;
    int32_t attackRadiusSquared;
    int32_t sensorRadiusSquared;
    int32_t movementDelay;
    int32_t attackDelay;
    int32_t oreCost;
    int32_t upkeep;
    float radius;
    HeightTier tier;
};

namespace EntityTraits {

constexpr KindStats stats(EntityKind kind) noexcept {
    switch (kind) {
        //                          hp  atk a.r2 s.r2 mv atk cost upk radius tier
        case EntityKind::HQ:          return {2000, 24, 24, 35, 0, 2, 0,   0, 1.0f,  HeightTier::Ground};
        case EntityKind::Tower:       return {1000, 8,  24, 35, 0, 1, 0,   0, 1.0f,  HeightTier::Ground};
        case EntityKind::SupplyDepot: return {100,  0,  0,  24, 0, 0, 100, 0, 1.0f,  HeightTier::Ground};
        case EntityKind::Barracks:    return {500,  0,  0,  24, 0, 0, 300, 0, 1.0f,  HeightTier::Ground};
        case EntityKind::Beaver:      return {30,   4,  5,  24, 2, 2, 100, 2, 0.5f,  HeightTier::Ground};
        case EntityKind::Miner:       return {50,   3,  5,  24, 2, 2, 60,  2, 0.5f,  HeightTier::Ground};
        case EntityKind::Soldier:     return {40,   4,  8,  24, 2, 1, 60,  3, 0.5f,  HeightTier::Ground};
        case EntityKind::Drone:       return {70,   8,  10, 24, 1, 3, 125, 4, 0.5f,  HeightTier::Air};
        case EntityKind::Missile:     return {3,    18, 2,  24, 1, 0, 0,   0, 0.25f, HeightTier::Air};
        default:                      return {0,    0,  0,  0,  0, 0, 0,   0, 0.0f,  HeightTier::Ground};
    }
}

constexpr bool isStructure(EntityKind kind) noexcept {
    return kind <= EntityKind::Barracks;
}

constexpr bool isUnit(EntityKind kind) noexcept {
    return kind >= EntityKind::Beaver && kind <= EntityKind::Drone;
}

constexpr bool isProjectile(EntityKind kind) noexcept {
    return kind == EntityKind::Missile;
}

/// Missiles fly on their own velocity during round upkeep
constexpr bool canMove(EntityKind kind) noexcept {
    return stats(kind).movementDelay > 0 && !isProjectile(kind);
}

/// Missiles deal their damage by exploding, not through attack()
constexpr bool canAttack(EntityKind kind) noexcept {
    return stats(kind).attackPower > 0 && !isProjectile(kind);
}

constexpr bool canSpawn(EntityKind spawner, EntityKind child) noexcept {
    switch (spawner) {
        case EntityKind::HQ:
            return child == EntityKind::Beaver || child == EntityKind::Miner;
        case EntityKind::Barracks:
            return child == EntityKind::Soldier || child == EntityKind::Drone;
        default:
            return false;
    }
}

constexpr bool canBuild(EntityKind builder, EntityKind structure) noexcept {
    return builder == EntityKind::Beaver &&
           (structure == EntityKind::SupplyDepot || structure == EntityKind::Barracks);
}

constexpr bool canMine(EntityKind kind) noexcept {
    return kind == EntityKind::Beaver || kind == EntityKind::Miner;
}

constexpr bool canLaunch(EntityKind kind) noexcept {
    return kind == EntityKind::Drone;
}

constexpr bool canResearch(EntityKind kind) noexcept {
    return kind == EntityKind::HQ;
}

constexpr const char* kindToString(EntityKind kind) noexcept {
    switch (kind) {
        case EntityKind::HQ:          return "HQ";
        case EntityKind::Tower:       return "Tower";
        case EntityKind::SupplyDepot: return "SupplyDepot";
        case EntityKind::Barracks:    return "Barracks";
        case EntityKind::Beaver:      return "Beaver";
        case EntityKind::Miner:       return "Miner";
        case EntityKind::Soldier:     return "Soldier";
        case EntityKind::Drone:       return "Drone";
        case EntityKind::Missile:     return "Missile";
        default:                      return "Unknown";
    }
}

constexpr const char* teamToString(Team team) noexcept {
    switch (team) {
        case Team::A:       return "A";
        case Team::B:       return "B";
        case Team::NEUTRAL: return "NEUTRAL";
        default:            return "Unknown";
    }
}

constexpr Team opponent(Team team) noexcept {
    switch (team) {
        case Team::A: return Team::B;
        case Team::B: return Team::A;
        default:      return Team::NEUTRAL;
    }
}

/// Index into per-team arrays; only valid for A and B
constexpr size_t teamIndex(Team team) noexcept {
    return static_cast<size_t>(team);
}

inline std::optional<EntityKind> kindFromString(std::string_view name) {
    for (size_t i = 0; i < ENTITY_KIND_COUNT; ++i) {
        auto kind = static_cast<EntityKind>(i);
        if (name == kindToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

} // namespace EntityTraits

inline std::ostream& operator<<(std::ostream& os, EntityKind kind) {
    return os << EntityTraits::kindToString(kind);
}

inline std::ostream& operator<<(std::ostream& os, Team team) {
    return os << EntityTraits::teamToString(team);
}

inline std::ostream& operator<<(std::ostream& os, HeightTier tier) {
    return os << (tier == HeightTier::Air ? "Air" : "Ground");
}

} // namespace ArenaEngine

#endif // ENTITY_KIND_HPP
