/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include "entities/EntityKind.hpp"
#include "utils/MapLocation.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>

namespace ArenaEngine {

using EntityID = int32_t;

inline constexpr EntityID INVALID_ENTITY_ID = -1;

/**
 * @brief Authoritative state of one entity, owned by EntityDataManager
 *
 * location is only ever written by EntityDataManager::move so that the
 * occupancy index and spatial hash stay in step with it.
 */
struct EntityRecord {
    EntityID id{INVALID_ENTITY_ID};
    Team team{Team::NEUTRAL};
    EntityKind kind{EntityKind::Beaver};
    HeightTier tier{HeightTier::Ground};
    MapLocation location;
    int32_t health{0};
    int32_t turnsUntilMove{0};
    int32_t turnsUntilAttack{0};
    int32_t roundsAlive{0};
    Vector2D velocity;  // Missiles only
    bool alive{true};
};

/**
 * @brief Read-only copy of an entity handed to sensing and observers
 */
struct EntitySnapshot {
    EntityID id{INVALID_ENTITY_ID};
    Team team{Team::NEUTRAL};
    EntityKind kind{EntityKind::Beaver};
    HeightTier tier{HeightTier::Ground};
    MapLocation location;
    int32_t health{0};
    int32_t turnsUntilMove{0};
    int32_t turnsUntilAttack{0};

    static EntitySnapshot fromRecord(const EntityRecord& record) {
        return EntitySnapshot{record.id, record.team, record.kind, record.tier,
                              record.location, record.health,
                              record.turnsUntilMove, record.turnsUntilAttack};
    }
};

} // namespace ArenaEngine

#endif // ENTITY_HPP
