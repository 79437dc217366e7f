/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_DATA_MANAGER_HPP
#define ENTITY_DATA_MANAGER_HPP

/**
 * @file EntityDataManager.hpp
 * @brief Central data authority for every entity in a match
 *
 * EntityDataManager is a pure DATA STORE, not a processor. It owns:
 * - All entity records (team, kind, location, tier, health, cooldowns)
 * - The (location, tier) occupancy index
 * - The spatial hash used by area queries
 * - Per-team, per-kind live counts
 *
 * It is the only place that mints EntityIDs and the only place that writes
 * an entity's location. Rule checks (cooldowns, costs, ranges) live one
 * layer up in GameWorld.
 *
 * Every structural change appends exactly one signal to the SignalLog the
 * manager was constructed with: spawn -> SpawnSignal, remove -> DeathSignal,
 * move -> MoveSignal. Damage and cooldown writes are silent; the World
 * action that caused them appends the signal.
 *
 * THREADING CONTRACT:
 * - Not thread-safe. The turn scheduler serializes every caller.
 */

#include "collisions/SpatialHash.hpp"
#include "core/ArenaErrors.hpp"
#include "entities/Entity.hpp"
#include "events/Signal.hpp"
#include "world/Region.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace ArenaEngine {

class GameMap;
class SignalLog;

class EntityDataManager {
public:
    /**
     * @param map Supplies the bounds for spawn and move; must outlive the manager
     * @param signalLog Receives spawn, move and death signals
     */
    EntityDataManager(const GameMap& map, SignalLog& signalLog);

    EntityDataManager(const EntityDataManager&) = delete;
    EntityDataManager& operator=(const EntityDataManager&) = delete;

    // ========================================================================
    // STRUCTURAL OPERATIONS
    // ========================================================================

    /**
     * @brief Creates an entity and indexes it
     * @param outId Receives the new id on success, INVALID_ENTITY_ID otherwise
     * @param parentId Spawner recorded in the signal, INVALID_ENTITY_ID for map seeds
     * @param velocity Initial velocity, only meaningful for projectiles
     * @return OutOfBounds if off the map, OccupiedLocation if (location, tier) is taken
     */
    ActionError spawn(Team team, EntityKind kind, const MapLocation& location,
                      HeightTier tier, EntityID& outId,
                      EntityID parentId = INVALID_ENTITY_ID,
                      const Vector2D& velocity = Vector2D());

    /**
     * @brief Removes an entity from storage and every index
     *
     * Idempotent: removing an id that already died is a silent no-op.
     * @return UnknownEntity only for ids that were never minted
     */
    ActionError remove(EntityID id, DeathCause cause = DeathCause::Destroyed);

    /**
     * @brief Relocates a live entity, keeping its tier
     * @return UnknownEntity, OutOfBounds or OccupiedLocation on failure
     */
    ActionError move(EntityID id, const MapLocation& newLocation);

    /**
     * @brief Snapshots of live entities inside a region
     * @return Ordered by ascending id
     */
    std::vector<EntitySnapshot> query(const Region& region,
                                      std::optional<Team> teamFilter = std::nullopt,
                                      std::optional<EntityKind> kindFilter = std::nullopt) const;

    // ========================================================================
    // ACCESSORS
    // ========================================================================

    /// nullptr for unknown or dead ids
    const EntityRecord* get(EntityID id) const;
    std::optional<EntitySnapshot> snapshot(EntityID id) const;

    bool isAlive(EntityID id) const;
    bool wasMinted(EntityID id) const { return id >= 0 && id < m_nextId; }

    std::optional<EntityID> entityAt(const MapLocation& location, HeightTier tier) const;

    /// Ascending ids of every live entity
    std::vector<EntityID> liveIds() const;

    int32_t count(Team team, EntityKind kind) const;
    int32_t countTeam(Team team) const;
    size_t size() const { return m_entities.size(); }
    EntityID peekNextId() const { return m_nextId; }

    // ========================================================================
    // STATE WRITES (no signal, caller emits)
    // ========================================================================

    /**
     * @brief Subtracts health, clamped at zero
     * @return Remaining health, 0 for unknown or dead ids
     */
    int32_t applyDamage(EntityID id, int32_t damage);

    void setTurnsUntilMove(EntityID id, int32_t turns);
    void setTurnsUntilAttack(EntityID id, int32_t turns);

    /**
     * @brief End-of-round bookkeeping for every live entity
     *
     * Decrements both cooldowns by one, clamped at zero, and ages the entity.
     */
    void tickRound();

    void clear();

private:
    struct OccupancyKey {
        MapLocation location;
        HeightTier tier;

        bool operator==(const OccupancyKey& other) const {
            return location == other.location && tier == other.tier;
        }
    };
    struct OccupancyKeyHash {
        size_t operator()(const OccupancyKey& key) const noexcept {
            return MapLocationHash{}(key.location) * 2 + static_cast<size_t>(key.tier);
        }
    };

    const GameMap& m_map;
    SignalLog& m_signalLog;

    EntityID m_nextId{0};
    std::map<EntityID, EntityRecord> m_entities;
    std::unordered_map<OccupancyKey, EntityID, OccupancyKeyHash> m_occupancy;
    SpatialHash m_spatialHash;

    // [team][kind]
    std::array<std::array<int32_t, ENTITY_KIND_COUNT>, 3> m_counts{};

    EntityRecord* find(EntityID id);
    void adjustCount(Team team, EntityKind kind, int32_t delta);
};

} // namespace ArenaEngine

#endif // ENTITY_DATA_MANAGER_HPP
