/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_WORLD_HPP
#define GAME_WORLD_HPP

/**
 * @file GameWorld.hpp
 * @brief Composition root and mutation surface of one match
 *
 * GameWorld owns the map, the Entity Model, the Signal Log, the Broadcast
 * Store and both teams' state. Every action follows the same shape:
 * validate every precondition, then apply the mutation, then append the
 * signal. A failed validation returns its ActionError and leaves all state
 * untouched.
 *
 * Actions take the acting entity's id. Rule checks that depend on the
 * caller's capabilities (sensor range, budget) live in RobotController.
 */

#include "core/ArenaErrors.hpp"
#include "core/MatchConfig.hpp"
#include "entities/Entity.hpp"
#include "events/SignalLog.hpp"
#include "managers/BroadcastStore.hpp"
#include "managers/EntityDataManager.hpp"
#include "world/GameMap.hpp"
#include "world/TeamState.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ArenaEngine {

class GameWorld {
public:
    /**
     * @param map Copied into the world
     * @param config Economy and debug switches; copied
     * @param carriedMemory Team memory left by the previous match, A then B
     */
    GameWorld(const GameMap& map, const MatchConfig& config,
              const std::array<TeamMemory, 2>& carriedMemory = {});

    GameWorld(const GameWorld&) = delete;
    GameWorld& operator=(const GameWorld&) = delete;

    // ========================================================================
    // COMPONENTS
    // ========================================================================

    const GameMap& getMap() const { return m_map; }
    const MatchConfig& getConfig() const { return m_config; }
    EntityDataManager& getEntities() { return m_entities; }
    const EntityDataManager& getEntities() const { return m_entities; }
    SignalLog& getSignalLog() { return m_signalLog; }
    BroadcastStore& getBroadcastStore() { return m_broadcasts; }
    const BroadcastStore& getBroadcastStore() const { return m_broadcasts; }
    const TeamState& getTeamState(Team team) const;

    /// Stamps signals appended from now on with this round index
    void beginRound(int32_t round);
    int32_t getRound() const { return m_round; }

    /**
     * @brief Places a starting entity without spending ore
     * @return Same failures as EntityDataManager::spawn
     */
    ActionError seedEntity(Team team, EntityKind kind, const MapLocation& location, EntityID& outId);

    // ========================================================================
    // ACTIONS
    // ========================================================================

    /**
     * @brief Moves a unit one tile
     * @return CantDoThat for kinds that cannot move, OnCooldown while
     *         turnsUntilMove > 0, OutOfBounds, CantMoveThere for void
     *         terrain on the ground tier, OccupiedLocation
     */
    ActionError moveRobot(EntityID id, Direction dir);

    /**
     * @brief Attacks a tile on one height tier
     *
     * Appends an AttackSignal even when the tile is empty. Lethal damage
     * removes the occupant and credits the attacker's team.
     */
    ActionError attackLocation(EntityID id, const MapLocation& target, HeightTier tier);

    ActionError spawnRobot(EntityID id, Direction dir, EntityKind kind, EntityID* outId = nullptr);
    ActionError buildStructure(EntityID id, Direction dir, EntityKind kind, EntityID* outId = nullptr);

    /// Drones only; the missile flies one tile per round in dir
    ActionError launchMissile(EntityID id, Direction dir, EntityID* outId = nullptr);

    /// Missiles only; damages everything within EXPLOSION_RADIUS_SQUARED
    ActionError explode(EntityID id);

    ActionError mine(EntityID id);
    ActionError researchUpgrade(EntityID id, Upgrade upgrade);

    ActionError broadcast(EntityID id, int32_t channel, int32_t value);
    ActionError readBroadcast(EntityID id, int32_t channel, int32_t& out) const;

    ActionError disintegrate(EntityID id);
    void resign(Team team);

    /// Debug victory; CantDoThat unless debug methods are enabled
    ActionError declareWinner(Team team);

    /// Asks the match to pause at the end of this round, if breakpoints are enabled
    void requestBreakpoint();
    bool consumeBreakpoint();

    ActionError setIndicatorString(EntityID id, int32_t index, const std::string& text);
    ActionError addMatchObservation(EntityID id, const std::string& observation);

    /**
     * @brief Writes the bits of value selected by mask into team memory
     * @throws std::out_of_range if index >= TEAM_MEMORY_LENGTH
     */
    void setTeamMemory(Team team, size_t index, int64_t value, int64_t mask = -1);

    /**
     * @brief Memory the team left at the end of the previous match
     * @throws std::out_of_range if index >= TEAM_MEMORY_LENGTH
     */
    int64_t getTeamMemory(Team team, size_t index) const;

    /// Appends TeamSilencedSignal the first time a team is silenced
    void signalTeamSilenced(Team team);

    // ========================================================================
    // SENSING
    // ========================================================================

    std::vector<EntitySnapshot> senseNearby(const MapLocation& center, int32_t radiusSquared,
                                            std::optional<Team> teamFilter = std::nullopt) const;
    std::optional<EntitySnapshot> senseEntityAt(const MapLocation& location, HeightTier tier) const;
    double senseOre(const MapLocation& location) const;
    TerrainTile senseTerrain(const MapLocation& location) const { return m_map.getTerrain(location); }
    std::optional<MapLocation> hqLocation(Team team) const { return m_map.getHQLocation(team); }

    /// Sensor radius² of an entity including the Vision bonus, 0 if unknown
    int32_t sensorRadiusSquared(EntityID id) const;

    // ========================================================================
    // ROUND END AND STANDINGS
    // ========================================================================

    /**
     * @brief Global upkeep at the end of a round
     *
     * In order: ore income for teams with a live HQ, unit upkeep, cooldown
     * decay, missile flight, broadcast commit, then a TeamResourceSignal for
     * each team whose ore changed since the last report.
     */
    void endRound();

    bool hasLiveHQ(Team team) const { return m_entities.count(team, EntityKind::HQ) > 0; }
    int32_t structureCount(Team team) const;
    int64_t aggregateHealth(Team team) const;

private:
    GameMap m_map;
    MatchConfig m_config;
    SignalLog m_signalLog;
    EntityDataManager m_entities;
    BroadcastStore m_broadcasts;
    std::array<TeamState, 2> m_teams{};
    std::vector<double> m_ore;  // mutable copy of the map's ore grid
    int32_t m_round{0};
    bool m_breakpointRequested{false};

    TeamState& teamState(Team team);
    ActionError createChild(EntityID parentId, Direction dir, EntityKind kind, bool building, EntityID* outId);
    void damageEntity(EntityID victimId, Team sourceTeam, int32_t damage);
    void detonate(EntityID missileId, DeathCause cause);
    void advanceMissiles();
    size_t oreIndex(const MapLocation& location) const;
};

} // namespace ArenaEngine

#endif // GAME_WORLD_HPP
