/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROBOT_CONTROLLER_HPP
#define ROBOT_CONTROLLER_HPP

/**
 * @file RobotController.hpp
 * @brief Capability surface a RobotPlayer uses to observe and act
 *
 * Each call charges its OperationCost against the robot's per-round budget
 * before it runs. When the charge does not fit in what is left, the robot is
 * suspended first and the call completes at the start of its next turn. When a
 * call leaves the budget at exactly zero the robot is suspended right after it.
 *
 * Sensing is limited to the robot's sensor radius (plus the Vision bonus).
 * Terrain, HQ locations and the robot's own state are global knowledge.
 */

#include "core/ArenaErrors.hpp"
#include "core/GameConstants.hpp"
#include "entities/Entity.hpp"
#include "utils/MapLocation.hpp"
#include "world/GameMap.hpp"
#include "world/TeamState.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace ArenaEngine {

class GameWorld;

/// Why a robot's execution context gave control back to the scheduler
enum class SuspendReason : uint8_t {
    Yield = 0,            // yield() called
    BudgetExhausted = 1,  // operation budget used up
    EndTurn = 2,          // the robot removed itself (explode, disintegrate)
    Abandoned = 3         // the robot would not unwind; never resumed again
};

/**
 * Thrown out of every controller call once the robot's program is being
 * released. It is not a std::exception, so handlers for std::exception do
 * not stop it on its way out of RobotPlayer::run().
 */
struct ProgramRetired {};

class RobotController {
public:
    using SuspendHandler = std::function<void(SuspendReason)>;

    /**
     * @param world World the robot acts on
     * @param id Entity this controller drives
     * @param budget Operations available per turn
     * @param suspend Switches back to the scheduler; returns when resumed
     */
    RobotController(GameWorld& world, EntityID id, int32_t budget, SuspendHandler suspend);

    RobotController(const RobotController&) = delete;
    RobotController& operator=(const RobotController&) = delete;

    // ========================================================================
    // SCHEDULER SIDE
    // ========================================================================

    /// Refills the budget at the start of a turn
    void beginTurn();

    /// From here on every call throws ProgramRetired
    void beginRetirement() { m_retiring = true; }
    bool isRetiring() const { return m_retiring; }
    int32_t getOperationsUsed() const { return m_used; }

    // ========================================================================
    // OWN STATE (free)
    // ========================================================================

    EntityID getID() const { return m_id; }
    Team getTeam() const;
    EntityKind getType() const;
    MapLocation getLocation() const;
    int32_t getHealth() const;
    int32_t getRoundNum() const;
    int32_t getRoundLimit() const;
    int32_t getOperationsLeft() const { return m_remaining; }
    int32_t getOperationBudget() const { return m_budget; }

    // ========================================================================
    // GLOBAL QUERIES
    // ========================================================================

    double getTeamOre();
    bool isCoreReady();
    bool isWeaponReady();
    bool hasUpgrade(Upgrade upgrade);
    int32_t getUpgradeProgress(Upgrade upgrade);
    TerrainTile senseTerrainTile(const MapLocation& location);
    std::optional<MapLocation> senseHQLocation();
    std::optional<MapLocation> senseEnemyHQLocation();
    int32_t getSensorRadiusSquared();
    bool canSenseLocation(const MapLocation& location);

    /// True if move(dir) would succeed now
    bool canMove(Direction dir);

    // ========================================================================
    // SENSING
    // ========================================================================

    /**
     * @brief Entities within radiusSquared of this robot, ordered by id
     *
     * A negative radius, or one larger than the sensor radius, is clamped to
     * the sensor radius. The caller itself is not included.
     */
    std::vector<EntitySnapshot> senseNearbyRobots(int32_t radiusSquared = -1,
                                                  std::optional<Team> team = std::nullopt);

    /// nullopt if the tile is empty or outside sensor range
    std::optional<EntitySnapshot> senseRobotAtLocation(const MapLocation& location,
                                                       HeightTier tier = HeightTier::Ground);

    /// Ore left on a tile, nullopt outside sensor range
    std::optional<double> senseOre(const MapLocation& location);

    // ========================================================================
    // ACTIONS
    // ========================================================================

    ActionError move(Direction dir);
    ActionError attackLocation(const MapLocation& location, HeightTier tier = HeightTier::Ground);
    ActionError spawn(Direction dir, EntityKind kind);
    ActionError build(Direction dir, EntityKind kind);
    ActionError mine();
    ActionError launchMissile(Direction dir);
    ActionError researchUpgrade(Upgrade upgrade);

    /// Missiles only. On success the turn ends and never resumes
    ActionError explode();

    /// Removes this robot; the call does not return
    void disintegrate();

    // ========================================================================
    // COMMUNICATION
    // ========================================================================

    ActionError broadcast(int32_t channel, int32_t value);
    ActionError readBroadcast(int32_t channel, int32_t& out);

    // ========================================================================
    // MATCH CONTROL AND DEBUG
    // ========================================================================

    void yield();
    void resign();
    ActionError win();
    void breakpoint();
    ActionError setIndicatorString(int32_t index, const std::string& text);
    ActionError addMatchObservation(const std::string& observation);

    /// @throws std::out_of_range for index >= TEAM_MEMORY_LENGTH
    void setTeamMemory(size_t index, int64_t value, int64_t mask = -1);

    /// Memory the team carried in from the previous match
    TeamMemory getTeamMemory();

private:
    GameWorld& m_world;
    EntityID m_id;
    int32_t m_budget;
    int32_t m_remaining;
    int32_t m_used{0};
    SuspendHandler m_suspend;
    bool m_retiring{false};
    mutable int32_t m_retireAttempts{0};

    // Calls a retiring robot may swallow before it is abandoned
    static constexpr int32_t MAX_RETIRE_ATTEMPTS = 8;

    void interruptIfRetiring() const;
    void charge(int32_t cost);
    void settle();
    const EntityRecord& self() const;

    template <typename Fn>
    auto perform(int32_t cost, Fn&& fn) {
        charge(cost);
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            settle();
        } else {
            auto result = fn();
            settle();
            return result;
        }
    }
};

} // namespace ArenaEngine

#endif // ROBOT_CONTROLLER_HPP
