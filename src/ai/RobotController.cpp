/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/RobotController.hpp"
#include "world/GameWorld.hpp"
#include <algorithm>
#include <exception>
#include <format>
#include <stdexcept>
#include <utility>

namespace ArenaEngine {

RobotController::RobotController(GameWorld& world, EntityID id, int32_t budget, SuspendHandler suspend)
    : m_world(world),
      m_id(id),
      m_budget(std::max(1, budget)),
      m_remaining(m_budget),
      m_suspend(std::move(suspend)) {}

void RobotController::beginTurn() {
    m_remaining = m_budget;
    m_used = 0;
}

void RobotController::interruptIfRetiring() const {
    if (!m_retiring) {
        return;
    }
    // Throwing while another exception unwinds would terminate the process
    if (++m_retireAttempts > MAX_RETIRE_ATTEMPTS || std::uncaught_exceptions() > 0) {
        m_suspend(SuspendReason::Abandoned);
    }
    throw ProgramRetired{};
}

void RobotController::charge(int32_t cost) {
    interruptIfRetiring();
    // A call dearer than a whole turn would otherwise never fit
    cost = std::min(cost, m_budget);
    if (cost > m_remaining) {
        m_suspend(SuspendReason::BudgetExhausted);
    }
    m_remaining -= cost;
    m_used += cost;
}

void RobotController::settle() {
    if (m_remaining == 0) {
        m_suspend(SuspendReason::BudgetExhausted);
    }
}

const EntityRecord& RobotController::self() const {
    interruptIfRetiring();
    const EntityRecord* record = m_world.getEntities().get(m_id);
    if (record == nullptr) {
        throw std::logic_error(std::format("robot {} is no longer alive", m_id));
    }
    return *record;
}

// ============================================================================
// OWN STATE
// ============================================================================

Team RobotController::getTeam() const { return self().team; }
EntityKind RobotController::getType() const { return self().kind; }
MapLocation RobotController::getLocation() const { return self().location; }
int32_t RobotController::getHealth() const { return self().health; }
int32_t RobotController::getRoundNum() const {
    interruptIfRetiring();
    return m_world.getRound();
}

int32_t RobotController::getRoundLimit() const {
    interruptIfRetiring();
    return m_world.getConfig().roundCap;
}

// ============================================================================
// GLOBAL QUERIES
// ============================================================================

double RobotController::getTeamOre() {
    return perform(OperationCost::GLOBAL_QUERY, [&] { return m_world.getTeamState(self().team).ore; });
}

bool RobotController::isCoreReady() {
    return perform(OperationCost::GLOBAL_QUERY, [&] { return self().turnsUntilMove == 0; });
}

bool RobotController::isWeaponReady() {
    return perform(OperationCost::GLOBAL_QUERY, [&] { return self().turnsUntilAttack == 0; });
}

bool RobotController::hasUpgrade(Upgrade upgrade) {
    return perform(OperationCost::GLOBAL_QUERY,
                   [&] { return m_world.getTeamState(self().team).hasUpgrade(upgrade); });
}

int32_t RobotController::getUpgradeProgress(Upgrade upgrade) {
    return perform(OperationCost::GLOBAL_QUERY,
                   [&] { return m_world.getTeamState(self().team).progressOf(upgrade); });
}

TerrainTile RobotController::senseTerrainTile(const MapLocation& location) {
    return perform(OperationCost::GLOBAL_QUERY, [&] { return m_world.senseTerrain(location); });
}

std::optional<MapLocation> RobotController::senseHQLocation() {
    return perform(OperationCost::GLOBAL_QUERY, [&] { return m_world.hqLocation(self().team); });
}

std::optional<MapLocation> RobotController::senseEnemyHQLocation() {
    return perform(OperationCost::GLOBAL_QUERY,
                   [&] { return m_world.hqLocation(EntityTraits::opponent(self().team)); });
}

int32_t RobotController::getSensorRadiusSquared() {
    return perform(OperationCost::GLOBAL_QUERY, [&] { return m_world.sensorRadiusSquared(m_id); });
}

bool RobotController::canSenseLocation(const MapLocation& location) {
    return perform(OperationCost::GLOBAL_QUERY, [&] {
        return self().location.distanceSquaredTo(location) <= m_world.sensorRadiusSquared(m_id);
    });
}

bool RobotController::canMove(Direction dir) {
    return perform(OperationCost::GLOBAL_QUERY, [&] {
        const EntityRecord& me = self();
        if (!EntityTraits::canMove(me.kind) || !DirectionUtils::isMovement(dir) || me.turnsUntilMove > 0) {
            return false;
        }
        const MapLocation target = me.location.add(dir);
        if (!m_world.getMap().onMap(target)) {
            return false;
        }
        if (me.tier == HeightTier::Ground && m_world.senseTerrain(target) == TerrainTile::VOID) {
            return false;
        }
        return !m_world.getEntities().entityAt(target, me.tier).has_value();
    });
}

// ============================================================================
// SENSING
// ============================================================================

std::vector<EntitySnapshot> RobotController::senseNearbyRobots(int32_t radiusSquared, std::optional<Team> team) {
    return perform(OperationCost::SENSE_NEARBY, [&] {
        const int32_t sensor = m_world.sensorRadiusSquared(m_id);
        const int32_t radius = (radiusSquared < 0 || radiusSquared > sensor) ? sensor : radiusSquared;
        auto result = m_world.senseNearby(self().location, radius, team);
        std::erase_if(result, [this](const EntitySnapshot& snapshot) { return snapshot.id == m_id; });
        return result;
    });
}

std::optional<EntitySnapshot> RobotController::senseRobotAtLocation(const MapLocation& location, HeightTier tier) {
    return perform(OperationCost::SENSE_LOCATION, [&]() -> std::optional<EntitySnapshot> {
        if (self().location.distanceSquaredTo(location) > m_world.sensorRadiusSquared(m_id)) {
            return std::nullopt;
        }
        return m_world.senseEntityAt(location, tier);
    });
}

std::optional<double> RobotController::senseOre(const MapLocation& location) {
    return perform(OperationCost::SENSE_LOCATION, [&]() -> std::optional<double> {
        if (self().location.distanceSquaredTo(location) > m_world.sensorRadiusSquared(m_id)) {
            return std::nullopt;
        }
        return m_world.senseOre(location);
    });
}

// ============================================================================
// ACTIONS
// ============================================================================

ActionError RobotController::move(Direction dir) {
    return perform(OperationCost::MOVE, [&] { return m_world.moveRobot(m_id, dir); });
}

ActionError RobotController::attackLocation(const MapLocation& location, HeightTier tier) {
    return perform(OperationCost::ATTACK, [&] { return m_world.attackLocation(m_id, location, tier); });
}

ActionError RobotController::spawn(Direction dir, EntityKind kind) {
    return perform(OperationCost::SPAWN, [&] { return m_world.spawnRobot(m_id, dir, kind); });
}

ActionError RobotController::build(Direction dir, EntityKind kind) {
    return perform(OperationCost::BUILD, [&] { return m_world.buildStructure(m_id, dir, kind); });
}

ActionError RobotController::mine() {
    return perform(OperationCost::MINE, [&] { return m_world.mine(m_id); });
}

ActionError RobotController::launchMissile(Direction dir) {
    return perform(OperationCost::LAUNCH, [&] { return m_world.launchMissile(m_id, dir); });
}

ActionError RobotController::researchUpgrade(Upgrade upgrade) {
    return perform(OperationCost::RESEARCH, [&] { return m_world.researchUpgrade(m_id, upgrade); });
}

ActionError RobotController::explode() {
    charge(OperationCost::EXPLODE);
    ActionError result = m_world.explode(m_id);
    if (result == ActionError::None) {
        m_suspend(SuspendReason::EndTurn);
    }
    settle();
    return result;
}

void RobotController::disintegrate() {
    interruptIfRetiring();
    ActionError result = m_world.disintegrate(m_id);
    if (result != ActionError::None) {
        throw std::logic_error(std::format("robot {} could not disintegrate: {}",
                                           m_id, actionErrorToString(result)));
    }
    m_suspend(SuspendReason::EndTurn);
}

// ============================================================================
// COMMUNICATION
// ============================================================================

ActionError RobotController::broadcast(int32_t channel, int32_t value) {
    return perform(OperationCost::BROADCAST, [&] { return m_world.broadcast(m_id, channel, value); });
}

ActionError RobotController::readBroadcast(int32_t channel, int32_t& out) {
    return perform(OperationCost::READ_BROADCAST, [&] { return m_world.readBroadcast(m_id, channel, out); });
}

// ============================================================================
// MATCH CONTROL AND DEBUG
// ============================================================================

void RobotController::yield() {
    interruptIfRetiring();
    m_suspend(SuspendReason::Yield);
}

void RobotController::resign() {
    m_world.resign(self().team);
}

ActionError RobotController::win() {
    return m_world.declareWinner(self().team);
}

void RobotController::breakpoint() {
    interruptIfRetiring();
    m_world.requestBreakpoint();
}

ActionError RobotController::setIndicatorString(int32_t index, const std::string& text) {
    return perform(OperationCost::INDICATOR, [&] { return m_world.setIndicatorString(m_id, index, text); });
}

ActionError RobotController::addMatchObservation(const std::string& observation) {
    return perform(OperationCost::INDICATOR, [&] { return m_world.addMatchObservation(m_id, observation); });
}

void RobotController::setTeamMemory(size_t index, int64_t value, int64_t mask) {
    perform(OperationCost::TEAM_MEMORY, [&] { m_world.setTeamMemory(self().team, index, value, mask); });
}

TeamMemory RobotController::getTeamMemory() {
    return perform(OperationCost::TEAM_MEMORY, [&] { return m_world.getTeamState(self().team).initialMemory; });
}

} // namespace ArenaEngine
