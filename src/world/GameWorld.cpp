/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/GameWorld.hpp"
#include "core/Logger.hpp"
#include "world/Region.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace ArenaEngine {

GameWorld::GameWorld(const GameMap& map, const MatchConfig& config,
                     const std::array<TeamMemory, 2>& carriedMemory)
    : m_map(map),
      m_config(config),
      m_entities(m_map, m_signalLog) {
    for (Team team : {Team::A, Team::B}) {
        TeamState& state = teamState(team);
        state.ore = m_config.startingOre;
        state.oreAtLastReport = m_config.startingOre;
        state.initialMemory = carriedMemory[EntityTraits::teamIndex(team)];
        state.memory = state.initialMemory;
    }

    const size_t tiles = static_cast<size_t>(std::max(0, m_map.getWidth())) *
                         static_cast<size_t>(std::max(0, m_map.getHeight()));
    m_ore.assign(tiles, 0.0);
    for (int32_t y = 0; y < m_map.getHeight(); ++y) {
        for (int32_t x = 0; x < m_map.getWidth(); ++x) {
            const MapLocation loc(x, y);
            m_ore[oreIndex(loc)] = m_map.getInitialOre(loc);
        }
    }
}

const TeamState& GameWorld::getTeamState(Team team) const {
    static const TeamState neutral;
    if (team == Team::NEUTRAL) {
        return neutral;
    }
    return m_teams[EntityTraits::teamIndex(team)];
}

TeamState& GameWorld::teamState(Team team) {
    return m_teams[EntityTraits::teamIndex(team)];
}

size_t GameWorld::oreIndex(const MapLocation& location) const {
    return static_cast<size_t>(location.y) * static_cast<size_t>(m_map.getWidth()) +
           static_cast<size_t>(location.x);
}

void GameWorld::beginRound(int32_t round) {
    m_round = round;
    m_signalLog.setRound(round);
}

ActionError GameWorld::seedEntity(Team team, EntityKind kind, const MapLocation& location, EntityID& outId) {
    return m_entities.spawn(team, kind, location, EntityTraits::stats(kind).tier, outId);
}

// ============================================================================
// ACTIONS
// ============================================================================

ActionError GameWorld::moveRobot(EntityID id, Direction dir) {
    const EntityRecord* robot = m_entities.get(id);
    if (robot == nullptr) {
        return ActionError::UnknownEntity;
    }
    if (!EntityTraits::canMove(robot->kind) || !DirectionUtils::isMovement(dir)) {
        return ActionError::CantDoThat;
    }
    if (robot->turnsUntilMove > 0) {
        return ActionError::OnCooldown;
    }

    const MapLocation target = robot->location.add(dir);
    if (!m_map.onMap(target)) {
        return ActionError::OutOfBounds;
    }
    if (robot->tier == HeightTier::Ground && m_map.getTerrain(target) == TerrainTile::VOID) {
        return ActionError::CantMoveThere;
    }
    if (m_entities.entityAt(target, robot->tier)) {
        return ActionError::OccupiedLocation;
    }

    const int32_t delay = EntityTraits::stats(robot->kind).movementDelay;
    ActionError result = m_entities.move(id, target);
    if (result == ActionError::None) {
        m_entities.setTurnsUntilMove(id, delay);
    }
    return result;
}

ActionError GameWorld::attackLocation(EntityID id, const MapLocation& target, HeightTier tier) {
    const EntityRecord* attacker = m_entities.get(id);
    if (attacker == nullptr) {
        return ActionError::UnknownEntity;
    }
    if (!EntityTraits::canAttack(attacker->kind)) {
        return ActionError::CantDoThat;
    }
    if (attacker->turnsUntilAttack > 0) {
        return ActionError::OnCooldown;
    }
    if (!m_map.onMap(target)) {
        return ActionError::OutOfBounds;
    }
    // A robot cannot target the tile and tier it stands on
    if (target == attacker->location && tier == attacker->tier) {
        return ActionError::CantDoThat;
    }
    const KindStats stats = EntityTraits::stats(attacker->kind);
    if (attacker->location.distanceSquaredTo(target) > stats.attackRadiusSquared) {
        return ActionError::OutOfRange;
    }

    const Team attackerTeam = attacker->team;
    m_entities.setTurnsUntilAttack(id, stats.attackDelay);

    const auto victimId = m_entities.entityAt(target, tier);
    m_signalLog.emit(AttackSignal{id, target, tier,
                                  victimId.value_or(INVALID_ENTITY_ID),
                                  victimId ? stats.attackPower : 0});
    if (victimId) {
        damageEntity(*victimId, attackerTeam, stats.attackPower);
    }
    return ActionError::None;
}

void GameWorld::damageEntity(EntityID victimId, Team sourceTeam, int32_t damage) {
    const EntityRecord* victim = m_entities.get(victimId);
    if (victim == nullptr) {
        return;
    }
    const Team victimTeam = victim->team;
    const EntityKind victimKind = victim->kind;

    if (m_entities.applyDamage(victimId, damage) > 0) {
        return;
    }

    if (sourceTeam != Team::NEUTRAL && victimTeam == EntityTraits::opponent(sourceTeam)) {
        teamState(sourceTeam).capturedScore += EntityTraits::stats(victimKind).oreCost;
    }
    ActionError removed = m_entities.remove(victimId, DeathCause::Destroyed);
    if (removed != ActionError::None) {
        WORLD_ERROR(std::format("Failed to remove destroyed entity {}: {}", victimId, actionErrorToString(removed)));
    }
}

ActionError GameWorld::spawnRobot(EntityID id, Direction dir, EntityKind kind, EntityID* outId) {
    return createChild(id, dir, kind, false, outId);
}

ActionError GameWorld::buildStructure(EntityID id, Direction dir, EntityKind kind, EntityID* outId) {
    return createChild(id, dir, kind, true, outId);
}

ActionError GameWorld::createChild(EntityID parentId, Direction dir, EntityKind kind, bool building, EntityID* outId) {
    if (outId != nullptr) {
        *outId = INVALID_ENTITY_ID;
    }

    const EntityRecord* parent = m_entities.get(parentId);
    if (parent == nullptr) {
        return ActionError::UnknownEntity;
    }
    const bool allowed = building ? EntityTraits::canBuild(parent->kind, kind)
                                  : EntityTraits::canSpawn(parent->kind, kind);
    if (!allowed || !DirectionUtils::isMovement(dir)) {
        return ActionError::CantDoThat;
    }
    if (parent->turnsUntilMove > 0) {
        return ActionError::OnCooldown;
    }

    const KindStats childStats = EntityTraits::stats(kind);
    TeamState& team = teamState(parent->team);
    if (team.ore < childStats.oreCost) {
        return ActionError::InsufficientResource;
    }

    const MapLocation target = parent->location.add(dir);
    if (!m_map.onMap(target)) {
        return ActionError::OutOfBounds;
    }
    if (childStats.tier == HeightTier::Ground && m_map.getTerrain(target) == TerrainTile::VOID) {
        return ActionError::CantMoveThere;
    }
    if (m_entities.entityAt(target, childStats.tier)) {
        return ActionError::OccupiedLocation;
    }

    EntityID childId = INVALID_ENTITY_ID;
    ActionError result = m_entities.spawn(parent->team, kind, target, childStats.tier, childId, parentId);
    if (result != ActionError::None) {
        return result;
    }

    team.ore -= childStats.oreCost;
    m_entities.setTurnsUntilMove(parentId, GameConstants::SPAWN_COOLDOWN);
    if (outId != nullptr) {
        *outId = childId;
    }
    return ActionError::None;
}

ActionError GameWorld::launchMissile(EntityID id, Direction dir, EntityID* outId) {
    if (outId != nullptr) {
        *outId = INVALID_ENTITY_ID;
    }

    const EntityRecord* drone = m_entities.get(id);
    if (drone == nullptr) {
        return ActionError::UnknownEntity;
    }
    if (!EntityTraits::canLaunch(drone->kind) || !DirectionUtils::isMovement(dir)) {
        return ActionError::CantDoThat;
    }
    if (drone->turnsUntilAttack > 0) {
        return ActionError::OnCooldown;
    }

    const MapLocation target = drone->location.add(dir);
    if (!m_map.onMap(target)) {
        return ActionError::OutOfBounds;
    }
    if (m_entities.entityAt(target, HeightTier::Air)) {
        return ActionError::OccupiedLocation;
    }

    const Vector2D velocity(static_cast<float>(DirectionUtils::dx(dir)),
                            static_cast<float>(DirectionUtils::dy(dir)));
    EntityID missileId = INVALID_ENTITY_ID;
    ActionError result = m_entities.spawn(drone->team, EntityKind::Missile, target, HeightTier::Air,
                                          missileId, id, velocity);
    if (result != ActionError::None) {
        return result;
    }

    m_entities.setTurnsUntilAttack(id, EntityTraits::stats(EntityKind::Drone).attackDelay);
    if (outId != nullptr) {
        *outId = missileId;
    }
    return ActionError::None;
}

ActionError GameWorld::explode(EntityID id) {
    const EntityRecord* missile = m_entities.get(id);
    if (missile == nullptr) {
        return ActionError::UnknownEntity;
    }
    if (!EntityTraits::isProjectile(missile->kind)) {
        return ActionError::CantDoThat;
    }
    detonate(id, DeathCause::Exploded);
    return ActionError::None;
}

void GameWorld::detonate(EntityID missileId, DeathCause cause) {
    const EntityRecord* missile = m_entities.get(missileId);
    if (missile == nullptr) {
        return;
    }
    const Team team = missile->team;
    const MapLocation center = missile->location;
    const int32_t damage = EntityTraits::stats(missile->kind).attackPower;

    auto victims = m_entities.query(Region::circle(center, GameConstants::EXPLOSION_RADIUS_SQUARED));
    for (const auto& victim : victims) {
        if (victim.id == missileId) {
            continue;
        }
        m_signalLog.emit(AttackSignal{missileId, victim.location, victim.tier, victim.id, damage});
        damageEntity(victim.id, team, damage);
    }

    ActionError removed = m_entities.remove(missileId, cause);
    if (removed != ActionError::None) {
        WORLD_ERROR(std::format("Failed to remove missile {}: {}", missileId, actionErrorToString(removed)));
    }
}

ActionError GameWorld::mine(EntityID id) {
    const EntityRecord* miner = m_entities.get(id);
    if (miner == nullptr) {
        return ActionError::UnknownEntity;
    }
    if (!EntityTraits::canMine(miner->kind)) {
        return ActionError::CantDoThat;
    }
    if (miner->turnsUntilMove > 0) {
        return ActionError::OnCooldown;
    }

    const MapLocation location = miner->location;
    double& tileOre = m_ore[oreIndex(location)];
    if (tileOre <= 0.0) {
        return ActionError::InsufficientResource;
    }

    TeamState& team = teamState(miner->team);
    const double rate = team.hasUpgrade(Upgrade::Pickaxe) ? GameConstants::MINE_RATE * 2.0
                                                          : GameConstants::MINE_RATE;
    const double amount = std::min(tileOre, rate);
    tileOre -= amount;
    team.ore += amount;
    m_entities.setTurnsUntilMove(id, EntityTraits::stats(miner->kind).movementDelay);

    m_signalLog.emit(MineSignal{id, location, amount});
    return ActionError::None;
}

ActionError GameWorld::researchUpgrade(EntityID id, Upgrade upgrade) {
    const EntityRecord* hq = m_entities.get(id);
    if (hq == nullptr) {
        return ActionError::UnknownEntity;
    }
    if (!EntityTraits::canResearch(hq->kind) || upgrade >= Upgrade::COUNT) {
        return ActionError::CantDoThat;
    }
    if (hq->turnsUntilMove > 0) {
        return ActionError::OnCooldown;
    }

    TeamState& team = teamState(hq->team);
    if (team.hasUpgrade(upgrade)) {
        return ActionError::CantDoThat;
    }

    int32_t& progress = team.researchProgress[static_cast<size_t>(upgrade)];
    ++progress;
    m_entities.setTurnsUntilMove(id, GameConstants::SPAWN_COOLDOWN);

    const bool completed = team.hasUpgrade(upgrade);
    m_signalLog.emit(ResearchSignal{hq->team, upgrade, progress, completed});
    if (completed) {
        WORLD_INFO(std::format("Team {} completed {}", EntityTraits::teamToString(hq->team),
                               UpgradeTraits::toString(upgrade)));
    }
    return ActionError::None;
}

ActionError GameWorld::broadcast(EntityID id, int32_t channel, int32_t value) {
    const EntityRecord* robot = m_entities.get(id);
    if (robot == nullptr) {
        return ActionError::UnknownEntity;
    }
    return m_broadcasts.write(robot->team, channel, value);
}

ActionError GameWorld::readBroadcast(EntityID id, int32_t channel, int32_t& out) const {
    const EntityRecord* robot = m_entities.get(id);
    if (robot == nullptr) {
        return ActionError::UnknownEntity;
    }
    return m_broadcasts.read(robot->team, channel, out);
}

ActionError GameWorld::disintegrate(EntityID id) {
    return m_entities.remove(id, DeathCause::Disintegrated);
}

void GameWorld::resign(Team team) {
    if (team == Team::NEUTRAL || teamState(team).resigned) {
        return;
    }
    teamState(team).resigned = true;
    m_signalLog.emit(ResignSignal{team});
    WORLD_INFO(std::format("Team {} resigned", EntityTraits::teamToString(team)));
}

ActionError GameWorld::declareWinner(Team team) {
    if (!m_config.debugMethodsEnabled || team == Team::NEUTRAL) {
        return ActionError::CantDoThat;
    }
    teamState(team).declaredWinner = true;
    return ActionError::None;
}

void GameWorld::requestBreakpoint() {
    if (m_config.breakpointsEnabled) {
        m_breakpointRequested = true;
    }
}

bool GameWorld::consumeBreakpoint() {
    const bool requested = m_breakpointRequested;
    m_breakpointRequested = false;
    return requested;
}

ActionError GameWorld::setIndicatorString(EntityID id, int32_t index, const std::string& text) {
    if (!m_entities.isAlive(id)) {
        return ActionError::UnknownEntity;
    }
    if (index < 0 || index >= static_cast<int32_t>(GameConstants::INDICATOR_STRING_COUNT)) {
        return ActionError::CantDoThat;
    }
    m_signalLog.emit(IndicatorStringSignal{id, index, text});
    return ActionError::None;
}

ActionError GameWorld::addMatchObservation(EntityID id, const std::string& observation) {
    if (!m_entities.isAlive(id)) {
        return ActionError::UnknownEntity;
    }
    m_signalLog.emit(MatchObservationSignal{id, observation});
    return ActionError::None;
}

void GameWorld::setTeamMemory(Team team, size_t index, int64_t value, int64_t mask) {
    if (team == Team::NEUTRAL || index >= GameConstants::TEAM_MEMORY_LENGTH) {
        throw std::out_of_range(std::format("team memory index {} outside [0, {})",
                                            index, GameConstants::TEAM_MEMORY_LENGTH));
    }
    int64_t& slot = teamState(team).memory[index];
    slot = (slot & ~mask) | (value & mask);
}

int64_t GameWorld::getTeamMemory(Team team, size_t index) const {
    if (team == Team::NEUTRAL || index >= GameConstants::TEAM_MEMORY_LENGTH) {
        throw std::out_of_range(std::format("team memory index {} outside [0, {})",
                                            index, GameConstants::TEAM_MEMORY_LENGTH));
    }
    return getTeamState(team).initialMemory[index];
}

void GameWorld::signalTeamSilenced(Team team) {
    if (team == Team::NEUTRAL || teamState(team).silenced) {
        return;
    }
    teamState(team).silenced = true;
    m_signalLog.emit(TeamSilencedSignal{team});
}

// ============================================================================
// SENSING
// ============================================================================

std::vector<EntitySnapshot> GameWorld::senseNearby(const MapLocation& center, int32_t radiusSquared,
                                                   std::optional<Team> teamFilter) const {
    return m_entities.query(Region::circle(center, radiusSquared), teamFilter);
}

std::optional<EntitySnapshot> GameWorld::senseEntityAt(const MapLocation& location, HeightTier tier) const {
    auto id = m_entities.entityAt(location, tier);
    if (!id) {
        return std::nullopt;
    }
    return m_entities.snapshot(*id);
}

double GameWorld::senseOre(const MapLocation& location) const {
    if (!m_map.onMap(location)) {
        return 0.0;
    }
    return m_ore[oreIndex(location)];
}

int32_t GameWorld::sensorRadiusSquared(EntityID id) const {
    const EntityRecord* record = m_entities.get(id);
    if (record == nullptr) {
        return 0;
    }
    int32_t radius = EntityTraits::stats(record->kind).sensorRadiusSquared;
    if (getTeamState(record->team).hasUpgrade(Upgrade::Vision)) {
        radius += GameConstants::VISION_SENSOR_BONUS;
    }
    return radius;
}

// ============================================================================
// ROUND END
// ============================================================================

void GameWorld::endRound() {
    for (Team team : {Team::A, Team::B}) {
        TeamState& state = teamState(team);
        if (hasLiveHQ(team)) {
            state.ore += m_config.oreIncome;
        }
        if (m_config.upkeepEnabled) {
            double upkeep = 0.0;
            for (size_t k = 0; k < ENTITY_KIND_COUNT; ++k) {
                const auto kind = static_cast<EntityKind>(k);
                upkeep += static_cast<double>(m_entities.count(team, kind)) *
                          EntityTraits::stats(kind).upkeep;
            }
            state.ore = std::max(0.0, state.ore - upkeep);
        }
    }

    m_entities.tickRound();
    advanceMissiles();
    m_broadcasts.commit(m_signalLog);

    for (Team team : {Team::A, Team::B}) {
        TeamState& state = teamState(team);
        if (state.ore != state.oreAtLastReport) {
            state.oreAtLastReport = state.ore;
            m_signalLog.emit(TeamResourceSignal{team, state.ore});
        }
    }
}

void GameWorld::advanceMissiles() {
    std::vector<EntityID> missiles;
    for (EntityID id : m_entities.liveIds()) {
        const EntityRecord* record = m_entities.get(id);
        if (record != nullptr && EntityTraits::isProjectile(record->kind)) {
            missiles.push_back(id);
        }
    }

    for (EntityID id : missiles) {
        // An earlier explosion this pass may have destroyed it
        const EntityRecord* missile = m_entities.get(id);
        if (missile == nullptr) {
            continue;
        }
        if (missile->roundsAlive > GameConstants::MISSILE_LIFESPAN) {
            detonate(id, DeathCause::Expired);
            continue;
        }

        const MapLocation next(missile->location.x + static_cast<int32_t>(std::lround(missile->velocity.getX())),
                               missile->location.y + static_cast<int32_t>(std::lround(missile->velocity.getY())));
        if (next == missile->location) {
            continue;
        }
        if (!m_map.onMap(next) || m_entities.entityAt(next, HeightTier::Air)) {
            detonate(id, DeathCause::Exploded);
            continue;
        }

        ActionError moved = m_entities.move(id, next);
        if (moved != ActionError::None) {
            WORLD_WARN(std::format("Missile {} could not advance: {}", id, actionErrorToString(moved)));
        }
    }
}

int32_t GameWorld::structureCount(Team team) const {
    int32_t total = 0;
    for (EntityKind kind : {EntityKind::HQ, EntityKind::Tower, EntityKind::SupplyDepot, EntityKind::Barracks}) {
        total += m_entities.count(team, kind);
    }
    return total;
}

int64_t GameWorld::aggregateHealth(Team team) const {
    int64_t total = 0;
    for (EntityID id : m_entities.liveIds()) {
        const EntityRecord* record = m_entities.get(id);
        if (record != nullptr && record->team == team) {
            total += record->health;
        }
    }
    return total;
}

} // namespace ArenaEngine
