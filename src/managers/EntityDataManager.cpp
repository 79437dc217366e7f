/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EntityDataManager.hpp"
#include "core/Logger.hpp"
#include "events/SignalLog.hpp"
#include "world/GameMap.hpp"
#include <algorithm>
#include <format>

namespace ArenaEngine {

EntityDataManager::EntityDataManager(const GameMap& map, SignalLog& signalLog)
    : m_map(map), m_signalLog(signalLog) {}

ActionError EntityDataManager::spawn(Team team, EntityKind kind, const MapLocation& location,
                                     HeightTier tier, EntityID& outId,
                                     EntityID parentId, const Vector2D& velocity) {
    outId = INVALID_ENTITY_ID;

    if (!m_map.onMap(location)) {
        return ActionError::OutOfBounds;
    }
    if (m_occupancy.find(OccupancyKey{location, tier}) != m_occupancy.end()) {
        return ActionError::OccupiedLocation;
    }

    const KindStats stats = EntityTraits::stats(kind);

    EntityRecord record;
    record.id = m_nextId++;
    record.team = team;
    record.kind = kind;
    record.tier = tier;
    record.location = location;
    record.health = stats.maxHealth;
    record.velocity = velocity;
    record.alive = true;

    m_occupancy.emplace(OccupancyKey{location, tier}, record.id);
    m_spatialHash.insert(record.id, location);
    adjustCount(team, kind, 1);
    m_entities.emplace(record.id, record);

    m_signalLog.emit(SpawnSignal{record.id, parentId, team, kind, tier, location,
                                 velocity, record.health});

    ENTITY_DEBUG(std::format("Spawned {} {} for team {} at ({}, {})",
                             EntityTraits::kindToString(kind), record.id,
                             EntityTraits::teamToString(team), location.x, location.y));
    outId = record.id;
    return ActionError::None;
}

ActionError EntityDataManager::remove(EntityID id, DeathCause cause) {
    if (!wasMinted(id)) {
        return ActionError::UnknownEntity;
    }

    auto it = m_entities.find(id);
    if (it == m_entities.end()) {
        // Already gone, e.g. killed twice by effects in the same round
        return ActionError::None;
    }

    const EntityRecord& record = it->second;
    m_occupancy.erase(OccupancyKey{record.location, record.tier});
    m_spatialHash.remove(id);
    adjustCount(record.team, record.kind, -1);

    ENTITY_DEBUG(std::format("Removed {} {}", EntityTraits::kindToString(record.kind), id));
    m_entities.erase(it);

    m_signalLog.emit(DeathSignal{id, cause});
    return ActionError::None;
}

ActionError EntityDataManager::move(EntityID id, const MapLocation& newLocation) {
    EntityRecord* record = find(id);
    if (record == nullptr) {
        return ActionError::UnknownEntity;
    }
    if (!m_map.onMap(newLocation)) {
        return ActionError::OutOfBounds;
    }
    if (newLocation == record->location) {
        return ActionError::OccupiedLocation;
    }
    if (m_occupancy.find(OccupancyKey{newLocation, record->tier}) != m_occupancy.end()) {
        return ActionError::OccupiedLocation;
    }

    const MapLocation from = record->location;

    // Location write and both indices change together
    m_occupancy.erase(OccupancyKey{from, record->tier});
    m_occupancy.emplace(OccupancyKey{newLocation, record->tier}, id);
    record->location = newLocation;
    m_spatialHash.update(id, newLocation);

    m_signalLog.emit(MoveSignal{id, from, newLocation});
    return ActionError::None;
}

std::vector<EntitySnapshot> EntityDataManager::query(const Region& region,
                                                     std::optional<Team> teamFilter,
                                                     std::optional<EntityKind> kindFilter) const {
    std::vector<EntityID> ids;
    m_spatialHash.query(region, ids);
    std::sort(ids.begin(), ids.end());

    std::vector<EntitySnapshot> result;
    result.reserve(ids.size());
    for (EntityID id : ids) {
        const EntityRecord* record = get(id);
        if (record == nullptr) {
            continue;
        }
        if (teamFilter && record->team != *teamFilter) {
            continue;
        }
        if (kindFilter && record->kind != *kindFilter) {
            continue;
        }
        result.push_back(EntitySnapshot::fromRecord(*record));
    }
    return result;
}

const EntityRecord* EntityDataManager::get(EntityID id) const {
    auto it = m_entities.find(id);
    return it != m_entities.end() ? &it->second : nullptr;
}

EntityRecord* EntityDataManager::find(EntityID id) {
    auto it = m_entities.find(id);
    return it != m_entities.end() ? &it->second : nullptr;
}

std::optional<EntitySnapshot> EntityDataManager::snapshot(EntityID id) const {
    const EntityRecord* record = get(id);
    if (record == nullptr) {
        return std::nullopt;
    }
    return EntitySnapshot::fromRecord(*record);
}

bool EntityDataManager::isAlive(EntityID id) const {
    return m_entities.find(id) != m_entities.end();
}

std::optional<EntityID> EntityDataManager::entityAt(const MapLocation& location, HeightTier tier) const {
    auto it = m_occupancy.find(OccupancyKey{location, tier});
    if (it == m_occupancy.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<EntityID> EntityDataManager::liveIds() const {
    std::vector<EntityID> ids;
    ids.reserve(m_entities.size());
    for (const auto& [id, record] : m_entities) {
        ids.push_back(id);
    }
    return ids;
}

int32_t EntityDataManager::count(Team team, EntityKind kind) const {
    return m_counts[static_cast<size_t>(team)][static_cast<size_t>(kind)];
}

int32_t EntityDataManager::countTeam(Team team) const {
    int32_t total = 0;
    for (int32_t c : m_counts[static_cast<size_t>(team)]) {
        total += c;
    }
    return total;
}

int32_t EntityDataManager::applyDamage(EntityID id, int32_t damage) {
    EntityRecord* record = find(id);
    if (record == nullptr) {
        return 0;
    }
    record->health = std::max(0, record->health - std::max(0, damage));
    return record->health;
}

void EntityDataManager::setTurnsUntilMove(EntityID id, int32_t turns) {
    if (EntityRecord* record = find(id)) {
        record->turnsUntilMove = std::max(0, turns);
    }
}

void EntityDataManager::setTurnsUntilAttack(EntityID id, int32_t turns) {
    if (EntityRecord* record = find(id)) {
        record->turnsUntilAttack = std::max(0, turns);
    }
}

void EntityDataManager::tickRound() {
    for (auto& [id, record] : m_entities) {
        record.turnsUntilMove = std::max(0, record.turnsUntilMove - 1);
        record.turnsUntilAttack = std::max(0, record.turnsUntilAttack - 1);
        ++record.roundsAlive;
    }
}

void EntityDataManager::clear() {
    m_entities.clear();
    m_occupancy.clear();
    m_spatialHash.clear();
    for (auto& perTeam : m_counts) {
        perTeam.fill(0);
    }
    ENTITY_INFO("EntityDataManager cleared");
}

void EntityDataManager::adjustCount(Team team, EntityKind kind, int32_t delta) {
    m_counts[static_cast<size_t>(team)][static_cast<size_t>(kind)] += delta;
}

} // namespace ArenaEngine
