/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/players/ExampleFuncsPlayer.hpp"
#include "ai/RobotController.hpp"
#include "entities/EntityKind.hpp"
#include <algorithm>

namespace ArenaEngine {

void ExampleFuncsPlayer::run(RobotController& rc) {
    m_rng.seed(static_cast<std::mt19937::result_type>(rc.getID()) * 7919u + 17u);

    while (true) {
        switch (rc.getType()) {
            case EntityKind::HQ:          runHQ(rc); break;
            case EntityKind::Tower:       runTower(rc); break;
            case EntityKind::Beaver:
            case EntityKind::Miner:       runBeaver(rc); break;
            case EntityKind::Barracks:    runBarracks(rc); break;
            case EntityKind::Soldier:     runCombatUnit(rc); break;
            case EntityKind::Drone:       runDrone(rc); break;
            case EntityKind::Missile:     runMissile(rc); break;
            default:                      break;
        }
        rc.yield();
    }
}

Direction ExampleFuncsPlayer::randomDirection() {
    std::uniform_int_distribution<size_t> pick(0, ALL_DIRECTIONS.size() - 1);
    return ALL_DIRECTIONS[pick(m_rng)];
}

bool ExampleFuncsPlayer::attackWeakestEnemy(RobotController& rc) {
    if (!rc.isWeaponReady()) {
        return false;
    }
    const int32_t range = EntityTraits::stats(rc.getType()).attackRadiusSquared;
    auto enemies = rc.senseNearbyRobots(range, EntityTraits::opponent(rc.getTeam()));
    if (enemies.empty()) {
        return false;
    }
    auto weakest = std::min_element(enemies.begin(), enemies.end(),
                                    [](const EntitySnapshot& a, const EntitySnapshot& b) {
                                        return a.health < b.health;
                                    });
    return rc.attackLocation(weakest->location, weakest->tier) == ActionError::None;
}

bool ExampleFuncsPlayer::tryMove(RobotController& rc, Direction preferred) {
    if (!DirectionUtils::isMovement(preferred)) {
        preferred = randomDirection();
    }
    // Fan out from the preferred direction, alternating left and right
    Direction left = preferred;
    Direction right = preferred;
    for (int attempt = 0; attempt < 4; ++attempt) {
        if (rc.canMove(left)) {
            return rc.move(left) == ActionError::None;
        }
        if (right != left && rc.canMove(right)) {
            return rc.move(right) == ActionError::None;
        }
        left = DirectionUtils::rotateLeft(left);
        right = DirectionUtils::rotateRight(right);
    }
    return false;
}

bool ExampleFuncsPlayer::trySpawn(RobotController& rc, EntityKind kind, bool building) {
    if (!rc.isCoreReady() || rc.getTeamOre() < EntityTraits::stats(kind).oreCost) {
        return false;
    }
    Direction dir = randomDirection();
    for (size_t i = 0; i < ALL_DIRECTIONS.size(); ++i) {
        ActionError result = building ? rc.build(dir, kind) : rc.spawn(dir, kind);
        if (result == ActionError::None) {
            return true;
        }
        if (result == ActionError::OnCooldown || result == ActionError::InsufficientResource) {
            return false;
        }
        dir = DirectionUtils::rotateRight(dir);
    }
    return false;
}

void ExampleFuncsPlayer::runHQ(RobotController& rc) {
    const auto beavers = rc.senseNearbyRobots(-1, rc.getTeam());
    const auto beaverCount = std::count_if(beavers.begin(), beavers.end(), [](const EntitySnapshot& s) {
        return s.kind == EntityKind::Beaver;
    });
    (void)rc.broadcast(BEAVER_COUNT_CHANNEL, static_cast<int32_t>(beaverCount));

    if (attackWeakestEnemy(rc)) {
        return;
    }
    if (beaverCount < MAX_BEAVERS) {
        trySpawn(rc, EntityKind::Beaver, false);
    }
}

void ExampleFuncsPlayer::runTower(RobotController& rc) {
    attackWeakestEnemy(rc);
}

void ExampleFuncsPlayer::runBeaver(RobotController& rc) {
    if (attackWeakestEnemy(rc) || !rc.isCoreReady()) {
        return;
    }

    std::uniform_int_distribution<int> roll(0, 99);
    const int chance = roll(m_rng);

    if (rc.getType() == EntityKind::Beaver && chance < 5 && rc.getTeamOre() > 400.0 &&
        trySpawn(rc, EntityKind::Barracks, true)) {
        return;
    }

    const auto ore = rc.senseOre(rc.getLocation());
    if (ore && *ore > 0.0 && chance < 60 && rc.mine() == ActionError::None) {
        return;
    }
    tryMove(rc, randomDirection());
}

void ExampleFuncsPlayer::runBarracks(RobotController& rc) {
    std::uniform_int_distribution<int> roll(0, 3);
    trySpawn(rc, roll(m_rng) == 0 ? EntityKind::Drone : EntityKind::Soldier, false);
}

void ExampleFuncsPlayer::runCombatUnit(RobotController& rc) {
    if (attackWeakestEnemy(rc) || !rc.isCoreReady()) {
        return;
    }
    const auto target = rc.senseEnemyHQLocation();
    tryMove(rc, target ? rc.getLocation().directionTo(*target) : randomDirection());
}

void ExampleFuncsPlayer::runDrone(RobotController& rc) {
    const auto enemies = rc.senseNearbyRobots(-1, EntityTraits::opponent(rc.getTeam()));
    if (!enemies.empty() && rc.isWeaponReady()) {
        const Direction toward = rc.getLocation().directionTo(enemies.front().location);
        if (DirectionUtils::isMovement(toward) && rc.launchMissile(toward) == ActionError::None) {
            return;
        }
    }
    runCombatUnit(rc);
}

void ExampleFuncsPlayer::runMissile(RobotController& rc) {
    const auto adjacent = rc.senseNearbyRobots(GameConstants::EXPLOSION_RADIUS_SQUARED,
                                               EntityTraits::opponent(rc.getTeam()));
    if (!adjacent.empty()) {
        (void)rc.explode();
    }
}

} // namespace ArenaEngine
