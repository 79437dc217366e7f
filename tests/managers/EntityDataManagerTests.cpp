/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EntityDataManagerTests
#include <boost/test/unit_test.hpp>

#include "events/SignalLog.hpp"
#include "managers/EntityDataManager.hpp"
#include "world/GameMap.hpp"
#include "world/Region.hpp"
#include <iterator>
#include <map>
#include <random>
#include <set>
#include <tuple>
#include <vector>

using namespace ArenaEngine;

// ============================================================================
// Test Fixture
// ============================================================================

class EntityDataManagerTestFixture {
public:
    EntityDataManagerTestFixture()
        : map("edm_test", 10, 10, 1),
          edm(map, signals) {}

    EntityID spawnOrFail(Team team, EntityKind kind, const MapLocation& location) {
        EntityID id = INVALID_ENTITY_ID;
        ActionError result = edm.spawn(team, kind, location, EntityTraits::stats(kind).tier, id);
        BOOST_REQUIRE_EQUAL(result, ActionError::None);
        return id;
    }

protected:
    GameMap map;
    SignalLog signals;
    EntityDataManager edm;
};

// ============================================================================
// SPAWN TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SpawnTests, EntityDataManagerTestFixture)

BOOST_AUTO_TEST_CASE(TestIdsAreSequentialFromZero) {
    EntityID first = spawnOrFail(Team::A, EntityKind::HQ, MapLocation(1, 1));
    EntityID second = spawnOrFail(Team::B, EntityKind::HQ, MapLocation(8, 8));
    EntityID third = spawnOrFail(Team::A, EntityKind::Beaver, MapLocation(2, 1));

    BOOST_CHECK_EQUAL(first, 0);
    BOOST_CHECK_EQUAL(second, 1);
    BOOST_CHECK_EQUAL(third, 2);
    BOOST_CHECK_EQUAL(edm.size(), 3u);
}

BOOST_AUTO_TEST_CASE(TestSpawnInitialisesRecord) {
    EntityID id = spawnOrFail(Team::A, EntityKind::Soldier, MapLocation(4, 5));

    const EntityRecord* record = edm.get(id);
    BOOST_REQUIRE(record != nullptr);
    BOOST_CHECK_EQUAL(record->team, Team::A);
    BOOST_CHECK_EQUAL(record->kind, EntityKind::Soldier);
    BOOST_CHECK_EQUAL(record->tier, HeightTier::Ground);
    BOOST_CHECK_EQUAL(record->location, MapLocation(4, 5));
    BOOST_CHECK_EQUAL(record->health, EntityTraits::stats(EntityKind::Soldier).maxHealth);
    BOOST_CHECK_EQUAL(record->turnsUntilMove, 0);
}

BOOST_AUTO_TEST_CASE(TestSpawnEmitsSignal) {
    EntityID id = spawnOrFail(Team::B, EntityKind::Drone, MapLocation(3, 3));

    auto drained = signals.drain();
    BOOST_REQUIRE_EQUAL(drained.size(), 1u);
    const auto* spawn = drained[0].as<SpawnSignal>();
    BOOST_REQUIRE(spawn != nullptr);
    BOOST_CHECK_EQUAL(spawn->id, id);
    BOOST_CHECK_EQUAL(spawn->parentId, INVALID_ENTITY_ID);
    BOOST_CHECK_EQUAL(spawn->team, Team::B);
    BOOST_CHECK_EQUAL(spawn->tier, HeightTier::Air);
    BOOST_CHECK_EQUAL(spawn->location, MapLocation(3, 3));
}

BOOST_AUTO_TEST_CASE(TestSpawnOffMapFails) {
    EntityID id = 99;
    BOOST_CHECK_EQUAL(edm.spawn(Team::A, EntityKind::Beaver, MapLocation(10, 0), HeightTier::Ground, id),
                      ActionError::OutOfBounds);
    BOOST_CHECK_EQUAL(id, INVALID_ENTITY_ID);
    BOOST_CHECK_EQUAL(edm.spawn(Team::A, EntityKind::Beaver, MapLocation(-1, 3), HeightTier::Ground, id),
                      ActionError::OutOfBounds);
    BOOST_CHECK(signals.empty());
    BOOST_CHECK_EQUAL(edm.peekNextId(), 0);
}

BOOST_AUTO_TEST_CASE(TestOccupiedTierRejected) {
    spawnOrFail(Team::A, EntityKind::Beaver, MapLocation(2, 2));
    (void)signals.drain();

    EntityID id = INVALID_ENTITY_ID;
    BOOST_CHECK_EQUAL(edm.spawn(Team::B, EntityKind::Soldier, MapLocation(2, 2), HeightTier::Ground, id),
                      ActionError::OccupiedLocation);
    BOOST_CHECK(signals.empty());

    // The air tier above the same tile is free
    BOOST_CHECK_EQUAL(edm.spawn(Team::B, EntityKind::Drone, MapLocation(2, 2), HeightTier::Air, id),
                      ActionError::None);
    BOOST_CHECK_EQUAL(*edm.entityAt(MapLocation(2, 2), HeightTier::Air), id);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// REMOVE TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(RemoveTests, EntityDataManagerTestFixture)

BOOST_AUTO_TEST_CASE(TestRemoveFreesTileAndIndices) {
    EntityID id = spawnOrFail(Team::A, EntityKind::Miner, MapLocation(5, 5));
    (void)signals.drain();

    BOOST_CHECK_EQUAL(edm.remove(id, DeathCause::Destroyed), ActionError::None);
    BOOST_CHECK(!edm.isAlive(id));
    BOOST_CHECK(edm.get(id) == nullptr);
    BOOST_CHECK(!edm.entityAt(MapLocation(5, 5), HeightTier::Ground).has_value());
    BOOST_CHECK_EQUAL(edm.count(Team::A, EntityKind::Miner), 0);
    BOOST_CHECK(edm.query(Region::circle(MapLocation(5, 5), 4)).empty());

    auto drained = signals.drain();
    BOOST_REQUIRE_EQUAL(drained.size(), 1u);
    BOOST_CHECK_EQUAL(drained[0].as<DeathSignal>()->id, id);
    BOOST_CHECK_EQUAL(drained[0].as<DeathSignal>()->cause, DeathCause::Destroyed);
}

BOOST_AUTO_TEST_CASE(TestRemoveIsIdempotent) {
    EntityID id = spawnOrFail(Team::A, EntityKind::Miner, MapLocation(5, 5));
    BOOST_CHECK_EQUAL(edm.remove(id), ActionError::None);
    (void)signals.drain();

    BOOST_CHECK_EQUAL(edm.remove(id), ActionError::None);
    BOOST_CHECK(signals.empty());
}

BOOST_AUTO_TEST_CASE(TestRemoveNeverMintedId) {
    BOOST_CHECK_EQUAL(edm.remove(42), ActionError::UnknownEntity);
    BOOST_CHECK_EQUAL(edm.remove(-3), ActionError::UnknownEntity);
}

BOOST_AUTO_TEST_CASE(TestIdsNeverReused) {
    EntityID first = spawnOrFail(Team::A, EntityKind::Beaver, MapLocation(1, 1));
    BOOST_CHECK_EQUAL(edm.remove(first), ActionError::None);
    EntityID second = spawnOrFail(Team::A, EntityKind::Beaver, MapLocation(1, 1));

    BOOST_CHECK_NE(first, second);
    BOOST_CHECK(edm.wasMinted(first));
    BOOST_CHECK(!edm.isAlive(first));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// MOVE TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(MoveTests, EntityDataManagerTestFixture)

BOOST_AUTO_TEST_CASE(TestMoveUpdatesOccupancyAndSignals) {
    EntityID id = spawnOrFail(Team::A, EntityKind::Soldier, MapLocation(3, 3));
    (void)signals.drain();

    BOOST_CHECK_EQUAL(edm.move(id, MapLocation(4, 3)), ActionError::None);
    BOOST_CHECK_EQUAL(edm.get(id)->location, MapLocation(4, 3));
    BOOST_CHECK(!edm.entityAt(MapLocation(3, 3), HeightTier::Ground).has_value());
    BOOST_CHECK_EQUAL(*edm.entityAt(MapLocation(4, 3), HeightTier::Ground), id);

    auto drained = signals.drain();
    BOOST_REQUIRE_EQUAL(drained.size(), 1u);
    const auto* move = drained[0].as<MoveSignal>();
    BOOST_REQUIRE(move != nullptr);
    BOOST_CHECK_EQUAL(move->from, MapLocation(3, 3));
    BOOST_CHECK_EQUAL(move->to, MapLocation(4, 3));
}

BOOST_AUTO_TEST_CASE(TestMoveFailuresLeaveStateUntouched) {
    EntityID mover = spawnOrFail(Team::A, EntityKind::Soldier, MapLocation(0, 0));
    spawnOrFail(Team::B, EntityKind::Soldier, MapLocation(1, 0));
    (void)signals.drain();

    BOOST_CHECK_EQUAL(edm.move(mover, MapLocation(-1, 0)), ActionError::OutOfBounds);
    BOOST_CHECK_EQUAL(edm.move(mover, MapLocation(1, 0)), ActionError::OccupiedLocation);
    BOOST_CHECK_EQUAL(edm.move(77, MapLocation(2, 2)), ActionError::UnknownEntity);

    BOOST_CHECK_EQUAL(edm.get(mover)->location, MapLocation(0, 0));
    BOOST_CHECK(signals.empty());
}

BOOST_AUTO_TEST_CASE(TestRandomSequenceKeepsOccupancyConsistent) {
    struct Placement {
        MapLocation location;
        HeightTier tier;
    };
    std::map<EntityID, Placement> expected;
    std::mt19937 rng(20251019);
    std::uniform_int_distribution<int32_t> coord(-1, 10);
    std::uniform_int_distribution<int32_t> action(0, 9);

    auto occupiedInModel = [&expected](const MapLocation& location, HeightTier tier) {
        for (const auto& [id, placement] : expected) {
            if (placement.location == location && placement.tier == tier) {
                return true;
            }
        }
        return false;
    };
    auto pickLive = [&]() {
        auto it = expected.begin();
        std::advance(it, std::uniform_int_distribution<size_t>(0, expected.size() - 1)(rng));
        return it->first;
    };

    for (int step = 0; step < 600; ++step) {
        const int32_t roll = action(rng);
        const MapLocation target(coord(rng), coord(rng));

        if (roll < 4 || expected.empty()) {
            const EntityKind kind = (roll % 2 == 0) ? EntityKind::Beaver : EntityKind::Drone;
            const HeightTier tier = EntityTraits::stats(kind).tier;
            const ActionError want = !map.onMap(target)                 ? ActionError::OutOfBounds
                                     : occupiedInModel(target, tier)     ? ActionError::OccupiedLocation
                                                                         : ActionError::None;
            EntityID id = INVALID_ENTITY_ID;
            BOOST_REQUIRE_EQUAL(edm.spawn(Team::A, kind, target, tier, id), want);
            if (want == ActionError::None) {
                expected[id] = Placement{target, tier};
            }
        } else if (roll < 9) {
            const EntityID id = pickLive();
            const HeightTier tier = expected[id].tier;
            const ActionError want = !map.onMap(target)                 ? ActionError::OutOfBounds
                                     : occupiedInModel(target, tier)     ? ActionError::OccupiedLocation
                                                                         : ActionError::None;
            BOOST_REQUIRE_EQUAL(edm.move(id, target), want);
            if (want == ActionError::None) {
                expected[id].location = target;
            }
        } else {
            const EntityID id = pickLive();
            BOOST_REQUIRE_EQUAL(edm.remove(id), ActionError::None);
            expected.erase(id);
        }

        // Every record is indexed at its own key, and no key is shared
        BOOST_REQUIRE_EQUAL(edm.size(), expected.size());
        std::set<std::tuple<int32_t, int32_t, HeightTier>> keys;
        for (const auto& [id, placement] : expected) {
            const EntityRecord* record = edm.get(id);
            BOOST_REQUIRE(record != nullptr);
            BOOST_REQUIRE_EQUAL(record->location, placement.location);
            BOOST_REQUIRE(record->tier == placement.tier);
            const auto found = edm.entityAt(record->location, record->tier);
            BOOST_REQUIRE(found.has_value());
            BOOST_REQUIRE_EQUAL(*found, id);
            BOOST_REQUIRE(keys.emplace(record->location.x, record->location.y, record->tier).second);
        }

        // No tile reports an entity the records do not place there
        for (int32_t x = 0; x < 10; ++x) {
            for (int32_t y = 0; y < 10; ++y) {
                for (HeightTier tier : {HeightTier::Ground, HeightTier::Air}) {
                    const auto found = edm.entityAt(MapLocation(x, y), tier);
                    BOOST_REQUIRE_EQUAL(found.has_value(), keys.count({x, y, tier}) == 1);
                }
            }
        }
    }
    (void)signals.drain();
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// QUERY TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(QueryTests, EntityDataManagerTestFixture)

BOOST_AUTO_TEST_CASE(TestCircleQueryOrderedById) {
    EntityID far = spawnOrFail(Team::A, EntityKind::Beaver, MapLocation(9, 9));
    EntityID b = spawnOrFail(Team::B, EntityKind::Beaver, MapLocation(5, 6));
    EntityID a = spawnOrFail(Team::A, EntityKind::Beaver, MapLocation(5, 4));
    EntityID air = spawnOrFail(Team::A, EntityKind::Drone, MapLocation(5, 5));

    auto found = edm.query(Region::circle(MapLocation(5, 5), 2));
    BOOST_REQUIRE_EQUAL(found.size(), 3u);
    BOOST_CHECK_EQUAL(found[0].id, b);
    BOOST_CHECK_EQUAL(found[1].id, a);
    BOOST_CHECK_EQUAL(found[2].id, air);
    for (const auto& snapshot : found) {
        BOOST_CHECK_NE(snapshot.id, far);
    }
}

BOOST_AUTO_TEST_CASE(TestQueryFilters) {
    spawnOrFail(Team::A, EntityKind::Beaver, MapLocation(2, 2));
    EntityID enemy = spawnOrFail(Team::B, EntityKind::Soldier, MapLocation(3, 2));
    spawnOrFail(Team::B, EntityKind::Beaver, MapLocation(2, 3));

    auto enemies = edm.query(Region::rectangle(MapLocation(0, 0), MapLocation(4, 4)), Team::B);
    BOOST_CHECK_EQUAL(enemies.size(), 2u);

    auto soldiers = edm.query(Region::rectangle(MapLocation(0, 0), MapLocation(4, 4)),
                              Team::B, EntityKind::Soldier);
    BOOST_REQUIRE_EQUAL(soldiers.size(), 1u);
    BOOST_CHECK_EQUAL(soldiers[0].id, enemy);
}

BOOST_AUTO_TEST_CASE(TestCountsFollowLifecycle) {
    EntityID a = spawnOrFail(Team::A, EntityKind::Beaver, MapLocation(2, 2));
    spawnOrFail(Team::A, EntityKind::Beaver, MapLocation(3, 2));
    spawnOrFail(Team::A, EntityKind::HQ, MapLocation(1, 1));

    BOOST_CHECK_EQUAL(edm.count(Team::A, EntityKind::Beaver), 2);
    BOOST_CHECK_EQUAL(edm.countTeam(Team::A), 3);
    BOOST_CHECK_EQUAL(edm.countTeam(Team::B), 0);

    BOOST_CHECK_EQUAL(edm.remove(a), ActionError::None);
    BOOST_CHECK_EQUAL(edm.count(Team::A, EntityKind::Beaver), 1);
}

BOOST_AUTO_TEST_CASE(TestLiveIdsAscending) {
    spawnOrFail(Team::A, EntityKind::Beaver, MapLocation(0, 0));
    EntityID middle = spawnOrFail(Team::A, EntityKind::Beaver, MapLocation(1, 0));
    spawnOrFail(Team::A, EntityKind::Beaver, MapLocation(2, 0));
    BOOST_CHECK_EQUAL(edm.remove(middle), ActionError::None);

    auto ids = edm.liveIds();
    BOOST_REQUIRE_EQUAL(ids.size(), 2u);
    BOOST_CHECK_EQUAL(ids[0], 0);
    BOOST_CHECK_EQUAL(ids[1], 2);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// STATE WRITE TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(StateWriteTests, EntityDataManagerTestFixture)

BOOST_AUTO_TEST_CASE(TestDamageClampsAtZero) {
    EntityID id = spawnOrFail(Team::A, EntityKind::Beaver, MapLocation(2, 2));
    BOOST_CHECK_EQUAL(edm.applyDamage(id, 10), 20);
    BOOST_CHECK_EQUAL(edm.applyDamage(id, 100), 0);
    BOOST_CHECK_EQUAL(edm.applyDamage(12345, 5), 0);

    // Damage alone never removes; the World does that
    BOOST_CHECK(edm.isAlive(id));
}

BOOST_AUTO_TEST_CASE(TestTickRoundDecaysCooldowns) {
    EntityID id = spawnOrFail(Team::A, EntityKind::Beaver, MapLocation(2, 2));
    edm.setTurnsUntilMove(id, 2);
    edm.setTurnsUntilAttack(id, 1);

    edm.tickRound();
    BOOST_CHECK_EQUAL(edm.get(id)->turnsUntilMove, 1);
    BOOST_CHECK_EQUAL(edm.get(id)->turnsUntilAttack, 0);

    edm.tickRound();
    edm.tickRound();
    BOOST_CHECK_EQUAL(edm.get(id)->turnsUntilMove, 0);
    BOOST_CHECK_EQUAL(edm.get(id)->turnsUntilAttack, 0);
    BOOST_CHECK_EQUAL(edm.get(id)->roundsAlive, 3);
}

BOOST_AUTO_TEST_CASE(TestClearDropsEverything) {
    spawnOrFail(Team::A, EntityKind::Beaver, MapLocation(2, 2));
    spawnOrFail(Team::B, EntityKind::Beaver, MapLocation(3, 3));
    edm.clear();

    BOOST_CHECK_EQUAL(edm.size(), 0u);
    BOOST_CHECK(edm.liveIds().empty());
    BOOST_CHECK_EQUAL(edm.countTeam(Team::A), 0);
    BOOST_CHECK(!edm.entityAt(MapLocation(2, 2), HeightTier::Ground).has_value());
}

BOOST_AUTO_TEST_SUITE_END()
