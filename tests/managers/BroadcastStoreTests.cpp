/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE BroadcastStoreTests
#include <boost/test/unit_test.hpp>

#include "core/GameConstants.hpp"
#include "events/SignalLog.hpp"
#include "managers/BroadcastStore.hpp"

using namespace ArenaEngine;

struct BroadcastFixture {
    BroadcastStore store;
    SignalLog signals;

    int32_t readOrFail(Team team, int32_t channel) {
        int32_t value = -1;
        BOOST_REQUIRE_EQUAL(store.read(team, channel, value), ActionError::None);
        return value;
    }
};

BOOST_FIXTURE_TEST_SUITE(BroadcastStoreTestSuite, BroadcastFixture)

BOOST_AUTO_TEST_CASE(TestUnwrittenChannelReadsZero) {
    BOOST_CHECK_EQUAL(readOrFail(Team::A, 0), 0);
    BOOST_CHECK_EQUAL(readOrFail(Team::B, GameConstants::BROADCAST_MAX_CHANNELS - 1), 0);
}

BOOST_AUTO_TEST_CASE(TestWriteInvisibleUntilCommit) {
    BOOST_CHECK_EQUAL(store.write(Team::A, 5, 17), ActionError::None);
    BOOST_CHECK_EQUAL(readOrFail(Team::A, 5), 0);

    BOOST_CHECK_EQUAL(store.commit(signals), 1u);
    BOOST_CHECK_EQUAL(readOrFail(Team::A, 5), 17);
}

BOOST_AUTO_TEST_CASE(TestTeamsAreIsolated) {
    BOOST_CHECK_EQUAL(store.write(Team::A, 1, 100), ActionError::None);
    store.commit(signals);

    BOOST_CHECK_EQUAL(readOrFail(Team::A, 1), 100);
    BOOST_CHECK_EQUAL(readOrFail(Team::B, 1), 0);
}

BOOST_AUTO_TEST_CASE(TestLastWriteInRoundWins) {
    BOOST_CHECK_EQUAL(store.write(Team::B, 3, 1), ActionError::None);
    BOOST_CHECK_EQUAL(store.write(Team::B, 3, 2), ActionError::None);
    BOOST_CHECK_EQUAL(store.write(Team::B, 3, 3), ActionError::None);

    BOOST_CHECK_EQUAL(store.commit(signals), 1u);
    BOOST_CHECK_EQUAL(readOrFail(Team::B, 3), 3);

    auto drained = signals.drain();
    BOOST_REQUIRE_EQUAL(drained.size(), 1u);
    BOOST_CHECK_EQUAL(drained[0].as<BroadcastSignal>()->value, 3);
}

BOOST_AUTO_TEST_CASE(TestInvalidChannels) {
    int32_t out = 7;
    BOOST_CHECK_EQUAL(store.write(Team::A, -1, 1), ActionError::InvalidChannel);
    BOOST_CHECK_EQUAL(store.write(Team::A, GameConstants::BROADCAST_MAX_CHANNELS, 1),
                      ActionError::InvalidChannel);
    BOOST_CHECK_EQUAL(store.write(Team::NEUTRAL, 0, 1), ActionError::InvalidChannel);
    BOOST_CHECK_EQUAL(store.read(Team::A, -5, out), ActionError::InvalidChannel);
    BOOST_CHECK_EQUAL(out, 7);
    BOOST_CHECK(store.pending(Team::A).empty());
}

BOOST_AUTO_TEST_CASE(TestCommitSignalsOnlyChangedChannels) {
    BOOST_CHECK_EQUAL(store.write(Team::A, 2, 9), ActionError::None);
    store.commit(signals);
    (void)signals.drain();

    // Same value again: no change
    BOOST_CHECK_EQUAL(store.write(Team::A, 2, 9), ActionError::None);
    // Zero into an unwritten channel: reads the same as before
    BOOST_CHECK_EQUAL(store.write(Team::A, 8, 0), ActionError::None);
    BOOST_CHECK_EQUAL(store.commit(signals), 0u);
    BOOST_CHECK(signals.empty());

    // Back to zero from a non-zero value is a change
    BOOST_CHECK_EQUAL(store.write(Team::A, 2, 0), ActionError::None);
    BOOST_CHECK_EQUAL(store.commit(signals), 1u);
    BOOST_CHECK_EQUAL(readOrFail(Team::A, 2), 0);
}

BOOST_AUTO_TEST_CASE(TestCommitOrderByTeamThenChannel) {
    BOOST_CHECK_EQUAL(store.write(Team::B, 1, 10), ActionError::None);
    BOOST_CHECK_EQUAL(store.write(Team::A, 40, 20), ActionError::None);
    BOOST_CHECK_EQUAL(store.write(Team::A, 4, 30), ActionError::None);

    BOOST_CHECK_EQUAL(store.commit(signals), 3u);
    auto drained = signals.drain();
    BOOST_REQUIRE_EQUAL(drained.size(), 3u);

    const auto* first = drained[0].as<BroadcastSignal>();
    const auto* second = drained[1].as<BroadcastSignal>();
    const auto* third = drained[2].as<BroadcastSignal>();
    BOOST_CHECK(first->team == Team::A && first->channel == 4);
    BOOST_CHECK(second->team == Team::A && second->channel == 40);
    BOOST_CHECK(third->team == Team::B && third->channel == 1);
}

BOOST_AUTO_TEST_CASE(TestClear) {
    BOOST_CHECK_EQUAL(store.write(Team::A, 1, 1), ActionError::None);
    store.commit(signals);
    BOOST_CHECK_EQUAL(store.write(Team::A, 2, 2), ActionError::None);

    store.clear();
    BOOST_CHECK(store.committed(Team::A).empty());
    BOOST_CHECK(store.pending(Team::A).empty());
    BOOST_CHECK_EQUAL(readOrFail(Team::A, 1), 0);
}

BOOST_AUTO_TEST_SUITE_END()
