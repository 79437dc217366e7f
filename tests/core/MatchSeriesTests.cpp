/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE MatchSeriesTests
#include <boost/test/unit_test.hpp>

#include "ai/PlayerRegistry.hpp"
#include "core/ArenaErrors.hpp"
#include "core/MatchSeries.hpp"
#include "mocks/ScriptedPlayer.hpp"
#include "mocks/TestMaps.hpp"
#include <vector>

using namespace ArenaEngine;

struct SeriesFixture {
    SeriesFixture() {
        // Each round, slot 0 becomes one more than the value carried into the match
        registry.registerPlayer("learner", ScriptedPlayer::factory([](RobotController& rc) {
            const TeamMemory carried = rc.getTeamMemory();
            rc.setTeamMemory(0, carried[0] + 1);
        }, "learner"));
        registry.registerPlayer("waiting", ScriptedPlayer::idle());

        config.teamA = "learner";
        config.teamB = "waiting";
        config.roundCap = 3;
    }

    PlayerRegistry registry;
    MatchConfig config;
};

BOOST_FIXTURE_TEST_SUITE(MatchSeriesTestSuite, SeriesFixture)

BOOST_AUTO_TEST_CASE(TestMemoryCarriesBetweenMatches) {
    MatchSeries series(config, registry);
    std::vector<GameMap> maps{TestMaps::openArena(10, 1, "first"), TestMaps::openArena(10, 2, "second"),
                              TestMaps::openArena(10, 3, "third")};

    auto results = series.run(maps);
    BOOST_REQUIRE_EQUAL(results.size(), 3u);

    BOOST_CHECK_EQUAL(results[0].header.initialMemory[0][0], 0);
    BOOST_CHECK_EQUAL(results[0].footer.finalMemory[0][0], 1);
    BOOST_CHECK_EQUAL(results[1].header.initialMemory[0][0], 1);
    BOOST_CHECK_EQUAL(results[1].footer.finalMemory[0][0], 2);
    BOOST_CHECK_EQUAL(results[2].header.initialMemory[0][0], 2);
    BOOST_CHECK_EQUAL(results[2].footer.finalMemory[1][0], 0);

    BOOST_CHECK_EQUAL(series.getCarriedMemory()[0][0], 3);

    for (size_t i = 0; i < results.size(); ++i) {
        BOOST_CHECK_EQUAL(results[i].header.matchIndex, static_cast<int32_t>(i));
        BOOST_CHECK_EQUAL(results[i].header.matchCount, 3);
        BOOST_CHECK_EQUAL(results[i].footer.rounds, 3);
        BOOST_CHECK(!results[i].winnerString.empty());
    }
    BOOST_CHECK_EQUAL(results[1].header.mapName, "second");
}

BOOST_AUTO_TEST_CASE(TestPresetMemorySeedsFirstMatch) {
    MatchSeries series(config, registry);
    std::array<TeamMemory, 2> preset{};
    preset[0][0] = 40;
    preset[1][5] = -7;
    series.setCarriedMemory(preset);

    auto results = series.run({TestMaps::openArena()});
    BOOST_REQUIRE_EQUAL(results.size(), 1u);
    BOOST_CHECK_EQUAL(results[0].header.initialMemory[1][5], -7);
    BOOST_CHECK_EQUAL(results[0].footer.finalMemory[0][0], 41);
    BOOST_CHECK_EQUAL(results[0].footer.finalMemory[1][5], -7);
}

BOOST_AUTO_TEST_CASE(TestRoundObserverSeesEveryRound) {
    MatchSeries series(config, registry);
    std::vector<int32_t> rounds;
    int32_t gameOvers = 0;

    series.setRoundObserver([&](const Match& match, const RoundDelta& delta) {
        BOOST_CHECK_EQUAL(match.getRoundNumber(), delta.round);
        rounds.push_back(delta.round);
        for (const Signal& signal : delta.signals) {
            if (signal.is<GameOverSignal>()) {
                ++gameOvers;
            }
        }
    });

    series.run({TestMaps::openArena(10, 1), TestMaps::openArena(10, 2)});

    const std::vector<int32_t> expected{1, 2, 3, 1, 2, 3};
    BOOST_CHECK_EQUAL_COLLECTIONS(rounds.begin(), rounds.end(), expected.begin(), expected.end());
    BOOST_CHECK_EQUAL(gameOvers, 2);
}

BOOST_AUTO_TEST_CASE(TestInvalidMapStopsSeries) {
    MatchSeries series(config, registry);
    GameMap broken("broken", 6, 6, 0);
    broken.setHQLocation(Team::A, MapLocation(1, 1));

    BOOST_CHECK_THROW(series.run({TestMaps::openArena(), broken}), InitializationError);
    // The first match completed before the failure
    BOOST_CHECK_EQUAL(series.getCarriedMemory()[0][0], 1);
}

BOOST_AUTO_TEST_SUITE_END()
