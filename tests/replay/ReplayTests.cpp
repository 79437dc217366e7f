/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ReplayTests
#include <boost/test/unit_test.hpp>

#include "ai/PlayerRegistry.hpp"
#include "ai/players/ExampleFuncsPlayer.hpp"
#include "core/MatchSeries.hpp"
#include "mocks/TestMaps.hpp"
#include "replay/ReplayReader.hpp"
#include "replay/ReplayRecords.hpp"
#include "replay/ReplayWriter.hpp"
#include <algorithm>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace ArenaEngine;

namespace {

std::shared_ptr<std::istringstream> reopen(const std::shared_ptr<std::stringstream>& written,
                                           size_t dropTrailingBytes = 0) {
    std::string bytes = written->str();
    bytes.resize(bytes.size() - std::min(dropTrailingBytes, bytes.size()));
    return std::make_shared<std::istringstream>(bytes, std::ios::binary);
}

} // namespace

// ============================================================================
// SPAWNED BODY RECORDS
// ============================================================================

BOOST_AUTO_TEST_SUITE(SpawnedBodyTests)

BOOST_AUTO_TEST_CASE(TestFixedLayout) {
    SpawnSignal spawn;
    spawn.id = 0x0102;
    spawn.team = Team::B;
    spawn.kind = EntityKind::Drone;
    spawn.location = MapLocation(3, 7);
    spawn.velocity = Vector2D(1.0f, -1.0f);

    const SpawnedBody body = SpawnedBody::fromSignal(spawn);
    BOOST_CHECK_EQUAL(body.radius, EntityTraits::stats(EntityKind::Drone).radius);
    BOOST_CHECK_EQUAL(body.location, Vector2D(3.0f, 7.0f));

    const SpawnedBody::Bytes bytes = body.encode();
    BOOST_CHECK_EQUAL(bytes.size(), 28u);
    // Little-endian id, then team and kind tags, then two padding bytes
    BOOST_CHECK_EQUAL(bytes[0], 0x02);
    BOOST_CHECK_EQUAL(bytes[1], 0x01);
    BOOST_CHECK_EQUAL(bytes[2], 0x00);
    BOOST_CHECK_EQUAL(bytes[4], static_cast<unsigned char>(Team::B));
    BOOST_CHECK_EQUAL(bytes[5], static_cast<unsigned char>(EntityKind::Drone));
    BOOST_CHECK_EQUAL(bytes[6], 0);
    BOOST_CHECK_EQUAL(bytes[7], 0);

    auto decoded = SpawnedBody::decode(bytes);
    BOOST_REQUIRE(decoded.has_value());
    BOOST_CHECK(*decoded == body);
}

BOOST_AUTO_TEST_CASE(TestUnknownTagsRejected) {
    SpawnedBody::Bytes bytes = SpawnedBody{}.encode();
    bytes[4] = 9;
    BOOST_CHECK(!SpawnedBody::decode(bytes).has_value());

    bytes = SpawnedBody{}.encode();
    bytes[5] = static_cast<unsigned char>(ENTITY_KIND_COUNT);
    BOOST_CHECK(!SpawnedBody::decode(bytes).has_value());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// REPLAY STREAMS
// ============================================================================

struct RecordedSeriesFixture {
    RecordedSeriesFixture() : registry(PlayerRegistry::withSamplePlayers()) {
        config.teamA = ExampleFuncsPlayer::NAME;
        config.teamB = ExampleFuncsPlayer::NAME;
        config.roundCap = 40;

        ReplayWriter writer;
        BOOST_REQUIRE(writer.open(stream));
        MatchSeries series(config, registry);
        results = series.run({TestMaps::openArena(16, 11, "alpha"), TestMaps::openArena(12, 12, "beta")}, &writer);
        roundsWritten = writer.getRoundsWritten();
        writer.close();
    }

    PlayerRegistry registry;
    MatchConfig config;
    std::shared_ptr<std::stringstream> stream{std::make_shared<std::stringstream>(
        std::ios::in | std::ios::out | std::ios::binary)};
    std::vector<MatchResult> results;
    size_t roundsWritten{0};
};

BOOST_FIXTURE_TEST_SUITE(ReplayStreamTests, RecordedSeriesFixture)

BOOST_AUTO_TEST_CASE(TestSeriesReadsBackIntact) {
    ReplayReader reader;
    BOOST_REQUIRE(reader.open(reopen(stream)));
    BOOST_CHECK_EQUAL(reader.getVersion(), ReplayFormat::VERSION);

    std::vector<ReplayMatch> matches;
    BOOST_REQUIRE(reader.readAll(matches));
    BOOST_REQUIRE_EQUAL(matches.size(), 2u);
    BOOST_CHECK_EQUAL(matches[0].rounds.size() + matches[1].rounds.size(), roundsWritten);

    for (size_t i = 0; i < matches.size(); ++i) {
        const ReplayMatch& match = matches[i];
        const MatchResult& expected = results[i];

        BOOST_CHECK_EQUAL(match.header.mapName, expected.header.mapName);
        BOOST_CHECK_EQUAL(match.header.mapSeed, expected.header.mapSeed);
        BOOST_CHECK_EQUAL(match.header.matchIndex, static_cast<int32_t>(i));
        BOOST_REQUIRE_EQUAL(match.header.initialBodies.size(), expected.header.initialBodies.size());
        BOOST_CHECK(match.header.initialBodies[0] == expected.header.initialBodies[0]);

        BOOST_REQUIRE_EQUAL(static_cast<int32_t>(match.rounds.size()), expected.footer.rounds);
        for (size_t r = 0; r < match.rounds.size(); ++r) {
            BOOST_CHECK_EQUAL(match.rounds[r].round, static_cast<int32_t>(r + 1));
        }

        const RoundDelta& last = match.rounds.back();
        BOOST_REQUIRE(!last.signals.empty());
        const auto* gameOver = last.signals.back().as<GameOverSignal>();
        BOOST_REQUIRE(gameOver != nullptr);
        BOOST_CHECK_EQUAL(gameOver->factor, expected.footer.factor);

        BOOST_REQUIRE(match.footer.has_value());
        BOOST_CHECK_EQUAL(match.footer->factor, expected.footer.factor);
        BOOST_CHECK_EQUAL(match.footer->rounds, expected.footer.rounds);
        BOOST_CHECK(match.footer->winner == expected.footer.winner);
    }
}

BOOST_AUTO_TEST_CASE(TestSignalsKeepOrderAndContent) {
    // Record a synthetic round by hand and compare field by field
    auto handStream = std::make_shared<std::stringstream>(std::ios::in | std::ios::out | std::ios::binary);
    RoundDelta delta;
    delta.round = 9;
    delta.signals.push_back(Signal{9, MoveSignal{4, MapLocation(1, 1), MapLocation(2, 1)}});
    delta.signals.push_back(Signal{9, IndicatorStringSignal{4, 2, "scouting"}});
    delta.signals.push_back(Signal{9, BytecodesUsedSignal{{4, 5}, {120, 9000}}});
    delta.signals.push_back(Signal{9, GameOverSignal{std::nullopt, DominationFactor::ABORTED}});

    ReplayWriter writer;
    BOOST_REQUIRE(writer.open(handStream));
    BOOST_REQUIRE(writer.writeHeader(MatchHeader{}));
    BOOST_REQUIRE(writer.writeRound(delta));
    writer.close();

    ReplayReader reader;
    BOOST_REQUIRE(reader.open(reopen(handStream)));
    std::vector<ReplayMatch> matches;
    BOOST_REQUIRE(reader.readAll(matches));
    BOOST_REQUIRE_EQUAL(matches.size(), 1u);
    BOOST_CHECK(!matches[0].footer.has_value());
    BOOST_REQUIRE_EQUAL(matches[0].rounds.size(), 1u);

    const auto& signals = matches[0].rounds[0].signals;
    BOOST_REQUIRE_EQUAL(signals.size(), 4u);
    BOOST_CHECK_EQUAL(signals[0].getKind(), SignalKind::Move);
    BOOST_CHECK_EQUAL(signals[0].as<MoveSignal>()->to, MapLocation(2, 1));
    BOOST_CHECK_EQUAL(signals[1].as<IndicatorStringSignal>()->text, "scouting");
    BOOST_CHECK_EQUAL(signals[2].as<BytecodesUsedSignal>()->used[1], 9000);
    BOOST_CHECK(!signals[3].as<GameOverSignal>()->winner.has_value());
    BOOST_CHECK_EQUAL(signals[3].round, 9);
}

BOOST_AUTO_TEST_CASE(TestTruncatedStreamKeepsCompleteMatches) {
    ReplayReader reader;
    BOOST_REQUIRE(reader.open(reopen(stream, 3)));

    std::vector<ReplayMatch> matches;
    BOOST_CHECK(!reader.readAll(matches));
    BOOST_CHECK(!reader.getLastError().empty());
    BOOST_REQUIRE_EQUAL(matches.size(), 2u);
    BOOST_CHECK(matches[0].footer.has_value());
    BOOST_CHECK(!matches[1].footer.has_value());
}

BOOST_AUTO_TEST_CASE(TestRejectsForeignData) {
    ReplayReader reader;
    BOOST_CHECK(!reader.open(std::make_shared<std::istringstream>(std::string("NOTARENA\x01\x00\x00\x00"))));
    BOOST_CHECK(!reader.getLastError().empty());

    std::vector<ReplayMatch> matches;
    BOOST_CHECK(!reader.readAll(matches));

    // Right signature, wrong version
    std::string bytes = stream->str();
    bytes[sizeof(ReplayFormat::SIGNATURE)] = static_cast<char>(ReplayFormat::VERSION + 1);
    BOOST_CHECK(!reader.open(std::make_shared<std::istringstream>(bytes)));

    BOOST_CHECK(!reader.open((std::filesystem::temp_directory_path() / "arena_no_such_replay.arena").string()));
}

BOOST_AUTO_TEST_SUITE_END()
