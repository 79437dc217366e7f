/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Match.hpp"
#include "ai/PlayerRegistry.hpp"
#include "core/ArenaErrors.hpp"
#include "core/Logger.hpp"
#include "world/GameWorld.hpp"
#include <format>
#include <random>
#include <stdexcept>

namespace ArenaEngine {

Match::Match() = default;

// Scheduler first: suspended robot programs still reference the world
Match::~Match() {
    m_scheduler.reset();
    m_world.reset();
}

void Match::initialize(const MatchConfig& config, const PlayerRegistry& registry, const GameMap& map,
                       const std::array<TeamMemory, 2>& carriedMemory,
                       int32_t matchIndex, int32_t matchCount) {
    if (m_initialized) {
        throw std::logic_error("Match::initialize called twice");
    }

    if (auto error = map.validate()) {
        throw InitializationError(std::format("Invalid map '{}': {}", map.getName(), *error));
    }

    MatchConfig resolved = config;
    if (auto cap = map.getRoundCap()) {
        resolved.roundCap = *cap;
    }

    std::array<RobotPlayerFactory, 2> factories;
    const std::array<std::string, 2> names{resolved.teamA, resolved.teamB};
    for (size_t i = 0; i < names.size(); ++i) {
        const char* team = EntityTraits::teamToString(i == 0 ? Team::A : Team::B);
        if (names[i].empty()) {
            throw InitializationError(std::format("Team {} has no program", team));
        }
        factories[i] = registry.getFactory(names[i]);
        if (!factories[i]) {
            throw InitializationError(std::format("Unknown program '{}' for team {}", names[i], team));
        }
    }

    auto world = std::make_unique<GameWorld>(map, resolved, carriedMemory);
    world->beginRound(0);

    auto seed = [&world](Team team, EntityKind kind, const MapLocation& location) {
        EntityID id = INVALID_ENTITY_ID;
        ActionError result = world->seedEntity(team, kind, location, id);
        if (result != ActionError::None) {
            throw InitializationError(std::format("Cannot place {} {} at ({}, {}): {}",
                                                  EntityTraits::teamToString(team),
                                                  EntityTraits::kindToString(kind),
                                                  location.x, location.y, actionErrorToString(result)));
        }
    };

    // HQ A gets id 0 and HQ B id 1; validate() guarantees both exist
    seed(Team::A, EntityKind::HQ, *map.getHQLocation(Team::A));
    seed(Team::B, EntityKind::HQ, *map.getHQLocation(Team::B));
    for (Team team : {Team::A, Team::B}) {
        for (const MapLocation& location : map.getTowerLocations(team)) {
            seed(team, EntityKind::Tower, location);
        }
    }

    m_header = MatchHeader{};
    m_header.mapName = map.getName();
    m_header.mapWidth = map.getWidth();
    m_header.mapHeight = map.getHeight();
    m_header.mapSeed = map.getSeed();
    m_header.teamA = resolved.teamA;
    m_header.teamB = resolved.teamB;
    m_header.initialMemory = carriedMemory;
    m_header.matchIndex = matchIndex;
    m_header.matchCount = matchCount;
    for (const Signal& signal : world->getSignalLog().drain()) {
        if (const auto* spawn = signal.as<SpawnSignal>()) {
            m_header.initialBodies.push_back(SpawnedBody::fromSignal(*spawn));
        }
    }

    m_config = resolved;
    m_scheduler = std::make_unique<TurnScheduler>(resolved, factories[0], factories[1]);
    m_world = std::move(world);
    m_initialized = true;

    MATCH_INFO(std::format("Initialized {} (match {} of {}, round cap {})",
                           toString(), matchIndex + 1, matchCount, m_config.roundCap));
}

RoundResult Match::runRound() {
    if (m_finished) {
        throw MatchFinishedError("runRound() called after finish()");
    }
    if (!m_initialized) {
        throw std::logic_error("runRound() called before initialize()");
    }
    if (m_over) {
        return RoundResult{GameState::DONE, std::nullopt};
    }

    ++m_round;
    Logger::SetRoundStamp(m_header.matchIndex, m_round);
    m_world->beginRound(m_round);

    const auto reports = m_scheduler->runRound(*m_world);
    m_world->endRound();
    if (m_config.bytecodesUsedEnabled) {
        emitOperationUsage(reports);
    }
    m_scheduler->releaseDeadPrograms(*m_world);

    if (auto outcome = checkTermination()) {
        m_world->getSignalLog().emit(GameOverSignal{outcome->winner, outcome->factor});
        conclude(outcome->winner, outcome->factor);
    }

    RoundDelta delta{m_round, m_world->getSignalLog().drain()};
    MATCH_DEBUG(std::format("Round {} produced {} signals", m_round, delta.signals.size()));

    const bool breakpoint = m_world->consumeBreakpoint();
    const bool pause = m_pauseRequested.exchange(false, std::memory_order_relaxed);
    if ((breakpoint || pause) && !m_over) {
        return RoundResult{GameState::BREAKPOINT, std::move(delta)};
    }
    return RoundResult{GameState::RUNNING, std::move(delta)};
}

void Match::emitOperationUsage(const std::vector<TurnReport>& reports) {
    if (reports.empty()) {
        return;
    }
    BytecodesUsedSignal usage;
    usage.ids.reserve(reports.size());
    usage.used.reserve(reports.size());
    for (const TurnReport& report : reports) {
        usage.ids.push_back(report.id);
        usage.used.push_back(report.operationsUsed);
    }
    m_world->getSignalLog().emit(std::move(usage));
}

std::optional<Match::Outcome> Match::checkTermination() const {
    const TeamState& a = m_world->getTeamState(Team::A);
    const TeamState& b = m_world->getTeamState(Team::B);

    // Explicit victories: debug win, then a completed Nuke
    for (Team team : {Team::A, Team::B}) {
        if (m_world->getTeamState(team).declaredWinner) {
            return Outcome{team, DominationFactor::OWNED};
        }
    }
    for (Team team : {Team::A, Team::B}) {
        if (m_world->getTeamState(team).hasUpgrade(Upgrade::Nuke)) {
            return Outcome{team, DominationFactor::OWNED};
        }
    }

    if (a.resigned != b.resigned) {
        return Outcome{a.resigned ? Team::B : Team::A, DominationFactor::RESIGNED};
    }

    const bool aStanding = m_world->hasLiveHQ(Team::A);
    const bool bStanding = m_world->hasLiveHQ(Team::B);
    if (aStanding != bStanding) {
        const DominationFactor factor = m_round < m_config.roundCap / 2 ? DominationFactor::DESTROYED
                                                                        : DominationFactor::PWNED;
        return Outcome{aStanding ? Team::A : Team::B, factor};
    }

    // Both resigned or both HQs fell this round: decide as at the cap
    if ((a.resigned && b.resigned) || (!aStanding && !bStanding) || m_round >= m_config.roundCap) {
        return resolveTieBreak();
    }
    return std::nullopt;
}

Match::Outcome Match::resolveTieBreak() const {
    const double scoreA = m_world->getTeamState(Team::A).capturedScore;
    const double scoreB = m_world->getTeamState(Team::B).capturedScore;
    if (scoreA != scoreB) {
        return Outcome{scoreA > scoreB ? Team::A : Team::B, DominationFactor::BEAT};
    }

    const int32_t structuresA = m_world->structureCount(Team::A);
    const int32_t structuresB = m_world->structureCount(Team::B);
    if (structuresA != structuresB) {
        return Outcome{structuresA > structuresB ? Team::A : Team::B, DominationFactor::BARELY_BEAT};
    }

    const int64_t healthA = m_world->aggregateHealth(Team::A);
    const int64_t healthB = m_world->aggregateHealth(Team::B);
    if (healthA != healthB) {
        return Outcome{healthA > healthB ? Team::A : Team::B, DominationFactor::WON_BY_DUBIOUS_REASONS};
    }

    // mt19937 output is fixed by the standard, so the same map always picks the same team
    std::mt19937 coin(m_world->getMap().getSeed());
    return Outcome{(coin() & 1u) == 0 ? Team::A : Team::B, DominationFactor::WON_BY_DEFAULT};
}

void Match::conclude(std::optional<Team> winner, DominationFactor factor) {
    m_over = true;

    m_stats = GameStats{};
    m_stats.winner = winner;
    m_stats.factor = factor;
    m_stats.rounds = m_round;

    MatchFooter footer;
    footer.winner = winner;
    footer.factor = factor;
    footer.rounds = m_round;

    for (Team team : {Team::A, Team::B}) {
        const size_t i = EntityTraits::teamIndex(team);
        const TeamState& state = m_world->getTeamState(team);
        m_stats.capturedScore[i] = state.capturedScore;
        m_stats.structures[i] = m_world->structureCount(team);
        m_stats.totalHealth[i] = m_world->aggregateHealth(team);
        m_stats.faults[i] = m_scheduler->getFaultTally(team);
        footer.finalMemory[i] = state.memory;
    }
    m_footer = footer;

    MATCH_INFO(std::format("Match over after round {}: {} ({})", m_round,
                           winner ? EntityTraits::teamToString(*winner) : "nobody",
                           dominationFactorToString(factor)));
}

void Match::abort(const std::string& reason) {
    if (!m_initialized || m_over) {
        return;
    }
    MATCH_WARN(std::format("Match aborted: {}", reason));
    conclude(std::nullopt, DominationFactor::ABORTED);
}

void Match::finish() {
    if (m_finished) {
        return;
    }
    if (m_initialized && !m_over) {
        abort("finished before a result");
    }
    if (m_footer) {
        m_computedMemory = m_footer->finalMemory;
    }
    m_scheduler.reset();
    m_world.reset();
    m_finished = true;
}

std::optional<Team> Match::getWinner() const {
    return m_over ? m_stats.winner : std::nullopt;
}

std::string Match::getWinnerString() const {
    std::string teamName = "nobody";
    if (auto winner = getWinner()) {
        teamName = *winner == Team::A ? std::format("{} (A)", m_header.teamA)
                                      : std::format("{} (B)", m_header.teamB);
    }

    std::string result;
    if (teamName.size() < 50) {
        result.append((50 - teamName.size()) / 2, ' ');
    }
    result += teamName;
    result += " wins (round " + std::to_string(m_stats.rounds) + ")";
    result += "\nReason: ";

    const auto& s = m_stats;
    switch (s.factor) {
        case DominationFactor::DESTROYED:
            result += "The losing team's HQ was destroyed early.";
            break;
        case DominationFactor::PWNED:
            result += "The losing team's HQ was destroyed.";
            break;
        case DominationFactor::OWNED:
            result += "The winning team claimed an explicit victory.";
            break;
        case DominationFactor::RESIGNED:
            result += "The losing team resigned.";
            break;
        case DominationFactor::BEAT:
            result += std::format("Team A captured {:.0f} ore and Team B captured {:.0f} ore.",
                                  s.capturedScore[0], s.capturedScore[1]);
            break;
        case DominationFactor::BARELY_BEAT:
            result += std::format("Team A had {} structures and Team B had {} structures.",
                                  s.structures[0], s.structures[1]);
            break;
        case DominationFactor::WON_BY_DUBIOUS_REASONS:
            result += std::format("Team A had {} total health and Team B had {} total health.",
                                  s.totalHealth[0], s.totalHealth[1]);
            break;
        case DominationFactor::WON_BY_DEFAULT:
            result += "The teams were tied on every count; won by default.";
            break;
        case DominationFactor::ABORTED:
            result += "The match was aborted.";
            break;
    }
    return result;
}

std::string Match::toString() const {
    return std::format("{} vs. {} on {}", m_header.teamA, m_header.teamB, m_header.mapName);
}

} // namespace ArenaEngine
