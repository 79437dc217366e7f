/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/MatchSeries.hpp"
#include "ai/PlayerRegistry.hpp"
#include "core/Logger.hpp"
#include "replay/ReplayWriter.hpp"
#include <format>

namespace ArenaEngine {

MatchSeries::MatchSeries(const MatchConfig& config, const PlayerRegistry& registry)
    : m_config(config), m_registry(registry) {}

std::vector<MatchResult> MatchSeries::run(const std::vector<GameMap>& maps, ReplayWriter* writer) {
    std::vector<MatchResult> results;
    results.reserve(maps.size());

    const auto count = static_cast<int32_t>(maps.size());
    for (int32_t index = 0; index < count; ++index) {
        results.push_back(playMatch(maps[static_cast<size_t>(index)], index, count, writer));
    }
    return results;
}

MatchResult MatchSeries::playMatch(const GameMap& map, int32_t index, int32_t count, ReplayWriter* writer) {
    Match match;
    match.initialize(m_config, m_registry, map, m_memory, index, count);

    if (writer != nullptr && !writer->writeHeader(match.getHeader())) {
        MATCH_ERROR(std::format("Failed to record header of match {}", index + 1));
    }

    while (true) {
        RoundResult result = match.runRound();
        if (result.state == GameState::DONE) {
            break;
        }
        if (result.delta) {
            if (writer != nullptr && !writer->writeRound(*result.delta)) {
                MATCH_ERROR(std::format("Failed to record round {}", result.delta->round));
            }
            if (m_observer) {
                m_observer(match, *result.delta);
            }
        }
        if (result.state == GameState::BREAKPOINT) {
            // Headless: nothing to pause for, carry on with the next round
            MATCH_INFO(std::format("Breakpoint after round {}", match.getRoundNumber()));
        }
    }

    MatchResult result;
    result.header = match.getHeader();
    result.footer = *match.getFooter();
    result.stats = match.getGameStats();
    result.winnerString = match.getWinnerString();

    match.finish();
    m_memory = match.getComputedMemory();
    Logger::ClearRoundStamp();

    if (writer != nullptr && !writer->writeFooter(result.footer)) {
        MATCH_ERROR(std::format("Failed to record footer of match {}", index + 1));
    }
    return result;
}

} // namespace ArenaEngine
