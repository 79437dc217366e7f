/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MATCH_SERIES_HPP
#define MATCH_SERIES_HPP

#include "core/Match.hpp"
#include "core/MatchConfig.hpp"
#include "replay/ReplayRecords.hpp"
#include "world/GameMap.hpp"
#include "world/TeamState.hpp"
#include <array>
#include <functional>
#include <string>
#include <vector>

namespace ArenaEngine {

class PlayerRegistry;
class ReplayWriter;

/// What one finished match of a series produced
struct MatchResult {
    MatchHeader header;
    MatchFooter footer;
    GameStats stats;
    std::string winnerString;
};

/**
 * @brief Runs matches back to back on a list of maps
 *
 * The memory each team leaves at the end of a match is handed to the next
 * match's header, so team programs can learn across a series.
 */
class MatchSeries {
public:
    using RoundObserver = std::function<void(const Match&, const RoundDelta&)>;

    MatchSeries(const MatchConfig& config, const PlayerRegistry& registry);

    /// Called after every executed round with its delta
    void setRoundObserver(RoundObserver observer) { m_observer = std::move(observer); }

    /**
     * @brief Plays one match per map, in order
     * @param writer Receives every header, delta and footer when not null
     * @throws InitializationError from the first match that cannot start
     */
    std::vector<MatchResult> run(const std::vector<GameMap>& maps, ReplayWriter* writer = nullptr);

    /// Memory handed to the next match; starts zeroed
    const std::array<TeamMemory, 2>& getCarriedMemory() const { return m_memory; }
    void setCarriedMemory(const std::array<TeamMemory, 2>& memory) { m_memory = memory; }

private:
    MatchConfig m_config;
    const PlayerRegistry& m_registry;
    std::array<TeamMemory, 2> m_memory{};
    RoundObserver m_observer;

    MatchResult playMatch(const GameMap& map, int32_t index, int32_t count, ReplayWriter* writer);
};

} // namespace ArenaEngine

#endif // MATCH_SERIES_HPP
