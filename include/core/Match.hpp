/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MATCH_HPP
#define MATCH_HPP

/**
 * @file Match.hpp
 * @brief Drives one match round by round
 *
 * A round runs every robot that was alive at its start, then the World's
 * end-of-round upkeep, then the termination check, and finally drains the
 * Signal Log into the round's RoundDelta. Once a termination condition is
 * met the deciding round still returns its delta (ending in a GameOver
 * signal); every later call returns DONE without one.
 *
 * Round numbers start at 1. Signals of the starting entities are stamped
 * round 0 and go to the MatchHeader instead of a delta.
 */

#include "core/MatchConfig.hpp"
#include "core/TurnScheduler.hpp"
#include "events/Signal.hpp"
#include "replay/ReplayRecords.hpp"
#include "world/GameMap.hpp"
#include "world/TeamState.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ArenaEngine {

class GameWorld;
class PlayerRegistry;

enum class GameState : uint8_t {
    RUNNING = 0,     // Round executed, more to come
    BREAKPOINT = 1,  // Round executed, pause requested
    DONE = 2         // Match over, nothing executed
};

constexpr const char* gameStateToString(GameState state) noexcept {
    switch (state) {
        case GameState::RUNNING:    return "RUNNING";
        case GameState::BREAKPOINT: return "BREAKPOINT";
        case GameState::DONE:       return "DONE";
        default:                    return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, GameState state) {
    return os << gameStateToString(state);
}

struct RoundResult {
    GameState state{GameState::DONE};
    std::optional<RoundDelta> delta;
};

/**
 * @brief Standings at the end of a match, indexed by team (A, B)
 */
struct GameStats {
    std::optional<Team> winner;
    DominationFactor factor{DominationFactor::ABORTED};
    int32_t rounds{0};
    std::array<double, 2> capturedScore{};
    std::array<int32_t, 2> structures{};
    std::array<int64_t, 2> totalHealth{};
    std::array<int32_t, 2> faults{};
};

class Match {
public:
    Match();
    ~Match();

    Match(const Match&) = delete;
    Match& operator=(const Match&) = delete;

    /**
     * @brief Builds the world and seeds HQs and towers
     *
     * A round_cap set in the map overrides config.roundCap.
     *
     * @param matchIndex Position of this match in its series
     * @param matchCount Number of matches in the series
     * @throws InitializationError if the map is invalid, a starting site
     *         cannot be seeded, or a team program is empty or unknown
     */
    void initialize(const MatchConfig& config, const PlayerRegistry& registry, const GameMap& map,
                    const std::array<TeamMemory, 2>& carriedMemory = {},
                    int32_t matchIndex = 0, int32_t matchCount = 1);

    /**
     * @brief Executes the next round
     * @throws MatchFinishedError after finish()
     * @throws std::logic_error before initialize()
     */
    RoundResult runRound();

    /// Ends the match with no winner; later rounds return DONE
    void abort(const std::string& reason);

    /// Makes the next executed round return BREAKPOINT; safe from any thread
    void requestPause() { m_pauseRequested.store(true, std::memory_order_relaxed); }

    /**
     * @brief Freezes the carried memory and releases world and scheduler
     *
     * A match finished before it reached a result is aborted first.
     */
    void finish();

    bool isInitialized() const { return m_initialized; }
    bool isFinished() const { return m_finished; }
    bool hasMoreRounds() const { return m_initialized && !m_over; }

    /// Rounds executed so far; the first round is 1
    int32_t getRoundNumber() const { return m_round; }
    int32_t getRoundCap() const { return m_config.roundCap; }

    const MatchHeader& getHeader() const { return m_header; }

    /// Set once the match is over
    const std::optional<MatchFooter>& getFooter() const { return m_footer; }
    const GameStats& getGameStats() const { return m_stats; }

    /// nullopt while running, and for an aborted match
    std::optional<Team> getWinner() const;
    std::string getWinnerString() const;

    /// Memory to carry into the next match; valid after finish()
    const std::array<TeamMemory, 2>& getComputedMemory() const { return m_computedMemory; }

    /// Live world, nullptr after finish()
    GameWorld* getWorld() { return m_world.get(); }
    const TurnScheduler* getScheduler() const { return m_scheduler.get(); }

    std::string toString() const;

private:
    MatchConfig m_config;
    std::unique_ptr<GameWorld> m_world;
    std::unique_ptr<TurnScheduler> m_scheduler;
    MatchHeader m_header;
    std::optional<MatchFooter> m_footer;
    GameStats m_stats;
    std::array<TeamMemory, 2> m_computedMemory{};
    int32_t m_round{0};
    bool m_initialized{false};
    bool m_over{false};
    bool m_finished{false};
    std::atomic<bool> m_pauseRequested{false};

    struct Outcome {
        Team winner;
        DominationFactor factor;
    };

    std::optional<Outcome> checkTermination() const;
    Outcome resolveTieBreak() const;
    void conclude(std::optional<Team> winner, DominationFactor factor);
    void emitOperationUsage(const std::vector<TurnReport>& reports);
};

} // namespace ArenaEngine

#endif // MATCH_HPP
