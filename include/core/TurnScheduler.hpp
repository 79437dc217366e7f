/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TURN_SCHEDULER_HPP
#define TURN_SCHEDULER_HPP

/**
 * @file TurnScheduler.hpp
 * @brief Runs every robot's logic once per round under an operation budget
 *
 * Each robot program lives in its own Boost.Context fiber so it can be
 * suspended in the middle of its logic (yield or budget exhaustion) and
 * resumed at the same point the next round. Robots run strictly one at a
 * time in ascending id order over the ids alive at round start.
 *
 * Faults never leave the scheduler: an exception escaping a program ends
 * that robot's turn, is recorded in its TurnReport and counted against the
 * team. What happens once a team's tally passes the tolerance is decided by
 * MatchConfig::faultPolicy.
 */

#include "ai/RobotPlayer.hpp"
#include "core/MatchConfig.hpp"
#include "entities/Entity.hpp"
#include "entities/EntityKind.hpp"
#include <boost/container/flat_map.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace ArenaEngine {

class GameWorld;

/// Per-turn state machine: Pending -> Running -> outcome -> Committed
enum class TurnState : uint8_t {
    Pending = 0,
    Running = 1,
    Yielded = 2,
    BudgetExhausted = 3,
    Faulted = 4,
    Committed = 5
};

enum class FaultKind : uint8_t {
    None = 0,
    BudgetExhausted = 1,
    AgentRuntime = 2
};

constexpr const char* turnStateToString(TurnState state) noexcept {
    switch (state) {
        case TurnState::Pending:         return "Pending";
        case TurnState::Running:         return "Running";
        case TurnState::Yielded:         return "Yielded";
        case TurnState::BudgetExhausted: return "BudgetExhausted";
        case TurnState::Faulted:         return "Faulted";
        case TurnState::Committed:       return "Committed";
        default:                         return "Unknown";
    }
}

constexpr const char* faultKindToString(FaultKind kind) noexcept {
    switch (kind) {
        case FaultKind::None:            return "None";
        case FaultKind::BudgetExhausted: return "BudgetExhausted";
        case FaultKind::AgentRuntime:    return "AgentRuntime";
        default:                         return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, TurnState state) {
    return os << turnStateToString(state);
}

inline std::ostream& operator<<(std::ostream& os, FaultKind kind) {
    return os << faultKindToString(kind);
}

/**
 * @brief Outcome of one robot's turn
 *
 * state is the outcome the turn ended in (Yielded, BudgetExhausted or
 * Faulted). message carries the exception text of a runtime fault.
 */
struct TurnReport {
    EntityID id{INVALID_ENTITY_ID};
    Team team{Team::NEUTRAL};
    TurnState state{TurnState::Pending};
    int32_t operationsUsed{0};
    FaultKind fault{FaultKind::None};
    std::string message;
};

class TurnScheduler {
public:
    static constexpr size_t ROBOT_STACK_SIZE = 256 * 1024;

    TurnScheduler(const MatchConfig& config, RobotPlayerFactory teamA, RobotPlayerFactory teamB);
    ~TurnScheduler();

    TurnScheduler(const TurnScheduler&) = delete;
    TurnScheduler& operator=(const TurnScheduler&) = delete;

    /// Runs a round over the ids alive right now
    std::vector<TurnReport> runRound(GameWorld& world);

    /**
     * @brief Runs one turn for each id in the round-start snapshot
     *
     * Ids are visited in ascending order. Ids that died earlier in the round
     * and robots of silenced teams are skipped and get no report.
     */
    std::vector<TurnReport> runRound(GameWorld& world, std::vector<EntityID> roundStartIds);

    /// Drops the suspended programs of robots that are no longer alive
    void releaseDeadPrograms(const GameWorld& world);

    /// Drops every program and clears fault tallies
    void reset();

    int32_t getFaultTally(Team team) const;
    bool isSilenced(Team team) const;
    size_t getProgramCount() const { return m_programs.size(); }
    bool hasProgram(EntityID id) const { return m_programs.count(id) > 0; }

private:
    struct RobotProgram;

    MatchConfig m_config;
    std::array<RobotPlayerFactory, 2> m_factories;
    boost::container::flat_map<EntityID, std::unique_ptr<RobotProgram>> m_programs;
    std::array<int32_t, 2> m_faultTally{};
    std::array<bool, 2> m_silenced{};

    RobotProgram* ensureProgram(GameWorld& world, EntityID id, Team team, TurnReport& report);
    TurnReport runTurn(GameWorld& world, EntityID id, Team team);
    void applyFaultPolicy(GameWorld& world, const TurnReport& report);

    /// Unwinds a suspended program so it can be destroyed
    void retire(EntityID id, RobotProgram& program);
};

} // namespace ArenaEngine

#endif // TURN_SCHEDULER_HPP
