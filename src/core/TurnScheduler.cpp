/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/TurnScheduler.hpp"
#include "ai/RobotController.hpp"
#include "core/Logger.hpp"
#include "world/GameWorld.hpp"
#include <boost/context/fiber.hpp>
#include <boost/context/protected_fixedsize_stack.hpp>
#include <algorithm>
#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace ArenaEngine {
namespace {

/*
 * Stacks of programs that kept swallowing ProgramRetired. They are never
 * resumed and never destroyed: destroying a suspended fiber forces an unwind
 * through the same robot code, and a catch-all there aborts the process.
 */
void parkFiber(boost::context::fiber&& fiber) {
    static std::mutex parkedMutex;
    static auto* parked = new std::vector<boost::context::fiber>();
    std::lock_guard<std::mutex> lock(parkedMutex);
    parked->push_back(std::move(fiber));
}

} // anonymous namespace

/**
 * One robot's suspended execution. A program is retired before it is
 * destroyed, which leaves the fiber empty; member order keeps the player and
 * controller alive for as long as the fiber might still run.
 */
struct TurnScheduler::RobotProgram {
    std::unique_ptr<RobotPlayer> player;
    std::unique_ptr<RobotController> controller;
    boost::context::fiber caller;
    TurnState state{TurnState::Pending};
    FaultKind fault{FaultKind::None};
    std::string message;
    bool finished{false};
    boost::context::fiber fiber;
};

TurnScheduler::TurnScheduler(const MatchConfig& config, RobotPlayerFactory teamA, RobotPlayerFactory teamB)
    : m_config(config),
      m_factories{std::move(teamA), std::move(teamB)} {}

TurnScheduler::~TurnScheduler() {
    reset();
}

int32_t TurnScheduler::getFaultTally(Team team) const {
    return team == Team::NEUTRAL ? 0 : m_faultTally[EntityTraits::teamIndex(team)];
}

bool TurnScheduler::isSilenced(Team team) const {
    return team != Team::NEUTRAL && m_silenced[EntityTraits::teamIndex(team)];
}

void TurnScheduler::reset() {
    for (auto& [id, program] : m_programs) {
        retire(id, *program);
    }
    m_programs.clear();
    m_faultTally = {};
    m_silenced = {};
}

std::vector<TurnReport> TurnScheduler::runRound(GameWorld& world) {
    return runRound(world, world.getEntities().liveIds());
}

std::vector<TurnReport> TurnScheduler::runRound(GameWorld& world, std::vector<EntityID> roundStartIds) {
    std::sort(roundStartIds.begin(), roundStartIds.end());

    std::vector<TurnReport> reports;
    reports.reserve(roundStartIds.size());

    for (EntityID id : roundStartIds) {
        const EntityRecord* record = world.getEntities().get(id);
        if (record == nullptr) {
            continue;
        }
        const Team team = record->team;
        if (team == Team::NEUTRAL || isSilenced(team)) {
            continue;
        }

        TurnReport report = runTurn(world, id, team);
        applyFaultPolicy(world, report);
        reports.push_back(std::move(report));
    }
    return reports;
}

TurnScheduler::RobotProgram* TurnScheduler::ensureProgram(GameWorld& world, EntityID id, Team team,
                                                          TurnReport& report) {
    auto it = m_programs.find(id);
    if (it != m_programs.end()) {
        return it->second.get();
    }

    const RobotPlayerFactory& factory = m_factories[EntityTraits::teamIndex(team)];
    auto program = std::make_unique<RobotProgram>();
    std::string playerName;
    try {
        if (factory) {
            program->player = factory();
        }
        if (program->player) {
            playerName = program->player->getName();
        }
    } catch (const std::exception& e) {
        report.state = TurnState::Faulted;
        report.fault = FaultKind::AgentRuntime;
        report.message = std::format("team program factory threw: {}", e.what());
        return nullptr;
    } catch (...) {
        report.state = TurnState::Faulted;
        report.fault = FaultKind::AgentRuntime;
        report.message = "team program factory threw an unknown exception";
        return nullptr;
    }
    if (!program->player) {
        report.state = TurnState::Faulted;
        report.fault = FaultKind::AgentRuntime;
        report.message = "team program factory produced no player";
        return nullptr;
    }

    RobotProgram* raw = program.get();
    program->controller = std::make_unique<RobotController>(
        world, id, m_config.operationBudget,
        [raw](SuspendReason reason) {
            if (reason != SuspendReason::Abandoned) {
                raw->state = reason == SuspendReason::BudgetExhausted ? TurnState::BudgetExhausted
                                                                      : TurnState::Yielded;
            }
            raw->caller = std::move(raw->caller).resume();
            if (raw->controller->isRetiring()) {
                throw ProgramRetired{};
            }
        });

    program->fiber = boost::context::fiber(
        std::allocator_arg, boost::context::protected_fixedsize_stack(ROBOT_STACK_SIZE),
        [raw](boost::context::fiber&& caller) {
            raw->caller = std::move(caller);
            try {
                raw->player->run(*raw->controller);
                raw->state = TurnState::Yielded;
            } catch (const boost::context::detail::forced_unwind&) {
                throw;
            } catch (const ProgramRetired&) {
                // Released while suspended, nothing to report
            } catch (const std::exception& e) {
                raw->state = TurnState::Faulted;
                raw->fault = FaultKind::AgentRuntime;
                raw->message = e.what();
            } catch (...) {
                raw->state = TurnState::Faulted;
                raw->fault = FaultKind::AgentRuntime;
                raw->message = "unknown exception";
            }
            raw->finished = true;
            return std::move(raw->caller);
        });

    SCHEDULER_DEBUG(std::format("Created {} program for robot {}", playerName, id));
    return m_programs.emplace(id, std::move(program)).first->second.get();
}

TurnReport TurnScheduler::runTurn(GameWorld& world, EntityID id, Team team) {
    TurnReport report;
    report.id = id;
    report.team = team;

    RobotProgram* program = ensureProgram(world, id, team, report);
    if (program == nullptr) {
        SCHEDULER_WARN(std::format("Robot {} has no program: {}", id, report.message));
        return report;
    }

    program->controller->beginTurn();
    program->state = TurnState::Running;
    program->fault = FaultKind::None;
    program->message.clear();
    program->fiber = std::move(program->fiber).resume();

    report.state = program->state;
    report.operationsUsed = program->controller->getOperationsUsed();
    report.fault = program->state == TurnState::BudgetExhausted ? FaultKind::BudgetExhausted : program->fault;
    report.message = program->message;
    program->state = TurnState::Committed;

    if (report.state == TurnState::Faulted) {
        SCHEDULER_WARN(std::format("Robot {} faulted: {}", id, report.message));
    }

    // Finished programs restart next round; removed robots never run again
    if (program->finished || !world.getEntities().isAlive(id)) {
        retire(id, *program);
        m_programs.erase(id);
    }
    return report;
}

void TurnScheduler::applyFaultPolicy(GameWorld& world, const TurnReport& report) {
    const bool counts = report.state == TurnState::Faulted ||
                        (report.state == TurnState::BudgetExhausted && m_config.silenceOnBudgetExhaustion);
    if (!counts) {
        return;
    }

    const size_t index = EntityTraits::teamIndex(report.team);
    const int32_t tally = ++m_faultTally[index];
    if (m_config.faultPolicy == FaultPolicy::Continue || tally <= m_config.faultTolerance) {
        return;
    }

    switch (m_config.faultPolicy) {
        case FaultPolicy::Silence:
            if (!m_silenced[index]) {
                m_silenced[index] = true;
                world.signalTeamSilenced(report.team);
                SCHEDULER_WARN(std::format("Team {} silenced after {} faults",
                                           EntityTraits::teamToString(report.team), tally));
            }
            break;
        case FaultPolicy::Terminate:
            if (world.getEntities().isAlive(report.id)) {
                ActionError result = world.disintegrate(report.id);
                if (result != ActionError::None) {
                    SCHEDULER_ERROR(std::format("Failed to terminate robot {}: {}",
                                                report.id, actionErrorToString(result)));
                }
                SCHEDULER_INFO(std::format("Robot {} terminated after fault", report.id));
            }
            if (auto it = m_programs.find(report.id); it != m_programs.end()) {
                retire(report.id, *it->second);
                m_programs.erase(it);
            }
            break;
        case FaultPolicy::Continue:
            break;
    }
}

void TurnScheduler::releaseDeadPrograms(const GameWorld& world) {
    const auto& entities = world.getEntities();
    for (auto it = m_programs.begin(); it != m_programs.end();) {
        if (!entities.isAlive(it->first)) {
            retire(it->first, *it->second);
            it = m_programs.erase(it);
        } else {
            ++it;
        }
    }
}

void TurnScheduler::retire(EntityID id, RobotProgram& program) {
    if (!program.fiber) {
        return;
    }
    // Resume once more so the robot's stack unwinds through ProgramRetired
    program.controller->beginRetirement();
    program.fiber = std::move(program.fiber).resume();
    if (program.fiber) {
        SCHEDULER_ERROR(std::format("Robot {} would not unwind; its stack is abandoned", id));
        parkFiber(std::move(program.fiber));
    }
}

} // namespace ArenaEngine
