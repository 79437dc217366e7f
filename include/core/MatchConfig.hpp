/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MATCH_CONFIG_HPP
#define MATCH_CONFIG_HPP

#include "core/GameConstants.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ArenaEngine {

class SettingsManager;

/**
 * @brief What the scheduler does once a team's fault tally passes the tolerance
 */
enum class FaultPolicy : uint8_t {
    Continue = 0,   // Never escalate; faulting programs restart next round
    Silence = 1,    // Stop scheduling every robot of the team
    Terminate = 2   // Disintegrate the faulting robot
};

constexpr const char* faultPolicyToString(FaultPolicy policy) noexcept {
    switch (policy) {
        case FaultPolicy::Continue:  return "continue";
        case FaultPolicy::Silence:   return "silence";
        case FaultPolicy::Terminate: return "terminate";
        default:                     return "unknown";
    }
}

std::optional<FaultPolicy> faultPolicyFromString(std::string_view name);

inline std::ostream& operator<<(std::ostream& os, FaultPolicy policy) {
    return os << faultPolicyToString(policy);
}

/**
 * @brief Resolved configuration values a match depends on
 *
 * The kernel never parses configuration; the runner builds one of these
 * from SettingsManager and passes it down.
 */
struct MatchConfig {
    // engine.*
    int32_t roundCap{GameConstants::DEFAULT_ROUND_CAP};
    int32_t operationBudget{GameConstants::DEFAULT_OPERATION_BUDGET};
    FaultPolicy faultPolicy{FaultPolicy::Continue};
    int32_t faultTolerance{0};
    bool silenceOnBudgetExhaustion{false};
    bool debugMethodsEnabled{true};
    bool breakpointsEnabled{true};
    bool upkeepEnabled{true};
    bool bytecodesUsedEnabled{true};
    double oreIncome{GameConstants::DEFAULT_ORE_INCOME};
    double startingOre{GameConstants::DEFAULT_STARTING_ORE};

    // game.*
    std::string mapPath{"maps"};
    std::vector<std::string> maps{"arena"};
    std::string teamA{"examplefuncsplayer"};
    std::string teamB{"examplefuncsplayer"};

    // server.*
    std::string saveFile{"match.arena"};

    /**
     * @brief Reads every recognised key, falling back to the defaults above
     *
     * An unknown engine.fault_policy value is logged and treated as continue.
     */
    static MatchConfig fromSettings(const SettingsManager& settings);

    /// Writes every field back under its settings key
    void storeTo(SettingsManager& settings) const;
};

} // namespace ArenaEngine

#endif // MATCH_CONFIG_HPP
