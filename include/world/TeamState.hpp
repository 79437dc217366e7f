/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TEAM_STATE_HPP
#define TEAM_STATE_HPP

#include "core/GameConstants.hpp"
#include <array>
#include <cstdint>

namespace ArenaEngine {

/// Per-team integers carried from one match of a series to the next
using TeamMemory = std::array<int64_t, GameConstants::TEAM_MEMORY_LENGTH>;

/**
 * @brief Shared state of one team, owned by GameWorld
 *
 * Mutated only by World actions (spend, mine, research, memory writes) and
 * by GameWorld::endRound (income, upkeep).
 */
struct TeamState {
    double ore{0.0};
    double oreAtLastReport{0.0};

    // Ore value of enemy entities this team destroyed
    double capturedScore{0.0};

    std::array<int32_t, static_cast<size_t>(Upgrade::COUNT)> researchProgress{};

    TeamMemory memory{};
    TeamMemory initialMemory{};

    bool resigned{false};
    bool declaredWinner{false};
    bool silenced{false};

    int32_t progressOf(Upgrade upgrade) const {
        return researchProgress[static_cast<size_t>(upgrade)];
    }

    bool hasUpgrade(Upgrade upgrade) const {
        return progressOf(upgrade) >= UpgradeTraits::roundsToComplete(upgrade);
    }
};

} // namespace ArenaEngine

#endif // TEAM_STATE_HPP
