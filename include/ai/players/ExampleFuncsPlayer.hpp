/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EXAMPLE_FUNCS_PLAYER_HPP
#define EXAMPLE_FUNCS_PLAYER_HPP

#include "ai/RobotPlayer.hpp"
#include "entities/Entity.hpp"
#include "utils/MapLocation.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace ArenaEngine {

/**
 * @brief Sample team program exercising most of the controller
 *
 * HQs spawn beavers and broadcast the team's beaver count. Beavers wander,
 * mine and build barracks. Barracks produce soldiers and drones. Combat
 * units attack what they can reach and otherwise head for the enemy HQ.
 * Drones fire missiles, which explode next to enemies.
 *
 * Randomness is seeded from the robot id, so a match replays identically.
 */
class ExampleFuncsPlayer : public RobotPlayer {
public:
    static constexpr const char* NAME = "examplefuncsplayer";

    // Broadcast channel carrying the beaver count seen by the HQ
    static constexpr int32_t BEAVER_COUNT_CHANNEL = 0;
    static constexpr int32_t MAX_BEAVERS = 10;

    void run(RobotController& rc) override;
    std::string getName() const override { return NAME; }

private:
    std::mt19937 m_rng;

    void runHQ(RobotController& rc);
    void runTower(RobotController& rc);
    void runBeaver(RobotController& rc);
    void runBarracks(RobotController& rc);
    void runCombatUnit(RobotController& rc);
    void runDrone(RobotController& rc);
    void runMissile(RobotController& rc);

    bool attackWeakestEnemy(RobotController& rc);
    bool tryMove(RobotController& rc, Direction preferred);
    bool trySpawn(RobotController& rc, EntityKind kind, bool building);
    Direction randomDirection();
};

} // namespace ArenaEngine

#endif // EXAMPLE_FUNCS_PLAYER_HPP
