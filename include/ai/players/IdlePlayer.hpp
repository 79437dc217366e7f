/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IDLE_PLAYER_HPP
#define IDLE_PLAYER_HPP

#include "ai/RobotPlayer.hpp"
#include <string>

namespace ArenaEngine {

/**
 * @brief Team program that never acts; every robot yields forever
 */
class IdlePlayer : public RobotPlayer {
public:
    static constexpr const char* NAME = "idleplayer";

    void run(RobotController& rc) override;
    std::string getName() const override { return NAME; }
};

} // namespace ArenaEngine

#endif // IDLE_PLAYER_HPP
