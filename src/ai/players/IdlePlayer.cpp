/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/players/IdlePlayer.hpp"
#include "ai/RobotController.hpp"

namespace ArenaEngine {

void IdlePlayer::run(RobotController& rc) {
    while (true) {
        rc.yield();
    }
}

} // namespace ArenaEngine
