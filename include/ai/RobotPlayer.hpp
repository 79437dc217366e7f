/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROBOT_PLAYER_HPP
#define ROBOT_PLAYER_HPP

#include <functional>
#include <memory>
#include <string>

namespace ArenaEngine {

class RobotController;

/**
 * @brief Decision logic of one robot
 *
 * Every live entity owns one RobotPlayer instance, created from its team's
 * factory the first round it is scheduled. run() executes inside the robot's
 * own execution context: RobotController::yield() and budget exhaustion
 * suspend it mid-call and the next round resumes it at the same point.
 * Returning from run() ends the turn; the next round calls run() again on a
 * fresh instance.
 *
 * Anything thrown out of run() is recorded as a runtime fault of the robot
 * and never reaches the match.
 */
class RobotPlayer {
public:
    virtual ~RobotPlayer() = default;

    virtual void run(RobotController& rc) = 0;

    virtual std::string getName() const = 0;
};

using RobotPlayerFactory = std::function<std::unique_ptr<RobotPlayer>()>;

} // namespace ArenaEngine

#endif // ROBOT_PLAYER_HPP
