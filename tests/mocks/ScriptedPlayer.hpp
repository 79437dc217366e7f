/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SCRIPTED_PLAYER_HPP
#define SCRIPTED_PLAYER_HPP

#include "ai/RobotController.hpp"
#include "ai/RobotPlayer.hpp"
#include <functional>
#include <memory>
#include <string>

/**
 * RobotPlayer whose run() is a test-supplied function.
 * The factory helpers hand one shared script to every robot of a team.
 */
class ScriptedPlayer : public ArenaEngine::RobotPlayer {
public:
    using Script = std::function<void(ArenaEngine::RobotController&)>;

    explicit ScriptedPlayer(Script script, std::string name = "scripted")
        : m_script(std::move(script)), m_name(std::move(name)) {}

    void run(ArenaEngine::RobotController& rc) override {
        if (m_script) {
            m_script(rc);
        }
    }

    std::string getName() const override { return m_name; }

    static ArenaEngine::RobotPlayerFactory factory(Script script, std::string name = "scripted") {
        return [script = std::move(script), name = std::move(name)]() {
            return std::make_unique<ScriptedPlayer>(script, name);
        };
    }

    /// Every robot yields forever
    static ArenaEngine::RobotPlayerFactory idle() {
        return factory([](ArenaEngine::RobotController& rc) {
            while (true) {
                rc.yield();
            }
        }, "idle");
    }

private:
    Script m_script;
    std::string m_name;
};

#endif // SCRIPTED_PLAYER_HPP
