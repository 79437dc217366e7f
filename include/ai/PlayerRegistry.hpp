/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLAYER_REGISTRY_HPP
#define PLAYER_REGISTRY_HPP

#include "ai/RobotPlayer.hpp"
#include <boost/container/flat_map.hpp>
#include <memory>
#include <string>
#include <vector>

namespace ArenaEngine {

/**
 * @brief Maps team program names to the factories that build their robots
 */
class PlayerRegistry {
public:
    /// Registry with the bundled sample programs already registered
    static PlayerRegistry withSamplePlayers();

    /**
     * @return false if the name is empty, already taken or the factory is empty
     */
    bool registerPlayer(const std::string& name, RobotPlayerFactory factory);
    bool unregisterPlayer(const std::string& name);

    bool hasPlayer(const std::string& name) const;

    /// Empty function if the name is unknown
    RobotPlayerFactory getFactory(const std::string& name) const;

    /// nullptr if the name is unknown
    std::unique_ptr<RobotPlayer> create(const std::string& name) const;

    /// Registered names in ascending order
    std::vector<std::string> getNames() const;
    size_t size() const { return m_factories.size(); }

private:
    boost::container::flat_map<std::string, RobotPlayerFactory> m_factories;
};

} // namespace ArenaEngine

#endif // PLAYER_REGISTRY_HPP
