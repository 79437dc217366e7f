/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/PlayerRegistry.hpp"
#include "ai/players/ExampleFuncsPlayer.hpp"
#include "ai/players/IdlePlayer.hpp"
#include "core/Logger.hpp"
#include <format>

namespace ArenaEngine {

PlayerRegistry PlayerRegistry::withSamplePlayers() {
    PlayerRegistry registry;
    registry.registerPlayer(ExampleFuncsPlayer::NAME, [] { return std::make_unique<ExampleFuncsPlayer>(); });
    registry.registerPlayer(IdlePlayer::NAME, [] { return std::make_unique<IdlePlayer>(); });
    return registry;
}

bool PlayerRegistry::registerPlayer(const std::string& name, RobotPlayerFactory factory) {
    if (name.empty() || !factory) {
        ARENA_WARN("PlayerRegistry", "Refusing to register an unnamed or empty team program");
        return false;
    }
    if (!m_factories.emplace(name, std::move(factory)).second) {
        ARENA_WARN("PlayerRegistry", std::format("Team program '{}' is already registered", name));
        return false;
    }
    ARENA_DEBUG("PlayerRegistry", std::format("Registered team program '{}'", name));
    return true;
}

bool PlayerRegistry::unregisterPlayer(const std::string& name) {
    return m_factories.erase(name) > 0;
}

bool PlayerRegistry::hasPlayer(const std::string& name) const {
    return m_factories.find(name) != m_factories.end();
}

RobotPlayerFactory PlayerRegistry::getFactory(const std::string& name) const {
    auto it = m_factories.find(name);
    return it != m_factories.end() ? it->second : RobotPlayerFactory{};
}

std::unique_ptr<RobotPlayer> PlayerRegistry::create(const std::string& name) const {
    auto it = m_factories.find(name);
    return it != m_factories.end() ? it->second() : nullptr;
}

std::vector<std::string> PlayerRegistry::getNames() const {
    std::vector<std::string> names;
    names.reserve(m_factories.size());
    for (const auto& [name, factory] : m_factories) {
        names.push_back(name);
    }
    return names;
}

} // namespace ArenaEngine
