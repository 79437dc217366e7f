/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/MatchConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <format>

namespace ArenaEngine {

std::optional<FaultPolicy> faultPolicyFromString(std::string_view name) {
    for (FaultPolicy policy : {FaultPolicy::Continue, FaultPolicy::Silence, FaultPolicy::Terminate}) {
        if (name == faultPolicyToString(policy)) {
            return policy;
        }
    }
    return std::nullopt;
}

MatchConfig MatchConfig::fromSettings(const SettingsManager& settings) {
    MatchConfig config;

    config.roundCap = std::max(1, settings.get<int>("engine", "round_cap", config.roundCap));
    config.operationBudget = std::max(1, settings.get<int>("engine", "operation_budget", config.operationBudget));

    const std::string policyName = settings.get<std::string>("engine", "fault_policy",
                                                             faultPolicyToString(config.faultPolicy));
    if (auto policy = faultPolicyFromString(policyName)) {
        config.faultPolicy = *policy;
    } else {
        SETTINGS_WARNING(std::format("Unknown engine.fault_policy '{}', using continue", policyName));
    }

    config.faultTolerance = std::max(0, settings.get<int>("engine", "fault_tolerance", config.faultTolerance));
    config.silenceOnBudgetExhaustion = settings.get<bool>("engine", "silence_on_budget_exhaustion",
                                                          config.silenceOnBudgetExhaustion);
    config.debugMethodsEnabled = settings.get<bool>("engine", "debug_methods", config.debugMethodsEnabled);
    config.breakpointsEnabled = settings.get<bool>("engine", "breakpoints", config.breakpointsEnabled);
    config.upkeepEnabled = settings.get<bool>("engine", "upkeep", config.upkeepEnabled);
    config.bytecodesUsedEnabled = settings.get<bool>("engine", "bytecodes_used", config.bytecodesUsedEnabled);
    config.oreIncome = settings.get<float>("engine", "ore_income", static_cast<float>(config.oreIncome));
    config.startingOre = settings.get<float>("engine", "starting_ore", static_cast<float>(config.startingOre));

    config.mapPath = settings.get<std::string>("game", "map_path", config.mapPath);
    if (settings.has("game", "maps")) {
        auto maps = settings.getList("game", "maps");
        if (!maps.empty()) {
            config.maps = std::move(maps);
        }
    }
    config.teamA = settings.get<std::string>("game", "team_a", config.teamA);
    config.teamB = settings.get<std::string>("game", "team_b", config.teamB);

    config.saveFile = settings.get<std::string>("server", "save_file", config.saveFile);
    return config;
}

void MatchConfig::storeTo(SettingsManager& settings) const {
    settings.set("engine", "round_cap", roundCap);
    settings.set("engine", "operation_budget", operationBudget);
    settings.set("engine", "fault_policy", std::string(faultPolicyToString(faultPolicy)));
    settings.set("engine", "fault_tolerance", faultTolerance);
    settings.set("engine", "silence_on_budget_exhaustion", silenceOnBudgetExhaustion);
    settings.set("engine", "debug_methods", debugMethodsEnabled);
    settings.set("engine", "breakpoints", breakpointsEnabled);
    settings.set("engine", "upkeep", upkeepEnabled);
    settings.set("engine", "bytecodes_used", bytecodesUsedEnabled);
    settings.set("engine", "ore_income", static_cast<float>(oreIncome));
    settings.set("engine", "starting_ore", static_cast<float>(startingOre));

    std::string joined;
    for (const auto& map : maps) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += map;
    }
    settings.set("game", "map_path", mapPath);
    settings.set("game", "maps", joined);
    settings.set("game", "team_a", teamA);
    settings.set("game", "team_b", teamB);

    settings.set("server", "save_file", saveFile);
}

} // namespace ArenaEngine
