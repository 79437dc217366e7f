/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/PlayerRegistry.hpp"
#include "core/ArenaErrors.hpp"
#include "core/Logger.hpp"
#include "core/MatchConfig.hpp"
#include "core/MatchSeries.hpp"
#include "managers/SettingsManager.hpp"
#include "replay/ReplayWriter.hpp"
#include "world/MapLoader.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cstdio>
#include <exception>
#include <format>
#include <string>
#include <vector>

// Settings file used when none is given on the command line
const std::string DEFAULT_SETTINGS_PATH{"res/settings.json"};

int main(int argc, char* argv[]) {
  const std::string settingsPath = argc > 1 ? argv[1] : DEFAULT_SETTINGS_PATH;
  RUNNER_INFO(std::format("Starting ArenaEngine with settings {}", settingsPath));

  auto& settingsManager = ArenaEngine::SettingsManager::Instance();
  if (!settingsManager.loadFromFile(settingsPath)) {
    RUNNER_WARN(std::format("Failed to load {} - using defaults", settingsPath));
  }
  const ArenaEngine::MatchConfig config = ArenaEngine::MatchConfig::fromSettings(settingsManager);

  std::vector<ArenaEngine::GameMap> maps;
  for (const auto& name : config.maps) {
    const std::string path = ArenaEngine::MapLoader::resolvePath(config.mapPath, name);
    auto map = ArenaEngine::MapLoader::loadFromFile(path);
    if (!map) {
      RUNNER_CRITICAL(std::format("Cannot load map '{}' from {}", name, path));
      return -1;
    }
    maps.push_back(std::move(*map));
  }

  const auto registry = ArenaEngine::PlayerRegistry::withSamplePlayers();

  ArenaEngine::ReplayWriter writer;
  ArenaEngine::ReplayWriter* replay = nullptr;
  if (!config.saveFile.empty()) {
    if (writer.open(config.saveFile)) {
      replay = &writer;
    } else {
      RUNNER_ERROR(std::format("Cannot write replay to {} - continuing without one", config.saveFile));
    }
  }

  // Wall-clock timing is for the console only, never fed back into the match
  const Uint64 frequency = SDL_GetPerformanceFrequency();
  Uint64 slowestRound = 0;
  ArenaEngine::MatchSeries series(config, registry);
  series.setRoundObserver([&slowestRound, last = SDL_GetPerformanceCounter()](
                              const ArenaEngine::Match&, const ArenaEngine::RoundDelta&) mutable {
    const Uint64 now = SDL_GetPerformanceCounter();
    slowestRound = std::max(slowestRound, now - last);
    last = now;
  });

  std::vector<ArenaEngine::MatchResult> results;
  const Uint64 start = SDL_GetPerformanceCounter();
  try {
    results = series.run(maps, replay);
  } catch (const ArenaEngine::InitializationError& e) {
    RUNNER_CRITICAL(std::format("Match could not start: {}", e.what()));
    return -1;
  }
  const double elapsedMs = static_cast<double>(SDL_GetPerformanceCounter() - start) * 1000.0 /
                           static_cast<double>(frequency);
  writer.close();

  for (size_t i = 0; i < results.size(); ++i) {
    const auto& header = results[i].header;
    std::printf("Match %zu of %zu: %s vs. %s on %s\n", i + 1, results.size(),
                header.teamA.c_str(), header.teamB.c_str(), header.mapName.c_str());
    std::printf("%s\n\n", results[i].winnerString.c_str());
  }

  RUNNER_INFO(std::format("Series finished in {:.1f} ms (slowest round {:.3f} ms)", elapsedMs,
                          static_cast<double>(slowestRound) * 1000.0 / static_cast<double>(frequency)));
  return 0;
}
