/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <cstdint> // IWYU pragma: keep - Required for uint8_t/int32_t
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace ArenaEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

/**
 * Every line carries the match and round it was written in, so a log can be
 * lined up with the replay. Match sets the stamp for its own thread; -1 means
 * "outside a match". The stamp only labels log lines.
 *
 * Debug builds print everything to stdout. Release builds compile WARN, INFO
 * and DEBUG away and append CRITICAL/ERROR to a log file (Logger.cpp).
 */
class Logger {
private:
  static thread_local int32_t s_matchIndex;
  static thread_local int32_t s_round;

public:
  static std::mutex s_logMutex;

  static void SetRoundStamp(int32_t matchIndex, int32_t round) {
    s_matchIndex = matchIndex;
    s_round = round;
  }

  static void ClearRoundStamp() { SetRoundStamp(-1, -1); }

  static int32_t GetStampedRound() { return s_round; }

  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }

  // "m1 r42" or "-" outside a match
  static std::string FormatStamp() {
    if (s_round < 0) {
      return "-";
    }
    return "m" + std::to_string(s_matchIndex) + " r" + std::to_string(s_round);
  }

#ifdef DEBUG
  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    const std::string stamp = FormatStamp();
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("ArenaEngine - [%s] [%s] %s: %s\n", stamp.c_str(), system,
           getLevelString(level), message);
    fflush(stdout);
  }
#else
  static void Log(LogLevel level, const char *system,
                  const std::string &message);
  static void Log(LogLevel level, const char *system, const char *message);
#endif
};

#define ARENA_CRITICAL(system, msg)                                            \
  ArenaEngine::Logger::Log(ArenaEngine::LogLevel::CRITICAL, system, msg)
#define ARENA_ERROR(system, msg)                                               \
  ArenaEngine::Logger::Log(ArenaEngine::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define ARENA_WARN(system, msg)                                                \
  ArenaEngine::Logger::Log(ArenaEngine::LogLevel::WARNING, system, msg)
#define ARENA_INFO(system, msg)                                                \
  ArenaEngine::Logger::Log(ArenaEngine::LogLevel::INFO, system, msg)
#define ARENA_DEBUG(system, msg)                                               \
  ArenaEngine::Logger::Log(ArenaEngine::LogLevel::DEBUG_LEVEL, system, msg)
#else
#define ARENA_WARN(system, msg) ((void)0)  // Zero overhead
#define ARENA_INFO(system, msg) ((void)0)  // Zero overhead
#define ARENA_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline thread_local int32_t Logger::s_matchIndex{-1};
inline thread_local int32_t Logger::s_round{-1};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each kernel subsystem

#define MATCH_CRITICAL(msg) ARENA_CRITICAL("Match", msg)
#define MATCH_ERROR(msg) ARENA_ERROR("Match", msg)
#define MATCH_WARN(msg) ARENA_WARN("Match", msg)
#define MATCH_INFO(msg) ARENA_INFO("Match", msg)
#define MATCH_DEBUG(msg) ARENA_DEBUG("Match", msg)

#define SCHEDULER_CRITICAL(msg) ARENA_CRITICAL("TurnScheduler", msg)
#define SCHEDULER_ERROR(msg) ARENA_ERROR("TurnScheduler", msg)
#define SCHEDULER_WARN(msg) ARENA_WARN("TurnScheduler", msg)
#define SCHEDULER_INFO(msg) ARENA_INFO("TurnScheduler", msg)
#define SCHEDULER_DEBUG(msg) ARENA_DEBUG("TurnScheduler", msg)

#define WORLD_CRITICAL(msg) ARENA_CRITICAL("GameWorld", msg)
#define WORLD_ERROR(msg) ARENA_ERROR("GameWorld", msg)
#define WORLD_WARN(msg) ARENA_WARN("GameWorld", msg)
#define WORLD_INFO(msg) ARENA_INFO("GameWorld", msg)
#define WORLD_DEBUG(msg) ARENA_DEBUG("GameWorld", msg)

#define ENTITY_CRITICAL(msg) ARENA_CRITICAL("EntityDataManager", msg)
#define ENTITY_ERROR(msg) ARENA_ERROR("EntityDataManager", msg)
#define ENTITY_WARN(msg) ARENA_WARN("EntityDataManager", msg)
#define ENTITY_INFO(msg) ARENA_INFO("EntityDataManager", msg)
#define ENTITY_DEBUG(msg) ARENA_DEBUG("EntityDataManager", msg)

#define SIGNAL_CRITICAL(msg) ARENA_CRITICAL("SignalLog", msg)
#define SIGNAL_ERROR(msg) ARENA_ERROR("SignalLog", msg)
#define SIGNAL_WARN(msg) ARENA_WARN("SignalLog", msg)
#define SIGNAL_INFO(msg) ARENA_INFO("SignalLog", msg)
#define SIGNAL_DEBUG(msg) ARENA_DEBUG("SignalLog", msg)

#define BROADCAST_CRITICAL(msg) ARENA_CRITICAL("BroadcastStore", msg)
#define BROADCAST_ERROR(msg) ARENA_ERROR("BroadcastStore", msg)
#define BROADCAST_WARN(msg) ARENA_WARN("BroadcastStore", msg)
#define BROADCAST_INFO(msg) ARENA_INFO("BroadcastStore", msg)
#define BROADCAST_DEBUG(msg) ARENA_DEBUG("BroadcastStore", msg)

#define MAP_CRITICAL(msg) ARENA_CRITICAL("MapLoader", msg)
#define MAP_ERROR(msg) ARENA_ERROR("MapLoader", msg)
#define MAP_WARN(msg) ARENA_WARN("MapLoader", msg)
#define MAP_INFO(msg) ARENA_INFO("MapLoader", msg)
#define MAP_DEBUG(msg) ARENA_DEBUG("MapLoader", msg)

#define REPLAY_CRITICAL(msg) ARENA_CRITICAL("Replay", msg)
#define REPLAY_ERROR(msg) ARENA_ERROR("Replay", msg)
#define REPLAY_WARN(msg) ARENA_WARN("Replay", msg)
#define REPLAY_INFO(msg) ARENA_INFO("Replay", msg)
#define REPLAY_DEBUG(msg) ARENA_DEBUG("Replay", msg)

#define SETTINGS_CRITICAL(msg) ARENA_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) ARENA_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) ARENA_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) ARENA_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) ARENA_DEBUG("SettingsManager", msg)

#define RUNNER_CRITICAL(msg) ARENA_CRITICAL("Runner", msg)
#define RUNNER_ERROR(msg) ARENA_ERROR("Runner", msg)
#define RUNNER_WARN(msg) ARENA_WARN("Runner", msg)
#define RUNNER_INFO(msg) ARENA_INFO("Runner", msg)
#define RUNNER_DEBUG(msg) ARENA_DEBUG("Runner", msg)

} // namespace ArenaEngine

#endif // LOGGER_HPP
