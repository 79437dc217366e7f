/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Only compile this file for release builds - debug builds use inline definitions
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <vector>

namespace ArenaEngine {
namespace {

namespace fs = std::filesystem;

constexpr size_t KEPT_RUN_LOGS = 5;
constexpr const char* RUN_LOG_PREFIX = "run_";

std::string wallClock(const char* pattern) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);

    char buffer[32];
    const size_t written = std::strftime(buffer, sizeof(buffer), pattern, &local);
    return std::string(buffer, written);
}

// Keeps the newest keepCount run logs in logDir
void pruneRunLogs(const fs::path& logDir, size_t keepCount) {
    std::error_code ec;
    std::vector<fs::path> runLogs;
    for (const auto& entry : fs::directory_iterator(logDir, ec)) {
        const std::string name = entry.path().filename().string();
        if (entry.path().extension() == ".log" && name.starts_with(RUN_LOG_PREFIX)) {
            runLogs.push_back(entry.path());
        }
    }
    if (runLogs.size() < keepCount) {
        return;
    }

    // Names embed the start time, so lexical order is age order
    std::sort(runLogs.begin(), runLogs.end());
    const size_t excess = runLogs.size() - keepCount + 1;
    for (size_t i = 0; i < excess; ++i) {
        fs::remove(runLogs[i], ec);
    }
}

// One log file per runner process, under <pref path>/logs
class RunLog {
public:
    static RunLog& Instance() {
        static RunLog instance;
        return instance;
    }

    void append(const char* level, const std::string& stamp, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(Logger::s_logMutex);
        if (!m_opened) {
            open();
        }
        if (!m_file.is_open()) {
            return;
        }

        m_file << wallClock("%H:%M:%S") << " [" << level << "] [" << stamp << "] [" << system << "] "
               << message << '\n';
        // Only CRITICAL and ERROR reach this point
        m_file.flush();
    }

private:
    RunLog() = default;
    RunLog(const RunLog&) = delete;
    RunLog& operator=(const RunLog&) = delete;

    void open() {
        m_opened = true;

        // ARENA_APP_NAME is defined via CMake from ${PROJECT_NAME}
        char* prefPath = SDL_GetPrefPath("ArenaEngine", ARENA_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }
        const fs::path logDir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }
        pruneRunLogs(logDir, KEPT_RUN_LOGS);

        const fs::path file = logDir / std::format("{}{}.log", RUN_LOG_PREFIX, wallClock("%Y%m%d_%H%M%S"));
        m_file.open(file, std::ios::out | std::ios::app);
        if (m_file.is_open()) {
            m_file << "=== " << ARENA_APP_NAME << " run started " << wallClock("%Y-%m-%d %H:%M:%S") << " ===\n";
        }
    }

    std::ofstream m_file;
    bool m_opened{false};
};

} // anonymous namespace

void Logger::Log(LogLevel level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(LogLevel level, const char* system, const char* message) {
    RunLog::Instance().append(getLevelString(level), FormatStamp(), system, message);
}

} // namespace ArenaEngine

#endif // ifndef DEBUG
