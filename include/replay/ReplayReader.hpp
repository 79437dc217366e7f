/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REPLAY_READER_HPP
#define REPLAY_READER_HPP

#include "replay/ReplayRecords.hpp"
#include "utils/BinarySerializer.hpp"
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ArenaEngine {

/// Everything recorded for one match of a replay file
struct ReplayMatch {
    MatchHeader header;
    std::vector<RoundDelta> rounds;
    std::optional<MatchFooter> footer;  // missing if the writer stopped early
};

/**
 * @brief Reads back files produced by ReplayWriter
 */
class ReplayReader {
public:
    /// Opens the file and checks its signature and version
    bool open(const std::string& path);
    bool open(std::shared_ptr<std::istream> stream);

    /**
     * @brief Reads every remaining record, grouped by match
     * @return false on a corrupt or truncated record; matches read so far are kept
     */
    bool readAll(std::vector<ReplayMatch>& matches);

    uint32_t getVersion() const { return m_version; }
    const std::string& getLastError() const { return m_lastError; }

private:
    std::unique_ptr<BinarySerial::Reader> m_reader;
    uint32_t m_version{0};
    std::string m_lastError;

    bool readPreamble();
    bool fail(const std::string& message);
};

} // namespace ArenaEngine

#endif // REPLAY_READER_HPP
