/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REPLAY_WRITER_HPP
#define REPLAY_WRITER_HPP

/**
 * @file ReplayWriter.hpp
 * @brief Streams match records into a replay file
 *
 * File layout: the 8-byte signature "ARENAREC", a uint32 format version, then
 * a sequence of tagged records (header, rounds, footer) for every match of a
 * series, in the order they were produced.
 */

#include "replay/ReplayRecords.hpp"
#include "utils/BinarySerializer.hpp"
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>

namespace ArenaEngine {

namespace ReplayFormat {
inline constexpr char SIGNATURE[8] = {'A', 'R', 'E', 'N', 'A', 'R', 'E', 'C'};
inline constexpr uint32_t VERSION = 1;

enum class RecordTag : uint8_t {
    Header = 1,
    Round = 2,
    Footer = 3
};
} // namespace ReplayFormat

class ReplayWriter {
public:
    ReplayWriter() = default;
    ~ReplayWriter();

    ReplayWriter(const ReplayWriter&) = delete;
    ReplayWriter& operator=(const ReplayWriter&) = delete;

    /// Creates (or truncates) the file and writes the signature
    bool open(const std::string& path);

    /// Writes to an already open stream
    bool open(std::shared_ptr<std::ostream> stream);

    bool writeHeader(const MatchHeader& header);
    bool writeRound(const RoundDelta& delta);
    bool writeFooter(const MatchFooter& footer);

    void close();
    bool isOpen() const { return m_writer != nullptr; }
    size_t getRoundsWritten() const { return m_roundsWritten; }

private:
    std::unique_ptr<BinarySerial::Writer> m_writer;
    size_t m_roundsWritten{0};

    bool writePreamble();
    template <typename Record>
    bool writeRecord(ReplayFormat::RecordTag tag, const Record& record);
};

} // namespace ArenaEngine

#endif // REPLAY_WRITER_HPP
