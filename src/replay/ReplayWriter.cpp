/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "replay/ReplayWriter.hpp"
#include "core/Logger.hpp"
#include <format>
#include <ostream>
#include <stdexcept>

namespace ArenaEngine {

ReplayWriter::~ReplayWriter() {
    close();
}

bool ReplayWriter::open(const std::string& path) {
    close();
    m_writer = BinarySerial::Writer::createFileWriter(path);
    if (!m_writer) {
        return false;
    }
    REPLAY_INFO(std::format("Writing replay to {}", path));
    return writePreamble();
}

bool ReplayWriter::open(std::shared_ptr<std::ostream> stream) {
    close();
    try {
        m_writer = std::make_unique<BinarySerial::Writer>(std::move(stream));
    } catch (const std::runtime_error& e) {
        REPLAY_ERROR(std::format("Cannot open replay stream: {}", e.what()));
        return false;
    }
    return writePreamble();
}

bool ReplayWriter::writePreamble() {
    m_roundsWritten = 0;
    if (!m_writer->writeBytes(ReplayFormat::SIGNATURE, sizeof(ReplayFormat::SIGNATURE)) ||
        !m_writer->write(ReplayFormat::VERSION)) {
        REPLAY_ERROR("Failed to write replay signature");
        m_writer.reset();
        return false;
    }
    return true;
}

template <typename Record>
bool ReplayWriter::writeRecord(ReplayFormat::RecordTag tag, const Record& record) {
    if (!m_writer) {
        REPLAY_ERROR("Replay writer is not open");
        return false;
    }
    if (!m_writer->write(tag) || !m_writer->writeSerializable(record)) {
        REPLAY_ERROR(std::format("Failed to write replay record {}", static_cast<int>(tag)));
        return false;
    }
    return true;
}

bool ReplayWriter::writeHeader(const MatchHeader& header) {
    return writeRecord(ReplayFormat::RecordTag::Header, header);
}

bool ReplayWriter::writeRound(const RoundDelta& delta) {
    if (!writeRecord(ReplayFormat::RecordTag::Round, delta)) {
        return false;
    }
    ++m_roundsWritten;
    return true;
}

bool ReplayWriter::writeFooter(const MatchFooter& footer) {
    if (!writeRecord(ReplayFormat::RecordTag::Footer, footer)) {
        return false;
    }
    m_writer->flush();
    return true;
}

void ReplayWriter::close() {
    if (m_writer) {
        m_writer->flush();
        m_writer.reset();
    }
}

} // namespace ArenaEngine
