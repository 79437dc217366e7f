/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "replay/ReplayReader.hpp"
#include "core/Logger.hpp"
#include "replay/ReplayWriter.hpp"
#include <algorithm>
#include <format>
#include <istream>
#include <stdexcept>

namespace ArenaEngine {

bool ReplayReader::fail(const std::string& message) {
    m_lastError = message;
    REPLAY_ERROR(message);
    return false;
}

bool ReplayReader::open(const std::string& path) {
    m_lastError.clear();
    m_reader = BinarySerial::Reader::createFileReader(path);
    if (!m_reader) {
        return fail(std::format("Cannot open replay file {}", path));
    }
    return readPreamble();
}

bool ReplayReader::open(std::shared_ptr<std::istream> stream) {
    m_lastError.clear();
    try {
        m_reader = std::make_unique<BinarySerial::Reader>(std::move(stream));
    } catch (const std::runtime_error& e) {
        return fail(std::format("Cannot open replay stream: {}", e.what()));
    }
    return readPreamble();
}

bool ReplayReader::readPreamble() {
    char signature[sizeof(ReplayFormat::SIGNATURE)] = {};
    if (!m_reader->readBytes(signature, sizeof(signature)) ||
        !std::equal(std::begin(signature), std::end(signature), std::begin(ReplayFormat::SIGNATURE))) {
        m_reader.reset();
        return fail("Not an ArenaEngine replay file");
    }
    if (!m_reader->read(m_version) || m_version != ReplayFormat::VERSION) {
        m_reader.reset();
        return fail(std::format("Unsupported replay version {}", m_version));
    }
    return true;
}

bool ReplayReader::readAll(std::vector<ReplayMatch>& matches) {
    if (!m_reader) {
        return fail("Replay reader is not open");
    }

    while (!m_reader->atEnd()) {
        uint8_t rawTag = 0;
        if (!m_reader->read(rawTag)) {
            return fail("Truncated replay record tag");
        }

        switch (static_cast<ReplayFormat::RecordTag>(rawTag)) {
            case ReplayFormat::RecordTag::Header: {
                ReplayMatch match;
                if (!m_reader->readSerializable(match.header)) {
                    return fail("Corrupt match header");
                }
                matches.push_back(std::move(match));
                break;
            }
            case ReplayFormat::RecordTag::Round: {
                if (matches.empty()) {
                    return fail("Round record before any match header");
                }
                RoundDelta delta;
                if (!m_reader->readSerializable(delta)) {
                    return fail(std::format("Corrupt round record after round {}",
                                            matches.back().rounds.size()));
                }
                matches.back().rounds.push_back(std::move(delta));
                break;
            }
            case ReplayFormat::RecordTag::Footer: {
                if (matches.empty()) {
                    return fail("Footer record before any match header");
                }
                MatchFooter footer;
                if (!m_reader->readSerializable(footer)) {
                    return fail("Corrupt match footer");
                }
                matches.back().footer = footer;
                break;
            }
            default:
                return fail(std::format("Unknown replay record tag {}", rawTag));
        }
    }

    REPLAY_DEBUG(std::format("Read {} matches from replay", matches.size()));
    return true;
}

} // namespace ArenaEngine
