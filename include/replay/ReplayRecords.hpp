/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REPLAY_RECORDS_HPP
#define REPLAY_RECORDS_HPP

/**
 * @file ReplayRecords.hpp
 * @brief Round- and match-granular records produced by a match
 *
 * A match produces one MatchHeader, one RoundDelta per executed round and one
 * MatchFooter. Each record knows how to write itself through
 * BinarySerial::Writer and read itself back.
 */

#include "entities/Entity.hpp"
#include "events/Signal.hpp"
#include "utils/BinarySerializer.hpp"
#include "utils/Vector2D.hpp"
#include "world/TeamState.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ArenaEngine {

/**
 * @brief Fixed-size record of an entity entering the simulation
 *
 * Encoded as 28 little-endian bytes: int32 id, int8 team, int8 kind, two
 * bytes of padding, float radius, then location and velocity as two floats
 * each.
 */
struct SpawnedBody {
    static constexpr size_t ENCODED_SIZE = 28;
    using Bytes = std::array<unsigned char, ENCODED_SIZE>;

    EntityID id{INVALID_ENTITY_ID};
    Team team{Team::NEUTRAL};
    EntityKind kind{EntityKind::HQ};
    float radius{0.0f};
    Vector2D location;
    Vector2D velocity;

    static SpawnedBody fromSignal(const SpawnSignal& signal);

    Bytes encode() const;

    /// nullopt for an unknown team or kind tag
    static std::optional<SpawnedBody> decode(const Bytes& bytes);

    bool operator==(const SpawnedBody& other) const;
};

/// Signals of one round, in the order they were appended
struct RoundDelta {
    int32_t round{0};
    std::vector<Signal> signals;

    bool serialize(BinarySerial::Writer& writer) const;
    bool deserialize(BinarySerial::Reader& reader);
};

struct MatchHeader {
    std::string mapName;
    int32_t mapWidth{0};
    int32_t mapHeight{0};
    uint32_t mapSeed{0};
    std::string teamA;
    std::string teamB;
    std::array<TeamMemory, 2> initialMemory{};
    int32_t matchIndex{0};
    int32_t matchCount{1};
    std::vector<SpawnedBody> initialBodies;

    bool serialize(BinarySerial::Writer& writer) const;
    bool deserialize(BinarySerial::Reader& reader);
};

struct MatchFooter {
    std::optional<Team> winner;
    DominationFactor factor{DominationFactor::ABORTED};
    int32_t rounds{0};
    std::array<TeamMemory, 2> finalMemory{};

    bool serialize(BinarySerial::Writer& writer) const;
    bool deserialize(BinarySerial::Reader& reader);
};

/**
 * @brief Signal codec used inside RoundDelta
 *
 * A signal is written as its round, its SignalKind tag and then the payload
 * fields in declaration order.
 */
namespace SignalCodec {
bool write(BinarySerial::Writer& writer, const Signal& signal);
bool read(BinarySerial::Reader& reader, Signal& signal);
} // namespace SignalCodec

} // namespace ArenaEngine

#endif // REPLAY_RECORDS_HPP
