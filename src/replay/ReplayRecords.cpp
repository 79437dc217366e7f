/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "replay/ReplayRecords.hpp"
#include "core/Logger.hpp"
#include <boost/endian/conversion.hpp>
#include <cstring>
#include <format>

namespace ArenaEngine {

namespace {

using BinarySerial::Reader;
using BinarySerial::Writer;

constexpr uint8_t TEAM_TAG_COUNT = 3;
constexpr uint8_t HEIGHT_TIER_COUNT = 2;
constexpr uint8_t DEATH_CAUSE_COUNT = 4;
constexpr uint8_t DOMINATION_FACTOR_COUNT = 9;
constexpr uint8_t SIGNAL_KIND_COUNT = 14;
constexpr uint8_t NO_WINNER = 0xFF;

template <typename E>
bool readEnum(Reader& reader, E& out, uint8_t count) {
    uint8_t raw = 0;
    if (!reader.read(raw) || raw >= count) {
        return false;
    }
    out = static_cast<E>(raw);
    return true;
}

template <typename E>
bool writeEnum(Writer& writer, E value) {
    return writer.write(static_cast<uint8_t>(value));
}

bool writeLocation(Writer& writer, const MapLocation& location) {
    return writer.write(location.x) && writer.write(location.y);
}

bool readLocation(Reader& reader, MapLocation& location) {
    return reader.read(location.x) && reader.read(location.y);
}

bool writeVector(Writer& writer, const Vector2D& vector) {
    return writer.write(vector.getX()) && writer.write(vector.getY());
}

bool readVector(Reader& reader, Vector2D& vector) {
    float x = 0.0f;
    float y = 0.0f;
    if (!reader.read(x) || !reader.read(y)) {
        return false;
    }
    vector = Vector2D(x, y);
    return true;
}

bool writeOptionalTeam(Writer& writer, const std::optional<Team>& team) {
    return writer.write(team ? static_cast<uint8_t>(*team) : NO_WINNER);
}

bool readOptionalTeam(Reader& reader, std::optional<Team>& team) {
    uint8_t raw = 0;
    if (!reader.read(raw)) {
        return false;
    }
    if (raw == NO_WINNER) {
        team.reset();
        return true;
    }
    if (raw >= TEAM_TAG_COUNT) {
        return false;
    }
    team = static_cast<Team>(raw);
    return true;
}

bool writeMemory(Writer& writer, const std::array<TeamMemory, 2>& memory) {
    for (const auto& team : memory) {
        for (int64_t value : team) {
            SERIALIZE_PRIMITIVE(writer, value)
        }
    }
    return true;
}

bool readMemory(Reader& reader, std::array<TeamMemory, 2>& memory) {
    for (auto& team : memory) {
        for (int64_t& value : team) {
            DESERIALIZE_PRIMITIVE(reader, value)
        }
    }
    return true;
}

// ============================================================================
// PAYLOADS
// ============================================================================

bool put(Writer& w, const SpawnSignal& s) {
    return w.write(s.id) && w.write(s.parentId) && writeEnum(w, s.team) && writeEnum(w, s.kind) &&
           writeEnum(w, s.tier) && writeLocation(w, s.location) && writeVector(w, s.velocity) &&
           w.write(s.health);
}

bool get(Reader& r, SpawnSignal& s) {
    return r.read(s.id) && r.read(s.parentId) && readEnum(r, s.team, TEAM_TAG_COUNT) &&
           readEnum(r, s.kind, static_cast<uint8_t>(ENTITY_KIND_COUNT)) &&
           readEnum(r, s.tier, HEIGHT_TIER_COUNT) && readLocation(r, s.location) &&
           readVector(r, s.velocity) && r.read(s.health);
}

bool put(Writer& w, const MoveSignal& s) {
    return w.write(s.id) && writeLocation(w, s.from) && writeLocation(w, s.to);
}

bool get(Reader& r, MoveSignal& s) {
    return r.read(s.id) && readLocation(r, s.from) && readLocation(r, s.to);
}

bool put(Writer& w, const AttackSignal& s) {
    return w.write(s.attackerId) && writeLocation(w, s.target) && writeEnum(w, s.tier) &&
           w.write(s.victimId) && w.write(s.damage);
}

bool get(Reader& r, AttackSignal& s) {
    return r.read(s.attackerId) && readLocation(r, s.target) && readEnum(r, s.tier, HEIGHT_TIER_COUNT) &&
           r.read(s.victimId) && r.read(s.damage);
}

bool put(Writer& w, const DeathSignal& s) {
    return w.write(s.id) && writeEnum(w, s.cause);
}

bool get(Reader& r, DeathSignal& s) {
    return r.read(s.id) && readEnum(r, s.cause, DEATH_CAUSE_COUNT);
}

bool put(Writer& w, const BroadcastSignal& s) {
    return writeEnum(w, s.team) && w.write(s.channel) && w.write(s.value);
}

bool get(Reader& r, BroadcastSignal& s) {
    return readEnum(r, s.team, TEAM_TAG_COUNT) && r.read(s.channel) && r.read(s.value);
}

bool put(Writer& w, const TeamResourceSignal& s) {
    return writeEnum(w, s.team) && w.write(s.ore);
}

bool get(Reader& r, TeamResourceSignal& s) {
    return readEnum(r, s.team, TEAM_TAG_COUNT) && r.read(s.ore);
}

bool put(Writer& w, const MineSignal& s) {
    return w.write(s.id) && writeLocation(w, s.location) && w.write(s.amount);
}

bool get(Reader& r, MineSignal& s) {
    return r.read(s.id) && readLocation(r, s.location) && r.read(s.amount);
}

bool put(Writer& w, const ResearchSignal& s) {
    return writeEnum(w, s.team) && writeEnum(w, s.upgrade) && w.write(s.progress) && w.write(s.completed);
}

bool get(Reader& r, ResearchSignal& s) {
    return readEnum(r, s.team, TEAM_TAG_COUNT) &&
           readEnum(r, s.upgrade, static_cast<uint8_t>(Upgrade::COUNT)) &&
           r.read(s.progress) && r.read(s.completed);
}

bool put(Writer& w, const IndicatorStringSignal& s) {
    return w.write(s.id) && w.write(s.index) && w.writeString(s.text);
}

bool get(Reader& r, IndicatorStringSignal& s) {
    return r.read(s.id) && r.read(s.index) && r.readString(s.text);
}

bool put(Writer& w, const MatchObservationSignal& s) {
    return w.write(s.id) && w.writeString(s.observation);
}

bool get(Reader& r, MatchObservationSignal& s) {
    return r.read(s.id) && r.readString(s.observation);
}

bool put(Writer& w, const BytecodesUsedSignal& s) {
    return w.writeVector(s.ids) && w.writeVector(s.used);
}

bool get(Reader& r, BytecodesUsedSignal& s) {
    return r.readVector(s.ids) && r.readVector(s.used) && s.ids.size() == s.used.size();
}

bool put(Writer& w, const TeamSilencedSignal& s) {
    return writeEnum(w, s.team);
}

bool get(Reader& r, TeamSilencedSignal& s) {
    return readEnum(r, s.team, TEAM_TAG_COUNT);
}

bool put(Writer& w, const ResignSignal& s) {
    return writeEnum(w, s.team);
}

bool get(Reader& r, ResignSignal& s) {
    return readEnum(r, s.team, TEAM_TAG_COUNT);
}

bool put(Writer& w, const GameOverSignal& s) {
    return writeOptionalTeam(w, s.winner) && writeEnum(w, s.factor);
}

bool get(Reader& r, GameOverSignal& s) {
    return readOptionalTeam(r, s.winner) && readEnum(r, s.factor, DOMINATION_FACTOR_COUNT);
}

template <size_t I>
bool readAlternative(Reader& reader, size_t index, SignalPayload& payload) {
    if constexpr (I < std::variant_size_v<SignalPayload>) {
        if (index == I) {
            std::variant_alternative_t<I, SignalPayload> value;
            if (!get(reader, value)) {
                return false;
            }
            payload = std::move(value);
            return true;
        }
        return readAlternative<I + 1>(reader, index, payload);
    } else {
        return false;
    }
}

} // namespace

// ============================================================================
// SPAWNED BODY
// ============================================================================

SpawnedBody SpawnedBody::fromSignal(const SpawnSignal& signal) {
    SpawnedBody body;
    body.id = signal.id;
    body.team = signal.team;
    body.kind = signal.kind;
    body.radius = EntityTraits::stats(signal.kind).radius;
    body.location = signal.location.toVector();
    body.velocity = signal.velocity;
    return body;
}

SpawnedBody::Bytes SpawnedBody::encode() const {
    Bytes bytes{};
    auto storeFloat = [&bytes](size_t offset, float value) {
        uint32_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        boost::endian::store_little_u32(bytes.data() + offset, bits);
    };

    boost::endian::store_little_s32(bytes.data(), id);
    bytes[4] = static_cast<unsigned char>(team);
    bytes[5] = static_cast<unsigned char>(kind);
    // bytes 6 and 7 stay zero
    storeFloat(8, radius);
    storeFloat(12, location.getX());
    storeFloat(16, location.getY());
    storeFloat(20, velocity.getX());
    storeFloat(24, velocity.getY());
    return bytes;
}

std::optional<SpawnedBody> SpawnedBody::decode(const Bytes& bytes) {
    auto loadFloat = [&bytes](size_t offset) {
        const uint32_t bits = boost::endian::load_little_u32(bytes.data() + offset);
        float value = 0.0f;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    };

    if (bytes[4] >= TEAM_TAG_COUNT || bytes[5] >= ENTITY_KIND_COUNT) {
        return std::nullopt;
    }

    SpawnedBody body;
    body.id = boost::endian::load_little_s32(bytes.data());
    body.team = static_cast<Team>(bytes[4]);
    body.kind = static_cast<EntityKind>(bytes[5]);
    body.radius = loadFloat(8);
    body.location = Vector2D(loadFloat(12), loadFloat(16));
    body.velocity = Vector2D(loadFloat(20), loadFloat(24));
    return body;
}

bool SpawnedBody::operator==(const SpawnedBody& other) const {
    return id == other.id && team == other.team && kind == other.kind && radius == other.radius &&
           location == other.location && velocity == other.velocity;
}

// ============================================================================
// SIGNALS
// ============================================================================

bool SignalCodec::write(Writer& writer, const Signal& signal) {
    SERIALIZE_PRIMITIVE(writer, signal.round)
    SERIALIZE_PRIMITIVE(writer, static_cast<uint8_t>(signal.getKind()))
    return std::visit([&writer](const auto& payload) { return put(writer, payload); }, signal.payload);
}

bool SignalCodec::read(Reader& reader, Signal& signal) {
    DESERIALIZE_PRIMITIVE(reader, signal.round)
    uint8_t kind = 0;
    DESERIALIZE_PRIMITIVE(reader, kind)
    if (kind >= SIGNAL_KIND_COUNT) {
        REPLAY_ERROR(std::format("Unknown signal kind tag {}", kind));
        return false;
    }
    return readAlternative<0>(reader, kind, signal.payload);
}

// ============================================================================
// RECORDS
// ============================================================================

bool RoundDelta::serialize(Writer& writer) const {
    SERIALIZE_PRIMITIVE(writer, round)
    SERIALIZE_PRIMITIVE(writer, static_cast<uint32_t>(signals.size()))
    for (const Signal& signal : signals) {
        if (!SignalCodec::write(writer, signal)) {
            return false;
        }
    }
    return true;
}

bool RoundDelta::deserialize(Reader& reader) {
    DESERIALIZE_PRIMITIVE(reader, round)
    uint32_t count = 0;
    DESERIALIZE_PRIMITIVE(reader, count)
    if (count > BinarySerial::MAX_VECTOR_SIZE) {
        REPLAY_ERROR(std::format("Round {} claims {} signals", round, count));
        return false;
    }
    signals.assign(count, Signal{});
    for (Signal& signal : signals) {
        if (!SignalCodec::read(reader, signal)) {
            return false;
        }
    }
    return true;
}

bool MatchHeader::serialize(Writer& writer) const {
    SERIALIZE_STRING(writer, mapName)
    SERIALIZE_PRIMITIVE(writer, mapWidth)
    SERIALIZE_PRIMITIVE(writer, mapHeight)
    SERIALIZE_PRIMITIVE(writer, mapSeed)
    SERIALIZE_STRING(writer, teamA)
    SERIALIZE_STRING(writer, teamB)
    if (!writeMemory(writer, initialMemory)) {
        return false;
    }
    SERIALIZE_PRIMITIVE(writer, matchIndex)
    SERIALIZE_PRIMITIVE(writer, matchCount)
    SERIALIZE_PRIMITIVE(writer, static_cast<uint32_t>(initialBodies.size()))
    for (const SpawnedBody& body : initialBodies) {
        const auto bytes = body.encode();
        if (!writer.writeBytes(bytes.data(), bytes.size())) {
            return false;
        }
    }
    return true;
}

bool MatchHeader::deserialize(Reader& reader) {
    DESERIALIZE_STRING(reader, mapName)
    DESERIALIZE_PRIMITIVE(reader, mapWidth)
    DESERIALIZE_PRIMITIVE(reader, mapHeight)
    DESERIALIZE_PRIMITIVE(reader, mapSeed)
    DESERIALIZE_STRING(reader, teamA)
    DESERIALIZE_STRING(reader, teamB)
    if (!readMemory(reader, initialMemory)) {
        return false;
    }
    DESERIALIZE_PRIMITIVE(reader, matchIndex)
    DESERIALIZE_PRIMITIVE(reader, matchCount)
    uint32_t count = 0;
    DESERIALIZE_PRIMITIVE(reader, count)
    if (count > BinarySerial::MAX_VECTOR_SIZE) {
        return false;
    }
    initialBodies.clear();
    initialBodies.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        SpawnedBody::Bytes bytes{};
        if (!reader.readBytes(bytes.data(), bytes.size())) {
            return false;
        }
        auto body = SpawnedBody::decode(bytes);
        if (!body) {
            REPLAY_ERROR("Corrupt spawned body record in match header");
            return false;
        }
        initialBodies.push_back(*body);
    }
    return true;
}

bool MatchFooter::serialize(Writer& writer) const {
    if (!writeOptionalTeam(writer, winner)) {
        return false;
    }
    SERIALIZE_PRIMITIVE(writer, static_cast<uint8_t>(factor))
    SERIALIZE_PRIMITIVE(writer, rounds)
    return writeMemory(writer, finalMemory);
}

bool MatchFooter::deserialize(Reader& reader) {
    if (!readOptionalTeam(reader, winner)) {
        return false;
    }
    if (!readEnum(reader, factor, DOMINATION_FACTOR_COUNT)) {
        return false;
    }
    DESERIALIZE_PRIMITIVE(reader, rounds)
    return readMemory(reader, finalMemory);
}

} // namespace ArenaEngine
