/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIGNAL_HPP
#define SIGNAL_HPP

/**
 * @file Signal.hpp
 * @brief Immutable records of single state transitions
 *
 * Signals reference entities by id only, never through live handles, and
 * carry enough data to replay the transition. Every signal is stamped with
 * the round it was produced in.
 */

#include "core/GameConstants.hpp"
#include "entities/Entity.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace ArenaEngine {

enum class DeathCause : uint8_t {
    Destroyed = 0,      // Health reached zero from an attack or explosion
    Disintegrated = 1,  // Robot logic asked for it, or the fault policy did
    Exploded = 2,       // Missile detonation
    Expired = 3         // Missile lifespan ran out
};

constexpr const char* deathCauseToString(DeathCause cause) noexcept {
    switch (cause) {
        case DeathCause::Destroyed:     return "Destroyed";
        case DeathCause::Disintegrated: return "Disintegrated";
        case DeathCause::Exploded:      return "Exploded";
        case DeathCause::Expired:       return "Expired";
        default:                        return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, DeathCause cause) {
    return os << deathCauseToString(cause);
}

/**
 * @brief How decisively a match was won, reported in the footer
 */
enum class DominationFactor : uint8_t {
    DESTROYED = 0,           // Enemy HQ destroyed before half the round cap
    PWNED,                   // Enemy HQ destroyed after half the round cap
    OWNED,                   // Explicit victory (debug win or completed Nuke)
    RESIGNED,                // Opponent resigned
    BEAT,                    // Round cap, more captured score
    BARELY_BEAT,             // Round cap, more structures
    WON_BY_DUBIOUS_REASONS,  // Round cap, more aggregate health
    WON_BY_DEFAULT,          // Round cap, perfect tie resolved by the seeded rule
    ABORTED                  // Ended by the runner with no winner
};

constexpr const char* dominationFactorToString(DominationFactor factor) noexcept {
    switch (factor) {
        case DominationFactor::DESTROYED:              return "DESTROYED";
        case DominationFactor::PWNED:                  return "PWNED";
        case DominationFactor::OWNED:                  return "OWNED";
        case DominationFactor::RESIGNED:               return "RESIGNED";
        case DominationFactor::BEAT:                   return "BEAT";
        case DominationFactor::BARELY_BEAT:            return "BARELY_BEAT";
        case DominationFactor::WON_BY_DUBIOUS_REASONS: return "WON_BY_DUBIOUS_REASONS";
        case DominationFactor::WON_BY_DEFAULT:         return "WON_BY_DEFAULT";
        case DominationFactor::ABORTED:                return "ABORTED";
        default:                                       return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, DominationFactor factor) {
    return os << dominationFactorToString(factor);
}

struct SpawnSignal {
    EntityID id{INVALID_ENTITY_ID};
    EntityID parentId{INVALID_ENTITY_ID};
    Team team{Team::NEUTRAL};
    EntityKind kind{EntityKind::Beaver};
    HeightTier tier{HeightTier::Ground};
    MapLocation location;
    Vector2D velocity;
    int32_t health{0};
};

struct MoveSignal {
    EntityID id{INVALID_ENTITY_ID};
    MapLocation from;
    MapLocation to;
};

struct AttackSignal {
    EntityID attackerId{INVALID_ENTITY_ID};
    MapLocation target;
    HeightTier tier{HeightTier::Ground};
    EntityID victimId{INVALID_ENTITY_ID};  // INVALID_ENTITY_ID when the tile was empty
    int32_t damage{0};
};

struct DeathSignal {
    EntityID id{INVALID_ENTITY_ID};
    DeathCause cause{DeathCause::Destroyed};
};

struct BroadcastSignal {
    Team team{Team::NEUTRAL};
    int32_t channel{0};
    int32_t value{0};
};

struct TeamResourceSignal {
    Team team{Team::NEUTRAL};
    double ore{0.0};
};

struct MineSignal {
    EntityID id{INVALID_ENTITY_ID};
    MapLocation location;
    double amount{0.0};
};

struct ResearchSignal {
    Team team{Team::NEUTRAL};
    Upgrade upgrade{Upgrade::Pickaxe};
    int32_t progress{0};
    bool completed{false};
};

struct IndicatorStringSignal {
    EntityID id{INVALID_ENTITY_ID};
    int32_t index{0};
    std::string text;
};

struct MatchObservationSignal {
    EntityID id{INVALID_ENTITY_ID};
    std::string observation;
};

/// Operations each robot consumed this round, parallel arrays in id order
struct BytecodesUsedSignal {
    std::vector<EntityID> ids;
    std::vector<int32_t> used;
};

struct TeamSilencedSignal {
    Team team{Team::NEUTRAL};
};

struct ResignSignal {
    Team team{Team::NEUTRAL};
};

struct GameOverSignal {
    std::optional<Team> winner;
    DominationFactor factor{DominationFactor::ABORTED};
};

using SignalPayload = std::variant<SpawnSignal, MoveSignal, AttackSignal, DeathSignal,
                                   BroadcastSignal, TeamResourceSignal, MineSignal,
                                   ResearchSignal, IndicatorStringSignal,
                                   MatchObservationSignal, BytecodesUsedSignal,
                                   TeamSilencedSignal, ResignSignal, GameOverSignal>;

/// Tag matching the alternative index of SignalPayload
enum class SignalKind : uint8_t {
    Spawn = 0,
    Move,
    Attack,
    Death,
    Broadcast,
    TeamResource,
    Mine,
    Research,
    IndicatorString,
    MatchObservation,
    BytecodesUsed,
    TeamSilenced,
    Resign,
    GameOver
};

constexpr const char* signalKindToString(SignalKind kind) noexcept {
    switch (kind) {
        case SignalKind::Spawn:            return "Spawn";
        case SignalKind::Move:             return "Move";
        case SignalKind::Attack:           return "Attack";
        case SignalKind::Death:            return "Death";
        case SignalKind::Broadcast:        return "Broadcast";
        case SignalKind::TeamResource:     return "TeamResource";
        case SignalKind::Mine:             return "Mine";
        case SignalKind::Research:         return "Research";
        case SignalKind::IndicatorString:  return "IndicatorString";
        case SignalKind::MatchObservation: return "MatchObservation";
        case SignalKind::BytecodesUsed:    return "BytecodesUsed";
        case SignalKind::TeamSilenced:     return "TeamSilenced";
        case SignalKind::Resign:           return "Resign";
        case SignalKind::GameOver:         return "GameOver";
        default:                           return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, SignalKind kind) {
    return os << signalKindToString(kind);
}

struct Signal {
    int32_t round{0};
    SignalPayload payload;

    SignalKind getKind() const {
        return static_cast<SignalKind>(payload.index());
    }

    template<typename T>
    bool is() const { return std::holds_alternative<T>(payload); }

    /// Returns nullptr if the payload is of another kind
    template<typename T>
    const T* as() const { return std::get_if<T>(&payload); }
};

} // namespace ArenaEngine

#endif // SIGNAL_HPP
