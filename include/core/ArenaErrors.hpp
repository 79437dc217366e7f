/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ARENA_ERRORS_HPP
#define ARENA_ERRORS_HPP

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

namespace ArenaEngine {

/**
 * @brief Result of a World or Entity Model action
 *
 * Validation failures are ordinary values handed back to robot logic.
 * None means the action was applied and its signal appended.
 */
enum class [[nodiscard]] ActionError : uint8_t {
    None = 0,
    OutOfBounds,
    OccupiedLocation,
    OnCooldown,
    InsufficientResource,
    UnknownEntity,
    InvalidChannel,
    OutOfRange,
    CantMoveThere,
    CantDoThat,
    CantSenseThat
};

constexpr const char* actionErrorToString(ActionError error) noexcept {
    switch (error) {
        case ActionError::None:                 return "None";
        case ActionError::OutOfBounds:          return "OutOfBounds";
        case ActionError::OccupiedLocation:     return "OccupiedLocation";
        case ActionError::OnCooldown:           return "OnCooldown";
        case ActionError::InsufficientResource: return "InsufficientResource";
        case ActionError::UnknownEntity:        return "UnknownEntity";
        case ActionError::InvalidChannel:       return "InvalidChannel";
        case ActionError::OutOfRange:           return "OutOfRange";
        case ActionError::CantMoveThere:        return "CantMoveThere";
        case ActionError::CantDoThat:           return "CantDoThat";
        case ActionError::CantSenseThat:        return "CantSenseThat";
        default:                                return "Unknown";
    }
}

// Stream operator for ActionError (for Boost.Test)
inline std::ostream& operator<<(std::ostream& os, ActionError error) {
    return os << actionErrorToString(error);
}

/**
 * @brief Thrown by Match::initialize for an unusable map or team list
 */
class InitializationError : public std::runtime_error {
public:
    explicit InitializationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Thrown when a finished match is asked to run another round
 */
class MatchFinishedError : public std::logic_error {
public:
    explicit MatchFinishedError(const std::string& message)
        : std::logic_error(message) {}
};

} // namespace ArenaEngine

#endif // ARENA_ERRORS_HPP
