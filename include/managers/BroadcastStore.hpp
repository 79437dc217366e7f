/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BROADCAST_STORE_HPP
#define BROADCAST_STORE_HPP

#include "core/ArenaErrors.hpp"
#include "entities/EntityKind.hpp"
#include <array>
#include <boost/container/flat_map.hpp>
#include <cstdint>

namespace ArenaEngine {

class SignalLog;

/**
 * @brief Team-scoped, round-deferred channel memory
 *
 * Writes made during round N land in a pending table. Reads during round N
 * see only the table committed at the end of round N-1, so the value a
 * robot reads never depends on which teammate happened to run first.
 * Channels never written read as 0.
 */
class BroadcastStore {
public:
    using ChannelTable = boost::container::flat_map<int32_t, int32_t>;

    BroadcastStore() = default;

    /**
     * @brief Buffers a write; the last write to a channel in a round wins
     * @return InvalidChannel outside [0, BROADCAST_MAX_CHANNELS) or for NEUTRAL
     */
    ActionError write(Team team, int32_t channel, int32_t value);

    /**
     * @brief Reads the committed value of a channel
     * @param out Receives the value, untouched on failure
     */
    ActionError read(Team team, int32_t channel, int32_t& out) const;

    /**
     * @brief Promotes pending writes into the readable tables
     *
     * Appends one BroadcastSignal per channel whose committed value changed,
     * ascending by channel, team A before team B. Writes that store the value
     * already committed produce no signal.
     * @return Number of signals appended
     */
    size_t commit(SignalLog& signalLog);

    const ChannelTable& committed(Team team) const;
    const ChannelTable& pending(Team team) const;

    void clear();

private:
    std::array<ChannelTable, 2> m_committed{};
    std::array<ChannelTable, 2> m_pending{};

    static bool validChannel(Team team, int32_t channel);
};

} // namespace ArenaEngine

#endif // BROADCAST_STORE_HPP
