/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/BroadcastStore.hpp"
#include "core/GameConstants.hpp"
#include "core/Logger.hpp"
#include "events/SignalLog.hpp"
#include <format>

namespace ArenaEngine {

bool BroadcastStore::validChannel(Team team, int32_t channel) {
    return team != Team::NEUTRAL && channel >= 0 &&
           channel < GameConstants::BROADCAST_MAX_CHANNELS;
}

ActionError BroadcastStore::write(Team team, int32_t channel, int32_t value) {
    if (!validChannel(team, channel)) {
        return ActionError::InvalidChannel;
    }
    m_pending[EntityTraits::teamIndex(team)][channel] = value;
    return ActionError::None;
}

ActionError BroadcastStore::read(Team team, int32_t channel, int32_t& out) const {
    if (!validChannel(team, channel)) {
        return ActionError::InvalidChannel;
    }
    const ChannelTable& table = m_committed[EntityTraits::teamIndex(team)];
    auto it = table.find(channel);
    out = (it != table.end()) ? it->second : 0;
    return ActionError::None;
}

size_t BroadcastStore::commit(SignalLog& signalLog) {
    size_t signalsAppended = 0;

    for (Team team : {Team::A, Team::B}) {
        const size_t index = EntityTraits::teamIndex(team);
        ChannelTable& committedTable = m_committed[index];

        // flat_map iterates in ascending channel order
        for (const auto& [channel, value] : m_pending[index]) {
            auto it = committedTable.find(channel);
            const int32_t previous = (it != committedTable.end()) ? it->second : 0;
            const bool present = it != committedTable.end();
            if (present && previous == value) {
                continue;
            }
            if (!present && value == 0) {
                // Unwritten channels already read as 0; record the write without a change signal
                committedTable.emplace(channel, value);
                continue;
            }
            committedTable[channel] = value;
            signalLog.emit(BroadcastSignal{team, channel, value});
            ++signalsAppended;
        }
        m_pending[index].clear();
    }

    if (signalsAppended > 0) {
        BROADCAST_DEBUG(std::format("Committed {} changed broadcast channels", signalsAppended));
    }
    return signalsAppended;
}

const BroadcastStore::ChannelTable& BroadcastStore::committed(Team team) const {
    static const ChannelTable empty;
    return team == Team::NEUTRAL ? empty : m_committed[EntityTraits::teamIndex(team)];
}

const BroadcastStore::ChannelTable& BroadcastStore::pending(Team team) const {
    static const ChannelTable empty;
    return team == Team::NEUTRAL ? empty : m_pending[EntityTraits::teamIndex(team)];
}

void BroadcastStore::clear() {
    for (auto& table : m_committed) {
        table.clear();
    }
    for (auto& table : m_pending) {
        table.clear();
    }
}

} // namespace ArenaEngine
