/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "events/SignalLog.hpp"
#include "core/Logger.hpp"
#include <format>

namespace ArenaEngine {

void SignalLog::append(SignalPayload payload) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pending.push_back(Signal{m_round, std::move(payload)});
    ++m_totalAppended;
}

std::vector<Signal> SignalLog::drain() {
    std::vector<Signal> drained;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        drained.swap(m_pending);
        m_totalDrained += drained.size();
    }
    SIGNAL_DEBUG(std::format("Drained {} signals for round {}", drained.size(), getRound()));
    return drained;
}

size_t SignalLog::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

uint64_t SignalLog::totalAppended() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_totalAppended;
}

uint64_t SignalLog::totalDrained() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_totalDrained;
}

void SignalLog::setRound(int32_t round) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_round = round;
}

int32_t SignalLog::getRound() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_round;
}

void SignalLog::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_pending.empty()) {
        SIGNAL_WARN(std::format("Discarding {} undrained signals", m_pending.size()));
    }
    m_pending.clear();
    m_totalAppended = 0;
    m_totalDrained = 0;
    m_round = 0;
}

} // namespace ArenaEngine
