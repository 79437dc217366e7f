/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIGNAL_LOG_HPP
#define SIGNAL_LOG_HPP

#include "events/Signal.hpp"
#include <cstdint>
#include <mutex>
#include <vector>

namespace ArenaEngine {

/**
 * @brief Append-only record of every state change in the current round
 *
 * Signals are kept in the order their mutations were applied and are
 * never reordered, merged or deduplicated. drain() swaps the pending
 * buffer out under the same mutex that guards append(), so a signal
 * appended concurrently with a drain lands either in the drained batch
 * or in the next one, never in both and never in neither.
 *
 * The log also carries the round stamp applied to appended signals. The
 * owning Match sets it through setRound() at the start of every round.
 */
class SignalLog {
public:
    SignalLog() = default;

    SignalLog(const SignalLog&) = delete;
    SignalLog& operator=(const SignalLog&) = delete;

    void append(SignalPayload payload);

    template<typename T>
    void emit(T payload) {
        append(SignalPayload(std::move(payload)));
    }

    /**
     * @brief Takes every pending signal, leaving the log empty
     * @return Signals in append order
     */
    [[nodiscard]] std::vector<Signal> drain();

    size_t size() const;
    bool empty() const { return size() == 0; }

    uint64_t totalAppended() const;
    uint64_t totalDrained() const;

    void setRound(int32_t round);
    int32_t getRound() const;

    // Drops pending signals and counters, used between matches
    void reset();

private:
    mutable std::mutex m_mutex;
    std::vector<Signal> m_pending;
    uint64_t m_totalAppended{0};
    uint64_t m_totalDrained{0};
    int32_t m_round{0};
};

} // namespace ArenaEngine

#endif // SIGNAL_LOG_HPP
