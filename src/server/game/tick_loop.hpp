// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/game_state.hpp"
#include "server/server_context.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <chrono>
#include <cstdint>
#include <memory>

namespace arena::game {

// Fixed-timestep accumulator: wall time goes in, whole steps come out.
class FixedStepAccumulator
{
public:
    explicit FixedStepAccumulator(std::chrono::nanoseconds step) : m_step(step) {}

    void add(std::chrono::nanoseconds elapsed)
    {
        if (elapsed.count() > 0)
            m_pending += elapsed;
    }

    // Consumes one step if enough time has accumulated.
    bool consume()
    {
        if (m_pending < m_step)
            return false;
        m_pending -= m_step;
        return true;
    }

    std::chrono::nanoseconds pending() const { return m_pending; }
    std::chrono::nanoseconds until_next() const
    {
        return m_pending >= m_step ? std::chrono::nanoseconds{0} : m_step - m_pending;
    }
    std::chrono::nanoseconds step() const { return m_step; }

private:
    std::chrono::nanoseconds m_step;
    std::chrono::nanoseconds m_pending{0};
};

inline std::chrono::nanoseconds tick_interval(uint32_t tick_rate)
{
    // Rounded nanoseconds so 30 Hz does not truncate to 33 ms.
    return std::chrono::nanoseconds((1'000'000'000ull + tick_rate / 2) / tick_rate);
}

// Owns the GameState. Each tick: reconcile the roster with the registry, drain the
// input buffer into intents, advance one fixed step, encode one STATE frame and
// queue it on every live session.
class TickLoop
{
public:
    explicit TickLoop(ServerContext &ctx);

    void run_tick();
    coro::task<void> run(std::shared_ptr<coro::io_scheduler> scheduler);

    const GameState &state() const { return m_state; }
    uint64_t tick() const { return m_tick; }
    float step_seconds() const { return m_step_sec; }

private:
    void reconcile_roster();

    ServerContext &m_ctx;
    GameState m_state;
    uint64_t m_tick{0};
    float m_step_sec;
};

} // namespace arena::game
