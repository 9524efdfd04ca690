// SPDX-License-Identifier: Apache-2.0
#include "server/game/tick_loop.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "common/wire.hpp"

#include <algorithm>
#include <unordered_set>
#include <vector>

namespace arena::game {

namespace {

double wall_seconds()
{
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

} // namespace

TickLoop::TickLoop(ServerContext &ctx)
    : m_ctx(ctx), m_state(ctx.config.sim), m_step_sec(1.0f / static_cast<float>(ctx.config.tick_rate))
{}

void TickLoop::reconcile_roster()
{
    auto joined = m_ctx.registry.joined_player_ids();
    std::unordered_set<std::string> live(joined.begin(), joined.end());
    std::vector<std::string> gone;
    for (const auto &[id, p] : m_state.players()) {
        if (!live.contains(id))
            gone.push_back(id);
    }
    for (const auto &id : gone) {
        m_state.remove_player(id);
        arena::log::debug("[tick] removed {} from world", id);
    }
    for (const auto &id : joined) {
        if (m_state.players().contains(id))
            continue;
        const auto &p = m_state.add_player(id);
        arena::log::debug("[tick] spawned {} at ({}, {})", id, p.pos.x, p.pos.y);
    }
}

void TickLoop::run_tick()
{
    auto started = std::chrono::steady_clock::now();
    ++m_tick;
    reconcile_roster();
    m_state.apply_inputs(m_ctx.inputs.drain());
    m_state.update(m_step_sec);

    arena::Message msg;
    msg.set_type(arena::STATE);
    *msg.mutable_state() = m_state.snapshot(m_tick, wall_seconds());
    auto frame = std::make_shared<const std::string>(arena::wire::encode_frame(msg));
    if (frame->empty()) {
        ARENA_LOG_EVERY_N(error, 100, "[tick] failed to encode snapshot tick={}", m_tick);
    } else {
        auto slow = m_ctx.registry.broadcast(frame);
        auto &rt = arena::metrics::runtime();
        rt.snapshot_bytes.fetch_add(frame->size(), std::memory_order_relaxed);
        rt.snapshots_sent.fetch_add(1, std::memory_order_relaxed);
        for (auto &s : slow) {
            rt.slow_client_drops.fetch_add(1, std::memory_order_relaxed);
            m_ctx.teardown(s, "outbound queue overflow");
        }
    }

    auto &rt = arena::metrics::runtime();
    rt.players_in_world.store(m_state.players().size(), std::memory_order_relaxed);
    rt.bullets_active.store(m_state.bullets().size(), std::memory_order_relaxed);
    rt.ammo_boxes_active.store(m_state.ammo_boxes().size(), std::memory_order_relaxed);
    auto took = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - started);
    arena::metrics::record_tick_duration(static_cast<uint64_t>(took.count()));
}

coro::task<void> TickLoop::run(std::shared_ptr<coro::io_scheduler> scheduler)
{
    co_await scheduler->schedule();
    arena::log::info("[tick] loop started at {} Hz", m_ctx.config.tick_rate);
    using clock = std::chrono::steady_clock;
    FixedStepAccumulator acc(tick_interval(m_ctx.config.tick_rate));
    auto last = clock::now();
    while (m_ctx.running.load(std::memory_order_acquire)) {
        auto now = clock::now();
        acc.add(std::chrono::duration_cast<std::chrono::nanoseconds>(now - last));
        last = now;
        uint32_t ran = 0;
        while (acc.consume()) {
            run_tick();
            ++ran;
        }
        if (ran > 1) {
            arena::metrics::runtime().catch_up_ticks.fetch_add(ran - 1, std::memory_order_relaxed);
            ARENA_LOG_EVERY_N(warn, 50, "[tick] fell behind, ran {} ticks back-to-back", ran);
        }
        auto wait =
            std::max(std::chrono::ceil<std::chrono::milliseconds>(acc.until_next()), std::chrono::milliseconds(1));
        co_await scheduler->yield_for(wait);
    }
    arena::log::info("[tick] loop stopped at tick {}", m_tick);
}

} // namespace arena::game
