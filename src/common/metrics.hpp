// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide runtime counters (atomics, no dynamic allocation).
#pragma once
#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace arena::metrics {

struct RuntimeCounters
{
    std::atomic<uint64_t> ticks{0};
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_duration_ns_max{0};
    // Ticks executed back-to-back because the scheduler fell behind.
    std::atomic<uint64_t> catch_up_ticks{0};
    // Gauges refreshed by the tick loop / registry
    std::atomic<uint64_t> connected_players{0};
    std::atomic<uint64_t> players_in_world{0};
    std::atomic<uint64_t> bullets_active{0};
    std::atomic<uint64_t> ammo_boxes_active{0};
    // Network
    std::atomic<uint64_t> connections_accepted{0};
    std::atomic<uint64_t> protocol_errors{0};
    std::atomic<uint64_t> snapshot_bytes{0};
    std::atomic<uint64_t> snapshots_sent{0};
    std::atomic<uint64_t> slow_client_drops{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline void record_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.ticks.fetch_add(1, std::memory_order_relaxed);
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    uint64_t prev = rt.tick_duration_ns_max.load(std::memory_order_relaxed);
    while (ns > prev && !rt.tick_duration_ns_max.compare_exchange_weak(prev, ns, std::memory_order_relaxed)) {
        // retry
    }
}

// Single JSON line summarizing the counters, used by the periodic metrics log.
inline std::string to_json(const char *name)
{
    auto &rt = runtime();
    uint64_t ticks = rt.ticks.load(std::memory_order_relaxed);
    uint64_t avg_ns = ticks ? rt.tick_duration_ns_accum.load(std::memory_order_relaxed) / ticks : 0;
    std::ostringstream j;
    j << "{\"metric\":\"" << name << "\"";
    j << ",\"ticks\":" << ticks;
    j << ",\"avg_tick_ns\":" << avg_ns;
    j << ",\"max_tick_ns\":" << rt.tick_duration_ns_max.load(std::memory_order_relaxed);
    j << ",\"catch_up_ticks\":" << rt.catch_up_ticks.load(std::memory_order_relaxed);
    j << ",\"connected_players\":" << rt.connected_players.load(std::memory_order_relaxed);
    j << ",\"players_in_world\":" << rt.players_in_world.load(std::memory_order_relaxed);
    j << ",\"bullets_active\":" << rt.bullets_active.load(std::memory_order_relaxed);
    j << ",\"ammo_boxes_active\":" << rt.ammo_boxes_active.load(std::memory_order_relaxed);
    j << ",\"connections_accepted\":" << rt.connections_accepted.load(std::memory_order_relaxed);
    j << ",\"protocol_errors\":" << rt.protocol_errors.load(std::memory_order_relaxed);
    j << ",\"snapshots_sent\":" << rt.snapshots_sent.load(std::memory_order_relaxed);
    j << ",\"snapshot_bytes\":" << rt.snapshot_bytes.load(std::memory_order_relaxed);
    j << ",\"slow_client_drops\":" << rt.slow_client_drops.load(std::memory_order_relaxed);
    j << "}";
    return j.str();
}

} // namespace arena::metrics
