// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

// Per-callsite rate limiter: emits on the 1st, (N+1)th, (2N+1)th ... invocation.
// Usage: ARENA_LOG_EVERY_N(warn, 30, "slow client {}", id);
// The counter is atomic because connection coroutines share callsites across pool threads.
#define ARENA_LOG_EVERY_N(level, N, ...) \
    do { \
        static std::atomic<uint64_t> arena_log_every_n_counter{0}; \
        if (arena_log_every_n_counter.fetch_add(1, std::memory_order_relaxed) % (N) == 0) { \
            arena::log::level(__VA_ARGS__); \
        } \
    } while (0)
