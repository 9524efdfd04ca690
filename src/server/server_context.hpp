// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/config.hpp"
#include "server/game/input_buffer.hpp"
#include "server/net/client_registry.hpp"

#include <atomic>
#include <memory>
#include <string_view>
#include <utility>

namespace arena {

// Shared state handed to the listener, every connection coroutine and the tick loop.
// GameState is deliberately absent: it belongs to the tick loop alone.
struct ServerContext
{
    explicit ServerContext(cfg::ServerConfig c) : config(std::move(c)), registry(config.max_outbound_queue) {}

    cfg::ServerConfig config;
    net::ClientRegistry registry;
    game::InputBuffer inputs;
    std::atomic<bool> running{false};
    // Connection coroutines still executing; shutdown waits for this to reach zero.
    std::atomic<int> connection_tasks{0};

    // Exactly-once teardown shared by the reader path, the broadcaster and shutdown:
    // drops the session from the live set, discards its buffered input and shuts the
    // socket down. The player leaves GameState on the next tick's roster pass.
    // Returns false when another path already tore the session down.
    bool teardown(const std::shared_ptr<net::Session> &s, std::string_view reason);
};

} // namespace arena
