// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/config.hpp"
#include "server/game/tick_loop.hpp"
#include "server/server_context.hpp"

#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <memory>

namespace arena {

// One server instance: binds the listen socket, runs the accept loop and the tick loop
// on the io_scheduler and owns every piece of shared state they use.
class Server
{
public:
    explicit Server(cfg::ServerConfig cfg);
    ~Server();

    Server(const Server &) = delete;
    Server &operator=(const Server &) = delete;

    // Binds and spawns the loops. Throws std::runtime_error when the port cannot be bound.
    void start();
    // Clears the running flag, shuts every live connection down and waits (bounded)
    // for the accept and tick loops to exit. Safe to call more than once.
    void stop(std::chrono::milliseconds wait = std::chrono::milliseconds(3000));
    // Blocks until the accept loop, tick loop and every connection task have exited.
    // Only meaningful after stop(); the destructor calls it.
    void wait_idle();
    bool idle() const;

    bool running() const { return m_ctx.running.load(std::memory_order_acquire); }
    ServerContext &context() { return m_ctx; }

private:
    coro::task<void> tracked(coro::task<void> inner);

    ServerContext m_ctx;
    std::shared_ptr<coro::io_scheduler> m_scheduler;
    std::unique_ptr<game::TickLoop> m_tick_loop;
    std::atomic<int> m_loops_alive{0};
};

} // namespace arena
