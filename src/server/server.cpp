// SPDX-License-Identifier: Apache-2.0
#include "server/server.hpp"

#include "common/logger.hpp"
#include "server/net/listener.hpp"

#include <coro/default_executor.hpp>
#include <coro/net/tcp/server.hpp>

#include <stdexcept>
#include <thread>

namespace arena {

Server::Server(cfg::ServerConfig cfg) : m_ctx(std::move(cfg)) {}

Server::~Server()
{
    stop();
    // The spawned coroutines reference m_ctx and m_tick_loop.
    wait_idle();
}

bool Server::idle() const
{
    return m_loops_alive.load(std::memory_order_acquire) == 0
        && m_ctx.connection_tasks.load(std::memory_order_acquire) == 0;
}

void Server::wait_idle()
{
    while (!idle())
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
}

coro::task<void> Server::tracked(coro::task<void> inner)
{
    co_await inner;
    m_loops_alive.fetch_sub(1, std::memory_order_acq_rel);
}

void Server::start()
{
    if (m_ctx.running.load(std::memory_order_acquire))
        return;
    m_scheduler = coro::default_executor::io_executor();
    std::unique_ptr<coro::net::tcp::server> listen_socket;
    try {
        listen_socket = std::make_unique<coro::net::tcp::server>(
            m_scheduler,
            coro::net::tcp::server::options{
                .address = coro::net::ip_address::from_string(m_ctx.config.listen_host),
                .port = m_ctx.config.listen_port});
    } catch (const std::exception &ex) {
        throw std::runtime_error(
            "cannot listen on " + m_ctx.config.listen_host + ":" + std::to_string(m_ctx.config.listen_port) + ": "
            + ex.what());
    }
    m_tick_loop = std::make_unique<game::TickLoop>(m_ctx);
    m_ctx.running.store(true, std::memory_order_release);
    m_loops_alive.store(2, std::memory_order_release);
    m_scheduler->spawn(tracked(net::run_listener(m_scheduler, m_ctx, std::move(listen_socket))));
    m_scheduler->spawn(tracked(m_tick_loop->run(m_scheduler)));
    arena::log::info("[server] started on {}:{}", m_ctx.config.listen_host, m_ctx.config.listen_port);
}

void Server::stop(std::chrono::milliseconds wait)
{
    if (!m_ctx.running.exchange(false, std::memory_order_acq_rel))
        return;
    arena::log::info("[server] stopping");
    for (auto &s : m_ctx.registry.snapshot_all())
        m_ctx.teardown(s, "server shutdown");
    auto deadline = std::chrono::steady_clock::now() + wait;
    while (!idle() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    if (!idle())
        arena::log::warn("[server] loops still running after {} ms", wait.count());
    else
        arena::log::info("[server] stopped");
}

} // namespace arena
