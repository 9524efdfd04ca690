// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/server_context.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/server.hpp>

#include <memory>

namespace arena::net {

// Accept loop over an already bound server socket. Polls with a bounded interval so
// it notices ctx.running turning false, and spawns one connection coroutine per client.
// Read poll timeouts inside each connection are derived from the tick rate so queued
// snapshots are flushed within half a tick.
coro::task<void> run_listener(
    std::shared_ptr<coro::io_scheduler> scheduler, ServerContext &ctx, std::unique_ptr<coro::net::tcp::server> server);

} // namespace arena::net
