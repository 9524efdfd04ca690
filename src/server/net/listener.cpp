// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "common/framing.hpp"
#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "common/wire.hpp"
#include "server/game/entities.hpp"
#include "server/game/tick_loop.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/poll.hpp>

#include <algorithm>
#include <chrono>
#include <span>
#include <string>

namespace arena::net {

namespace {

using namespace std::chrono_literals;

// Sends every byte or gives up: a write that cannot make progress within the timeout
// counts as a dead connection so one slow reader never holds up its own loop forever.
coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data, std::chrono::milliseconds timeout)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        auto ps = co_await client.poll(coro::poll_op::write, timeout);
        if (ps != coro::poll_status::event)
            co_return false;
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

void count_protocol_error()
{
    arena::metrics::runtime().protocol_errors.fetch_add(1, std::memory_order_relaxed);
}

coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler, ServerContext &ctx, std::shared_ptr<Session> session)
{
    co_await scheduler->schedule();
    const auto &cfg = ctx.config;
    const auto read_timeout =
        std::max(std::chrono::ceil<std::chrono::milliseconds>(arena::game::tick_interval(cfg.tick_rate) / 2), 1ms);
    const auto write_timeout = std::chrono::milliseconds(cfg.write_timeout_ms);
    const auto join_deadline = session->accepted_at + std::chrono::milliseconds(cfg.join_timeout_ms);
    if (!ctx.registry.mark_awaiting_join(session)) {
        ctx.teardown(session, "closed before handshake");
        ctx.connection_tasks.fetch_sub(1, std::memory_order_acq_rel);
        co_return;
    }
    arena::log::debug("[conn] {} awaiting JOIN", session->connection_id);

    arena::netutil::FrameParseState fps;
    std::string chunk(4096, '\0');
    std::string payload;
    std::string reason = "shutdown";
    bool joined = false;
    bool stop = false;
    while (!stop && ctx.running.load(std::memory_order_acquire)) {
        if (joined) {
            if (ctx.registry.is_dead(session)) {
                reason = "dropped by server";
                break;
            }
            for (auto &frame : ctx.registry.drain_frames(session)) {
                if (!co_await send_all(*session->client, std::span<const char>(frame->data(), frame->size()), write_timeout)) {
                    reason = "write failed";
                    stop = true;
                    break;
                }
            }
            if (stop)
                break;
        } else if (std::chrono::steady_clock::now() >= join_deadline) {
            reason = "join timeout";
            break;
        }

        auto pstat = co_await session->client->poll(coro::poll_op::read, read_timeout);
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat != coro::poll_status::event) {
            reason = "poll error";
            break;
        }
        auto [rstatus, span] = session->client->recv(chunk);
        if (rstatus == coro::net::recv_status::would_block)
            continue;
        if (rstatus == coro::net::recv_status::closed) {
            reason = "eof";
            break;
        }
        if (rstatus != coro::net::recv_status::ok) {
            reason = "recv error";
            break;
        }
        fps.buffer.insert(fps.buffer.end(), span.begin(), span.end());

        while (!stop) {
            auto fs = arena::netutil::try_extract(fps, payload);
            if (fs == arena::netutil::FrameStatus::need_more)
                break;
            if (fs == arena::netutil::FrameStatus::malformed) {
                count_protocol_error();
                reason = "malformed frame";
                stop = true;
                break;
            }
            auto msg = arena::wire::decode_payload(payload);
            if (!msg) {
                count_protocol_error();
                reason = "undecodable record";
                stop = true;
                break;
            }
            if (!joined) {
                if (msg->type() != arena::JOIN) {
                    count_protocol_error();
                    reason = std::string("expected JOIN, got ") + arena::wire::type_name(msg->type());
                    stop = true;
                    break;
                }
                auto player_id = ctx.registry.join(session);
                if (player_id.empty()) {
                    reason = "closed during join";
                    stop = true;
                    break;
                }
                auto ack = arena::wire::encode_frame(
                    arena::wire::make_join_ack(player_id, arena::game::player_color(player_id)));
                if (ack.empty()
                    || !co_await send_all(*session->client, std::span<const char>(ack.data(), ack.size()), write_timeout)) {
                    reason = "JOIN_ACK write failed";
                    stop = true;
                    break;
                }
                joined = true;
                arena::log::info("[conn] {} joined as {}", session->connection_id, player_id);
                continue;
            }
            switch (msg->type()) {
                case arena::INPUT:
                    ctx.inputs.submit(session->player_id, arena::game::input_from_message(*msg));
                    break;
                case arena::LEAVE:
                    reason = "leave";
                    stop = true;
                    break;
                case arena::JOIN:
                    ARENA_LOG_EVERY_N(debug, 20, "[conn] {} duplicate JOIN ignored", session->player_id);
                    break;
                default:
                    count_protocol_error();
                    reason = std::string("unexpected ") + arena::wire::type_name(msg->type());
                    stop = true;
                    break;
            }
        }
    }
    ctx.teardown(session, reason);
    ctx.connection_tasks.fetch_sub(1, std::memory_order_acq_rel);
}

} // namespace

coro::task<void> run_listener(
    std::shared_ptr<coro::io_scheduler> scheduler, ServerContext &ctx, std::unique_ptr<coro::net::tcp::server> server)
{
    co_await scheduler->schedule();
    arena::log::info("[listener] accepting on {}:{}", ctx.config.listen_host, ctx.config.listen_port);
    while (ctx.running.load(std::memory_order_acquire)) {
        auto status = co_await server->poll(std::chrono::milliseconds(100));
        if (status == coro::poll_status::timeout)
            continue;
        if (status != coro::poll_status::event) {
            arena::log::error("[listener] poll error/closed, exiting accept loop");
            break;
        }
        auto client = server->accept();
        if (!client.socket().is_valid()) {
            ARENA_LOG_EVERY_N(warn, 10, "[listener] accept returned an invalid socket");
            continue;
        }
        arena::metrics::runtime().connections_accepted.fetch_add(1, std::memory_order_relaxed);
        auto session = ctx.registry.add_connection(std::move(client));
        arena::log::info("[listener] new connection {}", session->connection_id);
        ctx.connection_tasks.fetch_add(1, std::memory_order_acq_rel);
        scheduler->spawn(connection_loop(scheduler, ctx, session));
    }
    arena::log::info("[listener] stopped");
}

} // namespace arena::net
