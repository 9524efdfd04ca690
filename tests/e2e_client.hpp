// SPDX-License-Identifier: Apache-2.0
// Minimal framed client shared by the end-to-end tests.
#pragma once

#include "common/framing.hpp"
#include "common/wire.hpp"
#include "server/config.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace arena_test {

using namespace std::chrono_literals;

inline arena::cfg::ServerConfig e2e_config(uint16_t port)
{
    arena::cfg::ServerConfig cfg;
    cfg.listen_host = "127.0.0.1";
    cfg.listen_port = port;
    cfg.tick_rate = 30;
    cfg.join_timeout_ms = 2000;
    cfg.sim.rng_seed = 77;
    return cfg;
}

class TestClient
{
public:
    TestClient(std::shared_ptr<coro::io_scheduler> sched, uint16_t port)
        : m_cli(sched, {.address = coro::net::ip_address::from_string("127.0.0.1"), .port = port})
    {}

    coro::task<bool> connect()
    {
        auto st = co_await m_cli.connect(2s);
        co_return st == coro::net::connect_status::connected;
    }

    coro::task<bool> send_raw(std::string bytes)
    {
        std::span<const char> rest(bytes.data(), bytes.size());
        while (!rest.empty()) {
            auto ps = co_await m_cli.poll(coro::poll_op::write, 1s);
            if (ps != coro::poll_status::event)
                co_return false;
            auto [s, r] = m_cli.send(rest);
            if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block)
                rest = r;
            else
                co_return false;
        }
        co_return true;
    }

    coro::task<bool> send(const arena::Message &msg) { co_return co_await send_raw(arena::wire::encode_frame(msg)); }

    // Reads records until one satisfies pred, the deadline passes or the server closes.
    coro::task<std::optional<arena::Message>> read_until(
        std::function<bool(const arena::Message &)> pred, std::chrono::milliseconds timeout)
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::string payload;
        while (std::chrono::steady_clock::now() < deadline && !m_closed) {
            while (arena::netutil::try_extract(m_fps, payload) == arena::netutil::FrameStatus::frame) {
                auto msg = arena::wire::decode_payload(payload);
                if (msg && pred(*msg))
                    co_return msg;
            }
            auto ps = co_await m_cli.poll(coro::poll_op::read, 100ms);
            if (ps == coro::poll_status::timeout)
                continue;
            if (ps != coro::poll_status::event) {
                m_closed = true;
                break;
            }
            std::string tmp(4096, '\0');
            auto [rs, span] = m_cli.recv(tmp);
            if (rs == coro::net::recv_status::would_block)
                continue;
            if (rs != coro::net::recv_status::ok) {
                m_closed = true;
                break;
            }
            m_fps.buffer.insert(m_fps.buffer.end(), span.begin(), span.end());
        }
        co_return std::nullopt;
    }

    // True once the server has closed the connection (EOF or error) within the timeout.
    coro::task<bool> wait_closed(std::chrono::milliseconds timeout)
    {
        co_await read_until([](const arena::Message &) { return false; }, timeout);
        co_return m_closed;
    }

    // Sends JOIN and waits for the acknowledgement; returns the issued id or "".
    coro::task<std::string> join()
    {
        if (!co_await send(arena::wire::make_join()))
            co_return std::string{};
        auto ack = co_await read_until([](const arena::Message &m) { return m.type() == arena::JOIN_ACK; }, 3s);
        co_return ack ? ack->player_id() : std::string{};
    }

    void close() { m_cli.socket().shutdown(); }
    bool closed() const { return m_closed; }

private:
    coro::net::tcp::client m_cli;
    arena::netutil::FrameParseState m_fps;
    bool m_closed{false};
};

inline bool is_state_with(const arena::Message &m, const std::string &player_id)
{
    return m.type() == arena::STATE && m.state().players().contains(player_id);
}

} // namespace arena_test
