// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <coro/net/tcp/client.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace arena::net {

enum class ConnState
{
    accepted,
    awaiting_join,
    joined,
    closed
};

const char *to_string(ConnState s);

using FramePtr = std::shared_ptr<const std::string>;

struct Session
{
    std::string connection_id; // "conn_<n>", assigned at accept
    std::string player_id; // set once on join, never changed afterwards
    ConnState state{ConnState::accepted}; // guarded by the registry mutex
    bool dead{false}; // outbound queue overflowed; guarded by the registry mutex
    std::chrono::steady_clock::time_point accepted_at{std::chrono::steady_clock::now()};
    std::unique_ptr<coro::net::tcp::client> client; // nullptr in unit tests
    std::deque<FramePtr> outgoing; // pending snapshot frames, guarded by the registry mutex

    Session(std::string cid, coro::net::tcp::client c)
        : connection_id(std::move(cid)), client(std::make_unique<coro::net::tcp::client>(std::move(c)))
    {}

    explicit Session(std::string cid) : connection_id(std::move(cid)) {}
};

// Live client set. Every access takes the single mutex; nothing here performs I/O.
class ClientRegistry
{
public:
    explicit ClientRegistry(size_t max_outbound_queue) : m_max_outbound(max_outbound_queue) {}

    std::shared_ptr<Session> add_connection(coro::net::tcp::client client);
    // Registers a session without a socket (tests, tools).
    std::shared_ptr<Session> add_detached(const std::string &label);
    bool mark_awaiting_join(const std::shared_ptr<Session> &s);
    // Issues the next server-wide player id and moves the session to JOINED.
    // Returns an empty string when the session was already torn down.
    std::string join(const std::shared_ptr<Session> &s);

    // Queues the frame on every joined session. Sessions whose queue would exceed
    // the limit are marked dead, their queue is cleared and they are returned so the
    // caller can tear them down once the pass is complete.
    std::vector<std::shared_ptr<Session>> broadcast(const FramePtr &frame);
    std::vector<FramePtr> drain_frames(const std::shared_ptr<Session> &s);
    bool is_dead(const std::shared_ptr<Session> &s);

    std::vector<std::string> joined_player_ids();
    std::vector<std::shared_ptr<Session>> snapshot_all();
    size_t joined_count();
    size_t connection_count();

    // Check-then-delete: only the first call for a session returns true.
    bool disconnect(const std::shared_ptr<Session> &s);

private:
    std::mutex m_mutex;
    size_t m_max_outbound;
    uint64_t m_connection_counter{0};
    uint64_t m_player_counter{0};
    std::unordered_map<std::string, std::shared_ptr<Session>> m_by_connection; // every live connection
    std::unordered_map<std::string, std::shared_ptr<Session>> m_by_player; // joined only
};

} // namespace arena::net
