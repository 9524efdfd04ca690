// SPDX-License-Identifier: Apache-2.0
#include "server/net/client_registry.hpp"

#include "common/metrics.hpp"

namespace arena::net {

const char *to_string(ConnState s)
{
    switch (s) {
        case ConnState::accepted:
            return "ACCEPTED";
        case ConnState::awaiting_join:
            return "AWAITING_JOIN";
        case ConnState::joined:
            return "JOINED";
        case ConnState::closed:
            return "CLOSED";
    }
    return "?";
}

std::shared_ptr<Session> ClientRegistry::add_connection(coro::net::tcp::client client)
{
    std::scoped_lock lk{m_mutex};
    std::string cid = "conn_" + std::to_string(++m_connection_counter);
    auto s = std::make_shared<Session>(cid, std::move(client));
    m_by_connection.emplace(cid, s);
    return s;
}

std::shared_ptr<Session> ClientRegistry::add_detached(const std::string &label)
{
    std::scoped_lock lk{m_mutex};
    std::string cid = label + "_" + std::to_string(++m_connection_counter);
    auto s = std::make_shared<Session>(cid);
    m_by_connection.emplace(cid, s);
    return s;
}

bool ClientRegistry::mark_awaiting_join(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (s->state != ConnState::accepted)
        return false;
    s->state = ConnState::awaiting_join;
    return true;
}

std::string ClientRegistry::join(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (s->state != ConnState::awaiting_join || !m_by_connection.contains(s->connection_id))
        return {};
    s->player_id = "player_" + std::to_string(++m_player_counter);
    s->state = ConnState::joined;
    m_by_player.emplace(s->player_id, s);
    arena::metrics::runtime().connected_players.store(m_by_player.size(), std::memory_order_relaxed);
    return s->player_id;
}

std::vector<std::shared_ptr<Session>> ClientRegistry::broadcast(const FramePtr &frame)
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Session>> overflowed;
    for (auto &[pid, s] : m_by_player) {
        if (s->dead)
            continue;
        if (s->outgoing.size() >= m_max_outbound) {
            s->dead = true;
            s->outgoing.clear();
            overflowed.push_back(s);
            continue;
        }
        s->outgoing.push_back(frame);
    }
    return overflowed;
}

std::vector<FramePtr> ClientRegistry::drain_frames(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    std::vector<FramePtr> out(s->outgoing.begin(), s->outgoing.end());
    s->outgoing.clear();
    return out;
}

bool ClientRegistry::is_dead(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    return s->dead || s->state == ConnState::closed;
}

std::vector<std::string> ClientRegistry::joined_player_ids()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::string> ids;
    ids.reserve(m_by_player.size());
    for (auto &kv : m_by_player)
        ids.push_back(kv.first);
    return ids;
}

std::vector<std::shared_ptr<Session>> ClientRegistry::snapshot_all()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Session>> res;
    res.reserve(m_by_connection.size());
    for (auto &kv : m_by_connection)
        res.push_back(kv.second);
    return res;
}

size_t ClientRegistry::joined_count()
{
    std::scoped_lock lk{m_mutex};
    return m_by_player.size();
}

size_t ClientRegistry::connection_count()
{
    std::scoped_lock lk{m_mutex};
    return m_by_connection.size();
}

bool ClientRegistry::disconnect(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (m_by_connection.erase(s->connection_id) == 0)
        return false;
    if (s->state == ConnState::joined)
        m_by_player.erase(s->player_id);
    s->state = ConnState::closed;
    s->outgoing.clear();
    arena::metrics::runtime().connected_players.store(m_by_player.size(), std::memory_order_relaxed);
    return true;
}

} // namespace arena::net
