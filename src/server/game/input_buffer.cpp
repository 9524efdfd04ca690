// SPDX-License-Identifier: Apache-2.0
#include "server/game/input_buffer.hpp"

#include "common/wire.hpp"

namespace arena::game {

PlayerInput input_from_message(const arena::Message &msg)
{
    PlayerInput in;
    if (msg.has_keys()) {
        in.left = msg.keys().left();
        in.right = msg.keys().right();
        in.up = msg.keys().up();
        in.down = msg.keys().down();
    }
    in.shoot = msg.shoot();
    auto dir = arena::wire::shoot_direction(msg);
    in.dir_x = dir[0];
    in.dir_y = dir[1];
    return in;
}

void InputBuffer::submit(const std::string &player_id, const PlayerInput &input)
{
    std::scoped_lock lk{m_mutex};
    m_latest[player_id] = input;
}

std::unordered_map<std::string, PlayerInput> InputBuffer::drain()
{
    std::scoped_lock lk{m_mutex};
    std::unordered_map<std::string, PlayerInput> out;
    out.swap(m_latest);
    return out;
}

void InputBuffer::erase(const std::string &player_id)
{
    std::scoped_lock lk{m_mutex};
    m_latest.erase(player_id);
}

size_t InputBuffer::size()
{
    std::scoped_lock lk{m_mutex};
    return m_latest.size();
}

} // namespace arena::game
