// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "arena.pb.h"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace arena::game {

struct PlayerInput
{
    bool left{false};
    bool right{false};
    bool up{false};
    bool down{false};
    bool shoot{false};
    float dir_x{0.f};
    float dir_y{0.f};
};

// Missing fields fall back to neutral values (no movement, no shot).
PlayerInput input_from_message(const arena::Message &msg);

// Latest input per player, written by connection coroutines and drained once per tick.
// Last write wins: inputs arriving faster than the tick rate overwrite each other and
// only the newest one reaches the simulation. A shot flag that is overwritten by a
// later non-shooting input before the tick is lost.
class InputBuffer
{
public:
    void submit(const std::string &player_id, const PlayerInput &input);
    // Returns every buffered input and leaves the buffer empty.
    std::unordered_map<std::string, PlayerInput> drain();
    void erase(const std::string &player_id);
    size_t size();

private:
    std::mutex m_mutex;
    std::unordered_map<std::string, PlayerInput> m_latest;
};

} // namespace arena::game
