// SPDX-License-Identifier: Apache-2.0
#include "server/game/entities.hpp"

#include <algorithm>

namespace arena::game {

Color player_color(std::string_view player_id)
{
    uint32_t h = 2166136261u;
    for (unsigned char c : player_id) {
        h ^= c;
        h *= 16777619u;
    }
    auto channel = [](uint32_t v) { return std::max<uint8_t>(kMinColorChannel, static_cast<uint8_t>(v & 0xFFu)); };
    return Color{channel(h >> 16), channel(h >> 8), channel(h)};
}

bool circles_collide(Vec2 a, float ra, Vec2 b, float rb)
{
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    float reach = ra + rb;
    return dx * dx + dy * dy < reach * reach;
}

} // namespace arena::game
