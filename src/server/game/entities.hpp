// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace arena::game {

struct Vec2
{
    float x{0.f};
    float y{0.f};
};

using Color = std::array<uint8_t, 3>;

// Lowest value of any color channel so players stay visible on a dark background.
inline constexpr uint8_t kMinColorChannel = 100;

// Pure function of the id: FNV-1a hash split into r/g/b, each floored at kMinColorChannel.
Color player_color(std::string_view player_id);

// Strict overlap test; circles that merely touch do not collide.
bool circles_collide(Vec2 a, float ra, Vec2 b, float rb);

struct Player
{
    std::string id;
    Vec2 pos;
    Vec2 vel;
    bool alive{true};
    uint32_t score{0};
    uint32_t ammo{0};
    Color color{};
    double respawn_at{0.0}; // simulation time; meaningful only while !alive
};

struct Bullet
{
    std::string id; // "<owner>_<counter>"
    std::string owner_id;
    Vec2 pos;
    Vec2 vel;
    double spawn_time{0.0};
};

struct AmmoBox
{
    std::string id; // "ammo_<counter>"
    Vec2 pos;
    double spawn_time{0.0};
};

} // namespace arena::game
