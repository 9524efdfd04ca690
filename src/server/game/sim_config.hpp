// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>

namespace arena::game {

// Simulation constants. Distances in arena pixels, times in seconds.
struct SimConfig
{
    float arena_width{800.f};
    float arena_height{600.f};
    float player_radius{20.f};
    float bullet_radius{5.f};
    float ammo_box_radius{10.f};
    float player_speed{200.f};
    float bullet_speed{400.f};
    float bullet_lifetime_sec{3.0f};
    float ammo_box_lifetime_sec{15.0f};
    // Inter-arrival of ammo boxes is drawn uniformly from [min, max] after each spawn.
    float ammo_spawn_min_sec{5.0f};
    float ammo_spawn_max_sec{10.0f};
    float respawn_sec{3.0f};
    uint32_t max_ammo{10};
    // 0 picks a random seed at startup
    uint32_t rng_seed{0};
};

} // namespace arena::game
