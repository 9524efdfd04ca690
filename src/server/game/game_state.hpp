// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "arena.pb.h"
#include "server/game/entities.hpp"
#include "server/game/input_buffer.hpp"
#include "server/game/sim_config.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

namespace arena::game {

// Authoritative world. Owned and mutated by the tick loop only; other threads see it
// through the WorldState snapshot built at the end of each tick.
//
// Entities live in id-ordered maps, which fixes the collision tie-break: bullets are
// resolved in ascending bullet id, each against players in ascending player id, and
// the first overlapping player wins. Ammo boxes go to the first living player in id order.
class GameState
{
public:
    explicit GameState(const SimConfig &cfg);

    // Spawns at a random in-bounds position with full ammo. A duplicate id leaves the
    // existing player untouched and returns it.
    Player &add_player(const std::string &id);
    void remove_player(const std::string &id);

    // Rejected (nullopt, no side effect) for unknown or dead owner, empty magazine or a
    // zero / non-finite direction. Costs one ammo otherwise.
    std::optional<Bullet> create_bullet(const std::string &owner_id, float dir_x, float dir_y);
    AmmoBox &spawn_ammo_box();

    // Resets every player's velocity, then applies the given intents (movement + shot).
    // Intents of dead players are dropped.
    void apply_inputs(const std::unordered_map<std::string, PlayerInput> &inputs);

    // One fixed step: movement and respawn, bullet expiry, ammo box expiry and spawn, collisions.
    void update(float dt);

    arena::WorldState snapshot(uint64_t tick, double wall_time_sec) const;

    Player *find_player(const std::string &id);
    const std::map<std::string, Player> &players() const { return m_players; }
    const std::map<std::string, Bullet> &bullets() const { return m_bullets; }
    const std::map<std::string, AmmoBox> &ammo_boxes() const { return m_boxes; }
    const SimConfig &config() const { return m_cfg; }
    double now() const { return m_now; }
    double next_ammo_interval() const { return m_next_ammo_interval; }

private:
    Vec2 random_position(float radius);
    void respawn(Player &p);
    void kill(Player &victim);
    void step_players(float dt);
    void step_bullets(float dt);
    void step_ammo_boxes();
    void resolve_collisions();

    SimConfig m_cfg;
    std::mt19937 m_rng;
    std::map<std::string, Player> m_players;
    std::map<std::string, Bullet> m_bullets;
    std::map<std::string, AmmoBox> m_boxes;
    uint64_t m_bullet_counter{0};
    uint64_t m_box_counter{0};
    double m_now{0.0}; // simulation seconds
    double m_last_ammo_spawn{0.0};
    double m_next_ammo_interval{0.0};
};

} // namespace arena::game
