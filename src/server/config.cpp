// SPDX-License-Identifier: Apache-2.0
#include "server/config.hpp"

#include <algorithm>
#include <stdexcept>

namespace arena::cfg {

namespace {

template <typename T>
void set_if_present(const YAML::Node &root, const char *key, T &field)
{
    if (root[key])
        field = root[key].as<T>();
}

} // namespace

void apply_overrides(ServerConfig &cfg, const YAML::Node &root)
{
    set_if_present(root, "listen_host", cfg.listen_host);
    set_if_present(root, "listen_port", cfg.listen_port);
    set_if_present(root, "tick_rate", cfg.tick_rate);
    set_if_present(root, "max_outbound_queue", cfg.max_outbound_queue);
    set_if_present(root, "write_timeout_ms", cfg.write_timeout_ms);
    set_if_present(root, "join_timeout_ms", cfg.join_timeout_ms);
    set_if_present(root, "log_level", cfg.log_level);
    set_if_present(root, "log_json", cfg.log_json);
    set_if_present(root, "metrics_interval_sec", cfg.metrics_interval_sec);

    auto &sim = cfg.sim;
    set_if_present(root, "arena_width", sim.arena_width);
    set_if_present(root, "arena_height", sim.arena_height);
    set_if_present(root, "player_radius", sim.player_radius);
    set_if_present(root, "bullet_radius", sim.bullet_radius);
    set_if_present(root, "ammo_box_radius", sim.ammo_box_radius);
    set_if_present(root, "player_speed", sim.player_speed);
    set_if_present(root, "bullet_speed", sim.bullet_speed);
    set_if_present(root, "bullet_lifetime_sec", sim.bullet_lifetime_sec);
    set_if_present(root, "ammo_box_lifetime_sec", sim.ammo_box_lifetime_sec);
    set_if_present(root, "ammo_spawn_min_sec", sim.ammo_spawn_min_sec);
    set_if_present(root, "ammo_spawn_max_sec", sim.ammo_spawn_max_sec);
    set_if_present(root, "respawn_sec", sim.respawn_sec);
    set_if_present(root, "max_ammo", sim.max_ammo);
    set_if_present(root, "rng_seed", sim.rng_seed);
}

void validate(const ServerConfig &cfg)
{
    const auto &sim = cfg.sim;
    if (cfg.tick_rate == 0)
        throw std::invalid_argument("tick_rate must be > 0");
    if (cfg.max_outbound_queue == 0)
        throw std::invalid_argument("max_outbound_queue must be > 0");
    if (sim.player_radius <= 0.f || sim.bullet_radius <= 0.f || sim.ammo_box_radius <= 0.f)
        throw std::invalid_argument("entity radii must be > 0");
    float widest = std::max(sim.player_radius, sim.ammo_box_radius);
    if (sim.arena_width <= 2.f * widest || sim.arena_height <= 2.f * widest)
        throw std::invalid_argument("arena too small for entity radii");
    if (sim.ammo_spawn_min_sec < 0.f || sim.ammo_spawn_min_sec > sim.ammo_spawn_max_sec)
        throw std::invalid_argument("ammo spawn interval range is invalid");
    if (sim.bullet_speed <= 0.f)
        throw std::invalid_argument("bullet_speed must be > 0");
}

ServerConfig load_config(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    ServerConfig cfg;
    apply_overrides(cfg, root);
    validate(cfg);
    return cfg;
}

} // namespace arena::cfg
