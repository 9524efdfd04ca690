// SPDX-License-Identifier: Apache-2.0
#include "server/game/game_state.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace arena::game {

namespace {

uint32_t pick_seed(uint32_t configured)
{
    if (configured != 0)
        return configured;
    return std::random_device{}();
}

void set_vec(arena::Vec2 *out, Vec2 v)
{
    out->set_x(v.x);
    out->set_y(v.y);
}

} // namespace

GameState::GameState(const SimConfig &cfg) : m_cfg(cfg), m_rng(pick_seed(cfg.rng_seed))
{
    float lo = std::min(m_cfg.ammo_spawn_min_sec, m_cfg.ammo_spawn_max_sec);
    float hi = std::max(m_cfg.ammo_spawn_min_sec, m_cfg.ammo_spawn_max_sec);
    m_next_ammo_interval = std::uniform_real_distribution<double>(lo, hi)(m_rng);
}

Vec2 GameState::random_position(float radius)
{
    std::uniform_real_distribution<float> ux(radius, m_cfg.arena_width - radius);
    std::uniform_real_distribution<float> uy(radius, m_cfg.arena_height - radius);
    float x = ux(m_rng);
    float y = uy(m_rng);
    return Vec2{x, y};
}

Player &GameState::add_player(const std::string &id)
{
    auto existing = m_players.find(id);
    if (existing != m_players.end()) {
        arena::log::warn("[world] duplicate add_player id={} ignored", id);
        return existing->second;
    }
    Player p;
    p.id = id;
    p.pos = random_position(m_cfg.player_radius);
    p.alive = true;
    p.ammo = m_cfg.max_ammo;
    p.color = player_color(id);
    return m_players.emplace(id, std::move(p)).first->second;
}

void GameState::remove_player(const std::string &id)
{
    m_players.erase(id);
}

std::optional<Bullet> GameState::create_bullet(const std::string &owner_id, float dir_x, float dir_y)
{
    auto it = m_players.find(owner_id);
    if (it == m_players.end())
        return std::nullopt;
    Player &owner = it->second;
    if (!owner.alive || owner.ammo == 0)
        return std::nullopt;
    // Double precision so tiny and huge finite components still normalize.
    double len = std::hypot(static_cast<double>(dir_x), static_cast<double>(dir_y));
    if (!std::isfinite(len) || !(len > 0.0))
        return std::nullopt;
    auto nx = static_cast<float>(dir_x / len);
    auto ny = static_cast<float>(dir_y / len);
    float offset = m_cfg.player_radius + m_cfg.bullet_radius;
    Bullet b;
    b.id = owner_id + "_" + std::to_string(m_bullet_counter++);
    b.owner_id = owner_id;
    b.pos = Vec2{owner.pos.x + nx * offset, owner.pos.y + ny * offset};
    b.vel = Vec2{nx * m_cfg.bullet_speed, ny * m_cfg.bullet_speed};
    b.spawn_time = m_now;
    owner.ammo -= 1;
    m_bullets.emplace(b.id, b);
    return b;
}

AmmoBox &GameState::spawn_ammo_box()
{
    AmmoBox box;
    box.id = "ammo_" + std::to_string(m_box_counter++);
    box.pos = random_position(m_cfg.ammo_box_radius);
    box.spawn_time = m_now;
    auto it = m_boxes.emplace(box.id, box).first;
    arena::log::debug("[world] ammo box {} at ({}, {})", box.id, box.pos.x, box.pos.y);
    return it->second;
}

void GameState::apply_inputs(const std::unordered_map<std::string, PlayerInput> &inputs)
{
    for (auto &[id, p] : m_players)
        p.vel = Vec2{};
    for (const auto &[id, in] : inputs) {
        auto it = m_players.find(id);
        if (it == m_players.end())
            continue;
        Player &p = it->second;
        if (!p.alive)
            continue;
        float vx = 0.f;
        float vy = 0.f;
        if (in.left)
            vx -= m_cfg.player_speed;
        if (in.right)
            vx += m_cfg.player_speed;
        if (in.up)
            vy -= m_cfg.player_speed;
        if (in.down)
            vy += m_cfg.player_speed;
        p.vel = Vec2{vx, vy};
        if (in.shoot)
            create_bullet(id, in.dir_x, in.dir_y);
    }
}

void GameState::respawn(Player &p)
{
    p.alive = true;
    p.ammo = m_cfg.max_ammo;
    p.pos = random_position(m_cfg.player_radius);
    p.vel = Vec2{};
    arena::log::debug("[world] respawn {} at ({}, {})", p.id, p.pos.x, p.pos.y);
}

void GameState::kill(Player &victim)
{
    victim.alive = false;
    victim.vel = Vec2{};
    victim.respawn_at = m_now + m_cfg.respawn_sec;
}

void GameState::step_players(float dt)
{
    const float r = m_cfg.player_radius;
    for (auto &[id, p] : m_players) {
        if (p.alive) {
            p.pos.x += p.vel.x * dt;
            p.pos.y += p.vel.y * dt;
            p.pos.x = std::clamp(p.pos.x, r, m_cfg.arena_width - r);
            p.pos.y = std::clamp(p.pos.y, r, m_cfg.arena_height - r);
        } else if (m_now >= p.respawn_at) {
            respawn(p);
        }
    }
}

void GameState::step_bullets(float dt)
{
    for (auto it = m_bullets.begin(); it != m_bullets.end();) {
        Bullet &b = it->second;
        b.pos.x += b.vel.x * dt;
        b.pos.y += b.vel.y * dt;
        bool too_old = m_now - b.spawn_time > m_cfg.bullet_lifetime_sec;
        bool outside = b.pos.x < 0.f || b.pos.x > m_cfg.arena_width || b.pos.y < 0.f || b.pos.y > m_cfg.arena_height;
        if (too_old || outside)
            it = m_bullets.erase(it);
        else
            ++it;
    }
}

void GameState::step_ammo_boxes()
{
    std::erase_if(m_boxes, [&](const auto &kv) { return m_now - kv.second.spawn_time > m_cfg.ammo_box_lifetime_sec; });
    if (m_now - m_last_ammo_spawn > m_next_ammo_interval) {
        spawn_ammo_box();
        m_last_ammo_spawn = m_now;
        float lo = std::min(m_cfg.ammo_spawn_min_sec, m_cfg.ammo_spawn_max_sec);
        float hi = std::max(m_cfg.ammo_spawn_min_sec, m_cfg.ammo_spawn_max_sec);
        m_next_ammo_interval = std::uniform_real_distribution<double>(lo, hi)(m_rng);
    }
}

void GameState::resolve_collisions()
{
    for (auto bit = m_bullets.begin(); bit != m_bullets.end();) {
        const Bullet &b = bit->second;
        Player *victim = nullptr;
        for (auto &[pid, p] : m_players) {
            if (pid == b.owner_id || !p.alive)
                continue;
            if (circles_collide(b.pos, m_cfg.bullet_radius, p.pos, m_cfg.player_radius)) {
                victim = &p;
                break;
            }
        }
        if (!victim) {
            ++bit;
            continue;
        }
        kill(*victim);
        auto shooter = m_players.find(b.owner_id);
        if (shooter != m_players.end())
            shooter->second.score += 1;
        arena::log::debug("[world] {} hit {} bullet={}", b.owner_id, victim->id, b.id);
        bit = m_bullets.erase(bit);
    }
    for (auto bx = m_boxes.begin(); bx != m_boxes.end();) {
        Player *collector = nullptr;
        for (auto &[pid, p] : m_players) {
            if (p.alive && circles_collide(bx->second.pos, m_cfg.ammo_box_radius, p.pos, m_cfg.player_radius)) {
                collector = &p;
                break;
            }
        }
        if (!collector) {
            ++bx;
            continue;
        }
        collector->ammo = m_cfg.max_ammo;
        bx = m_boxes.erase(bx);
    }
}

void GameState::update(float dt)
{
    m_now += dt;
    step_players(dt);
    step_bullets(dt);
    step_ammo_boxes();
    resolve_collisions();
}

arena::WorldState GameState::snapshot(uint64_t tick, double wall_time_sec) const
{
    arena::WorldState ws;
    ws.set_tick(tick);
    ws.set_timestamp(wall_time_sec);
    auto *players = ws.mutable_players();
    for (const auto &[id, p] : m_players) {
        arena::PlayerState ps;
        set_vec(ps.mutable_position(), p.pos);
        set_vec(ps.mutable_velocity(), p.vel);
        ps.set_score(p.score);
        ps.set_alive(p.alive);
        for (auto c : p.color)
            ps.add_color(c);
        ps.set_ammo(p.ammo);
        (*players)[id] = std::move(ps);
    }
    auto *bullets = ws.mutable_bullets();
    for (const auto &[id, b] : m_bullets) {
        arena::BulletState bs;
        bs.set_owner_id(b.owner_id);
        set_vec(bs.mutable_position(), b.pos);
        set_vec(bs.mutable_velocity(), b.vel);
        (*bullets)[id] = std::move(bs);
    }
    auto *boxes = ws.mutable_ammo_boxes();
    for (const auto &[id, box] : m_boxes) {
        arena::AmmoBoxState as;
        set_vec(as.mutable_position(), box.pos);
        (*boxes)[id] = std::move(as);
    }
    return ws;
}

Player *GameState::find_player(const std::string &id)
{
    auto it = m_players.find(id);
    return it == m_players.end() ? nullptr : &it->second;
}

} // namespace arena::game
