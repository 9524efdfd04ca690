// SPDX-License-Identifier: Apache-2.0
#include "server/game/entities.hpp"

#include <cassert>
#include <iostream>
#include <string>

int main()
{
    using namespace arena::game;

    // Colour is a pure function of the id and every channel stays visible.
    for (int i = 0; i < 500; ++i) {
        std::string id = "player_" + std::to_string(i);
        auto c = player_color(id);
        assert(c == player_color(id));
        for (auto ch : c)
            assert(ch >= kMinColorChannel);
    }
    assert(player_color("player_1") != player_color("player_2"));
    for (auto ch : player_color(""))
        assert(ch >= kMinColorChannel);

    // Strict overlap: touching circles do not collide.
    assert(circles_collide({0.f, 0.f}, 5.f, {10.f, 0.f}, 6.f));
    assert(!circles_collide({0.f, 0.f}, 5.f, {10.f, 0.f}, 5.f));
    assert(!circles_collide({0.f, 0.f}, 5.f, {0.f, 11.f}, 5.f));
    assert(circles_collide({3.f, 4.f}, 1.f, {3.f, 4.f}, 1.f));
    // 3-4-5 triangle: distance 5, radii sum 5 -> touching only
    assert(!circles_collide({0.f, 0.f}, 2.f, {3.f, 4.f}, 3.f));
    assert(circles_collide({0.f, 0.f}, 2.f, {3.f, 4.f}, 3.01f));

    Player p;
    assert(p.alive && p.score == 0 && p.ammo == 0);
    Bullet b;
    assert(b.pos.x == 0.f && b.vel.y == 0.f);
    std::cout << "unit_entities OK" << std::endl;
    return 0;
}
