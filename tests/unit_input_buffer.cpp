// SPDX-License-Identifier: Apache-2.0
#include "common/wire.hpp"
#include "server/game/input_buffer.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using arena::game::InputBuffer;
using arena::game::PlayerInput;

int main()
{
    // Last write wins per player; drain empties the buffer.
    {
        InputBuffer buf;
        PlayerInput a;
        a.left = true;
        PlayerInput b;
        b.right = true;
        buf.submit("p1", a);
        buf.submit("p1", b);
        buf.submit("p2", a);
        assert(buf.size() == 2);
        auto got = buf.drain();
        assert(got.size() == 2);
        assert(got.at("p1").right && !got.at("p1").left);
        assert(got.at("p2").left);
        assert(buf.size() == 0);
        assert(buf.drain().empty());
        buf.submit("p3", a);
        buf.erase("p3");
        buf.erase("missing");
        assert(buf.size() == 0);
    }

    // Decoding from a wire record, with missing fields neutral.
    {
        auto in = arena::game::input_from_message(arena::wire::make_input(false, true, true, false, true, 0.f, 2.f));
        assert(!in.left && in.right && in.up && !in.down && in.shoot);
        assert(in.dir_x == 0.f && in.dir_y == 2.f);
        arena::Message bare;
        bare.set_type(arena::INPUT);
        auto neutral = arena::game::input_from_message(bare);
        assert(!neutral.left && !neutral.right && !neutral.up && !neutral.down && !neutral.shoot);
        assert(neutral.dir_x == 0.f && neutral.dir_y == 0.f);
    }

    // Concurrent writers against a draining reader: no lost players, no torn entries.
    {
        InputBuffer buf;
        constexpr int kWriters = 8;
        constexpr int kRounds = 2000;
        std::vector<std::thread> writers;
        for (int w = 0; w < kWriters; ++w) {
            writers.emplace_back([&buf, w] {
                std::string id = "p" + std::to_string(w);
                for (int i = 0; i < kRounds; ++i) {
                    PlayerInput in;
                    in.dir_x = static_cast<float>(i);
                    in.dir_y = static_cast<float>(i);
                    buf.submit(id, in);
                }
            });
        }
        size_t drained = 0;
        for (int i = 0; i < 200; ++i) {
            for (auto &[id, in] : buf.drain()) {
                assert(in.dir_x == in.dir_y);
                ++drained;
            }
        }
        for (auto &t : writers)
            t.join();
        auto rest = buf.drain();
        for (auto &[id, in] : rest) {
            assert(in.dir_x == static_cast<float>(kRounds - 1));
            ++drained;
        }
        assert(drained >= static_cast<size_t>(kWriters));
    }
    std::cout << "unit_input_buffer OK" << std::endl;
    return 0;
}
