// SPDX-License-Identifier: Apache-2.0
// JSON record codec: field names on the wire, lenient decoding of optional fields,
// rejection of records without a usable type.
#include "common/wire.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

static bool contains(const std::string &hay, const std::string &needle)
{
    return hay.find(needle) != std::string::npos;
}

int main()
{
    // Encoded records carry the type by name and the documented field names.
    {
        std::string json;
        assert(arena::wire::encode_payload(arena::wire::make_join(), json));
        assert(contains(json, "\"type\":\"JOIN\""));

        assert(arena::wire::encode_payload(arena::wire::make_join_ack("player_3", {120, 200, 255}), json));
        assert(contains(json, "\"type\":\"JOIN_ACK\""));
        assert(contains(json, "\"player_id\":\"player_3\""));
        assert(contains(json, "\"color\":[120,200,255]"));

        assert(arena::wire::encode_payload(arena::wire::make_input(true, false, false, true, true, 0.5f, -1.f), json));
        assert(contains(json, "\"keys\""));
        assert(contains(json, "\"shoot_dir\":[0.5,-1]"));
    }

    // Hand-written client JSON decodes; unknown fields are ignored.
    {
        auto msg = arena::wire::decode_payload(
            R"({"type":"INPUT","keys":{"left":true,"down":true},"shoot":true,"shoot_dir":[0.25,-2],"extra":42})");
        assert(msg.has_value());
        assert(msg->type() == arena::INPUT);
        assert(msg->keys().left() && msg->keys().down());
        assert(!msg->keys().right() && !msg->keys().up());
        assert(msg->shoot());
        auto dir = arena::wire::shoot_direction(*msg);
        assert(dir[0] == 0.25f && dir[1] == -2.f);
    }

    // Missing optional fields read as neutral values.
    {
        auto msg = arena::wire::decode_payload(R"({"type":"INPUT"})");
        assert(msg.has_value());
        assert(!msg->has_keys());
        assert(!msg->shoot());
        auto dir = arena::wire::shoot_direction(*msg);
        assert(dir[0] == 0.f && dir[1] == 0.f);
        auto half = arena::wire::decode_payload(R"({"type":"INPUT","shoot_dir":[3]})");
        assert(half.has_value());
        assert(arena::wire::shoot_direction(*half)[0] == 3.f);
        assert(arena::wire::shoot_direction(*half)[1] == 0.f);
    }

    // Records without a usable type, or that are not JSON objects, are rejected.
    assert(!arena::wire::decode_payload(R"({"shoot":true})").has_value());
    assert(!arena::wire::decode_payload(R"({"type":"MESSAGE_TYPE_UNSPECIFIED"})").has_value());
    assert(!arena::wire::decode_payload(R"({"type":"NOT_A_TYPE"})").has_value());
    assert(!arena::wire::decode_payload("{not json").has_value());
    assert(!arena::wire::decode_payload("[1,2,3]").has_value());
    assert(!arena::wire::decode_payload("").has_value());

    // STATE survives a frame round trip with its maps intact.
    {
        arena::Message st;
        st.set_type(arena::STATE);
        auto *ws = st.mutable_state();
        ws->set_tick(42);
        ws->set_timestamp(1700000000.25);
        auto &p = (*ws->mutable_players())["player_1"];
        p.mutable_position()->set_x(100.f);
        p.mutable_position()->set_y(300.f);
        p.set_alive(true);
        p.set_ammo(7);
        p.set_score(2);
        auto &b = (*ws->mutable_bullets())["player_1_0"];
        b.set_owner_id("player_1");
        b.mutable_velocity()->set_x(400.f);
        (*ws->mutable_ammo_boxes())["ammo_0"].mutable_position()->set_x(50.f);

        auto frame = arena::wire::encode_frame(st);
        assert(!frame.empty());
        auto back = arena::wire::decode_frame(frame);
        assert(back.has_value());
        assert(back->type() == arena::STATE);
        const auto &s = back->state();
        assert(s.tick() == 42);
        assert(std::fabs(s.timestamp() - 1700000000.25) < 1e-6);
        assert(s.players().at("player_1").ammo() == 7);
        assert(s.players().at("player_1").position().y() == 300.f);
        assert(s.bullets().at("player_1_0").owner_id() == "player_1");
        assert(s.ammo_boxes().at("ammo_0").position().x() == 50.f);

        // A frame cut short does not decode.
        assert(!arena::wire::decode_frame(frame.substr(0, frame.size() - 2)).has_value());
        // Neither does one followed by stray bytes.
        assert(!arena::wire::decode_frame(frame + frame).has_value());
    }

    assert(std::string(arena::wire::type_name(arena::LEAVE)) == "LEAVE");
    assert(std::string(arena::wire::type_name(arena::MESSAGE_TYPE_UNSPECIFIED)) == "UNSPECIFIED");
    std::cout << "unit_wire_codec OK" << std::endl;
    return 0;
}
