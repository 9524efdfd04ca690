// SPDX-License-Identifier: Apache-2.0
#include "common/wire.hpp"

#include "common/framing.hpp"

#include <google/protobuf/util/json_util.h>

namespace arena::wire {

bool encode_payload(const arena::Message &msg, std::string &out)
{
    google::protobuf::util::JsonPrintOptions opts;
    opts.preserve_proto_field_names = true;
    opts.always_print_primitive_fields = true;
    out.clear();
    return google::protobuf::util::MessageToJsonString(msg, &out, opts).ok();
}

std::string encode_frame(const arena::Message &msg)
{
    std::string payload;
    if (!encode_payload(msg, payload))
        return {};
    return arena::netutil::build_frame(payload);
}

std::optional<arena::Message> decode_payload(std::string_view payload)
{
    google::protobuf::util::JsonParseOptions opts;
    opts.ignore_unknown_fields = true;
    arena::Message msg;
    if (!google::protobuf::util::JsonStringToMessage(std::string(payload), &msg, opts).ok())
        return std::nullopt;
    if (msg.type() == arena::MESSAGE_TYPE_UNSPECIFIED)
        return std::nullopt;
    return msg;
}

std::optional<arena::Message> decode_frame(std::string_view bytes)
{
    auto payload = arena::netutil::decode_frame(bytes);
    if (!payload)
        return std::nullopt;
    return decode_payload(*payload);
}

arena::Message make_join()
{
    arena::Message m;
    m.set_type(arena::JOIN);
    return m;
}

arena::Message make_leave()
{
    arena::Message m;
    m.set_type(arena::LEAVE);
    return m;
}

arena::Message make_join_ack(const std::string &player_id, const std::array<uint8_t, 3> &color)
{
    arena::Message m;
    m.set_type(arena::JOIN_ACK);
    m.set_player_id(player_id);
    for (auto c : color)
        m.add_color(c);
    return m;
}

arena::Message make_input(bool left, bool right, bool up, bool down, bool shoot, float dir_x, float dir_y)
{
    arena::Message m;
    m.set_type(arena::INPUT);
    auto *keys = m.mutable_keys();
    keys->set_left(left);
    keys->set_right(right);
    keys->set_up(up);
    keys->set_down(down);
    m.set_shoot(shoot);
    m.add_shoot_dir(dir_x);
    m.add_shoot_dir(dir_y);
    return m;
}

std::array<float, 2> shoot_direction(const arena::Message &msg)
{
    std::array<float, 2> dir{0.f, 0.f};
    for (int i = 0; i < msg.shoot_dir_size() && i < 2; ++i)
        dir[static_cast<size_t>(i)] = msg.shoot_dir(i);
    return dir;
}

const char *type_name(arena::MessageType t)
{
    switch (t) {
        case arena::JOIN:
            return "JOIN";
        case arena::JOIN_ACK:
            return "JOIN_ACK";
        case arena::INPUT:
            return "INPUT";
        case arena::STATE:
            return "STATE";
        case arena::LEAVE:
            return "LEAVE";
        default:
            return "UNSPECIFIED";
    }
}

} // namespace arena::wire
