// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "arena.pb.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace arena::wire {

// JSON text of one record (proto field names, primitive fields always printed).
bool encode_payload(const arena::Message &msg, std::string &out);
// Length-prefixed frame ready for the socket; empty on serialization failure.
std::string encode_frame(const arena::Message &msg);

// Parses one JSON payload. Unknown fields are ignored; nullopt when the text is
// not a JSON object matching the schema or the type is unspecified.
std::optional<arena::Message> decode_payload(std::string_view payload);
// Decodes a byte string holding exactly one frame; nullopt for truncated input
// or bytes past the first frame.
std::optional<arena::Message> decode_frame(std::string_view bytes);

arena::Message make_join();
arena::Message make_leave();
arena::Message make_join_ack(const std::string &player_id, const std::array<uint8_t, 3> &color);
arena::Message make_input(bool left, bool right, bool up, bool down, bool shoot, float dir_x, float dir_y);

// shoot_dir with missing components read as zero.
std::array<float, 2> shoot_direction(const arena::Message &msg);

const char *type_name(arena::MessageType t);

} // namespace arena::wire
