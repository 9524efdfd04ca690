// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arena::netutil {

// Upper bound for a single record; anything larger is treated as a corrupt prefix.
inline constexpr uint32_t kMaxFrameBytes = 1u << 20;

inline std::string build_frame(std::string_view payload)
{
    uint32_t net = htonl(static_cast<uint32_t>(payload.size()));
    std::string frame;
    frame.resize(4 + payload.size());
    std::memcpy(frame.data(), &net, 4);
    std::memcpy(frame.data() + 4, payload.data(), payload.size());
    return frame;
}

enum class FrameStatus
{
    need_more,
    frame,
    malformed
};

struct FrameParseState
{
    std::vector<char> buffer; // accumulated bytes
    uint32_t expected_len{0};
    bool have_len{false};
    bool poisoned{false}; // set once a bad prefix is seen; stream cannot resync
};

// Extract at most one payload from the accumulated buffer.
inline FrameStatus try_extract(FrameParseState &st, std::string &out)
{
    if (st.poisoned)
        return FrameStatus::malformed;
    if (!st.have_len) {
        if (st.buffer.size() < 4)
            return FrameStatus::need_more;
        uint32_t net;
        std::memcpy(&net, st.buffer.data(), 4);
        st.expected_len = ntohl(net);
        if (st.expected_len == 0 || st.expected_len > kMaxFrameBytes) {
            st.poisoned = true;
            return FrameStatus::malformed;
        }
        st.have_len = true;
    }
    if (st.buffer.size() < 4 + static_cast<size_t>(st.expected_len))
        return FrameStatus::need_more;
    out.assign(st.buffer.data() + 4, st.expected_len);
    st.buffer.erase(st.buffer.begin(), st.buffer.begin() + 4 + st.expected_len);
    st.have_len = false;
    st.expected_len = 0;
    return FrameStatus::frame;
}

// One-shot decode of a complete byte string holding exactly one frame.
// Truncated, malformed or trailing-byte input yields nullopt.
inline std::optional<std::string> decode_frame(std::string_view bytes)
{
    FrameParseState st;
    st.buffer.assign(bytes.begin(), bytes.end());
    std::string out;
    if (try_extract(st, out) != FrameStatus::frame || !st.buffer.empty())
        return std::nullopt;
    return out;
}

} // namespace arena::netutil
