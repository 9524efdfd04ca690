// SPDX-License-Identifier: Apache-2.0
// unit_framing_fuzz.cpp
// Fuzz-style tests for the frame parser: malformed lengths, truncations, random noise.
#include "common/framing.hpp"

#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>

static size_t feed_bytes(arena::netutil::FrameParseState &st, const std::vector<char> &data, size_t chunk)
{
    std::string out;
    size_t frames = 0;
    for (size_t i = 0; i < data.size();) {
        size_t n = std::min(chunk, data.size() - i);
        st.buffer.insert(st.buffer.end(), data.begin() + i, data.begin() + i + n);
        i += n;
        while (arena::netutil::try_extract(st, out) == arena::netutil::FrameStatus::frame) {
            assert(!out.empty());
            ++frames;
        }
    }
    return frames;
}

static uint32_t rnd32(std::mt19937 &rng)
{
    return std::uniform_int_distribution<uint32_t>{0, 0xffffffff}(rng);
}

static std::string prefix_only(uint32_t len)
{
    uint32_t net = htonl(len);
    std::string s(4, '\0');
    std::memcpy(s.data(), &net, 4);
    return s;
}

int main()
{
    using arena::netutil::FrameParseState;
    using arena::netutil::FrameStatus;
    std::mt19937 rng(12345);
    // 1. Valid random payloads with varied chunk sizes, several frames per stream
    for (int caseId = 0; caseId < 200; ++caseId) {
        std::vector<char> stream;
        size_t count = 1 + caseId % 4;
        for (size_t k = 0; k < count; ++k) {
            size_t len = std::uniform_int_distribution<size_t>{1, 2048}(rng);
            std::string payload(len, '\0');
            for (auto &c : payload)
                c = static_cast<char>(rnd32(rng));
            auto frame = arena::netutil::build_frame(payload);
            stream.insert(stream.end(), frame.begin(), frame.end());
        }
        FrameParseState st;
        assert(feed_bytes(st, stream, (caseId % 17) + 1) == count);
        assert(st.buffer.empty());
    }
    // 2. Truncated frames never yield output
    for (int caseId = 0; caseId < 100; ++caseId) {
        size_t len = std::uniform_int_distribution<size_t>{10, 4096}(rng);
        std::string payload(len, 'x');
        auto frame = arena::netutil::build_frame(payload);
        frame.resize(frame.size() - std::uniform_int_distribution<size_t>{1, len}(rng));
        FrameParseState st;
        std::string out;
        st.buffer.assign(frame.begin(), frame.end());
        assert(try_extract(st, out) == FrameStatus::need_more);
    }
    // 3. Length above the cap is malformed and the stream stays poisoned
    {
        FrameParseState st;
        auto bad = prefix_only(arena::netutil::kMaxFrameBytes + 1);
        st.buffer.assign(bad.begin(), bad.end());
        std::string out;
        assert(try_extract(st, out) == FrameStatus::malformed);
        auto good = arena::netutil::build_frame("ok");
        st.buffer.insert(st.buffer.end(), good.begin(), good.end());
        assert(try_extract(st, out) == FrameStatus::malformed);
    }
    // 4. Exactly the cap is accepted
    {
        FrameParseState st;
        auto hdr = prefix_only(arena::netutil::kMaxFrameBytes);
        st.buffer.assign(hdr.begin(), hdr.end());
        std::string out;
        assert(try_extract(st, out) == FrameStatus::need_more);
        st.buffer.resize(4 + arena::netutil::kMaxFrameBytes, 'y');
        assert(try_extract(st, out) == FrameStatus::frame);
        assert(out.size() == arena::netutil::kMaxFrameBytes);
    }
    // 5. Zero length is rejected
    {
        FrameParseState st;
        auto zero = prefix_only(0);
        st.buffer.assign(zero.begin(), zero.end());
        std::string out;
        assert(try_extract(st, out) == FrameStatus::malformed);
    }
    // 6. Random noise either waits for more bytes or is malformed; never crashes
    for (int caseId = 0; caseId < 200; ++caseId) {
        FrameParseState st;
        size_t len = std::uniform_int_distribution<size_t>{0, 64}(rng);
        for (size_t i = 0; i < len; ++i)
            st.buffer.push_back(static_cast<char>(rnd32(rng)));
        std::string out;
        for (int i = 0; i < 4; ++i) {
            if (try_extract(st, out) != FrameStatus::frame)
                break;
        }
    }
    std::cout << "unit_framing_fuzz OK" << std::endl;
    return 0;
}
