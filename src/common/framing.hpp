// SPDX-License-Identifier: Apache-2.0
// Length-prefixed framing: 4-byte big-endian payload length followed by the payload.
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace arena::netutil {

inline constexpr uint32_t kMaxFrameBytes = 1u << 20;

inline void append_frame(std::string &out, std::string_view payload)
{
    uint32_t net = htonl(static_cast<uint32_t>(payload.size()));
    size_t offset = out.size();
    out.resize(offset + 4 + payload.size());
    std::memcpy(out.data() + offset, &net, 4);
    std::memcpy(out.data() + offset + 4, payload.data(), payload.size());
}

inline std::string build_frame(std::string_view payload)
{
    std::string frame;
    frame.reserve(4 + payload.size());
    append_frame(frame, payload);
    return frame;
}

struct FrameParseState
{
    std::vector<char> buffer; // bytes received but not yet consumed
    bool corrupt{false}; // set once a length prefix is zero or above kMaxFrameBytes
};

// Extracts one complete payload into out. Returns false when more bytes are needed
// or the stream is corrupt; callers check st.corrupt to tell the two apart.
inline bool try_extract(FrameParseState &st, std::string &out)
{
    if (st.corrupt || st.buffer.size() < 4)
        return false;
    uint32_t net;
    std::memcpy(&net, st.buffer.data(), 4);
    uint32_t len = ntohl(net);
    if (len == 0 || len > kMaxFrameBytes) {
        st.corrupt = true;
        return false;
    }
    if (st.buffer.size() < 4 + static_cast<size_t>(len))
        return false;
    out.assign(st.buffer.data() + 4, len);
    st.buffer.erase(st.buffer.begin(), st.buffer.begin() + 4 + len);
    return true;
}

} // namespace arena::netutil
