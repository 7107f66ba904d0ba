// SPDX-License-Identifier: Apache-2.0
// Unit test: length-prefixed framing across split reads and corrupt prefixes.
#include "common/framing.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace arena::netutil;

static void test_split_frames()
{
    std::string p1 = "hello";
    std::string p2 = std::string(100, 'x');
    std::string all = build_frame(p1) + build_frame(p2);
    // Feed the stream one byte at a time.
    FrameParseState st;
    std::string out;
    int got = 0;
    for (char c : all) {
        st.buffer.push_back(c);
        while (try_extract(st, out)) {
            assert(out == (got == 0 ? p1 : p2));
            ++got;
        }
    }
    assert(got == 2);
    assert(st.buffer.empty());
    assert(!st.corrupt);
}

static void test_append_batches()
{
    std::string batch;
    append_frame(batch, "a");
    append_frame(batch, "bc");
    assert(batch.size() == 4 + 1 + 4 + 2);
    FrameParseState st;
    st.buffer.assign(batch.begin(), batch.end());
    std::string out;
    bool first = try_extract(st, out);
    assert(first && out == "a");
    bool second = try_extract(st, out);
    assert(second && out == "bc");
    bool third = try_extract(st, out);
    assert(!third);
}

static void test_corrupt_prefix()
{
    FrameParseState zero;
    zero.buffer = {0, 0, 0, 0, 'x'};
    std::string out;
    bool got = try_extract(zero, out);
    assert(!got && zero.corrupt);

    FrameParseState huge;
    std::string frame = build_frame("payload");
    huge.buffer.assign(frame.begin(), frame.end());
    huge.buffer[0] = 0x7f; // length far above the limit
    got = try_extract(huge, out);
    assert(!got && huge.corrupt);
    // Stays corrupt.
    got = try_extract(huge, out);
    assert(!got);

    FrameParseState partial;
    partial.buffer = {0, 0};
    got = try_extract(partial, out);
    assert(!got && !partial.corrupt);
}

int main()
{
    test_split_frames();
    test_append_batches();
    test_corrupt_prefix();
    std::cout << "unit_framing OK" << std::endl;
    return 0;
}
