// Fuzz target for the length-prefixed frame decoder
// Tests FrameDecoder (feed/next), IsWellFormedUtf8 and EncodeFrame
//
// The decoder consumes untrusted bytes straight off the socket. Bugs here can:
// - Hand invalid UTF-8 to the controller as a message
// - Lose or duplicate frames when a header is split across reads
// - Grow the receive buffer without bound
//
// Target code:
// - src/network/frame.cpp

#include "network/frame.hpp"
#include "network/protocol.hpp"
#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

using namespace peerlink;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 1) return 0;

    // First byte picks the chunk size used to split the stream
    size_t chunk = static_cast<size_t>(data[0]) + 1;
    const uint8_t* stream = data + 1;
    size_t stream_len = size - 1;

    // TEST 1: decoding in chunks must equal decoding in one go
    frame::FrameDecoder whole;
    whole.feed(stream, stream_len);
    std::vector<std::string> expected;
    while (auto payload = whole.next()) {
        expected.push_back(*payload);
    }

    frame::FrameDecoder split;
    std::vector<std::string> actual;
    for (size_t off = 0; off < stream_len; off += chunk) {
        size_t n = std::min(chunk, stream_len - off);
        split.feed(stream + off, n);
        while (auto payload = split.next()) {
            actual.push_back(*payload);
        }
        if (split.failed()) break;
    }

    if (whole.failed() != split.failed()) {
        __builtin_trap();
    }
    if (expected != actual) {
        __builtin_trap();
    }

    // TEST 2: every delivered payload is valid and re-encodes to its own frame
    for (const auto& payload : expected) {
        if (payload.size() > protocol::MAX_PAYLOAD_SIZE) {
            __builtin_trap();
        }
        if (!frame::IsWellFormedUtf8(payload)) {
            __builtin_trap();
        }

        auto encoded = frame::EncodeFrame(payload);
        if (encoded.size() != payload.size() + protocol::FRAME_HEADER_SIZE) {
            __builtin_trap();
        }

        frame::FrameDecoder again;
        again.feed(encoded);
        auto decoded = again.next();
        if (!decoded || *decoded != payload || again.buffered() != 0) {
            __builtin_trap();
        }
    }

    // TEST 3: a failed decoder yields nothing further
    if (whole.failed()) {
        whole.feed(stream, stream_len);
        if (whole.next().has_value()) {
            __builtin_trap();
        }
    }

    // TEST 4: EncodeFrame accepts exactly the well-formed inputs
    std::string raw(reinterpret_cast<const char*>(stream), stream_len);
    bool valid = frame::IsWellFormedUtf8(raw);
    try {
        frame::EncodeFrame(raw);
        if (!valid) {
            __builtin_trap();
        }
    } catch (const std::invalid_argument&) {
        if (valid && raw.size() <= protocol::MAX_PAYLOAD_SIZE) {
            __builtin_trap();
        }
    }

    return 0;
}
