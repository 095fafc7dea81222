// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for the length-prefixed frame codec

#include <catch2/catch_test_macros.hpp>

#include "network/frame.hpp"
#include "network/protocol.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using namespace peerlink;
using namespace peerlink::frame;

namespace {

std::vector<uint8_t> Bytes(std::initializer_list<int> values) {
    std::vector<uint8_t> out;
    for (int v : values) out.push_back(static_cast<uint8_t>(v));
    return out;
}

std::vector<uint8_t> Concat(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    std::vector<uint8_t> out(a);
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

}  // namespace

TEST_CASE("EncodeFrame writes a big-endian length prefix", "[network][frame]") {
    SECTION("Short ASCII payload") {
        auto f = EncodeFrame("hello");
        REQUIRE(f == Bytes({0x00, 0x05, 'h', 'e', 'l', 'l', 'o'}));
    }

    SECTION("Empty payload is a bare header") {
        REQUIRE(EncodeFrame("") == Bytes({0x00, 0x00}));
    }

    SECTION("Length counts bytes, not characters") {
        // U+00E9 is two bytes in UTF-8
        auto f = EncodeFrame("caf\xC3\xA9");
        REQUIRE(f.size() == 2 + 5);
        CHECK(f[0] == 0x00);
        CHECK(f[1] == 0x05);
    }

    SECTION("Length above 255 uses the high byte") {
        auto f = EncodeFrame(std::string(300, 'x'));
        CHECK(f[0] == 0x01);
        CHECK(f[1] == 0x2C);
        CHECK(f.size() == 302);
    }
}

TEST_CASE("EncodeFrame enforces the 65535-byte payload limit", "[network][frame]") {
    SECTION("Exactly 65535 bytes is accepted") {
        auto f = EncodeFrame(std::string(protocol::MAX_PAYLOAD_SIZE, 'a'));
        REQUIRE(f.size() == protocol::MAX_FRAME_SIZE);
        CHECK(f[0] == 0xFF);
        CHECK(f[1] == 0xFF);
    }

    SECTION("65536 bytes is rejected, not truncated") {
        REQUIRE_THROWS_AS(EncodeFrame(std::string(protocol::MAX_PAYLOAD_SIZE + 1, 'a')), std::invalid_argument);
    }

    SECTION("Much larger payloads are rejected") {
        REQUIRE_THROWS_AS(EncodeFrame(std::string(1 << 20, 'a')), std::invalid_argument);
    }
}

TEST_CASE("EncodeFrame rejects malformed UTF-8", "[network][frame][utf8]") {
    CHECK_THROWS_AS(EncodeFrame("\xC3\x28"), std::invalid_argument);      // bad continuation
    CHECK_THROWS_AS(EncodeFrame("\x80"), std::invalid_argument);          // stray continuation
    CHECK_THROWS_AS(EncodeFrame("\xC0\x80"), std::invalid_argument);      // overlong NUL
    CHECK_THROWS_AS(EncodeFrame("\xED\xA0\x80"), std::invalid_argument);  // surrogate
    CHECK_THROWS_AS(EncodeFrame("\xF4\x90\x80\x80"), std::invalid_argument);  // above U+10FFFF
    CHECK_THROWS_AS(EncodeFrame("abc\xE2\x82"), std::invalid_argument);   // truncated

    CHECK_NOTHROW(EncodeFrame("\xE2\x82\xAC"));      // euro sign
    CHECK_NOTHROW(EncodeFrame("\xF0\x9F\x98\x80"));  // emoji
    CHECK_NOTHROW(EncodeFrame(std::string("a\0b", 3)));
}

TEST_CASE("IsWellFormedUtf8 boundaries", "[network][frame][utf8]") {
    CHECK(IsWellFormedUtf8(""));
    CHECK(IsWellFormedUtf8("\x7F"));
    CHECK(IsWellFormedUtf8("\xC2\x80"));          // U+0080
    CHECK(IsWellFormedUtf8("\xEF\xBF\xBF"));      // U+FFFF
    CHECK(IsWellFormedUtf8("\xF4\x8F\xBF\xBF"));  // U+10FFFF
    CHECK_FALSE(IsWellFormedUtf8("\xE0\x9F\xBF"));  // overlong 3-byte
    CHECK_FALSE(IsWellFormedUtf8("\xF8\x88\x80\x80\x80"));
    CHECK_FALSE(IsWellFormedUtf8("\xFF"));
}

TEST_CASE("FrameDecoder reassembles frames from arbitrary chunks", "[network][frame][decoder]") {
    FrameDecoder decoder;

    SECTION("One frame per feed") {
        decoder.feed(EncodeFrame("hello"));
        auto msg = decoder.next();
        REQUIRE(msg.has_value());
        REQUIRE(*msg == "hello");
        REQUIRE_FALSE(decoder.next().has_value());
        REQUIRE(decoder.buffered() == 0);
    }

    SECTION("Several frames in one feed come out in order") {
        auto stream = Concat(Concat(EncodeFrame("one"), EncodeFrame("")), EncodeFrame("three"));
        decoder.feed(stream);
        REQUIRE(decoder.next() == std::optional<std::string>("one"));
        REQUIRE(decoder.next() == std::optional<std::string>(""));
        REQUIRE(decoder.next() == std::optional<std::string>("three"));
        REQUIRE_FALSE(decoder.next().has_value());
    }

    SECTION("Byte-at-a-time delivery") {
        auto stream = Concat(EncodeFrame("split"), EncodeFrame("across reads"));
        std::vector<std::string> out;
        for (uint8_t b : stream) {
            decoder.feed(&b, 1);
            while (auto msg = decoder.next()) out.push_back(*msg);
        }
        REQUIRE(out == std::vector<std::string>{"split", "across reads"});
    }

    SECTION("Partial header waits for more bytes") {
        decoder.feed(Bytes({0x00}));
        REQUIRE_FALSE(decoder.next().has_value());
        decoder.feed(Bytes({0x02, 'o'}));
        REQUIRE_FALSE(decoder.next().has_value());
        REQUIRE(decoder.buffered() == 3);
        decoder.feed(Bytes({'k'}));
        REQUIRE(decoder.next() == std::optional<std::string>("ok"));
    }

    SECTION("Maximum payload survives the decoder") {
        std::string big(protocol::MAX_PAYLOAD_SIZE, 'z');
        auto f = EncodeFrame(big);
        // Deliver in receive-buffer sized pieces
        for (size_t off = 0; off < f.size(); off += protocol::RECV_BUFFER_SIZE) {
            size_t n = std::min(protocol::RECV_BUFFER_SIZE, f.size() - off);
            decoder.feed(f.data() + off, n);
        }
        auto msg = decoder.next();
        REQUIRE(msg.has_value());
        REQUIRE(msg->size() == protocol::MAX_PAYLOAD_SIZE);
        REQUIRE(*msg == big);
    }

    SECTION("Reserved payloads decode like any other") {
        decoder.feed(Concat(EncodeFrame(protocol::tags::CONFIRM), EncodeFrame(protocol::tags::CLOSE)));
        REQUIRE(decoder.next() == std::optional<std::string>("[CONFIRM]"));
        REQUIRE(decoder.next() == std::optional<std::string>("CLOSE"));
    }
}

TEST_CASE("FrameDecoder fails permanently on malformed UTF-8", "[network][frame][decoder]") {
    FrameDecoder decoder;
    auto bad = Bytes({0x00, 0x02, 0xC3, 0x28});
    decoder.feed(Concat(EncodeFrame("before"), Concat(bad, EncodeFrame("after"))));

    REQUIRE(decoder.next() == std::optional<std::string>("before"));
    REQUIRE_FALSE(decoder.next().has_value());
    REQUIRE(decoder.failed());
    REQUIRE_FALSE(decoder.error().empty());

    // Valid frames after the bad one are never delivered
    decoder.feed(EncodeFrame("later"));
    REQUIRE_FALSE(decoder.next().has_value());
}
