// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for protocol constants and PeerAddress

#include <catch2/catch_test_macros.hpp>

#include "network/protocol.hpp"

#include <map>
#include <set>
#include <string>
#include <unordered_set>

using namespace peerlink::protocol;

TEST_CASE("Protocol constants", "[network][protocol]") {
    STATIC_REQUIRE(FRAME_HEADER_SIZE == 2);
    STATIC_REQUIRE(MAX_PAYLOAD_SIZE == 65535);
    STATIC_REQUIRE(MAX_FRAME_SIZE == 65537);
    CHECK(std::string(tags::CONFIRM) == "[CONFIRM]");
    CHECK(std::string(tags::CLOSE) == "CLOSE");
}

TEST_CASE("PeerAddress formatting", "[network][protocol]") {
    CHECK(PeerAddress("192.168.1.7", 9590).to_string() == "192.168.1.7:9590");
    CHECK(PeerAddress("2001:db8::1", 80).to_string() == "[2001:db8::1]:80");
    CHECK(PeerAddress().empty());
    CHECK_FALSE(PeerAddress("127.0.0.1", 0).empty());
}

TEST_CASE("PeerAddress works as a map key", "[network][protocol]") {
    PeerAddress a("10.0.0.1", 1000);
    PeerAddress b("10.0.0.1", 1001);
    PeerAddress c("10.0.0.2", 1000);

    SECTION("Equality covers host and port") {
        CHECK(a == PeerAddress("10.0.0.1", 1000));
        CHECK(a != b);
        CHECK(a != c);
    }

    SECTION("Ordering is total") {
        std::set<PeerAddress> s{c, b, a};
        REQUIRE(s.size() == 3);
        CHECK(*s.begin() == a);
    }

    SECTION("Hash distinguishes ports of the same host") {
        std::unordered_set<PeerAddress, PeerAddressHash> s{a, b, c, a};
        REQUIRE(s.size() == 3);
        CHECK(s.count(b) == 1);
    }
}
