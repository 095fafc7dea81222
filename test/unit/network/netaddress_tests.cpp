// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for util/netaddress

#include <catch2/catch_test_macros.hpp>

#include "util/netaddress.hpp"

using namespace peerlink::util;

TEST_CASE("ValidateAndNormalizeIP", "[network][netaddress]") {
    SECTION("IPv4 passes through") {
        CHECK(ValidateAndNormalizeIP("192.168.1.1") == "192.168.1.1");
        CHECK(ValidateAndNormalizeIP("0.0.0.0") == "0.0.0.0");
    }

    SECTION("IPv4-mapped IPv6 becomes IPv4") {
        CHECK(ValidateAndNormalizeIP("::ffff:192.168.1.1") == "192.168.1.1");
        CHECK(ValidateAndNormalizeIP("::ffff:127.0.0.1") == "127.0.0.1");
    }

    SECTION("IPv6 is canonicalized") {
        CHECK(ValidateAndNormalizeIP("2001:db8::1") == "2001:db8::1");
        CHECK(ValidateAndNormalizeIP("2001:0db8:0000:0000:0000:0000:0000:0001") == "2001:db8::1");
    }

    SECTION("Garbage and hostnames are rejected") {
        CHECK_FALSE(ValidateAndNormalizeIP("").has_value());
        CHECK_FALSE(ValidateAndNormalizeIP("invalid").has_value());
        CHECK_FALSE(ValidateAndNormalizeIP("localhost").has_value());
        CHECK_FALSE(ValidateAndNormalizeIP("256.1.1.1").has_value());
        CHECK_FALSE(IsValidIPAddress("1.2.3"));
        CHECK(IsValidIPAddress("::1"));
    }
}

TEST_CASE("ParsePort", "[network][netaddress]") {
    CHECK(ParsePort("0") == uint16_t{0});
    CHECK(ParsePort("9590") == uint16_t{9590});
    CHECK(ParsePort("65535") == uint16_t{65535});
    CHECK_FALSE(ParsePort("65536").has_value());
    CHECK_FALSE(ParsePort("-1").has_value());
    CHECK_FALSE(ParsePort("+80").has_value());
    CHECK_FALSE(ParsePort(" 80").has_value());
    CHECK_FALSE(ParsePort("80a").has_value());
    CHECK_FALSE(ParsePort("").has_value());
    CHECK_FALSE(ParsePort("123456").has_value());
}

TEST_CASE("ParseHostPort", "[network][netaddress]") {
    std::string host;
    uint16_t port = 0;

    SECTION("IPv4") {
        REQUIRE(ParseHostPort("192.168.1.1:9590", host, port));
        CHECK(host == "192.168.1.1");
        CHECK(port == 9590);
    }

    SECTION("Bracketed IPv6") {
        REQUIRE(ParseHostPort("[2001:db8::1]:8333", host, port));
        CHECK(host == "2001:db8::1");
        CHECK(port == 8333);
    }

    SECTION("Bracketed IPv4-mapped normalizes to IPv4") {
        REQUIRE(ParseHostPort("[::ffff:10.0.0.1]:1", host, port));
        CHECK(host == "10.0.0.1");
    }

    SECTION("Hostname kept verbatim") {
        REQUIRE(ParseHostPort("localhost:7000", host, port));
        CHECK(host == "localhost");
        CHECK(port == 7000);
    }

    SECTION("Rejected forms") {
        CHECK_FALSE(ParseHostPort("", host, port));
        CHECK_FALSE(ParseHostPort("192.168.1.1", host, port));
        CHECK_FALSE(ParseHostPort(":80", host, port));
        CHECK_FALSE(ParseHostPort("2001:db8::1:80", host, port));
        CHECK_FALSE(ParseHostPort("[1.2.3.4]:80", host, port));
        CHECK_FALSE(ParseHostPort("[]:80", host, port));
        CHECK_FALSE(ParseHostPort("[::1]80", host, port));
        CHECK_FALSE(ParseHostPort("host:99999", host, port));
        CHECK_FALSE(ParseHostPort("host:", host, port));
    }
}

TEST_CASE("FormatHostPort brackets IPv6", "[network][netaddress]") {
    CHECK(FormatHostPort("1.2.3.4", 5) == "1.2.3.4:5");
    CHECK(FormatHostPort("::1", 5) == "[::1]:5");
    CHECK(FormatHostPort("example.org", 443) == "example.org:443");
}

TEST_CASE("IsSelfAddress", "[network][netaddress]") {
    CHECK(IsSelfAddress("127.0.0.1"));
    CHECK(IsSelfAddress("127.8.9.10"));
    CHECK(IsSelfAddress("::1"));
    CHECK(IsSelfAddress("0.0.0.0"));
    CHECK(IsSelfAddress("::"));
    CHECK(IsSelfAddress("::ffff:127.0.0.1"));
    CHECK_FALSE(IsSelfAddress("192.168.1.1"));
    CHECK_FALSE(IsSelfAddress("2001:db8::1"));
    CHECK_FALSE(IsSelfAddress("localhost"));
    CHECK_FALSE(IsSelfAddress(""));
}
