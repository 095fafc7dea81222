// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for ConnectionRegistry

#include <catch2/catch_test_macros.hpp>

#include "infra/fake_connection.hpp"
#include "network/connection_registry.hpp"

#include <memory>
#include <thread>
#include <vector>

using namespace peerlink;
using namespace peerlink::network;
using peerlink::protocol::PeerAddress;
using peerlink::test::FakeConnection;

namespace {
std::shared_ptr<FakeConnection> MakeConn(const PeerAddress& addr, bool open = true) {
    return std::make_shared<FakeConnection>(addr, true, open);
}
}  // namespace

TEST_CASE("ConnectionRegistry basic operations", "[network][registry]") {
    ConnectionRegistry registry;
    PeerAddress a("10.0.0.1", 1000);
    PeerAddress b("10.0.0.2", 1000);

    REQUIRE(registry.empty());
    REQUIRE_FALSE(registry.any_open());
    REQUIRE(registry.get(a) == nullptr);

    auto ca = MakeConn(a);
    REQUIRE(registry.insert(a, ca) == nullptr);
    REQUIRE(registry.contains(a));
    REQUIRE(registry.get(a) == ca);
    REQUIRE(registry.size() == 1);

    SECTION("remove returns the entry once") {
        REQUIRE(registry.remove(a) == ca);
        REQUIRE(registry.remove(a) == nullptr);
        REQUIRE(registry.empty());
    }

    SECTION("remove_if_same only removes the matching connection") {
        auto other = MakeConn(a);
        REQUIRE_FALSE(registry.remove_if_same(a, other));
        REQUIRE(registry.contains(a));
        REQUIRE(registry.remove_if_same(a, ca));
        REQUIRE_FALSE(registry.contains(a));
        REQUIRE_FALSE(registry.remove_if_same(b, ca));
    }

    SECTION("insert under an existing key replaces and returns the old connection") {
        auto cb = MakeConn(b);
        registry.insert(b, cb);
        auto replacement = MakeConn(a);
        REQUIRE(registry.insert(a, replacement) == ca);
        REQUIRE(registry.get(a) == replacement);
        REQUIRE(registry.size() == 2);
        // Position is kept
        REQUIRE(registry.addresses() == std::vector<PeerAddress>{a, b});
    }
}

TEST_CASE("ConnectionRegistry keeps insertion order", "[network][registry]") {
    ConnectionRegistry registry;
    std::vector<PeerAddress> order{{"10.0.0.9", 1}, {"10.0.0.1", 2}, {"10.0.0.5", 3}, {"::1", 4}};
    for (const auto& addr : order) registry.insert(addr, MakeConn(addr));

    REQUIRE(registry.addresses() == order);

    registry.remove(order[1]);
    auto snap = registry.snapshot();
    REQUIRE(snap.size() == 3);
    CHECK(snap[0].first == order[0]);
    CHECK(snap[1].first == order[2]);
    CHECK(snap[2].first == order[3]);
}

TEST_CASE("ConnectionRegistry snapshot is independent of later mutation", "[network][registry]") {
    ConnectionRegistry registry;
    PeerAddress a("10.0.0.1", 1);
    registry.insert(a, MakeConn(a));

    auto snap = registry.snapshot();
    registry.remove(a);
    REQUIRE(snap.size() == 1);
    REQUIRE(snap[0].second != nullptr);
    REQUIRE(registry.empty());
}

TEST_CASE("ConnectionRegistry any_open looks at connection state", "[network][registry]") {
    ConnectionRegistry registry;
    PeerAddress a("10.0.0.1", 1);
    PeerAddress b("10.0.0.2", 1);
    auto ca = MakeConn(a);
    auto cb = MakeConn(b, false);

    registry.insert(b, cb);
    REQUIRE_FALSE(registry.any_open());

    registry.insert(a, ca);
    REQUIRE(registry.any_open());

    ca->close();
    REQUIRE_FALSE(registry.any_open());
    REQUIRE(registry.size() == 2);
}

TEST_CASE("ConnectionRegistry concurrent insert and remove", "[network][registry][threading]") {
    ConnectionRegistry registry;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 200;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&registry, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                PeerAddress addr("10.0." + std::to_string(t) + ".1", static_cast<uint16_t>(i));
                auto conn = MakeConn(addr);
                registry.insert(addr, conn);
                (void)registry.snapshot();
                if (i % 2 == 0) registry.remove_if_same(addr, conn);
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(registry.size() == kThreads * kPerThread / 2);
}
