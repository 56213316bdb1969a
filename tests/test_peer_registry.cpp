#include <doctest/doctest.h>
#include "agentmsg/peer_registry.hpp"

#include <thread>
#include <vector>

using namespace agentmsg;

TEST_CASE("PeerRegistry never records its own identity") {
    PeerRegistry reg("self");
    reg.observe("self", 100.0);
    CHECK(reg.size() == 0);
    CHECK(reg.active_peers(100.0, 15.0).empty());
    CHECK(reg.self_id() == "self");
}

TEST_CASE("observe upserts; latest write wins") {
    PeerRegistry reg("self");
    reg.observe("a", 100.0);
    reg.observe("a", 105.0);
    reg.observe("b", 101.0);

    PeerMap peers = reg.active_peers(106.0, 15.0);
    REQUIRE(peers.size() == 2);
    CHECK(peers["a"] == 105.0);
    CHECK(peers["b"] == 101.0);

    reg.observe("a", 103.0);   // out-of-order datagram
    CHECK(reg.active_peers(106.0, 15.0)["a"] == 103.0);
}

TEST_CASE("active_peers filters by timeout without mutating") {
    PeerRegistry reg("self");
    reg.observe("fresh", 100.0);
    reg.observe("stale", 80.0);

    PeerMap peers = reg.active_peers(100.0, 15.0);
    CHECK(peers.count("fresh") == 1);
    CHECK(peers.count("stale") == 0);
    CHECK(reg.count(100.0, 15.0) == 1);
    CHECK(reg.size() == 2);   // stale entry still held

    // boundary: exactly timeout old is no longer active
    CHECK(reg.count(115.0, 15.0) == 0);
    CHECK(reg.count(114.5, 15.0) == 1);
}

TEST_CASE("evict_older_than removes only entries past the horizon") {
    PeerRegistry reg("self");
    reg.observe("a", 100.0);
    reg.observe("b", 70.0);
    reg.observe("c", 60.0);

    CHECK(reg.evict_older_than(100.0, 30.0) == 2);   // b is exactly 30 old
    CHECK(reg.size() == 1);
    CHECK(reg.active_peers(100.0, 15.0).count("a") == 1);
    CHECK(reg.evict_older_than(100.0, 30.0) == 0);
}

TEST_CASE("concurrent observers do not lose entries") {
    PeerRegistry reg("self");
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&reg, t] {
            for (int i = 0; i < 100; ++i) {
                reg.observe("peer-" + std::to_string(t) + "-" + std::to_string(i), 1000.0);
            }
        });
    }
    for (auto& th : threads) th.join();
    CHECK(reg.size() == 800);
    CHECK(reg.count(1001.0, 15.0) == 800);
}
