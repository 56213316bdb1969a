#include <doctest/doctest.h>
#include "agentmsg/errors.hpp"
#include "agentmsg/messenger.hpp"
#include "test_support.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace agentmsg;
using agentmsg::testing::LoopbackBus;
using agentmsg::testing::LoopbackTransport;
using agentmsg::testing::TempDir;
using agentmsg::testing::wait_until;

namespace {

MessengerConfig fast_cfg(const std::string& id = {}) {
    MessengerConfig cfg;
    if (!id.empty()) cfg.identity = id;
    cfg.heartbeat_interval = std::chrono::milliseconds(50);
    cfg.peer_timeout       = std::chrono::milliseconds(500);
    cfg.receive_timeout    = std::chrono::milliseconds(20);
    cfg.join_timeout       = std::chrono::milliseconds(1000);
    cfg.shared.poll_interval    = std::chrono::milliseconds(20);
    cfg.shared.cleanup_interval = std::chrono::milliseconds(200);
    return cfg;
}

struct Inbox {
    std::mutex mu;
    std::vector<std::pair<std::string, std::string>> items;

    MessageHandler handler() {
        return [this](const std::string& uuid, const std::string& text) {
            std::lock_guard<std::mutex> lock(mu);
            items.emplace_back(uuid, text);
        };
    }
    std::size_t size() {
        std::lock_guard<std::mutex> lock(mu);
        return items.size();
    }
    std::vector<std::pair<std::string, std::string>> snapshot() {
        std::lock_guard<std::mutex> lock(mu);
        return items;
    }
};

} // namespace

TEST_CASE("identity comes from config or is generated") {
    auto bus = std::make_shared<LoopbackBus>();
    Messenger named(fast_cfg("agent-a"), std::make_shared<LoopbackTransport>(bus));
    CHECK(named.uuid() == "agent-a");

    Messenger generated(fast_cfg(), std::make_shared<LoopbackTransport>(bus));
    CHECK(generated.uuid().size() == 36);
    CHECK(generated.uuid() != named.uuid());
}

TEST_CASE("config picks the transport") {
    Messenger udp(fast_cfg("u"));
    CHECK(std::string(udp.transport_name()) == "udp-multicast");

    TempDir dir;
    MessengerConfig cfg = fast_cfg("f");
    cfg.shared_dir = dir.str();
    Messenger file(cfg);
    CHECK(std::string(file.transport_name()) == "shared-dir");
}

TEST_CASE("a null transport is rejected") {
    CHECK_THROWS_AS(Messenger(fast_cfg("x"), nullptr), SetupFailure);
}

TEST_CASE("send() before start() throws NotStarted and does no I/O") {
    auto bus = std::make_shared<LoopbackBus>();
    auto tr  = std::make_shared<LoopbackTransport>(bus);
    Messenger m(fast_cfg("a"), tr);

    CHECK(m.state() == MessengerState::Stopped);
    CHECK_THROWS_AS(m.send("hello"), NotStarted);
    try {
        m.send("hello");
    } catch (const NotStarted& e) {
        CHECK(std::string(e.what()).find("not started") != std::string::npos);
    }
    CHECK(tr->begin_calls.load() == 0);
    CHECK(tr->text_sends.load() == 0);
    CHECK(tr->heartbeat_sends.load() == 0);
}

TEST_CASE("start/stop walk the lifecycle and are idempotent") {
    auto bus = std::make_shared<LoopbackBus>();
    auto tr  = std::make_shared<LoopbackTransport>(bus);
    Messenger m(fast_cfg("a"), tr);

    m.start();
    CHECK(m.running());
    CHECK(m.state() == MessengerState::Running);
    CHECK(tr->begin_calls.load() == 1);
    CHECK(tr->heartbeat_sends.load() >= 1);   // immediate announce

    m.start();
    CHECK(tr->begin_calls.load() == 1);

    m.stop();
    CHECK(m.state() == MessengerState::Stopped);
    CHECK_FALSE(m.running());
    CHECK(tr->end_calls.load() == 1);

    m.stop();
    CHECK(tr->end_calls.load() == 1);
    CHECK_THROWS_AS(m.send("late"), NotStarted);
}

TEST_CASE("stop() is prompt even with a long heartbeat interval") {
    auto bus = std::make_shared<LoopbackBus>();
    MessengerConfig cfg = fast_cfg("a");
    cfg.heartbeat_interval = std::chrono::seconds(30);
    Messenger m(cfg, std::make_shared<LoopbackTransport>(bus));
    m.start();

    const auto t0 = std::chrono::steady_clock::now();
    m.stop();
    CHECK(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(1));
}

TEST_CASE("setup failure propagates and leaves the messenger stopped") {
    auto bus = std::make_shared<LoopbackBus>();
    auto tr  = std::make_shared<LoopbackTransport>(bus);
    tr->fail_begin = true;
    Messenger m(fast_cfg("a"), tr);

    CHECK_THROWS_AS(m.start(), SetupFailure);
    CHECK(m.state() == MessengerState::Stopped);

    tr->fail_begin = false;
    m.start();
    CHECK(m.running());
    m.stop();
}

TEST_CASE("a worker left behind by stop() keeps the transport and blocks restart until done") {
    std::atomic<int> in_handler{0};
    std::atomic<int> max_in_handler{0};
    std::atomic<int> calls{0};
    auto bus = std::make_shared<LoopbackBus>();
    auto tr  = std::make_shared<LoopbackTransport>(bus);
    MessengerConfig cfg = fast_cfg("a");
    cfg.join_timeout = std::chrono::milliseconds(100);
    Messenger m(cfg, tr);
    m.on_message([&](const std::string&, const std::string&) {
        const int now = ++in_handler;
        int prev = max_in_handler.load();
        while (now > prev && !max_in_handler.compare_exchange_weak(prev, now)) {}
        if (calls++ == 0) std::this_thread::sleep_for(std::chrono::milliseconds(800));
        --in_handler;
    });

    m.start();
    tr->inject(codec::encode_string(make_text("peer", "slow")));
    REQUIRE(wait_until([&] { return in_handler.load() == 1; }));

    m.stop();
    CHECK(m.state() == MessengerState::Stopped);
    CHECK(tr->end_calls.load() == 0);   // still in use by the busy receive worker

    CHECK_THROWS_AS(m.start(), SetupFailure);
    CHECK(m.state() == MessengerState::Stopped);
    CHECK(tr->begin_calls.load() == 1);

    REQUIRE(wait_until([&] { return tr->end_calls.load() == 1; }));

    m.start();
    CHECK(m.running());
    for (int i = 0; i < 6; ++i) tr->inject(codec::encode_string(make_text("peer", "n" + std::to_string(i))));
    REQUIRE(wait_until([&] { return calls.load() == 7; }));
    CHECK(max_in_handler.load() == 1);

    m.stop();
    CHECK(tr->end_calls.load() == 2);
}

TEST_CASE("a refused send surfaces as SendFailure") {
    auto bus = std::make_shared<LoopbackBus>();
    auto tr  = std::make_shared<LoopbackTransport>(bus);
    Messenger m(fast_cfg("a"), tr);
    m.start();
    tr->fail_send = true;
    CHECK_THROWS_AS(m.send("nope"), SendFailure);
    m.stop();
}

TEST_CASE("text reaches other participants but never the sender") {
    Inbox at_a, at_b;
    auto bus = std::make_shared<LoopbackBus>();
    Messenger a(fast_cfg("a"), std::make_shared<LoopbackTransport>(bus));
    Messenger b(fast_cfg("b"), std::make_shared<LoopbackTransport>(bus));
    a.on_message(at_a.handler());
    b.on_message(at_b.handler());

    a.start();
    b.start();
    a.send("hello from a");

    REQUIRE(wait_until([&] { return at_b.size() == 1; }));
    auto got = at_b.snapshot();
    CHECK(got[0].first == "a");
    CHECK(got[0].second == "hello from a");

    // a's own datagram looped back to it; give it time to be dropped
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    CHECK(at_a.size() == 0);

    b.stop();
    a.stop();
}

TEST_CASE("handlers run in registration order and a throwing handler is isolated") {
    std::mutex mu;
    std::vector<std::string> calls;
    auto bus = std::make_shared<LoopbackBus>();
    Messenger a(fast_cfg("a"), std::make_shared<LoopbackTransport>(bus));
    Messenger b(fast_cfg("b"), std::make_shared<LoopbackTransport>(bus));

    b.on_message([&](const std::string&, const std::string& text) {
        std::lock_guard<std::mutex> lock(mu);
        calls.push_back("first:" + text);
    });
    b.add_handler([](const std::string&, const std::string&) {
        throw std::runtime_error("handler failure");
    });
    b.add_handler([&](const std::string&, const std::string& text) {
        std::lock_guard<std::mutex> lock(mu);
        calls.push_back("third:" + text);
    });

    a.start();
    b.start();
    a.send("one");
    a.send("two");

    REQUIRE(wait_until([&] {
        std::lock_guard<std::mutex> lock(mu);
        return calls.size() == 4;
    }));
    {
        std::lock_guard<std::mutex> lock(mu);
        CHECK(calls[0] == "first:one");
        CHECK(calls[1] == "third:one");
        CHECK(calls[2] == "first:two");
        CHECK(calls[3] == "third:two");
    }

    b.stop();
    a.stop();
}

TEST_CASE("malformed traffic is dropped and the receive loop keeps going") {
    Inbox inbox;
    auto bus = std::make_shared<LoopbackBus>();
    auto tr  = std::make_shared<LoopbackTransport>(bus);
    Messenger m(fast_cfg("a"), tr);
    m.on_message(inbox.handler());
    m.start();

    tr->inject("{ definitely not json");
    tr->inject(R"({"uuid":"x","type":"mystery","payload":"","timestamp":1.0})");
    tr->inject(codec::encode_string(make_text("peer", "still here")));

    REQUIRE(wait_until([&] { return inbox.size() == 1; }));
    CHECK(inbox.snapshot()[0].second == "still here");
    CHECK(m.running());
    m.stop();
}

TEST_CASE("heartbeats update liveness without reaching handlers") {
    Inbox inbox;
    auto bus = std::make_shared<LoopbackBus>();
    auto tr  = std::make_shared<LoopbackTransport>(bus);
    Messenger m(fast_cfg("a"), tr);
    m.on_message(inbox.handler());
    m.start();

    tr->inject(codec::encode_string(make_heartbeat("quiet-peer")));
    REQUIRE(wait_until([&] { return m.get_peers().count("quiet-peer") == 1; }));
    CHECK(inbox.size() == 0);
    m.stop();
}

TEST_CASE("two participants discover each other") {
    auto bus = std::make_shared<LoopbackBus>();
    Messenger a(fast_cfg("a"), std::make_shared<LoopbackTransport>(bus));
    Messenger b(fast_cfg("b"), std::make_shared<LoopbackTransport>(bus));
    a.start();
    b.start();

    REQUIRE(wait_until([&] { return a.get_active_peer_count() == 1 && b.get_active_peer_count() == 1; }));
    CHECK(a.get_peers().count("b") == 1);
    CHECK(b.get_peers().count("a") == 1);
    CHECK(a.get_peers().count("a") == 0);

    b.stop();
    a.stop();
}

TEST_CASE("three participants each see the other two") {
    auto bus = std::make_shared<LoopbackBus>();
    Messenger a(fast_cfg("a"), std::make_shared<LoopbackTransport>(bus));
    Messenger b(fast_cfg("b"), std::make_shared<LoopbackTransport>(bus));
    Messenger c(fast_cfg("c"), std::make_shared<LoopbackTransport>(bus));
    a.start();
    b.start();
    c.start();

    REQUIRE(wait_until([&] {
        return a.get_active_peer_count() == 2 && b.get_active_peer_count() == 2 &&
               c.get_active_peer_count() == 2;
    }));

    c.stop();
    b.stop();
    a.stop();
}

TEST_CASE("a silent peer ages out after the liveness timeout") {
    auto bus = std::make_shared<LoopbackBus>();
    Messenger a(fast_cfg("a"), std::make_shared<LoopbackTransport>(bus));
    Messenger b(fast_cfg("b"), std::make_shared<LoopbackTransport>(bus));
    a.start();
    b.start();
    REQUIRE(wait_until([&] { return a.get_peers().count("b") == 1; }));

    b.stop();
    CHECK(wait_until([&] { return a.get_peers().count("b") == 0; }));
    a.stop();
}

TEST_CASE("shared-directory participants exchange text and see each other") {
    TempDir dir;
    MessengerConfig ca = fast_cfg("file-a");
    MessengerConfig cb = fast_cfg("file-b");
    ca.shared_dir = dir.str();
    cb.shared_dir = dir.str();

    Inbox at_a, at_b;
    Messenger a(ca);
    Messenger b(cb);
    a.on_message(at_a.handler());
    b.on_message(at_b.handler());
    a.start();
    b.start();

    REQUIRE(wait_until([&] { return a.get_peers().count("file-b") == 1 && b.get_peers().count("file-a") == 1; }));

    a.send("over the filesystem");
    REQUIRE(wait_until([&] { return at_b.size() == 1; }));
    CHECK(at_b.snapshot()[0].first == "file-a");
    CHECK(at_b.snapshot()[0].second == "over the filesystem");

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    CHECK(at_a.size() == 0);

    a.stop();
    CHECK_FALSE(std::filesystem::exists(dir.path() / "heartbeats" / "file-a.json"));
    b.stop();
}
