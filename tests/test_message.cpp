#include <doctest/doctest.h>
#include "agentmsg/message.hpp"

#include <cctype>
#include <set>

using namespace agentmsg;

TEST_CASE("generate_uuid() yields 36-char version-4 identities") {
    const std::string id = generate_uuid();
    REQUIRE(id.size() == 36);
    CHECK(id[8] == '-');
    CHECK(id[13] == '-');
    CHECK(id[18] == '-');
    CHECK(id[23] == '-');
    CHECK(id[14] == '4');                                   // version nibble
    CHECK(std::string("89ab").find(id[19]) != std::string::npos); // variant

    for (std::size_t i = 0; i < id.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        CHECK(std::isxdigit(static_cast<unsigned char>(id[i])));
    }
}

TEST_CASE("generate_uuid() does not repeat") {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) ids.insert(generate_uuid());
    CHECK(ids.size() == 1000);
}

TEST_CASE("make_text stamps the current time and keeps the text") {
    const double before = now_seconds();
    Message m = make_text("agent-a", "hello");
    const double after = now_seconds();

    CHECK(m.uuid() == "agent-a");
    CHECK(m.is_text());
    CHECK_FALSE(m.is_heartbeat());
    CHECK(m.payload() == "hello");
    CHECK(m.timestamp() >= before);
    CHECK(m.timestamp() <= after);
}

TEST_CASE("make_heartbeat carries an empty payload") {
    Message hb = make_heartbeat("agent-b");
    CHECK(hb.is_heartbeat());
    CHECK(hb.kind() == MessageKind::Heartbeat);
    CHECK(hb.payload().empty());
}

TEST_CASE("kind tags map both ways and reject unknown tags") {
    CHECK(std::string(kind_to_string(MessageKind::Text)) == "message");
    CHECK(std::string(kind_to_string(MessageKind::Heartbeat)) == "heartbeat");
    CHECK(kind_from_string("message") == MessageKind::Text);
    CHECK(kind_from_string("heartbeat") == MessageKind::Heartbeat);
    CHECK_FALSE(kind_from_string("ping").has_value());
    CHECK_FALSE(kind_from_string("").has_value());
}

TEST_CASE("Message equality compares every field") {
    Message a("u1", MessageKind::Text, "hi", 1000.0);
    CHECK(a == Message("u1", MessageKind::Text, "hi", 1000.0));
    CHECK(a != Message("u2", MessageKind::Text, "hi", 1000.0));
    CHECK(a != Message("u1", MessageKind::Heartbeat, "hi", 1000.0));
    CHECK(a != Message("u1", MessageKind::Text, "ho", 1000.0));
    CHECK(a != Message("u1", MessageKind::Text, "hi", 1000.5));
}
