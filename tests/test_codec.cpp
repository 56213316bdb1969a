#include <doctest/doctest.h>
#include "agentmsg/codec.hpp"
#include "agentmsg/errors.hpp"

using namespace agentmsg;

TEST_CASE("encode produces the fixed wire form") {
    Message m("u1", MessageKind::Text, "hi", 1000.0);
    CHECK(codec::encode_string(m) ==
          R"({"uuid":"u1","type":"message","payload":"hi","timestamp":1000.0})");

    const Bytes bytes = codec::encode(m);
    CHECK(std::string(bytes.begin(), bytes.end()) == codec::encode_string(m));
}

TEST_CASE("heartbeat wire form uses the heartbeat tag") {
    Message hb("u2", MessageKind::Heartbeat, "", 12.5);
    CHECK(codec::encode_string(hb) ==
          R"({"uuid":"u2","type":"heartbeat","payload":"","timestamp":12.5})");
}

TEST_CASE("decode restores every field exactly, non-ASCII included") {
    Message m("7f1c2a9e-0000-4000-8000-000000000001", MessageKind::Text,
              "d\xC3\xA9j\xC3\xA0 vu \xE2\x9C\x93 \xF0\x9F\x9A\x80", 1718041234.123456);
    Message back = codec::decode(codec::encode(m));
    CHECK(back == m);
    CHECK(back.timestamp() == m.timestamp());
}

TEST_CASE("non-ASCII text is written verbatim, not escaped") {
    Message m("u1", MessageKind::Text, "caf\xC3\xA9", 1.0);
    CHECK(codec::encode_string(m).find("caf\xC3\xA9") != std::string::npos);
}

TEST_CASE("decode accepts fields in any order and integer timestamps") {
    Message m = codec::decode(std::string(R"({"timestamp":42,"payload":"x","type":"message","uuid":"a"})"));
    CHECK(m.uuid() == "a");
    CHECK(m.is_text());
    CHECK(m.payload() == "x");
    CHECK(m.timestamp() == 42.0);
}

TEST_CASE("decoded heartbeats drop any payload") {
    Message m = codec::decode(std::string(R"({"uuid":"a","type":"heartbeat","payload":"junk","timestamp":1.0})"));
    CHECK(m.is_heartbeat());
    CHECK(m.payload().empty());
}

TEST_CASE("decode rejects malformed input with MalformedPayload") {
    const char* bad[] = {
        "",
        "not json",
        "[1,2,3]",
        R"({"uuid":"a","type":"message","payload":"x"})",
        R"({"uuid":"a","type":"message","timestamp":1.0})",
        R"({"type":"message","payload":"x","timestamp":1.0})",
        R"({"uuid":"a","payload":"x","timestamp":1.0})",
        R"({"uuid":7,"type":"message","payload":"x","timestamp":1.0})",
        R"({"uuid":"a","type":"message","payload":"x","timestamp":"soon"})",
        R"({"uuid":"a","type":"ping","payload":"x","timestamp":1.0})",
        R"({"uuid":"a","type":"message","payload":"x","timestamp":1e400})",
    };
    for (const char* input : bad) {
        CAPTURE(input);
        CHECK_THROWS_AS(codec::decode(std::string(input)), MalformedPayload);
        CHECK_FALSE(codec::try_decode(input).has_value());
    }
}

TEST_CASE("try_decode returns the message on valid input") {
    auto m = codec::try_decode(R"({"uuid":"u1","type":"message","payload":"hi","timestamp":1000.0})");
    REQUIRE(m.has_value());
    CHECK(*m == Message("u1", MessageKind::Text, "hi", 1000.0));
}
