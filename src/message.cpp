// -----------------------------------------------------------------------------
// message.cpp — Message factories, kind tags, identity generation
//
// API & field descriptions:
//   see include/agentmsg/message.hpp
// -----------------------------------------------------------------------------
#include "agentmsg/message.hpp"

#include <chrono>
#include <cstdio>
#include <random>

namespace agentmsg {

bool operator==(const Message& a, const Message& b) {
  return a.uuid() == b.uuid()
      && a.kind() == b.kind()
      && a.payload() == b.payload()
      && a.timestamp() == b.timestamp();   // exact: receivers never rewrite it
}

bool operator!=(const Message& a, const Message& b) {
  return !(a == b);
}

const char* kind_to_string(MessageKind kind) {
  switch (kind) {
    case MessageKind::Text:      return "message";
    case MessageKind::Heartbeat: return "heartbeat";
  }
  return "message";
}

std::optional<MessageKind> kind_from_string(const std::string& tag) {
  if (tag == "message")   return MessageKind::Text;
  if (tag == "heartbeat") return MessageKind::Heartbeat;
  return std::nullopt;
}

double now_seconds() {
  using namespace std::chrono;
  const auto us = duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
  return static_cast<double>(us) / 1e6;
}

Message make_text(const std::string& uuid, const std::string& text) {
  return Message(uuid, MessageKind::Text, text, now_seconds());
}

Message make_heartbeat(const std::string& uuid) {
  return Message(uuid, MessageKind::Heartbeat, std::string{}, now_seconds());
}

// -----------------------------------------------------------------------------
// generate_uuid() — RFC 4122 version-4 identity.
// POLICY:
//   - One mt19937_64 per thread, seeded from random_device.
//   - Version nibble forced to 4, variant bits to 10xx.
// OUT:   36 chars, hyphens at 8/13/18/23.
// -----------------------------------------------------------------------------
std::string generate_uuid() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  uint8_t id[16];
  for (auto& b : id) b = static_cast<uint8_t>(rng());

  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | 0x40);   // version 4
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80);   // RFC 4122 variant

  char buf[37];
  std::snprintf(buf, sizeof(buf),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                id[0], id[1], id[2], id[3], id[4], id[5], id[6], id[7],
                id[8], id[9], id[10], id[11], id[12], id[13], id[14], id[15]);
  return std::string(buf, 36);
}

} // namespace agentmsg
