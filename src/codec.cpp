/**
 * @file codec.cpp
 * @brief nlohmann::json implementation of the agentmsg wire codec.
 *
 * Refer to `codec.hpp` for the wire contract.
 *
 * ordered_json keeps insertion order on dump(), which is what pins the field
 * order to uuid/type/payload/timestamp.
 */

#include "agentmsg/codec.hpp"
#include "agentmsg/errors.hpp"

#include <nlohmann/json.hpp>

using nlohmann::ordered_json;

namespace agentmsg {
namespace codec {

namespace {

// Pull one required string field or throw with the field name.
std::string require_string(const ordered_json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end())       throw MalformedPayload(std::string("missing field '") + key + "'");
  if (!it->is_string())    throw MalformedPayload(std::string("field '") + key + "' is not a string");
  return it->get<std::string>();
}

Message from_json(const ordered_json& j) {
  if (!j.is_object()) {
    throw MalformedPayload("payload is not a JSON object");
  }

  std::string uuid    = require_string(j, "uuid");
  std::string tag     = require_string(j, "type");
  std::string payload = require_string(j, "payload");

  auto ts = j.find("timestamp");
  if (ts == j.end())        throw MalformedPayload("missing field 'timestamp'");
  if (!ts->is_number())     throw MalformedPayload("field 'timestamp' is not a number");

  auto kind = kind_from_string(tag);
  if (!kind) throw MalformedPayload("unknown message type '" + tag + "'");

  // Heartbeats carry no payload; whatever a peer put there is dropped.
  if (*kind == MessageKind::Heartbeat) payload.clear();

  return Message(std::move(uuid), *kind, std::move(payload), ts->get<double>());
}

ordered_json to_json(const Message& msg) {
  ordered_json j;
  j["uuid"]      = msg.uuid();
  j["type"]      = kind_to_string(msg.kind());
  j["payload"]   = msg.payload();
  j["timestamp"] = msg.timestamp();
  return j;
}

} // namespace

std::string encode_string(const Message& msg) {
  // replace: a payload with broken UTF-8 still goes out instead of throwing
  return to_json(msg).dump(-1, ' ', false, ordered_json::error_handler_t::replace);
}

Bytes encode(const Message& msg) {
  const std::string s = encode_string(msg);
  return Bytes(s.begin(), s.end());
}

Message decode(const std::string& data) {
  // parse_error and out_of_range (e.g. a number that overflows a double)
  // both derive from ordered_json::exception.
  try {
    return from_json(ordered_json::parse(data));
  } catch (const ordered_json::exception& e) {
    throw MalformedPayload(std::string("invalid JSON: ") + e.what());
  }
}

Message decode(const Bytes& data) {
  return decode(std::string(data.begin(), data.end()));
}

std::optional<Message> try_decode(const std::string& data) {
  try {
    return decode(data);
  } catch (const MalformedPayload&) {
    return std::nullopt;
  }
}

} // namespace codec
} // namespace agentmsg
