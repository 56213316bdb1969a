/**
 * @file message.hpp
 * @brief agentmsg Message — the one fact every participant broadcasts.
 *
 * A Message is a flat, immutable record:
 *   - `uuid`      issuer's self-assigned identity (36-char UUID by default),
 *   - `kind`      closed tag: Text or Heartbeat,
 *   - `payload`   UTF-8 text; always empty for Heartbeat,
 *   - `timestamp` seconds since the Unix epoch, fractional, set by the issuer.
 *
 * ### Wire tags
 * The codec writes `kind` as a string tag so the JSON stays readable by eye:
 *     Text      -> "message"
 *     Heartbeat -> "heartbeat"
 *
 * ### Construction paths
 * - `make_text(uuid, text)` for user sends.
 * - `make_heartbeat(uuid)` for the liveness loop.
 * - `codec::decode(bytes)` on the receive side (see codec.hpp).
 *
 * Receivers never rewrite the timestamp; the Peer Registry stores it as-is.
 */
#ifndef AGENTMSG_MESSAGE_HPP
#define AGENTMSG_MESSAGE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agentmsg {

/// Raw bytes as they travel over a transport.
using Bytes = std::vector<uint8_t>;

/// Closed message-kind tag. Dispatch sites switch over it exhaustively.
enum class MessageKind : uint8_t { Text = 0, Heartbeat = 1 };

/**
 * @class Message
 * @brief Immutable broadcast record (identity, kind, payload, timestamp).
 *
 * There are no setters: a Message is fully defined at construction. Copy and
 * assignment replace the whole record, which keeps it usable in queues.
 */
class Message {
public:
  Message(std::string uuid, MessageKind kind, std::string payload, double timestamp)
  : uuid_(std::move(uuid)), kind_(kind), payload_(std::move(payload)), timestamp_(timestamp) {}

  const std::string& uuid() const    { return uuid_; }
  MessageKind        kind() const    { return kind_; }
  const std::string& payload() const { return payload_; }
  double             timestamp() const { return timestamp_; }

  bool is_text() const      { return kind_ == MessageKind::Text; }
  bool is_heartbeat() const { return kind_ == MessageKind::Heartbeat; }

private:
  std::string uuid_;
  MessageKind kind_;
  std::string payload_;
  double      timestamp_;
};

bool operator==(const Message& a, const Message& b);
bool operator!=(const Message& a, const Message& b);

/// Wire tag for a kind ("message" / "heartbeat").
const char* kind_to_string(MessageKind kind);

/// Inverse of kind_to_string(); std::nullopt for any other tag.
std::optional<MessageKind> kind_from_string(const std::string& tag);

/// Current wall-clock time in fractional seconds since the epoch.
double now_seconds();

/// Build a Text message stamped with now_seconds().
Message make_text(const std::string& uuid, const std::string& text);

/// Build a Heartbeat (empty payload) stamped with now_seconds().
Message make_heartbeat(const std::string& uuid);

/**
 * @brief Generate a fresh participant identity.
 *
 * 128 random bits formatted as an RFC 4122 version-4 UUID:
 * `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx` (36 chars, lowercase hex).
 */
std::string generate_uuid();

} // namespace agentmsg

#endif // AGENTMSG_MESSAGE_HPP
