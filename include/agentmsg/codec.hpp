#pragma once
/**
 * @file codec.hpp
 * @brief JSON wire codec for agentmsg Messages.
 * @details
 *   The codec centralizes all conversion between raw bytes and the
 *   @ref agentmsg::Message record. Every transport carries the same encoding:
 *
 *   @code
 *   {"uuid":"u1","type":"message","payload":"hi","timestamp":1000.0}
 *   @endcode
 *
 *   - Field order is fixed (uuid, type, payload, timestamp) and there is no
 *     whitespace, so identical messages produce identical bytes.
 *   - UTF-8 is written verbatim; nothing is \\u-escaped beyond what JSON needs.
 *   - `timestamp` is a JSON number and round-trips exactly.
 *
 *   Backed by [nlohmann::json](https://github.com/nlohmann/json).
 *
 *   ## Errors
 *   decode() throws agentmsg::MalformedPayload for anything that is not a JSON
 *   object with the four fields at the right types. try_decode() is the
 *   non-throwing variant for callers that only want "usable or not".
 */

#include <optional>
#include <string>

#include "agentmsg/message.hpp"

namespace agentmsg {
namespace codec {

/// Serialize a Message to its wire bytes.
Bytes encode(const Message& msg);

/// Same encoding as encode(), returned as text (file transport, logs).
std::string encode_string(const Message& msg);

/**
 * @brief Parse wire bytes into a Message.
 * @throws MalformedPayload on invalid JSON or a missing/mistyped field.
 */
Message decode(const Bytes& data);

/// Overload for text already in memory (file contents).
Message decode(const std::string& data);

/// Non-throwing decode; std::nullopt on malformed input.
std::optional<Message> try_decode(const std::string& data);

} // namespace codec
} // namespace agentmsg
