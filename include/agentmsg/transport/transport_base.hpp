#pragma once
/**
 * @file transport_base.hpp
 * @brief Transport interface the Messenger drives, whatever carries the bytes.
 */

#include <chrono>
#include <cstdint>
#include <optional>

#include "agentmsg/message.hpp"
#include "agentmsg/peer_registry.hpp"

namespace agentmsg::transport {

enum class TxResult : uint8_t { Ok=0, Error=1 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

/**
 * @brief Broadcast transport every Messenger can rely on.
 *
 * Contract:
 *  - begin() acquires sockets/directories; throws SetupFailure. Not retried.
 *  - end() releases everything; safe to call twice or without begin().
 *  - recv(out, timeout) waits at most @p timeout for one inbound message.
 *      None  -> nothing arrived (a poll cycle, not an error),
 *      Ok    -> @p out holds a decoded message,
 *      Error -> the underlying handle failed (e.g. closed by end()).
 *    Undecodable bytes throw MalformedPayload to the caller's receive loop.
 *  - send() carries a user Text message; Error is surfaced to the user.
 *  - send_heartbeat() is best effort; callers ignore Error.
 *  - peers(now) returns the transport's own liveness view, or std::nullopt if
 *    the transport learns liveness only through recv().
 *  - name() is a short identifier for logs.
 *
 * recv() is called from exactly one thread. send()/send_heartbeat() may be
 * called concurrently with recv() and with each other.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual void      begin() = 0;
  virtual void      end() = 0;
  virtual RxResult  recv(std::optional<Message>& out, std::chrono::milliseconds timeout) = 0;
  virtual TxResult  send(const Message& msg) = 0;
  virtual TxResult  send_heartbeat(const Message& msg) = 0;
  virtual std::optional<PeerMap> peers(double now) const { (void)now; return std::nullopt; }
  virtual const char* name() const = 0;
};

} // namespace agentmsg::transport
