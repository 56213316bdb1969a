/**
 * @file messenger.hpp
 * @brief agentmsg Messenger — one participant on the local broadcast medium.
 *
 * @details
 * ## Field Brief
 * A handful of agents on one host or one LAN segment need to shout at each
 * other and know who else is around. No broker, no addressing, no delivery
 * receipts. The **Messenger** is that participant: it owns an identity, a
 * transport, a peer registry, and two workers.
 *
 * ---
 *
 * @par What This File Provides
 * - `agentmsg::Messenger` — lifecycle (`start`/`stop`), `send(text)`,
 *   ordered message handlers, and a live peer view.
 * - `agentmsg::MessengerState` — `Stopped → Starting → Running → Stopping`.
 * - `agentmsg::MessageHandler` — `(sender uuid, text)` callback.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *   [transport]                        [Messenger]
 *       │                                   │
 *   recv(out, 1s) ◄──── receive worker ─────┤
 *       │                 │                 │
 *       │                 ├─ self?      -> drop
 *       │                 ├─ registry.observe(uuid, ts)
 *       │                 └─ Text       -> handlers, in registration order
 *       │                                   │
 *   send_heartbeat() ◄── heartbeat worker ──┤  every heartbeat_interval
 *       │                                   │  + evict entries older than 2 x peer_timeout
 *   send() ◄──────────── send(text) ────────┘  caller's thread
 * ```
 *
 * - The transport is chosen at construction: a configured shared directory
 *   selects the file transport, otherwise UDP multicast. Callers can also
 *   hand in any `ITransport`.
 * - Handlers run on the receive worker. A slow handler delays the next
 *   receive; a throwing handler is logged and the rest still run.
 *
 * ---
 *
 * @par Failure Model
 * - `start()` propagates `SetupFailure` from the transport and stays Stopped.
 * - `send()` throws `NotStarted` unless Running, `SendFailure` if the
 *   transport refuses the message.
 * - Malformed inbound traffic is logged and dropped; the worker keeps going.
 * - Heartbeat write failures are transient and only logged at debug.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * agentmsg::Messenger m;
 * m.on_message([](const std::string& from, const std::string& text) {
 *   std::cout << from.substr(0, 8) << ": " << text << "\n";
 * });
 * m.start();
 * m.send("build 1432 is green");
 * auto peers = m.get_peers();   // uuid -> last seen (epoch seconds)
 * m.stop();
 * @endcode
 */
#ifndef AGENTMSG_MESSENGER_HPP
#define AGENTMSG_MESSENGER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "agentmsg/config.hpp"
#include "agentmsg/peer_registry.hpp"
#include "agentmsg/transport/transport_base.hpp"

namespace agentmsg {

enum class MessengerState : uint8_t { Stopped = 0, Starting = 1, Running = 2, Stopping = 3 };

const char* state_to_string(MessengerState s);

/// Called with (sender uuid, text) for every Text message from another participant.
using MessageHandler = std::function<void(const std::string& uuid, const std::string& text)>;

class Messenger {
public:
  /// Identity from config or generated; transport picked from config.shared_dir.
  explicit Messenger(MessengerConfig config = {});

  /// Use a ready transport instead of building one from config.
  Messenger(MessengerConfig config, std::shared_ptr<transport::ITransport> transport);

  ~Messenger();

  Messenger(const Messenger&) = delete;
  Messenger& operator=(const Messenger&) = delete;

  /**
   * @brief Open the transport, launch both workers, emit one heartbeat.
   * No-op unless Stopped.
   * @throws SetupFailure if the transport cannot be opened, or if a worker
   *         detached by the previous stop() is still busy after join_timeout.
   */
  void start();

  /**
   * @brief Stop workers (bounded by join_timeout each) and close the transport.
   * No-op unless Running. A worker that misses the deadline is detached; it
   * shares ownership of the runtime state, so it finishes safely later, and
   * the transport is closed by the last such worker instead of here.
   */
  void stop();

  /**
   * @brief Broadcast @p text to every participant.
   * @throws NotStarted  if not Running (no I/O is attempted).
   * @throws SendFailure if the transport rejects the message.
   */
  void send(const std::string& text);

  void on_message(MessageHandler handler);
  void add_handler(MessageHandler handler);   ///< same as on_message()

  /// uuid -> last_seen for every peer heard within peer_timeout.
  PeerMap get_peers() const;
  std::size_t get_active_peer_count() const;

  const std::string& uuid() const;
  MessengerState state() const { return state_.load(); }
  bool running() const { return state() == MessengerState::Running; }
  const char* transport_name() const;

private:
  struct Runtime;
  struct Run;

  void join_bounded(std::thread& worker, std::future<void>& done, const char* what);
  bool reap(std::future<void>& done);

  std::shared_ptr<Runtime> rt_;
  std::shared_ptr<Run>     run_;   ///< token of the current start(); null while Stopped

  std::mutex                  lifecycle_mu_;
  std::atomic<MessengerState> state_{MessengerState::Stopped};

  std::thread       recv_thread_;
  std::thread       heartbeat_thread_;
  std::future<void> recv_done_;
  std::future<void> heartbeat_done_;
};

} // namespace agentmsg

#endif // AGENTMSG_MESSENGER_HPP
