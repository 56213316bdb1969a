#pragma once
/**
 * @file transport_udp_multicast.hpp
 * @brief UDP multicast transport: every participant on the segment hears every datagram.
 *
 * @details
 * PURPOSE
 * -------
 * Primary transport. One fixed group/port for the whole deployment, hop limit
 * 1 so nothing leaves the local segment, and multicast loopback on so a
 * sender also receives its own datagrams. Self-suppression happens one layer
 * up, in the Messenger.
 *
 * SOCKETS
 * -------
 * - receive socket: SO_REUSEADDR (+ SO_REUSEPORT where required), bound to the
 *   port, joined to the group on the default interface.
 * - send socket: IP_MULTICAST_TTL and IP_MULTICAST_LOOP set, unbound.
 *
 * PLATFORM VARIANCE
 * -----------------
 * Linux delivers group traffic to a socket bound to the group address and
 * filters unrelated unicast for free. macOS/BSD refuse that bind and also
 * need SO_REUSEPORT for several local listeners. The choice is made once, at
 * construction, by probe_socket_plan(); no call site branches afterwards.
 *
 * RECEIVE TIMING
 * --------------
 * recv() uses poll(2) with the caller's timeout, so a stop request is seen
 * within one timeout even when the segment is silent.
 */

#include <atomic>
#include <netinet/in.h>

#include "agentmsg/config.hpp"
#include "agentmsg/transport/transport_base.hpp"

namespace agentmsg::transport {

/// Socket options decided once per process by probe_socket_plan().
struct SocketPlan {
  bool bind_to_group{true};   ///< bind the group address (else INADDR_ANY)
  bool reuse_port{false};     ///< also set SO_REUSEPORT
};

/// Capability probe for the running platform.
SocketPlan probe_socket_plan();

class UdpMulticast : public ITransport {
public:
  explicit UdpMulticast(UdpConfig cfg = {});
  ~UdpMulticast() override;

  UdpMulticast(const UdpMulticast&) = delete;
  UdpMulticast& operator=(const UdpMulticast&) = delete;

  void      begin() override;
  void      end() override;
  RxResult  recv(std::optional<Message>& out, std::chrono::milliseconds timeout) override;
  TxResult  send(const Message& msg) override;
  TxResult  send_heartbeat(const Message& msg) override;
  const char* name() const override { return "udp-multicast"; }

  const SocketPlan& plan() const { return plan_; }
  const UdpConfig&  config() const { return cfg_; }
  bool is_open() const { return recv_fd_.load() >= 0 && send_fd_.load() >= 0; }

private:
  int  open_receiver() const;
  int  open_sender() const;
  TxResult send_bytes(const Bytes& data);

  UdpConfig   cfg_;
  SocketPlan  plan_;
  sockaddr_in group_addr_{};
  bool        group_valid_{false};
  in_addr     iface_addr_{};
  bool        iface_valid_{false};

  std::atomic<int> recv_fd_{-1};
  std::atomic<int> send_fd_{-1};
  Bytes            rx_buf_;      ///< touched only by the recv() thread
};

} // namespace agentmsg::transport
