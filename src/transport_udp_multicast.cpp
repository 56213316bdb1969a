// ============================================================================
// transport_udp_multicast.cpp — implementation for transport_udp_multicast.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "agentmsg/transport/transport_udp_multicast.hpp"
#include "agentmsg/codec.hpp"
#include "agentmsg/errors.hpp"
#include "agentmsg/logging.hpp"

#include <arpa/inet.h>     // inet_pton, htons
#include <netinet/in.h>    // ip_mreq, IPPROTO_IP
#include <poll.h>          // poll(2) for bounded receive
#include <sys/socket.h>    // socket, bind, setsockopt, sendto, recvfrom
#include <unistd.h>        // close

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

namespace agentmsg::transport {

namespace {

std::string errno_text() {
  return std::error_code(errno, std::generic_category()).message();
}

// Close @p fd and throw SetupFailure naming the step that failed.
[[noreturn]] void fail_setup(int fd, const std::string& step) {
  const std::string why = errno_text();
  if (fd >= 0) ::close(fd);
  throw SetupFailure("udp multicast: " + step + " failed: " + why);
}

} // namespace

// ---------------------------------------------------------------------------
// probe_socket_plan()
// -------------------
// Linux: bind the group address, SO_REUSEADDR is enough for shared listeners.
// Darwin/BSD: binding a multicast address fails; bind INADDR_ANY and add
// SO_REUSEPORT so several local processes can listen on one port.
// ---------------------------------------------------------------------------
SocketPlan probe_socket_plan() {
  SocketPlan plan;
#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
  plan.bind_to_group = false;
  plan.reuse_port    = true;
#else
  plan.bind_to_group = true;
  plan.reuse_port    = false;
#endif
  return plan;
}

UdpMulticast::UdpMulticast(UdpConfig cfg)
: cfg_(std::move(cfg)), plan_(probe_socket_plan()) {
  group_addr_.sin_family = AF_INET;
  group_addr_.sin_port   = htons(cfg_.port);
  group_valid_ = ::inet_pton(AF_INET, cfg_.group.c_str(), &group_addr_.sin_addr) == 1;
  iface_valid_ = ::inet_pton(AF_INET, cfg_.interface_addr.c_str(), &iface_addr_) == 1;
  rx_buf_.resize(cfg_.buffer_size);
}

UdpMulticast::~UdpMulticast() {
  end();
}

// ---------------------------------------------------------------------------
// open_receiver()
// ---------------
// socket -> reuse options -> bind -> join group.
// Any failure closes the socket and throws SetupFailure.
// ---------------------------------------------------------------------------
int UdpMulticast::open_receiver() const {
  int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
  if (fd < 0) fail_setup(-1, "socket(receiver)");

  int one = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) < 0)
    fail_setup(fd, "setsockopt(SO_REUSEADDR)");
#ifdef SO_REUSEPORT
  if (plan_.reuse_port &&
      ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &one, sizeof(one)) < 0)
    fail_setup(fd, "setsockopt(SO_REUSEPORT)");
#endif

  sockaddr_in local{};
  local.sin_family = AF_INET;
  local.sin_port   = htons(cfg_.port);
  local.sin_addr   = plan_.bind_to_group ? group_addr_.sin_addr : in_addr{htonl(INADDR_ANY)};
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) < 0)
    fail_setup(fd, "bind(" + cfg_.group + ":" + std::to_string(cfg_.port) + ")");

  ip_mreq mreq{};
  mreq.imr_multiaddr        = group_addr_.sin_addr;
  mreq.imr_interface        = iface_addr_;
  if (::setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0)
    fail_setup(fd, "join group " + cfg_.group);

  return fd;
}

int UdpMulticast::open_sender() const {
  int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
  if (fd < 0) fail_setup(-1, "socket(sender)");

  unsigned char ttl  = cfg_.ttl;
  unsigned char loop = cfg_.loopback ? 1 : 0;
  if (::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0)
    fail_setup(fd, "setsockopt(IP_MULTICAST_TTL)");
  if (::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) < 0)
    fail_setup(fd, "setsockopt(IP_MULTICAST_LOOP)");
  if (iface_addr_.s_addr != htonl(INADDR_ANY) &&
      ::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_IF, &iface_addr_, sizeof(iface_addr_)) < 0)
    fail_setup(fd, "setsockopt(IP_MULTICAST_IF " + cfg_.interface_addr + ")");

  return fd;
}

void UdpMulticast::begin() {
  if (is_open()) return;
  if (!group_valid_) {
    throw SetupFailure("udp multicast: invalid group address '" + cfg_.group + "'");
  }
  if (!iface_valid_) {
    throw SetupFailure("udp multicast: invalid interface address '" + cfg_.interface_addr + "'");
  }

  int rfd = open_receiver();
  int sfd = -1;
  try {
    sfd = open_sender();
  } catch (...) {
    ::close(rfd);          // don't leak the half-built pair
    throw;
  }

  recv_fd_.store(rfd);
  send_fd_.store(sfd);
  AGENTMSG_LOG_DEBUG("udp multicast open", {str_field("group", cfg_.group),
                                            int_field("port", cfg_.port),
                                            int_field("bind_to_group", plan_.bind_to_group)});
}

void UdpMulticast::end() {
  int rfd = recv_fd_.exchange(-1);
  int sfd = send_fd_.exchange(-1);
  if (rfd >= 0) ::close(rfd);
  if (sfd >= 0) ::close(sfd);
}

// ---------------------------------------------------------------------------
// recv()
// ------
// PRE:   called from the Messenger's receive worker only.
// POLICY:
//   - poll() bounds the wait; 0 ready -> None (the caller re-checks its run flag).
//   - EINTR is just a short poll cycle.
//   - A closed fd (end() raced us) or any other error -> Error.
// OUT:   decoded message in @p out, or MalformedPayload thrown to the caller.
// ---------------------------------------------------------------------------
RxResult UdpMulticast::recv(std::optional<Message>& out, std::chrono::milliseconds timeout) {
  out.reset();
  const int fd = recv_fd_.load();
  if (fd < 0) return RxResult::Error;

  pollfd pfd{fd, POLLIN, 0};
  int pr = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (pr == 0) return RxResult::None;
  if (pr < 0) return errno == EINTR ? RxResult::None : RxResult::Error;
  if (pfd.revents & (POLLERR | POLLNVAL)) return RxResult::Error;

  ssize_t n = ::recvfrom(fd, rx_buf_.data(), rx_buf_.size(), 0, nullptr, nullptr);
  if (n < 0) {
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return RxResult::None;
    return RxResult::Error;
  }

  out.emplace(codec::decode(std::string(rx_buf_.begin(), rx_buf_.begin() + n)));
  return RxResult::Ok;
}

TxResult UdpMulticast::send_bytes(const Bytes& data) {
  const int fd = send_fd_.load();
  if (fd < 0) return TxResult::Error;

  ssize_t w = ::sendto(fd, data.data(), data.size(), 0,
                       reinterpret_cast<const sockaddr*>(&group_addr_), sizeof(group_addr_));
  return (w == static_cast<ssize_t>(data.size())) ? TxResult::Ok : TxResult::Error;
}

TxResult UdpMulticast::send(const Message& msg) {
  TxResult r = send_bytes(codec::encode(msg));
  if (r != TxResult::Ok) {
    AGENTMSG_LOG_WARN("udp multicast send failed", {str_field("error", errno_text())});
  }
  return r;
}

TxResult UdpMulticast::send_heartbeat(const Message& msg) {
  return send_bytes(codec::encode(msg));
}

} // namespace agentmsg::transport
