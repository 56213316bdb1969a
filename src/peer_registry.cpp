// ============================================================================
// peer_registry.cpp — implementation for peer_registry.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "agentmsg/peer_registry.hpp"

#include <utility>

namespace agentmsg {

PeerRegistry::PeerRegistry(std::string self_id)
: self_id_(std::move(self_id)) {}

/*
 * observe()
 * ---------
 * Record that @p id was heard from at @p timestamp.
 *
 * - Self is skipped: a participant never lists itself as a peer, even though
 *   the multicast transport loops its own datagrams back.
 * - Latest write wins, even if older than the stored value. Datagrams arrive
 *   unordered and liveness only needs "recent enough".
 */
void PeerRegistry::observe(const std::string& id, double timestamp) {
  if (id == self_id_) return;
  std::lock_guard<std::mutex> lock(mu_);
  peers_[id] = timestamp;
}

PeerMap PeerRegistry::active_peers(double now, double timeout_s) const {
  PeerMap out;
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& [id, last_seen] : peers_) {
    if (now - last_seen < timeout_s) out.emplace(id, last_seen);
  }
  return out;
}

std::size_t PeerRegistry::count(double now, double timeout_s) const {
  return active_peers(now, timeout_s).size();
}

/*
 * evict_older_than()
 * ------------------
 * Drop entries whose last_seen is at least @p horizon_s old.
 * Mirrors the seen-entry pruning of the shared-directory transport.
 */
std::size_t PeerRegistry::evict_older_than(double now, double horizon_s) {
  std::size_t removed = 0;
  std::lock_guard<std::mutex> lock(mu_);
  for (auto it = peers_.begin(); it != peers_.end();) {
    if (now - it->second >= horizon_s) {
      it = peers_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t PeerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return peers_.size();
}

} // namespace agentmsg
