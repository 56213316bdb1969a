#pragma once
/**
 * @file peer_registry.hpp
 * @brief In-memory roster of peers and when each was last heard from.
 *
 * @details
 * PURPOSE
 * -------
 * Every participant derives its own view of "who is reachable right now"
 * from the traffic it has observed. The registry is that view: identity ->
 * last-seen timestamp (the issuer's timestamp, never rewritten).
 *
 * WHAT THIS DOES
 * --------------
 * - observe() upserts an entry; the owner's own identity is never recorded.
 * - active_peers() / count() filter at read time by a liveness timeout and do
 *   not mutate the map.
 * - evict_older_than() actively drops long-stale entries so a churning network
 *   does not grow the map forever. The Messenger calls it with a horizon well
 *   past the liveness timeout, so eviction never changes what active_peers()
 *   reports.
 *
 * THREADING
 * ---------
 * All methods lock an internal mutex for the duration of the map access only.
 */

#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace agentmsg {

/// identity -> last_seen (seconds since epoch)
using PeerMap = std::map<std::string, double>;

class PeerRegistry {
public:
  explicit PeerRegistry(std::string self_id);

  /// Upsert @p id with @p timestamp. No-op for the self identity.
  void observe(const std::string& id, double timestamp);

  /// Entries with `now - last_seen < timeout_s`.
  PeerMap active_peers(double now, double timeout_s) const;

  /// Cardinality of active_peers(now, timeout_s).
  std::size_t count(double now, double timeout_s) const;

  /// Remove entries with `now - last_seen >= horizon_s`. Returns how many went.
  std::size_t evict_older_than(double now, double horizon_s);

  /// Total entries held, stale ones included.
  std::size_t size() const;

  const std::string& self_id() const { return self_id_; }

private:
  const std::string self_id_;
  mutable std::mutex mu_;
  PeerMap peers_;
};

} // namespace agentmsg
