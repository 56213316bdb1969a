#pragma once
/**
 * @file transport_shared_dir.hpp
 * @brief Shared-directory broadcast transport for networks that drop multicast.
 *
 * @details
 * PURPOSE
 * -------
 * Containers on isolated bridge networks, some CI runners and most cloud VPCs
 * never deliver multicast. If every participant can mount one directory, that
 * directory becomes the rendezvous point instead.
 *
 * LAYOUT
 * ------
 *   <base>/messages/<uuid>_<epoch-millis>_<seq>.json   one file per sent message
 *   <base>/heartbeats/<uuid>.json                       one file per participant, overwritten
 *
 * Every file is published atomically: written as `<stem>.tmp` in the same
 * directory, then renamed. Pollers only list `*.json`, so a half-written file
 * is never seen.
 *
 * WORKERS
 * -------
 * - poll    (every poll_interval): list messages/ in lexical order, claim each
 *           file not yet in the seen set, read it and queue the decoded message
 *           for recv(). Own files are claimed and skipped. A file stays claimed
 *           even when reading or decoding fails, so it is never retried.
 *           When the queue holds inbox_cap messages the pass waits for recv()
 *           to make room; a claimed message is never dropped.
 * - cleanup (every cleanup_interval): delete own message files older than
 *           message_ttl; prune seen-entries older than 2 x message_ttl.
 *
 * LIVENESS
 * --------
 * Heartbeats never enter messages/. peers(now) reads heartbeats/ directly and
 * reports every non-self issuer whose heartbeat timestamp is within
 * message_ttl. end() deletes the own heartbeat file; a crash leaves it to age
 * out.
 *
 * OWNERSHIP
 * ---------
 * Only files authored by this instance are ever deleted. A file is ours when
 * its name is exactly `<self_id>_<digits>_<digits>.json`.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>

#include "agentmsg/config.hpp"
#include "agentmsg/transport/transport_base.hpp"

namespace agentmsg::transport {

class SharedDirectory : public ITransport {
public:
  SharedDirectory(std::filesystem::path base_dir, std::string self_id, SharedDirConfig cfg = {});
  ~SharedDirectory() override;

  SharedDirectory(const SharedDirectory&) = delete;
  SharedDirectory& operator=(const SharedDirectory&) = delete;

  void      begin() override;
  void      end() override;
  RxResult  recv(std::optional<Message>& out, std::chrono::milliseconds timeout) override;
  TxResult  send(const Message& msg) override;
  TxResult  send_heartbeat(const Message& msg) override;
  std::optional<PeerMap> peers(double now) const override;
  const char* name() const override { return "shared-dir"; }

  /// One poll pass. Exposed so tests can drive it without waiting a period.
  void poll_once();

  /// One cleanup pass. Exposed for the same reason.
  void cleanup_once();

  const std::filesystem::path& messages_dir() const   { return messages_dir_; }
  const std::filesystem::path& heartbeats_dir() const { return heartbeats_dir_; }
  std::size_t seen_count() const;

  /// `<uuid>_<millis>_<seq>.json`
  static std::string message_file_name(const Message& msg, uint64_t seq);

private:
  void publish(const std::filesystem::path& target, const std::string& data,
               std::error_code& ec) const;
  bool enqueue(Message msg);
  // Insert @p file_name into the seen set. False if it was already there.
  bool claim(const std::string& file_name, double now);
  void unclaim(const std::string& file_name);
  bool is_own_file(const std::string& file_name) const;
  void poll_loop();
  void cleanup_loop();
  // Wait up to @p d or until end() is called. Returns false once stopping.
  bool wait_for_stop(std::chrono::milliseconds d);

  const std::filesystem::path base_;
  const std::filesystem::path messages_dir_;
  const std::filesystem::path heartbeats_dir_;
  const std::string           self_id_;
  const std::string           own_prefix_;   ///< "<self_id>_"
  const SharedDirConfig       cfg_;

  std::mutex seq_mu_;
  uint64_t   seq_{0};

  mutable std::mutex seen_mu_;
  std::unordered_map<std::string, double> seen_;   ///< file name -> observed-at

  std::mutex              inbox_mu_;
  std::condition_variable inbox_cv_;   ///< inbox became non-empty
  std::condition_variable space_cv_;   ///< inbox dropped below inbox_cap
  std::deque<Message>     inbox_;

  std::mutex              stop_mu_;
  std::condition_variable stop_cv_;
  std::atomic<bool>       running_{false};

  std::thread poll_thread_;
  std::thread cleanup_thread_;
};

} // namespace agentmsg::transport
