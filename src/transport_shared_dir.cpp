// ============================================================================
// transport_shared_dir.cpp — implementation for transport_shared_dir.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "agentmsg/transport/transport_shared_dir.hpp"
#include "agentmsg/codec.hpp"
#include "agentmsg/errors.hpp"
#include "agentmsg/logging.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace agentmsg::transport {

namespace {

bool has_prefix(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool all_digits(const std::string& s, std::size_t from, std::size_t to) {
  if (from >= to) return false;
  for (std::size_t i = from; i < to; ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
  }
  return true;
}

bool read_file(const fs::path& p, std::string& out) {
  std::ifstream in(p, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) return false;
  out = ss.str();
  return true;
}

// Regular `*.json` entries of @p dir, sorted by file name.
std::vector<fs::path> list_json(const fs::path& dir, std::error_code& ec) {
  std::vector<fs::path> out;
  fs::directory_iterator it(dir, ec), end;
  for (; !ec && it != end; it.increment(ec)) {
    const fs::path& p = it->path();
    if (p.extension() == ".json") out.push_back(p);
  }
  std::sort(out.begin(), out.end(),
            [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); });
  return out;
}

} // namespace

SharedDirectory::SharedDirectory(fs::path base_dir, std::string self_id, SharedDirConfig cfg)
: base_(std::move(base_dir)),
  messages_dir_(base_ / "messages"),
  heartbeats_dir_(base_ / "heartbeats"),
  self_id_(std::move(self_id)),
  own_prefix_(self_id_ + "_"),
  cfg_(cfg) {}

SharedDirectory::~SharedDirectory() {
  end();
}

std::string SharedDirectory::message_file_name(const Message& msg, uint64_t seq) {
  const auto millis = static_cast<uint64_t>(msg.timestamp() * 1000.0);
  return msg.uuid() + "_" + std::to_string(millis) + "_" + std::to_string(seq) + ".json";
}

void SharedDirectory::begin() {
  if (running_.load()) return;

  std::error_code ec;
  fs::create_directories(messages_dir_, ec);
  if (ec) throw SetupFailure("shared dir: cannot create " + messages_dir_.string() + ": " + ec.message());
  fs::create_directories(heartbeats_dir_, ec);
  if (ec) throw SetupFailure("shared dir: cannot create " + heartbeats_dir_.string() + ": " + ec.message());

  running_.store(true);
  poll_thread_    = std::thread(&SharedDirectory::poll_loop, this);
  cleanup_thread_ = std::thread(&SharedDirectory::cleanup_loop, this);

  AGENTMSG_LOG_DEBUG("shared dir open", {str_field("base", base_.string()),
                                         int_field("poll_ms", cfg_.poll_interval.count())});
}

/*
 * end()
 * -----
 * Stop both workers, wake any recv() waiter, then remove our heartbeat so
 * peers drop us on their next read instead of after the retention window.
 * Safe to call repeatedly; the heartbeat removal is best effort.
 */
void SharedDirectory::end() {
  {
    std::lock_guard<std::mutex> lock(stop_mu_);
    running_.store(false);
  }
  stop_cv_.notify_all();
  {
    // Pair with waiters that checked running_ under inbox_mu_.
    std::lock_guard<std::mutex> lock(inbox_mu_);
  }
  inbox_cv_.notify_all();
  space_cv_.notify_all();

  if (poll_thread_.joinable())    poll_thread_.join();
  if (cleanup_thread_.joinable()) cleanup_thread_.join();

  std::error_code ec;
  fs::remove(heartbeats_dir_ / (self_id_ + ".json"), ec);
}

bool SharedDirectory::wait_for_stop(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lock(stop_mu_);
  stop_cv_.wait_for(lock, d, [this] { return !running_.load(); });
  return running_.load();
}

// ---------------------------------------------------------------------------
// publish()
// ---------
// Write @p data to `<stem>.tmp` next to @p target, then rename over it.
// rename(2) within one directory is atomic, so readers see either the old
// file, the new file, or nothing. On failure the temp file is removed.
// ---------------------------------------------------------------------------
void SharedDirectory::publish(const fs::path& target, const std::string& data,
                              std::error_code& ec) const {
  fs::path tmp = target;
  tmp.replace_extension(".tmp");

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (out) {
      out.write(data.data(), static_cast<std::streamsize>(data.size()));
      out.close();
    }
    if (!out) {
      ec = std::make_error_code(std::errc::io_error);
      std::error_code ignored;
      fs::remove(tmp, ignored);
      return;
    }
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
  }
}

TxResult SharedDirectory::send(const Message& msg) {
  uint64_t seq;
  {
    std::lock_guard<std::mutex> lock(seq_mu_);
    seq = seq_++;
  }
  const fs::path target = messages_dir_ / message_file_name(msg, seq);

  std::error_code ec;
  publish(target, codec::encode_string(msg), ec);
  if (ec) {
    AGENTMSG_LOG_WARN("shared dir send failed", {str_field("file", target.filename().string()),
                                                 str_field("error", ec.message())});
    return TxResult::Error;
  }
  return TxResult::Ok;
}

TxResult SharedDirectory::send_heartbeat(const Message& msg) {
  std::error_code ec;
  publish(heartbeats_dir_ / (msg.uuid() + ".json"), codec::encode_string(msg), ec);
  if (ec) {
    AGENTMSG_LOG_DEBUG("shared dir heartbeat write failed", {str_field("error", ec.message())});
    return TxResult::Error;
  }
  return TxResult::Ok;
}

/*
 * peers()
 * -------
 * Liveness straight from heartbeats/. A participant that crashed keeps its
 * file, so the issuer timestamp inside it (not the mtime) decides freshness.
 */
std::optional<PeerMap> SharedDirectory::peers(double now) const {
  PeerMap out;
  const double window_s = std::chrono::duration<double>(cfg_.message_ttl).count();

  std::error_code ec;
  for (const auto& p : list_json(heartbeats_dir_, ec)) {
    std::string data;
    if (!read_file(p, data)) continue;
    auto msg = codec::try_decode(data);
    if (!msg || msg->uuid() == self_id_) continue;
    if (now - msg->timestamp() < window_s) out[msg->uuid()] = msg->timestamp();
  }
  if (ec) {
    AGENTMSG_LOG_DEBUG("shared dir heartbeat listing failed", {str_field("error", ec.message())});
  }
  return out;
}

bool SharedDirectory::claim(const std::string& file_name, double now) {
  std::lock_guard<std::mutex> lock(seen_mu_);
  return seen_.emplace(file_name, now).second;
}

// `<self>_<digits>_<digits>.json` exactly; "a" must not own "a_b_1_0.json".
bool SharedDirectory::is_own_file(const std::string& file_name) const {
  static const std::string ext = ".json";
  if (!has_prefix(file_name, own_prefix_)) return false;
  if (file_name.size() < own_prefix_.size() + ext.size() ||
      file_name.compare(file_name.size() - ext.size(), ext.size(), ext) != 0) {
    return false;
  }
  const std::size_t lo  = own_prefix_.size();
  const std::size_t hi  = file_name.size() - ext.size();
  const std::size_t sep = file_name.find('_', lo);
  if (sep == std::string::npos || sep >= hi) return false;
  return all_digits(file_name, lo, sep) && all_digits(file_name, sep + 1, hi);
}

void SharedDirectory::unclaim(const std::string& file_name) {
  std::lock_guard<std::mutex> lock(seen_mu_);
  seen_.erase(file_name);
}

std::size_t SharedDirectory::seen_count() const {
  std::lock_guard<std::mutex> lock(seen_mu_);
  return seen_.size();
}

// Blocks while the inbox holds inbox_cap entries. False only when end() is
// called before space frees up; the message is not queued then.
bool SharedDirectory::enqueue(Message msg) {
  {
    std::unique_lock<std::mutex> lock(inbox_mu_);
    space_cv_.wait(lock, [this] { return inbox_.size() < cfg_.inbox_cap || !running_.load(); });
    if (inbox_.size() >= cfg_.inbox_cap) return false;
    inbox_.push_back(std::move(msg));
  }
  inbox_cv_.notify_one();
  return true;
}

// ---------------------------------------------------------------------------
// poll_once()
// -----------
// POLICY:
//   - claim before reading, so two concurrent passes never both deliver a file
//   - own files are claimed and skipped
//   - a file that cannot be read or decoded stays claimed (no retry)
//   - a full inbox blocks the pass; nothing claimed is ever dropped. If end()
//     interrupts the wait, the pending file is unclaimed and the pass stops.
// ---------------------------------------------------------------------------
void SharedDirectory::poll_once() {
  std::error_code ec;
  const auto files = list_json(messages_dir_, ec);
  if (ec) {
    AGENTMSG_LOG_WARN("shared dir listing failed", {str_field("dir", messages_dir_.string()),
                                                    str_field("error", ec.message())});
    return;
  }

  const double now = now_seconds();
  for (const auto& p : files) {
    const std::string file_name = p.filename().string();
    if (!claim(file_name, now)) continue;
    if (is_own_file(file_name)) continue;

    std::string data;
    if (!read_file(p, data)) {
      AGENTMSG_LOG_WARN("shared dir read failed", {str_field("file", file_name)});
      continue;
    }
    auto msg = codec::try_decode(data);
    if (!msg) {
      AGENTMSG_LOG_WARN("dropping malformed message file", {str_field("file", file_name)});
      continue;
    }
    if (!enqueue(std::move(*msg))) {
      unclaim(file_name);
      return;
    }
  }
}

// ---------------------------------------------------------------------------
// cleanup_once()
// --------------
// Age is measured on the filesystem clock against the file's mtime, so a
// skewed issuer timestamp cannot keep a file alive. Per-file errors are
// skipped; the next pass tries again.
// ---------------------------------------------------------------------------
void SharedDirectory::cleanup_once() {
  std::error_code ec;
  const auto files = list_json(messages_dir_, ec);
  const auto fs_now = fs::file_time_type::clock::now();

  std::size_t removed = 0;
  for (const auto& p : files) {
    if (!is_own_file(p.filename().string())) continue;
    std::error_code fec;
    const auto mtime = fs::last_write_time(p, fec);
    if (fec) continue;
    if (fs_now - mtime > cfg_.message_ttl && fs::remove(p, fec)) ++removed;
  }

  const double horizon_s = 2.0 * std::chrono::duration<double>(cfg_.message_ttl).count();
  const double now = now_seconds();
  std::size_t pruned = 0;
  {
    std::lock_guard<std::mutex> lock(seen_mu_);
    for (auto it = seen_.begin(); it != seen_.end();) {
      if (now - it->second > horizon_s) {
        it = seen_.erase(it);
        ++pruned;
      } else {
        ++it;
      }
    }
  }

  if (removed || pruned) {
    AGENTMSG_LOG_DEBUG("shared dir cleanup", {int_field("removed", static_cast<int64_t>(removed)),
                                              int_field("pruned", static_cast<int64_t>(pruned))});
  }
}

RxResult SharedDirectory::recv(std::optional<Message>& out, std::chrono::milliseconds timeout) {
  out.reset();
  std::unique_lock<std::mutex> lock(inbox_mu_);
  inbox_cv_.wait_for(lock, timeout, [this] { return !inbox_.empty() || !running_.load(); });
  if (!inbox_.empty()) {
    out.emplace(std::move(inbox_.front()));
    inbox_.pop_front();
    lock.unlock();
    space_cv_.notify_one();
    return RxResult::Ok;
  }
  return running_.load() ? RxResult::None : RxResult::Error;
}

void SharedDirectory::poll_loop() {
  while (wait_for_stop(cfg_.poll_interval)) {
    poll_once();
  }
}

void SharedDirectory::cleanup_loop() {
  while (wait_for_stop(cfg_.cleanup_interval)) {
    cleanup_once();
  }
}

} // namespace agentmsg::transport
