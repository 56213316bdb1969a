// -----------------------------------------------------------------------------
// messenger.cpp — Implementation of the agentmsg Messenger
//
// API & lifecycle contract:
//   see include/agentmsg/messenger.hpp
//
// Runnable examples & usage tests:
//   see tests/test_messenger.cpp and cli/main.cpp
//
// NOTE: Everything the workers touch lives in Runtime, owned through a
// shared_ptr that each worker also holds. stop() may therefore give up on a
// slow worker (detach) without leaving it pointing at freed memory.
// Each start() also gets its own Run token. A detached worker only ever sees
// its own token, and the last worker of a run that outlived stop() is the one
// that closes the transport.
// -----------------------------------------------------------------------------
#include "agentmsg/messenger.hpp"

#include "agentmsg/errors.hpp"
#include "agentmsg/logging.hpp"
#include "agentmsg/message.hpp"
#include "agentmsg/transport/transport_shared_dir.hpp"
#include "agentmsg/transport/transport_udp_multicast.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <utility>
#include <vector>

namespace agentmsg {

using transport::ITransport;
using transport::RxResult;
using transport::TxResult;

const char* state_to_string(MessengerState s) {
  switch (s) {
    case MessengerState::Stopped:  return "stopped";
    case MessengerState::Starting: return "starting";
    case MessengerState::Running:  return "running";
    case MessengerState::Stopping: return "stopping";
  }
  return "unknown";
}

// ---------- runtime state shared with the workers ----------

struct Messenger::Runtime {
  Runtime(std::string id_, MessengerConfig cfg_, std::shared_ptr<ITransport> transport_)
  : id(std::move(id_)), cfg(std::move(cfg_)), transport(std::move(transport_)), registry(id) {}

  const std::string                 id;
  const MessengerConfig             cfg;
  const std::shared_ptr<ITransport> transport;
  PeerRegistry                      registry;

  std::mutex                  handlers_mu;
  std::vector<MessageHandler> handlers;

  double peer_timeout_s() const {
    return std::chrono::duration<double>(cfg.peer_timeout).count();
  }

  void beat();
  void handle(const Message& msg);
  void deliver(const Message& msg);
  void receive_loop(Run& run);
  void heartbeat_loop(Run& run);
};

// ---------- per-start run token ----------

struct Messenger::Run {
  static constexpr int kWorkers = 2;   // receive + heartbeat

  std::atomic<bool>       running{true};
  std::mutex              mu;
  std::condition_variable cv;
  int                     live_workers{kWorkers};
  bool                    close_on_exit{false};

  // Sleep up to @p d unless stop is signalled. True while still running.
  bool wait_running(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(mu);
    cv.wait_for(lock, d, [this] { return !running.load(); });
    return running.load();
  }

  void signal_stop() {
    {
      std::lock_guard<std::mutex> lock(mu);
      running.store(false);
    }
    cv.notify_all();
  }

  // Called by each worker on its way out. True for the last one when stop()
  // already gave up on this run; that worker then owns transport->end().
  bool worker_exit() {
    std::lock_guard<std::mutex> lock(mu);
    return --live_workers == 0 && close_on_exit;
  }

  // Called by stop() after joining. True when every worker is gone and the
  // caller must close the transport; otherwise the last worker will.
  bool hand_off_close() {
    std::lock_guard<std::mutex> lock(mu);
    if (live_workers == 0) return true;
    close_on_exit = true;
    return false;
  }
};

// beat() — one heartbeat plus registry housekeeping. Failures are transient.
void Messenger::Runtime::beat() {
  if (transport->send_heartbeat(make_heartbeat(id)) != TxResult::Ok) {
    AGENTMSG_LOG_DEBUG("heartbeat send failed", {str_field("transport", transport->name())});
  }
  registry.evict_older_than(now_seconds(), 2.0 * peer_timeout_s());
}

// -----------------------------------------------------------------------------
// handle() — apply one decoded inbound message.
// POLICY:
//   - self-authored traffic (multicast loopback) is dropped before anything else
//   - every other message refreshes the sender's liveness
//   - only Text reaches handlers
// -----------------------------------------------------------------------------
void Messenger::Runtime::handle(const Message& msg) {
  if (msg.uuid() == id) return;
  registry.observe(msg.uuid(), msg.timestamp());

  switch (msg.kind()) {
    case MessageKind::Heartbeat:
      return;
    case MessageKind::Text:
      deliver(msg);
      return;
  }
}

// deliver() — fan out to a snapshot of the handler list; each call is isolated.
void Messenger::Runtime::deliver(const Message& msg) {
  std::vector<MessageHandler> snapshot;
  {
    std::lock_guard<std::mutex> lock(handlers_mu);
    snapshot = handlers;
  }

  for (std::size_t i = 0; i < snapshot.size(); ++i) {
    try {
      snapshot[i](msg.uuid(), msg.payload());
    } catch (const std::exception& e) {
      AGENTMSG_LOG_ERROR("message handler threw", {int_field("handler", static_cast<int64_t>(i)),
                                                   str_field("error", e.what())});
    } catch (...) {
      AGENTMSG_LOG_ERROR("message handler threw", {int_field("handler", static_cast<int64_t>(i)),
                                                   str_field("error", "unknown exception")});
    }
  }
}

// -----------------------------------------------------------------------------
// receive_loop()
// PRE:   transport begun; running set.
// POLICY:
//   - None  -> poll cycle, re-check the run flag
//   - Error -> handle gone or failing; back off one receive timeout
//   - MalformedPayload -> log, drop, continue
// -----------------------------------------------------------------------------
void Messenger::Runtime::receive_loop(Run& run) {
  while (run.running.load()) {
    std::optional<Message> msg;
    RxResult r = RxResult::None;
    try {
      r = transport->recv(msg, cfg.receive_timeout);
    } catch (const MalformedPayload& e) {
      AGENTMSG_LOG_WARN("dropping malformed payload", {str_field("error", e.what())});
      continue;
    } catch (const std::exception& e) {
      AGENTMSG_LOG_ERROR("receive failed", {str_field("transport", transport->name()),
                                            str_field("error", e.what())});
      run.wait_running(cfg.receive_timeout);
      continue;
    }

    if (r == RxResult::Ok && msg) {
      handle(*msg);
    } else if (r == RxResult::Error && run.running.load()) {
      AGENTMSG_LOG_DEBUG("receive error", {str_field("transport", transport->name())});
      run.wait_running(cfg.receive_timeout);
    }
  }
}

void Messenger::Runtime::heartbeat_loop(Run& run) {
  while (run.wait_running(cfg.heartbeat_interval)) {
    beat();
  }
}

// ---------- construction ----------

namespace {

std::shared_ptr<ITransport> make_transport(const MessengerConfig& cfg, const std::string& id) {
  if (cfg.shared_dir && !cfg.shared_dir->empty()) {
    return std::make_shared<transport::SharedDirectory>(*cfg.shared_dir, id, cfg.shared);
  }
  return std::make_shared<transport::UdpMulticast>(cfg.udp);
}

std::string resolve_identity(const MessengerConfig& cfg) {
  if (cfg.identity && !cfg.identity->empty()) return *cfg.identity;
  return generate_uuid();
}

} // namespace

Messenger::Messenger(MessengerConfig config) {
  std::string id = resolve_identity(config);
  auto tr = make_transport(config, id);
  rt_ = std::make_shared<Runtime>(std::move(id), std::move(config), std::move(tr));
}

Messenger::Messenger(MessengerConfig config, std::shared_ptr<ITransport> transport) {
  if (!transport) throw SetupFailure("messenger: null transport");
  std::string id = resolve_identity(config);
  rt_ = std::make_shared<Runtime>(std::move(id), std::move(config), std::move(transport));
}

Messenger::~Messenger() {
  stop();
}

// ---------- lifecycle ----------

// -----------------------------------------------------------------------------
// start()
// PRE:   Stopped. Workers detached by an earlier stop() get one more
//        join_timeout to finish; if they are still busy the restart is refused,
//        so two receive loops never share the transport.
// -----------------------------------------------------------------------------
void Messenger::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  if (state_.load() != MessengerState::Stopped) return;
  state_.store(MessengerState::Starting);

  if (!reap(recv_done_) || !reap(heartbeat_done_)) {
    state_.store(MessengerState::Stopped);
    throw SetupFailure("messenger: workers from the previous run are still busy");
  }

  try {
    rt_->transport->begin();
  } catch (...) {
    state_.store(MessengerState::Stopped);
    throw;
  }

  run_ = std::make_shared<Run>();

  std::promise<void> recv_promise;
  std::promise<void> hb_promise;
  recv_done_      = recv_promise.get_future();
  heartbeat_done_ = hb_promise.get_future();

  std::shared_ptr<Runtime> rt = rt_;
  std::shared_ptr<Run> run = run_;
  recv_thread_ = std::thread([rt, run, p = std::move(recv_promise)]() mutable {
    rt->receive_loop(*run);
    if (run->worker_exit()) rt->transport->end();
    p.set_value();
  });
  heartbeat_thread_ = std::thread([rt, run, p = std::move(hb_promise)]() mutable {
    rt->heartbeat_loop(*run);
    if (run->worker_exit()) rt->transport->end();
    p.set_value();
  });

  rt_->beat();   // announce now rather than one interval from now
  state_.store(MessengerState::Running);

  AGENTMSG_LOG_INFO("messenger started", {str_field("uuid", rt_->id),
                                          str_field("transport", rt_->transport->name())});
}

void Messenger::join_bounded(std::thread& worker, std::future<void>& done, const char* what) {
  if (!worker.joinable()) return;
  if (done.valid() && done.wait_for(rt_->cfg.join_timeout) == std::future_status::ready) {
    worker.join();
    done.get();
    return;
  }
  // done stays valid so the next start() can tell when this worker is gone.
  AGENTMSG_LOG_WARN("worker did not stop in time, detaching",
                    {str_field("worker", what),
                     int_field("join_timeout_ms", rt_->cfg.join_timeout.count())});
  worker.detach();
}

// Wait out a worker detached by stop(). False if it is still running.
bool Messenger::reap(std::future<void>& done) {
  if (!done.valid()) return true;
  if (done.wait_for(rt_->cfg.join_timeout) != std::future_status::ready) return false;
  done.get();
  return true;
}

void Messenger::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  if (state_.load() != MessengerState::Running) return;
  state_.store(MessengerState::Stopping);

  run_->signal_stop();
  join_bounded(recv_thread_, recv_done_, "receive");
  join_bounded(heartbeat_thread_, heartbeat_done_, "heartbeat");

  if (run_->hand_off_close()) {
    rt_->transport->end();
  } else {
    AGENTMSG_LOG_WARN("transport close deferred to the detached worker", {str_field("uuid", rt_->id)});
  }
  run_.reset();
  state_.store(MessengerState::Stopped);

  AGENTMSG_LOG_INFO("messenger stopped", {str_field("uuid", rt_->id)});
}

// ---------- messaging ----------

void Messenger::send(const std::string& text) {
  if (!running()) {
    throw NotStarted("messenger not started: call start() before send()");
  }
  if (rt_->transport->send(make_text(rt_->id, text)) != TxResult::Ok) {
    throw SendFailure(std::string("send failed on ") + rt_->transport->name());
  }
}

void Messenger::on_message(MessageHandler handler) {
  std::lock_guard<std::mutex> lock(rt_->handlers_mu);
  rt_->handlers.push_back(std::move(handler));
}

void Messenger::add_handler(MessageHandler handler) {
  on_message(std::move(handler));
}

// -----------------------------------------------------------------------------
// get_peers() — registry view, merged with the transport's own liveness view
// when it has one (shared-directory heartbeat files). Later timestamp wins.
// -----------------------------------------------------------------------------
PeerMap Messenger::get_peers() const {
  const double now = now_seconds();
  PeerMap out = rt_->registry.active_peers(now, rt_->peer_timeout_s());

  if (auto extra = rt_->transport->peers(now)) {
    for (const auto& [id, ts] : *extra) {
      if (id == rt_->id) continue;
      auto it = out.find(id);
      if (it == out.end()) out.emplace(id, ts);
      else it->second = std::max(it->second, ts);
    }
  }
  return out;
}

std::size_t Messenger::get_active_peer_count() const {
  return get_peers().size();
}

const std::string& Messenger::uuid() const {
  return rt_->id;
}

const char* Messenger::transport_name() const {
  return rt_->transport->name();
}

} // namespace agentmsg
