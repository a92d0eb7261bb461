#include "auton/orchestrator.hpp"

#include <iostream>

#include "auton/observability.hpp"

namespace auton {

// ---------------------------------------------------------------------------
// SessionRunner
// ---------------------------------------------------------------------------

SessionRunner::SessionRunner(std::string session_id, std::string user_id, std::string project_id,
                             SessionDeps deps, SessionSettings settings,
                             std::size_t park_buffer_messages)
    : id_(session_id), park_buffer_limit_(park_buffer_messages) {
  machine_ = std::make_unique<SessionMachine>(
      std::move(session_id), std::move(user_id), std::move(project_id), deps, std::move(settings),
      [this](const ProtocolMessage& msg) { deliver(msg); });
}

SessionRunner::~SessionRunner() {
  inbox_.close();
  join();
}

void SessionRunner::start() { thread_ = std::thread([this] { run(); }); }

void SessionRunner::join() {
  if (thread_.joinable()) thread_.join();
}

bool SessionRunner::post(ProtocolMessage msg) { return inbox_.push(std::move(msg)); }

bool SessionRunner::post_abort(ErrorCode reason) {
  if (reason == ErrorCode::grace_expired) {
    if (abort_posted_.exchange(true)) return false;
  } else {
    ending_posted_.store(true, std::memory_order_release);
  }
  machine_->interrupt();
  return inbox_.push(AbortRequest{reason});
}

bool SessionRunner::post_cancel(ProtocolMessage msg) {
  if (finished()) return false;
  ending_posted_.store(true, std::memory_order_release);
  machine_->interrupt();
  SessionEvent ack;
  ack.kind = "cancel_acknowledged";
  ack.phase = to_string(phase());
  ack.trigger = "session";
  ack.reason = "cancelling";
  deliver(make_message(id_, ack));
  return inbox_.push(AcknowledgedCancel{std::move(msg)});
}

void SessionRunner::apply(Inbound item) {
  if (auto* msg = std::get_if<ProtocolMessage>(&item)) {
    machine_->handle(*msg);
  } else if (auto* cancel = std::get_if<AcknowledgedCancel>(&item)) {
    machine_->handle_acknowledged_cancel(cancel->msg);
  } else {
    const ErrorCode reason = std::get<AbortRequest>(item).reason;
    // A reattach may land between the reaper's parked() check and this.
    if (reason == ErrorCode::grace_expired && attached()) {
      std::cerr << "[orchestrator] " << id_ << ": reattached before grace expiry, resuming\n";
      abort_posted_.store(false, std::memory_order_release);
      if (!ending_posted_.load(std::memory_order_acquire)) {
        machine_->resume_after_interrupt();
      }
      return;
    }
    machine_->abort(reason);
  }
}

void SessionRunner::run() {
  machine_->start();
  phase_.store(static_cast<int>(machine_->phase()), std::memory_order_release);
  while (!machine_->terminal()) {
    if (machine_->command_in_flight()) {
      while (auto item = inbox_.try_pop()) apply(std::move(*item));
      if (!machine_->terminal()) machine_->pump(std::chrono::milliseconds(20));
    } else {
      auto item = inbox_.pop_for(std::chrono::milliseconds(50));
      if (item) {
        apply(std::move(*item));
      } else if (inbox_.exhausted()) {
        machine_->abort(ErrorCode::executor_shutdown);
      }
    }
    machine_->tick(now_unix_ms());
    phase_.store(static_cast<int>(machine_->phase()), std::memory_order_release);
  }
  inbox_.close();
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (out_) out_->close();
  }
  finished_.store(true, std::memory_order_release);
}

void SessionRunner::deliver(const ProtocolMessage& msg) {
  std::string frame = encode(msg);
  std::lock_guard<std::mutex> lk(mu_);
  if (out_) {
    if (out_->write_all(frame)) return;
    std::cerr << "[orchestrator] " << id_ << ": write to " << out_->peer()
              << " failed, parking\n";
    out_ = nullptr;
    parked_since_ms_ = now_unix_ms();
  }
  parked_frames_.push_back(std::move(frame));
  while (parked_frames_.size() > park_buffer_limit_) {
    parked_frames_.pop_front();
    ++dropped_;
  }
}

bool SessionRunner::attach(Transport* transport, std::string* error) {
  std::lock_guard<std::mutex> lk(mu_);
  if (out_) {
    if (error) *error = "session " + id_ + " is attached to another connection";
    return false;
  }
  const bool resumed = ever_attached_;
  SessionEvent ev;
  ev.kind = "attached";
  ev.phase = to_string(phase());
  ev.trigger = resumed ? "resume" : "new";
  ev.reason = std::to_string(parked_frames_.size()) + " buffered";
  if (!transport->write_all(encode(make_message(id_, ev)))) {
    if (error) *error = "write failed";
    return false;
  }
  if (dropped_ > 0) {
    SessionEvent notice;
    notice.kind = "notice";
    notice.phase = ev.phase;
    notice.trigger = "park_buffer";
    notice.reason = "dropped " + std::to_string(dropped_) + " buffered messages";
    transport->write_all(encode(make_message(id_, notice)));
    dropped_ = 0;
  }
  while (!parked_frames_.empty()) {
    if (!transport->write_all(parked_frames_.front())) {
      if (error) *error = "write failed while flushing";
      return false;
    }
    parked_frames_.pop_front();
  }
  out_ = transport;
  ever_attached_ = true;
  parked_since_ms_ = 0;
  if (resumed) global_executor_stats().sessions_resumed.fetch_add(1, std::memory_order_relaxed);
  return true;
}

void SessionRunner::detach(Transport* transport) {
  std::lock_guard<std::mutex> lk(mu_);
  if (out_ != transport) return;
  out_ = nullptr;
  parked_since_ms_ = now_unix_ms();
  if (!finished()) global_executor_stats().sessions_parked.fetch_add(1, std::memory_order_relaxed);
}

bool SessionRunner::attached() const {
  std::lock_guard<std::mutex> lk(mu_);
  return out_ != nullptr;
}

bool SessionRunner::parked() const {
  std::lock_guard<std::mutex> lk(mu_);
  return out_ == nullptr && !finished();
}

std::uint64_t SessionRunner::parked_since_ms() const {
  std::lock_guard<std::mutex> lk(mu_);
  return parked_since_ms_;
}

// ---------------------------------------------------------------------------
// ExecutorOrchestrator
// ---------------------------------------------------------------------------

ExecutorOrchestrator::ExecutorOrchestrator(OrchestratorDeps deps, ServerConfig server,
                                           SessionSettings settings, ArchiveConfig archive)
    : deps_(deps),
      server_(std::move(server)),
      settings_(std::move(settings)),
      archive_(std::move(archive)) {
  reaper_ = std::thread([this] { reaper_loop(); });
}

ExecutorOrchestrator::~ExecutorOrchestrator() { shutdown(); }

void ExecutorOrchestrator::reaper_loop() {
  std::unique_lock<std::mutex> lk(reaper_mu_);
  while (!stopping_) {
    reaper_cv_.wait_for(lk, std::chrono::milliseconds(server_.reap_interval_ms));
    if (stopping_) break;
    lk.unlock();
    reap(now_unix_ms());
    lk.lock();
  }
}

void ExecutorOrchestrator::send_error(Transport& transport, const std::string& session_id,
                                      const std::string& code, const std::string& detail,
                                      bool fatal, const std::string& ref_id) {
  ErrorMessage err;
  err.code = code;
  err.detail = detail;
  err.fatal = fatal;
  err.ref_id = ref_id;
  transport.write_all(encode(make_message(session_id, err)));
}

std::shared_ptr<SessionRunner> ExecutorOrchestrator::open_session(const Attach& attach,
                                                                  Transport& transport,
                                                                  std::string* error) {
  if (!attach.resume_session.empty()) {
    auto runner = find(attach.resume_session);
    if (!runner || runner->finished()) {
      if (error) *error = "unknown session " + attach.resume_session;
      return nullptr;
    }
    if (!runner->attach(&transport, error)) return nullptr;
    return runner;
  }

  std::shared_ptr<SessionRunner> runner;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (sessions_.size() >= server_.max_sessions) {
      if (error) *error = to_string(ErrorCode::resource_exhausted) + ": session limit reached";
      return nullptr;
    }
    SessionDeps deps;
    deps.sandbox = deps_.sandbox;
    deps.store = deps_.store;
    deps.planner = deps_.planner;
    deps.research = deps_.research;
    runner = std::make_shared<SessionRunner>(new_id("sess"), attach.user_id, attach.project_id,
                                             deps, settings_, server_.park_buffer_messages);
    sessions_[runner->id()] = runner;
  }
  if (!runner->attach(&transport, error)) {
    std::lock_guard<std::mutex> lk(mu_);
    sessions_.erase(runner->id());
    return nullptr;
  }
  runner->start();
  return runner;
}

void ExecutorOrchestrator::serve_connection(Transport& transport) {
  {
    std::lock_guard<std::mutex> lk(reaper_mu_);
    if (stopping_) return;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    connections_.insert(&transport);
  }
  FrameDecoder decoder(server_.max_frame_bytes);
  std::shared_ptr<SessionRunner> runner;
  std::vector<char> buf(64 * 1024);
  bool done = false;

  while (!done) {
    const long n = transport.read_some(buf.data(), buf.size());
    if (n <= 0) break;
    for (auto& item : decoder.feed(std::string_view(buf.data(), static_cast<std::size_t>(n)))) {
      const std::string sid = runner ? runner->id() : std::string{};
      if (item.error) {
        const ProtocolError& e = *item.error;
        global_executor_stats().record_protocol_error(e.fatal);
        ObservedEvent oe;
        oe.category = "protocol";
        oe.name = e.code;
        oe.session_id = sid;
        oe.fields = {{"detail", e.detail},
                     {"fatal", e.fatal ? "true" : "false"},
                     {"frame", std::to_string(e.frame_index)}};
        oe.unix_ms = now_unix_ms();
        emit_event(oe);
        send_error(transport, sid, e.code, e.detail, e.fatal, e.message_id);
        if (e.fatal) {
          done = true;
          break;
        }
        continue;
      }
      ProtocolMessage& msg = *item.message;
      if (const auto* a = std::get_if<Attach>(&msg.body)) {
        if (runner) {
          send_error(transport, sid, "invalid_field", "connection already attached", false, msg.id);
          continue;
        }
        std::string err;
        runner = open_session(*a, transport, &err);
        if (!runner) send_error(transport, "", to_string(ErrorCode::protocol_error), err, false, msg.id);
        continue;
      }
      if (!runner) {
        send_error(transport, "", to_string(ErrorCode::protocol_error),
                   "first frame must be attach", false, msg.id);
        continue;
      }
      if (!msg.session_id.empty() && msg.session_id != runner->id()) {
        send_error(transport, sid, "invalid_field", "session mismatch", false, msg.id);
        continue;
      }
      const auto* cancel = std::get_if<Cancel>(&msg.body);
      const bool posted = cancel && cancel->target.empty() ? runner->post_cancel(std::move(msg))
                                                           : runner->post(std::move(msg));
      if (!posted) {
        send_error(transport, sid, to_string(ErrorCode::sandbox_terminated), "session has ended",
                   false, "");
      }
    }
    if (decoder.broken()) break;
  }

  if (runner) runner->detach(&transport);
  transport.close();
  std::lock_guard<std::mutex> lk(mu_);
  connections_.erase(&transport);
}

void ExecutorOrchestrator::serve(Listener& listener) {
  std::vector<std::thread> readers;
  while (true) {
    std::string err;
    std::unique_ptr<Transport> conn = listener.accept(&err);
    if (!conn) {
      if (!err.empty()) std::cerr << "[serve] " << err << "\n";
      break;
    }
    std::shared_ptr<Transport> shared(std::move(conn));
    readers.emplace_back([this, shared] { serve_connection(*shared); });
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (Transport* t : connections_) t->close();
  }
  for (auto& t : readers) t.join();
}

void ExecutorOrchestrator::archive_runner(SessionRunner& runner) {
  runner.join();
  if (archive_.dir.empty()) return;
  std::string err;
  auto path = write_archive(archive_, archive_of(runner.session()), &err);
  if (!path) {
    std::cerr << "[orchestrator] archive " << runner.id() << ": " << err << "\n";
    return;
  }
  std::lock_guard<std::mutex> lk(mu_);
  archived_.push_back(*path);
}

void ExecutorOrchestrator::reap(std::uint64_t now_ms) {
  std::vector<std::shared_ptr<SessionRunner>> finished;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      const auto& runner = it->second;
      if (runner->finished()) {
        finished.push_back(runner);
        it = sessions_.erase(it);
        continue;
      }
      const std::uint64_t since = runner->parked_since_ms();
      if (runner->parked() && since > 0 && now_ms >= since + server_.grace_ms) {
        if (runner->post_abort(ErrorCode::grace_expired)) {
          std::cerr << "[orchestrator] " << runner->id() << ": grace period expired\n";
        }
      }
      ++it;
    }
  }
  for (auto& runner : finished) archive_runner(*runner);
}

void ExecutorOrchestrator::shutdown() {
  {
    std::lock_guard<std::mutex> lk(reaper_mu_);
    if (stopping_ && !reaper_.joinable()) return;
    stopping_ = true;
  }
  reaper_cv_.notify_all();
  if (reaper_.joinable()) reaper_.join();

  std::map<std::string, std::shared_ptr<SessionRunner>> sessions;
  {
    std::lock_guard<std::mutex> lk(mu_);
    sessions.swap(sessions_);
    for (Transport* t : connections_) t->close();
  }
  for (auto& [id, runner] : sessions) runner->post_abort(ErrorCode::executor_shutdown);
  for (auto& [id, runner] : sessions) archive_runner(*runner);
}

std::vector<std::string> ExecutorOrchestrator::session_ids() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  for (const auto& [id, r] : sessions_) out.push_back(id);
  return out;
}

std::shared_ptr<SessionRunner> ExecutorOrchestrator::find(const std::string& session_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : it->second;
}

std::vector<std::string> ExecutorOrchestrator::archived_paths() const {
  std::lock_guard<std::mutex> lk(mu_);
  return archived_;
}

}  // namespace auton
