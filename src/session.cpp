#include "auton/session.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <utility>

#include "auton/hash.hpp"
#include "auton/jsonlite.hpp"
#include "auton/observability.hpp"
#include "auton/version.hpp"

namespace auton {

namespace {

using jsonlite::Object;

Object event_body(const SessionEventRecord& r) {
  Object o;
  o["v"] = static_cast<std::uint64_t>(version::EVENT_LOG_VERSION);
  o["seq"] = r.seq;
  o["from"] = r.from_phase;
  o["to"] = r.to_phase;
  o["trigger"] = r.trigger;
  o["reason"] = r.reason;
  o["unix_ms"] = r.unix_ms;
  o["prev"] = r.prev_digest;
  return o;
}

std::string join_argv(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& a : argv) {
    if (!out.empty()) out += ' ';
    out += a;
  }
  return out;
}

std::string format_confidence(double c) { return jsonlite::format_double(c); }

bool cancels_session(ErrorCode reason) {
  return reason == ErrorCode::user_cancelled || reason == ErrorCode::grace_expired ||
         reason == ErrorCode::executor_shutdown;
}

}  // namespace

// ---------------------------------------------------------------------------
// Event log
// ---------------------------------------------------------------------------

std::string event_record_digest(const SessionEventRecord& r) {
  return chain_digest("event:", r.prev_digest, jsonlite::to_json(event_body(r)));
}

std::string event_record_to_json(const SessionEventRecord& r) {
  Object o = event_body(r);
  o["digest"] = r.digest;
  return jsonlite::to_json(o);
}

std::optional<SessionEventRecord> event_record_from_json(const std::string& text,
                                                         std::string* error) {
  std::optional<jsonlite::JsonError> jerr;
  Object o = jsonlite::parse(text, &jerr);
  if (jerr) {
    if (error) *error = jerr->message;
    return std::nullopt;
  }
  if (jsonlite::get_u64(o, "v", 0) > version::EVENT_LOG_VERSION) {
    if (error) *error = "unsupported event log version";
    return std::nullopt;
  }
  SessionEventRecord r;
  r.seq = jsonlite::get_u64(o, "seq", 0);
  r.from_phase = jsonlite::get_string(o, "from", "");
  r.to_phase = jsonlite::get_string(o, "to", "");
  r.trigger = jsonlite::get_string(o, "trigger", "");
  r.reason = jsonlite::get_string(o, "reason", "");
  r.unix_ms = jsonlite::get_u64(o, "unix_ms", 0);
  r.prev_digest = jsonlite::get_string(o, "prev", "");
  r.digest = jsonlite::get_string(o, "digest", "");
  return r;
}

bool verify_event_chain(const std::vector<SessionEventRecord>& records, std::string* error) {
  std::string prev;
  std::uint64_t expected = 1;
  for (const auto& r : records) {
    if (r.seq != expected) {
      if (error) *error = "event seq " + std::to_string(r.seq) + " out of order";
      return false;
    }
    if (r.prev_digest != prev) {
      if (error) *error = "broken prev link at event " + std::to_string(r.seq);
      return false;
    }
    if (r.digest != event_record_digest(r)) {
      if (error) *error = "digest mismatch at event " + std::to_string(r.seq);
      return false;
    }
    prev = r.digest;
    ++expected;
  }
  return true;
}

// ---------------------------------------------------------------------------
// SessionMachine
// ---------------------------------------------------------------------------

SessionMachine::SessionMachine(std::string session_id, std::string user_id,
                               std::string project_id, SessionDeps deps,
                               SessionSettings settings, MessageSink sink)
    : session_id_(std::move(session_id)),
      user_id_(std::move(user_id)),
      project_id_(std::move(project_id)),
      deps_(deps),
      settings_(std::move(settings)),
      sink_(std::move(sink)) {}

SessionMachine::~SessionMachine() {
  if (sandbox_ && deps_.sandbox) deps_.sandbox->teardown(*sandbox_);
}

void SessionMachine::send(MessageBody body) {
  ProtocolMessage msg = make_message(session_id_, std::move(body));
  transcript_.push_back(msg);
  if (sink_) sink_(msg);
}

void SessionMachine::say(const std::string& text, const std::string& topic) {
  if (!text.empty()) dialogue_.push_back({"assistant", text});
  const std::size_t chunk = settings_.assistant_chunk_chars == 0 ? text.size() + 1
                                                                 : settings_.assistant_chunk_chars;
  std::size_t pos = 0;
  bool first = true;
  do {
    std::size_t len = std::min(chunk, text.size() - pos);
    // Keep UTF-8 sequences whole.
    while (len > 0 && pos + len < text.size() &&
           (static_cast<unsigned char>(text[pos + len]) & 0xC0) == 0x80) {
      --len;
    }
    if (len == 0 && pos < text.size()) len = std::min(chunk, text.size() - pos);
    AssistantOutput out;
    out.text = text.substr(pos, len);
    out.topic = topic;
    out.first = first;
    pos += len;
    out.last = pos >= text.size();
    first = false;
    send(std::move(out));
  } while (pos < text.size());
}

void SessionMachine::append_event(const std::string& from, SessionPhase to,
                                  const std::string& trigger, const std::string& reason) {
  SessionEventRecord rec;
  rec.seq = events_.size() + 1;
  rec.from_phase = from;
  rec.to_phase = to_string(to);
  rec.trigger = trigger;
  rec.reason = reason;
  rec.unix_ms = now_unix_ms();
  rec.prev_digest = events_.empty() ? std::string{} : events_.back().digest;
  rec.digest = event_record_digest(rec);
  events_.push_back(rec);

  SessionEvent ev;
  ev.kind = "transition";
  ev.phase = rec.to_phase;
  ev.from_phase = from;
  ev.trigger = trigger;
  ev.reason = reason;
  ev.seq = rec.seq;
  send(std::move(ev));

  ObservedEvent oe;
  oe.category = "session";
  oe.name = "transition";
  oe.session_id = session_id_;
  oe.fields = {{"from", from}, {"to", rec.to_phase}, {"trigger", trigger}, {"reason", reason}};
  oe.unix_ms = rec.unix_ms;
  emit_event(oe);
}

void SessionMachine::open_log() {
  if (started_) return;
  started_ = true;
  global_executor_stats().record_session_started();
  append_event("", SessionPhase::intake, "attach", "");
}

bool SessionMachine::transition(SessionPhase to, const std::string& trigger,
                                const std::string& reason) {
  if (!is_legal_transition(phase_, to)) {
    std::cerr << "[session] " << session_id_ << ": illegal transition " << to_string(phase_)
              << " -> " << to_string(to) << "\n";
    return false;
  }
  const SessionPhase from = phase_;
  phase_ = to;
  append_event(to_string(from), to, trigger, reason);
  return true;
}

void SessionMachine::fail(ErrorCode code, const std::string& detail) {
  if (terminal()) return;
  ErrorMessage err;
  err.code = to_string(code);
  err.detail = detail;
  err.fatal = true;
  send(std::move(err));
  finish_terminal(SessionPhase::failed, code, detail);
}

void SessionMachine::finish_terminal(SessionPhase target, ErrorCode reason,
                                     const std::string& detail) {
  if (terminal()) return;
  open_log();
  drain_active();
  while (!manual_queue_.empty()) {
    const Command c = manual_queue_.front();
    manual_queue_.pop_front();
    CommandResult res;
    res.correlation_id = c.correlation_id;
    res.command_id = c.command_id;
    res.status = CommandStatus::cancelled;
    res.error = to_string(ErrorCode::cancelled);
    send(std::move(res));
  }
  awaiting_approval_ = false;

  const std::string reason_code = reason == ErrorCode::none ? "" : to_string(reason);
  const std::string trigger = reason == ErrorCode::none ? "review_complete" : reason_code;
  terminal_reason_ = reason_code;
  transition(target, trigger, detail.empty() ? reason_code : reason_code + ": " + detail);

  if (sandbox_ && deps_.sandbox) deps_.sandbox->teardown(*sandbox_);

  SessionEvent ev;
  ev.kind = "terminal";
  ev.phase = to_string(target);
  ev.trigger = trigger;
  ev.reason = reason_code;
  ev.seq = events_.size();
  send(std::move(ev));
  global_executor_stats().record_session_finished(target);
}

PlanningContext SessionMachine::context() const {
  PlanningContext ctx;
  ctx.session_id = session_id_;
  ctx.project_id = project_id_;
  ctx.user_id = user_id_;
  ctx.phase = phase_;
  ctx.transcript = dialogue_;
  ctx.preferences = applied_;
  ctx.research_notes = research_notes_;
  ctx.current_plan = plan_;
  ctx.step_index = step_index_;
  ctx.replans = replans_;
  {
    std::lock_guard<std::mutex> lk(cancel_mu_);
    ctx.cancel = planner_cancel_;
  }
  return ctx;
}

void SessionMachine::interrupt() {
  std::lock_guard<std::mutex> lk(cancel_mu_);
  interrupted_.store(true, std::memory_order_release);
  planner_cancel_.cancel();
}

void SessionMachine::resume_after_interrupt() {
  if (terminal() || cancel_requested_) return;
  {
    std::lock_guard<std::mutex> lk(cancel_mu_);
    interrupted_.store(false, std::memory_order_release);
    planner_cancel_ = CancellationToken();
  }
  auto retry = std::exchange(interrupted_call_, nullptr);
  if (retry) retry();
}

std::function<bool()> SessionMachine::abort_check() const {
  return [this] { return interrupted_.load(std::memory_order_acquire); };
}

void SessionMachine::stage(const std::vector<PreferenceFact>& facts) {
  for (const auto& f : facts) {
    PreferenceFact staged = f;
    staged.source_session = session_id_;
    staged_.push_back(std::move(staged));
  }
}

void SessionMachine::start() {
  if (started_) return;
  open_log();

  std::string err;
  if (!deps_.store->register_project(project_id_, user_id_, &err)) {
    fail(ErrorCode::store_io, err);
    return;
  }
  auto snap = deps_.store->snapshot_for_project(project_id_, &err);
  if (!snap) {
    fail(ErrorCode::store_io, err);
    return;
  }
  for (const auto& [key, fact] : snap->facts) {
    if (fact.confidence >= settings_.auto_apply_confidence) applied_[key] = fact;
    else pending_[key] = fact;
  }

  ProvisionResult prov = deps_.sandbox->provision(project_id_, settings_.limits);
  if (!prov.ok()) {
    fail(ErrorCode::provision_failed, to_string(prov.error) + ": " + prov.detail);
    return;
  }
  sandbox_ = *prov.handle;

  SessionEvent ready;
  ready.kind = "sandbox_ready";
  ready.phase = to_string(phase_);
  ready.trigger = "provision";
  ready.reason = sandbox_->environment_id;
  send(std::move(ready));

  if (!applied_.empty()) {
    std::string text = "Applying your saved preferences:";
    for (const auto& [key, fact] : applied_) text += "\n  " + key + " = " + fact.value;
    say(text, "preferences");
  }
  if (!pending_.empty()) {
    std::string text = "Confirm any of these preferences to apply them:";
    for (const auto& [key, fact] : pending_) {
      text += "\n  " + key + " = " + fact.value + " (confidence " +
              format_confidence(fact.confidence) + ")";
    }
    say(text, "preferences");
  }
}

void SessionMachine::handle(const ProtocolMessage& msg) {
  transcript_.push_back(msg);
  if (const auto* in = std::get_if<UserInput>(&msg.body)) {
    on_user_input(msg, *in);
  } else if (const auto* req = std::get_if<CommandRequest>(&msg.body)) {
    on_command_request(msg, *req);
  } else if (const auto* c = std::get_if<Cancel>(&msg.body)) {
    on_cancel(*c, true);
  } else {
    ErrorMessage err;
    err.code = "invalid_field";
    err.detail = "unexpected " + to_string(msg.kind()) + " from front-end";
    err.ref_id = msg.id;
    send(std::move(err));
  }
  maybe_dispatch();
}

void SessionMachine::handle_acknowledged_cancel(const ProtocolMessage& msg) {
  const auto* c = std::get_if<Cancel>(&msg.body);
  if (!c || !c->target.empty()) {
    handle(msg);
    return;
  }
  transcript_.push_back(msg);
  on_cancel(*c, false);
}

void SessionMachine::on_user_input(const ProtocolMessage& msg, const UserInput& in) {
  if (terminal()) {
    ErrorMessage err;
    err.code = "invalid_field";
    err.detail = "session is " + to_string(phase_);
    err.ref_id = msg.id;
    send(std::move(err));
    return;
  }
  if (!in.text.empty()) dialogue_.push_back({"user", in.text});

  if (!in.confirm_preferences.empty()) {
    std::string confirmed;
    for (const auto& key : in.confirm_preferences) {
      auto it = pending_.find(key);
      if (it == pending_.end()) continue;
      applied_[key] = it->second;
      confirmed += "\n  " + key + " = " + it->second.value;
      pending_.erase(it);
    }
    if (!confirmed.empty()) say("Applied preferences:" + confirmed, "preferences");
  }

  switch (phase_) {
    case SessionPhase::intake:
      if (!in.text.empty()) run_converse();
      break;
    case SessionPhase::planning:
      if (!awaiting_approval_) break;
      if (in.approve) approve_plan("user_approval");
      else if (!in.text.empty()) request_plan("feedback", false);
      break;
    default:
      break;
  }
}

void SessionMachine::on_command_request(const ProtocolMessage& msg, const CommandRequest& req) {
  Command c;
  c.command_id = req.command_id.empty() ? new_id("cmd") : req.command_id;
  c.correlation_id = req.correlation_id.empty() ? msg.id : req.correlation_id;
  c.argv = req.argv;
  c.cwd = req.cwd;
  c.timeout_ms = req.timeout_ms > 0 ? req.timeout_ms : settings_.default_command_timeout_ms;
  c.origin = CommandOrigin::user;

  if (terminal() || !sandbox_ || cancel_requested_) {
    CommandResult res;
    res.correlation_id = c.correlation_id;
    res.command_id = c.command_id;
    res.status = CommandStatus::failed;
    res.error = to_string(ErrorCode::sandbox_terminated);
    send(std::move(res));
    return;
  }
  manual_queue_.push_back(std::move(c));
}

void SessionMachine::on_cancel(const Cancel& c, bool send_ack) {
  SessionEvent ack;
  ack.kind = "cancel_acknowledged";
  ack.phase = to_string(phase_);
  ack.trigger = c.target.empty() ? "session" : c.target;

  if (c.target.empty()) {
    ack.reason = terminal() ? "already_terminal" : "cancelling";
    if (send_ack) send(std::move(ack));
    if (terminal()) return;
    cancel_requested_ = true;
    interrupt();
    if (active_ && sandbox_) {
      deps_.sandbox->cancel(*sandbox_, active_->command().command_id);
    } else {
      finish_terminal(SessionPhase::cancelled, ErrorCode::user_cancelled, "");
    }
    return;
  }

  if (active_ && sandbox_ && active_->command().correlation_id == c.target) {
    const CancelOutcome out = deps_.sandbox->cancel(*sandbox_, active_->command().command_id);
    ack.reason = out == CancelOutcome::cancelling ? "cancelling" : "already_completed";
    send(std::move(ack));
    return;
  }
  for (auto it = manual_queue_.begin(); it != manual_queue_.end(); ++it) {
    if (it->correlation_id != c.target) continue;
    const Command queued = *it;
    manual_queue_.erase(it);
    ack.reason = "dequeued";
    send(std::move(ack));
    CommandResult res;
    res.correlation_id = queued.correlation_id;
    res.command_id = queued.command_id;
    res.status = CommandStatus::cancelled;
    res.error = to_string(ErrorCode::cancelled);
    send(std::move(res));
    return;
  }
  ack.reason = "not_running";
  send(std::move(ack));
}

void SessionMachine::run_converse() {
  std::uint32_t attempts = 0;
  const PlanningContext ctx = context();
  IntakeReply reply = call_with_retry<IntakeReply>(
      settings_.planner_retry, [&] { return deps_.planner->converse(ctx); }, abort_check(),
      &attempts);
  if (attempts > 1) global_executor_stats().planner_retries.fetch_add(attempts - 1);
  if (terminal()) return;
  if (!reply.ok) {
    // An interrupted retry is ended by the runner's abort(), not here.
    if (interrupted_.load(std::memory_order_acquire)) {
      interrupted_call_ = [this] { run_converse(); };
    } else {
      fail(ErrorCode::planning_unavailable, reply.error);
    }
    return;
  }
  stage(reply.inferred);
  if (!reply.text.empty()) say(reply.text, reply.ready ? "notice" : "question");
  if (!reply.ready) return;
  if (transition(SessionPhase::planning, "intake_ready", "")) request_plan("initial", false);
}

void SessionMachine::request_plan(const std::string& trigger, bool auto_approve) {
  if (!research_done_ && deps_.research) {
    research_done_ = true;
    for (const auto& e : dialogue_) {
      if (e.role != "user") continue;
      research_notes_ = deps_.research->notes_for(e.text);
      break;
    }
  }

  std::uint32_t attempts = 0;
  const PlanningContext ctx = context();
  PlanReply reply = call_with_retry<PlanReply>(
      settings_.planner_retry, [&] { return deps_.planner->plan(ctx); }, abort_check(), &attempts);
  if (attempts > 1) global_executor_stats().planner_retries.fetch_add(attempts - 1);
  if (terminal()) return;
  if (!reply.ok) {
    // An interrupted retry is ended by the runner's abort(), not here.
    if (interrupted_.load(std::memory_order_acquire)) {
      interrupted_call_ = [this, trigger, auto_approve] { request_plan(trigger, auto_approve); };
    } else {
      fail(ErrorCode::planning_unavailable, reply.error);
    }
    return;
  }
  plan_ = std::move(reply.plan);
  step_index_ = 0;
  say(render_plan(*plan_), "plan");

  if (auto_approve) {
    approve_plan(trigger == "replan" ? "replan_auto_approved" : "auto_approved");
    return;
  }
  awaiting_approval_ = true;
  approval_deadline_ms_ = settings_.plan_approval_timeout_ms > 0
                              ? now_unix_ms() + settings_.plan_approval_timeout_ms
                              : 0;
}

void SessionMachine::approve_plan(const std::string& trigger) {
  awaiting_approval_ = false;
  approval_deadline_ms_ = 0;
  if (!transition(SessionPhase::executing, trigger, "")) return;
  step_index_ = 0;
  if (plan_ && plan_->steps.empty()) {
    if (transition(SessionPhase::reviewing, "plan_empty", "")) run_review();
    return;
  }
  maybe_dispatch();
}

void SessionMachine::abort(ErrorCode reason, const std::string& detail) {
  if (terminal()) return;
  if (cancels_session(reason)) finish_terminal(SessionPhase::cancelled, reason, detail);
  else fail(reason, detail);
}

void SessionMachine::tick(std::uint64_t now) {
  if (phase_ != SessionPhase::planning || !awaiting_approval_ || approval_deadline_ms_ == 0) return;
  if (now >= approval_deadline_ms_) approve_plan("approval_timeout");
}

void SessionMachine::run_review() {
  std::size_t committed = 0;
  std::string committed_text;
  for (auto fact : staged_) {
    fact.source_session = session_id_;
    fact.timestamp_unix_ms = now_unix_ms();
    const UpsertOutcome out = deps_.store->upsert(user_id_, fact);
    if (!out.ok) {
      ErrorMessage err;
      err.code = to_string(ErrorCode::store_io);
      err.detail = out.error;
      send(std::move(err));
      continue;
    }
    ++committed;
    committed_text += "\n  " + fact.key + " = " + fact.value;
    global_executor_stats().preference_commits.fetch_add(1, std::memory_order_relaxed);

    ObservedEvent oe;
    oe.category = "preference";
    oe.name = "commit";
    oe.session_id = session_id_;
    oe.fields = {{"key", fact.key},
                 {"effective", out.effective ? "true" : "false"},
                 {"conflict", out.conflict ? "true" : "false"}};
    oe.unix_ms = now_unix_ms();
    emit_event(oe);
  }
  staged_.clear();

  SessionEvent ev;
  ev.kind = "preferences_committed";
  ev.phase = to_string(phase_);
  ev.trigger = "review";
  ev.reason = std::to_string(committed);
  send(std::move(ev));

  std::ostringstream summary;
  summary << "Finished: " << (plan_ ? plan_->summary : std::string("no plan")) << "\n";
  summary << "Steps run: " << steps_run_ << ", replans: " << replans_;
  if (committed > 0) summary << "\nLearned preferences:" << committed_text;
  say(summary.str(), "summary");

  finish_terminal(SessionPhase::completed, ErrorCode::none, "");
}

// ---------------------------------------------------------------------------
// Command flow
// ---------------------------------------------------------------------------

void SessionMachine::maybe_dispatch() {
  if (active_ || terminal() || !sandbox_ || cancel_requested_) return;
  if (!manual_queue_.empty()) {
    Command c = std::move(manual_queue_.front());
    manual_queue_.pop_front();
    dispatch(std::move(c), ActiveKind::manual, "");
    return;
  }
  if (phase_ != SessionPhase::executing || !plan_ || step_index_ >= plan_->steps.size()) return;

  const PlanStep& step = plan_->steps[step_index_];
  Command c;
  c.command_id = new_id("cmd");
  c.correlation_id = new_id("corr");
  c.argv = step.argv;
  c.cwd = step.cwd;
  c.timeout_ms = step.timeout_ms > 0 ? step.timeout_ms : settings_.default_command_timeout_ms;
  c.origin = CommandOrigin::plan;

  CommandRequest req;
  req.correlation_id = c.correlation_id;
  req.command_id = c.command_id;
  req.argv = c.argv;
  req.cwd = c.cwd;
  req.timeout_ms = c.timeout_ms;
  req.origin = CommandOrigin::plan;
  req.step = step.description;
  send(std::move(req));

  dispatch(std::move(c), ActiveKind::plan_step, step.description);
}

void SessionMachine::dispatch(Command command, ActiveKind kind, const std::string& step_description) {
  active_kind_ = kind;
  active_step_ = step_description;
  output_tail_.clear();
  active_ = deps_.sandbox->execute(*sandbox_, command);
}

std::optional<ExecutionOutcome> SessionMachine::forward(ExecutionUpdate update) {
  if (auto* chunk = std::get_if<OutputChunk>(&update)) {
    output_tail_ += chunk->data;
    if (output_tail_.size() > settings_.output_tail_bytes) {
      output_tail_.erase(0, output_tail_.size() - settings_.output_tail_bytes);
    }
    CommandOutputChunk out;
    out.correlation_id = chunk->correlation_id;
    out.command_id = chunk->command_id;
    out.seq = chunk->seq;
    out.stream = chunk->stream;
    out.data = std::move(chunk->data);
    send(std::move(out));
    return std::nullopt;
  }
  auto& outcome = std::get<ExecutionOutcome>(update);
  CommandResult res;
  res.correlation_id = outcome.correlation_id;
  res.command_id = outcome.command_id;
  res.status = outcome.status;
  res.exit_code = outcome.exit_code;
  res.duration_ms = outcome.duration_ms;
  res.output_truncated = outcome.output_truncated;
  res.error = outcome.error;
  send(std::move(res));

  global_executor_stats().record_command(outcome.status, outcome.duration_ms * 1000000ull);
  ObservedEvent oe;
  oe.category = "command";
  oe.name = "result";
  oe.session_id = session_id_;
  oe.fields = {{"command_id", outcome.command_id},
               {"status", to_string(outcome.status)},
               {"exit_code", std::to_string(outcome.exit_code)},
               {"duration_ms", std::to_string(outcome.duration_ms)}};
  oe.unix_ms = now_unix_ms();
  emit_event(oe);
  return outcome;
}

bool SessionMachine::pump(std::chrono::milliseconds wait) {
  if (!active_) return false;
  bool progressed = false;
  auto update = active_->updates().pop_for(wait);
  while (update) {
    progressed = true;
    if (auto outcome = forward(std::move(*update))) {
      on_command_finished(*outcome);
      return true;
    }
    update = active_->updates().try_pop();
  }
  return progressed;
}

void SessionMachine::drain_active() {
  if (!active_) return;
  if (sandbox_) deps_.sandbox->cancel(*sandbox_, active_->command().command_id);
  while (active_) {
    auto update = active_->updates().pop_for(std::chrono::milliseconds(100));
    if (update) {
      if (forward(std::move(*update))) active_.reset();
    } else if (active_->updates().exhausted()) {
      active_.reset();
    }
  }
}

void SessionMachine::on_command_finished(const ExecutionOutcome& outcome) {
  const ActiveKind kind = active_kind_;
  const std::vector<std::string> argv = active_->command().argv;
  const std::string description = active_step_;
  const std::string tail = output_tail_;
  active_.reset();

  dialogue_.push_back({"command", join_argv(argv) + " -> " + to_string(outcome.status) +
                                      " (exit " + std::to_string(outcome.exit_code) + ")"});

  if (cancel_requested_) {
    finish_terminal(SessionPhase::cancelled, ErrorCode::user_cancelled, "");
    return;
  }
  if (kind == ActiveKind::manual || phase_ != SessionPhase::executing) {
    maybe_dispatch();
    return;
  }

  ++steps_run_;
  StepOutcome so;
  so.description = description;
  so.argv = argv;
  so.status = outcome.status;
  so.exit_code = outcome.exit_code;
  so.error = outcome.error;
  so.output_tail = tail;
  judge_step(so);
}

void SessionMachine::judge_step(const StepOutcome& outcome) {
  std::uint32_t attempts = 0;
  const PlanningContext ctx = context();
  DecisionReply reply = call_with_retry<DecisionReply>(
      settings_.planner_retry, [&] { return deps_.planner->decide(ctx, outcome); }, abort_check(),
      &attempts);
  if (attempts > 1) global_executor_stats().planner_retries.fetch_add(attempts - 1);
  if (terminal()) return;
  if (!reply.ok) {
    // An interrupted retry is ended by the runner's abort(), not here.
    if (interrupted_.load(std::memory_order_acquire)) {
      interrupted_call_ = [this, outcome] { judge_step(outcome); };
    } else {
      fail(ErrorCode::planning_unavailable, reply.error);
    }
    return;
  }
  stage(reply.inferred);
  if (!reply.note.empty()) say(reply.note, "notice");

  switch (reply.decision) {
    case Decision::continue_plan:
      ++step_index_;
      if (step_index_ >= plan_->steps.size()) {
        if (transition(SessionPhase::reviewing, "plan_complete", "")) run_review();
        return;
      }
      maybe_dispatch();
      return;
    case Decision::replan:
      if (replans_ >= settings_.max_replans) {
        fail(ErrorCode::replan_limit,
             "replan limit " + std::to_string(settings_.max_replans) + " reached");
        return;
      }
      ++replans_;
      global_executor_stats().replans.fetch_add(1, std::memory_order_relaxed);
      if (transition(SessionPhase::planning, "replan", outcome.error)) {
        request_plan("replan", !settings_.replan_requires_approval);
      }
      return;
    case Decision::finish:
      if (transition(SessionPhase::reviewing, "planner_finish", "")) run_review();
      return;
  }
}

}  // namespace auton
