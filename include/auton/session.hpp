#pragma once

// auton/session.hpp: Per-project session state machine.
//
// PHASES:
//   Intake -> Planning -> Executing -> Reviewing -> Completed
//   Executing -> Planning on replan. Failed and Cancelled are reachable from
//   every non-terminal phase. Every transition appends one chained
//   SessionEventRecord and sends one SessionEvent{kind=transition}.
//
// THREADING:
//   A SessionMachine is driven by exactly one thread (the session runner).
//   handle(), pump(), tick() and abort() must all be called from it. The
//   only cross-thread entry point is interrupt(), which fires the planner's
//   cancellation token and makes a pending planner retry give up early.
//
// COMMANDS:
//   At most one command is in flight. Manual CommandRequests from the
//   front-end are queued and dispatched ahead of the next plan step. pump()
//   forwards the in-flight command's output chunks and its single result;
//   plan-step results are then judged by the planner (continue, replan,
//   finish).
//
// PREFERENCES:
//   At start the project snapshot is frozen. Facts at or above
//   auto_apply_confidence are applied; the rest are listed to the user and
//   applied once a UserInput names them in confirm_preferences. Facts the
//   planner infers are staged and only committed in Reviewing.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "auton/planner.hpp"
#include "auton/preference_store.hpp"
#include "auton/protocol.hpp"
#include "auton/research.hpp"
#include "auton/sandbox.hpp"
#include "auton/types.hpp"

namespace auton {

struct SessionSettings {
  std::uint64_t plan_approval_timeout_ms{0};  // 0 = wait for acknowledgement
  std::uint32_t max_replans{3};
  bool replan_requires_approval{false};
  RetryPolicy planner_retry;
  double auto_apply_confidence{0.7};
  std::size_t assistant_chunk_chars{2048};
  std::uint64_t default_command_timeout_ms{30000};
  std::size_t output_tail_bytes{2048};
  ResourceLimits limits;
};

struct SessionEventRecord {
  std::uint64_t seq{0};
  std::string from_phase;  // empty for the opening record
  std::string to_phase;
  std::string trigger;
  std::string reason;
  std::uint64_t unix_ms{0};
  std::string prev_digest;
  std::string digest;
};

std::string event_record_to_json(const SessionEventRecord& r);
std::optional<SessionEventRecord> event_record_from_json(const std::string& text,
                                                         std::string* error);
std::string event_record_digest(const SessionEventRecord& r);
// Checks seq continuity, prev links and every digest.
bool verify_event_chain(const std::vector<SessionEventRecord>& records, std::string* error);

using MessageSink = std::function<void(const ProtocolMessage&)>;

struct SessionDeps {
  SandboxRuntime* sandbox{nullptr};
  PreferenceStore* store{nullptr};
  Planner* planner{nullptr};
  ResearchAssembler* research{nullptr};  // optional
};

class SessionMachine {
 public:
  SessionMachine(std::string session_id, std::string user_id, std::string project_id,
                 SessionDeps deps, SessionSettings settings, MessageSink sink);
  ~SessionMachine();

  SessionMachine(const SessionMachine&) = delete;
  SessionMachine& operator=(const SessionMachine&) = delete;

  // Freezes preferences and provisions the sandbox. A provisioning failure
  // moves the session straight to Failed.
  void start();

  void handle(const ProtocolMessage& msg);

  // Applies a session-level Cancel whose cancel_acknowledged event was
  // already sent by the connection reader.
  void handle_acknowledged_cancel(const ProtocolMessage& msg);

  // Forwards updates of the in-flight command. Waits up to `wait` for the
  // first one. Returns true if anything was forwarded.
  bool pump(std::chrono::milliseconds wait);

  // Applies the plan approval timeout.
  void tick(std::uint64_t now_unix_ms);

  // Ends the session. user_cancelled, grace_expired and executor_shutdown
  // lead to Cancelled, anything else to Failed.
  void abort(ErrorCode reason, const std::string& detail = "");

  void interrupt();

  // Undoes an interrupt whose abort was not applied (a parked session that
  // was reattached in time) and re-runs the planner call it cut short.
  void resume_after_interrupt();

  void set_sink(MessageSink sink) { sink_ = std::move(sink); }

  const std::string& id() const { return session_id_; }
  const std::string& user_id() const { return user_id_; }
  const std::string& project_id() const { return project_id_; }
  SessionPhase phase() const { return phase_; }
  bool terminal() const { return is_terminal(phase_); }
  std::string terminal_reason() const { return terminal_reason_; }
  bool command_in_flight() const { return active_ != nullptr; }
  bool awaiting_approval() const { return awaiting_approval_; }
  std::uint32_t replans() const { return replans_; }
  const std::optional<Plan>& plan() const { return plan_; }
  const std::optional<SandboxHandle>& sandbox() const { return sandbox_; }

  const std::vector<ProtocolMessage>& transcript() const { return transcript_; }
  const std::vector<SessionEventRecord>& events() const { return events_; }
  const std::map<std::string, PreferenceFact>& applied_preferences() const { return applied_; }
  const std::map<std::string, PreferenceFact>& pending_confirmation() const { return pending_; }
  const std::vector<PreferenceFact>& staged_facts() const { return staged_; }

 private:
  enum class ActiveKind { plan_step, manual };

  void send(MessageBody body);
  void say(const std::string& text, const std::string& topic);
  bool transition(SessionPhase to, const std::string& trigger, const std::string& reason);
  void fail(ErrorCode code, const std::string& detail);
  void finish_terminal(SessionPhase target, ErrorCode reason, const std::string& detail);

  PlanningContext context() const;
  std::function<bool()> abort_check() const;

  void on_user_input(const ProtocolMessage& msg, const UserInput& in);
  void on_command_request(const ProtocolMessage& msg, const CommandRequest& req);
  void on_cancel(const Cancel& c, bool send_ack);

  void run_converse();
  void request_plan(const std::string& trigger, bool auto_approve);
  void approve_plan(const std::string& trigger);
  void run_review();

  void maybe_dispatch();
  void dispatch(Command command, ActiveKind kind, const std::string& step_description);
  std::optional<ExecutionOutcome> forward(ExecutionUpdate update);
  void on_command_finished(const ExecutionOutcome& outcome);
  void judge_step(const StepOutcome& outcome);
  void drain_active();
  void stage(const std::vector<PreferenceFact>& facts);
  void open_log();
  void append_event(const std::string& from, SessionPhase to, const std::string& trigger,
                    const std::string& reason);

  std::string session_id_;
  std::string user_id_;
  std::string project_id_;
  SessionDeps deps_;
  SessionSettings settings_;
  MessageSink sink_;

  SessionPhase phase_{SessionPhase::intake};
  bool started_{false};
  std::string terminal_reason_;
  std::atomic<bool> interrupted_{false};
  mutable std::mutex cancel_mu_;
  CancellationToken planner_cancel_;
  std::function<void()> interrupted_call_;

  std::vector<ProtocolMessage> transcript_;
  std::vector<TranscriptEntry> dialogue_;
  std::vector<SessionEventRecord> events_;

  std::map<std::string, PreferenceFact> applied_;
  std::map<std::string, PreferenceFact> pending_;
  std::vector<PreferenceFact> staged_;
  std::string research_notes_;
  bool research_done_{false};

  std::optional<SandboxHandle> sandbox_;
  std::optional<Plan> plan_;
  std::size_t step_index_{0};
  std::uint32_t replans_{0};
  std::size_t steps_run_{0};
  bool awaiting_approval_{false};
  std::uint64_t approval_deadline_ms_{0};
  bool cancel_requested_{false};

  std::shared_ptr<CommandExecution> active_;
  ActiveKind active_kind_{ActiveKind::plan_step};
  std::string active_step_;
  std::string output_tail_;
  std::deque<Command> manual_queue_;
};

}  // namespace auton
