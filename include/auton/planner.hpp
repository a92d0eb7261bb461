#pragma once

// auton/planner.hpp: Interface to the planning/generation collaborator.
//
// The planner is treated as a pure function of (transcript, preference
// snapshot, phase) with latency and failure. It answers three questions:
//   converse()  during Intake: ask a clarifying question or declare ready;
//   plan()      during Planning: produce an ordered list of steps;
//   decide()    during Executing, after each command result: continue,
//               replan or finish.
// Every reply may carry inferred preference facts; the session stages them
// and commits them only during Reviewing.
//
// FAILURE:
//   A reply with ok == false is a planning_unavailable failure. The session
//   retries through call_with_retry() with exponential backoff and fails
//   once the attempt budget is spent.
//
// CANCELLATION:
//   PlanningContext::cancel fires when the session is cancelled or aborted
//   from another thread. Implementations should return promptly with
//   ok == false once it has fired; SubprocessPlanner kills its child.
//
// SUBPROCESS ADAPTER:
//   SubprocessPlanner runs PlannerConfig::argv once per request. The request
//   is one JSON object on stdin:
//     {"op":"converse|plan|decide","session":..,"project":..,"phase":..,
//      "transcript":[{"role":..,"text":..}],"preferences":{key:value},
//      "research":"..","plan":{..},"step_index":N,"replans":N,"outcome":{..}}
//   The reply is one JSON object on stdout:
//     converse: {"verdict":"ask|ready","text":..,"preferences":[{key,value,confidence}]}
//     plan:     {"summary":..,"steps":[{"description","argv","cwd","timeout_ms"}]}
//     decide:   {"decision":"continue|replan|finish","note":..,"preferences":[..]}

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "auton/channel.hpp"
#include "auton/jsonlite.hpp"
#include "auton/types.hpp"

namespace auton {

struct TranscriptEntry {
  std::string role;  // "user" | "assistant" | "command" | "system"
  std::string text;
};

struct PlanningContext {
  std::string session_id;
  std::string project_id;
  std::string user_id;
  SessionPhase phase{SessionPhase::intake};
  std::vector<TranscriptEntry> transcript;
  std::map<std::string, PreferenceFact> preferences;  // applied facts only
  std::string research_notes;
  std::optional<Plan> current_plan;
  std::size_t step_index{0};
  std::uint32_t replans{0};
  CancellationToken cancel;  // shared with the session
};

// Result of the command the planner is asked to judge.
struct StepOutcome {
  std::string description;
  std::vector<std::string> argv;
  CommandStatus status{CommandStatus::failed};
  std::int64_t exit_code{-1};
  std::string error;
  std::string output_tail;
};

struct IntakeReply {
  bool ok{false};
  std::string error;
  bool ready{false};
  std::string text;
  std::vector<PreferenceFact> inferred;
};

struct PlanReply {
  bool ok{false};
  std::string error;
  Plan plan;
};

enum class Decision {
  continue_plan,
  replan,
  finish,
};

std::string to_string(Decision d);
std::optional<Decision> parse_decision(const std::string& s);

struct DecisionReply {
  bool ok{false};
  std::string error;
  Decision decision{Decision::continue_plan};
  std::string note;
  std::vector<PreferenceFact> inferred;
};

class Planner {
 public:
  virtual ~Planner() = default;

  virtual IntakeReply converse(const PlanningContext& ctx) = 0;
  virtual PlanReply plan(const PlanningContext& ctx) = 0;
  virtual DecisionReply decide(const PlanningContext& ctx, const StepOutcome& outcome) = 0;
};

struct RetryPolicy {
  std::uint32_t max_attempts{3};
  std::uint64_t initial_backoff_ms{200};
  std::uint64_t max_backoff_ms{5000};
  double multiplier{2.0};

  // Delay before attempt `attempt` (1-based; attempt 1 has no delay).
  std::uint64_t backoff_for(std::uint32_t attempt) const;
};

// Calls `fn` until it returns a reply with ok == true or the attempt budget
// is spent. Backoff sleeps are sliced so `abort` can end them early; an
// aborted call returns the last failed reply. *attempts receives the number
// of calls made.
template <typename Reply, typename Fn>
Reply call_with_retry(const RetryPolicy& policy, Fn&& fn, const std::function<bool()>& abort,
                      std::uint32_t* attempts) {
  Reply reply;
  const std::uint32_t max_attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;
  std::uint32_t made = 0;
  for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    if (attempt > 1) {
      auto remaining = std::chrono::milliseconds(policy.backoff_for(attempt));
      const auto slice = std::chrono::milliseconds(10);
      while (remaining.count() > 0) {
        if (abort && abort()) {
          if (attempts) *attempts = made;
          return reply;
        }
        const auto step = remaining < slice ? remaining : slice;
        std::this_thread::sleep_for(step);
        remaining -= step;
      }
    }
    reply = fn();
    ++made;
    if (reply.ok) break;
  }
  if (attempts) *attempts = made;
  return reply;
}

struct PlannerConfig {
  std::vector<std::string> argv;
  std::uint64_t timeout_ms{60000};
  std::map<std::string, std::string> env;
};

// Request payload shared by SubprocessPlanner and tests.
jsonlite::Object context_to_json(const std::string& op, const PlanningContext& ctx);

// Parses the "preferences" array of a planner reply. Entries without a key
// are skipped; confidence defaults to 0.5 and is clamped to [0, 1].
std::vector<PreferenceFact> parse_inferred_facts(const jsonlite::Object& reply);

std::optional<Plan> parse_plan_reply(const jsonlite::Object& reply, std::string* error);

class SubprocessPlanner : public Planner {
 public:
  explicit SubprocessPlanner(PlannerConfig config);

  IntakeReply converse(const PlanningContext& ctx) override;
  PlanReply plan(const PlanningContext& ctx) override;
  DecisionReply decide(const PlanningContext& ctx, const StepOutcome& outcome) override;

 private:
  std::optional<jsonlite::Object> invoke(const jsonlite::Object& request,
                                         const CancellationToken& cancel, std::string* error);

  PlannerConfig config_;
};

}  // namespace auton
