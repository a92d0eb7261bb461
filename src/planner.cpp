#include "auton/planner.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include "auton/sandbox.hpp"

namespace auton {

namespace {

using jsonlite::Array;
using jsonlite::Object;

Object plan_to_object(const Plan& plan) {
  Array steps;
  for (const auto& s : plan.steps) {
    Object o;
    o["description"] = s.description;
    o["argv"] = jsonlite::to_array(s.argv);
    o["cwd"] = s.cwd;
    o["timeout_ms"] = s.timeout_ms;
    steps.push_back(std::move(o));
  }
  Object o;
  o["summary"] = plan.summary;
  o["steps"] = std::move(steps);
  return o;
}

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

}  // namespace

std::string to_string(Decision d) {
  switch (d) {
    case Decision::continue_plan: return "continue";
    case Decision::replan: return "replan";
    case Decision::finish: return "finish";
  }
  return "continue";
}

std::optional<Decision> parse_decision(const std::string& s) {
  if (s == "continue") return Decision::continue_plan;
  if (s == "replan") return Decision::replan;
  if (s == "finish") return Decision::finish;
  return std::nullopt;
}

std::uint64_t RetryPolicy::backoff_for(std::uint32_t attempt) const {
  if (attempt <= 1) return 0;
  double delay = static_cast<double>(initial_backoff_ms);
  for (std::uint32_t i = 2; i < attempt; ++i) {
    delay *= multiplier;
    if (delay >= static_cast<double>(max_backoff_ms)) break;
  }
  return std::min<std::uint64_t>(static_cast<std::uint64_t>(delay), max_backoff_ms);
}

Object context_to_json(const std::string& op, const PlanningContext& ctx) {
  Array transcript;
  for (const auto& e : ctx.transcript) {
    Object o;
    o["role"] = e.role;
    o["text"] = e.text;
    transcript.push_back(std::move(o));
  }
  Object prefs;
  for (const auto& [key, fact] : ctx.preferences) prefs[key] = fact.value;

  Object o;
  o["op"] = op;
  o["session"] = ctx.session_id;
  o["project"] = ctx.project_id;
  o["phase"] = to_string(ctx.phase);
  o["transcript"] = std::move(transcript);
  o["preferences"] = std::move(prefs);
  o["research"] = ctx.research_notes;
  o["step_index"] = static_cast<std::uint64_t>(ctx.step_index);
  o["replans"] = static_cast<std::uint64_t>(ctx.replans);
  if (ctx.current_plan) o["plan"] = plan_to_object(*ctx.current_plan);
  return o;
}

std::vector<PreferenceFact> parse_inferred_facts(const Object& reply) {
  std::vector<PreferenceFact> out;
  const Array* arr = jsonlite::get_array(reply, "preferences");
  if (!arr) return out;
  for (const auto& item : *arr) {
    const auto* o = std::get_if<Object>(&item.v);
    if (!o) continue;
    PreferenceFact f;
    f.key = jsonlite::get_string(*o, "key", "");
    if (f.key.empty()) continue;
    f.value = jsonlite::get_string(*o, "value", "");
    f.confidence = std::clamp(jsonlite::get_double(*o, "confidence", 0.5), 0.0, 1.0);
    out.push_back(std::move(f));
  }
  return out;
}

std::optional<Plan> parse_plan_reply(const Object& reply, std::string* error) {
  Plan plan;
  plan.summary = jsonlite::get_string(reply, "summary", "");
  const Array* steps = jsonlite::get_array(reply, "steps");
  if (!steps || steps->empty()) {
    if (error) *error = "plan has no steps";
    return std::nullopt;
  }
  for (std::size_t i = 0; i < steps->size(); ++i) {
    const auto* o = std::get_if<Object>(&(*steps)[i].v);
    if (!o) {
      if (error) *error = "step " + std::to_string(i) + " is not an object";
      return std::nullopt;
    }
    PlanStep step;
    step.description = jsonlite::get_string(*o, "description", "");
    step.argv = jsonlite::get_string_array(*o, "argv");
    step.cwd = jsonlite::get_string(*o, "cwd", "");
    step.timeout_ms = jsonlite::get_u64(*o, "timeout_ms", 0);
    if (step.argv.empty()) {
      if (error) *error = "step " + std::to_string(i) + " has empty argv";
      return std::nullopt;
    }
    plan.steps.push_back(std::move(step));
  }
  return plan;
}

SubprocessPlanner::SubprocessPlanner(PlannerConfig config) : config_(std::move(config)) {}

std::optional<Object> SubprocessPlanner::invoke(const Object& request,
                                                const CancellationToken& cancel,
                                                std::string* error) {
  if (config_.argv.empty()) {
    if (error) *error = "no planner command configured";
    return std::nullopt;
  }
  ProcessSpec spec;
  spec.argv = config_.argv;
  spec.stdin_data = jsonlite::to_json(request);
  spec.timeout_ms = config_.timeout_ms;
  spec.apply_limits = false;
  if (const char* path = std::getenv("PATH")) spec.env["PATH"] = path;
  if (const char* home = std::getenv("HOME")) spec.env["HOME"] = home;
  for (const auto& [k, v] : config_.env) spec.env[k] = v;

  if (cancel.cancelled()) {
    if (error) *error = "planner call cancelled";
    return std::nullopt;
  }
  const ProcessResult r = run_process(spec, &cancel);
  if (r.cancelled) {
    if (error) *error = "planner call cancelled";
    return std::nullopt;
  }
  if (r.spawn_failed) {
    if (error) *error = "planner spawn failed: " + r.error_message;
    return std::nullopt;
  }
  if (r.timed_out) {
    if (error) *error = "planner timed out";
    return std::nullopt;
  }
  if (r.exit_code != 0) {
    if (error) {
      *error = "planner exited " + std::to_string(r.exit_code);
      const std::string tail = trim(r.stderr_text);
      if (!tail.empty()) *error += ": " + tail.substr(0, 200);
    }
    return std::nullopt;
  }
  std::optional<jsonlite::JsonError> jerr;
  Object reply = jsonlite::parse(trim(r.stdout_text), &jerr);
  if (jerr) {
    if (error) *error = "planner reply: " + jerr->message;
    return std::nullopt;
  }
  return reply;
}

IntakeReply SubprocessPlanner::converse(const PlanningContext& ctx) {
  IntakeReply out;
  auto reply = invoke(context_to_json("converse", ctx), ctx.cancel, &out.error);
  if (!reply) return out;
  const std::string verdict = jsonlite::get_string(*reply, "verdict", "");
  if (verdict != "ask" && verdict != "ready") {
    out.error = "planner reply: verdict must be ask or ready";
    return out;
  }
  out.ok = true;
  out.ready = verdict == "ready";
  out.text = jsonlite::get_string(*reply, "text", "");
  out.inferred = parse_inferred_facts(*reply);
  return out;
}

PlanReply SubprocessPlanner::plan(const PlanningContext& ctx) {
  PlanReply out;
  auto reply = invoke(context_to_json("plan", ctx), ctx.cancel, &out.error);
  if (!reply) return out;
  auto plan = parse_plan_reply(*reply, &out.error);
  if (!plan) return out;
  out.ok = true;
  out.plan = std::move(*plan);
  return out;
}

DecisionReply SubprocessPlanner::decide(const PlanningContext& ctx, const StepOutcome& outcome) {
  DecisionReply out;
  Object request = context_to_json("decide", ctx);
  Object o;
  o["description"] = outcome.description;
  o["argv"] = jsonlite::to_array(outcome.argv);
  o["status"] = to_string(outcome.status);
  o["exit_code"] = static_cast<double>(outcome.exit_code);
  o["error"] = outcome.error;
  o["output_tail"] = outcome.output_tail;
  request["outcome"] = std::move(o);

  auto reply = invoke(request, ctx.cancel, &out.error);
  if (!reply) return out;
  auto decision = parse_decision(jsonlite::get_string(*reply, "decision", ""));
  if (!decision) {
    out.error = "planner reply: decision must be continue, replan or finish";
    return out;
  }
  out.ok = true;
  out.decision = *decision;
  out.note = jsonlite::get_string(*reply, "note", "");
  out.inferred = parse_inferred_facts(*reply);
  return out;
}

}  // namespace auton
