#include "auton/types.hpp"

#include <chrono>
#include <cstdio>
#include <random>

namespace auton {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::provision_failed: return "provision_failed";
    case ErrorCode::resource_exhausted: return "resource_exhausted";
    case ErrorCode::environment_unavailable: return "environment_unavailable";
    case ErrorCode::planning_unavailable: return "planning_unavailable";
    case ErrorCode::replan_limit: return "replan_limit";
    case ErrorCode::protocol_error: return "protocol_error";
    case ErrorCode::protocol_fatal: return "protocol_fatal";
    case ErrorCode::grace_expired: return "grace_expired";
    case ErrorCode::user_cancelled: return "user_cancelled";
    case ErrorCode::executor_shutdown: return "executor_shutdown";
    case ErrorCode::sandbox_busy: return "sandbox_busy";
    case ErrorCode::sandbox_terminated: return "sandbox_terminated";
    case ErrorCode::path_escape: return "path_escape";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::cancelled: return "cancelled";
    case ErrorCode::nonzero_exit: return "nonzero_exit";
    case ErrorCode::invalid_command: return "invalid_command";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::store_io: return "store_io";
  }
  return "";
}

std::string to_string(SessionPhase phase) {
  switch (phase) {
    case SessionPhase::intake: return "intake";
    case SessionPhase::planning: return "planning";
    case SessionPhase::executing: return "executing";
    case SessionPhase::reviewing: return "reviewing";
    case SessionPhase::completed: return "completed";
    case SessionPhase::failed: return "failed";
    case SessionPhase::cancelled: return "cancelled";
  }
  return "";
}

std::optional<SessionPhase> parse_session_phase(const std::string& s) {
  if (s == "intake") return SessionPhase::intake;
  if (s == "planning") return SessionPhase::planning;
  if (s == "executing") return SessionPhase::executing;
  if (s == "reviewing") return SessionPhase::reviewing;
  if (s == "completed") return SessionPhase::completed;
  if (s == "failed") return SessionPhase::failed;
  if (s == "cancelled") return SessionPhase::cancelled;
  return std::nullopt;
}

bool is_terminal(SessionPhase phase) {
  return phase == SessionPhase::completed || phase == SessionPhase::failed ||
         phase == SessionPhase::cancelled;
}

bool is_legal_transition(SessionPhase from, SessionPhase to) {
  if (is_terminal(from) || from == to) return false;
  if (to == SessionPhase::failed || to == SessionPhase::cancelled) return true;
  switch (from) {
    case SessionPhase::intake: return to == SessionPhase::planning;
    case SessionPhase::planning: return to == SessionPhase::executing;
    case SessionPhase::executing:
      return to == SessionPhase::planning || to == SessionPhase::reviewing;
    case SessionPhase::reviewing: return to == SessionPhase::completed;
    default: return false;
  }
}

std::string to_string(SandboxState state) {
  switch (state) {
    case SandboxState::provisioning: return "provisioning";
    case SandboxState::ready: return "ready";
    case SandboxState::busy: return "busy";
    case SandboxState::terminating: return "terminating";
    case SandboxState::terminated: return "terminated";
  }
  return "";
}

std::string to_string(CommandStatus status) {
  switch (status) {
    case CommandStatus::succeeded: return "succeeded";
    case CommandStatus::failed: return "failed";
    case CommandStatus::timed_out: return "timed_out";
    case CommandStatus::cancelled: return "cancelled";
  }
  return "";
}

std::optional<CommandStatus> parse_command_status(const std::string& s) {
  if (s == "succeeded") return CommandStatus::succeeded;
  if (s == "failed") return CommandStatus::failed;
  if (s == "timed_out") return CommandStatus::timed_out;
  if (s == "cancelled") return CommandStatus::cancelled;
  return std::nullopt;
}

bool fact_precedes(const PreferenceFact& a, const PreferenceFact& b) {
  if (a.timestamp_unix_ms != b.timestamp_unix_ms) {
    return a.timestamp_unix_ms < b.timestamp_unix_ms;
  }
  return a.source_session < b.source_session;
}

std::string to_string(CommandOrigin origin) {
  return origin == CommandOrigin::plan ? "plan" : "user";
}

std::string render_plan(const Plan& plan) {
  std::string out = plan.summary.empty() ? "Plan:" : plan.summary;
  for (std::size_t i = 0; i < plan.steps.size(); ++i) {
    const auto& step = plan.steps[i];
    out += "\n";
    out += std::to_string(i + 1);
    out += ". ";
    out += step.description;
    if (!step.argv.empty()) {
      out += " [";
      for (std::size_t a = 0; a < step.argv.size(); ++a) {
        if (a) out += ' ';
        out += step.argv[a];
      }
      out += "]";
    }
  }
  return out;
}

std::uint64_t now_unix_ms() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

std::string new_id(const std::string& prefix) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx",
                static_cast<unsigned long long>(rng()));
  return prefix + "-" + buf;
}

}  // namespace auton
