#pragma once

// auton/types.hpp: Core data structures shared by every executor module.
//
// OWNERSHIP:
//   All types here are value types. Strings are value-owned, no borrowed
//   references escape an API call. Sessions, sandboxes and stores hand out
//   copies; the only shared objects in the system are CommandExecution
//   (shared_ptr, see sandbox.hpp) and the store itself.
//
// ERROR MODEL:
//   Errors are values. ErrorCode::to_string() yields the stable snake_case
//   reason code that appears in Error messages, terminal SessionEvents, the
//   event log and the JSONL observability stream. Never rename a code
//   without bumping the framing version.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace auton {

enum class ErrorCode {
  none,
  provision_failed,
  resource_exhausted,
  environment_unavailable,
  planning_unavailable,
  replan_limit,
  protocol_error,
  protocol_fatal,
  grace_expired,
  user_cancelled,
  executor_shutdown,
  sandbox_busy,
  sandbox_terminated,
  path_escape,
  spawn_failed,
  timeout,
  cancelled,
  nonzero_exit,
  invalid_command,
  config_invalid,
  store_io,
};

std::string to_string(ErrorCode code);

// Session phases. Completed, Failed and Cancelled are terminal.
enum class SessionPhase {
  intake,
  planning,
  executing,
  reviewing,
  completed,
  failed,
  cancelled,
};

std::string to_string(SessionPhase phase);
std::optional<SessionPhase> parse_session_phase(const std::string& s);
bool is_terminal(SessionPhase phase);
// Legal edges of the session graph. Failed/Cancelled are reachable from every
// non-terminal phase; nothing leaves a terminal phase.
bool is_legal_transition(SessionPhase from, SessionPhase to);

enum class SandboxState {
  provisioning,
  ready,
  busy,
  terminating,
  terminated,
};

std::string to_string(SandboxState state);

enum class CommandStatus {
  succeeded,
  failed,
  timed_out,
  cancelled,
};

std::string to_string(CommandStatus status);
std::optional<CommandStatus> parse_command_status(const std::string& s);

// Per-environment resource limits. 0 means "not enforced" except for
// max_output_bytes, which always caps the bytes streamed per command.
struct ResourceLimits {
  std::uint64_t cpu_seconds{0};
  std::uint64_t memory_bytes{0};
  std::uint64_t wall_time_ms{30000};
  std::uint64_t max_file_descriptors{0};
  std::size_t max_output_bytes{1u << 20};
};

struct PreferenceFact {
  std::string key;
  std::string value;
  double confidence{1.0};
  std::string source_session;
  std::uint64_t timestamp_unix_ms{0};
};

// Total order used to fold concurrent writes: timestamp first, then session
// id. Returns true when `a` is ordered before `b`.
bool fact_precedes(const PreferenceFact& a, const PreferenceFact& b);

enum class CommandOrigin {
  plan,
  user,
};

std::string to_string(CommandOrigin origin);

struct Command {
  std::string command_id;
  std::string correlation_id;
  std::vector<std::string> argv;
  std::string cwd;  // relative to the sandbox root
  std::uint64_t timeout_ms{0};  // 0 = environment wall_time_ms
  CommandOrigin origin{CommandOrigin::plan};
};

struct PlanStep {
  std::string description;
  std::vector<std::string> argv;
  std::string cwd;
  std::uint64_t timeout_ms{0};
};

struct Plan {
  std::string summary;
  std::vector<PlanStep> steps;
};

// Human-readable rendering used for the plan AssistantOutput.
std::string render_plan(const Plan& plan);

std::uint64_t now_unix_ms();

// Random identifier "<prefix>-<16 hex>". Unique per process for practical
// purposes; used for message, session, command and environment ids.
std::string new_id(const std::string& prefix);

}  // namespace auton
