#pragma once

// auton/config.hpp: Executor configuration.
//
// SOURCES, later wins:
//   1. built-in defaults;
//   2. the JSON file named by --config or AUTON_CONFIG;
//   3. environment: AUTON_STATE_DIR, AUTON_SANDBOX_ROOT, AUTON_PLANNER,
//      AUTON_LISTEN, AUTON_GRACE_MS, AUTON_SANDBOX_DISABLED.
//
// FILE FORMAT (every section and key optional):
//   {"config_version":"1",
//    "server":  {"listen","grace_ms","park_buffer_messages","max_frame_bytes","max_sessions"},
//    "sandbox": {"root","max_environments","kill_grace_ms","network_isolation",
//                "purge_on_teardown","enabled","path","env":{..},
//                "limits":{"cpu_seconds","memory_bytes","wall_time_ms",
//                          "max_file_descriptors","max_output_bytes"}},
//    "session": {"plan_approval_timeout_ms","max_replans","replan_requires_approval",
//                "planner_attempts","planner_backoff_ms","planner_max_backoff_ms",
//                "auto_apply_confidence","assistant_chunk_chars","default_command_timeout_ms"},
//    "store":   {"state_dir"},
//    "planner": {"argv":[..],"timeout_ms","env":{..}},
//    "archive": {"dir","compression":"off|zstd"}}
//   Unknown keys are reported as warnings, never silently ignored.

#include <optional>
#include <string>
#include <vector>

#include "auton/archive.hpp"
#include "auton/orchestrator.hpp"
#include "auton/planner.hpp"
#include "auton/sandbox.hpp"
#include "auton/session.hpp"

namespace auton {

constexpr const char* kConfigVersion = "1";

struct AutonConfig {
  ServerConfig server;
  SandboxConfig sandbox;
  SessionSettings session;
  std::string state_dir{"/tmp/auton/state"};
  PlannerConfig planner;
  ArchiveConfig archive;
};

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Merges `text` into `config`. Structural problems (bad JSON, wrong types)
// go to errors; unknown keys go to warnings.
ConfigValidationResult apply_config_json(const std::string& text, AutonConfig& config);

void apply_env_overrides(AutonConfig& config);

// Semantic checks on a fully merged configuration.
ConfigValidationResult validate_config(const AutonConfig& config);

// Defaults, then `path` (if non-empty, else AUTON_CONFIG), then environment.
// Returns nullopt and fills *report when the file cannot be used.
std::optional<AutonConfig> load_config(const std::string& path, ConfigValidationResult* report);

std::string config_to_json(const AutonConfig& config);

}  // namespace auton
