#pragma once

// auton/sandbox.hpp: Isolated per-project execution environments.
//
// LAYERS:
//   run_streaming()/run_process() spawn one child under a ProcessSpec and
//   are shared by the sandbox runtime and the subprocess planner adapter.
//   SandboxRuntime is the narrow capability the session sees: provision an
//   environment, execute one command at a time in it, cancel, transfer
//   files, tear down.
//
// ISOLATION (LocalSandboxRuntime):
//   - per-project root directory; cwd and file paths are confined to it
//     with normalize_under() (symlinks resolved before the prefix check);
//   - every command runs in its own session/process group (setsid) so the
//     whole tree can be signalled;
//   - setrlimit for CPU seconds, address space and open files;
//   - scrubbed environment: only PATH/HOME/LANG/TERM plus configured extras,
//     never anything is_secret_key() matches;
//   - optional unshare(CLONE_NEWNET), best-effort (needs privileges).
//   Termination is SIGTERM to the group, SIGKILL after kill_grace_ms, and a
//   final SIGKILL sweep of the group once the leader has exited.
//
// SANDBOX ENABLED FLAG:
//   SandboxConfig::sandbox_enabled defaults to true. AUTON_SANDBOX_DISABLED=1
//   skips rlimits and the network namespace for debugging. Path confinement
//   always applies.
//
// EXECUTION MODEL:
//   execute() returns a shared CommandExecution immediately. A worker thread
//   publishes OutputChunk updates as bytes are read and then exactly one
//   ExecutionOutcome, after which the update channel is closed. The
//   consumer observes completion by draining updates(); nothing calls back
//   into session code.

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

#include "auton/channel.hpp"
#include "auton/types.hpp"

namespace auton {

// ---------------------------------------------------------------------------
// Process layer
// ---------------------------------------------------------------------------

struct ProcessSpec {
  std::vector<std::string> argv;  // argv[0] is looked up on PATH when it has no '/'
  std::map<std::string, std::string> env;
  std::string cwd;
  std::string stdin_data;
  std::uint64_t timeout_ms{5000};
  std::uint64_t kill_grace_ms{2000};
  std::size_t max_output_bytes{1u << 20};
  bool apply_limits{true};
  bool enforce_network_isolation{false};
  std::uint64_t cpu_seconds{0};  // 0 = derived from timeout_ms
  std::uint64_t max_memory_bytes{0};
  std::uint64_t max_file_descriptors{0};
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool cancelled{false};
  bool spawn_failed{false};
  bool output_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;
  std::uint64_t duration_ms{0};
};

// Receives output as it is read; `stream` is "stdout" or "stderr".
using OutputSink = std::function<void(const char* stream, std::string_view data)>;

// Runs the child to completion. Output is passed to `sink` (after the
// max_output_bytes cap) and not accumulated in the result.
ProcessResult run_streaming(const ProcessSpec& spec, const CancellationToken* cancel,
                            const OutputSink& sink);

// Runs the child and collects stdout/stderr into the result. A fired
// `cancel` kills the child's process group.
ProcessResult run_process(const ProcessSpec& spec, const CancellationToken* cancel = nullptr);

std::string resolve_executable(const std::string& name, const std::string& path_env);

// Resolves `rel` under `root`. Returns "" if the result escapes the root.
std::string normalize_under(const std::string& root, const std::string& rel);

bool is_secret_key(const std::string& key);

// ---------------------------------------------------------------------------
// Command execution handle
// ---------------------------------------------------------------------------

struct OutputChunk {
  std::string command_id;
  std::string correlation_id;
  std::uint64_t seq{0};
  std::string stream;
  std::string data;
};

struct ExecutionOutcome {
  std::string command_id;
  std::string correlation_id;
  CommandStatus status{CommandStatus::failed};
  int exit_code{-1};
  std::uint64_t duration_ms{0};
  bool output_truncated{false};
  std::string error;  // ErrorCode string, empty on success
};

using ExecutionUpdate = std::variant<OutputChunk, ExecutionOutcome>;

class CommandExecution {
 public:
  explicit CommandExecution(Command command);

  const Command& command() const { return command_; }
  Channel<ExecutionUpdate>& updates() { return updates_; }
  const CancellationToken& cancel_token() const { return cancel_; }
  void request_cancel() { cancel_.cancel(); }

  bool finished() const;
  std::optional<ExecutionOutcome> outcome() const;
  // Blocks until the outcome has been published or the timeout elapses.
  bool wait_for(std::chrono::milliseconds timeout) const;

  // Producer side. publish() after finish() is dropped; finish() succeeds
  // once and closes the update channel.
  void publish(const char* stream, std::string data);
  bool finish(ExecutionOutcome outcome);

 private:
  Command command_;
  Channel<ExecutionUpdate> updates_;
  CancellationToken cancel_;
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  std::optional<ExecutionOutcome> outcome_;
  std::uint64_t next_seq_{0};
};

// An execution that is already finished, used for rejected submissions.
std::shared_ptr<CommandExecution> rejected_execution(const Command& command, ErrorCode error,
                                                     const std::string& detail = "");

// ---------------------------------------------------------------------------
// Runtime interface
// ---------------------------------------------------------------------------

struct SandboxHandle {
  std::string environment_id;
  std::string project_id;
  std::string root;
  ResourceLimits limits;

  bool valid() const { return !environment_id.empty(); }
};

enum class ProvisionError {
  none,
  resource_exhausted,
  environment_unavailable,
};

std::string to_string(ProvisionError e);

struct ProvisionResult {
  std::optional<SandboxHandle> handle;
  ProvisionError error{ProvisionError::none};
  std::string detail;

  bool ok() const { return handle.has_value(); }
};

enum class CancelOutcome {
  cancelling,
  already_completed,
  not_found,
};

class SandboxRuntime {
 public:
  virtual ~SandboxRuntime() = default;

  virtual ProvisionResult provision(const std::string& project_id, const ResourceLimits& limits) = 0;
  virtual std::shared_ptr<CommandExecution> execute(const SandboxHandle& handle,
                                                    const Command& command) = 0;
  // Best effort. A completed command is left untouched.
  virtual CancelOutcome cancel(const SandboxHandle& handle, const std::string& command_id) = 0;
  // Idempotent. Cancels and reaps a running command first.
  virtual void teardown(const SandboxHandle& handle) = 0;
  virtual SandboxState state(const SandboxHandle& handle) const = 0;

  virtual bool put_file(const SandboxHandle& handle, const std::string& relative_path,
                        const std::string& bytes, std::string* error) = 0;
  virtual std::optional<std::string> get_file(const SandboxHandle& handle,
                                              const std::string& relative_path,
                                              std::string* error) const = 0;
};

struct SandboxConfig {
  std::string root{"/tmp/auton/sandboxes"};
  std::size_t max_environments{16};
  ResourceLimits default_limits;
  std::uint64_t kill_grace_ms{2000};
  bool enforce_network_isolation{false};
  bool purge_on_teardown{false};
  bool sandbox_enabled{true};
  std::string path_env{"/usr/local/bin:/usr/bin:/bin"};
  std::map<std::string, std::string> extra_env;

  // Applies AUTON_SANDBOX_ROOT and AUTON_SANDBOX_DISABLED.
  void apply_env_overrides();
};

class LocalSandboxRuntime : public SandboxRuntime {
 public:
  explicit LocalSandboxRuntime(SandboxConfig config);
  ~LocalSandboxRuntime() override;

  LocalSandboxRuntime(const LocalSandboxRuntime&) = delete;
  LocalSandboxRuntime& operator=(const LocalSandboxRuntime&) = delete;

  ProvisionResult provision(const std::string& project_id, const ResourceLimits& limits) override;
  std::shared_ptr<CommandExecution> execute(const SandboxHandle& handle,
                                            const Command& command) override;
  CancelOutcome cancel(const SandboxHandle& handle, const std::string& command_id) override;
  void teardown(const SandboxHandle& handle) override;
  SandboxState state(const SandboxHandle& handle) const override;

  bool put_file(const SandboxHandle& handle, const std::string& relative_path,
                const std::string& bytes, std::string* error) override;
  std::optional<std::string> get_file(const SandboxHandle& handle,
                                      const std::string& relative_path,
                                      std::string* error) const override;

  std::size_t live_environments() const;
  const SandboxConfig& config() const { return config_; }

 private:
  struct Environment {
    SandboxHandle handle;
    SandboxState state{SandboxState::provisioning};
    std::shared_ptr<CommandExecution> active;
    std::thread worker;
  };

  ProcessSpec spec_for(const Environment& env, const Command& command, const std::string& cwd) const;
  void run_execution(Environment* env, std::shared_ptr<CommandExecution> execution, ProcessSpec spec);

  SandboxConfig config_;
  mutable std::mutex mu_;
  std::map<std::string, std::unique_ptr<Environment>> envs_;
};

}  // namespace auton
