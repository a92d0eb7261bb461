#include "auton/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>

namespace fs = std::filesystem;

namespace auton {

namespace {

using Clock = std::chrono::steady_clock;

// Child-side setup failure report, written to a CLOEXEC pipe. A successful
// execve closes the pipe with nothing written.
struct SpawnFailure {
  int stage;  // 1 = chdir, 2 = execve, 3 = stdin
  int err;
};

void close_fd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

bool make_pipe(int fds[2]) {
  return pipe2(fds, O_CLOEXEC) == 0;
}

void set_nonblocking(int fd) {
  const int flags = fcntl(fd, F_GETFL);
  if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void ignore_sigpipe_once() {
  static const bool done = [] {
    std::signal(SIGPIPE, SIG_IGN);
    return true;
  }();
  (void)done;
}

void apply_rlimit(int resource, std::uint64_t soft, std::uint64_t hard) {
  struct rlimit rl;
  rl.rlim_cur = soft;
  rl.rlim_max = hard;
  setrlimit(resource, &rl);
}

[[noreturn]] void child_fail(int status_fd, int stage) {
  SpawnFailure f{stage, errno};
  ssize_t w = write(status_fd, &f, sizeof(f));
  (void)w;
  _exit(127);
}

// Reads whatever is available on `fd` and forwards it to the sink under the
// shared output cap. Returns false once the pipe reports EOF.
bool drain_fd(int fd, const char* stream, std::size_t& delivered, std::size_t cap,
              bool& truncated, const OutputSink& sink) {
  char buf[4096];
  while (true) {
    const ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      const std::size_t avail = delivered < cap ? cap - delivered : 0;
      const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
      if (take > 0) {
        sink(stream, std::string_view(buf, take));
        delivered += take;
      }
      if (take < static_cast<std::size_t>(n)) truncated = true;
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return true;  // EAGAIN: nothing more right now
  }
}

std::string sanitize_component(const std::string& id) {
  std::string out;
  out.reserve(id.size());
  for (char c : id) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
        c == '-' || c == '_' || c == '.') {
      out.push_back(c);
    } else {
      out.push_back('_');
    }
  }
  if (out.empty() || out == "." || out == "..") out = "_" + out;
  return out;
}

bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  static thread_local std::mt19937_64 rng(std::random_device{}());
  const fs::path tmp = target.parent_path() / (".tmp_" + std::to_string(rng()));
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      fs::remove(tmp, ec);
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

ExecutionOutcome outcome_from(const ProcessResult& r, const Command& command) {
  ExecutionOutcome o;
  o.command_id = command.command_id;
  o.correlation_id = command.correlation_id;
  o.exit_code = r.exit_code;
  o.duration_ms = r.duration_ms;
  o.output_truncated = r.output_truncated;
  if (r.spawn_failed) {
    o.status = CommandStatus::failed;
    o.error = to_string(ErrorCode::spawn_failed);
  } else if (r.timed_out) {
    o.status = CommandStatus::timed_out;
    o.error = to_string(ErrorCode::timeout);
  } else if (r.cancelled) {
    o.status = CommandStatus::cancelled;
    o.error = to_string(ErrorCode::cancelled);
  } else if (r.exit_code != 0) {
    o.status = CommandStatus::failed;
    o.error = to_string(ErrorCode::nonzero_exit);
  } else {
    o.status = CommandStatus::succeeded;
  }
  return o;
}

}  // namespace

// ---------------------------------------------------------------------------
// Process layer
// ---------------------------------------------------------------------------

std::string resolve_executable(const std::string& name, const std::string& path_env) {
  if (name.empty()) return {};
  if (name.find('/') != std::string::npos) return name;
  std::size_t start = 0;
  while (start <= path_env.size()) {
    std::size_t end = path_env.find(':', start);
    if (end == std::string::npos) end = path_env.size();
    const std::string dir = path_env.substr(start, end - start);
    if (!dir.empty()) {
      const std::string candidate = dir + "/" + name;
      struct stat st;
      if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
          access(candidate.c_str(), X_OK) == 0) {
        return candidate;
      }
    }
    start = end + 1;
  }
  return {};
}

std::string normalize_under(const std::string& root, const std::string& rel) {
  std::error_code ec;
  const fs::path base = fs::weakly_canonical(fs::path(root), ec);
  if (ec) return "";
  if (!rel.empty() && fs::path(rel).is_absolute()) return "";
  const fs::path in = rel.empty() ? base : fs::weakly_canonical(base / rel, ec);
  if (ec) return "";
  const std::string base_str = base.string();
  const std::string in_str = in.string();
  if (in_str != base_str && in_str.rfind(base_str + "/", 0) != 0) return "";
  return in_str;
}

bool is_secret_key(const std::string& key) {
  auto ends_with = [&](const std::string& suffix) {
    return key.size() >= suffix.size() &&
           key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  auto starts_with = [&](const std::string& prefix) { return key.rfind(prefix, 0) == 0; };
  if (ends_with("_TOKEN") || ends_with("_SECRET") || ends_with("_KEY") ||
      ends_with("_PASSWORD") || ends_with("_CREDENTIAL") || ends_with("_CREDENTIALS")) {
    return true;
  }
  return starts_with("AUTH") || starts_with("COOKIE") || starts_with("AWS_SECRET") ||
         starts_with("GH_TOKEN") || starts_with("GITHUB_TOKEN") || starts_with("NPM_TOKEN") ||
         starts_with("OPENAI_") || starts_with("ANTHROPIC_");
}

ProcessResult run_streaming(const ProcessSpec& spec, const CancellationToken* cancel,
                            const OutputSink& sink) {
  ignore_sigpipe_once();
  ProcessResult result;
  const auto started = Clock::now();
  auto finish_duration = [&] {
    result.duration_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count());
  };

  if (spec.argv.empty()) {
    result.spawn_failed = true;
    result.exit_code = 127;
    result.error_message = "empty argv";
    return result;
  }
  auto path_it = spec.env.find("PATH");
  const std::string exe =
      resolve_executable(spec.argv[0], path_it != spec.env.end() ? path_it->second : "");
  if (exe.empty()) {
    result.spawn_failed = true;
    result.exit_code = 127;
    result.error_message = "executable not found: " + spec.argv[0];
    return result;
  }

  // Everything the child needs is built before fork(); the child only makes
  // async-signal-safe calls.
  std::vector<std::string> args = spec.argv;
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& s : args) argv.push_back(s.data());
  argv.push_back(nullptr);
  std::vector<std::string> envs;
  envs.reserve(spec.env.size());
  for (const auto& [k, v] : spec.env) envs.push_back(k + "=" + v);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  std::uint64_t cpu_soft = spec.cpu_seconds;
  if (cpu_soft == 0 && spec.timeout_ms > 0) cpu_soft = (spec.timeout_ms + 999) / 1000 + 1;

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int in_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(status_pipe) ||
      (!spec.stdin_data.empty() && !make_pipe(in_pipe))) {
    for (int* p : {out_pipe, err_pipe, in_pipe, status_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    result.spawn_failed = true;
    result.exit_code = 127;
    result.error_message = std::string("pipe: ") + std::strerror(errno);
    return result;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    for (int* p : {out_pipe, err_pipe, in_pipe, status_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    result.spawn_failed = true;
    result.exit_code = 127;
    result.error_message = std::string("fork: ") + std::strerror(errno);
    return result;
  }

  if (pid == 0) {
    setsid();
#if defined(__linux__)
    if (spec.apply_limits && spec.enforce_network_isolation) {
      // Needs CAP_SYS_ADMIN; without it the command keeps host networking.
      (void)unshare(CLONE_NEWNET);
    }
#endif
    if (in_pipe[0] >= 0) {
      dup2(in_pipe[0], STDIN_FILENO);
    } else {
      const int devnull = open("/dev/null", O_RDONLY);
      if (devnull < 0) child_fail(status_pipe[1], 3);
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);

    if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) child_fail(status_pipe[1], 1);

    if (spec.apply_limits) {
      if (spec.max_memory_bytes > 0) {
        apply_rlimit(RLIMIT_AS, spec.max_memory_bytes, spec.max_memory_bytes);
      }
      if (spec.max_file_descriptors > 0) {
        apply_rlimit(RLIMIT_NOFILE, spec.max_file_descriptors, spec.max_file_descriptors);
      }
      if (cpu_soft > 0) apply_rlimit(RLIMIT_CPU, cpu_soft, cpu_soft + 1);
    }

    execve(exe.c_str(), argv.data(), envp.data());
    child_fail(status_pipe[1], 2);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(in_pipe[0]);
  close_fd(status_pipe[1]);

  SpawnFailure failure{0, 0};
  ssize_t n = 0;
  do {
    n = read(status_pipe[0], &failure, sizeof(failure));
  } while (n < 0 && errno == EINTR);
  close_fd(status_pipe[0]);
  if (n == static_cast<ssize_t>(sizeof(failure))) {
    int status = 0;
    waitpid(pid, &status, 0);
    for (int* p : {out_pipe, err_pipe, in_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    const char* stage = failure.stage == 1 ? "chdir" : failure.stage == 3 ? "stdin" : "execve";
    result.spawn_failed = true;
    result.exit_code = 127;
    result.error_message = std::string(stage) + ": " + std::strerror(failure.err);
    finish_duration();
    return result;
  }

  set_nonblocking(out_pipe[0]);
  set_nonblocking(err_pipe[0]);
  if (in_pipe[1] >= 0) set_nonblocking(in_pipe[1]);

  const auto deadline = spec.timeout_ms > 0
                            ? started + std::chrono::milliseconds(spec.timeout_ms)
                            : Clock::time_point::max();
  std::size_t delivered = 0;
  std::size_t stdin_off = 0;
  bool out_open = true;
  bool err_open = true;
  bool terminating = false;
  bool killed = false;
  Clock::time_point term_sent{};
  int status = 0;

  while (true) {
    struct pollfd pfds[3];
    nfds_t nfds = 0;
    if (out_open) pfds[nfds++] = {out_pipe[0], POLLIN, 0};
    if (err_open) pfds[nfds++] = {err_pipe[0], POLLIN, 0};
    if (in_pipe[1] >= 0) pfds[nfds++] = {in_pipe[1], POLLOUT, 0};
    if (nfds > 0) {
      poll(pfds, nfds, 20);
    } else {
      usleep(20 * 1000);
    }

    if (out_open) {
      out_open = drain_fd(out_pipe[0], "stdout", delivered, spec.max_output_bytes,
                          result.output_truncated, sink);
    }
    if (err_open) {
      err_open = drain_fd(err_pipe[0], "stderr", delivered, spec.max_output_bytes,
                          result.output_truncated, sink);
    }
    if (in_pipe[1] >= 0) {
      const ssize_t w = write(in_pipe[1], spec.stdin_data.data() + stdin_off,
                              spec.stdin_data.size() - stdin_off);
      if (w > 0) stdin_off += static_cast<std::size_t>(w);
      if (stdin_off >= spec.stdin_data.size() || (w < 0 && errno != EAGAIN && errno != EINTR)) {
        close_fd(in_pipe[1]);
      }
    }

    const pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid) break;

    const auto now = Clock::now();
    if (!terminating) {
      const bool expired = now >= deadline;
      const bool cancelled = cancel && cancel->cancelled();
      if (expired || cancelled) {
        result.timed_out = expired;
        result.cancelled = !expired;
        kill(-pid, SIGTERM);
        terminating = true;
        term_sent = now;
      }
    } else if (!killed && now - term_sent >= std::chrono::milliseconds(spec.kill_grace_ms)) {
      kill(-pid, SIGKILL);
      killed = true;
    }
  }

  // Leader is gone; collect what is still buffered, then sweep the group so
  // no background child outlives the command.
  if (out_open) {
    drain_fd(out_pipe[0], "stdout", delivered, spec.max_output_bytes, result.output_truncated, sink);
  }
  if (err_open) {
    drain_fd(err_pipe[0], "stderr", delivered, spec.max_output_bytes, result.output_truncated, sink);
  }
  kill(-pid, SIGKILL);
  close_fd(out_pipe[0]);
  close_fd(err_pipe[0]);
  close_fd(in_pipe[1]);

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  finish_duration();
  return result;
}

ProcessResult run_process(const ProcessSpec& spec, const CancellationToken* cancel) {
  std::string out;
  std::string err;
  ProcessResult r = run_streaming(spec, cancel, [&](const char* stream, std::string_view data) {
    if (std::strcmp(stream, "stdout") == 0) {
      out.append(data);
    } else {
      err.append(data);
    }
  });
  r.stdout_text = std::move(out);
  r.stderr_text = std::move(err);
  return r;
}

// ---------------------------------------------------------------------------
// CommandExecution
// ---------------------------------------------------------------------------

CommandExecution::CommandExecution(Command command) : command_(std::move(command)) {}

bool CommandExecution::finished() const {
  std::lock_guard<std::mutex> lk(mu_);
  return outcome_.has_value();
}

std::optional<ExecutionOutcome> CommandExecution::outcome() const {
  std::lock_guard<std::mutex> lk(mu_);
  return outcome_;
}

bool CommandExecution::wait_for(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, timeout, [&] { return outcome_.has_value(); });
}

void CommandExecution::publish(const char* stream, std::string data) {
  std::lock_guard<std::mutex> lk(mu_);
  if (outcome_) return;
  OutputChunk chunk;
  chunk.command_id = command_.command_id;
  chunk.correlation_id = command_.correlation_id;
  chunk.seq = next_seq_++;
  chunk.stream = stream;
  chunk.data = std::move(data);
  updates_.push(std::move(chunk));
}

bool CommandExecution::finish(ExecutionOutcome outcome) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (outcome_) return false;
    outcome_ = outcome;
    updates_.push(std::move(outcome));
    updates_.close();
  }
  cv_.notify_all();
  return true;
}

std::shared_ptr<CommandExecution> rejected_execution(const Command& command, ErrorCode error,
                                                     const std::string& detail) {
  auto exec = std::make_shared<CommandExecution>(command);
  ExecutionOutcome o;
  o.command_id = command.command_id;
  o.correlation_id = command.correlation_id;
  o.status = CommandStatus::failed;
  o.error = to_string(error);
  if (!detail.empty()) o.error += ": " + detail;
  exec->finish(std::move(o));
  return exec;
}

// ---------------------------------------------------------------------------
// LocalSandboxRuntime
// ---------------------------------------------------------------------------

std::string to_string(ProvisionError e) {
  switch (e) {
    case ProvisionError::none: return "";
    case ProvisionError::resource_exhausted: return to_string(ErrorCode::resource_exhausted);
    case ProvisionError::environment_unavailable: return to_string(ErrorCode::environment_unavailable);
  }
  return "";
}

void SandboxConfig::apply_env_overrides() {
  if (const char* root_env = std::getenv("AUTON_SANDBOX_ROOT"); root_env && root_env[0]) {
    root = root_env;
  }
  if (const char* disabled = std::getenv("AUTON_SANDBOX_DISABLED");
      disabled && std::string(disabled) == "1") {
    sandbox_enabled = false;
  }
}

LocalSandboxRuntime::LocalSandboxRuntime(SandboxConfig config) : config_(std::move(config)) {
  if (!config_.sandbox_enabled) {
    std::cerr << "[sandbox] enforcement disabled: rlimits and network isolation skipped\n";
  }
}

LocalSandboxRuntime::~LocalSandboxRuntime() {
  std::vector<SandboxHandle> live;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, env] : envs_) live.push_back(env->handle);
  }
  for (const auto& h : live) teardown(h);
}

std::size_t LocalSandboxRuntime::live_environments() const {
  std::lock_guard<std::mutex> lk(mu_);
  return envs_.size();
}

ProvisionResult LocalSandboxRuntime::provision(const std::string& project_id,
                                               const ResourceLimits& limits) {
  ProvisionResult result;
  std::lock_guard<std::mutex> lk(mu_);
  if (envs_.size() >= config_.max_environments) {
    result.error = ProvisionError::resource_exhausted;
    result.detail = "environment quota reached (" + std::to_string(config_.max_environments) + ")";
    return result;
  }
  const std::string component = sanitize_component(project_id);
  for (const auto& [id, env] : envs_) {
    if (env->handle.project_id == project_id) {
      result.error = ProvisionError::environment_unavailable;
      result.detail = "project environment already in use by " + id;
      return result;
    }
  }

  std::error_code ec;
  const fs::path root = fs::path(config_.root) / component;
  fs::create_directories(root, ec);
  if (ec) {
    result.error = ProvisionError::environment_unavailable;
    result.detail = root.string() + ": " + ec.message();
    return result;
  }
  if (access(root.c_str(), R_OK | W_OK | X_OK) != 0) {
    result.error = ProvisionError::environment_unavailable;
    result.detail = root.string() + ": " + std::strerror(errno);
    return result;
  }
  const fs::path canonical = fs::weakly_canonical(root, ec);
  if (ec) {
    result.error = ProvisionError::environment_unavailable;
    result.detail = root.string() + ": " + ec.message();
    return result;
  }

  auto env = std::make_unique<Environment>();
  env->handle.environment_id = new_id("env");
  env->handle.project_id = project_id;
  env->handle.root = canonical.string();
  env->handle.limits = limits;
  env->state = SandboxState::ready;
  result.handle = env->handle;
  envs_[env->handle.environment_id] = std::move(env);
  return result;
}

ProcessSpec LocalSandboxRuntime::spec_for(const Environment& env, const Command& command,
                                          const std::string& cwd) const {
  ProcessSpec spec;
  spec.argv = command.argv;
  spec.cwd = cwd;
  spec.timeout_ms = command.timeout_ms > 0 ? command.timeout_ms : env.handle.limits.wall_time_ms;
  spec.kill_grace_ms = config_.kill_grace_ms;
  spec.max_output_bytes = env.handle.limits.max_output_bytes;
  spec.apply_limits = config_.sandbox_enabled;
  spec.enforce_network_isolation = config_.enforce_network_isolation;
  spec.cpu_seconds = env.handle.limits.cpu_seconds;
  spec.max_memory_bytes = env.handle.limits.memory_bytes;
  spec.max_file_descriptors = env.handle.limits.max_file_descriptors;
  for (const auto& [k, v] : config_.extra_env) {
    if (!is_secret_key(k)) spec.env[k] = v;
  }
  spec.env["PATH"] = config_.path_env;
  spec.env["HOME"] = env.handle.root;
  spec.env["LANG"] = "C.UTF-8";
  spec.env["TERM"] = "dumb";
  spec.env["AUTON_ENVIRONMENT_ID"] = env.handle.environment_id;
  return spec;
}

std::shared_ptr<CommandExecution> LocalSandboxRuntime::execute(const SandboxHandle& handle,
                                                               const Command& command) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = envs_.find(handle.environment_id);
  if (it == envs_.end() || it->second->state == SandboxState::terminating ||
      it->second->state == SandboxState::terminated) {
    return rejected_execution(command, ErrorCode::sandbox_terminated);
  }
  Environment& env = *it->second;
  if (env.state == SandboxState::busy) {
    return rejected_execution(command, ErrorCode::sandbox_busy);
  }
  if (command.argv.empty() || command.argv[0].empty()) {
    return rejected_execution(command, ErrorCode::invalid_command, "empty argv");
  }
  const std::string cwd = normalize_under(env.handle.root, command.cwd);
  if (cwd.empty()) {
    return rejected_execution(command, ErrorCode::path_escape, command.cwd);
  }

  // The previous worker has already published its outcome; reap it.
  if (env.worker.joinable()) env.worker.join();

  auto execution = std::make_shared<CommandExecution>(command);
  env.active = execution;
  env.state = SandboxState::busy;
  env.worker = std::thread(&LocalSandboxRuntime::run_execution, this, &env, execution,
                           spec_for(env, command, cwd));
  return execution;
}

void LocalSandboxRuntime::run_execution(Environment* env,
                                        std::shared_ptr<CommandExecution> execution,
                                        ProcessSpec spec) {
  CommandExecution* exec = execution.get();
  ProcessResult r = run_streaming(spec, &exec->cancel_token(),
                                  [exec](const char* stream, std::string_view data) {
                                    exec->publish(stream, std::string(data));
                                  });
  ExecutionOutcome outcome = outcome_from(r, exec->command());
  if (r.spawn_failed && !r.error_message.empty()) outcome.error += ": " + r.error_message;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (env->state == SandboxState::busy) env->state = SandboxState::ready;
  }
  exec->finish(std::move(outcome));
}

CancelOutcome LocalSandboxRuntime::cancel(const SandboxHandle& handle,
                                          const std::string& command_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = envs_.find(handle.environment_id);
  if (it == envs_.end()) return CancelOutcome::not_found;
  const auto& active = it->second->active;
  if (!active || active->command().command_id != command_id) return CancelOutcome::not_found;
  if (active->finished()) return CancelOutcome::already_completed;
  active->request_cancel();
  return CancelOutcome::cancelling;
}

void LocalSandboxRuntime::teardown(const SandboxHandle& handle) {
  std::shared_ptr<CommandExecution> active;
  std::thread worker;
  Environment* env = nullptr;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = envs_.find(handle.environment_id);
    if (it == envs_.end()) return;
    env = it->second.get();
    if (env->state == SandboxState::terminating || env->state == SandboxState::terminated) return;
    env->state = SandboxState::terminating;
    active = env->active;
    worker = std::move(env->worker);
  }
  if (active && !active->finished()) active->request_cancel();
  if (worker.joinable()) worker.join();

  std::lock_guard<std::mutex> lk(mu_);
  env->state = SandboxState::terminated;
  if (config_.purge_on_teardown) {
    std::error_code ec;
    fs::remove_all(env->handle.root, ec);
    if (ec) std::cerr << "[sandbox] purge of " << env->handle.root << " failed: " << ec.message() << "\n";
  }
  envs_.erase(handle.environment_id);
}

SandboxState LocalSandboxRuntime::state(const SandboxHandle& handle) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = envs_.find(handle.environment_id);
  if (it == envs_.end()) return SandboxState::terminated;
  return it->second->state;
}

bool LocalSandboxRuntime::put_file(const SandboxHandle& handle, const std::string& relative_path,
                                   const std::string& bytes, std::string* error) {
  if (state(handle) == SandboxState::terminated) {
    if (error) *error = to_string(ErrorCode::sandbox_terminated);
    return false;
  }
  const std::string target = normalize_under(handle.root, relative_path);
  if (target.empty() || target == handle.root) {
    if (error) *error = to_string(ErrorCode::path_escape);
    return false;
  }
  if (!atomic_write(target, bytes)) {
    if (error) *error = "write failed: " + target;
    return false;
  }
  return true;
}

std::optional<std::string> LocalSandboxRuntime::get_file(const SandboxHandle& handle,
                                                         const std::string& relative_path,
                                                         std::string* error) const {
  if (state(handle) == SandboxState::terminated) {
    if (error) *error = to_string(ErrorCode::sandbox_terminated);
    return std::nullopt;
  }
  const std::string target = normalize_under(handle.root, relative_path);
  if (target.empty()) {
    if (error) *error = to_string(ErrorCode::path_escape);
    return std::nullopt;
  }
  std::ifstream ifs(target, std::ios::binary);
  if (!ifs) {
    if (error) *error = "not found: " + relative_path;
    return std::nullopt;
  }
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

}  // namespace auton
