#pragma once

// auton/orchestrator.hpp: Binds front-end connections to session runners.
//
// THREADS:
//   - one reader per connection (serve_connection): decodes frames and posts
//     them to the session's inbox. A session-level Cancel is acknowledged
//     by the reader itself and interrupts the runner's planner call;
//   - one runner per session: owns the SessionMachine, drains the inbox,
//     pumps the in-flight command and applies timeouts;
//   - one reaper: expires parked sessions and archives terminal ones.
//
// ATTACH:
//   The first frame on a connection must be Attach. {user, project} creates
//   a session, {resume} reattaches a parked one. The reply is
//   SessionEvent{kind=attached}; buffered messages follow it in order.
//
// PARKING:
//   When a connection ends (EOF, error or a fatal protocol error) its
//   session is parked. Outbound messages are buffered up to
//   park_buffer_messages (oldest dropped first, with a notice on flush).
//   After grace_ms without reattach the session is aborted with
//   grace_expired, which cancels any command and tears the sandbox down.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "auton/archive.hpp"
#include "auton/channel.hpp"
#include "auton/protocol.hpp"
#include "auton/session.hpp"
#include "auton/transport.hpp"

namespace auton {

struct ServerConfig {
  std::string listen{"127.0.0.1:7878"};
  std::uint64_t grace_ms{30000};
  std::size_t park_buffer_messages{1024};
  std::size_t max_frame_bytes{kDefaultMaxFrameBytes};
  std::size_t max_sessions{64};
  std::uint64_t reap_interval_ms{100};
};

struct OrchestratorDeps {
  SandboxRuntime* sandbox{nullptr};
  PreferenceStore* store{nullptr};
  Planner* planner{nullptr};
  ResearchAssembler* research{nullptr};
};

class SessionRunner {
 public:
  SessionRunner(std::string session_id, std::string user_id, std::string project_id,
                SessionDeps deps, SessionSettings settings, std::size_t park_buffer_messages);
  ~SessionRunner();

  SessionRunner(const SessionRunner&) = delete;
  SessionRunner& operator=(const SessionRunner&) = delete;

  const std::string& id() const { return id_; }

  void start();
  bool post(ProtocolMessage msg);
  // Interrupts the planner call and queues abort(reason). A grace_expired
  // abort is queued once and dropped by the runner if the session has been
  // reattached by then. Returns false if nothing was queued.
  bool post_abort(ErrorCode reason);
  // Session-level Cancel from the reader thread: interrupts the machine,
  // sends cancel_acknowledged right away and queues the cancel itself.
  // Returns false if the session has already ended.
  bool post_cancel(ProtocolMessage msg);

  // Sends the attached event, flushes buffered messages and routes output
  // to `transport`. Fails if another connection holds the session.
  bool attach(Transport* transport, std::string* error);
  void detach(Transport* transport);

  bool attached() const;
  bool parked() const;
  std::uint64_t parked_since_ms() const;
  bool finished() const { return finished_.load(std::memory_order_acquire); }
  SessionPhase phase() const { return static_cast<SessionPhase>(phase_.load(std::memory_order_acquire)); }

  void join();
  // Only valid once finished() and join() have returned.
  const SessionMachine& session() const { return *machine_; }

 private:
  struct AbortRequest {
    ErrorCode reason;
  };
  struct AcknowledgedCancel {
    ProtocolMessage msg;
  };
  using Inbound = std::variant<ProtocolMessage, AbortRequest, AcknowledgedCancel>;

  void run();
  void apply(Inbound item);
  void deliver(const ProtocolMessage& msg);

  std::string id_;
  std::unique_ptr<SessionMachine> machine_;
  std::size_t park_buffer_limit_;

  Channel<Inbound> inbox_;
  std::thread thread_;
  std::atomic<bool> finished_{false};
  std::atomic<int> phase_{static_cast<int>(SessionPhase::intake)};
  std::atomic<bool> abort_posted_{false};
  std::atomic<bool> ending_posted_{false};

  mutable std::mutex mu_;
  Transport* out_{nullptr};
  bool ever_attached_{false};
  std::deque<std::string> parked_frames_;
  std::size_t dropped_{0};
  std::uint64_t parked_since_ms_{0};
};

class ExecutorOrchestrator {
 public:
  ExecutorOrchestrator(OrchestratorDeps deps, ServerConfig server, SessionSettings settings,
                       ArchiveConfig archive);
  ~ExecutorOrchestrator();

  ExecutorOrchestrator(const ExecutorOrchestrator&) = delete;
  ExecutorOrchestrator& operator=(const ExecutorOrchestrator&) = delete;

  // Reads frames until the transport ends, then parks the attached session.
  void serve_connection(Transport& transport);

  // Accept loop, one reader thread per connection. Returns after the
  // listener is closed and every connection has ended.
  void serve(Listener& listener);

  // Expires parked sessions past their grace period and archives finished
  // ones. Called by the reaper thread; exposed for tests.
  void reap(std::uint64_t now_ms);

  // Aborts every session with executor_shutdown, archives them and closes
  // open connections.
  void shutdown();

  std::vector<std::string> session_ids() const;
  std::shared_ptr<SessionRunner> find(const std::string& session_id) const;
  std::vector<std::string> archived_paths() const;

 private:
  std::shared_ptr<SessionRunner> open_session(const Attach& attach, Transport& transport,
                                              std::string* error);
  void send_error(Transport& transport, const std::string& session_id, const std::string& code,
                  const std::string& detail, bool fatal, const std::string& ref_id);
  void archive_runner(SessionRunner& runner);
  void reaper_loop();

  OrchestratorDeps deps_;
  ServerConfig server_;
  SessionSettings settings_;
  ArchiveConfig archive_;

  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<SessionRunner>> sessions_;
  std::set<Transport*> connections_;
  std::vector<std::string> archived_;

  std::mutex reaper_mu_;
  std::condition_variable reaper_cv_;
  bool stopping_{false};
  std::thread reaper_;
};

}  // namespace auton
