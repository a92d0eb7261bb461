#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "auton/archive.hpp"
#include "auton/config.hpp"
#include "auton/hash.hpp"
#include "auton/jsonlite.hpp"
#include "auton/observability.hpp"
#include "auton/orchestrator.hpp"
#include "auton/planner.hpp"
#include "auton/preference_store.hpp"
#include "auton/protocol.hpp"
#include "auton/sandbox.hpp"
#include "auton/session.hpp"
#include "auton/transport.hpp"
#include "auton/version.hpp"

namespace {

void print_error(const std::string &code, const std::string &detail) {
  auton::jsonlite::Object o;
  o["error"] = code;
  if (!detail.empty())
    o["detail"] = detail;
  std::cerr << auton::jsonlite::to_json(o) << "\n";
}

std::string report_to_json(const auton::ConfigValidationResult &r) {
  auton::jsonlite::Object o;
  o["ok"] = r.ok;
  o["config_version"] = r.config_version;
  o["errors"] = auton::jsonlite::to_array(r.errors);
  o["warnings"] = auton::jsonlite::to_array(r.warnings);
  return auton::jsonlite::to_json(o);
}

std::string fact_to_json(const auton::PreferenceFact &f) {
  auton::jsonlite::Object o;
  o["key"] = f.key;
  o["value"] = f.value;
  o["confidence"] = f.confidence;
  o["source_session"] = f.source_session;
  o["timestamp"] = f.timestamp_unix_ms;
  return auton::jsonlite::to_json(o);
}

std::vector<std::string> split_words(const std::string &s) {
  std::vector<std::string> out;
  std::istringstream in(s);
  std::string w;
  while (in >> w)
    out.push_back(w);
  return out;
}

// Loads and validates configuration. Warnings go to stderr; errors make the
// command fail with exit code 2.
bool load_checked(const std::string &path, auton::AutonConfig &out) {
  auton::ConfigValidationResult report;
  auto cfg = auton::load_config(path, &report);
  if (!cfg) {
    std::cerr << report_to_json(report) << "\n";
    return false;
  }
  auto checked = auton::validate_config(*cfg);
  for (const auto &w : report.warnings)
    std::cerr << "[config] warning: " << w << "\n";
  for (const auto &w : checked.warnings)
    std::cerr << "[config] warning: " << w << "\n";
  if (!checked.ok) {
    std::cerr << report_to_json(checked) << "\n";
    return false;
  }
  out = std::move(*cfg);
  return true;
}

// The collaborators a served executor needs, owned for the process lifetime.
struct Executor {
  explicit Executor(const auton::AutonConfig &cfg)
      : sandbox(cfg.sandbox), store(cfg.state_dir), planner(cfg.planner),
        orchestrator({&sandbox, &store, &planner, nullptr}, cfg.server,
                     cfg.session, cfg.archive) {}

  auton::LocalSandboxRuntime sandbox;
  auton::FilePreferenceStore store;
  auton::SubprocessPlanner planner;
  auton::ExecutorOrchestrator orchestrator;
};

// Human-readable rendering of one inbound frame for the attach client.
void render(const auton::ProtocolMessage &msg) {
  if (auto *a = std::get_if<auton::AssistantOutput>(&msg.body)) {
    if (a->first)
      std::cout << "[" << a->topic << "] ";
    std::cout << a->text;
    if (a->last)
      std::cout << "\n";
  } else if (auto *c = std::get_if<auton::CommandOutputChunk>(&msg.body)) {
    std::cout << c->data;
  } else if (auto *r = std::get_if<auton::CommandRequest>(&msg.body)) {
    std::cout << "$";
    for (const auto &a : r->argv)
      std::cout << " " << a;
    if (!r->step.empty())
      std::cout << "    # " << r->step;
    std::cout << "\n";
  } else if (auto *r = std::get_if<auton::CommandResult>(&msg.body)) {
    std::cout << "[result] " << auton::to_string(r->status)
              << " exit=" << r->exit_code << " " << r->duration_ms << "ms";
    if (!r->error.empty())
      std::cout << " " << r->error;
    std::cout << "\n";
  } else if (auto *e = std::get_if<auton::SessionEvent>(&msg.body)) {
    std::cout << "[event] " << e->kind;
    if (!e->from_phase.empty())
      std::cout << " " << e->from_phase << " -> " << e->phase;
    else if (!e->phase.empty())
      std::cout << " " << e->phase;
    if (!e->trigger.empty())
      std::cout << " (" << e->trigger << ")";
    if (!e->reason.empty())
      std::cout << " " << e->reason;
    std::cout << "\n";
  } else if (auto *e = std::get_if<auton::ErrorMessage>(&msg.body)) {
    std::cout << "[error] " << e->code << (e->fatal ? " fatal" : "") << ": "
              << e->detail << "\n";
  }
  std::cout.flush();
}

// Turns one line typed at the attach client into a message body.
//   /approve              approve the pending plan
//   /confirm k1 k2 ..     confirm low-confidence preferences
//   /run argv..           queue a manual command
//   /cancel [id]          cancel a command, or the whole session
//   anything else         plain user input
auton::MessageBody line_to_body(const std::string &line) {
  if (line == "/approve") {
    auton::UserInput in;
    in.approve = true;
    return in;
  }
  if (line.rfind("/confirm", 0) == 0) {
    auton::UserInput in;
    auto words = split_words(line.substr(8));
    in.confirm_preferences = words;
    return in;
  }
  if (line.rfind("/run ", 0) == 0) {
    auton::CommandRequest req;
    req.correlation_id = auton::new_id("corr");
    req.argv = split_words(line.substr(5));
    req.origin = auton::CommandOrigin::user;
    return req;
  }
  if (line.rfind("/cancel", 0) == 0) {
    auton::Cancel c;
    auto words = split_words(line.substr(7));
    if (!words.empty())
      c.target = words[0];
    return c;
  }
  auton::UserInput in;
  in.text = line;
  return in;
}

} // namespace

int main(int argc, char **argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0)
      continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty()) {
    std::cerr << "usage: auton <serve|stdio|attach|prefs|replay|version|"
                 "health|config> [options]\n";
    return 1;
  }

  std::string config_path;
  for (int i = 1; i < argc; ++i)
    if (std::string(argv[i]) == "--config" && i + 1 < argc)
      config_path = argv[i + 1];

  if (cmd == "version") {
    std::cout << auton::version::manifest_to_json(
                     auton::version::current_manifest())
              << "\n";
    return 0;
  }

  if (cmd == "health") {
    const auto h = auton::hash_runtime_info();
    std::cout << "{\"ok\":true"
              << ",\"engine_semver\":\"" << auton::version::ENGINE_SEMVER
              << "\""
              << ",\"hash_primitive\":\"" << h.primitive << "\""
              << ",\"hash_version\":\"" << h.version << "\""
              << ",\"zstd\":" << (auton::zstd_compiled_in() ? "true" : "false")
              << ",\"stats\":" << auton::global_executor_stats().to_json()
              << "}\n";
    return 0;
  }

  // ---------------------------------------------------------------------------
  // config check / show
  // check exits 2 when the merged configuration has errors.
  // ---------------------------------------------------------------------------
  if (cmd == "config" && argc >= 3 && std::string(argv[2]) == "check") {
    auton::ConfigValidationResult report;
    auto cfg = auton::load_config(config_path, &report);
    if (!cfg) {
      std::cout << report_to_json(report) << "\n";
      return 2;
    }
    auto checked = auton::validate_config(*cfg);
    checked.warnings.insert(checked.warnings.begin(), report.warnings.begin(),
                            report.warnings.end());
    std::cout << report_to_json(checked) << "\n";
    return checked.ok ? 0 : 2;
  }

  if (cmd == "config" && argc >= 3 && std::string(argv[2]) == "show") {
    auton::ConfigValidationResult report;
    auto cfg = auton::load_config(config_path, &report);
    if (!cfg) {
      std::cerr << report_to_json(report) << "\n";
      return 2;
    }
    std::cout << auton::config_to_json(*cfg) << "\n";
    return 0;
  }

  // ---------------------------------------------------------------------------
  // serve: accept front-end connections until SIGINT/SIGTERM.
  // ---------------------------------------------------------------------------
  if (cmd == "serve") {
    auton::AutonConfig cfg;
    if (!load_checked(config_path, cfg))
      return 2;
    for (int i = 2; i < argc; ++i)
      if (std::string(argv[i]) == "--listen" && i + 1 < argc)
        cfg.server.listen = argv[++i];

    std::string err;
    auto addr = auton::parse_listen_address(cfg.server.listen, &err);
    if (!addr) {
      print_error("config_invalid", err);
      return 2;
    }

    // Block the shutdown signals before any thread starts so that only the
    // waiter below receives them.
    ::signal(SIGPIPE, SIG_IGN);
    sigset_t stop_set;
    sigemptyset(&stop_set);
    sigaddset(&stop_set, SIGINT);
    sigaddset(&stop_set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_set, nullptr);

    auto listener = auton::Listener::open(*addr, &err);
    if (!listener) {
      print_error("listen_failed", err);
      return 1;
    }
    Executor exec(cfg);
    std::cerr << "[serve] listening on " << listener->address().to_string()
              << "\n";

    std::atomic<bool> signalled{false};
    std::thread waiter([&] {
      int sig = 0;
      sigwait(&stop_set, &sig);
      signalled.store(true);
      listener->close();
    });

    exec.orchestrator.serve(*listener);
    if (!signalled.load())
      pthread_kill(waiter.native_handle(), SIGTERM);
    waiter.join();

    exec.orchestrator.shutdown();
    std::cerr << "[serve] stopped, archived "
              << exec.orchestrator.archived_paths().size() << " sessions\n";
    return 0;
  }

  // ---------------------------------------------------------------------------
  // stdio: serve one front-end over stdin/stdout. The session ends with the
  // stream, since there is nothing to reattach through.
  // ---------------------------------------------------------------------------
  if (cmd == "stdio") {
    auton::AutonConfig cfg;
    if (!load_checked(config_path, cfg))
      return 2;
    ::signal(SIGPIPE, SIG_IGN);
    Executor exec(cfg);
    auto transport = auton::stdio_transport();
    exec.orchestrator.serve_connection(*transport);
    exec.orchestrator.shutdown();
    return 0;
  }

  // ---------------------------------------------------------------------------
  // attach: interactive front-end for a running `auton serve`.
  // ---------------------------------------------------------------------------
  if (cmd == "attach") {
    std::string connect = "127.0.0.1:7878";
    auton::Attach attach;
    bool raw = false;
    for (int i = 2; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "--connect" && i + 1 < argc)
        connect = argv[++i];
      else if (a == "--user" && i + 1 < argc)
        attach.user_id = argv[++i];
      else if (a == "--project" && i + 1 < argc)
        attach.project_id = argv[++i];
      else if (a == "--resume" && i + 1 < argc)
        attach.resume_session = argv[++i];
      else if (a == "--raw")
        raw = true;
    }
    if (attach.resume_session.empty() &&
        (attach.user_id.empty() || attach.project_id.empty())) {
      print_error("invalid_field",
                  "attach needs --user and --project, or --resume");
      return 2;
    }

    std::string err;
    auto addr = auton::parse_listen_address(connect, &err);
    if (!addr) {
      print_error("invalid_field", err);
      return 2;
    }
    ::signal(SIGPIPE, SIG_IGN);
    auto conn = auton::connect_to(*addr, &err);
    if (!conn) {
      print_error("connect_failed", err);
      return 1;
    }

    std::mutex mu;
    std::condition_variable cv;
    std::string session_id = attach.resume_session;
    bool attached = false;
    bool ended = false;

    std::thread reader([&] {
      auton::FrameDecoder decoder;
      char buf[4096];
      while (true) {
        const long n = conn->read_some(buf, sizeof(buf));
        if (n <= 0)
          break;
        for (auto &item : decoder.feed(std::string_view(buf, n))) {
          if (item.error) {
            std::cerr << "[attach] bad frame: " << item.error->code << " "
                      << item.error->detail << "\n";
            continue;
          }
          const auto &msg = *item.message;
          if (raw) {
            std::cout << auton::encode(msg);
            std::cout.flush();
          } else {
            render(msg);
          }
          if (auto *e = std::get_if<auton::SessionEvent>(&msg.body)) {
            if (e->kind == "attached") {
              std::lock_guard<std::mutex> lk(mu);
              session_id = msg.session_id;
              attached = true;
              cv.notify_all();
            }
          }
        }
        if (decoder.broken())
          break;
      }
      std::lock_guard<std::mutex> lk(mu);
      ended = true;
      cv.notify_all();
    });

    int rc = 0;
    if (!conn->write_all(auton::encode(auton::make_message(session_id, attach)))) {
      print_error("connect_failed", "could not send attach");
      rc = 1;
    } else {
      std::unique_lock<std::mutex> lk(mu);
      cv.wait(lk, [&] { return attached || ended; });
      if (!attached)
        rc = 1;
    }

    std::string line;
    while (rc == 0 && std::getline(std::cin, line)) {
      if (line == "/quit")
        break;
      if (line.empty())
        continue;
      std::string sid;
      {
        std::lock_guard<std::mutex> lk(mu);
        if (ended)
          break;
        sid = session_id;
      }
      if (!conn->write_all(
              auton::encode(auton::make_message(sid, line_to_body(line))))) {
        rc = 1;
        break;
      }
    }
    conn->close();
    reader.join();
    {
      std::lock_guard<std::mutex> lk(mu);
      if (attached)
        std::cerr << "[attach] detached from " << session_id << "\n";
    }
    return rc;
  }

  // ---------------------------------------------------------------------------
  // prefs get|history|verify --user <id>
  // ---------------------------------------------------------------------------
  if (cmd == "prefs" && argc >= 3) {
    const std::string sub = argv[2];
    std::string user;
    std::string state_dir;
    for (int i = 3; i < argc; ++i) {
      if (std::string(argv[i]) == "--user" && i + 1 < argc)
        user = argv[++i];
      else if (std::string(argv[i]) == "--state-dir" && i + 1 < argc)
        state_dir = argv[++i];
    }
    if (user.empty()) {
      print_error("invalid_field", "--user is required");
      return 2;
    }
    if (state_dir.empty()) {
      auton::AutonConfig cfg;
      if (!load_checked(config_path, cfg))
        return 2;
      state_dir = cfg.state_dir;
    }
    auton::FilePreferenceStore store(state_dir);

    if (sub == "get") {
      std::cout << "{\"user\":\"" << auton::jsonlite::escape(user)
                << "\",\"facts\":[";
      bool first = true;
      for (const auto &f : store.get(user)) {
        std::cout << (first ? "" : ",") << fact_to_json(f);
        first = false;
      }
      std::cout << "]}\n";
      return 0;
    }
    if (sub == "history") {
      for (const auto &r : store.history(user)) {
        std::cout << "{\"seq\":" << r.seq << ",\"fact\":" << fact_to_json(r.fact)
                  << ",\"digest\":\"" << r.digest << "\"}\n";
      }
      return 0;
    }
    if (sub == "verify") {
      std::string err;
      const bool ok = store.verify_history(user, &err);
      auton::jsonlite::Object o;
      o["ok"] = ok;
      o["user"] = user;
      if (!ok)
        o["error"] = err;
      std::cout << auton::jsonlite::to_json(o) << "\n";
      return ok ? 0 : 2;
    }
    print_error("invalid_field", "unknown prefs subcommand '" + sub + "'");
    return 1;
  }

  // ---------------------------------------------------------------------------
  // replay --archive <file> [--frames]
  // Verifies the event chain of an archived session and prints its events.
  // ---------------------------------------------------------------------------
  if (cmd == "replay") {
    std::string path;
    bool frames = false;
    for (int i = 2; i < argc; ++i) {
      if (std::string(argv[i]) == "--archive" && i + 1 < argc)
        path = argv[++i];
      else if (std::string(argv[i]) == "--frames")
        frames = true;
    }
    if (path.empty()) {
      print_error("invalid_field", "--archive is required");
      return 2;
    }
    std::string err;
    auto archive = auton::read_archive(path, &err);
    if (!archive) {
      print_error("archive_unreadable", err);
      return 2;
    }
    std::string chain_err;
    const bool chain_ok = auton::verify_event_chain(archive->events, &chain_err);
    for (const auto &ev : archive->events)
      std::cout << auton::event_record_to_json(ev) << "\n";
    if (frames)
      for (const auto &f : archive->frames)
        std::cout << f << "\n";

    auton::jsonlite::Object summary;
    summary["session"] = archive->session_id;
    summary["phase"] = archive->final_phase;
    summary["reason"] = archive->reason;
    summary["events"] = static_cast<std::uint64_t>(archive->events.size());
    summary["frames"] = static_cast<std::uint64_t>(archive->frames.size());
    summary["chain_ok"] = chain_ok;
    if (!chain_ok)
      summary["chain_error"] = chain_err;
    std::cout << auton::jsonlite::to_json(summary) << "\n";
    return chain_ok ? 0 : 2;
  }

  print_error("unknown_command", cmd);
  return 1;
}
