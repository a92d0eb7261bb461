#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
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
#include "auton/research.hpp"
#include "auton/sandbox.hpp"
#include "auton/session.hpp"
#include "auton/transport.hpp"
#include "auton/types.hpp"
#include "auton/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  std::cout.flush();
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / ("auton_test_" + name);
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

bool wait_until(const std::function<bool()>& pred, int timeout_ms) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

std::string read_text(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

// ---------------------------------------------------------------------------
// Collaborator doubles
// ---------------------------------------------------------------------------

// Plans are handed out in order; the last one repeats. decide() continues on
// success and asks for a replan otherwise.
class ScriptedPlanner : public auton::Planner {
 public:
  std::vector<auton::Plan> plans;
  bool ready = true;
  bool offline = false;
  int converse_delay_ms = 0;
  // When false, converse() sleeps out its delay even after ctx.cancel fires.
  std::atomic<bool> honour_cancel{true};
  std::vector<auton::PreferenceFact> intake_facts;

  std::atomic<int> converse_calls{0};
  std::atomic<int> plan_calls{0};
  std::atomic<int> decide_calls{0};

  std::mutex mu;
  std::string last_research;
  std::map<std::string, auton::PreferenceFact> last_preferences;

  auton::IntakeReply converse(const auton::PlanningContext& ctx) override {
    ++converse_calls;
    for (int slept = 0; slept < converse_delay_ms; slept += 10) {
      if (honour_cancel && ctx.cancel.cancelled()) break;
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    {
      std::lock_guard<std::mutex> lk(mu);
      last_preferences = ctx.preferences;
    }
    auton::IntakeReply r;
    if (honour_cancel && ctx.cancel.cancelled()) {
      r.error = "planner call cancelled";
      return r;
    }
    if (offline) {
      r.error = "planner offline";
      return r;
    }
    r.ok = true;
    r.ready = ready;
    r.text = ready ? "Got it." : "Which language should I use?";
    r.inferred = intake_facts;
    return r;
  }

  auton::PlanReply plan(const auton::PlanningContext& ctx) override {
    const int n = plan_calls++;
    {
      std::lock_guard<std::mutex> lk(mu);
      last_research = ctx.research_notes;
    }
    auton::PlanReply r;
    if (offline || plans.empty()) {
      r.error = "planner offline";
      return r;
    }
    r.ok = true;
    r.plan = plans[std::min<std::size_t>(static_cast<std::size_t>(n), plans.size() - 1)];
    return r;
  }

  auton::DecisionReply decide(const auton::PlanningContext&,
                              const auton::StepOutcome& outcome) override {
    ++decide_calls;
    auton::DecisionReply r;
    r.ok = true;
    r.decision = outcome.status == auton::CommandStatus::succeeded
                     ? auton::Decision::continue_plan
                     : auton::Decision::replan;
    return r;
  }
};

// Finishes every command immediately with the next scripted status.
class FakeSandbox : public auton::SandboxRuntime {
 public:
  bool fail_provision = false;
  std::deque<auton::CommandStatus> scripted;
  std::atomic<int> executed{0};
  std::atomic<int> teardowns{0};

  auton::ProvisionResult provision(const std::string& project_id,
                                   const auton::ResourceLimits& limits) override {
    auton::ProvisionResult r;
    if (fail_provision) {
      r.error = auton::ProvisionError::resource_exhausted;
      r.detail = "environment quota reached";
      return r;
    }
    auton::SandboxHandle h;
    h.environment_id = auton::new_id("env");
    h.project_id = project_id;
    h.root = "/nonexistent";
    h.limits = limits;
    r.handle = h;
    return r;
  }

  std::shared_ptr<auton::CommandExecution> execute(const auton::SandboxHandle&,
                                                   const auton::Command& command) override {
    ++executed;
    auto exec = std::make_shared<auton::CommandExecution>(command);
    exec->publish("stdout", "ran " + command.argv[0] + "\n");
    auton::ExecutionOutcome o;
    o.command_id = command.command_id;
    o.correlation_id = command.correlation_id;
    std::lock_guard<std::mutex> lk(mu_);
    o.status = scripted.empty() ? auton::CommandStatus::succeeded : scripted.front();
    if (!scripted.empty()) scripted.pop_front();
    if (o.status == auton::CommandStatus::timed_out) {
      o.exit_code = 124;
      o.error = auton::to_string(auton::ErrorCode::timeout);
    } else if (o.status == auton::CommandStatus::succeeded) {
      o.exit_code = 0;
    } else {
      o.exit_code = 1;
      o.error = auton::to_string(auton::ErrorCode::nonzero_exit);
    }
    exec->finish(o);
    return exec;
  }

  auton::CancelOutcome cancel(const auton::SandboxHandle&, const std::string&) override {
    return auton::CancelOutcome::already_completed;
  }
  void teardown(const auton::SandboxHandle&) override { ++teardowns; }
  auton::SandboxState state(const auton::SandboxHandle&) const override {
    return auton::SandboxState::ready;
  }
  bool put_file(const auton::SandboxHandle&, const std::string&, const std::string&,
                std::string* error) override {
    if (error) *error = "unsupported";
    return false;
  }
  std::optional<std::string> get_file(const auton::SandboxHandle&, const std::string&,
                                      std::string* error) const override {
    if (error) *error = "unsupported";
    return std::nullopt;
  }

 private:
  std::mutex mu_;
};

class FakeSearch : public auton::SearchProvider {
 public:
  int calls = 0;
  std::string last_query;

  std::vector<auton::SearchResult> search(const std::string& query, auton::SearchScope scope,
                                          std::size_t) override {
    ++calls;
    last_query = query;
    if (scope == auton::SearchScope::code_host) {
      return {{"todo-rs", "https://git.example/todo-rs", "<p>A <b>todo</b> app</p>", "MIT", 0.9},
              {"gpl-todo", "https://git.example/gpl-todo", "<p>copyleft</p>", "GPL-3.0", 0.95}};
    }
    if (scope == auton::SearchScope::package_registry) {
      return {{"todo-rs", "https://git.example/todo-rs", "duplicate", "MIT", 0.9},
              {"clap", "https://crates.example/clap", "<p>CLI &amp; args</p>", "mit", 0.7},
              {"mystery", "https://x.example/mystery", "<p>?</p>", "", 0.99}};
    }
    return {};
  }
};

auton::ProtocolMessage msg(const std::string& session, auton::MessageBody body) {
  return auton::make_message(session, std::move(body));
}

auton::UserInput text_input(const std::string& text) {
  auton::UserInput in;
  in.text = text;
  return in;
}

auton::UserInput approval() {
  auton::UserInput in;
  in.approve = true;
  return in;
}

auton::Plan one_step_plan(const std::string& summary, std::vector<std::string> argv) {
  auton::Plan p;
  p.summary = summary;
  p.steps.push_back({summary, std::move(argv), "", 0});
  return p;
}

auton::SessionSettings fast_settings() {
  auton::SessionSettings s;
  s.planner_retry.max_attempts = 2;
  s.planner_retry.initial_backoff_ms = 1;
  s.planner_retry.max_backoff_ms = 2;
  return s;
}

void drive(auton::SessionMachine& m) {
  for (int i = 0; i < 2000 && !m.terminal() && m.command_in_flight(); ++i) {
    m.pump(std::chrono::milliseconds(20));
  }
}

std::vector<std::string> phases_of(const auton::SessionMachine& m) {
  std::vector<std::string> out;
  for (const auto& e : m.events()) out.push_back(e.to_phase);
  return out;
}

template <typename T>
std::vector<T> sent_of(const auton::SessionMachine& m) {
  std::vector<T> out;
  for (const auto& pm : m.transcript()) {
    if (const auto* b = std::get_if<T>(&pm.body)) out.push_back(*b);
  }
  return out;
}

// Blocking NDJSON reader over one end of a socketpair.
class TestClient {
 public:
  explicit TestClient(int fd) : fd_(fd) {}
  ~TestClient() {
    if (fd_ >= 0) ::close(fd_);
  }

  void send(const auton::ProtocolMessage& m) { send_raw(auton::encode(m)); }

  void send_raw(const std::string& data) {
    std::size_t off = 0;
    while (off < data.size()) {
      const ssize_t n = ::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
      expect(n > 0, "client send");
      off += static_cast<std::size_t>(n);
    }
  }

  // Next decoded message, or nullopt on timeout or end of stream.
  std::optional<auton::ProtocolMessage> next(int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (pending_.empty() && !eof_) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                            deadline - std::chrono::steady_clock::now())
                            .count();
      if (left <= 0) break;
      pollfd p{fd_, POLLIN, 0};
      if (::poll(&p, 1, static_cast<int>(left)) <= 0) continue;
      char buf[4096];
      const ssize_t n = ::read(fd_, buf, sizeof(buf));
      if (n <= 0) {
        eof_ = true;
        break;
      }
      for (auto& item : decoder_.feed(std::string_view(buf, static_cast<std::size_t>(n)))) {
        if (item.message) pending_.push_back(std::move(*item.message));
      }
    }
    if (pending_.empty()) return std::nullopt;
    auton::ProtocolMessage m = std::move(pending_.front());
    pending_.pop_front();
    return m;
  }

  std::optional<auton::ProtocolMessage> wait_for(
      const std::function<bool(const auton::ProtocolMessage&)>& pred, int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
      auto m = next(50);
      if (m && pred(*m)) return m;
      if (!m && eof_) return std::nullopt;
    }
    return std::nullopt;
  }

  bool at_eof(int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!eof_ && std::chrono::steady_clock::now() < deadline) next(50);
    return eof_;
  }

  void hang_up() { ::shutdown(fd_, SHUT_RDWR); }

 private:
  int fd_;
  auton::FrameDecoder decoder_;
  std::deque<auton::ProtocolMessage> pending_;
  bool eof_ = false;
};

bool is_event(const auton::ProtocolMessage& m, const std::string& kind) {
  const auto* e = std::get_if<auton::SessionEvent>(&m.body);
  return e && e->kind == kind;
}

// ============================================================================
// Phase 1: Hashing & JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(auton::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(auton::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_and_chain_separation() {
  const std::string data = "payload";
  expect(auton::hash_domain("pref:", data) != auton::hash_domain("event:", data),
         "domains must differ");
  expect(auton::hash_domain("snap:", data) == auton::hash_domain("snap:", data),
         "domain hash must be deterministic");
  const std::string a = auton::chain_digest("event:", "", data);
  const std::string b = auton::chain_digest("event:", a, data);
  expect(a != b, "chained digest depends on prev");
  expect(auton::is_hex_digest(a), "chain digest is 64 hex chars");
  expect(!auton::is_hex_digest("xyz"), "non-hex rejected");
  expect(auton::hash_runtime_info().primitive == "blake3", "primitive is blake3");
}

void test_json_roundtrip_and_strictness() {
  std::optional<auton::jsonlite::JsonError> err;
  auto obj = auton::jsonlite::parse("{\"b\":1,\"a\":\"x\\ny\",\"c\":[true,null,2.5]}", &err);
  expect(!err, "valid JSON parses");
  expect(auton::jsonlite::get_u64(obj, "b", 0) == 1, "integer field");
  expect(auton::jsonlite::get_string(obj, "a", "") == "x\ny", "escaped newline decoded");
  const std::string out = auton::jsonlite::to_json(obj);
  expect(out.find('\n') == std::string::npos, "writer never emits a raw newline");
  expect(out.find("\"a\"") < out.find("\"b\""), "keys are sorted");

  auton::jsonlite::parse("{\"k\":1,\"k\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate keys rejected");
  err.reset();
  auton::jsonlite::parse("{\"k\":1} trailing", &err);
  expect(err.has_value(), "trailing data rejected");
}

// ============================================================================
// Phase 2: Protocol Codec
// ============================================================================

void test_codec_encode_decode() {
  auton::CommandRequest req;
  req.correlation_id = "c1";
  req.argv = {"cargo", "build"};
  req.origin = auton::CommandOrigin::plan;
  req.step = "build";
  const auto m = msg("sess-1", req);
  const std::string line = auton::encode(m);
  expect(!line.empty() && line.back() == '\n', "frame ends with newline");
  expect(line.find('\n') == line.size() - 1, "exactly one newline per frame");

  auto item = auton::decode_frame(std::string_view(line).substr(0, line.size() - 1));
  expect(item.message.has_value(), "frame decodes");
  expect(item.message->session_id == "sess-1", "session id survives");
  const auto* back = std::get_if<auton::CommandRequest>(&item.message->body);
  expect(back && back->argv.size() == 2 && back->step == "build", "command request fields");
  expect(back->origin == auton::CommandOrigin::plan, "origin survives");
}

void test_codec_resumable_across_splits() {
  std::string stream;
  stream += auton::encode(msg("s", text_input("first")));
  stream += "\n";  // keep-alive
  stream += "{not json}\n";
  stream += auton::encode(msg("s", auton::Cancel{}));
  stream += auton::encode(msg("s", text_input("last")));

  auton::FrameDecoder whole;
  const auto expected = whole.feed(stream);
  expect(expected.size() == 4, "three messages and one error");
  expect(expected[1].error && expected[1].error->code == "malformed_json", "error in position");

  auton::FrameDecoder bytewise;
  std::vector<auton::DecodeItem> got;
  for (char c : stream) {
    for (auto& it : bytewise.feed(std::string_view(&c, 1))) got.push_back(std::move(it));
  }
  expect(got.size() == expected.size(), "same item count byte by byte");
  for (std::size_t i = 0; i < got.size(); ++i) {
    expect(got[i].message.has_value() == expected[i].message.has_value(), "same item kinds");
    if (got[i].message) {
      expect(auton::encode(*got[i].message) == auton::encode(*expected[i].message),
             "same message content");
    }
  }
  expect(bytewise.buffered() == 0, "nothing left buffered");
}

void test_codec_recoverable_errors() {
  auton::FrameDecoder d;
  auto items = d.feed(
      "{\"v\":1,\"id\":\"a\",\"session\":\"\",\"type\":\"teleport\"}\n"
      "{\"v\":1,\"id\":\"b\",\"session\":\"\",\"type\":\"user_input\"}\r\n"
      "{\"v\":1,\"id\":\"c\",\"session\":\"\",\"type\":\"command_request\",\"correlation_id\":\"x\",\"argv\":[]}\n"
      "{\"v\":1,\"id\":\"d\",\"session\":\"\",\"type\":\"cancel\"}\r\n");
  expect(items.size() == 4, "four items");
  expect(items[0].error && items[0].error->code == "unknown_type", "unknown type");
  expect(items[0].error->message_id == "a", "offending id reported");
  expect(items[1].error && items[1].error->code == "missing_field", "missing text");
  expect(items[2].error && items[2].error->code == "invalid_field", "empty argv");
  expect(items[3].message.has_value(), "CRLF frame still decodes");
  expect(!d.broken(), "recoverable errors keep the stream");
}

void test_codec_fatal_errors() {
  auton::FrameDecoder v;
  auto items = v.feed("{\"v\":2,\"id\":\"z\",\"session\":\"\",\"type\":\"cancel\"}\n" +
                      auton::encode(msg("", auton::Cancel{})));
  expect(items.size() == 1, "nothing after a fatal frame");
  expect(items[0].error && items[0].error->code == "unsupported_version" && items[0].error->fatal,
         "newer framing version is fatal");
  expect(v.broken(), "decoder broken");
  expect(v.feed(auton::encode(msg("", auton::Cancel{}))).empty(), "broken decoder ignores input");

  auton::FrameDecoder small(64);
  auto big = small.feed(std::string(100, 'x'));
  expect(big.size() == 1 && big[0].error && big[0].error->code == "frame_too_large",
         "unterminated oversize frame detected early");
  expect(big[0].error->fatal && small.broken(), "oversize is fatal");
}

// ============================================================================
// Phase 3: Preference Store
// ============================================================================

auton::PreferenceFact fact(const std::string& key, const std::string& value, double confidence,
                           std::uint64_t ts, const std::string& session = "sess-a") {
  auton::PreferenceFact f;
  f.key = key;
  f.value = value;
  f.confidence = confidence;
  f.timestamp_unix_ms = ts;
  f.source_session = session;
  return f;
}

void test_store_last_write_wins() {
  const auto root = fresh_dir("store_lww");
  auton::FilePreferenceStore store(root.string());
  expect(store.upsert("alice", fact("language", "go", 0.8, 1000)).ok, "first upsert");
  auto out = store.upsert("alice", fact("language", "rust", 0.8, 2000));
  expect(out.ok && out.effective && !out.conflict, "later equal-confidence fact wins");
  const auto facts = store.get("alice");
  expect(facts.size() == 1 && facts[0].value == "rust", "effective value is rust");
  expect(store.history("alice").size() == 2, "history keeps both records");
}

void test_store_lower_confidence_later_write_wins() {
  const auto root = fresh_dir("store_conf");
  auton::FilePreferenceStore store(root.string());
  store.upsert("bob", fact("editor", "vim", 0.9, 1000));
  auto out = store.upsert("bob", fact("editor", "emacs", 0.5, 2000));
  expect(out.ok && out.effective && !out.conflict, "later lower-confidence fact becomes effective");
  const auto facts = store.get("bob");
  expect(facts.size() == 1 && facts[0].value == "emacs", "emacs replaces vim");
  expect(facts[0].confidence == 0.5, "effective fact keeps its own confidence");
  expect(store.history("bob").size() == 2, "both in history");
}

void test_store_out_of_order_conflict() {
  const auto root = fresh_dir("store_conflict");
  auton::FilePreferenceStore store(root.string());
  store.upsert("carol", fact("indent", "tabs", 0.7, 5000, "sess-late"));
  auto out = store.upsert("carol", fact("indent", "spaces", 0.7, 3000, "sess-early"));
  expect(out.ok && out.conflict, "earlier timestamp arriving late is a conflict");
  expect(!out.effective, "earlier fact does not supersede the later one");
  expect(store.conflicts() == 1, "conflict counted");
  expect(store.get("carol")[0].value == "tabs", "fold is by timestamp, not arrival");
}

void test_store_chain_verify_and_tamper() {
  const auto root = fresh_dir("store_chain");
  auton::FilePreferenceStore store(root.string());
  for (int i = 0; i < 5; ++i) {
    store.upsert("dave", fact("k" + std::to_string(i), "v", 1.0, 1000 + static_cast<std::uint64_t>(i)));
  }
  std::string err;
  expect(store.verify_history("dave", &err), "intact chain verifies: " + err);
  const auto h = store.history("dave");
  expect(h.size() == 5 && h[1].prev_digest == h[0].digest, "records are linked");

  fs::path file;
  for (const auto& e : fs::recursive_directory_iterator(root)) {
    if (e.path().extension() == ".ndjson") file = e.path();
  }
  expect(!file.empty(), "history file exists");
  std::string data = read_text(file);
  const auto pos = data.find("\"k2\"");
  expect(pos != std::string::npos, "record present");
  data.replace(pos, 4, "\"kX\"");
  std::ofstream(file, std::ios::binary | std::ios::trunc) << data;
  expect(!store.verify_history("dave", &err), "tampered chain detected");
}

void test_store_frozen_snapshot() {
  const auto root = fresh_dir("store_snapshot");
  auton::FilePreferenceStore store(root.string());
  store.upsert("erin", fact("language", "rust", 0.9, 1000));
  std::string err;
  expect(store.register_project("proj-1", "erin", &err), "register project");
  expect(store.register_project("proj-1", "erin", &err), "re-register by owner is fine");
  expect(!store.register_project("proj-1", "mallory", &err), "other user rejected");

  auto snap = store.snapshot_for_project("proj-1", &err);
  expect(snap && snap->facts.at("language").value == "rust", "snapshot holds rust");
  store.upsert("erin", fact("language", "zig", 1.0, 2000));
  auto again = store.snapshot_for_project("proj-1", &err);
  expect(again && again->facts.at("language").value == "rust", "snapshot stays frozen");
  expect(again->digest == snap->digest, "snapshot digest stable");
  expect(store.get("erin")[0].value == "zig", "live view moved on");

  auton::FilePreferenceStore other(root.string());
  auto third = other.snapshot_for_project("proj-1", &err);
  expect(third && third->digest == snap->digest, "second store sees the same snapshot");
}

void test_store_snapshot_refuses_unreadable_history() {
  const auto root = fresh_dir("store_corrupt");
  auton::FilePreferenceStore store(root.string());
  store.upsert("ivan", fact("language", "rust", 0.9, 1000));
  fs::path file;
  for (const auto& e : fs::recursive_directory_iterator(root)) {
    if (e.path().extension() == ".ndjson") file = e.path();
  }
  expect(!file.empty(), "history file exists");
  std::ofstream(file, std::ios::binary | std::ios::app) << "{not json\n";

  std::string err;
  expect(store.register_project("proj-corrupt", "ivan", &err), "register still works");
  auto snap = store.snapshot_for_project("proj-corrupt", &err);
  expect(!snap.has_value(), "unreadable history is not frozen");
  expect(err.rfind("store_io", 0) == 0, "store_io reported: " + err);
  bool frozen = false;
  for (const auto& e : fs::recursive_directory_iterator(root)) {
    frozen = frozen || e.path().filename() == "proj-corrupt.json";
  }
  expect(!frozen, "no snapshot file written");
  expect(!store.upsert("ivan", fact("editor", "vim", 0.9, 2000)).ok, "upsert refuses a corrupt history");
}

void test_store_concurrent_writers() {
  const auto root = fresh_dir("store_concurrent");
  auton::FilePreferenceStore a(root.string());
  auton::FilePreferenceStore b(root.string());
  constexpr int kPerWriter = 25;
  std::thread ta([&] {
    for (int i = 0; i < kPerWriter; ++i) a.upsert("frank", fact("shell", "bash", 0.6, 0, "sess-a"));
  });
  std::thread tb([&] {
    for (int i = 0; i < kPerWriter; ++i) b.upsert("frank", fact("shell", "zsh", 0.6, 0, "sess-b"));
  });
  ta.join();
  tb.join();
  const auto h = a.history("frank");
  expect(h.size() == 2 * kPerWriter, "no lost appends");
  for (std::size_t i = 0; i < h.size(); ++i) expect(h[i].seq == i + 1, "dense seq");
  std::string err;
  expect(b.verify_history("frank", &err), "chain intact after concurrent writes: " + err);
  expect(a.get("frank").size() == 1, "one effective fact per key");
  expect(a.get("frank")[0].value == b.get("frank")[0].value, "stores agree");
}

// ============================================================================
// Phase 4: Sandbox Runtime
// ============================================================================

auton::SandboxConfig sandbox_config(const std::string& name) {
  auton::SandboxConfig c;
  c.root = fresh_dir(name).string();
  c.kill_grace_ms = 200;
  return c;
}

auton::Command command(std::vector<std::string> argv, std::uint64_t timeout_ms = 5000) {
  auton::Command c;
  c.command_id = auton::new_id("cmd");
  c.correlation_id = auton::new_id("corr");
  c.argv = std::move(argv);
  c.timeout_ms = timeout_ms;
  return c;
}

struct Drained {
  std::string out;
  std::vector<std::uint64_t> seqs;
  std::optional<auton::ExecutionOutcome> outcome;
  int results = 0;
};

Drained drain(auton::CommandExecution& exec) {
  Drained d;
  while (auto u = exec.updates().pop_for(std::chrono::milliseconds(10000))) {
    if (auto* c = std::get_if<auton::OutputChunk>(&*u)) {
      d.out += c->data;
      d.seqs.push_back(c->seq);
    } else {
      d.outcome = std::get<auton::ExecutionOutcome>(*u);
      ++d.results;
    }
  }
  return d;
}

void test_sandbox_echo() {
  auton::LocalSandboxRuntime rt(sandbox_config("sb_echo"));
  auto prov = rt.provision("echo-proj", auton::ResourceLimits{});
  expect(prov.ok(), "provision: " + prov.detail);
  auto exec = rt.execute(*prov.handle, command({"echo", "hello"}));
  auto d = drain(*exec);
  expect(d.out == "hello\n", "stdout streamed");
  expect(d.results == 1, "exactly one result");
  expect(d.outcome->status == auton::CommandStatus::succeeded && d.outcome->exit_code == 0,
         "echo succeeds");
  for (std::size_t i = 0; i < d.seqs.size(); ++i) expect(d.seqs[i] == i, "chunk seq dense");
  expect(rt.state(*prov.handle) == auton::SandboxState::ready, "ready after command");
  rt.teardown(*prov.handle);
}

void test_sandbox_timeout() {
  auton::LocalSandboxRuntime rt(sandbox_config("sb_timeout"));
  auto prov = rt.provision("timeout-proj", auton::ResourceLimits{});
  expect(prov.ok(), "provision");
  const auto start = std::chrono::steady_clock::now();
  auto exec = rt.execute(*prov.handle, command({"sleep", "10"}, 200));
  auto d = drain(*exec);
  const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  expect(d.outcome->status == auton::CommandStatus::timed_out, "timed out");
  expect(d.outcome->exit_code == 124, "timeout exit code 124");
  expect(d.outcome->error == "timeout", "timeout reason code");
  expect(took.count() < 5000, "killed promptly");
  rt.teardown(*prov.handle);
}

void test_sandbox_cancel_and_late_cancel() {
  auton::LocalSandboxRuntime rt(sandbox_config("sb_cancel"));
  auto prov = rt.provision("cancel-proj", auton::ResourceLimits{});
  expect(prov.ok(), "provision");
  auto c = command({"sleep", "10"});
  auto exec = rt.execute(*prov.handle, c);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  expect(rt.cancel(*prov.handle, c.command_id) == auton::CancelOutcome::cancelling, "cancelling");
  auto d = drain(*exec);
  expect(d.outcome->status == auton::CommandStatus::cancelled, "cancelled status");
  expect(d.results == 1, "still exactly one result");
  expect(rt.cancel(*prov.handle, c.command_id) == auton::CancelOutcome::already_completed,
         "cancel after completion is a no-op");
  rt.teardown(*prov.handle);
}

void test_sandbox_busy_and_path_escape() {
  auton::LocalSandboxRuntime rt(sandbox_config("sb_busy"));
  auto prov = rt.provision("busy-proj", auton::ResourceLimits{});
  expect(prov.ok(), "provision");
  auto first = rt.execute(*prov.handle, command({"sleep", "10"}));
  auto second = drain(*rt.execute(*prov.handle, command({"echo", "x"})));
  expect(second.outcome->status == auton::CommandStatus::failed, "second command rejected");
  expect(second.outcome->error == "sandbox_busy", "busy reason");
  rt.cancel(*prov.handle, first->command().command_id);
  drain(*first);

  auto escape = command({"ls"});
  escape.cwd = "../..";
  auto e = drain(*rt.execute(*prov.handle, escape));
  expect(e.outcome->error.rfind("path_escape", 0) == 0, "cwd escape rejected");

  std::string err;
  expect(!rt.put_file(*prov.handle, "../outside.txt", "x", &err) && err == "path_escape",
         "put_file escape rejected");
  expect(rt.put_file(*prov.handle, "notes/a.txt", "content", &err), "put_file inside root");
  auto back = rt.get_file(*prov.handle, "notes/a.txt", &err);
  expect(back && *back == "content", "get_file returns bytes");

  rt.teardown(*prov.handle);
  rt.teardown(*prov.handle);
  auto after = drain(*rt.execute(*prov.handle, command({"echo", "x"})));
  expect(after.outcome->error == "sandbox_terminated", "terminated environment rejects work");
}

void test_sandbox_provision_limits() {
  auto cfg = sandbox_config("sb_quota");
  cfg.max_environments = 1;
  auton::LocalSandboxRuntime rt(cfg);
  auto a = rt.provision("proj-a", auton::ResourceLimits{});
  expect(a.ok(), "first environment");
  auto b = rt.provision("proj-b", auton::ResourceLimits{});
  expect(!b.ok() && b.error == auton::ProvisionError::resource_exhausted, "quota enforced");
  rt.teardown(*a.handle);
  auto c = rt.provision("proj-b", auton::ResourceLimits{});
  expect(c.ok(), "slot freed by teardown");
  auto dup = rt.provision("proj-b", auton::ResourceLimits{});
  expect(!dup.ok(), "one live environment per project");
  rt.teardown(*c.handle);
}

void test_secret_env_keys() {
  expect(auton::is_secret_key("GITHUB_TOKEN"), "token is secret");
  expect(auton::is_secret_key("DB_PASSWORD"), "password is secret");
  expect(!auton::is_secret_key("RUST_LOG"), "plain key allowed");
}

// ============================================================================
// Phase 5: Planner adapter & research
// ============================================================================

void test_retry_policy() {
  auton::RetryPolicy p;
  p.initial_backoff_ms = 100;
  p.max_backoff_ms = 300;
  expect(p.backoff_for(1) == 0, "first attempt has no delay");
  expect(p.backoff_for(2) == 100, "second attempt waits initial backoff");
  expect(p.backoff_for(3) == 200, "exponential growth");
  expect(p.backoff_for(6) == 300, "capped");

  auton::RetryPolicy fast;
  fast.max_attempts = 3;
  fast.initial_backoff_ms = 1;
  int calls = 0;
  std::uint32_t attempts = 0;
  auto r = auton::call_with_retry<auton::PlanReply>(
      fast,
      [&] {
        auton::PlanReply reply;
        reply.ok = ++calls == 2;
        return reply;
      },
      nullptr, &attempts);
  expect(r.ok && attempts == 2, "stops at first success");
}

void test_planner_reply_parsing() {
  std::optional<auton::jsonlite::JsonError> err;
  auto reply = auton::jsonlite::parse(
      "{\"preferences\":[{\"key\":\"language\",\"value\":\"rust\",\"confidence\":3},"
      "{\"value\":\"orphan\"},{\"key\":\"vcs\",\"value\":\"git\"}]}",
      &err);
  auto facts = auton::parse_inferred_facts(reply);
  expect(facts.size() == 2, "keyless entry skipped");
  expect(facts[0].confidence == 1.0, "confidence clamped");
  expect(facts[1].confidence == 0.5, "default confidence");

  std::string perr;
  auto empty = auton::jsonlite::parse("{\"summary\":\"x\",\"steps\":[]}", &err);
  expect(!auton::parse_plan_reply(empty, &perr), "empty plan rejected");
  auto ok = auton::jsonlite::parse(
      "{\"summary\":\"todo\",\"steps\":[{\"description\":\"init\",\"argv\":[\"cargo\",\"init\"]}]}",
      &err);
  auto plan = auton::parse_plan_reply(ok, &perr);
  expect(plan && plan->steps.size() == 1 && plan->steps[0].argv[0] == "cargo", "plan parsed");
}

void test_subprocess_planner() {
  auton::PlannerConfig cfg;
  cfg.argv = {"/bin/sh", "-c",
              "cat >/dev/null; echo '{\"verdict\":\"ready\",\"text\":\"ok\","
              "\"preferences\":[{\"key\":\"language\",\"value\":\"rust\",\"confidence\":0.9}]}'"};
  cfg.timeout_ms = 5000;
  auton::SubprocessPlanner planner(cfg);
  auton::PlanningContext ctx;
  ctx.session_id = "sess-x";
  auto r = planner.converse(ctx);
  expect(r.ok && r.ready && r.text == "ok", "converse via subprocess");
  expect(r.inferred.size() == 1 && r.inferred[0].value == "rust", "inferred facts parsed");

  auton::PlannerConfig broken;
  broken.argv = {"/bin/sh", "-c", "cat >/dev/null; echo not-json"};
  auton::SubprocessPlanner bad(broken);
  expect(!bad.plan(ctx).ok, "garbage reply is a failure");

  auto request = auton::context_to_json("plan", ctx);
  expect(auton::jsonlite::get_string(request, "op", "") == "plan", "request carries op");
}

void test_subprocess_planner_cancel() {
  auton::PlannerConfig cfg;
  cfg.argv = {"/bin/sh", "-c", "cat >/dev/null; sleep 10; echo '{\"verdict\":\"ready\"}'"};
  cfg.timeout_ms = 20000;
  auton::SubprocessPlanner planner(cfg);
  auton::PlanningContext ctx;
  ctx.session_id = "sess-slow";
  auton::CancellationToken token = ctx.cancel;
  std::thread canceller([token]() mutable {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    token.cancel();
  });
  const auto started = std::chrono::steady_clock::now();
  auto r = planner.converse(ctx);
  const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - started)
                        .count();
  canceller.join();
  expect(!r.ok && r.error == "planner call cancelled", "cancelled call fails: " + r.error);
  expect(took < 5000, "child killed instead of awaited");
  expect(!planner.plan(ctx).ok, "already-cancelled context is refused");
}

void test_html_to_text() {
  auton::BasicHtmlToText h;
  const std::string t =
      h.convert("<p>Fish &amp; chips</p><script>alert(1)</script><div>caf&#233; &lt;ok&gt;</div>");
  expect(t.find("Fish & chips") != std::string::npos, "entities decoded");
  expect(t.find("alert") == std::string::npos, "script dropped");
  expect(t.find("<ok>") != std::string::npos, "escaped markup becomes text");
  expect(t.find('\n') != std::string::npos, "block elements break lines");

  const std::string bad = h.convert("<p>a&#xD800;b&#57343;c&#x110000;d&#0;e</p>");
  expect(bad.find("a\xEF\xBF\xBD" "b\xEF\xBF\xBD" "c\xEF\xBF\xBD" "d\xEF\xBF\xBD" "e") !=
             std::string::npos,
         "code points without a UTF-8 form become U+FFFD");
  expect(h.convert("&#x1F600;").find("\xF0\x9F\x98\x80") != std::string::npos,
         "astral code points still encode");
}

void test_research_notes() {
  FakeSearch search;
  auton::BasicHtmlToText html;
  auton::ResearchConfig cfg;
  cfg.allowed_licenses = {"MIT"};
  auton::ResearchAssembler r(search, html, cfg);
  const std::string notes = r.notes_for("todo app in rust");
  expect(search.calls == 2, "one query per scope");
  expect(notes.find("todo-rs") != std::string::npos, "allowed result kept");
  expect(notes.find("gpl-todo") == std::string::npos, "disallowed license dropped");
  expect(notes.find("mystery") == std::string::npos, "unlicensed result dropped");
  expect(notes.find("todo-rs") < notes.find("clap"), "ranked by score");
  expect(notes.find("https://git.example/todo-rs") == notes.rfind("https://git.example/todo-rs"),
         "duplicate url collapsed");
  expect(notes.find("CLI & args") != std::string::npos, "snippet converted");

  auto all = auton::filter_by_license({{"a", "u", "", "", 1.0}}, {});
  expect(all.size() == 1, "empty allowlist keeps everything");
}

// ============================================================================
// Phase 6: Session State Machine
// ============================================================================

void test_session_todo_app_end_to_end() {
  const auto store_root = fresh_dir("e2e_store");
  auton::FilePreferenceStore store(store_root.string());
  auton::LocalSandboxRuntime sandbox(sandbox_config("e2e_sandbox"));
  ScriptedPlanner planner;
  planner.intake_facts = {fact("language", "rust", 0.9, 0)};
  auton::Plan plan;
  plan.summary = "todo app";
  plan.steps = {{"create layout", {"mkdir", "-p", "todo/src"}, "", 0},
                {"write main", {"sh", "-c", "printf 'fn main() {}\\n' > todo/src/main.rs"}, "", 0},
                {"check", {"ls", "todo/src/main.rs"}, "", 0}};
  planner.plans = {plan};
  FakeSearch search;
  auton::BasicHtmlToText html;
  auton::ResearchAssembler research(search, html, auton::ResearchConfig{});

  auton::SessionMachine m("sess-todo", "grace", "todo-app", {&sandbox, &store, &planner, &research},
                          fast_settings(), nullptr);
  m.start();
  expect(m.phase() == auton::SessionPhase::intake, "starts in intake");
  expect(m.sandbox().has_value(), "sandbox provisioned");

  m.handle(msg("sess-todo", text_input("build me a todo app in rust")));
  expect(m.phase() == auton::SessionPhase::planning && m.awaiting_approval(),
         "plan waits for approval");
  expect(planner.last_research.find("todo-rs") != std::string::npos, "research notes reach planner");
  expect(search.last_query == "build me a todo app in rust", "research uses the request");

  m.handle(msg("sess-todo", approval()));
  expect(m.phase() == auton::SessionPhase::executing, "executing after approval");
  drive(m);

  expect(m.phase() == auton::SessionPhase::completed, "completed");
  expect(planner.decide_calls == 3, "planner judged every step");
  const std::vector<std::string> want = {"intake", "planning", "executing", "reviewing", "completed"};
  expect(phases_of(m) == want, "phase sequence");
  std::string err;
  expect(auton::verify_event_chain(m.events(), &err), "event chain verifies: " + err);

  const auto facts = store.get("grace");
  expect(facts.size() == 1 && facts[0].key == "language" && facts[0].value == "rust",
         "language=rust committed");
  expect(facts[0].source_session == "sess-todo", "source session recorded");
  expect(fs::exists(fs::path(m.sandbox()->root) / "todo/src/main.rs"), "plan ran in sandbox root");

  int plan_requests = 0;
  for (const auto& r : sent_of<auton::CommandRequest>(m)) {
    if (r.origin == auton::CommandOrigin::plan) ++plan_requests;
  }
  expect(plan_requests == 3, "each step announced to the front-end");
  const auto results = sent_of<auton::CommandResult>(m);
  expect(results.size() == 3, "one result per step");
  for (const auto& r : results) expect(r.status == auton::CommandStatus::succeeded, "step ok");
  bool committed = false;
  for (const auto& e : sent_of<auton::SessionEvent>(m)) {
    if (e.kind == "preferences_committed") committed = e.reason == "1";
  }
  expect(committed, "commit event reports one fact");
  expect(sent_of<auton::SessionEvent>(m).back().kind == "terminal", "terminal event last");
  expect(sandbox.live_environments() == 0, "sandbox torn down");
}

void test_session_timeout_then_replan() {
  const auto root = fresh_dir("replan_store");
  auton::FilePreferenceStore store(root.string());
  FakeSandbox sandbox;
  sandbox.scripted = {auton::CommandStatus::timed_out, auton::CommandStatus::succeeded};
  ScriptedPlanner planner;
  planner.plans = {one_step_plan("slow build", {"cargo", "build"}),
                   one_step_plan("quick build", {"cargo", "check"})};

  auton::SessionMachine m("sess-replan", "henry", "replan-proj", {&sandbox, &store, &planner, nullptr},
                          fast_settings(), nullptr);
  m.start();
  m.handle(msg("sess-replan", text_input("build it")));
  m.handle(msg("sess-replan", approval()));
  drive(m);

  expect(m.phase() == auton::SessionPhase::completed, "completed after replan");
  expect(m.replans() == 1, "one replan");
  expect(planner.plan_calls == 2, "planned twice");
  bool saw_replan = false;
  bool saw_auto = false;
  for (const auto& e : m.events()) {
    if (e.trigger == "replan" && e.reason == "timeout" && e.to_phase == "planning") saw_replan = true;
    if (e.trigger == "replan_auto_approved") saw_auto = true;
  }
  expect(saw_replan, "replan transition records the timeout");
  expect(saw_auto, "replanned plan auto-approved");
  expect(sandbox.teardowns >= 1, "sandbox torn down");
}

void test_session_replan_limit() {
  const auto root = fresh_dir("replan_limit_store");
  auton::FilePreferenceStore store(root.string());
  FakeSandbox sandbox;
  sandbox.scripted = {auton::CommandStatus::failed, auton::CommandStatus::failed};
  ScriptedPlanner planner;
  planner.plans = {one_step_plan("flaky", {"make"})};
  auto settings = fast_settings();
  settings.max_replans = 1;

  auton::SessionMachine m("sess-limit", "ivy", "limit-proj", {&sandbox, &store, &planner, nullptr},
                          settings, nullptr);
  m.start();
  m.handle(msg("sess-limit", text_input("go")));
  m.handle(msg("sess-limit", approval()));
  drive(m);
  expect(m.phase() == auton::SessionPhase::failed, "failed");
  expect(m.terminal_reason() == "replan_limit", "replan limit reason");
}

void test_session_provision_failure() {
  const auto root = fresh_dir("prov_store");
  auton::FilePreferenceStore store(root.string());
  FakeSandbox sandbox;
  sandbox.fail_provision = true;
  ScriptedPlanner planner;
  auton::SessionMachine m("sess-prov", "jack", "prov-proj", {&sandbox, &store, &planner, nullptr},
                          fast_settings(), nullptr);
  m.start();
  expect(m.phase() == auton::SessionPhase::failed, "failed on provisioning");
  expect(m.terminal_reason() == "provision_failed", "provision_failed reason");
  const auto errors = sent_of<auton::ErrorMessage>(m);
  expect(!errors.empty() && errors[0].fatal, "fatal error sent");
  expect(errors[0].detail.find("resource_exhausted") != std::string::npos, "cause included");
  expect(planner.converse_calls == 0, "planner never consulted");

  m.handle(msg("sess-prov", auton::CommandRequest{"c9", "", {"ls"}, "", 0,
                                                   auton::CommandOrigin::user, ""}));
  const auto results = sent_of<auton::CommandResult>(m);
  expect(results.size() == 1 && results[0].error == "sandbox_terminated",
         "commands after failure are refused");
}

void test_session_planning_unavailable() {
  const auto root = fresh_dir("offline_store");
  auton::FilePreferenceStore store(root.string());
  FakeSandbox sandbox;
  ScriptedPlanner planner;
  planner.offline = true;
  auton::SessionMachine m("sess-off", "kate", "off-proj", {&sandbox, &store, &planner, nullptr},
                          fast_settings(), nullptr);
  m.start();
  m.handle(msg("sess-off", text_input("hello")));
  expect(m.phase() == auton::SessionPhase::failed, "failed");
  expect(m.terminal_reason() == "planning_unavailable", "planning_unavailable reason");
  expect(planner.converse_calls == 2, "retried up to the attempt budget");
  expect(sandbox.teardowns >= 1, "sandbox released");
}

void test_session_cancel_running_command() {
  const auto root = fresh_dir("cancel_store");
  auton::FilePreferenceStore store(root.string());
  auton::LocalSandboxRuntime sandbox(sandbox_config("cancel_sandbox"));
  ScriptedPlanner planner;
  auton::SessionMachine m("sess-cancel", "liam", "cancel-proj", {&sandbox, &store, &planner, nullptr},
                          fast_settings(), nullptr);
  m.start();

  m.handle(msg("sess-cancel", auton::Cancel{"nope"}));
  auto events = sent_of<auton::SessionEvent>(m);
  expect(events.back().kind == "cancel_acknowledged" && events.back().reason == "not_running",
         "unknown target acknowledged as not running");

  m.handle(msg("sess-cancel", auton::CommandRequest{"corr-sleep", "", {"sleep", "10"}, "", 0,
                                                     auton::CommandOrigin::user, ""}));
  expect(m.command_in_flight(), "manual command running");
  m.handle(msg("sess-cancel", auton::Cancel{}));
  events = sent_of<auton::SessionEvent>(m);
  bool acked = false;
  for (const auto& e : events) acked = acked || (e.kind == "cancel_acknowledged" && e.reason == "cancelling");
  expect(acked, "session cancel acknowledged first");
  drive(m);

  expect(m.phase() == auton::SessionPhase::cancelled, "cancelled");
  expect(m.terminal_reason() == "user_cancelled", "user_cancelled reason");
  const auto results = sent_of<auton::CommandResult>(m);
  expect(results.size() == 1 && results[0].status == auton::CommandStatus::cancelled,
         "running command reported cancelled");
  expect(sandbox.live_environments() == 0, "sandbox torn down");
}

void test_session_empty_plan_completes() {
  const auto root = fresh_dir("empty_plan_store");
  auton::FilePreferenceStore store(root.string());
  FakeSandbox sandbox;
  ScriptedPlanner planner;
  auton::Plan nothing;
  nothing.summary = "already done";
  planner.plans = {nothing};
  auton::SessionMachine m("sess-empty", "nina", "empty-proj", {&sandbox, &store, &planner, nullptr},
                          fast_settings(), nullptr);
  m.start();
  m.handle(msg("sess-empty", text_input("is there anything to do?")));
  expect(m.awaiting_approval(), "empty plan still offered for approval");
  m.handle(msg("sess-empty", approval()));

  expect(m.phase() == auton::SessionPhase::completed, "empty plan completes");
  expect(sandbox.executed == 0, "nothing executed");
  const std::vector<std::string> want = {"intake", "planning", "executing", "reviewing", "completed"};
  expect(phases_of(m) == want, "passes through reviewing");
  bool skipped = false;
  for (const auto& e : m.events()) skipped = skipped || e.trigger == "plan_empty";
  expect(skipped, "reviewing entered with plan_empty");
}

void test_session_approval_timeout() {
  const auto root = fresh_dir("approval_store");
  auton::FilePreferenceStore store(root.string());
  FakeSandbox sandbox;
  ScriptedPlanner planner;
  planner.plans = {one_step_plan("build", {"make"})};
  auto settings = fast_settings();
  settings.plan_approval_timeout_ms = 50;
  auton::SessionMachine m("sess-appr", "mia", "appr-proj", {&sandbox, &store, &planner, nullptr},
                          settings, nullptr);
  m.start();
  m.handle(msg("sess-appr", text_input("build")));
  expect(m.awaiting_approval(), "awaiting approval");
  m.tick(auton::now_unix_ms());
  expect(m.phase() == auton::SessionPhase::planning, "not yet expired");
  m.tick(auton::now_unix_ms() + 1000);
  expect(m.phase() == auton::SessionPhase::executing, "timeout approves the plan");
  expect(m.events().back().trigger == "approval_timeout", "trigger recorded");
  expect(m.command_in_flight(), "first step dispatched");
}

void test_session_feedback_replans() {
  const auto root = fresh_dir("feedback_store");
  auton::FilePreferenceStore store(root.string());
  FakeSandbox sandbox;
  ScriptedPlanner planner;
  planner.plans = {one_step_plan("first", {"make"}), one_step_plan("second", {"ninja"})};
  auton::SessionMachine m("sess-fb", "noah", "fb-proj", {&sandbox, &store, &planner, nullptr},
                          fast_settings(), nullptr);
  m.start();
  m.handle(msg("sess-fb", text_input("build")));
  m.handle(msg("sess-fb", text_input("use ninja instead")));
  expect(planner.plan_calls == 2, "feedback asks for a new plan");
  expect(m.awaiting_approval() && m.plan()->summary == "second", "new plan awaits approval");
  expect(m.replans() == 0, "feedback is not a replan");
}

void test_session_preference_confirmation() {
  const auto root = fresh_dir("confirm_store");
  auton::FilePreferenceStore store(root.string());
  store.upsert("olive", fact("language", "rust", 0.95, 1000));
  store.upsert("olive", fact("editor", "helix", 0.4, 1000));
  FakeSandbox sandbox;
  ScriptedPlanner planner;
  planner.ready = false;
  auton::SessionMachine m("sess-conf", "olive", "conf-proj", {&sandbox, &store, &planner, nullptr},
                          fast_settings(), nullptr);
  m.start();
  expect(m.applied_preferences().count("language") == 1, "high confidence auto-applied");
  expect(m.pending_confirmation().count("editor") == 1, "low confidence awaits confirmation");

  auton::UserInput in;
  in.text = "a cli tool";
  in.confirm_preferences = {"editor", "unknown"};
  m.handle(msg("sess-conf", in));
  expect(m.applied_preferences().count("editor") == 1, "confirmed fact applied");
  expect(m.pending_confirmation().empty(), "nothing pending");
  {
    std::lock_guard<std::mutex> lk(planner.mu);
    expect(planner.last_preferences.count("editor") == 1, "planner sees confirmed fact");
  }
  expect(m.phase() == auton::SessionPhase::intake, "still asking questions");
  const auto out = sent_of<auton::AssistantOutput>(m);
  expect(!out.empty() && out.back().topic == "question", "clarifying question sent");
}

void test_session_event_chain_tamper() {
  const auto root = fresh_dir("chain_store");
  auton::FilePreferenceStore store(root.string());
  FakeSandbox sandbox;
  ScriptedPlanner planner;
  planner.plans = {one_step_plan("build", {"make"})};
  auton::SessionMachine m("sess-chain", "pia", "chain-proj", {&sandbox, &store, &planner, nullptr},
                          fast_settings(), nullptr);
  m.start();
  m.handle(msg("sess-chain", text_input("build")));
  m.handle(msg("sess-chain", approval()));
  drive(m);
  auto events = m.events();
  std::string err;
  expect(auton::verify_event_chain(events, &err), "chain verifies");
  auto parsed = auton::event_record_from_json(auton::event_record_to_json(events[1]), &err);
  expect(parsed && parsed->digest == events[1].digest, "record survives json");
  events[2].reason = "edited";
  expect(!auton::verify_event_chain(events, &err), "edited record detected");
}

void test_assistant_output_chunking() {
  const auto root = fresh_dir("chunk_store");
  auton::FilePreferenceStore store(root.string());
  FakeSandbox sandbox;
  ScriptedPlanner planner;
  planner.ready = false;
  auto settings = fast_settings();
  settings.assistant_chunk_chars = 5;
  auton::SessionMachine m("sess-chunk", "quinn", "chunk-proj", {&sandbox, &store, &planner, nullptr},
                          settings, nullptr);
  m.start();
  m.handle(msg("sess-chunk", text_input("hi")));
  const auto out = sent_of<auton::AssistantOutput>(m);
  std::string joined;
  for (const auto& o : out) joined += o.text;
  expect(joined == "Which language should I use?", "chunks reassemble");
  expect(out.size() > 1 && out.front().first && out.back().last, "first/last flags set");
}

// ============================================================================
// Phase 7: Orchestrator
// ============================================================================

struct OrchestratorFixture {
  explicit OrchestratorFixture(const std::string& name)
      : store_root(fresh_dir(name)),
        archive_dir(store_root / "archive"),
        store(std::make_unique<auton::FilePreferenceStore>(store_root.string())) {}

  std::unique_ptr<auton::ExecutorOrchestrator> make(auton::ServerConfig server) {
    auton::ArchiveConfig archive;
    archive.dir = archive_dir.string();
    return std::make_unique<auton::ExecutorOrchestrator>(
        auton::OrchestratorDeps{&sandbox, store.get(), &planner, nullptr}, server, fast_settings(),
        archive);
  }

  fs::path store_root;
  fs::path archive_dir;
  std::unique_ptr<auton::FilePreferenceStore> store;
  FakeSandbox sandbox;
  ScriptedPlanner planner;
};

struct Connection {
  explicit Connection(auton::ExecutorOrchestrator& orch) {
    int fds[2];
    expect(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0, "socketpair");
    server = std::make_unique<auton::FdTransport>(fds[0], fds[0], true, "test");
    client = std::make_unique<TestClient>(fds[1]);
    thread = std::thread([&orch, this] { orch.serve_connection(*server); });
  }
  ~Connection() {
    client->hang_up();
    if (thread.joinable()) thread.join();
  }
  void close_and_wait() {
    client->hang_up();
    thread.join();
  }

  std::unique_ptr<auton::FdTransport> server;
  std::unique_ptr<TestClient> client;
  std::thread thread;
};

auton::Attach new_attach(const std::string& user, const std::string& project) {
  auton::Attach a;
  a.user_id = user;
  a.project_id = project;
  return a;
}

void test_orchestrator_attach_and_flow() {
  OrchestratorFixture fx("orch_flow");
  fx.planner.plans = {one_step_plan("build", {"make"})};
  auton::ServerConfig server;
  auto orch = fx.make(server);
  Connection conn(*orch);

  conn.client->send(msg("", text_input("too early")));
  auto early = conn.client->next(2000);
  expect(early && std::get_if<auton::ErrorMessage>(&early->body), "attach required first");

  conn.client->send(msg("", new_attach("rosa", "orch-proj")));
  auto attached = conn.client->wait_for([](const auto& m) { return is_event(m, "attached"); }, 2000);
  expect(attached.has_value(), "attached event");
  const std::string sid = attached->session_id;
  expect(!sid.empty(), "session id assigned");
  expect(std::get<auton::SessionEvent>(attached->body).trigger == "new", "new session");

  conn.client->send(msg(sid, text_input("build it")));
  auto plan = conn.client->wait_for(
      [](const auto& m) {
        const auto* a = std::get_if<auton::AssistantOutput>(&m.body);
        return a && a->topic == "plan";
      },
      3000);
  expect(plan.has_value(), "plan delivered");

  conn.client->send(msg("sess-other", approval()));
  auto mismatch = conn.client->wait_for(
      [](const auto& m) { return std::get_if<auton::ErrorMessage>(&m.body) != nullptr; }, 2000);
  expect(mismatch && std::get<auton::ErrorMessage>(mismatch->body).detail == "session mismatch",
         "foreign session id rejected");

  conn.client->send(msg(sid, approval()));
  auto terminal = conn.client->wait_for([](const auto& m) { return is_event(m, "terminal"); }, 5000);
  expect(terminal && std::get<auton::SessionEvent>(terminal->body).phase == "completed",
         "session completes over the wire");
  expect(conn.client->at_eof(3000), "connection closed after terminal");
  conn.close_and_wait();

  expect(wait_until([&] { return orch->archived_paths().size() == 1; }, 3000), "archived");
  std::string err;
  auto archive = auton::read_archive(orch->archived_paths()[0], &err);
  expect(archive && archive->session_id == sid && archive->final_phase == "completed",
         "archive readable: " + err);
  expect(auton::verify_event_chain(archive->events, &err), "archived chain verifies");
}

void test_orchestrator_park_and_resume() {
  OrchestratorFixture fx("orch_park");
  fx.planner.ready = false;
  fx.planner.converse_delay_ms = 300;
  auton::ServerConfig server;
  server.grace_ms = 60000;
  auto orch = fx.make(server);

  std::string sid;
  {
    Connection first(*orch);
    first.client->send(msg("", new_attach("sam", "park-proj")));
    auto attached = first.client->wait_for([](const auto& m) { return is_event(m, "attached"); }, 2000);
    expect(attached.has_value(), "attached");
    sid = attached->session_id;
    first.client->send(msg(sid, text_input("make a game")));
    first.close_and_wait();
  }
  auto runner = orch->find(sid);
  expect(runner && runner->parked(), "session parked after disconnect");
  expect(wait_until([&] { return fx.planner.converse_calls == 1; }, 2000), "input still processed");

  Connection second(*orch);
  auton::Attach resume;
  resume.resume_session = sid;
  second.client->send(msg("", resume));
  auto attached = second.client->wait_for([](const auto& m) { return is_event(m, "attached"); }, 2000);
  expect(attached && std::get<auton::SessionEvent>(attached->body).trigger == "resume", "resumed");
  auto question = second.client->wait_for(
      [](const auto& m) {
        const auto* a = std::get_if<auton::AssistantOutput>(&m.body);
        return a && a->topic == "question";
      },
      3000);
  expect(question.has_value(), "reply produced while parked is delivered");
  expect(runner->attached(), "runner attached again");

  Connection third(*orch);
  third.client->send(msg("", resume));
  auto refused = third.client->wait_for(
      [](const auto& m) { return std::get_if<auton::ErrorMessage>(&m.body) != nullptr; }, 2000);
  expect(refused.has_value(), "second attach to a held session refused");
}

void test_orchestrator_grace_expiry() {
  OrchestratorFixture fx("orch_grace");
  auton::ServerConfig server;
  server.grace_ms = 100;
  server.reap_interval_ms = 10;
  auto orch = fx.make(server);

  std::string sid;
  {
    Connection conn(*orch);
    conn.client->send(msg("", new_attach("tara", "grace-proj")));
    auto attached = conn.client->wait_for([](const auto& m) { return is_event(m, "attached"); }, 2000);
    expect(attached.has_value(), "attached");
    sid = attached->session_id;
    conn.close_and_wait();
  }
  expect(wait_until([&] { return orch->archived_paths().size() == 1; }, 5000),
         "expired session archived");
  expect(orch->find(sid) == nullptr, "expired session removed");
  std::string err;
  auto archive = auton::read_archive(orch->archived_paths()[0], &err);
  expect(archive && archive->final_phase == "cancelled", "cancelled on expiry");
  expect(archive->reason == "grace_expired", "grace_expired reason");
  expect(fx.sandbox.teardowns >= 1, "sandbox released on expiry");

  Connection late(*orch);
  auton::Attach resume;
  resume.resume_session = sid;
  late.client->send(msg("", resume));
  auto refused = late.client->wait_for(
      [](const auto& m) { return std::get_if<auton::ErrorMessage>(&m.body) != nullptr; }, 2000);
  expect(refused.has_value(), "expired session cannot be resumed");
}

void test_orchestrator_cancel_while_planner_busy() {
  OrchestratorFixture fx("orch_cancel_busy");
  fx.planner.converse_delay_ms = 3000;
  auto orch = fx.make(auton::ServerConfig{});
  Connection conn(*orch);
  conn.client->send(msg("", new_attach("omar", "busy-proj")));
  auto attached = conn.client->wait_for([](const auto& m) { return is_event(m, "attached"); }, 2000);
  expect(attached.has_value(), "attached");
  const std::string sid = attached->session_id;
  conn.client->send(msg(sid, text_input("write a compiler")));
  expect(wait_until([&] { return fx.planner.converse_calls == 1; }, 2000), "planner busy");

  const auto sent = std::chrono::steady_clock::now();
  conn.client->send(msg(sid, auton::Cancel{}));
  auto ack = conn.client->wait_for([](const auto& m) { return is_event(m, "cancel_acknowledged"); },
                                   1000);
  const auto acked_after = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - sent)
                               .count();
  expect(ack.has_value(), "cancel acknowledged while the planner is busy");
  expect(acked_after < 1000, "acknowledged without waiting for the planner");

  int extra_acks = 0;
  std::optional<auton::ProtocolMessage> terminal;
  while (auto m = conn.client->next(2000)) {
    if (is_event(*m, "cancel_acknowledged")) ++extra_acks;
    if (is_event(*m, "terminal")) {
      terminal = m;
      break;
    }
  }
  expect(terminal && std::get<auton::SessionEvent>(terminal->body).phase == "cancelled",
         "session cancelled well before the planner delay");
  expect(extra_acks == 0, "cancel acknowledged once");
  conn.close_and_wait();

  expect(wait_until([&] { return orch->archived_paths().size() == 1; }, 3000), "archived");
  std::string err;
  auto archive = auton::read_archive(orch->archived_paths()[0], &err);
  expect(archive && archive->reason == "user_cancelled", "user_cancelled reason");
}

void test_orchestrator_reattach_beats_grace_abort() {
  OrchestratorFixture fx("orch_reattach_race");
  fx.planner.ready = false;
  fx.planner.converse_delay_ms = 1000;
  fx.planner.honour_cancel = false;
  auton::ServerConfig server;
  server.grace_ms = 50;
  server.reap_interval_ms = 60000;
  auto orch = fx.make(server);

  std::string sid;
  {
    Connection first(*orch);
    first.client->send(msg("", new_attach("pia", "race-proj")));
    auto attached = first.client->wait_for([](const auto& m) { return is_event(m, "attached"); }, 2000);
    expect(attached.has_value(), "attached");
    sid = attached->session_id;
    first.client->send(msg(sid, text_input("a chess engine")));
    expect(wait_until([&] { return fx.planner.converse_calls == 1; }, 2000), "planner busy");
    first.close_and_wait();
  }
  auto runner = orch->find(sid);
  expect(runner && runner->parked(), "parked");

  // The abort is queued behind the busy planner call; the reattach lands first.
  orch->reap(auton::now_unix_ms() + 1000);
  Connection second(*orch);
  auton::Attach resume;
  resume.resume_session = sid;
  second.client->send(msg("", resume));
  auto attached = second.client->wait_for([](const auto& m) { return is_event(m, "attached"); }, 2000);
  expect(attached.has_value(), "reattached before the abort was applied");

  auto question = second.client->wait_for(
      [](const auto& m) {
        const auto* a = std::get_if<auton::AssistantOutput>(&m.body);
        return a && a->topic == "question";
      },
      3000);
  expect(question.has_value(), "session kept going");
  fx.planner.honour_cancel = true;
  second.client->send(msg(sid, text_input("with an opening book")));
  auto again = second.client->wait_for(
      [](const auto& m) {
        const auto* a = std::get_if<auton::AssistantOutput>(&m.body);
        return a && a->topic == "question";
      },
      3000);
  expect(again.has_value(), "planner token renewed after the dropped abort");
  expect(fx.sandbox.teardowns == 0, "stale grace abort dropped");
  expect(runner->phase() == auton::SessionPhase::intake && !runner->finished(), "still in intake");
}

void test_orchestrator_fatal_protocol_error() {
  OrchestratorFixture fx("orch_fatal");
  auto orch = fx.make(auton::ServerConfig{});
  const auto before = auton::global_executor_stats().protocol_errors_fatal.load();
  Connection conn(*orch);
  conn.client->send_raw("{\"v\":7,\"id\":\"m1\",\"session\":\"\",\"type\":\"cancel\"}\n");
  auto err = conn.client->next(2000);
  expect(err.has_value(), "error reply");
  const auto* e = std::get_if<auton::ErrorMessage>(&err->body);
  expect(e && e->code == "unsupported_version" && e->fatal && e->ref_id == "m1", "fatal error");
  expect(conn.client->at_eof(2000), "connection closed");
  expect(auton::global_executor_stats().protocol_errors_fatal.load() == before + 1,
         "fatal error counted");
}

void test_orchestrator_shutdown() {
  OrchestratorFixture fx("orch_shutdown");
  fx.planner.ready = false;
  auto orch = fx.make(auton::ServerConfig{});
  Connection conn(*orch);
  conn.client->send(msg("", new_attach("uma", "shutdown-proj")));
  expect(conn.client->wait_for([](const auto& m) { return is_event(m, "attached"); }, 2000).has_value(),
         "attached");
  orch->shutdown();
  expect(orch->archived_paths().size() == 1, "session archived on shutdown");
  std::string err;
  auto archive = auton::read_archive(orch->archived_paths()[0], &err);
  expect(archive && archive->reason == "executor_shutdown", "executor_shutdown reason");
}

void test_transport_listener_roundtrip() {
  std::string err;
  auto addr = auton::parse_listen_address("127.0.0.1:0", &err);
  expect(addr.has_value(), "address parses");
  expect(!auton::parse_listen_address("nohost", &err), "missing port rejected");
  auto v6 = auton::parse_listen_address("[::1]:9000", &err);
  expect(v6 && v6->host == "::1" && v6->port == 9000, "bracketed v6");
  auto ux = auton::parse_listen_address("unix:/tmp/x.sock", &err);
  expect(ux && ux->kind == auton::ListenAddress::Kind::unix_socket, "unix address");

  auto listener = auton::Listener::open(*addr, &err);
  expect(listener != nullptr, "listener opens: " + err);
  expect(listener->address().port != 0, "ephemeral port resolved");
  std::unique_ptr<auton::Transport> accepted;
  std::thread t([&] { accepted = listener->accept(&err); });
  auto client = auton::connect_to(listener->address(), &err);
  t.join();
  expect(client && accepted, "connected");
  expect(client->write_all("ping\n"), "write");
  char buf[16];
  const long n = accepted->read_some(buf, sizeof(buf));
  expect(n == 5 && std::string(buf, 5) == "ping\n", "bytes arrive");
  listener->close();
  expect(listener->accept(&err) == nullptr, "closed listener stops accepting");
}

// ============================================================================
// Phase 8: Archive, config & observability
// ============================================================================

auton::SessionArchive sample_archive() {
  auton::SessionArchive a;
  a.session_id = "sess-arch";
  a.user_id = "vic";
  a.project_id = "arch-proj";
  a.final_phase = "completed";
  a.archived_at_unix_ms = 1234;
  std::string frame = auton::encode(msg("sess-arch", text_input("hi")));
  frame.pop_back();
  a.frames = {frame};
  auton::SessionEventRecord r;
  r.seq = 1;
  r.to_phase = "intake";
  r.trigger = "attach";
  r.unix_ms = 1;
  r.digest = auton::event_record_digest(r);
  a.events = {r};
  return a;
}

void test_archive_write_read() {
  const auto dir = fresh_dir("archive");
  auton::ArchiveConfig cfg;
  cfg.dir = dir.string();
  std::string err;
  auto path = auton::write_archive(cfg, sample_archive(), &err);
  expect(path.has_value(), "archive written: " + err);
  auto back = auton::read_archive(*path, &err);
  expect(back && back->frames.size() == 1 && back->events.size() == 1, "archive read back");
  expect(back->frames[0] == sample_archive().frames[0], "frame preserved");
  expect(auton::verify_event_chain(back->events, &err), "events verify");

  std::ofstream(dir / "broken.ndjson") << "{\"kind\":\"frame\"}\n";
  expect(!auton::read_archive((dir / "broken.ndjson").string(), &err), "headerless archive rejected");

  if (auton::zstd_compiled_in()) {
    cfg.compression = "zstd";
    auto zpath = auton::write_archive(cfg, sample_archive(), &err);
    expect(zpath && zpath->size() > 4 && zpath->substr(zpath->size() - 4) == ".zst",
           "zstd archive named .zst");
    auto z = auton::read_archive(*zpath, &err);
    expect(z && z->session_id == "sess-arch", "zstd archive readable");
  }
}

void test_config_parse_and_validate() {
  auton::AutonConfig cfg;
  auto r = auton::apply_config_json(
      "{\"server\":{\"listen\":\"0.0.0.0:9000\",\"grace_ms\":500,\"colour\":\"red\"},"
      "\"session\":{\"max_replans\":\"many\"},"
      "\"sandbox\":{\"limits\":{\"wall_time_ms\":1500},\"env\":{\"API_TOKEN\":\"s3cret\",\"RUST_LOG\":\"info\"}}}",
      cfg);
  expect(!r.ok, "type error fails the file");
  expect(!r.warnings.empty() && r.warnings[0].find("colour") != std::string::npos,
         "unknown key warned");
  expect(cfg.server.listen == "0.0.0.0:9000" && cfg.server.grace_ms == 500, "values applied");
  expect(cfg.session.limits.wall_time_ms == 1500, "session inherits sandbox limits");

  const std::string shown = auton::config_to_json(cfg);
  expect(shown.find("s3cret") == std::string::npos, "secret redacted");
  expect(shown.find("info") != std::string::npos, "plain env shown");

  auton::AutonConfig bad;
  bad.session.auto_apply_confidence = 1.5;
  bad.server.listen = "nowhere";
  auto v = auton::validate_config(bad);
  expect(!v.ok && v.errors.size() >= 2, "semantic errors reported");

  const auto dir = fresh_dir("config");
  std::ofstream(dir / "auton.json") << "{\"store\":{\"state_dir\":\"/var/lib/auton\"}}";
  auton::ConfigValidationResult report;
  auto loaded = auton::load_config((dir / "auton.json").string(), &report);
  expect(loaded && report.ok, "config file loads");
  if (::getenv("AUTON_STATE_DIR") == nullptr) {
    expect(loaded->state_dir == "/var/lib/auton", "state dir from file");
  }
  expect(!auton::load_config((dir / "missing.json").string(), &report), "missing file fails");
}

std::mutex g_events_mu;
std::vector<auton::ObservedEvent> g_events;

void capture_event(const auton::ObservedEvent& ev) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  g_events.push_back(ev);
}

void test_observability_hook_and_stats() {
  auton::set_event_hook(capture_event);
  const auto root = fresh_dir("obs_store");
  auton::FilePreferenceStore store(root.string());
  FakeSandbox sandbox;
  ScriptedPlanner planner;
  planner.intake_facts = {fact("license", "MIT", 0.8, 0)};
  planner.plans = {one_step_plan("build", {"make"})};
  const auto completed_before = auton::global_executor_stats().sessions_completed.load();
  auton::SessionMachine m("sess-obs", "wes", "obs-proj", {&sandbox, &store, &planner, nullptr},
                          fast_settings(), nullptr);
  m.start();
  m.handle(msg("sess-obs", text_input("build")));
  m.handle(msg("sess-obs", approval()));
  drive(m);
  auton::set_event_hook(nullptr);

  bool transition = false;
  bool command = false;
  bool commit = false;
  {
    std::lock_guard<std::mutex> lk(g_events_mu);
    for (const auto& ev : g_events) {
      if (ev.session_id != "sess-obs") continue;
      transition = transition || (ev.category == "session" && ev.name == "transition");
      command = command || (ev.category == "command" && ev.name == "result");
      commit = commit || (ev.category == "preference" && ev.name == "commit");
    }
  }
  expect(transition && command && commit, "session, command and preference events emitted");
  expect(auton::global_executor_stats().sessions_completed.load() == completed_before + 1,
         "completion counted");
  const std::string stats = auton::global_executor_stats().to_json();
  std::optional<auton::jsonlite::JsonError> err;
  auton::jsonlite::parse(stats, &err);
  expect(!err, "stats render as JSON");
}

void test_version_manifest() {
  const auto m = auton::version::current_manifest();
  expect(m.protocol_framing == auton::version::PROTOCOL_FRAMING_VERSION, "framing version");
  expect(m.hash_primitive == "blake3", "hash primitive");
  std::optional<auton::jsonlite::JsonError> err;
  auto obj = auton::jsonlite::parse(auton::version::manifest_to_json(m), &err);
  expect(!err && auton::jsonlite::get_u64(obj, "archive_format", 0) == 1, "manifest JSON");
}

void test_phase_graph() {
  using P = auton::SessionPhase;
  expect(auton::is_legal_transition(P::intake, P::planning), "intake->planning");
  expect(auton::is_legal_transition(P::executing, P::planning), "replan edge");
  expect(!auton::is_legal_transition(P::intake, P::executing), "no skipping planning");
  expect(auton::is_legal_transition(P::reviewing, P::cancelled), "cancel from any live phase");
  expect(!auton::is_legal_transition(P::completed, P::failed), "terminal is final");
  expect(auton::parse_session_phase("reviewing") == P::reviewing, "phase parse");
}

}  // namespace

int main() {
  std::cout << "=== Auton Executor Test Suite ===\n";

  std::cout << "\n[Phase 1] Hashing & JSON\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain and chain separation", test_domain_and_chain_separation);
  run_test("JSON round trip and strictness", test_json_roundtrip_and_strictness);

  std::cout << "\n[Phase 2] Protocol Codec\n";
  run_test("encode/decode", test_codec_encode_decode);
  run_test("resumable across splits", test_codec_resumable_across_splits);
  run_test("recoverable errors", test_codec_recoverable_errors);
  run_test("fatal errors", test_codec_fatal_errors);

  std::cout << "\n[Phase 3] Preference Store\n";
  run_test("last write wins", test_store_last_write_wins);
  run_test("lower confidence later write wins", test_store_lower_confidence_later_write_wins);
  run_test("out-of-order conflict", test_store_out_of_order_conflict);
  run_test("chain verify and tamper", test_store_chain_verify_and_tamper);
  run_test("frozen snapshot", test_store_frozen_snapshot);
  run_test("snapshot refuses unreadable history", test_store_snapshot_refuses_unreadable_history);
  run_test("concurrent writers", test_store_concurrent_writers);

  std::cout << "\n[Phase 4] Sandbox Runtime\n";
  run_test("echo", test_sandbox_echo);
  run_test("timeout", test_sandbox_timeout);
  run_test("cancel and late cancel", test_sandbox_cancel_and_late_cancel);
  run_test("busy and path escape", test_sandbox_busy_and_path_escape);
  run_test("provision limits", test_sandbox_provision_limits);
  run_test("secret env keys", test_secret_env_keys);

  std::cout << "\n[Phase 5] Planner & Research\n";
  run_test("retry policy", test_retry_policy);
  run_test("planner reply parsing", test_planner_reply_parsing);
  run_test("subprocess planner", test_subprocess_planner);
  run_test("subprocess planner cancel", test_subprocess_planner_cancel);
  run_test("html to text", test_html_to_text);
  run_test("research notes", test_research_notes);

  std::cout << "\n[Phase 6] Session State Machine\n";
  run_test("todo app end to end", test_session_todo_app_end_to_end);
  run_test("timeout then replan", test_session_timeout_then_replan);
  run_test("replan limit", test_session_replan_limit);
  run_test("provision failure", test_session_provision_failure);
  run_test("planning unavailable", test_session_planning_unavailable);
  run_test("cancel running command", test_session_cancel_running_command);
  run_test("empty plan completes", test_session_empty_plan_completes);
  run_test("approval timeout", test_session_approval_timeout);
  run_test("feedback replans", test_session_feedback_replans);
  run_test("preference confirmation", test_session_preference_confirmation);
  run_test("event chain tamper", test_session_event_chain_tamper);
  run_test("assistant output chunking", test_assistant_output_chunking);

  std::cout << "\n[Phase 7] Orchestrator\n";
  run_test("attach and flow", test_orchestrator_attach_and_flow);
  run_test("park and resume", test_orchestrator_park_and_resume);
  run_test("grace expiry", test_orchestrator_grace_expiry);
  run_test("cancel while planner busy", test_orchestrator_cancel_while_planner_busy);
  run_test("reattach beats grace abort", test_orchestrator_reattach_beats_grace_abort);
  run_test("fatal protocol error", test_orchestrator_fatal_protocol_error);
  run_test("shutdown", test_orchestrator_shutdown);
  run_test("listener round trip", test_transport_listener_roundtrip);

  std::cout << "\n[Phase 8] Archive, Config & Observability\n";
  run_test("archive write/read", test_archive_write_read);
  run_test("config parse and validate", test_config_parse_and_validate);
  run_test("observability hook and stats", test_observability_hook_and_stats);
  run_test("version manifest", test_version_manifest);
  run_test("phase graph", test_phase_graph);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
