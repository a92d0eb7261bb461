#include "auton/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "auton/jsonlite.hpp"

namespace auton {

namespace {

inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_counter(std::string& out, const char* name, const std::atomic<uint64_t>& v,
                    bool first = false) {
  if (!first) out += ',';
  out += '"';
  out += name;
  out += "\":";
  out += std::to_string(v.load(std::memory_order_relaxed));
}

std::atomic<EventHook> g_event_hook{nullptr};

}  // namespace

std::string event_to_json(const ObservedEvent& ev) {
  jsonlite::Object o;
  o["category"] = ev.category;
  o["name"] = ev.name;
  o["session"] = ev.session_id;
  o["unix_ms"] = ev.unix_ms;
  o["fields"] = jsonlite::to_object(ev.fields);
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target && cumulative > 0) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", mean_us() / 1000.0);
  out += buf;
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.50) / 1000.0);
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.95) / 1000.0);
  out += buf;
  out += ",\"p99_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.99) / 1000.0);
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// ExecutorStats
// ---------------------------------------------------------------------------

void ExecutorStats::record_session_started() {
  sessions_started.fetch_add(1, std::memory_order_relaxed);
}

void ExecutorStats::record_session_finished(SessionPhase terminal_phase) {
  switch (terminal_phase) {
    case SessionPhase::completed:
      sessions_completed.fetch_add(1, std::memory_order_relaxed);
      break;
    case SessionPhase::failed:
      sessions_failed.fetch_add(1, std::memory_order_relaxed);
      break;
    case SessionPhase::cancelled:
      sessions_cancelled.fetch_add(1, std::memory_order_relaxed);
      break;
    default:
      break;
  }
}

void ExecutorStats::record_command(CommandStatus status, uint64_t duration_ns) {
  commands_run.fetch_add(1, std::memory_order_relaxed);
  switch (status) {
    case CommandStatus::succeeded:
      commands_succeeded.fetch_add(1, std::memory_order_relaxed);
      break;
    case CommandStatus::failed:
      commands_failed.fetch_add(1, std::memory_order_relaxed);
      break;
    case CommandStatus::timed_out:
      commands_timed_out.fetch_add(1, std::memory_order_relaxed);
      break;
    case CommandStatus::cancelled:
      commands_cancelled.fetch_add(1, std::memory_order_relaxed);
      break;
  }
  command_latency.record(duration_ns);
}

void ExecutorStats::record_protocol_error(bool fatal) {
  if (fatal) {
    protocol_errors_fatal.fetch_add(1, std::memory_order_relaxed);
  } else {
    protocol_errors_recoverable.fetch_add(1, std::memory_order_relaxed);
  }
}

std::string ExecutorStats::to_json() const {
  std::string out;
  out.reserve(768);
  out += "{\"sessions\":{";
  append_counter(out, "started", sessions_started, true);
  append_counter(out, "completed", sessions_completed);
  append_counter(out, "failed", sessions_failed);
  append_counter(out, "cancelled", sessions_cancelled);
  append_counter(out, "parked", sessions_parked);
  append_counter(out, "resumed", sessions_resumed);
  out += "},\"commands\":{";
  append_counter(out, "run", commands_run, true);
  append_counter(out, "succeeded", commands_succeeded);
  append_counter(out, "failed", commands_failed);
  append_counter(out, "timed_out", commands_timed_out);
  append_counter(out, "cancelled", commands_cancelled);
  out += ",\"latency\":";
  out += command_latency.to_json();
  out += "},\"protocol\":{";
  append_counter(out, "errors_recoverable", protocol_errors_recoverable, true);
  append_counter(out, "errors_fatal", protocol_errors_fatal);
  out += "},\"planner\":{";
  append_counter(out, "retries", planner_retries, true);
  append_counter(out, "replans", replans);
  out += "},\"preferences\":{";
  append_counter(out, "commits", preference_commits, true);
  append_counter(out, "conflicts", preference_conflicts);
  out += "}}";
  return out;
}

ExecutorStats& global_executor_stats() {
  static ExecutorStats inst;
  return inst;
}

void set_event_hook(EventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_event(const ObservedEvent& ev) {
  EventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("AUTON_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = event_to_json(ev);
  line += '\n';
  // O_APPEND keeps concurrent single-line writes from interleaving.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace auton
