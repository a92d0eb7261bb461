#pragma once

// auton/observability.hpp: Counters, command latency histogram and the
// structured JSONL event stream.
//
// DESIGN:
//   ObservedEvent is the unit of the event stream. Session transitions,
//   command results, protocol errors and preference commits each emit one.
//   Sinks, in priority order:
//     1. a hook registered with set_event_hook() (tests, embedders);
//     2. the JSONL file named by AUTON_EVENT_LOG, one object per line.
//   Emission never blocks a session on anything but a short append.
//
//   ExecutorStats is process-wide and lock-free; `auton health` prints it.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

#include "auton/types.hpp"

namespace auton {

struct ObservedEvent {
  std::string category;  // "session" | "command" | "protocol" | "preference"
  std::string name;
  std::string session_id;
  std::map<std::string, std::string> fields;
  std::uint64_t unix_ms{0};
};

std::string event_to_json(const ObservedEvent& ev);

// Bucket i covers [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 40;

  void record(uint64_t duration_ns);
  double percentile(double p) const;  // microseconds
  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;
  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

class ExecutorStats {
 public:
  void record_session_started();
  void record_session_finished(SessionPhase terminal_phase);
  void record_command(CommandStatus status, uint64_t duration_ns);
  void record_protocol_error(bool fatal);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> sessions_started{0};
  std::atomic<uint64_t> sessions_completed{0};
  std::atomic<uint64_t> sessions_failed{0};
  std::atomic<uint64_t> sessions_cancelled{0};
  std::atomic<uint64_t> sessions_parked{0};
  std::atomic<uint64_t> sessions_resumed{0};

  alignas(64) std::atomic<uint64_t> commands_run{0};
  std::atomic<uint64_t> commands_succeeded{0};
  std::atomic<uint64_t> commands_failed{0};
  std::atomic<uint64_t> commands_timed_out{0};
  std::atomic<uint64_t> commands_cancelled{0};

  alignas(64) std::atomic<uint64_t> protocol_errors_recoverable{0};
  std::atomic<uint64_t> protocol_errors_fatal{0};

  alignas(64) std::atomic<uint64_t> planner_retries{0};
  std::atomic<uint64_t> replans{0};
  std::atomic<uint64_t> preference_commits{0};
  std::atomic<uint64_t> preference_conflicts{0};

  LatencyHistogram command_latency;
};

ExecutorStats& global_executor_stats();

void emit_event(const ObservedEvent& ev);

using EventHook = void (*)(const ObservedEvent&);
void set_event_hook(EventHook hook);

struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace auton
