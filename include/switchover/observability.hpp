#pragma once

// switchover/observability.hpp - Structured harness observability.
//
// DESIGN:
//   HarnessEvent is the observable unit. Every step, fault, poll attempt,
//   convergence result, hold window and teardown action emits one. emit_harness_event():
//     - always folds the event into global_harness_stats();
//     - forwards it to the registered hook, if any;
//     - otherwise appends it as one JSONL line to the event log, when one is
//       configured (configure_event_log() or SWITCHOVER_EVENT_LOG).
//
// INVARIANTS:
//   - Emission never throws. A sink that cannot be opened drops the event.
//   - LatencyHistogram bucket boundaries are fixed powers of two (microseconds);
//     changing them changes the meaning of every recorded report.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "switchover/types.hpp"

namespace switchover {

enum class EventKind {
  step,
  fault,
  poll,
  convergence,
  hold,  // a window in which a predicate had to stay false
  teardown,
  scenario,
};

std::string to_string(EventKind kind);

struct HarnessEvent {
  EventKind kind{EventKind::step};
  std::string scenario;
  std::string step;          // step text, fault description or predicate name
  bool ok{false};
  uint64_t duration_ns{0};
  uint32_t attempt{0};       // poll attempt (1-based); 0 when not a poll
  ErrorCode error_code{ErrorCode::none};
  std::string detail;        // mismatch reason or error message
  std::string digest;        // observation digest for polls

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket 0: [0, 1us), bucket i: [2^(i-1) us, 2^i us). The last bucket absorbs
// everything above.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 40;

  void record(uint64_t duration_ns);

  // Approximate percentile, p in [0.0, 1.0], in microseconds. 0.0 when empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  static size_t bucket_for_us(uint64_t duration_us);

  void reset();

  std::string to_json() const;

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// HarnessStats - aggregated counters for one harness process
// ---------------------------------------------------------------------------
class HarnessStats {
 public:
  void record(const HarnessEvent& ev);
  std::string to_json() const;

  std::atomic<uint64_t> steps_run{0};
  std::atomic<uint64_t> step_failures{0};
  std::atomic<uint64_t> faults_applied{0};
  std::atomic<uint64_t> fault_failures{0};
  std::atomic<uint64_t> polls{0};
  std::atomic<uint64_t> convergences{0};
  std::atomic<uint64_t> timeouts{0};
  std::atomic<uint64_t> holds_kept{0};
  std::atomic<uint64_t> hold_violations{0};
  std::atomic<uint64_t> teardown_failures{0};
  std::atomic<uint64_t> scenarios_passed{0};
  std::atomic<uint64_t> scenarios_failed{0};

  // Time-to-convergence of successful awaits. Hold windows are not recorded.
  LatencyHistogram convergence_latency;

  std::map<ErrorCode, uint64_t> failure_categories() const;

  static constexpr size_t kMaxRecentEvents = 512;
  std::vector<HarnessEvent> recent_events_snapshot() const;

  // Zero every counter and drop recent events. Used between test cases.
  void reset();

 private:
  mutable std::mutex mu_;
  std::map<ErrorCode, uint64_t> failures_;
  std::vector<HarnessEvent> ring_;
  size_t ring_head_{0};  // next slot to overwrite once ring_ is full
};

HarnessStats& global_harness_stats();

// Fire-and-forget. See the header comment for routing.
void emit_harness_event(const HarnessEvent& ev);

using HarnessEventHook = void (*)(const HarnessEvent&);
void set_harness_event_hook(HarnessEventHook hook);

// Route JSONL output to path. An empty path disables the file sink. When never
// called, SWITCHOVER_EVENT_LOG is consulted on each emission.
void configure_event_log(const std::string& path);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace switchover
