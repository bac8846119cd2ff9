#include "switchover/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "switchover/jsonlite.hpp"

namespace switchover {

std::string to_string(EventKind kind) {
  switch (kind) {
    case EventKind::step:
      return "step";
    case EventKind::fault:
      return "fault";
    case EventKind::poll:
      return "poll";
    case EventKind::convergence:
      return "convergence";
    case EventKind::hold:
      return "hold";
    case EventKind::teardown:
      return "teardown";
    case EventKind::scenario:
      return "scenario";
  }
  return "unknown";
}

std::string HarnessEvent::to_json() const {
  std::string line;
  line.reserve(256);
  line += "{\"kind\":\"";
  line += switchover::to_string(kind);
  line += "\",\"scenario\":\"";
  line += jsonlite::escape(scenario);
  line += "\",\"step\":\"";
  line += jsonlite::escape(step);
  line += "\",\"ok\":";
  line += ok ? "true" : "false";
  line += ",\"duration_ns\":";
  line += std::to_string(duration_ns);
  if (attempt > 0) {
    line += ",\"attempt\":";
    line += std::to_string(attempt);
  }
  line += ",\"error_code\":\"";
  line += switchover::to_string(error_code);
  line += "\"";
  if (!detail.empty()) {
    line += ",\"detail\":\"";
    line += jsonlite::escape(detail);
    line += "\"";
  }
  if (!digest.empty()) {
    line += ",\"digest\":\"";
    line += digest;
    line += "\"";
  }
  line += "}";
  return line;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

// bit_width(x) is floor(log2(x)) + 1 for x > 0, which is exactly the bucket.
size_t LatencyHistogram::bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= kBuckets) ? kBuckets - 1 : b;
}

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

void LatencyHistogram::reset() {
  for (auto& b : buckets_) b.store(0, std::memory_order_relaxed);
  count_.store(0, std::memory_order_relaxed);
  sum_us_.store(0, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target && cumulative > 0) {
      // Midpoint of [2^(i-1), 2^i) us; bucket 0 is [0, 1) us.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
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
// HarnessStats
// ---------------------------------------------------------------------------

void HarnessStats::record(const HarnessEvent& ev) {
  switch (ev.kind) {
    case EventKind::step:
      steps_run.fetch_add(1, std::memory_order_relaxed);
      if (!ev.ok) step_failures.fetch_add(1, std::memory_order_relaxed);
      break;
    case EventKind::fault:
      if (ev.ok) {
        faults_applied.fetch_add(1, std::memory_order_relaxed);
      } else {
        fault_failures.fetch_add(1, std::memory_order_relaxed);
      }
      break;
    case EventKind::poll:
      polls.fetch_add(1, std::memory_order_relaxed);
      break;
    case EventKind::convergence:
      if (ev.ok) {
        convergences.fetch_add(1, std::memory_order_relaxed);
        convergence_latency.record(ev.duration_ns);
      } else {
        timeouts.fetch_add(1, std::memory_order_relaxed);
      }
      break;
    case EventKind::hold:
      if (ev.ok) {
        holds_kept.fetch_add(1, std::memory_order_relaxed);
      } else {
        hold_violations.fetch_add(1, std::memory_order_relaxed);
      }
      break;
    case EventKind::teardown:
      if (!ev.ok) teardown_failures.fetch_add(1, std::memory_order_relaxed);
      break;
    case EventKind::scenario:
      if (ev.ok) {
        scenarios_passed.fetch_add(1, std::memory_order_relaxed);
      } else {
        scenarios_failed.fetch_add(1, std::memory_order_relaxed);
      }
      break;
  }

  std::lock_guard<std::mutex> lk(mu_);
  if (!ev.ok && ev.error_code != ErrorCode::none) ++failures_[ev.error_code];
  if (ring_.size() < kMaxRecentEvents) {
    ring_.push_back(ev);
  } else {
    ring_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::map<ErrorCode, uint64_t> HarnessStats::failure_categories() const {
  std::lock_guard<std::mutex> lk(mu_);
  return failures_;
}

std::vector<HarnessEvent> HarnessStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  // Oldest first.
  std::vector<HarnessEvent> out;
  out.reserve(ring_.size());
  for (size_t i = 0; i < ring_.size(); ++i) {
    out.push_back(ring_[(ring_head_ + i) % ring_.size()]);
  }
  return out;
}

void HarnessStats::reset() {
  for (auto* c : {&steps_run, &step_failures, &faults_applied, &fault_failures, &polls,
                  &convergences, &timeouts, &holds_kept, &hold_violations, &teardown_failures,
                  &scenarios_passed, &scenarios_failed}) {
    c->store(0, std::memory_order_relaxed);
  }
  convergence_latency.reset();
  std::lock_guard<std::mutex> lk(mu_);
  failures_.clear();
  ring_.clear();
  ring_head_ = 0;
}

std::string HarnessStats::to_json() const {
  std::string out;
  out.reserve(512);
  auto field = [&out](const char* name, const std::atomic<uint64_t>& v, bool first = false) {
    if (!first) out += ',';
    out += '"';
    out += name;
    out += "\":";
    out += std::to_string(v.load(std::memory_order_relaxed));
  };
  out += '{';
  field("steps_run", steps_run, true);
  field("step_failures", step_failures);
  field("faults_applied", faults_applied);
  field("fault_failures", fault_failures);
  field("polls", polls);
  field("convergences", convergences);
  field("timeouts", timeouts);
  field("holds_kept", holds_kept);
  field("hold_violations", hold_violations);
  field("teardown_failures", teardown_failures);
  field("scenarios_passed", scenarios_passed);
  field("scenarios_failed", scenarios_failed);
  out += ",\"convergence_latency\":";
  out += convergence_latency.to_json();
  out += ",\"failure_categories\":{";
  bool first = true;
  for (const auto& [code, n] : failure_categories()) {
    if (!first) out += ',';
    first = false;
    out += '"';
    out += switchover::to_string(code);
    out += "\":";
    out += std::to_string(n);
  }
  out += "}}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

HarnessStats& global_harness_stats() {
  static HarnessStats inst;
  return inst;
}

namespace {
std::atomic<HarnessEventHook> g_event_hook{nullptr};

std::mutex g_sink_mu;
bool g_sink_configured = false;
std::string g_sink_path;
}  // namespace

void set_harness_event_hook(HarnessEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void configure_event_log(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  g_sink_configured = true;
  g_sink_path = path;
}

void emit_harness_event(const HarnessEvent& ev) {
  global_harness_stats().record(ev);

  HarnessEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  std::string path;
  {
    std::lock_guard<std::mutex> lk(g_sink_mu);
    if (g_sink_configured) {
      path = g_sink_path;
    } else if (const char* env = std::getenv("SWITCHOVER_EVENT_LOG")) {
      path = env;
    }
  }
  if (path.empty()) return;

  const std::string line = ev.to_json() + "\n";
  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace switchover
