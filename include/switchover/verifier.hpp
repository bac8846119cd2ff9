#pragma once

// switchover/verifier.hpp - Convergence Verifier.
//
// DESIGN:
//   await_condition() polls a probe at a fixed interval for at most
//   max_attempts attempts and returns a typed Convergence result. The budget is
//   explicit at every call site; there are no retry decorators and no hidden
//   defaults beyond PollBudget's named constructors.
//
//   A probe re-reads live state on every call and reports whether the target
//   predicate holds, the value it observed, the raw text it observed and, when
//   unsatisfied, why.
//
// INVARIANTS:
//   - At most max_attempts probe calls. Sleep happens only between attempts:
//     max_attempts attempts incur max_attempts - 1 sleeps.
//   - Success is reported at the first attempt whose probe is satisfied.
//   - A probe that throws HarnessError counts as one unsatisfied attempt; its
//     message becomes the mismatch. Other exceptions propagate.
//   - Every attempt records the BLAKE3 observation digest of what it saw.
//
// Scenarios treat an unconverged result as failure (Convergence::require)
// unless the timeout is the expected outcome.

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "switchover/control_plane.hpp"
#include "switchover/errors.hpp"
#include "switchover/hash.hpp"
#include "switchover/initiator.hpp"
#include "switchover/observability.hpp"

namespace switchover {

struct PollBudget {
  std::uint64_t interval_ms{1000};
  std::uint32_t max_attempts{40};

  // Path re-establishment: 1s x 40.
  static PollBudget path() { return PollBudget{1000, 40}; }
  // Cordon visibility: 200ms x 10.
  static PollBudget cordon() { return PollBudget{200, 10}; }

  // Longest time an await can spend sleeping.
  std::uint64_t sleep_budget_ms() const {
    return max_attempts == 0 ? 0 : interval_ms * (max_attempts - 1);
  }
};

template <typename T>
struct Observation {
  bool satisfied{false};
  T value{};
  std::string raw;       // text the observation was decoded from
  std::string mismatch;  // why the predicate does not hold; empty when satisfied
};

template <typename T>
using Probe = std::function<Observation<T>()>;

template <typename T>
struct Convergence {
  std::string condition;
  bool converged{false};
  std::uint32_t attempts{0};
  std::uint64_t elapsed_ms{0};
  std::optional<T> value;              // last successfully observed value
  std::string last_raw;
  std::string last_mismatch;
  std::vector<std::string> digests;    // one observation digest per attempt

  // Number of distinct consecutive observations (1 = state never changed).
  std::size_t distinct_observations() const {
    std::size_t n = 0;
    for (std::size_t i = 0; i < digests.size(); ++i) {
      if (i == 0 || digests[i] != digests[i - 1]) ++n;
    }
    return n;
  }

  // Returns the converged value or throws TimeoutError.
  const T& require() const {
    if (!converged || !value) {
      throw TimeoutError(condition, attempts, elapsed_ms, last_mismatch);
    }
    return *value;
  }
};

// Outcome of hold(): whether a predicate stayed unsatisfied for the window.
struct HoldResult {
  std::string condition;
  bool held{true};
  std::uint32_t attempts{0};
  std::uint64_t elapsed_ms{0};
  std::string violation;  // raw observation that satisfied the predicate

  // Throws AssertionFailure when the predicate became true inside the window.
  void require() const {
    if (!held) {
      throw AssertionFailure(condition + " within " + std::to_string(elapsed_ms) + "ms",
                             "never", "after " + std::to_string(attempts) + " attempts");
    }
  }
};

class ConvergenceVerifier {
 public:
  using SleepFn = std::function<void(std::chrono::milliseconds)>;
  using ClockFn = std::function<std::uint64_t()>;  // monotonic milliseconds

  // Real time: std::this_thread::sleep_for and steady_clock.
  ConvergenceVerifier();
  ConvergenceVerifier(SleepFn sleep, ClockFn clock);

  void set_scenario(const std::string& name) { scenario_ = name; }

  template <typename T>
  Convergence<T> await_condition(const std::string& condition, const Probe<T>& probe,
                                 const PollBudget& budget) {
    Convergence<T> out;
    out.condition = condition;
    const std::uint64_t start = clock_();
    for (std::uint32_t attempt = 1; attempt <= budget.max_attempts; ++attempt) {
      Observation<T> obs = observe(probe);
      out.attempts = attempt;
      out.last_raw = obs.raw;
      const std::string digest = observation_digest(obs.raw.empty() ? obs.mismatch : obs.raw);
      out.digests.push_back(digest);
      if (!obs.raw.empty()) out.value = obs.value;
      emit_poll(condition, attempt, obs.satisfied, obs.mismatch, digest);
      if (obs.satisfied) {
        out.converged = true;
        out.value = std::move(obs.value);
        out.last_mismatch.clear();
        break;
      }
      out.last_mismatch = obs.mismatch;
      if (attempt < budget.max_attempts) sleep_(std::chrono::milliseconds(budget.interval_ms));
    }
    out.elapsed_ms = clock_() - start;
    emit_result(condition, out.converged, out.attempts, out.elapsed_ms, out.last_mismatch);
    return out;
  }

  // Asserts the predicate stays unsatisfied across the window: sleeps one
  // interval before each of max_attempts observations and stops early at the
  // first satisfied one.
  template <typename T>
  HoldResult hold(const std::string& condition, const Probe<T>& probe, const PollBudget& budget) {
    HoldResult out;
    out.condition = condition;
    const std::uint64_t start = clock_();
    for (std::uint32_t attempt = 1; attempt <= budget.max_attempts; ++attempt) {
      sleep_(std::chrono::milliseconds(budget.interval_ms));
      Observation<T> obs = observe(probe);
      out.attempts = attempt;
      const std::string digest = observation_digest(obs.raw.empty() ? obs.mismatch : obs.raw);
      emit_poll("not " + condition, attempt, !obs.satisfied, obs.mismatch, digest);
      if (obs.satisfied) {
        out.held = false;
        out.violation = obs.raw;
        break;
      }
    }
    out.elapsed_ms = clock_() - start;
    emit_hold(condition, out.held, out.attempts, out.elapsed_ms, out.violation);
    return out;
  }

 private:
  template <typename T>
  static Observation<T> observe(const Probe<T>& probe) {
    try {
      return probe();
    } catch (const HarnessError& e) {
      Observation<T> failed;
      failed.mismatch = e.what();
      return failed;
    }
  }

  void emit_poll(const std::string& condition, std::uint32_t attempt, bool ok,
                 const std::string& mismatch, const std::string& digest) const;
  void emit_result(const std::string& condition, bool ok, std::uint32_t attempts,
                   std::uint64_t elapsed_ms, const std::string& mismatch) const;
  void emit_hold(const std::string& condition, bool held, std::uint32_t attempts,
                 std::uint64_t elapsed_ms, const std::string& violation) const;

  SleepFn sleep_;
  ClockFn clock_;
  std::string scenario_;
};

// ---------------------------------------------------------------------------
// Canonical predicates
// ---------------------------------------------------------------------------

// Empty when the listing shows exactly one subsystem with exactly one path in
// state "live"; otherwise the first reason it does not.
std::string path_mismatch(const SubsystemListing& listing);

Probe<SubsystemListing> path_reestablished(IInitiator& initiator, const std::string& device);

// Satisfied when the single path is present but not live, or no path is
// listed at all.
Probe<SubsystemListing> path_not_live(IInitiator& initiator, const std::string& device);

// Satisfied once the node reports cordonedstate (or drainedstate) and its
// cordon labels include drain_label. A cordon without that label does not
// count.
Probe<NodeRecord> node_cordon_applied(IControlPlane& control_plane, const std::string& node,
                                      const std::string& drain_label);

Probe<NodeRecord> label_present(IControlPlane& control_plane, const std::string& node,
                                const Label& label);
Probe<NodeRecord> label_absent(IControlPlane& control_plane, const std::string& node,
                               const std::string& key);

// Satisfied when the control plane lists exactly expected nodes.
Probe<std::vector<NodeRecord>> node_count(IControlPlane& control_plane, std::size_t expected);

// Satisfied when the volume's current target node equals node.
Probe<VolumeRecord> volume_target_on(IControlPlane& control_plane, const std::string& volume_uuid,
                                     const std::string& node);

// Satisfied as soon as either the path is live again or the volume's target
// has moved onto node. Holding this false across a window asserts that HA
// neither recovered the path nor picked node while node was cordoned.
Probe<std::string> failover_observed(IInitiator& initiator, const std::string& device,
                                     IControlPlane& control_plane,
                                     const std::string& volume_uuid, const std::string& node);

}  // namespace switchover
