#pragma once

// switchover/scenario.hpp - Scenario Runner.
//
// DESIGN:
//   A Scenario is an ordered list of Given/When/Then steps. Each step is a
//   function of one ScenarioContext, which owns every resource the scenario
//   acquires (backing disks, cluster, initiator connection, applied faults)
//   and carries the state steps hand to each other (the published volume, the
//   device, the volume's lifecycle outcome).
//
// LIFECYCLE:
//   ScenarioRunner::run() executes steps in order and stops at the first
//   failure; later steps are reported as skipped. Teardown always runs, in
//   reverse acquisition order:
//     initiator disconnect -> fault revert -> cluster stop -> disk removal.
//   A teardown failure is recorded in the report and never replaces the
//   error of the step that failed first.
//
// VOLUME STATE MACHINE:
//   Published(A) --fault--> Degraded --HA--> Republished(B) | SelfHealed(A)
//                                      \--> StuckDegraded (timeout)

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "switchover/config.hpp"
#include "switchover/container.hpp"
#include "switchover/control_plane.hpp"
#include "switchover/deployer.hpp"
#include "switchover/errors.hpp"
#include "switchover/fault.hpp"
#include "switchover/initiator.hpp"
#include "switchover/verifier.hpp"

namespace switchover {

enum class StepKind { given, when, then };
std::string to_string(StepKind kind);

enum class VolumeOutcome {
  none,
  published,
  degraded,
  republished,
  self_healed,
  stuck_degraded,
};
std::string to_string(VolumeOutcome outcome);

// External collaborators a scenario runs against. Empty sleep/clock mean
// real time.
struct Collaborators {
  IControlPlane& control_plane;
  IContainerRuntime& runtime;
  IInitiator& initiator;
  IDeployer& deployer;
  ConvergenceVerifier::SleepFn sleep;
  ConvergenceVerifier::ClockFn clock;
};

struct ScenarioContext {
  ScenarioContext(const std::string& scenario_name, const Collaborators& collaborators,
                  const HarnessConfig& harness_config);

  ScenarioContext(const ScenarioContext&) = delete;
  ScenarioContext& operator=(const ScenarioContext&) = delete;

  std::string scenario;
  const HarnessConfig& config;
  IControlPlane& control_plane;
  IContainerRuntime& runtime;
  IInitiator& initiator;
  IDeployer& deployer;
  FaultInjector injector;
  ConvergenceVerifier verifier;

  PollBudget path_budget;
  PollBudget cordon_budget;
  PollBudget startup_budget;
  PollBudget ha_fail_window;

  // Owned resources, released by teardown() in reverse order.
  std::unique_ptr<BackingDisks> disks;
  std::unique_ptr<ScopedCluster> cluster;
  std::unique_ptr<InitiatorConnection> connection;

  // State handed between steps.
  std::optional<VolumeRecord> volume;
  std::string published_node;
  std::string final_target_node;
  VolumeOutcome outcome{VolumeOutcome::none};
  std::optional<ControlPlaneError> rejection;  // an error a step expected and kept
  std::vector<std::string> notes;

  std::uint64_t now_ms() const { return clock_(); }

  // Throws HarnessError(not_found) when no volume is published yet.
  const VolumeRecord& published_volume() const;
  std::string device_uri() const;
  // Throws HarnessError(not_found) when no initiator is connected.
  const std::string& device() const;

  // Release every owned resource. Returns one message per failed action.
  std::vector<std::string> teardown();

 private:
  ConvergenceVerifier::ClockFn clock_;
};

struct Step {
  StepKind kind{StepKind::given};
  std::string text;
  std::function<void(ScenarioContext&)> action;
};

struct Scenario {
  std::string feature;
  std::string name;
  std::vector<Step> steps;
};

enum class StepStatus { passed, failed, skipped };
std::string to_string(StepStatus status);

struct StepReport {
  StepKind kind{StepKind::given};
  std::string text;
  StepStatus status{StepStatus::skipped};
  std::uint64_t duration_ms{0};
  ErrorCode error_code{ErrorCode::none};
  std::string error;
};

struct ScenarioReport {
  std::string feature;
  std::string scenario;
  std::string control_plane;  // endpoint the scenario ran against
  bool passed{false};
  VolumeOutcome outcome{VolumeOutcome::none};
  std::string published_node;
  std::string final_target_node;
  std::uint64_t elapsed_ms{0};
  std::vector<StepReport> steps;
  std::vector<std::string> notes;
  std::vector<std::string> teardown_errors;

  // First failing step, if any.
  const StepReport* first_failure() const;

  // Schema switchover_report_v1. The trailing "digest" is BLAKE3 (domain
  // "rpt:") over the same object serialized without the digest field.
  std::string to_json() const;
};

// {"schema":"switchover_suite_v1","passed":n,"failed":n,"scenarios":[...]}
std::string suite_to_json(const std::vector<ScenarioReport>& reports);

class ScenarioRunner {
 public:
  ScenarioRunner(Collaborators collaborators, HarnessConfig config);

  ScenarioReport run(const Scenario& scenario);
  std::vector<ScenarioReport> run_all(const std::vector<Scenario>& scenarios);

 private:
  Collaborators collaborators_;
  HarnessConfig config_;
};

}  // namespace switchover
