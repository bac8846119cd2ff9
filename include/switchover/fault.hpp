#pragma once

// switchover/fault.hpp - Fault Injector.
//
// DESIGN:
//   A FaultSpec names one mutation of cluster, node or initiator state.
//   FaultInjector::apply() validates that the target exists, performs the
//   mutation and returns as soon as the mutation call returns. It never waits
//   for the cluster to react; that is the ConvergenceVerifier's job.
//
// INVARIANTS:
//   - Every failure surfaces as InjectionError, whatever the collaborator threw.
//   - Every successful apply() is appended to the journal in order.
//   - revert_all() leaves no node cordoned and no target container stopped
//     by this injector, and never throws: failures are returned and logged.

#include <cstdint>
#include <string>
#include <vector>

#include "switchover/container.hpp"
#include "switchover/control_plane.hpp"
#include "switchover/initiator.hpp"

namespace switchover {

enum class FaultKind {
  cordon,
  uncordon,
  stop_target,
  restart_target,
  start_target,
  set_reconnect_delay,
};

std::string to_string(FaultKind kind);

struct FaultSpec {
  FaultKind kind{FaultKind::cordon};
  std::string node;          // node / container name; may be empty for target faults
  std::string drain_label;   // cordon, uncordon
  std::string volume_uuid;   // target faults: resolve node from the volume's current target
  std::string device_uri;    // set_reconnect_delay
  std::uint32_t reconnect_delay_s{0};

  std::string describe() const;

  static FaultSpec cordon(const std::string& node, const std::string& drain_label);
  static FaultSpec uncordon(const std::string& node, const std::string& drain_label);
  static FaultSpec stop_node(const std::string& node);
  static FaultSpec stop_volume_target(const std::string& volume_uuid);
  static FaultSpec restart_node(const std::string& node);
  static FaultSpec restart_volume_target(const std::string& volume_uuid);
  static FaultSpec start_node(const std::string& node);
  static FaultSpec reconnect_delay(const std::string& device_uri, std::uint32_t seconds);
};

struct AppliedFault {
  FaultSpec spec;
  std::string resolved_node;  // node actually mutated (empty for set_reconnect_delay)
  uint64_t duration_ns{0};
};

class FaultInjector {
 public:
  FaultInjector(IControlPlane& control_plane, IContainerRuntime& runtime, IInitiator& initiator);

  // Label attached to emitted fault events.
  void set_scenario(const std::string& name) { scenario_ = name; }

  // Throws InjectionError.
  AppliedFault apply(const FaultSpec& fault);

  const std::vector<AppliedFault>& journal() const { return journal_; }

  // Undo the net effect of the journal, newest first: uncordon nodes still
  // cordoned and start containers still stopped. Returns one message per
  // failed undo. Clears the journal.
  std::vector<std::string> revert_all();

 private:
  std::string resolve_target_node(const FaultSpec& fault);
  void require_node(const std::string& node);
  void require_container(const std::string& node);
  void mutate(const FaultSpec& fault, const std::string& node);

  IControlPlane& control_plane_;
  IContainerRuntime& runtime_;
  IInitiator& initiator_;
  std::string scenario_;
  std::vector<AppliedFault> journal_;
};

}  // namespace switchover
