#include "switchover/verifier.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

namespace switchover {

ConvergenceVerifier::ConvergenceVerifier()
    : ConvergenceVerifier(
          [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); },
          [] {
            return static_cast<std::uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now().time_since_epoch())
                    .count());
          }) {}

ConvergenceVerifier::ConvergenceVerifier(SleepFn sleep, ClockFn clock)
    : sleep_(std::move(sleep)), clock_(std::move(clock)) {}

void ConvergenceVerifier::emit_poll(const std::string& condition, std::uint32_t attempt, bool ok,
                                    const std::string& mismatch,
                                    const std::string& digest) const {
  HarnessEvent ev;
  ev.kind = EventKind::poll;
  ev.scenario = scenario_;
  ev.step = condition;
  ev.ok = ok;
  ev.attempt = attempt;
  ev.detail = mismatch;
  ev.digest = digest;
  emit_harness_event(ev);
}

void ConvergenceVerifier::emit_result(const std::string& condition, bool ok,
                                      std::uint32_t attempts, std::uint64_t elapsed_ms,
                                      const std::string& mismatch) const {
  HarnessEvent ev;
  ev.kind = EventKind::convergence;
  ev.scenario = scenario_;
  ev.step = condition;
  ev.ok = ok;
  ev.attempt = attempts;
  ev.duration_ns = elapsed_ms * 1000000ULL;
  ev.error_code = ok ? ErrorCode::none : ErrorCode::timeout;
  ev.detail = mismatch;
  emit_harness_event(ev);
  if (ok) {
    std::cerr << "[verify] " << condition << " after " << attempts << " attempt(s), "
              << elapsed_ms << "ms\n";
  } else {
    std::cerr << "[verify] gave up on " << condition << " after " << attempts
              << " attempt(s), " << elapsed_ms << "ms: " << mismatch << "\n";
  }
}

void ConvergenceVerifier::emit_hold(const std::string& condition, bool held,
                                    std::uint32_t attempts, std::uint64_t elapsed_ms,
                                    const std::string& violation) const {
  HarnessEvent ev;
  ev.kind = EventKind::hold;
  ev.scenario = scenario_;
  ev.step = "not " + condition;
  ev.ok = held;
  ev.attempt = attempts;
  ev.duration_ns = elapsed_ms * 1000000ULL;
  ev.error_code = held ? ErrorCode::none : ErrorCode::assertion_failed;
  ev.detail = violation;
  emit_harness_event(ev);
  if (held) {
    std::cerr << "[verify] held: no " << condition << " for " << attempts << " attempt(s), "
              << elapsed_ms << "ms\n";
  } else {
    std::cerr << "[verify] " << condition << " observed at attempt " << attempts << " ("
              << elapsed_ms << "ms) inside the hold window\n";
  }
}

// ---------------------------------------------------------------------------
// Predicates
// ---------------------------------------------------------------------------

std::string path_mismatch(const SubsystemListing& listing) {
  if (listing.subsystems.size() != 1) {
    return "expected 1 subsystem, observed " + std::to_string(listing.subsystems.size());
  }
  const auto& sub = listing.subsystems.front();
  if (sub.paths.size() != 1) {
    return "expected 1 path in " + sub.name + ", observed " + std::to_string(sub.paths.size());
  }
  const auto& path = sub.paths.front();
  if (path.state != "live") {
    return "path " + path.name + " is '" + path.state + "', expected 'live'";
  }
  return {};
}

Probe<SubsystemListing> path_reestablished(IInitiator& initiator, const std::string& device) {
  return [&initiator, device]() {
    Observation<SubsystemListing> obs;
    obs.value = initiator.list_subsystems(device);
    obs.raw = obs.value.raw;
    obs.mismatch = path_mismatch(obs.value);
    obs.satisfied = obs.mismatch.empty();
    return obs;
  };
}

Probe<SubsystemListing> path_not_live(IInitiator& initiator, const std::string& device) {
  return [&initiator, device]() {
    Observation<SubsystemListing> obs;
    obs.value = initiator.list_subsystems(device);
    obs.raw = obs.value.raw;
    for (const auto& sub : obs.value.subsystems) {
      for (const auto& path : sub.paths) {
        if (path.state == "live") {
          obs.mismatch = "path " + path.name + " is still live";
          return obs;
        }
      }
    }
    obs.satisfied = true;
    return obs;
  };
}

Probe<NodeRecord> node_cordon_applied(IControlPlane& control_plane, const std::string& node,
                                      const std::string& drain_label) {
  return [&control_plane, node, drain_label]() {
    Observation<NodeRecord> obs;
    obs.value = control_plane.get_node(node);
    obs.raw = obs.value.raw;
    const auto& labels = obs.value.cordon_labels;
    const bool labelled = std::find(labels.begin(), labels.end(), drain_label) != labels.end();
    if (obs.value.cordon_state != CordonState::cordoned) {
      obs.mismatch = "node " + node + " is " + to_string(obs.value.cordon_state);
    } else if (!labelled) {
      obs.mismatch = "node " + node + " is cordoned without label '" + drain_label + "'";
    } else {
      obs.satisfied = true;
    }
    return obs;
  };
}

Probe<NodeRecord> label_present(IControlPlane& control_plane, const std::string& node,
                                const Label& label) {
  return [&control_plane, node, label]() {
    Observation<NodeRecord> obs;
    obs.value = control_plane.get_node(node);
    obs.raw = obs.value.raw;
    auto it = obs.value.labels.find(label.key);
    if (it == obs.value.labels.end()) {
      obs.mismatch = "node " + node + " has no label '" + label.key + "'";
    } else if (it->second != label.value) {
      obs.mismatch = "node " + node + " has " + label.key + "=" + it->second;
    } else {
      obs.satisfied = true;
    }
    return obs;
  };
}

Probe<NodeRecord> label_absent(IControlPlane& control_plane, const std::string& node,
                               const std::string& key) {
  return [&control_plane, node, key]() {
    Observation<NodeRecord> obs;
    obs.value = control_plane.get_node(node);
    obs.raw = obs.value.raw;
    auto it = obs.value.labels.find(key);
    if (it != obs.value.labels.end()) {
      obs.mismatch = "node " + node + " still has " + key + "=" + it->second;
    } else {
      obs.satisfied = true;
    }
    return obs;
  };
}

Probe<std::vector<NodeRecord>> node_count(IControlPlane& control_plane, std::size_t expected) {
  return [&control_plane, expected]() {
    Observation<std::vector<NodeRecord>> obs;
    obs.value = control_plane.get_nodes();
    for (const auto& n : obs.value) obs.raw += n.raw + "\n";
    if (obs.raw.empty()) obs.raw = "[]";
    if (obs.value.size() != expected) {
      obs.mismatch = "expected " + std::to_string(expected) + " nodes, observed " +
                     std::to_string(obs.value.size());
    } else {
      obs.satisfied = true;
    }
    return obs;
  };
}

Probe<VolumeRecord> volume_target_on(IControlPlane& control_plane, const std::string& volume_uuid,
                                     const std::string& node) {
  return [&control_plane, volume_uuid, node]() {
    Observation<VolumeRecord> obs;
    obs.value = control_plane.get_volume(volume_uuid);
    obs.raw = obs.value.uuid + " " + obs.value.status + " " +
              (obs.value.target ? obs.value.target->node + " " + obs.value.target->device_uri
                                : std::string("unpublished"));
    if (!obs.value.target) {
      obs.mismatch = "volume " + volume_uuid + " is not published";
    } else if (obs.value.target->node != node) {
      obs.mismatch = "volume target is on " + obs.value.target->node + ", expected " + node;
    } else {
      obs.satisfied = true;
    }
    return obs;
  };
}

Probe<std::string> failover_observed(IInitiator& initiator, const std::string& device,
                                     IControlPlane& control_plane,
                                     const std::string& volume_uuid, const std::string& node) {
  auto path = path_reestablished(initiator, device);
  auto moved = volume_target_on(control_plane, volume_uuid, node);
  return [path, moved, node]() {
    const Observation<VolumeRecord> target = moved();
    const Observation<SubsystemListing> listing = path();
    Observation<std::string> obs;
    obs.raw = target.raw + "\n" + listing.raw;
    if (target.satisfied) {
      obs.satisfied = true;
      obs.value = "volume target moved onto " + node;
    } else if (listing.satisfied) {
      obs.satisfied = true;
      obs.value = "path is live again";
    } else {
      obs.mismatch = target.mismatch + "; " + listing.mismatch;
    }
    return obs;
  };
}

}  // namespace switchover
