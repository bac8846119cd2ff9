#include "switchover/fault.hpp"

#include <iostream>
#include <set>
#include <utility>

#include "switchover/errors.hpp"
#include "switchover/observability.hpp"

namespace switchover {

std::string to_string(FaultKind kind) {
  switch (kind) {
    case FaultKind::cordon:
      return "cordon";
    case FaultKind::uncordon:
      return "uncordon";
    case FaultKind::stop_target:
      return "stop-target";
    case FaultKind::restart_target:
      return "restart-target";
    case FaultKind::start_target:
      return "start-target";
    case FaultKind::set_reconnect_delay:
      return "set-reconnect-delay";
  }
  return "unknown";
}

std::string FaultSpec::describe() const {
  std::string out = to_string(kind);
  switch (kind) {
    case FaultKind::cordon:
    case FaultKind::uncordon:
      out += " " + node + " (" + drain_label + ")";
      break;
    case FaultKind::stop_target:
    case FaultKind::restart_target:
    case FaultKind::start_target:
      out += node.empty() ? " target of volume " + volume_uuid : " " + node;
      break;
    case FaultKind::set_reconnect_delay:
      out += " " + std::to_string(reconnect_delay_s) + "s on " + device_uri;
      break;
  }
  return out;
}

FaultSpec FaultSpec::cordon(const std::string& node, const std::string& drain_label) {
  FaultSpec f;
  f.kind = FaultKind::cordon;
  f.node = node;
  f.drain_label = drain_label;
  return f;
}

FaultSpec FaultSpec::uncordon(const std::string& node, const std::string& drain_label) {
  FaultSpec f = cordon(node, drain_label);
  f.kind = FaultKind::uncordon;
  return f;
}

FaultSpec FaultSpec::stop_node(const std::string& node) {
  FaultSpec f;
  f.kind = FaultKind::stop_target;
  f.node = node;
  return f;
}

FaultSpec FaultSpec::stop_volume_target(const std::string& volume_uuid) {
  FaultSpec f;
  f.kind = FaultKind::stop_target;
  f.volume_uuid = volume_uuid;
  return f;
}

FaultSpec FaultSpec::restart_node(const std::string& node) {
  FaultSpec f = stop_node(node);
  f.kind = FaultKind::restart_target;
  return f;
}

FaultSpec FaultSpec::restart_volume_target(const std::string& volume_uuid) {
  FaultSpec f = stop_volume_target(volume_uuid);
  f.kind = FaultKind::restart_target;
  return f;
}

FaultSpec FaultSpec::start_node(const std::string& node) {
  FaultSpec f = stop_node(node);
  f.kind = FaultKind::start_target;
  return f;
}

FaultSpec FaultSpec::reconnect_delay(const std::string& device_uri, std::uint32_t seconds) {
  FaultSpec f;
  f.kind = FaultKind::set_reconnect_delay;
  f.device_uri = device_uri;
  f.reconnect_delay_s = seconds;
  return f;
}

// ---------------------------------------------------------------------------
// FaultInjector
// ---------------------------------------------------------------------------

FaultInjector::FaultInjector(IControlPlane& control_plane, IContainerRuntime& runtime,
                             IInitiator& initiator)
    : control_plane_(control_plane), runtime_(runtime), initiator_(initiator) {}

// Lookup failures are HarnessErrors; apply() turns them into InjectionError.
void FaultInjector::require_node(const std::string& node) {
  if (node.empty()) throw HarnessError(ErrorCode::not_found, "no node named");
  try {
    control_plane_.get_node(node);
  } catch (const ControlPlaneError& e) {
    if (!e.is_not_found()) throw;
    throw HarnessError(ErrorCode::not_found, "node " + node + " does not exist");
  }
}

void FaultInjector::require_container(const std::string& node) {
  if (!runtime_.exists(node)) {
    throw HarnessError(ErrorCode::not_found, "container " + node + " does not exist");
  }
}

std::string FaultInjector::resolve_target_node(const FaultSpec& fault) {
  if (!fault.node.empty()) return fault.node;
  if (fault.volume_uuid.empty()) {
    throw InjectionError(fault.describe(), "neither a node nor a volume was given");
  }
  VolumeRecord vol;
  try {
    vol = control_plane_.get_volume(fault.volume_uuid);
  } catch (const ControlPlaneError& e) {
    if (e.is_not_found()) {
      throw InjectionError(fault.describe(), "volume " + fault.volume_uuid + " does not exist");
    }
    throw InjectionError(fault.describe(), e.what());
  }
  if (!vol.target || vol.target->node.empty()) {
    throw InjectionError(fault.describe(), "volume " + fault.volume_uuid + " is not published");
  }
  return vol.target->node;
}

void FaultInjector::mutate(const FaultSpec& fault, const std::string& node) {
  switch (fault.kind) {
    case FaultKind::cordon:
      require_node(node);
      control_plane_.put_node_cordon(node, fault.drain_label);
      break;
    case FaultKind::uncordon:
      require_node(node);
      control_plane_.delete_node_cordon(node, fault.drain_label);
      break;
    case FaultKind::stop_target:
      require_container(node);
      runtime_.stop(node);
      break;
    case FaultKind::restart_target:
      require_container(node);
      runtime_.restart(node);
      break;
    case FaultKind::start_target:
      require_container(node);
      runtime_.start(node);
      break;
    case FaultKind::set_reconnect_delay:
      if (!parse_nvmf_uri(fault.device_uri)) {
        throw InjectionError(fault.describe(), "not an nvmf device uri: " + fault.device_uri);
      }
      initiator_.set_reconnect_delay(fault.device_uri, fault.reconnect_delay_s);
      break;
  }
}

AppliedFault FaultInjector::apply(const FaultSpec& fault) {
  HarnessEvent ev;
  ev.kind = EventKind::fault;
  ev.scenario = scenario_;
  ev.step = fault.describe();

  AppliedFault applied;
  applied.spec = fault;
  try {
    ScopeTimer timer(ev.duration_ns);
    if (fault.kind == FaultKind::stop_target || fault.kind == FaultKind::restart_target ||
        fault.kind == FaultKind::start_target) {
      applied.resolved_node = resolve_target_node(fault);
    } else if (fault.kind != FaultKind::set_reconnect_delay) {
      applied.resolved_node = fault.node;
    }
    mutate(fault, applied.resolved_node);
  } catch (const InjectionError& e) {
    ev.error_code = e.code();
    ev.detail = e.what();
    emit_harness_event(ev);
    std::cerr << "[fault] FAIL " << ev.step << ": " << e.what() << "\n";
    throw;
  } catch (const HarnessError& e) {
    InjectionError wrapped(fault.describe(), e.what());
    ev.error_code = wrapped.code();
    ev.detail = wrapped.what();
    emit_harness_event(ev);
    std::cerr << "[fault] FAIL " << ev.step << ": " << e.what() << "\n";
    throw wrapped;
  }

  ev.ok = true;
  if (!applied.resolved_node.empty() && fault.node.empty()) {
    ev.detail = "resolved to " + applied.resolved_node;
  }
  emit_harness_event(ev);
  applied.duration_ns = ev.duration_ns;
  std::cerr << "[fault] " << ev.step
            << (ev.detail.empty() ? "" : " (" + ev.detail + ")") << "\n";
  journal_.push_back(applied);
  return applied;
}

std::vector<std::string> FaultInjector::revert_all() {
  // Net state: which (node, label) cordons and which stopped containers are
  // still outstanding once the whole journal is replayed.
  std::set<std::pair<std::string, std::string>> cordoned;
  std::set<std::string> stopped;
  std::vector<FaultSpec> undo;
  for (const auto& a : journal_) {
    const auto key = std::make_pair(a.resolved_node, a.spec.drain_label);
    switch (a.spec.kind) {
      case FaultKind::cordon:
        cordoned.insert(key);
        break;
      case FaultKind::uncordon:
        cordoned.erase(key);
        break;
      case FaultKind::stop_target:
        stopped.insert(a.resolved_node);
        break;
      case FaultKind::restart_target:
      case FaultKind::start_target:
        stopped.erase(a.resolved_node);
        break;
      case FaultKind::set_reconnect_delay:
        break;
    }
  }
  for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
    if (it->spec.kind == FaultKind::cordon &&
        cordoned.erase(std::make_pair(it->resolved_node, it->spec.drain_label)) > 0) {
      undo.push_back(FaultSpec::uncordon(it->resolved_node, it->spec.drain_label));
    } else if (it->spec.kind == FaultKind::stop_target && stopped.erase(it->resolved_node) > 0) {
      undo.push_back(FaultSpec::start_node(it->resolved_node));
    }
  }
  journal_.clear();

  std::vector<std::string> errors;
  for (const auto& f : undo) {
    HarnessEvent ev;
    ev.kind = EventKind::teardown;
    ev.scenario = scenario_;
    ev.step = "revert " + f.describe();
    try {
      ScopeTimer timer(ev.duration_ns);
      mutate(f, f.node);
      ev.ok = true;
    } catch (const std::exception& e) {
      ev.error_code = ErrorCode::teardown_failed;
      ev.detail = e.what();
      errors.push_back(ev.step + ": " + e.what());
      std::cerr << "[teardown] WARN: " << ev.step << " failed: " << e.what() << "\n";
    }
    emit_harness_event(ev);
  }
  return errors;
}

}  // namespace switchover
