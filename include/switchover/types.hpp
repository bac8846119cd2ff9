#pragma once

// switchover/types.hpp - Core data structures for the failover verification harness.
//
// DESIGN:
//   Everything the harness observes about the cluster is copied into plain value
//   types. Nothing here holds a connection or a reference back into the control
//   plane: a NodeRecord is a snapshot taken at the moment of the GET that produced
//   it, and the verifier re-fetches a new snapshot on every attempt.
//
// MEMORY OWNERSHIP:
//   All members are value-owned. Records are returned by value; callers own them.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace switchover {

enum class ErrorCode {
  none,
  control_plane_error,
  transport_error,
  injection_failed,
  timeout,
  assertion_failed,
  json_parse_error,
  spawn_failed,
  not_found,
  config_invalid,
  teardown_failed,
};

std::string to_string(ErrorCode code);

// Cordon state as reported by node.spec.cordondrainstate.
//   uncordoned - no cordon-drain state present.
//   cordoning  - a drain is in progress (drainingstate); node is already
//                unschedulable but the cordon has not settled.
//   cordoned   - cordonedstate or drainedstate present.
enum class CordonState {
  uncordoned,
  cordoning,
  cordoned,
};

std::string to_string(CordonState state);

// ---------------------------------------------------------------------------
// Label - key=value pair attached to a node. Keys are unique per node.
// ---------------------------------------------------------------------------
struct Label {
  std::string key;
  std::string value;

  bool operator==(const Label& other) const = default;
};

// Parse "key=value". Returns nullopt when '=' is missing or the key is empty.
// The value may be empty and may itself contain '='.
std::optional<Label> parse_label(const std::string& text);
std::string format_label(const Label& label);

struct NodeRecord {
  std::string id;
  std::string grpc_endpoint;
  std::string status;                          // state.status, e.g. "Online"
  CordonState cordon_state{CordonState::uncordoned};
  std::vector<std::string> cordon_labels;      // drain labels currently applied
  std::map<std::string, std::string> labels;   // spec.labels
  bool has_labels{false};                      // spec.labels key was present at all
  std::string raw;                             // body the record was decoded from
};

struct PoolSpec {
  std::string node;
  std::string id;
  std::vector<std::string> disks;
};

struct PoolRecord {
  std::string id;
  std::string node;
  std::vector<std::string> disks;
  std::string status;
  uint64_t capacity_bytes{0};
};

enum class Protocol {
  none,
  nvmf,
};

std::string to_string(Protocol protocol);

struct VolumePolicy {
  bool self_heal{true};
};

struct VolumeSpec {
  std::string uuid;
  VolumePolicy policy;
  uint32_t replicas{1};
  uint64_t size_bytes{0};
  bool thin{false};
};

// The node currently exporting a volume for I/O.
struct VolumeTarget {
  std::string node;
  Protocol protocol{Protocol::none};
  std::string device_uri;
};

struct VolumeRecord {
  std::string uuid;
  VolumeSpec spec;
  std::string status;                   // state.status, e.g. "Online", "Degraded"
  std::optional<VolumeTarget> target;   // unset while unpublished
};

// ---------------------------------------------------------------------------
// Initiator-side multipath view (nvme list-subsys).
// ---------------------------------------------------------------------------
struct PathDescriptor {
  std::string name;       // controller, e.g. "nvme0"
  std::string transport;  // "tcp"
  std::string address;    // "traddr=10.1.0.3 trsvcid=8420"
  std::string state;      // "live", "connecting", "resetting", ...
};

struct SubsystemDescriptor {
  std::string name;
  std::string nqn;
  std::vector<PathDescriptor> paths;
};

struct SubsystemListing {
  std::vector<SubsystemDescriptor> subsystems;
  std::string raw;  // tool output the listing was parsed from
};

}  // namespace switchover
