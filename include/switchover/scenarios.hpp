#pragma once

// switchover/scenarios.hpp - Scenario catalogue.
//
// Two features:
//   "Switchover Robustness" - target-node faults against a published volume,
//                             verified through the initiator's multipath view.
//   "Node Labeling"         - label put/overwrite/delete against node specs.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "switchover/scenario.hpp"

namespace switchover {

inline constexpr const char* kVolumeUuid = "5cd5378e-3f05-47f1-a830-a0f5873a1449";
inline constexpr std::uint64_t kVolumeSize = 20ULL * 1024 * 1024;
inline constexpr std::uint64_t kPoolSize = 100ULL * 1024 * 1024;
inline constexpr std::uint32_t kIoEngines = 2;
inline constexpr const char* kTargetNode1 = "io-engine-1";
inline constexpr const char* kTargetNode2 = "io-engine-2";
inline constexpr const char* kDrainLabel = "d";

// Control-plane service containers that must be running for labeling.
inline const std::vector<std::string>& control_plane_containers() {
  static const std::vector<std::string> names = {"core", "rest", "etcd"};
  return names;
}

inline constexpr const char* kFeatureRobustness = "Switchover Robustness";
inline constexpr const char* kFeatureLabeling = "Node Labeling";

std::string io_engine_name(std::uint32_t index);  // 1-based: io-engine-1
std::string pool_name(std::uint32_t index);       // 1-based: pool-1

std::vector<Scenario> robustness_scenarios();
std::vector<Scenario> labeling_scenarios();
std::vector<Scenario> all_scenarios();

std::optional<Scenario> find_scenario(const std::string& name);

// ---------------------------------------------------------------------------
// Step building blocks, exposed so tests and the CLI can compose their own.
// ---------------------------------------------------------------------------
namespace steps {

// Backing disks, HA cluster, one pool per io-engine, readiness checks.
void deploy_ha_cluster(ScenarioContext& ctx);
// Plain cluster (no HA agents), readiness checks including control-plane
// service containers.
void deploy_plain_cluster(ScenarioContext& ctx);

// Create a volume and publish it over nvmf on io-engine-1.
void create_published_volume(ScenarioContext& ctx, std::uint32_t replicas);
void connect_initiator(ScenarioContext& ctx);

// Await path re-establishment within the path budget and classify the
// outcome as republished or self-healed. Throws TimeoutError when stuck.
void await_path_established(ScenarioContext& ctx);

}  // namespace steps

}  // namespace switchover
