#include "switchover/scenarios.hpp"

#include <algorithm>
#include <memory>

namespace switchover {

namespace {

const Label kLabel1{"KEY1", "VALUE1"};
const Label kLabel2{"KEY2", "VALUE2"};
const Label kLabelOverwrite{"KEY1", "NEW_LABEL"};
constexpr const char* kLabelKeyToDelete = "KEY1";

std::string describe_labels(const NodeRecord& node) {
  if (node.labels.empty()) return "{}";
  std::string out;
  for (const auto& [k, v] : node.labels) {
    out += (out.empty() ? "{" : ",") + k + "=" + v;
  }
  return out + "}";
}

void require_running(ScenarioContext& ctx, const std::string& container) {
  if (!ctx.runtime.is_running(container)) {
    throw AssertionFailure("container " + container, "running", "not running");
  }
}

void require_label_count(ScenarioContext& ctx, const std::string& node, std::size_t expected) {
  const NodeRecord record = ctx.control_plane.get_node(node);
  if (record.labels.size() != expected) {
    throw AssertionFailure("label count of " + node, std::to_string(expected),
                           std::to_string(record.labels.size()) + " " + describe_labels(record));
  }
}

void stop_volume_target(ScenarioContext& ctx) {
  ctx.injector.apply(FaultSpec::stop_volume_target(ctx.published_volume().uuid));
  ctx.outcome = VolumeOutcome::degraded;
}

Step given(std::string text, std::function<void(ScenarioContext&)> action) {
  return Step{StepKind::given, std::move(text), std::move(action)};
}
Step when(std::string text, std::function<void(ScenarioContext&)> action) {
  return Step{StepKind::when, std::move(text), std::move(action)};
}
Step then(std::string text, std::function<void(ScenarioContext&)> action) {
  return Step{StepKind::then, std::move(text), std::move(action)};
}

}  // namespace

std::string io_engine_name(std::uint32_t index) { return "io-engine-" + std::to_string(index); }
std::string pool_name(std::uint32_t index) { return "pool-" + std::to_string(index); }

// ---------------------------------------------------------------------------
// Building blocks
// ---------------------------------------------------------------------------

namespace steps {

void deploy_ha_cluster(ScenarioContext& ctx) {
  ctx.disks = std::make_unique<BackingDisks>(ctx.config.disk_dir, kIoEngines, kPoolSize,
                                             ctx.config.host_prefix);
  ctx.cluster = std::make_unique<ScopedCluster>(ctx.deployer, DeployOptions::ha_cluster(kIoEngines));

  ctx.verifier
      .await_condition("cluster lists " + std::to_string(kIoEngines) + " nodes",
                       node_count(ctx.control_plane, kIoEngines), ctx.startup_budget)
      .require();
  const auto disks = ctx.disks->host_paths();
  for (std::uint32_t i = 1; i <= kIoEngines; ++i) {
    require_running(ctx, io_engine_name(i));
    PoolSpec pool;
    pool.node = io_engine_name(i);
    pool.id = pool_name(i);
    pool.disks = {disks[i - 1]};
    ctx.control_plane.put_node_pool(pool);
  }
}

void deploy_plain_cluster(ScenarioContext& ctx) {
  ctx.cluster = std::make_unique<ScopedCluster>(ctx.deployer, DeployOptions::plain(kIoEngines));
  for (const auto& name : control_plane_containers()) require_running(ctx, name);
  for (std::uint32_t i = 1; i <= kIoEngines; ++i) require_running(ctx, io_engine_name(i));
  ctx.verifier
      .await_condition("cluster lists " + std::to_string(kIoEngines) + " nodes",
                       node_count(ctx.control_plane, kIoEngines), ctx.startup_budget)
      .require();
}

void create_published_volume(ScenarioContext& ctx, std::uint32_t replicas) {
  VolumeSpec spec;
  spec.uuid = kVolumeUuid;
  spec.policy.self_heal = true;
  spec.replicas = replicas;
  spec.size_bytes = kVolumeSize;
  spec.thin = false;
  ctx.control_plane.put_volume(spec);

  VolumeRecord vol = ctx.control_plane.put_volume_target(kVolumeUuid, kTargetNode1, Protocol::nvmf);
  if (!vol.target) {
    throw AssertionFailure("target of volume " + spec.uuid, kTargetNode1, "unpublished");
  }
  assert_equal("target node of volume " + spec.uuid, kTargetNode1, vol.target->node);
  ctx.published_node = vol.target->node;
  ctx.volume = std::move(vol);
  ctx.outcome = VolumeOutcome::published;
}

void connect_initiator(ScenarioContext& ctx) {
  ctx.connection = std::make_unique<InitiatorConnection>(ctx.initiator, ctx.device_uri());
  ctx.notes.push_back("connected " + ctx.connection->device_uri() + " as " + ctx.device());
}

void await_path_established(ScenarioContext& ctx) {
  auto conv = ctx.verifier.await_condition(
      "path re-established", path_reestablished(ctx.initiator, ctx.device()), ctx.path_budget);
  if (!conv.converged) {
    ctx.outcome = VolumeOutcome::stuck_degraded;
    conv.require();
  }
  ctx.notes.push_back("path live after " + std::to_string(conv.attempts) + " attempt(s), " +
                      std::to_string(conv.elapsed_ms) + "ms, " +
                      std::to_string(conv.distinct_observations()) + " distinct observation(s)");

  VolumeRecord vol = ctx.control_plane.get_volume(ctx.published_volume().uuid);
  ctx.final_target_node = vol.target ? vol.target->node : "";
  ctx.outcome = ctx.final_target_node == ctx.published_node ? VolumeOutcome::self_healed
                                                            : VolumeOutcome::republished;
  ctx.volume = std::move(vol);
}

}  // namespace steps

// ---------------------------------------------------------------------------
// Switchover Robustness
// ---------------------------------------------------------------------------

std::vector<Scenario> robustness_scenarios() {
  const Step cluster = given("a deployer cluster", steps::deploy_ha_cluster);
  const Step single = given("a single replica volume",
                            [](ScenarioContext& ctx) { steps::create_published_volume(ctx, 1); });
  const Step two = given("a 2 replica volume",
                         [](ScenarioContext& ctx) { steps::create_published_volume(ctx, 2); });
  const Step connected = given("a connected nvme initiator", steps::connect_initiator);
  const Step stop = when("we stop the volume target node", stop_volume_target);
  const Step established = then("the path should be established", steps::await_path_established);

  std::vector<Scenario> out;

  out.push_back(Scenario{
      kFeatureRobustness,
      "reconnecting the new target times out",
      {cluster, two, connected,
       given("a reconnect_delay longer than the path budget",
             [](ScenarioContext& ctx) {
               const std::uint64_t delay_ms = std::uint64_t{ctx.config.reconnect_delay_s} * 1000;
               if (delay_ms <= ctx.path_budget.sleep_budget_ms()) {
                 throw HarnessError(ErrorCode::config_invalid,
                                    "reconnect_delay " + std::to_string(ctx.config.reconnect_delay_s) +
                                        "s does not exceed the path budget of " +
                                        std::to_string(ctx.path_budget.sleep_budget_ms()) + "ms");
               }
               ctx.injector.apply(
                   FaultSpec::reconnect_delay(ctx.device_uri(), ctx.config.reconnect_delay_s));
             }),
       stop,
       then("the initiator loses the path",
            [](ScenarioContext& ctx) {
              ctx.verifier
                  .await_condition("path lost", path_not_live(ctx.initiator, ctx.device()),
                                   ctx.path_budget)
                  .require();
            }),
       then("reconnecting the new target times out",
            [](ScenarioContext& ctx) {
              auto conv = ctx.verifier.await_condition(
                  "path re-established", path_reestablished(ctx.initiator, ctx.device()),
                  ctx.path_budget);
              if (conv.converged) {
                throw AssertionFailure(
                    "reconnect with a " + std::to_string(ctx.config.reconnect_delay_s) +
                        "s reconnect_delay",
                    "timeout",
                    "path live after " + std::to_string(conv.attempts) + " attempt(s)");
              }
              ctx.outcome = VolumeOutcome::stuck_degraded;
              ctx.notes.push_back("expected timeout after " + std::to_string(conv.attempts) +
                                  " attempt(s): " + conv.last_mismatch);
            })}});

  out.push_back(Scenario{
      kFeatureRobustness,
      "path failure with no free nodes",
      {cluster, two, connected,
       when("we cordon the non-target node",
            [](ScenarioContext& ctx) {
              ctx.injector.apply(FaultSpec::cordon(kTargetNode2, kDrainLabel));
              ctx.verifier
                  .await_condition("cordon of " + std::string(kTargetNode2),
                                   node_cordon_applied(ctx.control_plane, kTargetNode2, kDrainLabel),
                                   ctx.cordon_budget)
                  .require();
            }),
       stop,
       when("the ha clustering fails a few times",
            [](ScenarioContext& ctx) {
              // The only replica left is on the cordoned node: neither a
              // live path nor a move onto that node may show up yet.
              ctx.verifier
                  .hold("failover while " + std::string(kTargetNode2) + " is cordoned",
                        failover_observed(ctx.initiator, ctx.device(), ctx.control_plane,
                                          ctx.published_volume().uuid, kTargetNode2),
                        ctx.ha_fail_window)
                  .require();
            }),
       when("we uncordon the non-target node",
            [](ScenarioContext& ctx) {
              ctx.injector.apply(FaultSpec::uncordon(kTargetNode2, kDrainLabel));
            }),
       established,
       then("the volume is republished on the non-target node",
            [](ScenarioContext& ctx) {
              assert_equal("volume target node", kTargetNode2, ctx.final_target_node);
              assert_equal("volume outcome", to_string(VolumeOutcome::republished),
                           to_string(ctx.outcome));
            })}});

  out.push_back(Scenario{
      kFeatureRobustness,
      "temporary path failure with no other nodes",
      {cluster, single, connected,
       when("we restart the volume target node",
            [](ScenarioContext& ctx) {
              ctx.injector.apply(FaultSpec::restart_volume_target(ctx.published_volume().uuid));
              ctx.outcome = VolumeOutcome::degraded;
            }),
       established,
       then("the volume target remains on the original node",
            [](ScenarioContext& ctx) {
              assert_equal("volume target node", kTargetNode1, ctx.final_target_node);
              assert_equal("volume outcome", to_string(VolumeOutcome::self_healed),
                           to_string(ctx.outcome));
            })}});

  out.push_back(Scenario{
      kFeatureRobustness,
      "stopped target is republished",
      {cluster, single, connected, stop, established,
       then("the volume is republished away from the failed node",
            [](ScenarioContext& ctx) {
              if (ctx.final_target_node.empty() || ctx.final_target_node == ctx.published_node) {
                throw AssertionFailure("volume target node", "any node but " + ctx.published_node,
                                       ctx.final_target_node.empty() ? "unpublished"
                                                                     : ctx.final_target_node);
              }
            })}});

  return out;
}

// ---------------------------------------------------------------------------
// Node Labeling
// ---------------------------------------------------------------------------

std::vector<Scenario> labeling_scenarios() {
  const Step cluster = given("a control plane and two io-engine instances",
                             steps::deploy_plain_cluster);
  const Step unlabeled = given("an unlabeled node", [](ScenarioContext& ctx) {
    const NodeRecord node = ctx.control_plane.get_node(kTargetNode1);
    if (node.has_labels && !node.labels.empty()) {
      throw AssertionFailure("labels of " + node.id, "{}", describe_labels(node));
    }
  });
  const Step labeled = given("a labeled node", [](ScenarioContext& ctx) {
    for (const char* node : {kTargetNode1, kTargetNode2}) {
      ctx.control_plane.put_node_label(node, kLabel1);
      ctx.control_plane.put_node_label(node, kLabel2);
      require_label_count(ctx, node, 2);
    }
  });

  std::vector<Scenario> out;

  out.push_back(Scenario{
      kFeatureLabeling,
      "Label a node",
      {cluster, unlabeled,
       when("the user issues a label command with a label to the node",
            [](ScenarioContext& ctx) { ctx.control_plane.put_node_label(kTargetNode1, kLabel1); }),
       then("the given node should be labeled with the given label",
            [](ScenarioContext& ctx) {
              ctx.verifier
                  .await_condition("label " + format_label(kLabel1),
                                   label_present(ctx.control_plane, kTargetNode1, kLabel1),
                                   ctx.cordon_budget)
                  .require();
              require_label_count(ctx, kTargetNode1, 1);
            })}});

  out.push_back(Scenario{
      kFeatureLabeling,
      "UnLabel a node",
      {cluster, labeled,
       when("the user issues a unlabel command with a label key to the node",
            [](ScenarioContext& ctx) {
              ctx.control_plane.delete_node_label(kTargetNode1, kLabelKeyToDelete);
            }),
       then("the given node should remove the label with the given key",
            [](ScenarioContext& ctx) {
              ctx.verifier
                  .await_condition("label " + std::string(kLabelKeyToDelete) + " removed",
                                   label_absent(ctx.control_plane, kTargetNode1, kLabelKeyToDelete),
                                   ctx.cordon_budget)
                  .require();
              ctx.verifier
                  .await_condition("label " + format_label(kLabel2),
                                   label_present(ctx.control_plane, kTargetNode1, kLabel2),
                                   ctx.cordon_budget)
                  .require();
            })}});

  out.push_back(Scenario{
      kFeatureLabeling,
      "Overwrite the label of a node",
      {cluster, labeled,
       when("the user issues a label command with a same key and different value to the node",
            [](ScenarioContext& ctx) {
              ctx.control_plane.put_node_label(kTargetNode2, kLabelOverwrite);
            }),
       then("the given node should overwrite the label with the given key",
            [](ScenarioContext& ctx) {
              ctx.verifier
                  .await_condition("label " + format_label(kLabelOverwrite),
                                   label_present(ctx.control_plane, kTargetNode2, kLabelOverwrite),
                                   ctx.cordon_budget)
                  .require();
              require_label_count(ctx, kTargetNode2, 2);
            })}});

  out.push_back(Scenario{
      kFeatureLabeling,
      "Relabel a node with the same label",
      {cluster, unlabeled,
       when("the user issues the same label command twice",
            [](ScenarioContext& ctx) {
              ctx.control_plane.put_node_label(kTargetNode1, kLabel1);
              ctx.control_plane.put_node_label(kTargetNode1, kLabel1);
            }),
       then("the given node should carry a single entry for the key",
            [](ScenarioContext& ctx) {
              ctx.verifier
                  .await_condition("label " + format_label(kLabel1),
                                   label_present(ctx.control_plane, kTargetNode1, kLabel1),
                                   ctx.cordon_budget)
                  .require();
              require_label_count(ctx, kTargetNode1, 1);
            })}});

  out.push_back(Scenario{
      kFeatureLabeling,
      "Unlabel a key the node does not have",
      {cluster, unlabeled,
       when("the user issues a unlabel command with an absent label key",
            [](ScenarioContext& ctx) {
              try {
                ctx.control_plane.delete_node_label(kTargetNode1, kLabelKeyToDelete);
              } catch (const ControlPlaneError& e) {
                ctx.rejection = e;
                ctx.notes.push_back(std::string("rejected: ") + e.what());
              }
            }),
       then("the control plane should reject the request",
            [](ScenarioContext& ctx) {
              if (!ctx.rejection) {
                throw AssertionFailure("unlabel of absent key " + std::string(kLabelKeyToDelete),
                                       "rejection", "success");
              }
              const int status = ctx.rejection->status();
              if (status < 400 || status >= 500) {
                throw AssertionFailure("status of the rejection", "4xx", std::to_string(status));
              }
            }),
       then("the given node should remain unlabeled",
            [](ScenarioContext& ctx) { require_label_count(ctx, kTargetNode1, 0); })}});

  return out;
}

std::vector<Scenario> all_scenarios() {
  auto out = robustness_scenarios();
  for (auto& s : labeling_scenarios()) out.push_back(std::move(s));
  return out;
}

std::optional<Scenario> find_scenario(const std::string& name) {
  for (auto& s : all_scenarios()) {
    if (s.name == name) return s;
  }
  return std::nullopt;
}

}  // namespace switchover
