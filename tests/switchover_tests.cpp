#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>

#include "simulated_cluster.hpp"
#include "switchover/config.hpp"
#include "switchover/container.hpp"
#include "switchover/control_plane.hpp"
#include "switchover/deployer.hpp"
#include "switchover/errors.hpp"
#include "switchover/fault.hpp"
#include "switchover/hash.hpp"
#include "switchover/initiator.hpp"
#include "switchover/jsonlite.hpp"
#include "switchover/observability.hpp"
#include "switchover/process.hpp"
#include "switchover/scenario.hpp"
#include "switchover/scenarios.hpp"
#include "switchover/verifier.hpp"
#include "switchover/version.hpp"

namespace fs = std::filesystem;
using switchover::testing::SimulatedCluster;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path scratch_dir() {
  const fs::path dir = fs::temp_directory_path() / "switchover_tests";
  fs::create_directories(dir);
  return dir;
}

switchover::HarnessConfig sim_config() {
  switchover::HarnessConfig cfg;
  cfg.disk_dir = scratch_dir().string();
  return cfg;
}

// Fake clock for verifier tests: sleeping advances time.
struct ManualClock {
  std::uint64_t now{0};
  int sleeps{0};
  switchover::ConvergenceVerifier verifier() {
    return switchover::ConvergenceVerifier(
        [this](std::chrono::milliseconds d) {
          now += static_cast<std::uint64_t>(d.count());
          ++sleeps;
        },
        [this] { return now; });
  }
};

switchover::Probe<int> counting_probe(int& calls, int satisfied_at) {
  return [&calls, satisfied_at]() {
    ++calls;
    switchover::Observation<int> obs;
    obs.value = calls;
    obs.raw = "calls=" + std::to_string(calls);
    obs.satisfied = satisfied_at > 0 && calls >= satisfied_at;
    if (!obs.satisfied) obs.mismatch = "only " + std::to_string(calls) + " call(s)";
    return obs;
  };
}

const switchover::Scenario& scenario_named(const std::vector<switchover::Scenario>& all,
                                           const std::string& name) {
  for (const auto& s : all) {
    if (s.name == name) return s;
  }
  std::cerr << "FAIL: no scenario named " << name << "\n";
  std::exit(1);
}

// ============================================================================
// Fake control-plane REST server backed by a SimulatedCluster.
// ============================================================================

class FakeRestServer {
 public:
  explicit FakeRestServer(SimulatedCluster& sim) : sim_(sim) {
    route();
    port_ = server_.bind_to_any_port("127.0.0.1");
    thread_ = std::thread([this] { server_.listen_after_bind(); });
    server_.wait_until_ready();
  }

  ~FakeRestServer() {
    server_.stop();
    if (thread_.joinable()) thread_.join();
  }

  std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

  std::vector<std::string> requests() {
    std::lock_guard<std::mutex> lk(mu_);
    return requests_;
  }

 private:
  using Body = std::function<std::string(const httplib::Request&)>;

  httplib::Server::Handler guarded(Body body) {
    return [this, body](const httplib::Request& req, httplib::Response& res) {
      {
        std::lock_guard<std::mutex> lk(mu_);
        requests_.push_back(req.method + " " + req.path);
      }
      try {
        res.set_content(body(req), "application/json");
      } catch (const switchover::ControlPlaneError& e) {
        // Server messages are "Kind: text".
        const std::string& msg = e.server_message();
        const auto sep = msg.find(": ");
        switchover::jsonlite::Object err;
        err["details"] = switchover::jsonlite::Value{std::string()};
        err["kind"] = switchover::jsonlite::Value{msg.substr(0, sep)};
        err["message"] = switchover::jsonlite::Value{
            sep == std::string::npos ? msg : msg.substr(sep + 2)};
        res.status = e.status();
        res.set_content(switchover::jsonlite::to_json(switchover::jsonlite::Value{err}),
                        "application/json");
      }
    };
  }

  static switchover::jsonlite::Object body_of(const httplib::Request& req) {
    return switchover::jsonlite::parse(req.body, nullptr);
  }

  void route() {
    namespace jl = switchover::jsonlite;
    server_.Get("/v0/nodes", guarded([this](const httplib::Request&) { return sim_.nodes_json(); }));
    server_.Get(R"(/v0/nodes/([^/]+))", guarded([this](const httplib::Request& req) {
                  return sim_.node_json(req.matches[1].str());
                }));
    server_.Put(R"(/v0/nodes/([^/]+)/label/([^/]+))", guarded([this](const httplib::Request& req) {
                  auto label = switchover::parse_label(req.matches[2].str());
                  if (!label) {
                    throw switchover::ControlPlaneError(400, "PUT", req.path,
                                                        "InvalidArgument: malformed label");
                  }
                  sim_.put_node_label(req.matches[1].str(), *label);
                  return sim_.node_json(req.matches[1].str());
                }));
    server_.Delete(R"(/v0/nodes/([^/]+)/label/([^/]+))", guarded([this](const httplib::Request& req) {
                     sim_.delete_node_label(req.matches[1].str(), req.matches[2].str());
                     return sim_.node_json(req.matches[1].str());
                   }));
    server_.Put(R"(/v0/nodes/([^/]+)/cordon/([^/]+))", guarded([this](const httplib::Request& req) {
                  sim_.put_node_cordon(req.matches[1].str(), req.matches[2].str());
                  return sim_.node_json(req.matches[1].str());
                }));
    server_.Delete(R"(/v0/nodes/([^/]+)/cordon/([^/]+))", guarded([this](const httplib::Request& req) {
                     sim_.delete_node_cordon(req.matches[1].str(), req.matches[2].str());
                     return sim_.node_json(req.matches[1].str());
                   }));
    server_.Put(R"(/v0/nodes/([^/]+)/pools/([^/]+))", guarded([this](const httplib::Request& req) {
                  switchover::PoolSpec pool;
                  pool.node = req.matches[1].str();
                  pool.id = req.matches[2].str();
                  pool.disks = jl::get_string_array(body_of(req), "disks");
                  sim_.put_node_pool(pool);
                  return sim_.pool_json(pool.id);
                }));
    server_.Put(R"(/v0/volumes/([^/]+))", guarded([this](const httplib::Request& req) {
                  const auto body = body_of(req);
                  switchover::VolumeSpec spec;
                  spec.uuid = req.matches[1].str();
                  spec.replicas = static_cast<std::uint32_t>(jl::get_u64(body, "replicas", 1));
                  spec.size_bytes = jl::get_u64(body, "size");
                  spec.thin = jl::get_bool(body, "thin");
                  if (const auto* policy = jl::get_object(body, "policy")) {
                    spec.policy.self_heal = jl::get_bool(*policy, "self_heal", true);
                  }
                  sim_.put_volume(spec);
                  return sim_.volume_json(spec.uuid);
                }));
    server_.Put(R"(/v0/volumes/([^/]+)/target)", guarded([this](const httplib::Request& req) {
                  const auto body = body_of(req);
                  const auto protocol = jl::get_string(body, "protocol") == "nvmf"
                                            ? switchover::Protocol::nvmf
                                            : switchover::Protocol::none;
                  sim_.put_volume_target(req.matches[1].str(), jl::get_string(body, "node"), protocol);
                  return sim_.volume_json(req.matches[1].str());
                }));
    server_.Get(R"(/v0/volumes/([^/]+))", guarded([this](const httplib::Request& req) {
                  return sim_.volume_json(req.matches[1].str());
                }));
    server_.Delete(R"(/v0/volumes/([^/]+)/target)", guarded([this](const httplib::Request& req) {
                     sim_.delete_volume_target(req.matches[1].str());
                     return sim_.volume_json(req.matches[1].str());
                   }));
    server_.Delete(R"(/v0/volumes/([^/]+))", guarded([this](const httplib::Request& req) {
                     sim_.delete_volume(req.matches[1].str());
                     return std::string();
                   }));
  }

  SimulatedCluster& sim_;
  httplib::Server server_;
  int port_{0};
  std::thread thread_;
  std::mutex mu_;
  std::vector<std::string> requests_;
};

// ============================================================================
// Phase 1: Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(switchover::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(switchover::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_digest_domains() {
  const std::string raw = "{\"Subsystems\":[]}";
  const auto obs = switchover::observation_digest(raw);
  const auto rpt = switchover::report_digest(raw);
  expect(obs.size() == 64, "observation digest is 64 hex chars");
  expect(obs != rpt, "observation and report domains must differ");
  expect(obs == switchover::hash_domain("obs:", raw), "observation digest uses obs: domain");
  expect(obs != switchover::blake3_hex(raw), "domain digest differs from the plain hash");
}

void test_version_manifest() {
  const auto m = switchover::version::current_manifest();
  expect(m.hash_primitive == "blake3", "manifest names blake3");
  const auto json = switchover::version::manifest_to_json(m);
  auto obj = switchover::jsonlite::parse(json, nullptr);
  expect(switchover::jsonlite::get_u64(obj, "report_schema") ==
             switchover::version::REPORT_SCHEMA_VERSION,
         "manifest carries the report schema version");
}

// ============================================================================
// Phase 2: Wire formats
// ============================================================================

void test_jsonlite_parse() {
  std::optional<switchover::jsonlite::JsonError> err;
  auto obj = switchover::jsonlite::parse(
      R"({"id":"io-engine-1","n":7,"ok":true,"labels":{"a":"b"},"list":["x","y"]})", &err);
  expect(!err, "valid JSON parses");
  expect(switchover::jsonlite::get_string(obj, "id") == "io-engine-1", "string field");
  expect(switchover::jsonlite::get_u64(obj, "n") == 7, "integer field");
  expect(switchover::jsonlite::get_bool(obj, "ok"), "bool field");
  expect(switchover::jsonlite::get_string_map(obj, "labels").at("a") == "b", "string map");
  expect(switchover::jsonlite::get_string_array(obj, "list").size() == 2, "string array");
  expect(switchover::jsonlite::get_string(obj, "missing", "dflt") == "dflt", "default on missing");

  switchover::jsonlite::parse("{\"unterminated\":", &err);
  expect(err.has_value(), "malformed JSON reports an error");
  expect(switchover::jsonlite::escape("a\"b\n") == "a\\\"b\\n", "escape quotes and newlines");
}

void test_parse_label() {
  auto l = switchover::parse_label("KEY1=VALUE1");
  expect(l && l->key == "KEY1" && l->value == "VALUE1", "key=value");
  auto eq = switchover::parse_label("k=a=b");
  expect(eq && eq->key == "k" && eq->value == "a=b", "value may contain '='");
  auto empty_value = switchover::parse_label("k=");
  expect(empty_value && empty_value->value.empty(), "empty value allowed");
  expect(!switchover::parse_label("novalue"), "missing '=' rejected");
  expect(!switchover::parse_label("=v"), "empty key rejected");
  expect(switchover::format_label({"KEY2", "VALUE2"}) == "KEY2=VALUE2", "format_label");
}

void test_node_from_json_cordon_states() {
  auto parse = [](const std::string& s) { return switchover::jsonlite::parse(s, nullptr); };

  auto plain = switchover::node_from_json(
      parse(R"({"id":"io-engine-1","spec":{"grpcEndpoint":"10.1.0.3:10124"},"state":{"status":"Online"}})"));
  expect(plain.id == "io-engine-1", "node id");
  expect(plain.status == "Online", "node status");
  expect(!plain.has_labels && plain.labels.empty(), "no labels key");
  expect(plain.cordon_state == switchover::CordonState::uncordoned, "uncordoned");

  auto cordoned = switchover::node_from_json(parse(
      R"({"id":"n","spec":{"labels":{},"cordondrainstate":{"cordonedstate":{"cordonlabels":["d"]}}}})"));
  expect(cordoned.has_labels, "empty labels key still counts as present");
  expect(cordoned.cordon_state == switchover::CordonState::cordoned, "cordonedstate");
  expect(cordoned.cordon_labels.size() == 1 && cordoned.cordon_labels[0] == "d", "cordon label");

  auto draining = switchover::node_from_json(parse(
      R"({"id":"n","spec":{"cordondrainstate":{"drainingstate":{"cordonlabels":["d"],"drainlabels":[]}}}})"));
  expect(draining.cordon_state == switchover::CordonState::cordoning, "drainingstate");

  auto drained = switchover::node_from_json(parse(
      R"({"id":"n","spec":{"cordondrainstate":{"drainedstate":{"cordonlabels":[],"drainlabels":["d"]}}}})"));
  expect(drained.cordon_state == switchover::CordonState::cordoned, "drainedstate counts as cordoned");
}

void test_volume_from_json() {
  auto obj = switchover::jsonlite::parse(
      R"({"spec":{"uuid":"v1","num_replicas":2,"size":20971520,"thin":false,"policy":{"self_heal":true}},)"
      R"("state":{"uuid":"v1","status":"Online","target":{"node":"io-engine-1","deviceUri":"nvmf://10.1.0.3:8420/nqn:v1","protocol":"nvmf"}}})",
      nullptr);
  auto vol = switchover::volume_from_json(obj);
  expect(vol.uuid == "v1", "volume uuid");
  expect(vol.spec.replicas == 2, "replica count");
  expect(vol.spec.size_bytes == 20971520, "size");
  expect(vol.target && vol.target->node == "io-engine-1", "target node");
  expect(vol.target->protocol == switchover::Protocol::nvmf, "target protocol");

  auto unpublished = switchover::volume_from_json(
      switchover::jsonlite::parse(R"({"spec":{"uuid":"v2"},"state":{"status":"Online"}})", nullptr));
  expect(!unpublished.target, "no target when unpublished");
}

void test_request_bodies() {
  switchover::VolumeSpec spec;
  spec.uuid = "v1";
  spec.replicas = 2;
  spec.size_bytes = 1024;
  auto body = switchover::jsonlite::parse(switchover::volume_spec_to_json(spec), nullptr);
  expect(switchover::jsonlite::get_u64(body, "replicas") == 2, "replicas in create body");
  expect(switchover::jsonlite::get_object(body, "policy") != nullptr, "policy in create body");

  auto publish = switchover::jsonlite::parse(
      switchover::publish_body_to_json("io-engine-1", switchover::Protocol::nvmf), nullptr);
  expect(switchover::jsonlite::get_string(publish, "node") == "io-engine-1", "publish node");
  expect(switchover::jsonlite::get_string(publish, "protocol") == "nvmf", "publish protocol");

  expect(switchover::encode_path_segment("KEY1=VALUE1") == "KEY1=VALUE1", "'=' passes through");
  expect(switchover::encode_path_segment("a b/c") == "a%20b%2Fc", "reserved chars are escaped");

  expect(switchover::error_message_from_body(
             R"({"details":"","message":"label not present","kind":"PreconditionFailed"})") ==
             "PreconditionFailed: label not present",
         "REST error message");
  expect(switchover::error_message_from_body("plain text") == "plain text",
         "non-JSON error body passes through");
}

void test_parse_nvmf_uri() {
  auto uri = switchover::parse_nvmf_uri("nvmf://10.1.0.3:8420/nqn.2019-05.io.openebs:v1");
  expect(uri.has_value(), "nvmf uri parses");
  expect(uri->host == "10.1.0.3" && uri->port == 8420, "host and port");
  expect(uri->nqn == "nqn.2019-05.io.openebs:v1", "nqn");
  expect(uri->transport == "tcp", "default transport");

  auto rdma = switchover::parse_nvmf_uri("nvmf+rdma://host/nqn.x");
  expect(rdma && rdma->transport == "rdma" && rdma->port == 4420, "explicit transport, default port");

  expect(!switchover::parse_nvmf_uri("iscsi://host/iqn"), "wrong scheme rejected");
  expect(!switchover::parse_nvmf_uri("nvmf://host:0/nqn"), "port 0 rejected");
  expect(!switchover::parse_nvmf_uri("nvmf://host:70000/nqn"), "port out of range rejected");
  expect(!switchover::parse_nvmf_uri("nvmf://host"), "missing nqn rejected");
}

void test_parse_subsystem_listing() {
  const std::string object_layout =
      R"({"Subsystems":[{"Name":"nvme-subsys0","NQN":"nqn.x","Paths":[)"
      R"({"Name":"nvme0","Transport":"tcp","Address":"traddr=10.1.0.3 trsvcid=8420","State":"live"}]}]})";
  auto listing = switchover::parse_subsystem_listing(object_layout);
  expect(listing.subsystems.size() == 1, "one subsystem");
  expect(listing.subsystems[0].paths.size() == 1, "one path");
  expect(listing.subsystems[0].paths[0].state == "live", "path state");
  expect(listing.raw == object_layout, "raw retained");
  expect(switchover::path_mismatch(listing).empty(), "single live path satisfies the predicate");

  const std::string array_layout =
      R"([{"HostNQN":"h","Subsystems":[{"Name":"s","NQN":"n","Paths":[)"
      R"({"Name":"nvme0","State":"connecting"}]}]}])";
  auto connecting = switchover::parse_subsystem_listing(array_layout);
  expect(switchover::path_mismatch(connecting) == "path nvme0 is 'connecting', expected 'live'",
         "connecting path mismatch");

  auto none = switchover::parse_subsystem_listing(R"([{"HostNQN":"h","Subsystems":[]}])");
  expect(switchover::path_mismatch(none) == "expected 1 subsystem, observed 0", "no subsystem");

  bool threw = false;
  try {
    switchover::parse_subsystem_listing("not json");
  } catch (const switchover::HarnessError& e) {
    threw = e.code() == switchover::ErrorCode::json_parse_error;
  }
  expect(threw, "malformed listing raises json_parse_error");
}

void test_device_from_sysfs_entry() {
  expect(switchover::device_from_sysfs_entry("nvme0c1n1") == std::optional<std::string>("/dev/nvme0n1"),
         "multipath head");
  expect(switchover::device_from_sysfs_entry("nvme2n1") == std::optional<std::string>("/dev/nvme2n1"),
         "plain namespace");
  expect(!switchover::device_from_sysfs_entry("subsysnqn"), "non-device entry");
}

// ============================================================================
// Phase 3: Processes, containers and configuration
// ============================================================================

void test_process_echo() {
  switchover::ProcessSpec spec;
  spec.command = "/bin/echo";
  spec.argv = {"hello"};
  auto r = switchover::run_process(spec);
  expect(r.ok(), "echo succeeds");
  expect(r.stdout_text == "hello\n", "echo output captured");
}

void test_process_exit_code() {
  switchover::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "echo oops >&2; exit 3"};
  auto r = switchover::run_process(spec);
  expect(!r.ok(), "non-zero exit is not ok");
  expect(r.exit_code == 3, "exit code propagated");
  expect(r.stderr_text.find("oops") != std::string::npos, "stderr captured");
}

void test_process_timeout() {
  switchover::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "sleep 5"};
  spec.timeout_ms = 200;
  auto r = switchover::run_process(spec);
  expect(r.timed_out, "child killed at deadline");
  expect(r.exit_code == 124, "timeout exit code");
}

void test_process_missing_binary() {
  switchover::ProcessSpec spec;
  spec.command = "switchover-definitely-missing-tool";
  auto r = switchover::run_process(spec);
  expect(!r.ok() && !r.error_message.empty(), "missing binary reported");
  expect(!switchover::resolve_executable("switchover-definitely-missing-tool"), "not on PATH");
  expect(switchover::resolve_executable("sh").has_value(), "sh resolves via PATH");
}

void test_docker_cli_failure() {
  switchover::DockerCli docker("/nonexistent/docker", 2000);
  bool threw = false;
  try {
    docker.stop("io-engine-1");
  } catch (const switchover::HarnessError& e) {
    threw = e.code() == switchover::ErrorCode::spawn_failed;
  }
  expect(threw, "docker failure raises spawn_failed");
}

void test_config_defaults_and_env() {
  ::unsetenv("SWITCHOVER_PATH_ATTEMPTS");
  ::unsetenv("SWITCHOVER_REST_URL");
  ::unsetenv("SWITCHOVER_CORDON_INTERVAL_MS");
  auto d = switchover::HarnessConfig::from_env();
  expect(d.path_interval_ms == 1000 && d.path_attempts == 40, "path budget default 1s x 40");
  expect(d.cordon_interval_ms == 200 && d.cordon_attempts == 10, "cordon budget default 200ms x 10");
  expect(d.rest_url == "http://127.0.0.1:8081", "default REST url");

  ::setenv("SWITCHOVER_PATH_ATTEMPTS", "12", 1);
  ::setenv("SWITCHOVER_REST_URL", "http://10.0.0.1:9000", 1);
  ::setenv("SWITCHOVER_CORDON_INTERVAL_MS", "fast", 1);
  auto c = switchover::HarnessConfig::from_env();
  expect(c.path_attempts == 12, "numeric override");
  expect(c.rest_url == "http://10.0.0.1:9000", "string override");
  expect(c.cordon_interval_ms == 200, "invalid number keeps the default");
  expect(c.rest().base_url == "http://10.0.0.1:9000", "rest() carries the url");
  ::unsetenv("SWITCHOVER_PATH_ATTEMPTS");
  ::unsetenv("SWITCHOVER_REST_URL");
  ::unsetenv("SWITCHOVER_CORDON_INTERVAL_MS");

  std::uint64_t v = 0;
  expect(switchover::parse_u64("42", v) && v == 42, "parse_u64");
  expect(!switchover::parse_u64("-1", v), "negative rejected");
  expect(!switchover::parse_u64("99999999999999999999999", v), "overflow rejected");
}

void test_deploy_options_args() {
  auto ha = switchover::DeployOptions::ha_cluster(2).to_args();
  const std::vector<std::string> expected = {"start", "--io-engines", "2", "--cache-period", "1s",
                                             "--reconcile-period", "1s", "--cluster-agent",
                                             "--node-agent", "--csi-node"};
  expect(ha == expected, "HA cluster deployer arguments");
  auto plain = switchover::DeployOptions::plain(2).to_args();
  expect(plain.size() == 3, "plain cluster has no agents");
}

void test_backing_disks() {
  std::string path;
  {
    switchover::BackingDisks disks(scratch_dir().string(), 2, 1024 * 1024, "/host");
    expect(disks.paths().size() == 2, "two backing files");
    path = disks.paths()[0];
    expect(fs::exists(path), "backing file created");
    expect(fs::file_size(path) == 1024 * 1024, "backing file sized");
    expect(disks.host_paths()[0] == "/host" + path, "host path prefixed");
  }
  expect(!fs::exists(path), "backing files removed on scope exit");

  bool threw = false;
  try {
    switchover::BackingDisks bad("/nonexistent/dir", 1, 1024, "");
  } catch (const switchover::HarnessError&) {
    threw = true;
  }
  expect(threw, "unwritable directory raises");
}

// ============================================================================
// Phase 4: Convergence verifier
// ============================================================================

void test_verifier_budget_exhausted() {
  ManualClock clock;
  auto verifier = clock.verifier();
  int calls = 0;
  auto result = verifier.await_condition("never", counting_probe(calls, 0),
                                         switchover::PollBudget::cordon());
  expect(!result.converged, "never-satisfied probe does not converge");
  expect(calls == 10 && result.attempts == 10, "exactly max_attempts probes");
  expect(clock.sleeps == 9, "no sleep after the final attempt");
  expect(result.elapsed_ms == 1800, "elapsed is interval x (attempts - 1)");
  expect(result.last_mismatch == "only 10 call(s)", "last mismatch retained");

  bool threw = false;
  try {
    result.require();
  } catch (const switchover::TimeoutError& e) {
    threw = e.code() == switchover::ErrorCode::timeout && e.attempts() == 10;
  }
  expect(threw, "require() raises TimeoutError");
}

void test_verifier_converges_early() {
  ManualClock clock;
  auto verifier = clock.verifier();
  int calls = 0;
  auto result = verifier.await_condition("third time", counting_probe(calls, 3),
                                         switchover::PollBudget::path());
  expect(result.converged && result.attempts == 3, "stops at the first satisfied attempt");
  expect(result.require() == 3, "value of the satisfying observation");
  expect(clock.now == 2000, "two sleeps before success");
  expect(result.digests.size() == 3 && result.distinct_observations() == 3,
         "one digest per attempt");
}

void test_verifier_probe_errors() {
  ManualClock clock;
  auto verifier = clock.verifier();
  int calls = 0;
  switchover::Probe<int> flaky = [&calls]() {
    if (++calls < 3) throw switchover::ControlPlaneError(0, "GET", "/v0/nodes", "refused");
    switchover::Observation<int> obs;
    obs.satisfied = true;
    obs.raw = "ok";
    return obs;
  };
  auto result = verifier.await_condition("flaky", flaky, switchover::PollBudget{100, 5});
  expect(result.converged && result.attempts == 3, "harness errors count as failed attempts");

  switchover::Probe<int> broken = []() -> switchover::Observation<int> {
    throw std::logic_error("bug");
  };
  bool propagated = false;
  try {
    verifier.await_condition("broken", broken, switchover::PollBudget{100, 5});
  } catch (const std::logic_error&) {
    propagated = true;
  }
  expect(propagated, "non-harness exceptions propagate");
}

void test_verifier_hold() {
  ManualClock clock;
  auto verifier = clock.verifier();
  int calls = 0;
  auto held = verifier.hold("satisfied", counting_probe(calls, 0), switchover::PollBudget{1000, 5});
  expect(held.held && held.attempts == 5, "predicate stayed false for the window");
  expect(clock.now == 5000, "hold sleeps before every observation");

  calls = 0;
  auto broken = verifier.hold("satisfied", counting_probe(calls, 2), switchover::PollBudget{1000, 5});
  expect(!broken.held && broken.attempts == 2, "hold stops at the violation");
  bool threw = false;
  try {
    broken.require();
  } catch (const switchover::AssertionFailure&) {
    threw = true;
  }
  expect(threw, "violated hold raises AssertionFailure");
}

// Serves one fixed node body for every get_node.
class FixedNodeCluster : public SimulatedCluster {
 public:
  std::string body;
  switchover::NodeRecord get_node(const std::string&) override {
    return switchover::node_from_json(switchover::jsonlite::parse(body, nullptr));
  }
};

void test_cordon_applied_predicate() {
  FixedNodeCluster sim;
  auto probe = switchover::node_cordon_applied(sim, "n", "d");
  auto observe = [&](const std::string& state) {
    sim.body = R"({"id":"n","spec":{"cordondrainstate":)" + state + "}}";
    return probe();
  };

  expect(observe(R"({"cordonedstate":{"cordonlabels":["d"]}})").satisfied, "cordoned with label");
  auto unlabelled = observe(R"({"cordonedstate":{"cordonlabels":[]}})");
  expect(!unlabelled.satisfied, "cordon without the drain label does not count");
  expect(unlabelled.mismatch.find("without label 'd'") != std::string::npos, "mismatch names label");
  expect(!observe(R"({"cordonedstate":{"cordonlabels":["other"]}})").satisfied,
         "someone else's cordon does not count");
  expect(observe(R"({"drainedstate":{"cordonlabels":["d"],"drainlabels":[]}})").satisfied,
         "drained with label");
  expect(!observe(R"({"drainedstate":{"cordonlabels":[],"drainlabels":["d"]}})").satisfied,
         "drain label alone is not a cordon");
  expect(!observe(R"({"drainingstate":{"cordonlabels":["d"],"drainlabels":[]}})").satisfied,
         "draining is still cordoning");
}

void test_poll_budget() {
  expect(switchover::PollBudget::path().sleep_budget_ms() == 39000, "path sleep budget");
  expect(switchover::PollBudget::cordon().sleep_budget_ms() == 1800, "cordon sleep budget");
  expect(switchover::PollBudget{500, 0}.sleep_budget_ms() == 0, "zero attempts sleeps never");
}

// ============================================================================
// Phase 5: Fault injector
// ============================================================================

void test_fault_unknown_node() {
  SimulatedCluster sim;
  sim.start(switchover::DeployOptions::plain(2));
  switchover::FaultInjector injector(sim, sim, sim);
  bool threw = false;
  try {
    injector.apply(switchover::FaultSpec::cordon("io-engine-9", "d"));
  } catch (const switchover::InjectionError& e) {
    threw = e.code() == switchover::ErrorCode::injection_failed &&
            std::string(e.what()).find("io-engine-9") != std::string::npos;
  }
  expect(threw, "cordon of unknown node raises InjectionError");
  expect(injector.journal().empty(), "failed faults are not journaled");

  threw = false;
  try {
    injector.apply(switchover::FaultSpec::stop_node("io-engine-9"));
  } catch (const switchover::InjectionError&) {
    threw = true;
  }
  expect(threw, "stop of unknown container raises InjectionError");
}

void test_fault_volume_target_resolution() {
  SimulatedCluster sim;
  sim.start(switchover::DeployOptions::ha_cluster(2));
  sim.put_node_pool({"io-engine-2", "pool-2", {"/host/tmp/disk_1"}});
  switchover::FaultInjector injector(sim, sim, sim);

  switchover::VolumeSpec spec;
  spec.uuid = "v1";
  spec.replicas = 1;
  sim.put_volume(spec);
  bool threw = false;
  try {
    injector.apply(switchover::FaultSpec::stop_volume_target("v1"));
  } catch (const switchover::InjectionError& e) {
    threw = std::string(e.what()).find("not published") != std::string::npos;
  }
  expect(threw, "unpublished volume cannot be faulted");

  sim.put_volume_target("v1", "io-engine-1", switchover::Protocol::nvmf);
  auto applied = injector.apply(switchover::FaultSpec::stop_volume_target("v1"));
  expect(applied.resolved_node == "io-engine-1", "target node resolved from the volume");
  expect(!sim.is_running("io-engine-1"), "target container stopped");

  threw = false;
  try {
    injector.apply(switchover::FaultSpec::reconnect_delay("not-a-uri", 60));
  } catch (const switchover::InjectionError&) {
    threw = true;
  }
  expect(threw, "reconnect delay needs an nvmf uri");
}

void test_fault_revert_all() {
  SimulatedCluster sim;
  sim.start(switchover::DeployOptions::plain(2));
  switchover::FaultInjector injector(sim, sim, sim);
  injector.apply(switchover::FaultSpec::cordon("io-engine-2", "d"));
  injector.apply(switchover::FaultSpec::cordon("io-engine-1", "d"));
  injector.apply(switchover::FaultSpec::uncordon("io-engine-1", "d"));
  injector.apply(switchover::FaultSpec::stop_node("io-engine-1"));
  expect(injector.journal().size() == 4, "every applied fault journaled");

  auto errors = injector.revert_all();
  expect(errors.empty(), "revert succeeds");
  expect(sim.cordons("io-engine-2").empty(), "outstanding cordon removed");
  expect(sim.cordons("io-engine-1").empty(), "already uncordoned node untouched");
  expect(sim.is_running("io-engine-1"), "stopped container started again");
  expect(injector.journal().empty(), "journal cleared");

  injector.apply(switchover::FaultSpec::stop_node("io-engine-2"));
  sim.stop();  // cluster gone: the undo cannot reach the container
  errors = injector.revert_all();
  expect(errors.size() == 1, "revert failures are returned, not thrown");
}

// ============================================================================
// Phase 6: REST control-plane facade
// ============================================================================

void test_rest_nodes_and_labels() {
  SimulatedCluster sim;
  sim.start(switchover::DeployOptions::plain(2));
  FakeRestServer server(sim);
  switchover::RestConfig rc;
  rc.base_url = server.url();
  switchover::RestControlPlane cp(rc);

  auto nodes = cp.get_nodes();
  expect(nodes.size() == 2, "two nodes listed");
  expect(nodes[0].status == "Online", "node status decoded");

  auto node = cp.put_node_label("io-engine-1", {"KEY1", "VALUE1"});
  expect(node.labels.at("KEY1") == "VALUE1", "label applied");
  node = cp.put_node_label("io-engine-1", {"KEY1", "NEW_LABEL"});
  expect(node.labels.at("KEY1") == "NEW_LABEL" && node.labels.size() == 1, "label overwritten");
  node = cp.delete_node_label("io-engine-1", "KEY1");
  expect(node.labels.empty(), "label removed");

  bool rejected = false;
  try {
    cp.delete_node_label("io-engine-1", "KEY1");
  } catch (const switchover::ControlPlaneError& e) {
    rejected = e.status() == 412 && e.method() == "DELETE" &&
               std::string(e.what()).find("PreconditionFailed") != std::string::npos;
  }
  expect(rejected, "deleting an absent label surfaces the 412");

  bool not_found = false;
  try {
    cp.get_node("io-engine-9");
  } catch (const switchover::ControlPlaneError& e) {
    not_found = e.is_not_found();
  }
  expect(not_found, "unknown node is 404");

  const auto seen = server.requests();
  expect(seen.size() >= 2 && seen[1] == "PUT /v0/nodes/io-engine-1/label/KEY1=VALUE1",
         "label path encodes key=value");
}

void test_rest_cordon_and_volumes() {
  SimulatedCluster sim;
  sim.cordon_lag_ms = 0;
  sim.start(switchover::DeployOptions::ha_cluster(2));
  FakeRestServer server(sim);
  switchover::RestConfig rc;
  rc.base_url = server.url();
  switchover::RestControlPlane cp(rc);

  auto node = cp.put_node_cordon("io-engine-2", "d");
  expect(node.cordon_state == switchover::CordonState::cordoned, "cordon visible");
  node = cp.delete_node_cordon("io-engine-2", "d");
  expect(node.cordon_state == switchover::CordonState::uncordoned, "uncordon visible");

  auto pool = cp.put_node_pool({"io-engine-1", "pool-1", {"/host/tmp/disk_0"}});
  expect(pool.id == "pool-1" && pool.node == "io-engine-1", "pool created");
  cp.put_node_pool({"io-engine-2", "pool-2", {"/host/tmp/disk_1"}});

  switchover::VolumeSpec spec;
  spec.uuid = switchover::kVolumeUuid;
  spec.replicas = 2;
  spec.size_bytes = switchover::kVolumeSize;
  auto vol = cp.put_volume(spec);
  expect(vol.spec.replicas == 2 && !vol.target, "volume created unpublished");
  vol = cp.put_volume_target(spec.uuid, "io-engine-1", switchover::Protocol::nvmf);
  expect(vol.target && vol.target->node == "io-engine-1", "volume published");
  expect(switchover::parse_nvmf_uri(vol.target->device_uri).has_value(), "device uri is nvmf");
  expect(cp.get_volume(spec.uuid).target->node == "io-engine-1", "get_volume");

  vol = cp.delete_volume_target(spec.uuid);
  expect(!vol.target, "volume unpublished");
  cp.delete_volume(spec.uuid);
  expect(!sim.has_volume(spec.uuid), "volume deleted");
}

void test_rest_transport_error() {
  std::string url;
  {
    SimulatedCluster sim;
    FakeRestServer server(sim);
    url = server.url();
  }
  switchover::RestConfig rc;
  rc.base_url = url;
  rc.timeout_ms = 1000;
  switchover::RestControlPlane cp(rc);
  bool threw = false;
  try {
    cp.get_nodes();
  } catch (const switchover::ControlPlaneError& e) {
    threw = e.status() == 0 && e.code() == switchover::ErrorCode::transport_error;
  }
  expect(threw, "no response is a status-0 transport error");
}

// ============================================================================
// Phase 7: Scenarios against the simulated cluster
// ============================================================================

void test_catalogue() {
  const auto all = switchover::all_scenarios();
  expect(all.size() == 9, "four robustness and five labeling scenarios");
  expect(switchover::robustness_scenarios().size() == 4, "robustness feature");
  expect(switchover::find_scenario("path failure with no free nodes").has_value(), "lookup by name");
  expect(!switchover::find_scenario("no such scenario"), "unknown scenario");
  for (const auto& s : all) {
    expect(!s.steps.empty() && s.steps.front().kind == switchover::StepKind::given,
           s.name + " starts with a Given step");
  }
}

switchover::ScenarioReport run_in_sim(SimulatedCluster& sim, const std::string& name,
                                      switchover::HarnessConfig cfg = sim_config()) {
  switchover::ScenarioRunner runner(sim.collaborators(), cfg);
  return runner.run(scenario_named(switchover::all_scenarios(), name));
}

void expect_clean_teardown(const SimulatedCluster& sim, const std::string& name) {
  expect(!sim.deployed(), name + ": cluster stopped");
  expect(!sim.connected(), name + ": initiator disconnected");
  expect(!fs::exists(scratch_dir() / "disk_0"), name + ": backing disks removed");
}

void test_scenario_reconnect_times_out() {
  SimulatedCluster sim;
  auto scenario =
      scenario_named(switchover::all_scenarios(), "reconnecting the new target times out");
  // Inspect the cluster right after the path is lost, before teardown.
  auto lost = std::find_if(scenario.steps.begin(), scenario.steps.end(), [](const auto& s) {
    return s.text == "the initiator loses the path";
  });
  expect(lost != scenario.steps.end(), "path loss step present");
  scenario.steps.insert(
      lost + 1, switchover::Step{switchover::StepKind::then, "the cluster state is as injected",
                                 [&sim](switchover::ScenarioContext&) {
                                   expect(sim.pool_count() == 2, "one pool per io-engine");
                                   expect(sim.reconnect_delay_s() == 60,
                                          "configured reconnect delay applied on the initiator");
                                   expect(sim.path_state() == "connecting", "path is reconnecting");
                                 }});
  switchover::ScenarioRunner runner(sim.collaborators(), sim_config());
  auto report = runner.run(scenario);
  expect(report.passed, "expected timeout is a pass");
  expect(report.outcome == switchover::VolumeOutcome::stuck_degraded, "outcome stuck_degraded");
  expect(report.control_plane == "sim://cluster", "report names the control-plane endpoint");
  expect(sim.last_options().cluster_agent && sim.last_options().cache_period == "1s",
         "HA cluster bootstrap");
  expect_clean_teardown(sim, "reconnect timeout");

  SimulatedCluster short_delay;
  auto cfg = sim_config();
  cfg.reconnect_delay_s = 10;
  auto rejected = run_in_sim(short_delay, "reconnecting the new target times out", cfg);
  const auto* f = rejected.first_failure();
  expect(!rejected.passed && f && f->error_code == switchover::ErrorCode::config_invalid,
         "reconnect delay within the budget is a configuration error");
  expect_clean_teardown(short_delay, "short reconnect delay");
}

void test_scenario_no_free_nodes() {
  SimulatedCluster sim;
  auto report = run_in_sim(sim, "path failure with no free nodes");
  expect(report.passed, "no-free-nodes scenario passes");
  expect(report.published_node == "io-engine-1", "published on io-engine-1");
  expect(report.final_target_node == "io-engine-2", "republished on the uncordoned node");
  expect(report.outcome == switchover::VolumeOutcome::republished, "outcome republished");
  expect_clean_teardown(sim, "no free nodes");
}

void test_scenario_no_free_nodes_premature_failover() {
  // Cordon lifted before the target fails: HA republishes inside the window.
  SimulatedCluster sim;
  sim.default_reconnect_delay_s = 1;
  sim.detect_ms = 1000;
  auto cfg = sim_config();
  switchover::ScenarioRunner runner(sim.collaborators(), cfg);
  auto scenario = scenario_named(switchover::all_scenarios(), "path failure with no free nodes");
  // Cordon and uncordon in one step.
  scenario.steps[3].action = [](switchover::ScenarioContext& ctx) {
    ctx.injector.apply(switchover::FaultSpec::cordon(switchover::kTargetNode2, "d"));
    ctx.injector.apply(switchover::FaultSpec::uncordon(switchover::kTargetNode2, "d"));
  };
  auto report = runner.run(scenario);
  const auto* f = report.first_failure();
  expect(!report.passed && f, "premature path recovery fails the scenario");
  expect(f->error_code == switchover::ErrorCode::assertion_failed, "hold violation is an assertion");
  expect(report.steps.back().status == switchover::StepStatus::skipped, "later steps skipped");
  expect_clean_teardown(sim, "premature failover");
}

void test_scenario_no_free_nodes_cordon_ignored() {
  // HA moves the volume onto the cordoned node while the path is still down.
  SimulatedCluster sim;
  sim.ignore_cordons = true;
  sim.detect_ms = 2000;
  auto report = run_in_sim(sim, "path failure with no free nodes");
  const auto* f = report.first_failure();
  expect(!report.passed && f, "failover onto a cordoned node fails the scenario");
  expect(f->text == "the ha clustering fails a few times", "caught inside the hold window");
  expect(f->error_code == switchover::ErrorCode::assertion_failed, "hold violation is an assertion");
  expect(report.outcome == switchover::VolumeOutcome::degraded, "never classified as republished");
  expect_clean_teardown(sim, "cordon ignored");
}

void test_scenario_temporary_failure() {
  SimulatedCluster sim;
  auto report = run_in_sim(sim, "temporary path failure with no other nodes");
  expect(report.passed, "temporary failure scenario passes");
  expect(report.final_target_node == "io-engine-1", "target stays on the restarted node");
  expect(report.outcome == switchover::VolumeOutcome::self_healed, "outcome self_healed");
  expect_clean_teardown(sim, "temporary failure");
}

void test_scenario_stopped_target() {
  SimulatedCluster sim;
  auto report = run_in_sim(sim, "stopped target is republished");
  expect(report.passed, "stopped target scenario passes");
  expect(report.final_target_node == "io-engine-2", "republished on the replica node");
  expect(report.outcome == switchover::VolumeOutcome::republished, "outcome republished");
  expect_clean_teardown(sim, "stopped target");
}

void test_scenario_stuck_degraded() {
  SimulatedCluster sim;
  sim.detect_ms = 10ULL * 60 * 1000;  // HA never reacts inside the budget
  auto report = run_in_sim(sim, "stopped target is republished");
  const auto* f = report.first_failure();
  expect(!report.passed && f, "no failover fails the scenario");
  expect(f->text == "the path should be established", "failure at the path step");
  expect(f->error_code == switchover::ErrorCode::timeout, "timeout error code");
  expect(report.outcome == switchover::VolumeOutcome::stuck_degraded, "outcome stuck_degraded");
  expect(report.steps.back().status == switchover::StepStatus::skipped, "final step skipped");
  expect_clean_teardown(sim, "stuck degraded");
}

void test_scenarios_labeling() {
  for (const auto& s : switchover::labeling_scenarios()) {
    SimulatedCluster sim;
    switchover::ScenarioRunner runner(sim.collaborators(), sim_config());
    auto report = runner.run(s);
    expect(report.passed, s.name + " passes");
    expect(report.feature == switchover::kFeatureLabeling, s.name + " feature");
    expect(!sim.last_options().cluster_agent, s.name + " uses a plain cluster");
    expect(!sim.deployed(), s.name + " stops its cluster");
  }
}

void test_unlabel_absent_key_is_rejected() {
  SimulatedCluster sim;
  auto report = run_in_sim(sim, "Unlabel a key the node does not have");
  expect(report.passed, "rejection is the expected outcome");
  bool noted = false;
  for (const auto& n : report.notes) noted = noted || n.find("PreconditionFailed") != std::string::npos;
  expect(noted, "rejection recorded in the report notes");
}

void test_teardown_failure_reported() {
  SimulatedCluster sim;
  sim.fail_deployer_stop = true;
  auto report = run_in_sim(sim, "Label a node");
  expect(!report.first_failure(), "every step passed");
  expect(!report.passed, "teardown failure fails the scenario");
  expect(report.teardown_errors.size() == 1, "one teardown error");
  expect(report.teardown_errors[0].find("stop cluster") != std::string::npos, "names the action");
}

void test_teardown_keeps_first_error() {
  SimulatedCluster sim;
  sim.detect_ms = 10ULL * 60 * 1000;
  sim.fail_disconnect = true;
  auto report = run_in_sim(sim, "stopped target is republished");
  const auto* f = report.first_failure();
  expect(f && f->error_code == switchover::ErrorCode::timeout, "step error survives teardown");
  expect(report.teardown_errors.size() == 1, "disconnect failure recorded");
  expect(!sim.deployed(), "cluster still stopped after a disconnect failure");
  expect(sim.disconnects == 1, "disconnect attempted exactly once");
}

// ============================================================================
// Phase 8: Reports and observability
// ============================================================================

void test_report_digest() {
  SimulatedCluster sim;
  auto report = run_in_sim(sim, "Label a node");
  const std::string json = report.to_json();
  auto obj = switchover::jsonlite::parse(json, nullptr);
  expect(switchover::jsonlite::get_string(obj, "schema") == "switchover_report_v1", "schema");
  expect(switchover::jsonlite::get_bool(obj, "passed"), "passed field");
  const std::string digest = switchover::jsonlite::get_string(obj, "digest");
  const auto cut = json.rfind(",\"digest\":");
  expect(cut != std::string::npos, "digest field last");
  expect(digest == switchover::report_digest(json.substr(0, cut) + "}"),
         "digest covers the report without the digest");

  const std::string suite = switchover::suite_to_json({report});
  auto sobj = switchover::jsonlite::parse(suite, nullptr);
  expect(switchover::jsonlite::get_u64(sobj, "passed") == 1, "suite pass count");
  expect(switchover::jsonlite::get_array(sobj, "scenarios")->size() == 1, "suite scenarios");
}

std::vector<switchover::HarnessEvent>* g_captured = nullptr;
void capture_event(const switchover::HarnessEvent& ev) {
  if (g_captured) g_captured->push_back(ev);
}

void test_event_hook_and_stats() {
  std::vector<switchover::HarnessEvent> events;
  g_captured = &events;
  switchover::set_harness_event_hook(capture_event);
  switchover::global_harness_stats().reset();

  SimulatedCluster sim;
  auto report = run_in_sim(sim, "temporary path failure with no other nodes");
  switchover::set_harness_event_hook(nullptr);
  g_captured = nullptr;

  expect(report.passed, "scenario passes");
  int faults = 0, convergences = 0, scenarios = 0;
  for (const auto& ev : events) {
    if (ev.kind == switchover::EventKind::fault) ++faults;
    if (ev.kind == switchover::EventKind::convergence && ev.ok) ++convergences;
    if (ev.kind == switchover::EventKind::scenario) ++scenarios;
    expect(ev.scenario == report.scenario, "events tagged with the scenario");
  }
  expect(faults == 1, "one fault event");
  expect(convergences >= 2, "readiness and path convergence events");
  expect(scenarios == 1, "one scenario event");

  auto& stats = switchover::global_harness_stats();
  expect(stats.faults_applied.load() == 1, "stats count faults");
  expect(stats.scenarios_passed.load() == 1, "stats count passed scenarios");
  expect(stats.convergence_latency.count() >= 2, "convergence latency recorded");
  auto sj = switchover::jsonlite::parse(stats.to_json(), nullptr);
  expect(switchover::jsonlite::get_u64(sj, "faults_applied") == 1, "stats JSON");
}

void test_hold_and_await_stats() {
  auto& stats = switchover::global_harness_stats();
  stats.reset();
  ManualClock clock;
  auto verifier = clock.verifier();
  int calls = 0;
  verifier.await_condition("second time", counting_probe(calls, 2), switchover::PollBudget{1000, 5});
  calls = 0;
  verifier.hold("satisfied", counting_probe(calls, 0), switchover::PollBudget{1000, 5});

  expect(stats.convergences.load() == 1, "only the await counts as a convergence");
  expect(stats.convergence_latency.count() == 1, "hold window not in the convergence latency");
  expect(stats.holds_kept.load() == 1, "kept hold counted");
  expect(stats.timeouts.load() == 0, "no timeouts");
  expect(stats.polls.load() == 7, "every observation is a poll");

  calls = 0;
  verifier.hold("satisfied", counting_probe(calls, 1), switchover::PollBudget{1000, 5});
  expect(stats.hold_violations.load() == 1, "violated hold counted");
  expect(stats.timeouts.load() == 0, "a violated hold is not a timeout");
  expect(stats.failure_categories().at(switchover::ErrorCode::assertion_failed) == 1,
         "violation categorised as an assertion");

  const auto recent = stats.recent_events_snapshot();
  expect(recent.size() == 11, "every event retained, oldest first");
  expect(recent.front().kind == switchover::EventKind::poll && recent.front().attempt == 1,
         "first poll of the await first");
  expect(recent[2].kind == switchover::EventKind::convergence, "await result after its polls");
  expect(recent.back().kind == switchover::EventKind::hold && !recent.back().ok,
         "violated hold last");
  auto sj = switchover::jsonlite::parse(stats.to_json(), nullptr);
  expect(switchover::jsonlite::get_u64(sj, "holds_kept") == 1, "stats JSON holds_kept");
  stats.reset();
  expect(stats.recent_events_snapshot().empty(), "reset drops recent events");
}

void test_event_log_file() {
  const fs::path log = scratch_dir() / "events.jsonl";
  fs::remove(log);
  switchover::configure_event_log(log.string());
  switchover::HarnessEvent ev;
  ev.kind = switchover::EventKind::teardown;
  ev.scenario = "s";
  ev.step = "stop cluster";
  ev.ok = true;
  switchover::emit_harness_event(ev);
  switchover::emit_harness_event(ev);
  switchover::configure_event_log("");

  std::ifstream in(log);
  std::string line;
  int lines = 0;
  while (std::getline(in, line)) {
    auto obj = switchover::jsonlite::parse(line, nullptr);
    expect(switchover::jsonlite::get_string(obj, "kind") == "teardown", "event kind");
    ++lines;
  }
  expect(lines == 2, "one JSONL line per event");
  fs::remove(log);
}

void test_latency_histogram() {
  switchover::LatencyHistogram h;
  expect(h.percentile(0.5) == 0.0, "empty histogram");
  for (int i = 0; i < 100; ++i) h.record(1000000);  // 1ms
  h.record(1000000000);                               // 1s
  expect(h.count() == 101, "count");
  expect(h.percentile(0.5) < 2000.0, "p50 in the 1ms bucket");
  expect(h.percentile(1.0) > 500000.0, "p100 in the 1s bucket");
  expect(switchover::LatencyHistogram::bucket_for_us(0) == 0, "bucket 0");
  expect(switchover::LatencyHistogram::bucket_for_us(1) == 1, "bucket 1");
  expect(switchover::LatencyHistogram::bucket_for_us(~0ULL) ==
             switchover::LatencyHistogram::kBuckets - 1,
         "overflow bucket");
}

} // namespace

int main() {
  std::cout << "=== Switchover Harness Test Suite ===\n";

  std::cout << "\n[Phase 1] Hashing\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("digest domains", test_digest_domains);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Phase 2] Wire formats\n";
  run_test("jsonlite parse", test_jsonlite_parse);
  run_test("label parsing", test_parse_label);
  run_test("node cordon states", test_node_from_json_cordon_states);
  run_test("volume decoding", test_volume_from_json);
  run_test("request bodies and errors", test_request_bodies);
  run_test("nvmf uri parsing", test_parse_nvmf_uri);
  run_test("subsystem listing", test_parse_subsystem_listing);
  run_test("sysfs device naming", test_device_from_sysfs_entry);

  std::cout << "\n[Phase 3] Processes, containers and configuration\n";
  run_test("process echo", test_process_echo);
  run_test("process exit code", test_process_exit_code);
  run_test("process timeout", test_process_timeout);
  run_test("process missing binary", test_process_missing_binary);
  run_test("docker failure", test_docker_cli_failure);
  run_test("config defaults and env", test_config_defaults_and_env);
  run_test("deployer arguments", test_deploy_options_args);
  run_test("backing disks", test_backing_disks);

  std::cout << "\n[Phase 4] Convergence verifier\n";
  run_test("budget exhausted", test_verifier_budget_exhausted);
  run_test("early convergence", test_verifier_converges_early);
  run_test("probe errors", test_verifier_probe_errors);
  run_test("hold", test_verifier_hold);
  run_test("cordon predicate", test_cordon_applied_predicate);
  run_test("poll budgets", test_poll_budget);

  std::cout << "\n[Phase 5] Fault injector\n";
  run_test("unknown targets", test_fault_unknown_node);
  run_test("volume target resolution", test_fault_volume_target_resolution);
  run_test("revert all", test_fault_revert_all);

  std::cout << "\n[Phase 6] REST control plane\n";
  run_test("nodes and labels", test_rest_nodes_and_labels);
  run_test("cordon, pools and volumes", test_rest_cordon_and_volumes);
  run_test("transport error", test_rest_transport_error);

  std::cout << "\n[Phase 7] Scenarios\n";
  run_test("catalogue", test_catalogue);
  run_test("reconnect times out", test_scenario_reconnect_times_out);
  run_test("no free nodes", test_scenario_no_free_nodes);
  run_test("no free nodes, premature failover", test_scenario_no_free_nodes_premature_failover);
  run_test("no free nodes, cordon ignored", test_scenario_no_free_nodes_cordon_ignored);
  run_test("temporary failure", test_scenario_temporary_failure);
  run_test("stopped target", test_scenario_stopped_target);
  run_test("stuck degraded", test_scenario_stuck_degraded);
  run_test("labeling feature", test_scenarios_labeling);
  run_test("unlabel absent key", test_unlabel_absent_key_is_rejected);
  run_test("teardown failure reported", test_teardown_failure_reported);
  run_test("teardown keeps first error", test_teardown_keeps_first_error);

  std::cout << "\n[Phase 8] Reports and observability\n";
  run_test("report digest", test_report_digest);
  run_test("event hook and stats", test_event_hook_and_stats);
  run_test("hold and await stats", test_hold_and_await_stats);
  run_test("event log file", test_event_log_file);
  run_test("latency histogram", test_latency_histogram);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
