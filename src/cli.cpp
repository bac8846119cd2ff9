#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <vector>

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
#include "switchover/scenario.hpp"
#include "switchover/scenarios.hpp"
#include "switchover/verifier.hpp"
#include "switchover/version.hpp"

namespace {

void usage() {
  std::cerr << "usage: switchover <command> [args] [flags]\n"
            << "  list                              list scenarios\n"
            << "  run <scenario> | --all            run scenarios, print the suite report\n"
            << "  nodes                             list control-plane nodes\n"
            << "  label <node> <key=value>          put a node label\n"
            << "  unlabel <node> <key>              delete a node label\n"
            << "  cordon <node> <label>             cordon a node\n"
            << "  uncordon <node> <label>           remove a cordon label\n"
            << "  stop|restart|start <container>    container lifecycle\n"
            << "  reconnect-delay <uri> <secs>      set the initiator reconnect delay\n"
            << "  subsystems <device>               multipath view of a device\n"
            << "  health                            hashing and configuration\n"
            << "flags: --rest-url URL --report PATH --event-log PATH --deployer BIN\n"
            << "       --docker BIN --nvme BIN --disk-dir DIR\n";
}

void write_file(const std::string& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << data;
  if (!ofs) {
    throw switchover::HarnessError(switchover::ErrorCode::config_invalid, "cannot write " + path);
  }
}

std::string quoted(const std::string& s) { return "\"" + switchover::jsonlite::escape(s) + "\""; }

std::string error_json(const switchover::HarnessError& e) {
  return "{\"error\":" + quoted(e.what()) + ",\"code\":" +
         quoted(switchover::to_string(e.code())) + "}";
}

// Flags that take a value, and the config field each one overrides.
bool apply_flag(const std::string& flag, const std::string& value,
                switchover::HarnessConfig& cfg) {
  if (flag == "--rest-url") {
    cfg.rest_url = value;
  } else if (flag == "--report") {
    cfg.report_path = value;
  } else if (flag == "--event-log") {
    cfg.event_log = value;
  } else if (flag == "--deployer") {
    cfg.deployer = value;
  } else if (flag == "--docker") {
    cfg.docker = value;
  } else if (flag == "--nvme") {
    cfg.nvme = value;
  } else if (flag == "--disk-dir") {
    cfg.disk_dir = value;
  } else {
    return false;
  }
  return true;
}

std::string nodes_json(const std::vector<switchover::NodeRecord>& nodes) {
  std::string out = "[";
  for (size_t i = 0; i < nodes.size(); ++i) {
    if (i > 0) out += ",";
    out += nodes[i].raw.empty() ? "{\"id\":" + quoted(nodes[i].id) + "}" : nodes[i].raw;
  }
  return out + "]";
}

// Failed events still held in the stats ring, oldest first, one JSONL line each.
void dump_recent_failures() {
  for (const auto& ev : switchover::global_harness_stats().recent_events_snapshot()) {
    if (!ev.ok && ev.kind != switchover::EventKind::poll) {
      std::cerr << "[scenario] " << ev.to_json() << "\n";
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  auto cfg = switchover::HarnessConfig::from_env();

  std::vector<std::string> args;
  bool run_all = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--all") {
      run_all = true;
      continue;
    }
    if (a == "--help" || a == "-h") {
      usage();
      return 0;
    }
    if (a.rfind("--", 0) == 0) {
      if (i + 1 >= argc || !apply_flag(a, argv[i + 1], cfg)) {
        std::cerr << "{\"error\":\"unknown or incomplete flag " << a << "\"}\n";
        return 1;
      }
      ++i;
      continue;
    }
    args.push_back(a);
  }
  if (args.empty()) {
    usage();
    return 1;
  }
  const std::string cmd = args[0];
  auto need = [&](size_t n) {
    if (args.size() < n + 1) {
      usage();
      return false;
    }
    return true;
  };

  switchover::configure_event_log(cfg.event_log);

  if (cmd == "health") {
    const auto m = switchover::version::current_manifest();
    const bool vectors_ok = switchover::blake3_hex("") ==
                            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262";
    std::cout << "{\"ok\":" << (vectors_ok ? "true" : "false")
              << ",\"versions\":" << switchover::version::manifest_to_json(m)
              << ",\"config\":" << cfg.to_json() << "}\n";
    return vectors_ok ? 0 : 2;
  }

  if (cmd == "list") {
    for (const auto& s : switchover::all_scenarios()) {
      std::cout << s.feature << ": " << s.name << "\n";
    }
    return 0;
  }

  try {
    switchover::RestControlPlane control_plane(cfg.rest());
    switchover::DockerCli runtime(cfg.docker);
    switchover::NvmeCli initiator(cfg.nvme, cfg.sysfs_root);
    switchover::DeployerCli deployer(cfg.deployer);

    if (cmd == "run") {
      std::vector<switchover::Scenario> selected;
      if (run_all) {
        selected = switchover::all_scenarios();
      } else {
        if (!need(1)) return 1;
        auto s = switchover::find_scenario(args[1]);
        if (!s) {
          std::cerr << "{\"error\":\"unknown scenario\",\"scenario\":" << quoted(args[1]) << "}\n";
          return 1;
        }
        selected.push_back(std::move(*s));
      }

      switchover::ScenarioRunner runner(
          switchover::Collaborators{control_plane, runtime, initiator, deployer, {}, {}}, cfg);
      const auto reports = runner.run_all(selected);
      const std::string json = switchover::suite_to_json(reports);
      if (!cfg.report_path.empty()) write_file(cfg.report_path, json);
      std::cout << json << "\n";
      for (const auto& r : reports) {
        if (!r.passed) {
          dump_recent_failures();
          return 2;
        }
      }
      return 0;
    }

    if (cmd == "nodes") {
      std::cout << nodes_json(control_plane.get_nodes()) << "\n";
      return 0;
    }

    if (cmd == "label") {
      if (!need(2)) return 1;
      auto label = switchover::parse_label(args[2]);
      if (!label) {
        std::cerr << "{\"error\":\"label must be key=value\"}\n";
        return 1;
      }
      std::cout << control_plane.put_node_label(args[1], *label).raw << "\n";
      return 0;
    }

    if (cmd == "unlabel") {
      if (!need(2)) return 1;
      std::cout << control_plane.delete_node_label(args[1], args[2]).raw << "\n";
      return 0;
    }

    // Same injector path as scenario faults.
    switchover::FaultInjector injector(control_plane, runtime, initiator);
    injector.set_scenario("cli");
    const std::map<std::string, switchover::FaultSpec (*)(const std::string&)> container_faults = {
        {"stop", &switchover::FaultSpec::stop_node},
        {"restart", &switchover::FaultSpec::restart_node},
        {"start", &switchover::FaultSpec::start_node}};

    if (cmd == "cordon" || cmd == "uncordon") {
      if (!need(2)) return 1;
      const auto spec = cmd == "cordon" ? switchover::FaultSpec::cordon(args[1], args[2])
                                        : switchover::FaultSpec::uncordon(args[1], args[2]);
      injector.apply(spec);
      std::cout << control_plane.get_node(args[1]).raw << "\n";
      return 0;
    }

    if (auto it = container_faults.find(cmd); it != container_faults.end()) {
      if (!need(1)) return 1;
      const auto applied = injector.apply(it->second(args[1]));
      std::cout << "{\"ok\":true,\"fault\":" << quoted(applied.spec.describe())
                << ",\"duration_ns\":" << applied.duration_ns << "}\n";
      return 0;
    }

    if (cmd == "reconnect-delay") {
      if (!need(2)) return 1;
      std::uint64_t secs = 0;
      if (!switchover::parse_u64(args[2], secs) || secs > UINT32_MAX) {
        std::cerr << "{\"error\":\"seconds must be a non-negative integer\"}\n";
        return 1;
      }
      injector.apply(
          switchover::FaultSpec::reconnect_delay(args[1], static_cast<std::uint32_t>(secs)));
      std::cout << "{\"ok\":true,\"reconnect_delay_s\":" << secs << "}\n";
      return 0;
    }

    if (cmd == "subsystems") {
      if (!need(1)) return 1;
      const auto listing = initiator.list_subsystems(args[1]);
      const std::string mismatch = switchover::path_mismatch(listing);
      std::cout << "{\"device\":" << quoted(args[1])
                << ",\"single_live_path\":" << (mismatch.empty() ? "true" : "false")
                << ",\"mismatch\":" << quoted(mismatch)
                << ",\"observation_digest\":" << quoted(switchover::observation_digest(listing.raw))
                << ",\"raw\":" << quoted(listing.raw) << "}\n";
      return 0;
    }
  } catch (const switchover::HarnessError& e) {
    std::cerr << error_json(e) << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "{\"error\":" << quoted(e.what()) << "}\n";
    return 2;
  }

  usage();
  return 1;
}
