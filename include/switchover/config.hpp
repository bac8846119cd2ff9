#pragma once

// switchover/config.hpp - Harness configuration.
//
// Every knob has a default matching the reference cluster layout; each can be
// overridden by a SWITCHOVER_* environment variable and then by CLI flags.
// Numeric variables that do not parse keep the default and print a warning on
// stderr; they never abort the run.

#include <cstdint>
#include <string>

#include "switchover/control_plane.hpp"

namespace switchover {

struct HarnessConfig {
  // Control plane
  std::string rest_url{"http://127.0.0.1:8081"};
  std::uint64_t rest_timeout_ms{5000};

  // External tools
  std::string deployer{"deployer"};
  std::string docker{"docker"};
  std::string nvme{"nvme"};
  std::string sysfs_root{"/sys"};

  // Backing storage
  std::string disk_dir{"/tmp"};
  std::string host_prefix{"/host"};

  // Convergence budgets
  std::uint64_t path_interval_ms{1000};
  std::uint32_t path_attempts{40};
  std::uint64_t cordon_interval_ms{200};
  std::uint32_t cordon_attempts{10};
  std::uint64_t startup_interval_ms{1000};
  std::uint32_t startup_attempts{60};

  // Scenario tuning
  std::uint32_t reconnect_delay_s{60};
  std::uint32_t ha_fail_window_s{5};

  // Outputs
  std::string event_log;
  std::string report_path;

  static HarnessConfig from_env();

  RestConfig rest() const;
  std::string to_json() const;
};

// Parse a non-negative decimal integer. False on empty input, trailing
// garbage or overflow.
bool parse_u64(const std::string& text, std::uint64_t& out);

}  // namespace switchover
