#include "switchover/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <sstream>

#include "switchover/jsonlite.hpp"

namespace switchover {

namespace {

void env_string(const char* name, std::string& field) {
  const char* e = std::getenv(name);
  if (e && e[0]) field = e;
}

template <typename T>
void env_number(const char* name, T& field) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return;
  std::uint64_t value = 0;
  if (!parse_u64(e, value) || value > std::numeric_limits<T>::max()) {
    std::cerr << "[config] WARN: " << name << "='" << e
              << "' is not a valid number; using default " << field << "\n";
    return;
  }
  field = static_cast<T>(value);
}

}  // namespace

bool parse_u64(const std::string& text, std::uint64_t& out) {
  if (text.empty()) return false;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
  if (errno == ERANGE || end == nullptr || *end != '\0') return false;
  out = static_cast<std::uint64_t>(v);
  return true;
}

HarnessConfig HarnessConfig::from_env() {
  HarnessConfig c;
  env_string("SWITCHOVER_REST_URL", c.rest_url);
  env_number("SWITCHOVER_REST_TIMEOUT_MS", c.rest_timeout_ms);
  env_string("SWITCHOVER_DEPLOYER", c.deployer);
  env_string("SWITCHOVER_DOCKER", c.docker);
  env_string("SWITCHOVER_NVME", c.nvme);
  env_string("SWITCHOVER_SYSFS_ROOT", c.sysfs_root);
  env_string("SWITCHOVER_DISK_DIR", c.disk_dir);
  env_string("SWITCHOVER_HOST_PREFIX", c.host_prefix);
  env_number("SWITCHOVER_PATH_INTERVAL_MS", c.path_interval_ms);
  env_number("SWITCHOVER_PATH_ATTEMPTS", c.path_attempts);
  env_number("SWITCHOVER_CORDON_INTERVAL_MS", c.cordon_interval_ms);
  env_number("SWITCHOVER_CORDON_ATTEMPTS", c.cordon_attempts);
  env_number("SWITCHOVER_RECONNECT_DELAY_S", c.reconnect_delay_s);
  env_number("SWITCHOVER_HA_FAIL_WINDOW_S", c.ha_fail_window_s);
  env_string("SWITCHOVER_EVENT_LOG", c.event_log);
  env_string("SWITCHOVER_REPORT", c.report_path);
  return c;
}

RestConfig HarnessConfig::rest() const {
  RestConfig r;
  r.base_url = rest_url;
  r.timeout_ms = rest_timeout_ms;
  return r;
}

std::string HarnessConfig::to_json() const {
  std::ostringstream o;
  o << "{\"rest_url\":\"" << jsonlite::escape(rest_url) << "\""
    << ",\"rest_timeout_ms\":" << rest_timeout_ms
    << ",\"deployer\":\"" << jsonlite::escape(deployer) << "\""
    << ",\"docker\":\"" << jsonlite::escape(docker) << "\""
    << ",\"nvme\":\"" << jsonlite::escape(nvme) << "\""
    << ",\"sysfs_root\":\"" << jsonlite::escape(sysfs_root) << "\""
    << ",\"disk_dir\":\"" << jsonlite::escape(disk_dir) << "\""
    << ",\"host_prefix\":\"" << jsonlite::escape(host_prefix) << "\""
    << ",\"path_budget\":{\"interval_ms\":" << path_interval_ms
    << ",\"attempts\":" << path_attempts << "}"
    << ",\"cordon_budget\":{\"interval_ms\":" << cordon_interval_ms
    << ",\"attempts\":" << cordon_attempts << "}"
    << ",\"reconnect_delay_s\":" << reconnect_delay_s
    << ",\"ha_fail_window_s\":" << ha_fail_window_s << "}";
  return o.str();
}

}  // namespace switchover
