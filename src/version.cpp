#include "switchover/version.hpp"

#include <sstream>

#include "switchover/hash.hpp"

namespace switchover {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.harness_semver = SWITCHOVER_VERSION;
  const auto h = hash_runtime_info();
  m.hash_primitive = h.primitive;
  m.hash_version = h.version;
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"report_schema\":" << m.report_schema
    << ",\"suite_schema\":" << m.suite_schema
    << ",\"event_log\":" << m.event_log
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"harness_semver\":\"" << m.harness_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"hash_version\":\"" << m.hash_version << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace switchover
