#pragma once

// switchover/version.hpp - Version manifest for every emitted format.
//
// INVARIANT:
//   Readers of reports and event logs key on these constants. Adding or
//   removing a required field in a format requires a bump.

#include <cstdint>
#include <string>

#ifndef SWITCHOVER_VERSION
#define SWITCHOVER_VERSION "0.0.0"
#endif

namespace switchover {
namespace version {

// Scenario report object (schema "switchover_report_v<N>").
constexpr uint32_t REPORT_SCHEMA_VERSION = 1;

// Suite wrapper around scenario reports.
constexpr uint32_t SUITE_SCHEMA_VERSION = 1;

// One HarnessEvent per JSONL line.
constexpr uint32_t EVENT_LOG_VERSION = 1;

// Version 1 = BLAKE3-256 with "obs:" / "rpt:" domain prefixes.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t report_schema{REPORT_SCHEMA_VERSION};
  uint32_t suite_schema{SUITE_SCHEMA_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string harness_semver;   // from the CMake project version
  std::string hash_primitive;   // "blake3"
  std::string hash_version;     // BLAKE3 library version
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace switchover
