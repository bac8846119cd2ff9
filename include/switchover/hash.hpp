#pragma once

#include <string>
#include <string_view>

namespace switchover {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

// BLAKE3-256 of payload, 64 lowercase hex chars.
std::string blake3_hex(std::string_view payload);

// BLAKE3 over domain || payload. Domains keep digests of different payload
// kinds from colliding.
std::string hash_domain(std::string_view domain, std::string_view payload);

// Fingerprint of one polled observation (raw tool output or REST body).
// Two attempts with the same digest saw byte-identical state.
std::string observation_digest(std::string_view raw);

// Digest stamped into a scenario report.
std::string report_digest(std::string_view report_json);

}  // namespace switchover
