#pragma once

// switchover/process.hpp - Child process execution for external tooling.
//
// The container runtime (docker), the initiator tooling (nvme-cli) and the
// cluster deployer are all driven as child processes. run_process() forks,
// execs with the harness's own environment, captures bounded stdout/stderr
// and enforces a wall-clock deadline.
//
// INVARIANTS:
//   - run_process() never throws; failures are reported through
//     ProcessResult::error_message / exit_code.
//   - A child that outlives timeout_ms is SIGKILLed (whole process group) and
//     reported with timed_out=true, exit_code=124.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace switchover {

struct ProcessSpec {
  std::string command;             // absolute path or bare name resolved via PATH
  std::vector<std::string> argv;   // arguments, excluding argv[0]
  std::uint64_t timeout_ms{30000};
  std::size_t max_output_bytes{1 << 20};
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;  // set when the process could not be spawned

  bool ok() const { return error_message.empty() && !timed_out && exit_code == 0; }

  // One-line summary for error messages: exit code plus trimmed stderr.
  std::string describe() const;
};

ProcessResult run_process(const ProcessSpec& spec);

// Resolve a bare command name against $PATH. Names containing '/' are returned
// unchanged if executable. nullopt when nothing executable is found.
std::optional<std::string> resolve_executable(const std::string& name);

// Render argv for logs: "docker stop io-engine-1".
std::string command_line(const ProcessSpec& spec);

}  // namespace switchover
