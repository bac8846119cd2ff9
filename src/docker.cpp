#include "switchover/container.hpp"

#include <iostream>

#include "switchover/errors.hpp"
#include "switchover/process.hpp"

namespace switchover {

namespace {

ProcessSpec docker_spec(const std::string& docker, std::uint64_t timeout_ms,
                        std::vector<std::string> argv) {
  ProcessSpec spec;
  spec.command = docker;
  spec.argv = std::move(argv);
  spec.timeout_ms = timeout_ms;
  spec.max_output_bytes = 64 * 1024;
  return spec;
}

}  // namespace

DockerCli::DockerCli(std::string docker_binary, std::uint64_t timeout_ms)
    : docker_(std::move(docker_binary)), timeout_ms_(timeout_ms) {}

void DockerCli::run_checked(const std::string& verb, const std::string& name) {
  const auto spec = docker_spec(docker_, timeout_ms_, {verb, name});
  const auto result = run_process(spec);
  if (!result.ok()) {
    throw HarnessError(ErrorCode::spawn_failed,
                       "`" + command_line(spec) + "` failed: " + result.describe());
  }
  std::cerr << "[docker] " << verb << " " << name << "\n";
}

void DockerCli::stop(const std::string& name) { run_checked("stop", name); }
void DockerCli::restart(const std::string& name) { run_checked("restart", name); }
void DockerCli::start(const std::string& name) { run_checked("start", name); }

bool DockerCli::exists(const std::string& name) {
  const auto result =
      run_process(docker_spec(docker_, timeout_ms_, {"inspect", "-f", "{{.Id}}", name}));
  if (!result.error_message.empty()) {
    throw HarnessError(ErrorCode::spawn_failed, result.error_message);
  }
  return result.exit_code == 0;
}

bool DockerCli::is_running(const std::string& name) {
  const auto spec = docker_spec(docker_, timeout_ms_, {"inspect", "-f", "{{.State.Running}}", name});
  const auto result = run_process(spec);
  if (!result.error_message.empty() || result.timed_out) {
    throw HarnessError(ErrorCode::spawn_failed,
                       "`" + command_line(spec) + "` failed: " + result.describe());
  }
  // Non-zero exit: no such container.
  if (result.exit_code != 0) return false;
  return result.stdout_text.rfind("true", 0) == 0;
}

}  // namespace switchover
