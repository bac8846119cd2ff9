#pragma once

// switchover/container.hpp - Container runtime seam.
//
// Each io-engine node runs in its own container named after the node
// ("io-engine-1"). Stopping or restarting that container is how target
// failure is induced.

#include <cstdint>
#include <string>

namespace switchover {

class IContainerRuntime {
 public:
  virtual ~IContainerRuntime() = default;

  // All mutators throw HarnessError(spawn_failed) when the runtime tool fails.
  virtual void stop(const std::string& name) = 0;
  virtual void restart(const std::string& name) = 0;
  virtual void start(const std::string& name) = 0;

  virtual bool exists(const std::string& name) = 0;
  virtual bool is_running(const std::string& name) = 0;
};

// Drives the docker CLI.
class DockerCli : public IContainerRuntime {
 public:
  explicit DockerCli(std::string docker_binary = "docker", std::uint64_t timeout_ms = 60000);

  void stop(const std::string& name) override;
  void restart(const std::string& name) override;
  void start(const std::string& name) override;
  bool exists(const std::string& name) override;
  bool is_running(const std::string& name) override;

 private:
  void run_checked(const std::string& verb, const std::string& name);

  std::string docker_;
  std::uint64_t timeout_ms_;
};

}  // namespace switchover
