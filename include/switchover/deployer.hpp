#pragma once

// switchover/deployer.hpp - Cluster bootstrap seam and scoped fixtures.
//
// ScopedCluster and BackingDisks own one scenario's cluster and disk files.
// Both release in their destructor unless closed explicitly first, so a
// scenario that throws halfway still leaves nothing running and nothing on
// disk.

#include <cstdint>
#include <string>
#include <vector>

namespace switchover {

struct DeployOptions {
  std::uint32_t io_engines{2};
  std::string cache_period;       // empty: deployer default
  std::string reconcile_period;   // empty: deployer default
  bool cluster_agent{false};
  bool node_agent{false};
  bool csi_node{false};

  // io_engines nodes with the HA agents and the CSI node plugin, 1s cache and
  // reconcile periods.
  static DeployOptions ha_cluster(std::uint32_t io_engines);
  static DeployOptions plain(std::uint32_t io_engines);

  // Deployer command-line arguments for `start`.
  std::vector<std::string> to_args() const;
};

class IDeployer {
 public:
  virtual ~IDeployer() = default;
  virtual void start(const DeployOptions& options) = 0;
  virtual void stop() = 0;
};

class DeployerCli : public IDeployer {
 public:
  explicit DeployerCli(std::string binary, std::uint64_t timeout_ms = 300000);

  void start(const DeployOptions& options) override;
  void stop() override;

 private:
  std::string binary_;
  std::uint64_t timeout_ms_;
};

class ScopedCluster {
 public:
  ScopedCluster(IDeployer& deployer, const DeployOptions& options);
  ~ScopedCluster();

  ScopedCluster(const ScopedCluster&) = delete;
  ScopedCluster& operator=(const ScopedCluster&) = delete;

  const DeployOptions& options() const { return options_; }

  // Stop now; throws on failure. Idempotent.
  void close();

 private:
  IDeployer& deployer_;
  DeployOptions options_;
  bool running_{false};
};

// Flat backing files disk_0..disk_{count-1} under dir, truncated to size_bytes.
// Node containers see them under host_prefix + path.
class BackingDisks {
 public:
  BackingDisks(std::string dir, std::uint32_t count, std::uint64_t size_bytes,
               std::string host_prefix);
  ~BackingDisks();

  BackingDisks(const BackingDisks&) = delete;
  BackingDisks& operator=(const BackingDisks&) = delete;

  const std::vector<std::string>& paths() const { return paths_; }
  // Paths as the io-engine containers see them, e.g. /host/tmp/disk_0.
  std::vector<std::string> host_paths() const;

  // Remove the files now; throws HarnessError(teardown_failed) on failure.
  void close();

 private:
  std::vector<std::string> paths_;
  std::string host_prefix_;
};

}  // namespace switchover
