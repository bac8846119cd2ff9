#include "switchover/deployer.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

#include "switchover/errors.hpp"
#include "switchover/process.hpp"

namespace fs = std::filesystem;

namespace switchover {

namespace {

// Best-effort removal used while a constructor is already failing; the
// construction error is the one the caller sees.
void discard(std::vector<std::string>& paths) {
  for (const auto& p : paths) {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) std::cerr << "[teardown] WARN: cannot remove " << p << ": " << ec.message() << "\n";
  }
  paths.clear();
}

}  // namespace

DeployOptions DeployOptions::ha_cluster(std::uint32_t io_engines) {
  DeployOptions o;
  o.io_engines = io_engines;
  o.cache_period = "1s";
  o.reconcile_period = "1s";
  o.cluster_agent = true;
  o.node_agent = true;
  o.csi_node = true;
  return o;
}

DeployOptions DeployOptions::plain(std::uint32_t io_engines) {
  DeployOptions o;
  o.io_engines = io_engines;
  return o;
}

std::vector<std::string> DeployOptions::to_args() const {
  std::vector<std::string> args = {"start", "--io-engines", std::to_string(io_engines)};
  if (!cache_period.empty()) {
    args.push_back("--cache-period");
    args.push_back(cache_period);
  }
  if (!reconcile_period.empty()) {
    args.push_back("--reconcile-period");
    args.push_back(reconcile_period);
  }
  if (cluster_agent) args.push_back("--cluster-agent");
  if (node_agent) args.push_back("--node-agent");
  if (csi_node) args.push_back("--csi-node");
  return args;
}

// ---------------------------------------------------------------------------
// DeployerCli
// ---------------------------------------------------------------------------

DeployerCli::DeployerCli(std::string binary, std::uint64_t timeout_ms)
    : binary_(std::move(binary)), timeout_ms_(timeout_ms) {}

void DeployerCli::start(const DeployOptions& options) {
  ProcessSpec spec;
  spec.command = binary_;
  spec.argv = options.to_args();
  spec.timeout_ms = timeout_ms_;
  std::cerr << "[deployer] " << command_line(spec) << "\n";
  const auto result = run_process(spec);
  if (!result.ok()) {
    throw HarnessError(ErrorCode::spawn_failed,
                       "`" + command_line(spec) + "` failed: " + result.describe());
  }
}

void DeployerCli::stop() {
  ProcessSpec spec;
  spec.command = binary_;
  spec.argv = {"stop"};
  spec.timeout_ms = timeout_ms_;
  const auto result = run_process(spec);
  if (!result.ok()) {
    throw HarnessError(ErrorCode::teardown_failed,
                       "`" + command_line(spec) + "` failed: " + result.describe());
  }
}

// ---------------------------------------------------------------------------
// ScopedCluster
// ---------------------------------------------------------------------------

ScopedCluster::ScopedCluster(IDeployer& deployer, const DeployOptions& options)
    : deployer_(deployer), options_(options) {
  deployer_.start(options_);
  running_ = true;
}

ScopedCluster::~ScopedCluster() {
  if (!running_) return;
  try {
    close();
  } catch (const std::exception& e) {
    std::cerr << "[teardown] WARN: cluster stop failed: " << e.what() << "\n";
  }
}

void ScopedCluster::close() {
  if (!running_) return;
  running_ = false;
  deployer_.stop();
}

// ---------------------------------------------------------------------------
// BackingDisks
// ---------------------------------------------------------------------------

BackingDisks::BackingDisks(std::string dir, std::uint32_t count, std::uint64_t size_bytes,
                           std::string host_prefix)
    : host_prefix_(std::move(host_prefix)) {
  for (std::uint32_t i = 0; i < count; ++i) {
    const fs::path p = fs::path(dir) / ("disk_" + std::to_string(i));
    {
      // Create if absent, then truncate: a leftover from an earlier run is
      // reused with fresh (zeroed) contents.
      std::ofstream create(p, std::ios::binary | std::ios::trunc);
      if (!create) {
        discard(paths_);
        throw HarnessError(ErrorCode::spawn_failed, "cannot create backing file " + p.string());
      }
    }
    std::error_code ec;
    fs::resize_file(p, size_bytes, ec);
    if (ec) {
      paths_.push_back(p.string());
      discard(paths_);
      throw HarnessError(ErrorCode::spawn_failed,
                         "cannot size " + p.string() + ": " + ec.message());
    }
    paths_.push_back(p.string());
  }
}

BackingDisks::~BackingDisks() {
  if (paths_.empty()) return;
  try {
    close();
  } catch (const std::exception& e) {
    std::cerr << "[teardown] WARN: " << e.what() << "\n";
  }
}

std::vector<std::string> BackingDisks::host_paths() const {
  std::vector<std::string> out;
  out.reserve(paths_.size());
  for (const auto& p : paths_) out.push_back(host_prefix_ + p);
  return out;
}

void BackingDisks::close() {
  std::string failed;
  for (const auto& p : paths_) {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) failed += (failed.empty() ? "" : ", ") + p + " (" + ec.message() + ")";
  }
  paths_.clear();
  if (!failed.empty()) {
    throw HarnessError(ErrorCode::teardown_failed, "cannot remove backing files: " + failed);
  }
}

}  // namespace switchover
