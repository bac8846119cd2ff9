#pragma once

// switchover/initiator.hpp - NVMe-oF initiator seam.
//
// DESIGN:
//   The initiator is the host-side NVMe stack that holds the I/O path to the
//   volume's target. The harness only needs four things from it: connect,
//   disconnect, list the multipath view of a device, and tune how long a lost
//   path waits before reconnecting.
//
// INVARIANTS:
//   - list_subsystems() re-reads live state every call; no caching.
//   - InitiatorConnection disconnects exactly once (close() or destructor).

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "switchover/types.hpp"

namespace switchover {

// nvmf://host:port/nqn
struct NvmfUri {
  std::string transport{"tcp"};
  std::string host;
  std::uint16_t port{4420};
  std::string nqn;
};

// Accepts "nvmf://" and "nvmf+tcp://". nullopt when the scheme, host or NQN is
// missing or the port is not a number in 1..65535.
std::optional<NvmfUri> parse_nvmf_uri(const std::string& uri);

// Parses `nvme list-subsys -o json`. Both the single-object layout
// ({"Subsystems":[...]}) and the per-host array layout
// ([{"HostNQN":..,"Subsystems":[...]}]) are accepted. Throws
// HarnessError(json_parse_error) on malformed input.
SubsystemListing parse_subsystem_listing(const std::string& json);

// Derive the block device node from a controller's sysfs child entry:
//   nvme0c1n1 -> /dev/nvme0n1   (native multipath head)
//   nvme2n1   -> /dev/nvme2n1
// nullopt for anything else.
std::optional<std::string> device_from_sysfs_entry(const std::string& entry);

class IInitiator {
 public:
  virtual ~IInitiator() = default;

  // Connects and returns the block device path, e.g. "/dev/nvme0n1".
  virtual std::string connect(const std::string& device_uri) = 0;
  virtual void disconnect(const std::string& device_uri) = 0;
  virtual SubsystemListing list_subsystems(const std::string& device) = 0;
  virtual void set_reconnect_delay(const std::string& device_uri, std::uint32_t seconds) = 0;
};

// Drives nvme-cli and the nvme sysfs class.
class NvmeCli : public IInitiator {
 public:
  NvmeCli(std::string nvme_binary, std::string sysfs_root, std::uint64_t timeout_ms = 30000);

  std::string connect(const std::string& device_uri) override;
  void disconnect(const std::string& device_uri) override;
  SubsystemListing list_subsystems(const std::string& device) override;
  void set_reconnect_delay(const std::string& device_uri, std::uint32_t seconds) override;

 private:
  // Controllers (e.g. "nvme0") whose subsysnqn matches nqn.
  std::vector<std::string> controllers_for(const std::string& nqn) const;
  std::optional<std::string> device_for(const std::string& nqn) const;

  std::string nvme_;
  std::string sysfs_root_;
  std::uint64_t timeout_ms_;
};

// Scoped initiator connection. Disconnects on destruction unless close()
// already ran.
class InitiatorConnection {
 public:
  InitiatorConnection(IInitiator& initiator, std::string device_uri);
  ~InitiatorConnection();

  InitiatorConnection(const InitiatorConnection&) = delete;
  InitiatorConnection& operator=(const InitiatorConnection&) = delete;

  const std::string& device() const { return device_; }
  const std::string& device_uri() const { return device_uri_; }

  // Disconnect now; throws on failure.
  void close();

 private:
  IInitiator& initiator_;
  std::string device_uri_;
  std::string device_;
  bool open_{false};
};

}  // namespace switchover
