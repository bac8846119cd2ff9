#include "switchover/initiator.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <thread>

#include "switchover/errors.hpp"
#include "switchover/jsonlite.hpp"
#include "switchover/process.hpp"

namespace fs = std::filesystem;

namespace switchover {

namespace {

// A freshly connected namespace shows up in sysfs shortly after
// `nvme connect` returns.
constexpr int kDeviceWaitAttempts = 50;
constexpr auto kDeviceWaitInterval = std::chrono::milliseconds(100);

std::string read_first_line(const fs::path& p) {
  std::ifstream in(p);
  std::string line;
  if (in) std::getline(in, line);
  while (!line.empty() && (line.back() == '\n' || line.back() == ' ' || line.back() == '\r')) {
    line.pop_back();
  }
  return line;
}

NvmfUri require_uri(const std::string& device_uri) {
  auto uri = parse_nvmf_uri(device_uri);
  if (!uri) {
    throw HarnessError(ErrorCode::config_invalid, "not an nvmf device uri: " + device_uri);
  }
  return *uri;
}

void append_subsystems(const jsonlite::Object& host, SubsystemListing& out) {
  const auto* subsystems = jsonlite::get_array(host, "Subsystems");
  if (!subsystems) return;
  for (const auto& sv : *subsystems) {
    const auto* so = jsonlite::as_object(sv);
    if (!so) continue;
    SubsystemDescriptor sub;
    sub.name = jsonlite::get_string(*so, "Name");
    sub.nqn = jsonlite::get_string(*so, "NQN");
    if (const auto* paths = jsonlite::get_array(*so, "Paths")) {
      for (const auto& pv : *paths) {
        const auto* po = jsonlite::as_object(pv);
        if (!po) continue;
        PathDescriptor path;
        path.name = jsonlite::get_string(*po, "Name");
        path.transport = jsonlite::get_string(*po, "Transport");
        path.address = jsonlite::get_string(*po, "Address");
        path.state = jsonlite::get_string(*po, "State");
        sub.paths.push_back(std::move(path));
      }
    }
    out.subsystems.push_back(std::move(sub));
  }
}

}  // namespace

std::optional<NvmfUri> parse_nvmf_uri(const std::string& uri) {
  static const std::regex re(R"(^nvmf(\+(tcp|rdma))?://([^/:]+)(:([0-9]+))?/(.+)$)");
  std::smatch m;
  if (!std::regex_match(uri, m, re)) return std::nullopt;
  NvmfUri out;
  if (m[2].matched) out.transport = m[2].str();
  out.host = m[3].str();
  if (m[5].matched) {
    const std::string port = m[5].str();
    if (port.size() > 5) return std::nullopt;
    const unsigned long value = std::stoul(port);
    if (value == 0 || value > 65535) return std::nullopt;
    out.port = static_cast<std::uint16_t>(value);
  }
  out.nqn = m[6].str();
  return out;
}

SubsystemListing parse_subsystem_listing(const std::string& json) {
  std::optional<jsonlite::JsonError> err;
  const auto value = jsonlite::parse_value(json, &err);
  if (err) {
    throw HarnessError(ErrorCode::json_parse_error, "nvme list-subsys: " + err->message);
  }
  SubsystemListing out;
  out.raw = json;
  if (const auto* obj = jsonlite::as_object(value)) {
    append_subsystems(*obj, out);
  } else if (const auto* arr = jsonlite::as_array(value)) {
    for (const auto& host : *arr) {
      if (const auto* ho = jsonlite::as_object(host)) append_subsystems(*ho, out);
    }
  } else {
    throw HarnessError(ErrorCode::json_parse_error,
                       "nvme list-subsys: expected an object or an array");
  }
  return out;
}

std::optional<std::string> device_from_sysfs_entry(const std::string& entry) {
  static const std::regex multipath(R"(^nvme([0-9]+)c[0-9]+n([0-9]+)$)");
  static const std::regex plain(R"(^nvme([0-9]+)n([0-9]+)$)");
  std::smatch m;
  if (std::regex_match(entry, m, multipath) || std::regex_match(entry, m, plain)) {
    return "/dev/nvme" + m[1].str() + "n" + m[2].str();
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// NvmeCli
// ---------------------------------------------------------------------------

NvmeCli::NvmeCli(std::string nvme_binary, std::string sysfs_root, std::uint64_t timeout_ms)
    : nvme_(std::move(nvme_binary)), sysfs_root_(std::move(sysfs_root)), timeout_ms_(timeout_ms) {}

std::vector<std::string> NvmeCli::controllers_for(const std::string& nqn) const {
  std::vector<std::string> out;
  const fs::path cls = fs::path(sysfs_root_) / "class" / "nvme";
  std::error_code ec;
  if (!fs::is_directory(cls, ec)) return out;
  for (const auto& entry : fs::directory_iterator(cls, ec)) {
    if (read_first_line(entry.path() / "subsysnqn") == nqn) {
      out.push_back(entry.path().filename().string());
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::optional<std::string> NvmeCli::device_for(const std::string& nqn) const {
  const fs::path cls = fs::path(sysfs_root_) / "class" / "nvme";
  for (const auto& ctrl : controllers_for(nqn)) {
    std::error_code ec;
    for (const auto& child : fs::directory_iterator(cls / ctrl, ec)) {
      if (auto dev = device_from_sysfs_entry(child.path().filename().string())) return dev;
    }
  }
  return std::nullopt;
}

std::string NvmeCli::connect(const std::string& device_uri) {
  const NvmfUri uri = require_uri(device_uri);
  ProcessSpec spec;
  spec.command = nvme_;
  spec.argv = {"connect", "-t", uri.transport, "-a", uri.host,
               "-s", std::to_string(uri.port), "-n", uri.nqn};
  spec.timeout_ms = timeout_ms_;
  const auto result = run_process(spec);
  if (!result.ok()) {
    throw HarnessError(ErrorCode::spawn_failed,
                       "`" + command_line(spec) + "` failed: " + result.describe());
  }
  for (int attempt = 0; attempt < kDeviceWaitAttempts; ++attempt) {
    if (auto dev = device_for(uri.nqn)) {
      std::cerr << "[nvme] connected " << device_uri << " as " << *dev << "\n";
      return *dev;
    }
    std::this_thread::sleep_for(kDeviceWaitInterval);
  }
  throw HarnessError(ErrorCode::not_found,
                     "connected " + uri.nqn + " but no namespace appeared under " +
                         sysfs_root_ + "/class/nvme");
}

void NvmeCli::disconnect(const std::string& device_uri) {
  const NvmfUri uri = require_uri(device_uri);
  ProcessSpec spec;
  spec.command = nvme_;
  spec.argv = {"disconnect", "-n", uri.nqn};
  spec.timeout_ms = timeout_ms_;
  const auto result = run_process(spec);
  if (!result.ok()) {
    throw HarnessError(ErrorCode::spawn_failed,
                       "`" + command_line(spec) + "` failed: " + result.describe());
  }
}

SubsystemListing NvmeCli::list_subsystems(const std::string& device) {
  ProcessSpec spec;
  spec.command = nvme_;
  spec.argv = {"list-subsys", "-o", "json", device};
  spec.timeout_ms = timeout_ms_;
  const auto result = run_process(spec);
  if (!result.ok()) {
    throw HarnessError(ErrorCode::spawn_failed,
                       "`" + command_line(spec) + "` failed: " + result.describe());
  }
  return parse_subsystem_listing(result.stdout_text);
}

void NvmeCli::set_reconnect_delay(const std::string& device_uri, std::uint32_t seconds) {
  const NvmfUri uri = require_uri(device_uri);
  const auto controllers = controllers_for(uri.nqn);
  if (controllers.empty()) {
    throw HarnessError(ErrorCode::not_found, "no nvme controller connected to " + uri.nqn);
  }
  for (const auto& ctrl : controllers) {
    const fs::path knob = fs::path(sysfs_root_) / "class" / "nvme" / ctrl / "reconnect_delay";
    std::ofstream out(knob);
    if (!out) {
      throw HarnessError(ErrorCode::not_found, "cannot open " + knob.string());
    }
    out << seconds;
    out.flush();
    if (!out) {
      throw HarnessError(ErrorCode::injection_failed, "write to " + knob.string() + " failed");
    }
  }
}

// ---------------------------------------------------------------------------
// InitiatorConnection
// ---------------------------------------------------------------------------

InitiatorConnection::InitiatorConnection(IInitiator& initiator, std::string device_uri)
    : initiator_(initiator), device_uri_(std::move(device_uri)) {
  device_ = initiator_.connect(device_uri_);
  open_ = true;
}

InitiatorConnection::~InitiatorConnection() {
  if (!open_) return;
  try {
    close();
  } catch (const std::exception& e) {
    std::cerr << "[teardown] WARN: disconnect " << device_uri_ << " failed: " << e.what() << "\n";
  }
}

void InitiatorConnection::close() {
  if (!open_) return;
  open_ = false;
  initiator_.disconnect(device_uri_);
}

}  // namespace switchover
