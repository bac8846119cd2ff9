#pragma once

// switchover/control_plane.hpp - Cluster Control Facade.
//
// DESIGN:
//   IControlPlane is the only way the harness reads or mutates cluster state.
//   RestControlPlane talks to the control plane's REST API (base /v0); tests
//   substitute an in-memory implementation.
//
// INVARIANTS:
//   - Every call is a single synchronous request. No retries: retry policy
//     belongs to the ConvergenceVerifier.
//   - Any non-2xx response raises ControlPlaneError(status, message). A request
//     that produced no response raises ControlPlaneError with status 0.
//   - Nothing is cached. Two get_node() calls issue two GETs.

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "switchover/jsonlite.hpp"
#include "switchover/types.hpp"

namespace httplib {
class Client;
}

namespace switchover {

class IControlPlane {
 public:
  virtual ~IControlPlane() = default;

  virtual NodeRecord get_node(const std::string& node_id) = 0;
  virtual std::vector<NodeRecord> get_nodes() = 0;

  // Create-or-overwrite by key.
  virtual NodeRecord put_node_label(const std::string& node_id, const Label& label) = 0;
  virtual NodeRecord delete_node_label(const std::string& node_id, const std::string& key) = 0;

  virtual NodeRecord put_node_cordon(const std::string& node_id, const std::string& drain_label) = 0;
  virtual NodeRecord delete_node_cordon(const std::string& node_id, const std::string& drain_label) = 0;

  virtual PoolRecord put_node_pool(const PoolSpec& pool) = 0;

  virtual VolumeRecord put_volume(const VolumeSpec& spec) = 0;
  // Publish, or republish, the volume on node over protocol.
  virtual VolumeRecord put_volume_target(const std::string& volume_uuid,
                                         const std::string& node_id,
                                         Protocol protocol) = 0;
  virtual VolumeRecord get_volume(const std::string& volume_uuid) = 0;
  virtual VolumeRecord delete_volume_target(const std::string& volume_uuid) = 0;
  virtual void delete_volume(const std::string& volume_uuid) = 0;

  // Human-readable endpoint, used in logs and reports.
  virtual std::string endpoint() const = 0;
};

struct RestConfig {
  std::string base_url{"http://127.0.0.1:8081"};
  std::string api_prefix{"/v0"};
  std::uint64_t timeout_ms{5000};
};

class RestControlPlane : public IControlPlane {
 public:
  explicit RestControlPlane(RestConfig config);
  ~RestControlPlane() override;

  RestControlPlane(const RestControlPlane&) = delete;
  RestControlPlane& operator=(const RestControlPlane&) = delete;

  NodeRecord get_node(const std::string& node_id) override;
  std::vector<NodeRecord> get_nodes() override;
  NodeRecord put_node_label(const std::string& node_id, const Label& label) override;
  NodeRecord delete_node_label(const std::string& node_id, const std::string& key) override;
  NodeRecord put_node_cordon(const std::string& node_id, const std::string& drain_label) override;
  NodeRecord delete_node_cordon(const std::string& node_id, const std::string& drain_label) override;
  PoolRecord put_node_pool(const PoolSpec& pool) override;
  VolumeRecord put_volume(const VolumeSpec& spec) override;
  VolumeRecord put_volume_target(const std::string& volume_uuid,
                                 const std::string& node_id,
                                 Protocol protocol) override;
  VolumeRecord get_volume(const std::string& volume_uuid) override;
  VolumeRecord delete_volume_target(const std::string& volume_uuid) override;
  void delete_volume(const std::string& volume_uuid) override;
  std::string endpoint() const override { return config_.base_url; }

 private:
  enum class Method { get, put, del };

  // Issues the request; returns the body of a 2xx response.
  std::string call(Method method, const std::string& path, const std::string& body = "");

  RestConfig config_;
  std::unique_ptr<httplib::Client> client_;
};

// ---------------------------------------------------------------------------
// Wire mapping. Exposed so the fake REST server in tests shares one encoding.
// ---------------------------------------------------------------------------

// Percent-encode one path segment. Unreserved characters and '=' pass through.
std::string encode_path_segment(const std::string& segment);

NodeRecord node_from_json(const jsonlite::Object& obj);
VolumeRecord volume_from_json(const jsonlite::Object& obj);
PoolRecord pool_from_json(const jsonlite::Object& obj);

// Derive the cordon state from spec.cordondrainstate.
CordonState cordon_state_from_json(const jsonlite::Value& cordondrainstate,
                                   std::vector<std::string>* labels_out);

std::string volume_spec_to_json(const VolumeSpec& spec);
std::string publish_body_to_json(const std::string& node_id, Protocol protocol);
std::string pool_body_to_json(const PoolSpec& pool);

// Extract a human-readable message from a REST error body
// ({"details":...,"message":...,"kind":...}); falls back to the raw body.
std::string error_message_from_body(const std::string& body);

}  // namespace switchover
