#include "switchover/control_plane.hpp"

#include <cctype>

#include <httplib.h>

#include "switchover/errors.hpp"

namespace switchover {

namespace {

// Walks v and collects every string found under a "cordonlabels" key. The
// label list sits one level deep for cordonedstate and two levels deep for
// drainingstate/drainedstate.
void collect_cordon_labels(const jsonlite::Value& v, std::vector<std::string>& out) {
  const auto* obj = jsonlite::as_object(v);
  if (!obj) return;
  for (const auto& [k, child] : *obj) {
    if (k == "cordonlabels") {
      if (const auto* arr = jsonlite::as_array(child)) {
        for (const auto& item : *arr) {
          if (const auto* s = std::get_if<std::string>(&item.v)) out.push_back(*s);
        }
      }
    } else {
      collect_cordon_labels(child, out);
    }
  }
}

jsonlite::Object parse_body(const std::string& method, const std::string& path,
                            const std::string& body) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(body, &err);
  if (err) {
    throw HarnessError(ErrorCode::json_parse_error,
                       method + " " + path + " returned malformed JSON: " + err->message);
  }
  return obj;
}

}  // namespace

// ---------------------------------------------------------------------------
// Wire mapping
// ---------------------------------------------------------------------------

std::string encode_path_segment(const std::string& segment) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(segment.size());
  for (unsigned char c : segment) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '=') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0f];
    }
  }
  return out;
}

CordonState cordon_state_from_json(const jsonlite::Value& cordondrainstate,
                                   std::vector<std::string>* labels_out) {
  const auto* obj = jsonlite::as_object(cordondrainstate);
  if (!obj) return CordonState::uncordoned;
  if (labels_out) collect_cordon_labels(cordondrainstate, *labels_out);
  if (obj->contains("cordonedstate") || obj->contains("drainedstate")) {
    return CordonState::cordoned;
  }
  if (obj->contains("drainingstate")) return CordonState::cordoning;
  return CordonState::uncordoned;
}

NodeRecord node_from_json(const jsonlite::Object& obj) {
  NodeRecord node;
  node.id = jsonlite::get_string(obj, "id");
  node.raw = jsonlite::to_json(jsonlite::Value{obj});
  if (const auto* spec = jsonlite::get_object(obj, "spec")) {
    if (node.id.empty()) node.id = jsonlite::get_string(*spec, "id");
    node.grpc_endpoint = jsonlite::get_string(*spec, "grpcEndpoint");
    if (jsonlite::get_object(*spec, "labels")) {
      node.has_labels = true;
      node.labels = jsonlite::get_string_map(*spec, "labels");
    }
    auto it = spec->find("cordondrainstate");
    if (it != spec->end()) {
      node.cordon_state = cordon_state_from_json(it->second, &node.cordon_labels);
    }
  }
  if (const auto* state = jsonlite::get_object(obj, "state")) {
    node.status = jsonlite::get_string(*state, "status");
    if (node.grpc_endpoint.empty()) node.grpc_endpoint = jsonlite::get_string(*state, "grpcEndpoint");
  }
  return node;
}

VolumeRecord volume_from_json(const jsonlite::Object& obj) {
  VolumeRecord vol;
  if (const auto* spec = jsonlite::get_object(obj, "spec")) {
    vol.uuid = jsonlite::get_string(*spec, "uuid");
    vol.spec.uuid = vol.uuid;
    vol.spec.replicas = static_cast<uint32_t>(jsonlite::get_u64(*spec, "num_replicas", 1));
    vol.spec.size_bytes = jsonlite::get_u64(*spec, "size");
    vol.spec.thin = jsonlite::get_bool(*spec, "thin");
    if (const auto* policy = jsonlite::get_object(*spec, "policy")) {
      vol.spec.policy.self_heal = jsonlite::get_bool(*policy, "self_heal", true);
    }
  }
  if (const auto* state = jsonlite::get_object(obj, "state")) {
    if (vol.uuid.empty()) vol.uuid = jsonlite::get_string(*state, "uuid");
    vol.status = jsonlite::get_string(*state, "status");
    if (const auto* target = jsonlite::get_object(*state, "target")) {
      VolumeTarget t;
      t.node = jsonlite::get_string(*target, "node");
      t.device_uri = jsonlite::get_string(*target, "deviceUri");
      t.protocol = jsonlite::get_string(*target, "protocol") == "nvmf" ? Protocol::nvmf : Protocol::none;
      vol.target = t;
    }
  }
  return vol;
}

PoolRecord pool_from_json(const jsonlite::Object& obj) {
  PoolRecord pool;
  pool.id = jsonlite::get_string(obj, "id");
  if (const auto* spec = jsonlite::get_object(obj, "spec")) {
    if (pool.id.empty()) pool.id = jsonlite::get_string(*spec, "id");
    pool.node = jsonlite::get_string(*spec, "node");
    pool.disks = jsonlite::get_string_array(*spec, "disks");
    pool.status = jsonlite::get_string(*spec, "status");
  }
  if (const auto* state = jsonlite::get_object(obj, "state")) {
    if (pool.node.empty()) pool.node = jsonlite::get_string(*state, "node");
    pool.status = jsonlite::get_string(*state, "status", pool.status);
    pool.capacity_bytes = jsonlite::get_u64(*state, "capacity");
  }
  return pool;
}

std::string volume_spec_to_json(const VolumeSpec& spec) {
  jsonlite::Object policy;
  policy["self_heal"] = jsonlite::Value{spec.policy.self_heal};
  jsonlite::Object body;
  body["policy"] = jsonlite::Value{policy};
  body["replicas"] = jsonlite::Value{static_cast<std::uint64_t>(spec.replicas)};
  body["size"] = jsonlite::Value{static_cast<std::uint64_t>(spec.size_bytes)};
  body["thin"] = jsonlite::Value{spec.thin};
  return jsonlite::to_json(jsonlite::Value{body});
}

std::string publish_body_to_json(const std::string& node_id, Protocol protocol) {
  jsonlite::Object body;
  body["node"] = jsonlite::Value{node_id};
  body["protocol"] = jsonlite::Value{to_string(protocol)};
  body["publish_context"] = jsonlite::Value{jsonlite::Object{}};
  return jsonlite::to_json(jsonlite::Value{body});
}

std::string pool_body_to_json(const PoolSpec& pool) {
  jsonlite::Array disks;
  for (const auto& d : pool.disks) disks.push_back(jsonlite::Value{d});
  jsonlite::Object body;
  body["disks"] = jsonlite::Value{disks};
  return jsonlite::to_json(jsonlite::Value{body});
}

std::string error_message_from_body(const std::string& body) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(body, &err);
  if (err) return body;
  std::string out = jsonlite::get_string(obj, "message");
  const std::string details = jsonlite::get_string(obj, "details");
  const std::string kind = jsonlite::get_string(obj, "kind");
  if (!details.empty()) out += out.empty() ? details : " (" + details + ")";
  if (!kind.empty()) out = kind + ": " + out;
  return out.empty() ? body : out;
}

// ---------------------------------------------------------------------------
// RestControlPlane
// ---------------------------------------------------------------------------

RestControlPlane::RestControlPlane(RestConfig config)
    : config_(std::move(config)),
      client_(std::make_unique<httplib::Client>(config_.base_url)) {
  const auto secs = static_cast<time_t>(config_.timeout_ms / 1000);
  const auto usecs = static_cast<time_t>((config_.timeout_ms % 1000) * 1000);
  client_->set_connection_timeout(secs, usecs);
  client_->set_read_timeout(secs, usecs);
  client_->set_write_timeout(secs, usecs);
}

RestControlPlane::~RestControlPlane() = default;

std::string RestControlPlane::call(Method method, const std::string& path,
                                   const std::string& body) {
  const std::string full = config_.api_prefix + path;
  const std::string name =
      method == Method::get ? "GET" : method == Method::put ? "PUT" : "DELETE";
  auto res = [&]() {
    if (method == Method::get) return client_->Get(full);
    if (method == Method::put) return client_->Put(full, body, "application/json");
    return client_->Delete(full);
  }();
  if (!res) {
    throw ControlPlaneError(0, name, full,
                            "no response from " + config_.base_url + ": " +
                                httplib::to_string(res.error()));
  }
  if (res->status < 200 || res->status >= 300) {
    throw ControlPlaneError(res->status, name, full, error_message_from_body(res->body));
  }
  return res->body;
}

NodeRecord RestControlPlane::get_node(const std::string& node_id) {
  const std::string path = "/nodes/" + encode_path_segment(node_id);
  return node_from_json(parse_body("GET", path, call(Method::get, path)));
}

std::vector<NodeRecord> RestControlPlane::get_nodes() {
  const std::string body = call(Method::get, "/nodes");
  std::optional<jsonlite::JsonError> err;
  auto value = jsonlite::parse_value(body, &err);
  const auto* arr = jsonlite::as_array(value);
  if (err || !arr) {
    throw HarnessError(ErrorCode::json_parse_error,
                       "GET /nodes did not return a JSON array" +
                           (err ? ": " + err->message : std::string()));
  }
  std::vector<NodeRecord> out;
  out.reserve(arr->size());
  for (const auto& item : *arr) {
    if (const auto* obj = jsonlite::as_object(item)) out.push_back(node_from_json(*obj));
  }
  return out;
}

NodeRecord RestControlPlane::put_node_label(const std::string& node_id, const Label& label) {
  const std::string path = "/nodes/" + encode_path_segment(node_id) + "/label/" +
                           encode_path_segment(label.key) + "=" +
                           encode_path_segment(label.value);
  return node_from_json(parse_body("PUT", path, call(Method::put, path)));
}

NodeRecord RestControlPlane::delete_node_label(const std::string& node_id, const std::string& key) {
  const std::string path =
      "/nodes/" + encode_path_segment(node_id) + "/label/" + encode_path_segment(key);
  return node_from_json(parse_body("DELETE", path, call(Method::del, path)));
}

NodeRecord RestControlPlane::put_node_cordon(const std::string& node_id,
                                             const std::string& drain_label) {
  const std::string path =
      "/nodes/" + encode_path_segment(node_id) + "/cordon/" + encode_path_segment(drain_label);
  return node_from_json(parse_body("PUT", path, call(Method::put, path)));
}

NodeRecord RestControlPlane::delete_node_cordon(const std::string& node_id,
                                                const std::string& drain_label) {
  const std::string path =
      "/nodes/" + encode_path_segment(node_id) + "/cordon/" + encode_path_segment(drain_label);
  return node_from_json(parse_body("DELETE", path, call(Method::del, path)));
}

PoolRecord RestControlPlane::put_node_pool(const PoolSpec& pool) {
  const std::string path =
      "/nodes/" + encode_path_segment(pool.node) + "/pools/" + encode_path_segment(pool.id);
  return pool_from_json(parse_body("PUT", path, call(Method::put, path, pool_body_to_json(pool))));
}

VolumeRecord RestControlPlane::put_volume(const VolumeSpec& spec) {
  const std::string path = "/volumes/" + encode_path_segment(spec.uuid);
  return volume_from_json(
      parse_body("PUT", path, call(Method::put, path, volume_spec_to_json(spec))));
}

VolumeRecord RestControlPlane::put_volume_target(const std::string& volume_uuid,
                                                 const std::string& node_id,
                                                 Protocol protocol) {
  const std::string path = "/volumes/" + encode_path_segment(volume_uuid) + "/target";
  return volume_from_json(parse_body(
      "PUT", path, call(Method::put, path, publish_body_to_json(node_id, protocol))));
}

VolumeRecord RestControlPlane::get_volume(const std::string& volume_uuid) {
  const std::string path = "/volumes/" + encode_path_segment(volume_uuid);
  return volume_from_json(parse_body("GET", path, call(Method::get, path)));
}

VolumeRecord RestControlPlane::delete_volume_target(const std::string& volume_uuid) {
  const std::string path = "/volumes/" + encode_path_segment(volume_uuid) + "/target";
  return volume_from_json(parse_body("DELETE", path, call(Method::del, path)));
}

void RestControlPlane::delete_volume(const std::string& volume_uuid) {
  call(Method::del, "/volumes/" + encode_path_segment(volume_uuid));
}

}  // namespace switchover
