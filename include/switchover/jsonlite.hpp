#pragma once

// switchover/jsonlite.hpp - Minimal JSON reader/writer.
//
// Used for three payload families: control-plane REST bodies, nvme-cli JSON
// output and the harness's own reports/events. Objects keep keys sorted
// (std::map), so to_json() output is stable for a given value.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace switchover::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v{nullptr};
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse any JSON value. On error returns null and sets *error when given.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON object. Returns an empty object when the text is invalid or the
// top-level value is not an object.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string escape(const std::string& s);

// Type-safe extractors. Missing keys or mismatched types yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);

// Nested access. Returns nullptr when the key is absent or not of that type.
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

inline const Object* as_object(const Value& v) { return std::get_if<Object>(&v.v); }
inline const Array* as_array(const Value& v) { return std::get_if<Array>(&v.v); }

}  // namespace switchover::jsonlite
