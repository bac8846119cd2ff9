#include "switchover/jsonlite.hpp"

// Reader rules:
//   - Duplicate keys are rejected (json_duplicate_key). Neither the control
//     plane nor nvme-cli emits them.
//   - Non-negative integers are held as uint64 (sizes, capacities, counts).
//     Negative or fractional numbers are held as double.
//   - Nesting deeper than kMaxDepth is rejected instead of recursing further.
//   - Every error message carries the byte offset it was detected at.

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace switchover::jsonlite {

namespace {

constexpr int kMaxDepth = 64;

class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {}

  Value document() {
    Value v = value(0);
    skip_ws();
    if (!error_ && pos_ != text_.size()) fail("json_parse_error", "trailing data");
    return error_ ? Value{} : v;
  }

  const std::optional<JsonError>& error() const { return error_; }

 private:
  void fail(const char* code, const std::string& what) {
    if (error_) return;
    error_ = JsonError{code, what + " at offset " + std::to_string(pos_)};
  }

  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return text_[pos_]; }

  void skip_ws() {
    while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) ++pos_;
  }

  bool consume(char c) {
    skip_ws();
    if (at_end() || peek() != c) return false;
    ++pos_;
    return true;
  }

  bool literal(const char* word) {
    const std::string w(word);
    if (text_.compare(pos_, w.size(), w) != 0) return false;
    pos_ += w.size();
    return true;
  }

  Value value(int depth) {
    if (depth > kMaxDepth) {
      fail("json_parse_error", "nesting deeper than " + std::to_string(kMaxDepth));
      return {};
    }
    skip_ws();
    if (at_end()) {
      fail("json_parse_error", "unexpected end of input");
      return {};
    }
    switch (peek()) {
      case '{':
        return Value{object(depth + 1)};
      case '[':
        return Value{array(depth + 1)};
      case '"':
        return Value{read_string()};
      default:
        break;
    }
    if (literal("true")) return Value{true};
    if (literal("false")) return Value{false};
    if (literal("null")) return Value{nullptr};
    if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) return number();
    fail("json_parse_error", std::string("unexpected character '") + peek() + "'");
    return {};
  }

  Object object(int depth) {
    Object out;
    consume('{');
    if (consume('}')) return out;
    do {
      skip_ws();
      std::string key = read_string();
      if (error_) return out;
      if (out.count(key)) {
        fail("json_duplicate_key", "duplicate key '" + key + "'");
        return out;
      }
      if (!consume(':')) {
        fail("json_parse_error", "expected ':' after key '" + key + "'");
        return out;
      }
      Value v = value(depth);
      if (error_) return out;
      out.emplace(std::move(key), std::move(v));
    } while (consume(','));
    if (!consume('}')) fail("json_parse_error", "expected ',' or '}'");
    return out;
  }

  Array array(int depth) {
    Array out;
    consume('[');
    if (consume(']')) return out;
    do {
      out.push_back(value(depth));
      if (error_) return out;
    } while (consume(','));
    if (!consume(']')) fail("json_parse_error", "expected ',' or ']'");
    return out;
  }

  static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  }

  // Four hex digits after "\u", appended as UTF-8. Surrogate halves are
  // encoded individually.
  void unicode_escape(std::string& out) {
    if (pos_ + 4 > text_.size()) {
      fail("json_parse_error", "truncated \\u escape");
      return;
    }
    unsigned cp = 0;
    for (int k = 0; k < 4; ++k) {
      const int d = hex_value(text_[pos_++]);
      if (d < 0) {
        fail("json_parse_error", "bad hex digit in \\u escape");
        return;
      }
      cp = (cp << 4) | static_cast<unsigned>(d);
    }
    if (cp < 0x80) {
      out += static_cast<char>(cp);
    } else if (cp < 0x800) {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  std::string read_string() {
    std::string out;
    if (at_end() || peek() != '"') {
      fail("json_parse_error", "expected string");
      return out;
    }
    ++pos_;
    while (!at_end()) {
      const char c = text_[pos_++];
      if (c == '"') return out;
      if (c != '\\') {
        out += c;
        continue;
      }
      if (at_end()) break;
      const char e = text_[pos_++];
      switch (e) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'u':
          unicode_escape(out);
          if (error_) return {};
          break;
        default: out += e; break;
      }
    }
    fail("json_parse_error", "unterminated string");
    return {};
  }

  void digits() {
    while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
  }

  Value number() {
    const size_t start = pos_;
    const bool negative = peek() == '-';
    if (negative) ++pos_;
    if (at_end() || !std::isdigit(static_cast<unsigned char>(peek()))) {
      fail("json_parse_error", "expected digit");
      return {};
    }
    digits();
    bool integral = !negative;
    if (!at_end() && peek() == '.') {
      integral = false;
      ++pos_;
      if (at_end() || !std::isdigit(static_cast<unsigned char>(peek()))) {
        fail("json_parse_error", "expected digit after '.'");
        return {};
      }
      digits();
    }
    if (!at_end() && (peek() == 'e' || peek() == 'E')) {
      integral = false;
      ++pos_;
      if (!at_end() && (peek() == '+' || peek() == '-')) ++pos_;
      if (at_end() || !std::isdigit(static_cast<unsigned char>(peek()))) {
        fail("json_parse_error", "expected digit in exponent");
        return {};
      }
      digits();
    }
    const std::string token = text_.substr(start, pos_ - start);
    try {
      if (integral) return Value{static_cast<std::uint64_t>(std::stoull(token))};
      return Value{std::stod(token)};
    } catch (const std::out_of_range&) {
      fail("json_parse_error", "number out of range: " + token);
    } catch (const std::invalid_argument&) {
      fail("json_parse_error", "invalid number: " + token);
    }
    return {};
  }

  const std::string& text_;
  size_t pos_{0};
  std::optional<JsonError> error_;
};

void write_escaped(const std::string& s, std::string& out) {
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
}

// "%.6f" with trailing zeros trimmed; always keeps one digit after the point.
void write_double(double d, std::string& out) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) {
    out += "0.0";
    return;
  }
  std::string text(buf, static_cast<size_t>(n));
  while (text.back() == '0') text.pop_back();
  if (text.back() == '.') text += '0';
  out += text;
}

void write_value(const Value& v, std::string& out) {
  if (const auto* s = std::get_if<std::string>(&v.v)) {
    out += '"';
    write_escaped(*s, out);
    out += '"';
  } else if (const auto* obj = std::get_if<Object>(&v.v)) {
    out += '{';
    bool first = true;
    for (const auto& [k, child] : *obj) {
      if (!first) out += ',';
      first = false;
      out += '"';
      write_escaped(k, out);
      out += "\":";
      write_value(child, out);
    }
    out += '}';
  } else if (const auto* arr = std::get_if<Array>(&v.v)) {
    out += '[';
    for (size_t i = 0; i < arr->size(); ++i) {
      if (i) out += ',';
      write_value((*arr)[i], out);
    }
    out += ']';
  } else if (const auto* u = std::get_if<std::uint64_t>(&v.v)) {
    out += std::to_string(*u);
  } else if (const auto* d = std::get_if<double>(&v.v)) {
    write_double(*d, out);
  } else if (const auto* b = std::get_if<bool>(&v.v)) {
    out += *b ? "true" : "false";
  } else {
    out += "null";
  }
}

// Member of obj under key when it holds a T, else nullptr.
template <typename T>
const T* member(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : std::get_if<T>(&it->second.v);
}

}  // namespace

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Reader r(text);
  Value v = r.document();
  if (error) *error = r.error();
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value v = parse_value(text, &err);
  const auto* obj = std::get_if<Object>(&v.v);
  if (!err && !obj) err = JsonError{"json_parse_error", "top-level value is not an object"};
  if (error) *error = err;
  return err ? Object{} : std::move(*std::get_if<Object>(&v.v));
}

std::string to_json(const Value& v) {
  std::string out;
  write_value(v, out);
  return out;
}

std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  write_escaped(s, out);
  return out;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* s = member<std::string>(obj, key);
  return s ? *s : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* b = member<bool>(obj, key);
  return b ? *b : def;
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const auto* u = member<std::uint64_t>(obj, key);
  return u ? *u : def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  if (const auto* arr = member<Array>(obj, key)) {
    for (const auto& item : *arr) {
      if (const auto* s = std::get_if<std::string>(&item.v)) out.push_back(*s);
    }
  }
  return out;
}

std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  if (const auto* o = member<Object>(obj, key)) {
    for (const auto& [k, v] : *o) {
      if (const auto* s = std::get_if<std::string>(&v.v)) out[k] = *s;
    }
  }
  return out;
}

const Object* get_object(const Object& obj, const std::string& key) {
  return member<Object>(obj, key);
}

const Array* get_array(const Object& obj, const std::string& key) {
  return member<Array>(obj, key);
}

}  // namespace switchover::jsonlite
