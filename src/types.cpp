#include "switchover/types.hpp"

#include "switchover/errors.hpp"

namespace switchover {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none:
      return "none";
    case ErrorCode::control_plane_error:
      return "control_plane_error";
    case ErrorCode::transport_error:
      return "transport_error";
    case ErrorCode::injection_failed:
      return "injection_failed";
    case ErrorCode::timeout:
      return "timeout";
    case ErrorCode::assertion_failed:
      return "assertion_failed";
    case ErrorCode::json_parse_error:
      return "json_parse_error";
    case ErrorCode::spawn_failed:
      return "spawn_failed";
    case ErrorCode::not_found:
      return "not_found";
    case ErrorCode::config_invalid:
      return "config_invalid";
    case ErrorCode::teardown_failed:
      return "teardown_failed";
  }
  return "unknown";
}

std::string to_string(CordonState state) {
  switch (state) {
    case CordonState::uncordoned:
      return "uncordoned";
    case CordonState::cordoning:
      return "cordoning";
    case CordonState::cordoned:
      return "cordoned";
  }
  return "unknown";
}

std::string to_string(Protocol protocol) {
  switch (protocol) {
    case Protocol::none:
      return "none";
    case Protocol::nvmf:
      return "nvmf";
  }
  return "none";
}

std::optional<Label> parse_label(const std::string& text) {
  const auto eq = text.find('=');
  if (eq == std::string::npos || eq == 0) return std::nullopt;
  return Label{text.substr(0, eq), text.substr(eq + 1)};
}

std::string format_label(const Label& label) {
  return label.key + "=" + label.value;
}

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

HarnessError::HarnessError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

namespace {

std::string control_plane_message(int status, const std::string& method,
                                  const std::string& path,
                                  const std::string& message) {
  std::string out = method + " " + path + " failed";
  out += status == 0 ? " (no response)" : " with status " + std::to_string(status);
  if (!message.empty()) out += ": " + message;
  return out;
}

}  // namespace

ControlPlaneError::ControlPlaneError(int status, const std::string& method,
                                     const std::string& path,
                                     const std::string& message)
    : HarnessError(status == 0 ? ErrorCode::transport_error
                               : ErrorCode::control_plane_error,
                   control_plane_message(status, method, path, message)),
      status_(status),
      method_(method),
      path_(path),
      message_(message) {}

InjectionError::InjectionError(const std::string& fault, const std::string& detail)
    : HarnessError(ErrorCode::injection_failed,
                   "failed to inject " + fault + ": " + detail),
      fault_(fault) {}

TimeoutError::TimeoutError(const std::string& condition, uint32_t attempts,
                           uint64_t elapsed_ms, const std::string& last_mismatch)
    : HarnessError(ErrorCode::timeout,
                   "timed out waiting for " + condition + " after " +
                       std::to_string(attempts) + " attempts (" +
                       std::to_string(elapsed_ms) + "ms)" +
                       (last_mismatch.empty() ? "" : ": " + last_mismatch)),
      condition_(condition),
      attempts_(attempts),
      elapsed_ms_(elapsed_ms),
      last_mismatch_(last_mismatch) {}

AssertionFailure::AssertionFailure(const std::string& what,
                                   const std::string& expected,
                                   const std::string& observed)
    : HarnessError(ErrorCode::assertion_failed,
                   what + ": expected '" + expected + "', observed '" + observed + "'"),
      expected_(expected),
      observed_(observed) {}

void assert_equal(const std::string& what, const std::string& expected,
                  const std::string& observed) {
  if (expected != observed) throw AssertionFailure(what, expected, observed);
}

}  // namespace switchover
