#pragma once

// switchover/errors.hpp - Error taxonomy.
//
//   ControlPlaneError - non-2xx REST response or transport failure (status 0).
//   InjectionError    - a fault could not be applied.
//   TimeoutError      - a convergence budget was exhausted.
//   AssertionFailure  - observed state differs from the expectation; carries
//                       both literal values.
//
// All derive from HarnessError, which carries the ErrorCode recorded in step
// reports and harness events.

#include <cstdint>
#include <stdexcept>
#include <string>

#include "switchover/types.hpp"

namespace switchover {

class HarnessError : public std::runtime_error {
 public:
  HarnessError(ErrorCode code, const std::string& message);

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

class ControlPlaneError : public HarnessError {
 public:
  ControlPlaneError(int status, const std::string& method,
                    const std::string& path, const std::string& message);

  // HTTP status, or 0 when the request never produced a response.
  int status() const noexcept { return status_; }
  const std::string& method() const noexcept { return method_; }
  const std::string& path() const noexcept { return path_; }
  const std::string& server_message() const noexcept { return message_; }

  bool is_not_found() const noexcept { return status_ == 404; }

 private:
  int status_;
  std::string method_;
  std::string path_;
  std::string message_;
};

class InjectionError : public HarnessError {
 public:
  InjectionError(const std::string& fault, const std::string& detail);

  const std::string& fault() const noexcept { return fault_; }

 private:
  std::string fault_;
};

class TimeoutError : public HarnessError {
 public:
  TimeoutError(const std::string& condition, uint32_t attempts,
               uint64_t elapsed_ms, const std::string& last_mismatch);

  const std::string& condition() const noexcept { return condition_; }
  uint32_t attempts() const noexcept { return attempts_; }
  uint64_t elapsed_ms() const noexcept { return elapsed_ms_; }
  const std::string& last_mismatch() const noexcept { return last_mismatch_; }

 private:
  std::string condition_;
  uint32_t attempts_;
  uint64_t elapsed_ms_;
  std::string last_mismatch_;
};

class AssertionFailure : public HarnessError {
 public:
  AssertionFailure(const std::string& what, const std::string& expected,
                   const std::string& observed);

  const std::string& expected() const noexcept { return expected_; }
  const std::string& observed() const noexcept { return observed_; }

 private:
  std::string expected_;
  std::string observed_;
};

// Throws AssertionFailure when expected != observed.
void assert_equal(const std::string& what, const std::string& expected,
                  const std::string& observed);

}  // namespace switchover
