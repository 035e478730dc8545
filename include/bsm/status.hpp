#pragma once

#include <string>
#include <utility>

namespace bsm {

enum class ErrorCode {
  kOk = 0,
  kInvalidInput,
  kNonConvergence,
};

struct EngineStatus {
  ErrorCode code = ErrorCode::kOk;
  std::string message;

  bool ok() const { return code == ErrorCode::kOk; }
};

inline EngineStatus invalid_input(std::string message) {
  return EngineStatus{.code = ErrorCode::kInvalidInput, .message = std::move(message)};
}

inline EngineStatus non_convergence(std::string message) {
  return EngineStatus{.code = ErrorCode::kNonConvergence, .message = std::move(message)};
}

inline const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "OK";
    case ErrorCode::kInvalidInput:
      return "INVALID_INPUT";
    case ErrorCode::kNonConvergence:
      return "NON_CONVERGENCE";
  }
  return "UNKNOWN";
}

}  // namespace bsm
