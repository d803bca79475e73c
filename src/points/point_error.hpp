#pragma once

#include <stdexcept>
#include <string>

namespace sim_points {

enum class ErrorCode {
  DuplicateInstance,
  NotFound,
  InvalidPriority,
  TypeMismatch,
  ReadOnly,
  InvalidDefinition
};

inline const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::DuplicateInstance:
    return "DuplicateInstance";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::InvalidPriority:
    return "InvalidPriority";
  case ErrorCode::TypeMismatch:
    return "TypeMismatch";
  case ErrorCode::ReadOnly:
    return "ReadOnly";
  case ErrorCode::InvalidDefinition:
    return "InvalidDefinition";
  }
  return "Unknown";
}

// Raised by the point model for caller-recoverable failures. The protocol
// handlers translate the code into a response status.
class PointError : public std::runtime_error {
public:
  PointError(ErrorCode code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

} // namespace sim_points
