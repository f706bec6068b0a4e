#include "errors.hpp"

namespace sqlvault::util {

std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kIoError:
      return "io_error";
    case ErrorCode::kIntegrity:
      return "integrity";
    case ErrorCode::kExecution:
      return "execution";
    case ErrorCode::kNotFound:
      return "not_found";
    case ErrorCode::kInvalidConfig:
      return "invalid_config";
    case ErrorCode::kInternal:
      return "internal";
  }
  return "unknown";
}

} // namespace sqlvault::util
