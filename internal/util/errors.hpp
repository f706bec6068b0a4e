#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace sqlvault::util {

/*
  Central error taxonomy.

  Engine internals throw the exception types below; the public engine
  operations translate them into an ErrorCode on their result objects.
*/

enum class ErrorCode {
  kOk = 0,

  kIoError,
  kIntegrity,
  kExecution,
  kNotFound,
  kInvalidConfig,

  kInternal
};

std::string_view ToString(ErrorCode code);

class IoError : public std::runtime_error {
 public:
  explicit IoError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Stored bytes do not match what the metadata promises.
class IntegrityError : public std::runtime_error {
 public:
  explicit IntegrityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExecutionError : public std::runtime_error {
 public:
  explicit ExecutionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace sqlvault::util
