#pragma once

#include <stdexcept>
#include <string>

namespace trustnet::util {

/*
  Central error types.

  Malformed input records and solver failures are not exceptions: the former
  are counted by the builder, the latter become fallback selections.
*/

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InputError : public std::runtime_error {
 public:
  explicit InputError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExportError : public std::runtime_error {
 public:
  explicit ExportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace trustnet::util
