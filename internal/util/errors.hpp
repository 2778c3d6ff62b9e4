#pragma once

#include <stdexcept>
#include <string>

namespace curator::util {

/*
  Central error types.

  Row-local failures are recovered into manifest rows by the discovery
  layer. Anything that reaches the caller is a whole-run failure.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IoError : public std::runtime_error {
 public:
  explicit IoError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ManifestReadError : public std::runtime_error {
 public:
  explicit ManifestReadError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ManifestWriteError : public std::runtime_error {
 public:
  explicit ManifestWriteError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace curator::util
