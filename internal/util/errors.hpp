#pragma once

#include <stdexcept>
#include <string>

namespace kag::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The requested document set resolved to zero usable segments.
class NoContent : public std::runtime_error {
 public:
  explicit NoContent(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BuildError : public std::runtime_error {
 public:
  explicit BuildError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BuildTimeout : public BuildError {
 public:
  explicit BuildTimeout(const std::string& msg) : BuildError(msg) {
  }
};

// Never surfaced to callers: the document store turns it into an empty result.
class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace kag::util
