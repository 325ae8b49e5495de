#pragma once

#include <stdexcept>
#include <string>

namespace famgraph::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateEdge : public std::runtime_error {
 public:
  explicit DuplicateEdge(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The in-memory mutation committed but the durable write did not.
class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace famgraph::util
