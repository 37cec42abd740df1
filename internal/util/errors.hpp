#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace jobsrv::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Concurrent transitions kept colliding past the configured attempt budget.
class TransitionConflict : public std::runtime_error {
 public:
  explicit TransitionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Submission rejected before any state was created.
*/
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class GraphCycleError : public ValidationError {
 public:
  GraphCycleError(const std::string& msg, std::vector<std::string> members) : ValidationError(msg), members_(std::move(members)) {
  }

  // Projects on the cycle, in traversal order.
  const std::vector<std::string>& Members() const {
    return members_;
  }

 private:
  std::vector<std::string> members_;
};

class DuplicateProjectError : public ValidationError {
 public:
  explicit DuplicateProjectError(const std::string& msg) : ValidationError(msg) {
  }
};

class MalformedGraphError : public ValidationError {
 public:
  explicit MalformedGraphError(const std::string& msg) : ValidationError(msg) {
  }
};

} // namespace jobsrv::util
