#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/task_status.hpp"

namespace trailmap::util {

/*
  Central error types.

  Every rejection the engine produces is a business rule, never a transient
  fault, so nothing here is retried. Callers surface Kind() and what() as-is.
*/

enum class ErrorKind {
  kCycleDetected,
  kDuplicateDependency,
  kInvalidTransition,
  kTaskNotFound,
  kDependencyNotFound,
  kBlockedClosure,
  kValidationRequired,
  kInvalidArgument,
  kInternal,
};

std::string_view ToString(ErrorKind kind);

class EngineError : public std::runtime_error {
 public:
  EngineError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind Kind() const {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

class CycleDetected : public EngineError {
 public:
  // path runs from the new edge's target back to its source
  CycleDetected(const std::string& msg, std::vector<std::string> path);

  const std::vector<std::string>& Path() const {
    return path_;
  }

 private:
  std::vector<std::string> path_;
};

class DuplicateDependency : public EngineError {
 public:
  explicit DuplicateDependency(const std::string& msg) : EngineError(ErrorKind::kDuplicateDependency, msg) {
  }
};

class InvalidTransition : public EngineError {
 public:
  InvalidTransition(model::TaskStatus from, model::TaskStatus to);

  model::TaskStatus From() const {
    return from_;
  }
  model::TaskStatus To() const {
    return to_;
  }

 private:
  model::TaskStatus from_;
  model::TaskStatus to_;
};

class TaskNotFound : public EngineError {
 public:
  explicit TaskNotFound(const std::string& task_id) : EngineError(ErrorKind::kTaskNotFound, "task not found: " + task_id) {
  }
};

class DependencyNotFound : public EngineError {
 public:
  explicit DependencyNotFound(const std::string& msg) : EngineError(ErrorKind::kDependencyNotFound, msg) {
  }
};

class BlockedClosure : public EngineError {
 public:
  BlockedClosure(const std::string& task_id, std::vector<std::string> open_children);

  const std::vector<std::string>& OpenChildren() const {
    return open_children_;
  }

 private:
  std::vector<std::string> open_children_;
};

class ValidationRequired : public EngineError {
 public:
  ValidationRequired(const std::string& task_id, const std::string& reason);

  const std::string& Reason() const {
    return reason_;
  }

 private:
  std::string reason_;
};

class InvalidArgument : public EngineError {
 public:
  explicit InvalidArgument(const std::string& msg) : EngineError(ErrorKind::kInvalidArgument, msg) {
  }
};

// kInternal for anything that is not an EngineError
ErrorKind KindOf(const std::exception& e);

} // namespace trailmap::util
