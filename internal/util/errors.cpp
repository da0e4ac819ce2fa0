#include "internal/util/errors.hpp"

namespace trailmap::util {
namespace {

std::string Join(const std::vector<std::string>& ids, std::string_view separator) {
  std::string out;
  for (const auto& id : ids) {
    if (!out.empty()) out += separator;
    out += id;
  }
  return out;
}

} // namespace

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kCycleDetected:
      return "CycleDetected";
    case ErrorKind::kDuplicateDependency:
      return "DuplicateDependency";
    case ErrorKind::kInvalidTransition:
      return "InvalidTransition";
    case ErrorKind::kTaskNotFound:
      return "TaskNotFound";
    case ErrorKind::kDependencyNotFound:
      return "DependencyNotFound";
    case ErrorKind::kBlockedClosure:
      return "BlockedClosure";
    case ErrorKind::kValidationRequired:
      return "ValidationRequired";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
    case ErrorKind::kInternal:
      return "Internal";
  }
  return "Internal";
}

CycleDetected::CycleDetected(const std::string& msg, std::vector<std::string> path)
    : EngineError(ErrorKind::kCycleDetected, path.empty() ? msg : msg + " (path: " + Join(path, " -> ") + ")"), path_(std::move(path)) {
}

InvalidTransition::InvalidTransition(model::TaskStatus from, model::TaskStatus to)
    : EngineError(ErrorKind::kInvalidTransition,
                  "invalid status transition: " + std::string(model::ToString(from)) + " -> " + std::string(model::ToString(to))),
      from_(from),
      to_(to) {
}

BlockedClosure::BlockedClosure(const std::string& task_id, std::vector<std::string> open_children)
    : EngineError(ErrorKind::kBlockedClosure, "cannot close " + task_id + ": children not closed: " + Join(open_children, ", ")),
      open_children_(std::move(open_children)) {
}

ValidationRequired::ValidationRequired(const std::string& task_id, const std::string& reason)
    : EngineError(ErrorKind::kValidationRequired, "cannot close " + task_id + ": " + (reason.empty() ? "validation required" : reason)),
      reason_(reason) {
}

ErrorKind KindOf(const std::exception& e) {
  if (auto* engine = dynamic_cast<const EngineError*>(&e)) {
    return engine->Kind();
  }
  return ErrorKind::kInternal;
}

} // namespace trailmap::util
