#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace trailmap::model {

enum class TaskStatus : std::uint8_t {
  kOpen       = 0,
  kInProgress = 1,
  kBlocked    = 2,
  kClosed     = 3,
};

constexpr std::string_view ToString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kOpen:
      return "open";
    case TaskStatus::kInProgress:
      return "in_progress";
    case TaskStatus::kBlocked:
      return "blocked";
    case TaskStatus::kClosed:
      return "closed";
  }
  return "unknown";
}

constexpr std::optional<TaskStatus> ParseTaskStatus(std::string_view value) {
  if (value == "open") return TaskStatus::kOpen;
  if (value == "in_progress") return TaskStatus::kInProgress;
  if (value == "blocked") return TaskStatus::kBlocked;
  if (value == "closed") return TaskStatus::kClosed;
  return std::nullopt;
}

} // namespace trailmap::model
