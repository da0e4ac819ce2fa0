#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace trailmap::model {

enum class TaskType : std::uint8_t {
  kProject = 0,
  kEpic    = 1,
  kTask    = 2,
  kSubtask = 3,
};

constexpr std::string_view ToString(TaskType type) {
  switch (type) {
    case TaskType::kProject:
      return "project";
    case TaskType::kEpic:
      return "epic";
    case TaskType::kTask:
      return "task";
    case TaskType::kSubtask:
      return "subtask";
  }
  return "unknown";
}

constexpr std::optional<TaskType> ParseTaskType(std::string_view value) {
  if (value == "project") return TaskType::kProject;
  if (value == "epic") return TaskType::kEpic;
  if (value == "task") return TaskType::kTask;
  if (value == "subtask") return TaskType::kSubtask;
  return std::nullopt;
}

// 0 is most urgent
inline constexpr int kMinPriority = 0;
inline constexpr int kMaxPriority = 4;

constexpr bool IsValidPriority(int priority) {
  return priority >= kMinPriority && priority <= kMaxPriority;
}

} // namespace trailmap::model
