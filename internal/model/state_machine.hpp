#pragma once

#include <array>

#include "internal/model/task_status.hpp"

namespace trailmap::model {

inline constexpr std::array<TaskStatus, 4> kAllStatuses = {
    TaskStatus::kOpen,
    TaskStatus::kInProgress,
    TaskStatus::kBlocked,
    TaskStatus::kClosed,
};

constexpr bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::kClosed;
}

/*
  Legal learner status transitions.

    open        -> in_progress, blocked
    in_progress -> open, blocked, closed
    blocked     -> open, in_progress
    closed      -> open (reopen, reason required)

  Staying in the same state is not a transition.
*/
constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  switch (from) {
    case TaskStatus::kOpen:
      return to == TaskStatus::kInProgress || to == TaskStatus::kBlocked;
    case TaskStatus::kInProgress:
      return to == TaskStatus::kOpen || to == TaskStatus::kBlocked || to == TaskStatus::kClosed;
    case TaskStatus::kBlocked:
      return to == TaskStatus::kOpen || to == TaskStatus::kInProgress;
    case TaskStatus::kClosed:
      return to == TaskStatus::kOpen;
  }
  return false;
}

constexpr bool IsReopen(TaskStatus from, TaskStatus to) {
  return IsTerminal(from) && to == TaskStatus::kOpen;
}

static_assert(CanTransition(TaskStatus::kOpen, TaskStatus::kInProgress));
static_assert(!CanTransition(TaskStatus::kOpen, TaskStatus::kClosed));
static_assert(!CanTransition(TaskStatus::kClosed, TaskStatus::kInProgress));

} // namespace trailmap::model
