#include "internal/model/state_machine.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <utility>

#include "internal/model/dependency_type.hpp"
#include "internal/model/task_type.hpp"

namespace {

using trailmap::model::TaskStatus;

void TestTransitionTableMatchesLegalPairs() {
  const std::set<std::pair<TaskStatus, TaskStatus>> legal = {
      {TaskStatus::kOpen, TaskStatus::kInProgress},   {TaskStatus::kOpen, TaskStatus::kBlocked},
      {TaskStatus::kInProgress, TaskStatus::kOpen},   {TaskStatus::kInProgress, TaskStatus::kBlocked},
      {TaskStatus::kInProgress, TaskStatus::kClosed}, {TaskStatus::kBlocked, TaskStatus::kOpen},
      {TaskStatus::kBlocked, TaskStatus::kInProgress}, {TaskStatus::kClosed, TaskStatus::kOpen},
  };

  for (auto from : trailmap::model::kAllStatuses) {
    for (auto to : trailmap::model::kAllStatuses) {
      assert(trailmap::model::CanTransition(from, to) == legal.contains({from, to}));
    }
  }
}

void TestOnlyClosedToOpenIsReopen() {
  for (auto from : trailmap::model::kAllStatuses) {
    for (auto to : trailmap::model::kAllStatuses) {
      const bool expected = from == TaskStatus::kClosed && to == TaskStatus::kOpen;
      assert(trailmap::model::IsReopen(from, to) == expected);
    }
  }
  assert(trailmap::model::IsTerminal(TaskStatus::kClosed));
  assert(!trailmap::model::IsTerminal(TaskStatus::kBlocked));
}

void TestNamesParseBack() {
  for (auto status : trailmap::model::kAllStatuses) {
    auto parsed = trailmap::model::ParseTaskStatus(trailmap::model::ToString(status));
    assert(parsed && *parsed == status);
  }
  assert(trailmap::model::ToString(TaskStatus::kInProgress) == "in_progress");
  assert(!trailmap::model::ParseTaskStatus("done"));

  assert(trailmap::model::ParseDependencyType("parent_child") == trailmap::model::DependencyType::kParentChild);
  assert(!trailmap::model::IsBlockingType(trailmap::model::DependencyType::kRelated));
  assert(trailmap::model::IsBlockingType(trailmap::model::DependencyType::kParentChild));

  assert(trailmap::model::ParseTaskType("subtask") == trailmap::model::TaskType::kSubtask);
  assert(trailmap::model::IsValidPriority(0) && trailmap::model::IsValidPriority(4));
  assert(!trailmap::model::IsValidPriority(5) && !trailmap::model::IsValidPriority(-1));
}

} // namespace

int main() {
  TestTransitionTableMatchesLegalPairs();
  TestOnlyClosedToOpenIsReopen();
  TestNamesParseBack();

  std::cout << "trailmap_unit_state_machine: pass\n";
  return 0;
}
