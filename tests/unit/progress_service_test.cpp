#include "internal/service/progress_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using trailmap::db::model::TaskRecord;
using trailmap::model::TaskStatus;
using trailmap::model::TaskType;
using trailmap::progress::CloseDecision;
using trailmap::progress::CloseValidator;

class SubmissionGate final : public CloseValidator {
 public:
  CloseDecision MayClose(const TaskRecord&, const std::string&) override {
    if (!accepted) return {false, "submission failed"};
    return {};
  }

  bool accepted = false;
};

// Looks up the learner's current status through the service while deciding.
class ReadBackGate final : public CloseValidator {
 public:
  CloseDecision MayClose(const TaskRecord& task, const std::string& learner_id) override {
    seen = progress->GetProgress(task.id, learner_id).status;
    return {};
  }

  trailmap::service::ProgressService* progress = nullptr;
  std::optional<TaskStatus>           seen;
};

struct Fixture {
  std::shared_ptr<SubmissionGate> gate = std::make_shared<SubmissionGate>();
  trailmap::factory::Runtime      runtime;

  Fixture() {
    runtime = trailmap::factory::BuildWithRepository(std::make_shared<trailmap::db::memory::MemoryRepository>(), false, 0, gate);
    Add("P", std::nullopt, TaskType::kProject);
    Add("Q", std::nullopt, TaskType::kProject);
    Add("A", "P", TaskType::kTask);
    Add("S", "A", TaskType::kSubtask);
    Add("B", "P", TaskType::kTask);
    Add("Q.1", "Q", TaskType::kTask);
  }

  void Add(const std::string& id, std::optional<std::string> parent, TaskType type) {
    TaskRecord task;
    task.id        = id;
    task.parent_id = std::move(parent);
    task.type      = type;
    runtime.curriculum->AddTask(task);
  }

  trailmap::service::ProgressService& Progress() {
    return *runtime.progress;
  }
};

void TestConvenienceWrappers() {
  Fixture f;
  auto    started = f.Progress().StartTask("B", "L");
  assert(started.status == TaskStatus::kInProgress);
  assert(started.started_at_ms);

  auto closed = f.Progress().CloseTask("B", "L", std::string("finished"));
  assert(closed.status == TaskStatus::kClosed);
  assert(closed.close_reason == std::optional<std::string>("finished"));

  auto reopened = f.Progress().ReopenTask("B", "L", "found a bug");
  assert(reopened.status == TaskStatus::kOpen);
  assert(!reopened.completed_at_ms && !reopened.close_reason);
  assert(reopened.reopen_reason == std::optional<std::string>("found a bug"));

  auto stored = f.Progress().GetProgress("B", "L");
  assert(stored.status == TaskStatus::kOpen);
  assert(stored.reopen_reason == reopened.reopen_reason);
}

void TestGetProgressDefaultsToOpen() {
  Fixture f;
  auto    record = f.Progress().GetProgress("A", "nobody");
  assert(record.status == TaskStatus::kOpen);
  assert(!record.started_at_ms);

  bool threw = false;
  try {
    f.Progress().GetProgress("missing", "nobody");
  } catch (const trailmap::util::TaskNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestRejectionsLeaveStatusUnchanged() {
  Fixture f;

  bool threw = false;
  try {
    f.Progress().CloseTask("B", "L");
  } catch (const trailmap::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);
  assert(f.Progress().GetProgress("B", "L").status == TaskStatus::kOpen);

  f.Progress().StartTask("B", "L");
  f.Progress().CloseTask("B", "L");
  threw = false;
  try {
    f.Progress().ReopenTask("B", "L", "");
  } catch (const trailmap::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(f.Progress().GetProgress("B", "L").status == TaskStatus::kClosed);

  threw = false;
  try {
    f.Progress().UpdateStatus("B", "L", TaskStatus::kOpen);
  } catch (const trailmap::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestSubtaskNeedsAcceptedSubmission() {
  Fixture f;
  f.Progress().StartTask("S", "L");

  bool threw = false;
  try {
    f.Progress().CloseTask("S", "L");
  } catch (const trailmap::util::ValidationRequired& e) {
    threw = e.Reason() == "submission failed";
  }
  assert(threw);
  assert(f.Progress().GetProgress("S", "L").status == TaskStatus::kInProgress);

  // the parent cannot close over an open subtask
  f.Progress().StartTask("A", "L");
  threw = false;
  try {
    f.Progress().CloseTask("A", "L");
  } catch (const trailmap::util::BlockedClosure& e) {
    threw = e.OpenChildren() == std::vector<std::string>{"S"};
  }
  assert(threw);

  f.gate->accepted = true;
  f.Progress().CloseTask("S", "L");
  assert(f.Progress().GetProgress("A", "L").status == TaskStatus::kInProgress);
  f.Progress().CloseTask("A", "L");
  assert(f.Progress().GetProgress("A", "L").status == TaskStatus::kClosed);
}

void TestValidatorCanReadProgress() {
  auto gate    = std::make_shared<ReadBackGate>();
  auto runtime = trailmap::factory::BuildWithRepository(std::make_shared<trailmap::db::memory::MemoryRepository>(), true, 0, gate);
  gate->progress = runtime.progress.get();

  auto add = [&](const std::string& id, std::optional<std::string> parent, TaskType type) {
    TaskRecord task;
    task.id        = id;
    task.parent_id = std::move(parent);
    task.type      = type;
    runtime.curriculum->AddTask(task);
  };
  add("P", std::nullopt, TaskType::kProject);
  add("A", "P", TaskType::kTask);
  add("S", "A", TaskType::kSubtask);

  runtime.progress->StartTask("S", "L");
  auto closed = runtime.progress->CloseTask("S", "L");
  assert(closed.status == TaskStatus::kClosed);
  assert(gate->seen == std::optional<TaskStatus>(TaskStatus::kInProgress));

  // plain tasks never reach the validator
  gate->seen.reset();
  runtime.progress->StartTask("A", "L");
  runtime.progress->CloseTask("A", "L");
  assert(!gate->seen);
}

void TestReopenOnlyFromClosed() {
  Fixture f;
  f.Progress().StartTask("B", "L");

  bool threw = false;
  try {
    f.Progress().ReopenTask("B", "L", "try again");
  } catch (const trailmap::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);
  auto stored = f.Progress().GetProgress("B", "L");
  assert(stored.status == TaskStatus::kInProgress);
  assert(!stored.reopen_reason);

  // blocked -> open is a legal move, just not a reopen
  f.Progress().UpdateStatus("B", "L", TaskStatus::kBlocked);
  threw = false;
  try {
    f.Progress().ReopenTask("B", "L", "try again");
  } catch (const trailmap::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);
  assert(f.Progress().UpdateStatus("B", "L", TaskStatus::kOpen).status == TaskStatus::kOpen);
}

void TestListLearnerTasksByStatus() {
  Fixture f;
  f.Progress().StartTask("B", "L");
  f.Progress().StartTask("A", "L");
  f.Progress().StartTask("Q.1", "L");
  f.Progress().UpdateStatus("B", "L", TaskStatus::kBlocked);
  f.Progress().StartTask("B", "M");

  auto ids = [](const std::vector<TaskRecord>& tasks) {
    std::vector<std::string> out;
    for (const auto& task : tasks) out.push_back(task.id);
    return out;
  };

  assert((ids(f.Progress().ListLearnerTasksByStatus("L", TaskStatus::kInProgress)) == std::vector<std::string>{"A", "Q.1"}));
  assert((ids(f.Progress().ListLearnerTasksByStatus("L", TaskStatus::kInProgress, std::string("P"))) == std::vector<std::string>{"A"}));
  assert((ids(f.Progress().ListLearnerTasksByStatus("L", TaskStatus::kBlocked)) == std::vector<std::string>{"B"}));
  assert((ids(f.Progress().ListLearnerTasksByStatus("M", TaskStatus::kInProgress)) == std::vector<std::string>{"B"}));

  // untouched tasks are open but not materialized
  assert(f.Progress().ListLearnerTasksByStatus("L", TaskStatus::kOpen).empty());
}

} // namespace

int main() {
  TestConvenienceWrappers();
  TestGetProgressDefaultsToOpen();
  TestRejectionsLeaveStatusUnchanged();
  TestSubtaskNeedsAcceptedSubmission();
  TestValidatorCanReadProgress();
  TestReopenOnlyFromClosed();
  TestListLearnerTasksByStatus();

  std::cout << "trailmap_unit_progress_service: pass\n";
  return 0;
}
