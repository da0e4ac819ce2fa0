#include "internal/service/readiness_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using trailmap::db::model::TaskRecord;
using trailmap::model::DependencyType;
using trailmap::model::TaskStatus;
using trailmap::model::TaskType;
using trailmap::readiness::ReadyQuery;
using trailmap::service::AddDependencyRequest;

using Ids = std::vector<std::string>;

// P
// +-- T1
// +-- T2          depends on T1
// +-- T3          depends on T2
// +-- E (epic)    depends on T3
//     +-- E.1
//     +-- E.2     related to T1
struct Fixture {
  trailmap::factory::Runtime runtime;

  Fixture(bool cached, std::size_t default_limit) {
    runtime = trailmap::factory::BuildWithRepository(std::make_shared<trailmap::db::memory::MemoryRepository>(), cached, default_limit);
    Add("P", std::nullopt, TaskType::kProject, 4);
    Add("T1", "P", TaskType::kTask, 1);
    Add("T2", "P", TaskType::kTask, 1);
    Add("T3", "P", TaskType::kTask, 1);
    Add("E", "P", TaskType::kEpic, 0);
    Add("E.1", "E", TaskType::kTask, 0);
    Add("E.2", "E", TaskType::kTask, 0);

    Depend("T2", "T1", DependencyType::kBlocks);
    Depend("T3", "T2", DependencyType::kBlocks);
    Depend("E", "T3", DependencyType::kBlocks);
    Depend("E.2", "T1", DependencyType::kRelated);
  }

  void Add(const std::string& id, std::optional<std::string> parent, TaskType type, int priority) {
    TaskRecord task;
    task.id        = id;
    task.parent_id = std::move(parent);
    task.type      = type;
    task.priority  = priority;
    runtime.curriculum->AddTask(task);
  }

  void Depend(const std::string& from, const std::string& to, DependencyType type) {
    runtime.dependencies->AddDependency(AddDependencyRequest{from, to, type, "fixture"});
  }

  void Finish(const std::string& task_id, const std::string& learner_id) {
    runtime.progress->StartTask(task_id, learner_id);
    runtime.progress->CloseTask(task_id, learner_id);
  }

  Ids Ready(const std::string& learner_id, std::size_t limit = 0) {
    Ids ids;
    for (const auto& ranked : runtime.readiness->GetReadyWork(ReadyQuery{"P", learner_id, std::nullopt, limit})) {
      ids.push_back(ranked.task.id);
    }
    return ids;
  }

  trailmap::service::ReadinessService& Readiness() {
    return *runtime.readiness;
  }
};

void TestChainScenario(bool cached) {
  Fixture f(cached, 0);

  auto status = f.Readiness().IsTaskBlocked("T3", "L");
  assert(status.blocked && status.blockers == Ids{"T2"});
  assert((f.Readiness().GetBlockingChain("T3", "L") == Ids{"T2", "T1"}));

  f.Finish("T1", "L");
  status = f.Readiness().IsTaskBlocked("T3", "L");
  assert(status.blocked && status.blockers == Ids{"T2"});

  f.Finish("T2", "L");
  assert(!f.Readiness().IsTaskBlocked("T3", "L").blocked);
  assert(f.Readiness().IsTaskReady("T3", "L"));

  // learner M has done nothing
  assert(f.Readiness().IsTaskBlocked("T3", "M").blocked);
  assert(!f.Readiness().IsTaskReady("T3", "M"));
}

void TestRelatedEdgeChangesNothing(bool cached) {
  Fixture f(cached, 0);
  assert(!f.Readiness().IsTaskBlocked("E.2", "L").blocked);
  assert(f.Readiness().IsTaskBlocked("E.2", "L").blockers.empty());
}

void TestReadyWorkAndInheritedBlocking(bool cached) {
  Fixture f(cached, 0);

  // E is blocked by T3, so E.1 and E.2 wait too
  assert((f.Ready("L") == Ids{"T1", "P"}));
  assert(!f.Readiness().IsTaskReady("E.1", "L"));
  assert(!f.Readiness().IsTaskBlocked("E.1", "L").blocked);

  auto blocked = f.Readiness().GetBlockedTasks("P", "L");
  assert(blocked.size() == 5);
  assert(blocked[0].task.id == "E" && blocked[0].blockers == Ids{"T3"} && !blocked[0].inherited_from);
  assert(blocked[1].task.id == "E.1" && blocked[1].inherited_from == std::optional<std::string>("E"));
  assert(blocked[1].blockers == Ids{"T3"});
  assert(blocked[2].task.id == "E.2" && blocked[2].inherited_from == std::optional<std::string>("E"));
  assert(blocked[3].task.id == "T2" && blocked[3].blockers == Ids{"T1"});
  assert(blocked[4].task.id == "T3" && blocked[4].blockers == Ids{"T2"});

  f.Finish("T1", "L");
  f.Finish("T2", "L");
  f.Finish("T3", "L");
  assert((f.Ready("L") == Ids{"E", "E.1", "E.2", "P"}));
  assert(f.Readiness().GetBlockedTasks("P", "L").empty());

  // read idempotence
  assert(f.Ready("L") == f.Ready("L"));
}

void TestLearnerMarkedBlockedIsListed(bool cached) {
  Fixture f(cached, 0);
  f.runtime.progress->UpdateStatus("T1", "L", TaskStatus::kBlocked);

  auto blocked = f.Readiness().GetBlockedTasks("P", "L");
  assert(blocked.size() == 6);
  assert(blocked[3].task.id == "T1");
  assert(blocked[3].blockers.empty());
  assert(!blocked[3].inherited_from);

  // another learner's view is untouched
  for (const auto& entry : f.Readiness().GetBlockedTasks("P", "M")) {
    assert(entry.task.id != "T1");
  }
}

void TestDefaultLimitApplies(bool cached) {
  Fixture f(cached, 1);
  assert((f.Ready("L") == Ids{"T1"}));
  assert((f.Ready("L", 5) == Ids{"T1", "P"}));
}

void TestUnknownTaskIsReported(bool cached) {
  Fixture f(cached, 0);
  bool    threw = false;
  try {
    f.Readiness().IsTaskReady("nope", "L");
  } catch (const trailmap::util::TaskNotFound&) {
    threw = true;
  }
  assert(threw);
}

void RunAll(bool cached) {
  TestChainScenario(cached);
  TestRelatedEdgeChangesNothing(cached);
  TestReadyWorkAndInheritedBlocking(cached);
  TestLearnerMarkedBlockedIsListed(cached);
  TestDefaultLimitApplies(cached);
  TestUnknownTaskIsReported(cached);
}

} // namespace

int main() {
  RunAll(false);
  RunAll(true);

  std::cout << "trailmap_unit_readiness_service: pass\n";
  return 0;
}
