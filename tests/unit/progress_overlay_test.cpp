#include "internal/progress/progress_overlay.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/graph_store.hpp"
#include "internal/progress/status_machine.hpp"

namespace {

using trailmap::db::model::TaskRecord;
using trailmap::model::TaskStatus;
using trailmap::model::TaskType;
using trailmap::progress::LearnerStatusView;
using trailmap::progress::ProgressOverlay;

struct Fixture {
  std::shared_ptr<trailmap::db::memory::MemoryRepository> repo    = std::make_shared<trailmap::db::memory::MemoryRepository>();
  std::shared_ptr<trailmap::graph::GraphStore>            graph   = std::make_shared<trailmap::graph::GraphStore>(repo);
  std::shared_ptr<ProgressOverlay>                        overlay = std::make_shared<ProgressOverlay>(repo);
  trailmap::progress::StatusMachine                       machine{graph, overlay, nullptr};

  Fixture() {
    auto       tx = repo->Begin();
    TaskRecord project;
    project.id   = "P";
    project.type = TaskType::kProject;
    graph->AddTask(*tx, project);
    for (const auto* id : {"A", "B"}) {
      TaskRecord task;
      task.id        = id;
      task.parent_id = "P";
      graph->AddTask(*tx, task);
    }
    tx->Commit();
  }

  void Move(const std::string& task_id, const std::string& learner_id, TaskStatus target) {
    auto tx = repo->Begin();
    machine.Apply(*tx, {task_id, learner_id, target, std::nullopt});
    tx->Commit();
  }
};

void TestAbsentRecordResolvesToOpen() {
  Fixture f;
  auto    tx     = f.repo->Begin();
  auto    record = f.overlay->GetOrDefault(*tx, "A", "learner-1");
  assert(record.status == TaskStatus::kOpen);
  assert(record.task_id == "A");
  assert(record.learner_id == "learner-1");
  assert(!record.started_at_ms && !record.completed_at_ms && !record.close_reason);

  // reading never materializes
  assert(!f.overlay->IsMaterialized(*tx, "A", "learner-1"));
  assert(f.overlay->ListMaterialized(*tx, "learner-1").empty());
  tx->Commit();

  auto resolved = ProgressOverlay::Resolve(std::nullopt, "B", "learner-2");
  assert(resolved.status == TaskStatus::kOpen);
}

void TestWritesArePerLearner() {
  Fixture f;
  f.Move("A", "learner-1", TaskStatus::kInProgress);

  auto tx = f.repo->Begin();
  assert(f.overlay->IsMaterialized(*tx, "A", "learner-1"));
  assert(f.overlay->GetOrDefault(*tx, "A", "learner-1").status == TaskStatus::kInProgress);
  assert(!f.overlay->IsMaterialized(*tx, "A", "learner-2"));
  assert(f.overlay->GetOrDefault(*tx, "A", "learner-2").status == TaskStatus::kOpen);

  auto rows = f.overlay->ListMaterialized(*tx, "learner-1", std::string("P"));
  assert(rows.size() == 1 && rows[0].task_id == "A");
  assert(f.overlay->ListMaterialized(*tx, "learner-1", std::string("other")).empty());
  tx->Commit();
}

void TestLearnerStatusViewAgreesWithOverlay() {
  Fixture f;
  f.Move("A", "learner-1", TaskStatus::kInProgress);
  f.Move("A", "learner-1", TaskStatus::kClosed);

  for (bool preload : {false, true}) {
    auto              tx = f.repo->Begin();
    LearnerStatusView view(*f.overlay, *tx, "learner-1");
    if (preload) view.Preload();

    assert(view.StatusOf("A") == TaskStatus::kClosed);
    assert(view.StatusOf("B") == TaskStatus::kOpen);
    assert(view.StatusOf("A") == f.overlay->GetOrDefault(*tx, "A", "learner-1").status);
    assert(view.LearnerId() == "learner-1");
    tx->Commit();
  }

  auto              tx = f.repo->Begin();
  LearnerStatusView other(*f.overlay, *tx, "learner-2");
  other.Preload();
  assert(other.StatusOf("A") == TaskStatus::kOpen);
  tx->Commit();
}

} // namespace

int main() {
  TestAbsentRecordResolvesToOpen();
  TestWritesArePerLearner();
  TestLearnerStatusViewAgreesWithOverlay();

  std::cout << "trailmap_unit_progress_overlay: pass\n";
  return 0;
}
