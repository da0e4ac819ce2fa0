#include "internal/blocking/blocking_resolver.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/progress/status_machine.hpp"
#include "internal/util/errors.hpp"

namespace {

using trailmap::blocking::BlockingResolver;
using trailmap::blocking::BlockingStatus;
using trailmap::db::model::DependencyRecord;
using trailmap::db::model::TaskRecord;
using trailmap::model::DependencyType;
using trailmap::model::TaskStatus;
using trailmap::model::TaskType;

using Ids = std::vector<std::string>;

struct Fixture {
  std::shared_ptr<trailmap::db::memory::MemoryRepository> repo     = std::make_shared<trailmap::db::memory::MemoryRepository>();
  std::shared_ptr<trailmap::graph::GraphStore>            graph    = std::make_shared<trailmap::graph::GraphStore>(repo);
  std::shared_ptr<trailmap::progress::ProgressOverlay>    overlay  = std::make_shared<trailmap::progress::ProgressOverlay>(repo);
  trailmap::progress::StatusMachine                       machine{graph, overlay, nullptr};
  BlockingResolver                                        resolver{graph, overlay};

  explicit Fixture(const Ids& task_ids) {
    auto       tx = repo->Begin();
    TaskRecord project;
    project.id   = "P";
    project.type = TaskType::kProject;
    graph->AddTask(*tx, project);
    for (const auto& id : task_ids) {
      TaskRecord task;
      task.id        = id;
      task.parent_id = "P";
      graph->AddTask(*tx, task);
    }
    tx->Commit();
  }

  void Edge(const std::string& from, const std::string& to, DependencyType type = DependencyType::kBlocks) {
    DependencyRecord edge;
    edge.task_id       = from;
    edge.depends_on_id = to;
    edge.type          = type;
    auto tx            = repo->Begin();
    graph->AddEdge(*tx, edge);
    tx->Commit();
  }

  void Close(const std::string& task_id, const std::string& learner_id) {
    auto tx = repo->Begin();
    machine.Apply(*tx, {task_id, learner_id, TaskStatus::kInProgress, std::nullopt});
    machine.Apply(*tx, {task_id, learner_id, TaskStatus::kClosed, std::nullopt});
    tx->Commit();
  }

  BlockingStatus IsBlocked(const std::string& task_id, const std::string& learner_id) {
    auto tx     = repo->Begin();
    auto status = resolver.IsBlocked(*tx, task_id, learner_id);
    tx->Commit();
    return status;
  }

  Ids Chain(const std::string& task_id, const std::string& learner_id) {
    auto tx    = repo->Begin();
    auto chain = resolver.BlockingChain(*tx, task_id, learner_id);
    tx->Commit();
    return chain;
  }
};

// T3 depends on T2, T2 depends on T1
void TestChainUnblocksOneStepAtATime() {
  Fixture f({"T1", "T2", "T3"});
  f.Edge("T2", "T1");
  f.Edge("T3", "T2");

  auto status = f.IsBlocked("T3", "L");
  assert(status.blocked);
  assert(status.blockers == Ids{"T2"});

  f.Close("T1", "L");
  status = f.IsBlocked("T3", "L");
  assert(status.blocked);
  assert(status.blockers == Ids{"T2"});
  assert(!f.IsBlocked("T2", "L").blocked);

  f.Close("T2", "L");
  status = f.IsBlocked("T3", "L");
  assert(!status.blocked);
  assert(status.blockers.empty());
}

void TestClosedDependencyStillBlockedUpstream() {
  Fixture f({"T1", "T2", "T3"});
  f.Edge("T2", "T1");
  f.Edge("T3", "T2");

  // the learner closed T2 while T1 was still open
  f.Close("T2", "L");

  auto status = f.IsBlocked("T3", "L");
  assert(status.blocked);
  assert(status.blockers == Ids{"T1"});
}

void TestLearnersAreIsolated() {
  Fixture f({"A", "B"});
  f.Edge("B", "A");

  const auto before = f.IsBlocked("B", "Y");
  f.Close("A", "X");

  assert(!f.IsBlocked("B", "X").blocked);
  const auto after = f.IsBlocked("B", "Y");
  assert(after.blocked == before.blocked);
  assert(after.blockers == before.blockers);
  assert(after.blockers == Ids{"A"});
}

void TestRelatedAndParentChildNeverBlock() {
  Fixture f({"A", "B", "C"});
  const auto before = f.IsBlocked("A", "L");

  f.Edge("A", "B", DependencyType::kRelated);
  f.Edge("A", "C", DependencyType::kParentChild);

  const auto after = f.IsBlocked("A", "L");
  assert(!before.blocked && !after.blocked);
  assert(f.Chain("A", "L").empty());
}

void TestBlockingChainIsBreadthFirstAndDeduplicated() {
  Fixture f({"A", "B", "C", "D", "E"});
  // A -> B -> D, A -> C -> D, D -> E
  f.Edge("A", "B");
  f.Edge("A", "C");
  f.Edge("B", "D");
  f.Edge("C", "D");
  f.Edge("D", "E");
  f.Close("C", "L");

  assert((f.Chain("A", "L") == Ids{"B", "D", "E"}));

  auto status = f.IsBlocked("A", "L");
  assert(status.blockers == Ids{"B"});
}

void TestMultipleDirectBlockers() {
  Fixture f({"A", "B", "C"});
  f.Edge("A", "B");
  f.Edge("A", "C");

  assert((f.IsBlocked("A", "L").blockers == Ids{"B", "C"}));
  f.Close("B", "L");
  assert((f.IsBlocked("A", "L").blockers == Ids{"C"}));
}

void TestUnknownTask() {
  Fixture f({"A"});
  bool    threw = false;
  try {
    f.IsBlocked("missing", "L");
  } catch (const trailmap::util::TaskNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestEvaluationFindsBlockedAncestor() {
  Fixture f({"A", "B"});
  {
    auto       tx = f.repo->Begin();
    TaskRecord child;
    child.id        = "B.1";
    child.parent_id = "B";
    f.graph->AddTask(*tx, child);
    tx->Commit();
  }
  f.Edge("B", "A");

  auto                                tx = f.repo->Begin();
  trailmap::progress::LearnerStatusView view(*f.overlay, *tx, "L");
  BlockingResolver::Evaluation          evaluation(f.resolver, *tx, view);

  auto child = f.graph->GetTask(*tx, "B.1");
  assert(!evaluation.Blocked("B.1"));
  auto ancestor = evaluation.BlockedAncestor(child);
  assert(ancestor && ancestor->id == "B");
  assert(!evaluation.BlockedAncestor(f.graph->GetTask(*tx, "A")));
  tx->Commit();
}

} // namespace

int main() {
  TestChainUnblocksOneStepAtATime();
  TestClosedDependencyStillBlockedUpstream();
  TestLearnersAreIsolated();
  TestRelatedAndParentChildNeverBlock();
  TestBlockingChainIsBreadthFirstAndDeduplicated();
  TestMultipleDirectBlockers();
  TestUnknownTask();
  TestEvaluationFindsBlockedAncestor();

  std::cout << "trailmap_unit_blocking_resolver: pass\n";
  return 0;
}
