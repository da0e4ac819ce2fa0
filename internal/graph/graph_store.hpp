#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/graph/graph_cache.hpp"

namespace trailmap::graph {

/*
  GraphStore

  Template layer: tasks and typed edges shared by every learner.

  All reads go through the caller's transaction. With a GraphCache attached,
  task and outgoing-edge lookups are served from per-project snapshots;
  dependents and anything learner-scoped always hit the repository.

  AddEdge is a raw insert. Callers that add blocking edges run CycleGuard
  first, inside the same transaction.

  Reads a writer makes after its first write can cache uncommitted state.
  Every template write must therefore hold a GraphWriteGuard that outlives
  its transaction.
*/
class GraphStore {
 public:
  explicit GraphStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<GraphCache> cache = nullptr);

  db::Repository& Store() const {
    return *repository_;
  }

  bool CacheEnabled() const {
    return cache_ != nullptr;
  }

  // Validates and inserts; returns the stored record (defaults filled in).
  db::model::TaskRecord AddTask(db::Transaction& tx, db::model::TaskRecord task);

  void AddEdge(db::Transaction& tx, const db::model::DependencyRecord& edge);
  void RemoveEdge(db::Transaction& tx, const std::string& task_id, const std::string& depends_on_id, trailmap::model::DependencyType type);

  std::optional<db::model::TaskRecord> FindTask(db::Transaction& tx, const std::string& task_id);

  // throws util::TaskNotFound
  db::model::TaskRecord GetTask(db::Transaction& tx, const std::string& task_id);

  std::vector<db::model::DependencyRecord> DependenciesOf(db::Transaction& tx, const std::string& task_id,
                                                          std::optional<trailmap::model::DependencyType> type = std::nullopt);
  std::vector<db::model::DependencyRecord> DependentsOf(db::Transaction& tx, const std::string& task_id,
                                                        std::optional<trailmap::model::DependencyType> type = std::nullopt);

  // tree children plus explicit PARENT_CHILD targets, sorted, unique
  std::vector<std::string> ChildrenOf(db::Transaction& tx, const std::string& task_id);

  // parent chain, nearest first
  std::vector<db::model::TaskRecord> AncestorsOf(db::Transaction& tx, const std::string& task_id);

  std::size_t DepthOf(db::Transaction& tx, const std::string& task_id);

  std::vector<db::model::TaskRecord>       TasksInProject(db::Transaction& tx, const std::string& project_id);
  std::vector<db::model::DependencyRecord> EdgesInProject(db::Transaction& tx, const std::string& project_id);
  std::vector<std::string>                 Projects(db::Transaction& tx);

  // Drops cached snapshots. Writers call it again once their transaction ends.
  void InvalidateProject(const std::string& project_id);

 private:
  std::shared_ptr<const ProjectSnapshot> Snapshot(db::Transaction& tx, const std::string& project_id);
  std::shared_ptr<const ProjectSnapshot> SnapshotForTask(db::Transaction& tx, const std::string& task_id);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<GraphCache>     cache_;
};

/*
  Invalidates every project touched by a template write when the write's
  transaction is over, whether it committed or not.
*/
class GraphWriteGuard {
 public:
  explicit GraphWriteGuard(GraphStore& graph) : graph_(graph) {
  }
  ~GraphWriteGuard() {
    for (const auto& project_id : touched_) graph_.InvalidateProject(project_id);
  }

  GraphWriteGuard(const GraphWriteGuard&)            = delete;
  GraphWriteGuard& operator=(const GraphWriteGuard&) = delete;

  void Touch(const std::string& project_id) {
    touched_.insert(project_id);
  }

 private:
  GraphStore&           graph_;
  std::set<std::string> touched_;
};

} // namespace trailmap::graph
