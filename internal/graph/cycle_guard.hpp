#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/graph/graph_store.hpp"

namespace trailmap::graph {

/*
  CycleGuard

  Keeps the blocking subgraph (BLOCKS + PARENT_CHILD) acyclic.

  FindCyclePath is the insert-time check: a BFS from the candidate target
  over existing blocking edges looking for the candidate source. It runs
  inside the inserting transaction, after the project graph lock, and reads
  edges from the repository rather than the template cache.

  DetectCycles is the audit pass: Tarjan's SCC over a whole project.
  It is never called on a learner-facing path.
*/
class CycleGuard {
 public:
  explicit CycleGuard(std::shared_ptr<GraphStore> graph);

  // Path target ... source that the edge source -> target would close.
  // A self-edge yields {source}.
  std::optional<std::vector<std::string>> FindCyclePath(db::Transaction& tx, const std::string& source_id, const std::string& target_id) const;

  bool WouldCreateCycle(db::Transaction& tx, const std::string& source_id, const std::string& target_id) const {
    return FindCyclePath(tx, source_id, target_id).has_value();
  }

  // Every strongly connected component with more than one task, plus any
  // self-loop. Members sorted by id, components sorted.
  std::vector<std::vector<std::string>> DetectCycles(db::Transaction& tx, const std::string& project_id) const;

 private:
  std::shared_ptr<GraphStore> graph_;
};

} // namespace trailmap::graph
