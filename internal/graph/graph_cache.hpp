#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/model/dependency_record.hpp"
#include "internal/db/model/task_record.hpp"

namespace trailmap::graph {

/*
  Immutable view of one project's template graph.
  Holds tasks and outgoing edges only; progress is never cached.
*/
struct ProjectSnapshot {
  std::unordered_map<std::string, db::model::TaskRecord>                tasks;
  std::unordered_map<std::string, std::vector<db::model::DependencyRecord>> dependencies; // by task_id
  std::unordered_map<std::string, std::vector<std::string>>                tree_children; // by parent_id, sorted
  std::vector<db::model::TaskRecord>                                     ordered_tasks; // by id
  std::vector<db::model::DependencyRecord>                               ordered_edges; // by (task_id, depends_on_id, type)
};

/*
  GraphCache

  Read-through cache of per-project snapshots.

  Every project carries a generation that Invalidate() bumps. A reader
  takes the generation before it loads from the store and passes it to
  Put(); a snapshot loaded across an invalidation is discarded, so a write
  racing a load can never leave stale data behind.

  Task -> project hints survive invalidation.
*/
class GraphCache {
 public:
  std::shared_ptr<const ProjectSnapshot> Get(const std::string& project_id) const;

  uint64_t Generation(const std::string& project_id) const;

  // false if the project was invalidated since `generation` was read
  bool Put(const std::string& project_id, std::shared_ptr<const ProjectSnapshot> snapshot, uint64_t generation);

  void Invalidate(const std::string& project_id);

  // last project a snapshot placed the task in; a hint, verified by callers
  std::optional<std::string> ProjectOf(const std::string& task_id) const;

  void Clear();

 private:
  struct Entry {
    uint64_t                               generation = 0;
    std::shared_ptr<const ProjectSnapshot> snapshot;
  };

  mutable std::shared_mutex                    mutex_;
  std::unordered_map<std::string, Entry>       projects_;
  std::unordered_map<std::string, std::string> task_project_;
};

} // namespace trailmap::graph
