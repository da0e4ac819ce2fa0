#include "internal/graph/graph_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace trailmap::graph {

using trailmap::model::DependencyType;

namespace {

std::vector<db::model::DependencyRecord> FilterByType(std::vector<db::model::DependencyRecord> edges, std::optional<DependencyType> type) {
  if (type) {
    std::erase_if(edges, [&](const auto& edge) { return edge.type != *type; });
  }
  return edges;
}

} // namespace

GraphStore::GraphStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<GraphCache> cache)
    : repository_(std::move(repository)), cache_(std::move(cache)) {
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

db::model::TaskRecord GraphStore::AddTask(db::Transaction& tx, db::model::TaskRecord task) {
  if (task.id.empty()) {
    throw util::InvalidArgument("task id is required");
  }
  if (!model::IsValidPriority(task.priority)) {
    throw util::InvalidArgument("priority must be between 0 and 4: " + std::to_string(task.priority));
  }
  if (task.parent_id && task.parent_id->empty()) {
    task.parent_id.reset();
  }

  if (task.parent_id) {
    auto parent = FindTask(tx, *task.parent_id);
    if (!parent) {
      throw util::TaskNotFound(*task.parent_id);
    }
    if (task.project_id.empty()) {
      task.project_id = parent->project_id;
    } else if (task.project_id != parent->project_id) {
      throw util::InvalidArgument("task " + task.id + " and parent " + parent->id + " belong to different projects");
    }
  }

  if (task.project_id.empty()) {
    if (task.type != model::TaskType::kProject) {
      throw util::InvalidArgument("project id is required for " + task.id);
    }
    task.project_id = task.id;
  }

  if (task.created_at_ms == 0) {
    task.created_at_ms = util::NowMillis();
  }

  auto result = repository_->InsertTask(tx, task);
  if (result.code == db::ErrorCode::AlreadyExists) {
    throw util::InvalidArgument("task already exists: " + task.id);
  }
  if (!result) {
    throw std::runtime_error("insert task " + task.id + ": " + result.message);
  }

  InvalidateProject(task.project_id);
  return task;
}

void GraphStore::AddEdge(db::Transaction& tx, const db::model::DependencyRecord& edge) {
  auto result = repository_->InsertDependency(tx, edge);
  if (result.code == db::ErrorCode::AlreadyExists) {
    throw util::DuplicateDependency("dependency already exists: " + edge.task_id + " -> " + edge.depends_on_id + " (" +
                                    std::string(model::ToString(edge.type)) + ")");
  }
  if (!result) {
    throw std::runtime_error("insert dependency " + edge.task_id + " -> " + edge.depends_on_id + ": " + result.message);
  }

  if (auto source = FindTask(tx, edge.task_id)) {
    InvalidateProject(source->project_id);
  }
}

void GraphStore::RemoveEdge(db::Transaction& tx, const std::string& task_id, const std::string& depends_on_id, DependencyType type) {
  auto result = repository_->DeleteDependency(tx, task_id, depends_on_id, type);
  if (result.code == db::ErrorCode::NotFound) {
    throw util::DependencyNotFound("no " + std::string(model::ToString(type)) + " dependency " + task_id + " -> " + depends_on_id);
  }
  if (!result) {
    throw std::runtime_error("delete dependency " + task_id + " -> " + depends_on_id + ": " + result.message);
  }

  if (auto source = FindTask(tx, task_id)) {
    InvalidateProject(source->project_id);
  }
}

void GraphStore::InvalidateProject(const std::string& project_id) {
  if (cache_) cache_->Invalidate(project_id);
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

std::shared_ptr<const ProjectSnapshot> GraphStore::Snapshot(db::Transaction& tx, const std::string& project_id) {
  if (!cache_) return nullptr;
  if (auto cached = cache_->Get(project_id)) return cached;

  const auto generation = cache_->Generation(project_id);

  auto snapshot           = std::make_shared<ProjectSnapshot>();
  snapshot->ordered_tasks = repository_->ListTasksByProject(tx, project_id);
  snapshot->ordered_edges = repository_->ListDependenciesByProject(tx, project_id);

  for (const auto& task : snapshot->ordered_tasks) {
    snapshot->tasks.emplace(task.id, task);
    if (task.parent_id) snapshot->tree_children[*task.parent_id].push_back(task.id);
  }
  for (const auto& edge : snapshot->ordered_edges) {
    snapshot->dependencies[edge.task_id].push_back(edge);
  }

  cache_->Put(project_id, snapshot, generation);
  return snapshot;
}

std::shared_ptr<const ProjectSnapshot> GraphStore::SnapshotForTask(db::Transaction& tx, const std::string& task_id) {
  if (!cache_) return nullptr;

  if (auto hint = cache_->ProjectOf(task_id)) {
    auto snapshot = Snapshot(tx, *hint);
    if (snapshot->tasks.contains(task_id)) return snapshot;
  }

  auto task = repository_->GetTask(tx, task_id);
  if (!task) return nullptr;
  return Snapshot(tx, task->project_id);
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<db::model::TaskRecord> GraphStore::FindTask(db::Transaction& tx, const std::string& task_id) {
  if (auto snapshot = SnapshotForTask(tx, task_id)) {
    auto it = snapshot->tasks.find(task_id);
    if (it != snapshot->tasks.end()) return it->second;
  }
  return repository_->GetTask(tx, task_id);
}

db::model::TaskRecord GraphStore::GetTask(db::Transaction& tx, const std::string& task_id) {
  auto task = FindTask(tx, task_id);
  if (!task) throw util::TaskNotFound(task_id);
  return *task;
}

std::vector<db::model::DependencyRecord> GraphStore::DependenciesOf(db::Transaction& tx, const std::string& task_id,
                                                                    std::optional<DependencyType> type) {
  if (auto snapshot = SnapshotForTask(tx, task_id)) {
    auto it = snapshot->dependencies.find(task_id);
    if (it == snapshot->dependencies.end()) return {};
    return FilterByType(it->second, type);
  }
  return FilterByType(repository_->GetDependencies(tx, task_id), type);
}

std::vector<db::model::DependencyRecord> GraphStore::DependentsOf(db::Transaction& tx, const std::string& task_id,
                                                                  std::optional<DependencyType> type) {
  // sources may live in other projects, so no snapshot covers this
  return FilterByType(repository_->GetDependents(tx, task_id), type);
}

std::vector<std::string> GraphStore::ChildrenOf(db::Transaction& tx, const std::string& task_id) {
  std::vector<std::string> children;

  auto snapshot = SnapshotForTask(tx, task_id);
  if (snapshot) {
    if (auto it = snapshot->tree_children.find(task_id); it != snapshot->tree_children.end()) {
      children = it->second;
    }
  } else {
    for (const auto& child : repository_->ListChildTasks(tx, task_id)) {
      children.push_back(child.id);
    }
  }

  for (const auto& edge : DependenciesOf(tx, task_id, DependencyType::kParentChild)) {
    children.push_back(edge.depends_on_id);
  }

  std::sort(children.begin(), children.end());
  children.erase(std::unique(children.begin(), children.end()), children.end());
  return children;
}

std::vector<db::model::TaskRecord> GraphStore::AncestorsOf(db::Transaction& tx, const std::string& task_id) {
  std::vector<db::model::TaskRecord> ancestors;
  std::unordered_set<std::string>    visited{task_id};

  auto current = GetTask(tx, task_id);
  while (current.parent_id && visited.insert(*current.parent_id).second) {
    auto parent = FindTask(tx, *current.parent_id);
    if (!parent) break;
    ancestors.push_back(*parent);
    current = std::move(*parent);
  }
  return ancestors;
}

std::size_t GraphStore::DepthOf(db::Transaction& tx, const std::string& task_id) {
  return AncestorsOf(tx, task_id).size();
}

std::vector<db::model::TaskRecord> GraphStore::TasksInProject(db::Transaction& tx, const std::string& project_id) {
  if (auto snapshot = Snapshot(tx, project_id)) return snapshot->ordered_tasks;
  return repository_->ListTasksByProject(tx, project_id);
}

std::vector<db::model::DependencyRecord> GraphStore::EdgesInProject(db::Transaction& tx, const std::string& project_id) {
  if (auto snapshot = Snapshot(tx, project_id)) return snapshot->ordered_edges;
  return repository_->ListDependenciesByProject(tx, project_id);
}

std::vector<std::string> GraphStore::Projects(db::Transaction& tx) {
  return repository_->ListProjects(tx);
}

} // namespace trailmap::graph
