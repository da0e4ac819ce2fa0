#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace trailmap::db::memory {

namespace {

using trailmap::model::DependencyType;

bool ByTarget(const model::DependencyRecord& a, const model::DependencyRecord& b) {
  return std::tie(a.depends_on_id, a.type) < std::tie(b.depends_on_id, b.type);
}

bool BySource(const model::DependencyRecord& a, const model::DependencyRecord& b) {
  return std::tie(a.task_id, a.type) < std::tie(b.task_id, b.type);
}

bool SameEdge(const model::DependencyRecord& r, const std::string& task_id, const std::string& depends_on_id, DependencyType type) {
  return r.task_id == task_id && r.depends_on_id == depends_on_id && r.type == type;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result MemoryRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  const auto& view = TX(t).View();
  if (view.tasks.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "task exists: " + r.id);
  if (r.parent_id && !view.tasks.contains(*r.parent_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown parent: " + *r.parent_id);
  }

  auto& s = TX(t).Mutable();
  s.tasks[r.id] = r;
  s.tasks_by_project[r.project_id].insert(r.id);
  if (r.parent_id) s.children_by_parent[*r.parent_id].insert(r.id);
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.tasks.find(id);
  if (it == s.tasks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TaskRecord> MemoryRepository::ListTasksByProject(Transaction& t, const std::string& project_id) {
  const auto&                    s = TX(t).View();
  std::vector<model::TaskRecord> records;
  auto                           it = s.tasks_by_project.find(project_id);
  if (it == s.tasks_by_project.end()) return records;

  records.reserve(it->second.size());
  for (const auto& id : it->second) {
    records.push_back(s.tasks.at(id));
  }
  return records;
}

std::vector<model::TaskRecord> MemoryRepository::ListChildTasks(Transaction& t, const std::string& parent_id) {
  const auto&                    s = TX(t).View();
  std::vector<model::TaskRecord> records;
  auto                           it = s.children_by_parent.find(parent_id);
  if (it == s.children_by_parent.end()) return records;

  for (const auto& id : it->second) {
    records.push_back(s.tasks.at(id));
  }
  return records;
}

std::vector<std::string> MemoryRepository::ListProjects(Transaction& t) {
  const auto&              s = TX(t).View();
  std::vector<std::string> projects;
  projects.reserve(s.tasks_by_project.size());
  for (const auto& [project_id, _] : s.tasks_by_project) {
    projects.push_back(project_id);
  }
  return projects;
}

// ------------------------------------------------------------------
// Dependencies
// ------------------------------------------------------------------

Result MemoryRepository::InsertDependency(Transaction& t, const model::DependencyRecord& r) {
  const auto& view = TX(t).View();
  if (!view.tasks.contains(r.task_id) || !view.tasks.contains(r.depends_on_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "dependency references unknown task");
  }
  if (auto it = view.dependencies.find(r.task_id); it != view.dependencies.end()) {
    for (const auto& existing : it->second) {
      if (SameEdge(existing, r.task_id, r.depends_on_id, r.type)) {
        return Result::Err(ErrorCode::AlreadyExists, "dependency exists: " + r.task_id + " -> " + r.depends_on_id);
      }
    }
  }

  auto& s    = TX(t).Mutable();
  auto& deps = s.dependencies[r.task_id];
  deps.insert(std::upper_bound(deps.begin(), deps.end(), r, ByTarget), r);

  auto& rdeps = s.dependents[r.depends_on_id];
  rdeps.insert(std::upper_bound(rdeps.begin(), rdeps.end(), r, BySource), r);
  return Result::Ok();
}

Result MemoryRepository::DeleteDependency(Transaction& t, const std::string& task_id, const std::string& depends_on_id,
                                          DependencyType type) {
  const auto& view = TX(t).View();
  auto        it   = view.dependencies.find(task_id);
  if (it == view.dependencies.end() ||
      std::none_of(it->second.begin(), it->second.end(), [&](const auto& r) { return SameEdge(r, task_id, depends_on_id, type); })) {
    return Result::Err(ErrorCode::NotFound, "dependency not found: " + task_id + " -> " + depends_on_id);
  }

  auto& s = TX(t).Mutable();
  std::erase_if(s.dependencies[task_id], [&](const auto& r) { return SameEdge(r, task_id, depends_on_id, type); });
  std::erase_if(s.dependents[depends_on_id], [&](const auto& r) { return SameEdge(r, task_id, depends_on_id, type); });
  return Result::Ok();
}

std::vector<model::DependencyRecord> MemoryRepository::GetDependencies(Transaction& t, const std::string& task_id) {
  const auto& s  = TX(t).View();
  auto        it = s.dependencies.find(task_id);
  if (it == s.dependencies.end()) return {};
  return it->second;
}

std::vector<model::DependencyRecord> MemoryRepository::GetDependents(Transaction& t, const std::string& depends_on_id) {
  const auto& s  = TX(t).View();
  auto        it = s.dependents.find(depends_on_id);
  if (it == s.dependents.end()) return {};
  return it->second;
}

std::vector<model::DependencyRecord> MemoryRepository::ListDependenciesByProject(Transaction& t, const std::string& project_id) {
  const auto&                          s = TX(t).View();
  std::vector<model::DependencyRecord> records;
  auto                                 project = s.tasks_by_project.find(project_id);
  if (project == s.tasks_by_project.end()) return records;

  for (const auto& id : project->second) {
    auto it = s.dependencies.find(id);
    if (it == s.dependencies.end()) continue;
    records.insert(records.end(), it->second.begin(), it->second.end());
  }
  return records;
}

Result MemoryRepository::LockProjectGraph(Transaction&, const std::string&) {
  // transactions are already exclusive
  return Result::Ok();
}

// ------------------------------------------------------------------
// Progress
// ------------------------------------------------------------------

std::optional<model::ProgressRecord> MemoryRepository::GetProgress(Transaction& t, const std::string& task_id, const std::string& learner_id) {
  const auto& s       = TX(t).View();
  auto        learner = s.progress.find(learner_id);
  if (learner == s.progress.end()) return std::nullopt;

  auto it = learner->second.find(task_id);
  if (it == learner->second.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertProgress(Transaction& t, const model::ProgressRecord& r) {
  if (!TX(t).View().tasks.contains(r.task_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "progress references unknown task: " + r.task_id);
  }
  TX(t).Mutable().progress[r.learner_id][r.task_id] = r;
  return Result::Ok();
}

std::vector<model::ProgressRecord> MemoryRepository::ListProgressByLearner(Transaction& t, const std::string& learner_id,
                                                                           const std::optional<std::string>& project_id) {
  const auto&                        s = TX(t).View();
  std::vector<model::ProgressRecord> records;
  auto                               learner = s.progress.find(learner_id);
  if (learner == s.progress.end()) return records;

  for (const auto& [task_id, record] : learner->second) {
    if (project_id) {
      auto task = s.tasks.find(task_id);
      if (task == s.tasks.end() || task->second.project_id != *project_id) continue;
    }
    records.push_back(record);
  }
  return records;
}

} // namespace trailmap::db::memory
