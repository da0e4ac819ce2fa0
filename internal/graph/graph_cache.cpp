#include "internal/graph/graph_cache.hpp"

#include <mutex>

namespace trailmap::graph {

std::shared_ptr<const ProjectSnapshot> GraphCache::Get(const std::string& project_id) const {
  std::shared_lock lock(mutex_);
  auto             it = projects_.find(project_id);
  if (it == projects_.end()) return nullptr;
  return it->second.snapshot;
}

uint64_t GraphCache::Generation(const std::string& project_id) const {
  std::shared_lock lock(mutex_);
  auto             it = projects_.find(project_id);
  return it == projects_.end() ? 0 : it->second.generation;
}

bool GraphCache::Put(const std::string& project_id, std::shared_ptr<const ProjectSnapshot> snapshot, uint64_t generation) {
  std::unique_lock lock(mutex_);
  auto&            entry = projects_[project_id];
  if (entry.generation != generation) {
    return false;
  }

  for (const auto& [task_id, _] : snapshot->tasks) {
    task_project_[task_id] = project_id;
  }
  entry.snapshot = std::move(snapshot);
  return true;
}

void GraphCache::Invalidate(const std::string& project_id) {
  std::unique_lock lock(mutex_);
  auto&            entry = projects_[project_id];
  ++entry.generation;
  entry.snapshot.reset();
}

std::optional<std::string> GraphCache::ProjectOf(const std::string& task_id) const {
  std::shared_lock lock(mutex_);
  auto             it = task_project_.find(task_id);
  if (it == task_project_.end()) return std::nullopt;
  return it->second;
}

void GraphCache::Clear() {
  std::unique_lock lock(mutex_);
  for (auto& [_, entry] : projects_) {
    ++entry.generation;
    entry.snapshot.reset();
  }
}

} // namespace trailmap::graph
