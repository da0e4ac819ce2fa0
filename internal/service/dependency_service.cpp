#include "internal/service/dependency_service.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/graph/cycle_guard.hpp"
#include "internal/graph/graph_store.hpp"
#include "internal/service/observe_call.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace trailmap::service {

using trailmap::model::DependencyType;
using trailmap::observability::ListField;
using trailmap::observability::StringField;

namespace {

constexpr const char* kDefaultCreatedBy = "system";

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::DependencyNotFound(context + ": " + result.message);
    case db::ErrorCode::AlreadyExists:
      throw util::DuplicateDependency(context + ": " + result.message);
    default:
      throw std::runtime_error(context + ": " + result.message);
  }
}

} // namespace

DependencyService::DependencyService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::shared_ptr<std::mutex> DependencyService::ProjectMutex(const std::string& project_id) {
  std::lock_guard<std::mutex> lock(project_mutexes_guard_);
  auto&                       project_mutex = project_mutexes_[project_id];
  if (!project_mutex) {
    project_mutex = std::make_shared<std::mutex>();
  }
  return project_mutex;
}

db::model::DependencyRecord DependencyService::AddDependency(const AddDependencyRequest& req) {
  return ObserveCall("DependencyService.AddDependency", req.task_id, [&] {
    graph::GraphWriteGuard guard(*ctx_.graph);

    auto       tx     = ctx_.repository->Begin();
    const auto source = ctx_.graph->GetTask(*tx, req.task_id);
    const auto target = ctx_.graph->GetTask(*tx, req.depends_on_id);

    std::vector<std::string> projects{source.project_id, target.project_id};
    std::sort(projects.begin(), projects.end());
    projects.erase(std::unique(projects.begin(), projects.end()), projects.end());

    std::vector<std::unique_lock<std::mutex>> locks;
    for (const auto& project_id : projects) {
      locks.emplace_back(*ProjectMutex(project_id));
      ThrowIfDbError(ctx_.repository->LockProjectGraph(*tx, project_id), "lock project graph " + project_id);
    }

    // a self-edge is a cycle of one whatever its type
    if (req.task_id == req.depends_on_id) {
      throw util::CycleDetected("task " + req.task_id + " cannot depend on itself", {req.task_id});
    }

    if (model::IsBlockingType(req.type)) {
      if (auto path = ctx_.cycles->FindCyclePath(*tx, req.task_id, req.depends_on_id)) {
        TRAILMAP_LOG_WARN("Dependency would create a cycle", {StringField("task_id", req.task_id), StringField("depends_on_id", req.depends_on_id),
                                                              StringField("type", model::ToString(req.type)), ListField("path", *path)});
        throw util::CycleDetected("dependency " + req.task_id + " -> " + req.depends_on_id + " would create a cycle", std::move(*path));
      }
    }

    db::model::DependencyRecord edge;
    edge.task_id       = req.task_id;
    edge.depends_on_id = req.depends_on_id;
    edge.type          = req.type;
    edge.created_at_ms = util::NowMillis();
    edge.created_by    = req.created_by.empty() ? kDefaultCreatedBy : req.created_by;

    ctx_.graph->AddEdge(*tx, edge);
    for (const auto& project_id : projects) guard.Touch(project_id);
    tx->Commit();

    // still under the project locks: the next writer must not see a snapshot
    // loaded while this edge was uncommitted
    for (const auto& project_id : projects) ctx_.graph->InvalidateProject(project_id);
    return edge;
  });
}

void DependencyService::RemoveDependency(const std::string& task_id, const std::string& depends_on_id, DependencyType type) {
  ObserveCall("DependencyService.RemoveDependency", task_id, [&] {
    graph::GraphWriteGuard guard(*ctx_.graph);

    auto tx     = ctx_.repository->Begin();
    auto source = ctx_.graph->GetTask(*tx, task_id);
    ctx_.graph->GetTask(*tx, depends_on_id);

    ctx_.graph->RemoveEdge(*tx, task_id, depends_on_id, type);
    guard.Touch(source.project_id);
    tx->Commit();
  });
}

std::vector<db::model::DependencyRecord> DependencyService::GetDependencies(const std::string& task_id, std::optional<DependencyType> type) {
  return ObserveCall("DependencyService.GetDependencies", task_id, [&] {
    auto tx = ctx_.repository->Begin();
    ctx_.graph->GetTask(*tx, task_id);
    auto edges = ctx_.graph->DependenciesOf(*tx, task_id, type);
    tx->Commit();
    return edges;
  });
}

std::vector<db::model::DependencyRecord> DependencyService::GetDependents(const std::string& task_id, std::optional<DependencyType> type) {
  return ObserveCall("DependencyService.GetDependents", task_id, [&] {
    auto tx = ctx_.repository->Begin();
    ctx_.graph->GetTask(*tx, task_id);
    auto edges = ctx_.graph->DependentsOf(*tx, task_id, type);
    tx->Commit();
    return edges;
  });
}

bool DependencyService::WouldCreateCycle(const std::string& task_id, const std::string& depends_on_id) {
  return ObserveCall("DependencyService.WouldCreateCycle", task_id, [&] {
    auto tx = ctx_.repository->Begin();
    ctx_.graph->GetTask(*tx, task_id);
    ctx_.graph->GetTask(*tx, depends_on_id);
    const bool cycle = ctx_.cycles->WouldCreateCycle(*tx, task_id, depends_on_id);
    tx->Commit();
    return cycle;
  });
}

std::vector<std::vector<std::string>> DependencyService::DetectCycles(const std::string& project_id) {
  return ObserveCall("DependencyService.DetectCycles", {}, [&] {
    auto tx     = ctx_.repository->Begin();
    auto cycles = ctx_.cycles->DetectCycles(*tx, project_id);
    tx->Commit();

    for (const auto& cycle : cycles) {
      TRAILMAP_LOG_WARN("Cycle detected", {StringField("project_id", project_id), ListField("tasks", cycle)});
    }
    return cycles;
  });
}

} // namespace trailmap::service
