#include "internal/service/curriculum_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/graph/graph_store.hpp"
#include "internal/service/observe_call.hpp"

namespace trailmap::service {

CurriculumService::CurriculumService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

db::model::TaskRecord CurriculumService::AddTask(const db::model::TaskRecord& task) {
  return ObserveCall("CurriculumService.AddTask", task.id, [&] {
    graph::GraphWriteGuard guard(*ctx_.graph);

    auto tx     = ctx_.repository->Begin();
    auto stored = ctx_.graph->AddTask(*tx, task);
    guard.Touch(stored.project_id);
    tx->Commit();
    return stored;
  });
}

db::model::TaskRecord CurriculumService::GetTask(const std::string& task_id) {
  return ObserveCall("CurriculumService.GetTask", task_id, [&] {
    auto tx   = ctx_.repository->Begin();
    auto task = ctx_.graph->GetTask(*tx, task_id);
    tx->Commit();
    return task;
  });
}

std::vector<db::model::TaskRecord> CurriculumService::Children(const std::string& task_id) {
  return ObserveCall("CurriculumService.Children", task_id, [&] {
    auto tx = ctx_.repository->Begin();
    ctx_.graph->GetTask(*tx, task_id);

    std::vector<db::model::TaskRecord> children;
    for (const auto& child_id : ctx_.graph->ChildrenOf(*tx, task_id)) {
      children.push_back(ctx_.graph->GetTask(*tx, child_id));
    }
    tx->Commit();
    return children;
  });
}

std::vector<db::model::TaskRecord> CurriculumService::Ancestors(const std::string& task_id) {
  return ObserveCall("CurriculumService.Ancestors", task_id, [&] {
    auto tx        = ctx_.repository->Begin();
    auto ancestors = ctx_.graph->AncestorsOf(*tx, task_id);
    tx->Commit();
    return ancestors;
  });
}

std::vector<db::model::TaskRecord> CurriculumService::TasksInProject(const std::string& project_id) {
  return ObserveCall("CurriculumService.TasksInProject", {}, [&] {
    auto tx    = ctx_.repository->Begin();
    auto tasks = ctx_.graph->TasksInProject(*tx, project_id);
    tx->Commit();
    return tasks;
  });
}

std::vector<std::string> CurriculumService::Projects() {
  return ObserveCall("CurriculumService.Projects", {}, [&] {
    auto tx       = ctx_.repository->Begin();
    auto projects = ctx_.graph->Projects(*tx);
    tx->Commit();
    return projects;
  });
}

} // namespace trailmap::service
