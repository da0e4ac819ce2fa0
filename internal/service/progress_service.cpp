#include "internal/service/progress_service.hpp"

#include <algorithm>

#include "internal/db/api/repository.hpp"
#include "internal/graph/graph_store.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/progress/progress_overlay.hpp"
#include "internal/progress/status_machine.hpp"
#include "internal/service/observe_call.hpp"

namespace trailmap::service {

using trailmap::model::TaskStatus;
using trailmap::observability::StringField;

ProgressService::ProgressService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

db::model::ProgressRecord ProgressService::UpdateStatus(const std::string& task_id, const std::string& learner_id, TaskStatus status,
                                                        const std::optional<std::string>& reason) {
  progress::TransitionRequest request;
  request.task_id    = task_id;
  request.learner_id = learner_id;
  request.target     = status;
  request.reason     = reason;
  return Transition(std::move(request));
}

db::model::ProgressRecord ProgressService::Transition(progress::TransitionRequest request) {
  return ObserveCall("ProgressService.UpdateStatus", request.task_id, [&] {
    if (request.target == TaskStatus::kClosed) {
      auto check = ctx_.repository->Begin();
      auto task  = ctx_.status_machine->Check(*check, request);
      check->Commit();

      // the validator may call back into the engine; no transaction is open here
      request.decision = ctx_.status_machine->Consult(task, request.learner_id);
    }

    auto tx     = ctx_.repository->Begin();
    auto before = ctx_.overlay->GetOrDefault(*tx, request.task_id, request.learner_id).status;
    auto record = ctx_.status_machine->Apply(*tx, request);
    tx->Commit();

    if (model::IsReopen(before, request.target)) {
      TRAILMAP_LOG_INFO("Task reopened", {StringField("task_id", request.task_id), StringField("learner_id", request.learner_id),
                                          StringField("reason", record.reopen_reason.value_or(""))});
    }
    return record;
  });
}

db::model::ProgressRecord ProgressService::StartTask(const std::string& task_id, const std::string& learner_id) {
  return UpdateStatus(task_id, learner_id, TaskStatus::kInProgress);
}

db::model::ProgressRecord ProgressService::CloseTask(const std::string& task_id, const std::string& learner_id,
                                                     const std::optional<std::string>& reason) {
  return UpdateStatus(task_id, learner_id, TaskStatus::kClosed, reason);
}

db::model::ProgressRecord ProgressService::ReopenTask(const std::string& task_id, const std::string& learner_id, const std::string& reason) {
  progress::TransitionRequest request;
  request.task_id    = task_id;
  request.learner_id = learner_id;
  request.target     = TaskStatus::kOpen;
  request.reason     = reason;
  request.reopen     = true;
  return Transition(std::move(request));
}

db::model::ProgressRecord ProgressService::GetProgress(const std::string& task_id, const std::string& learner_id) {
  return ObserveCall("ProgressService.GetProgress", task_id, [&] {
    auto tx = ctx_.repository->Begin();
    ctx_.graph->GetTask(*tx, task_id);
    auto record = ctx_.overlay->GetOrDefault(*tx, task_id, learner_id);
    tx->Commit();
    return record;
  });
}

std::vector<db::model::TaskRecord> ProgressService::ListLearnerTasksByStatus(const std::string& learner_id, TaskStatus status,
                                                                             const std::optional<std::string>& project_id) {
  return ObserveCall("ProgressService.ListLearnerTasksByStatus", {}, [&] {
    auto tx = ctx_.repository->Begin();

    std::vector<db::model::TaskRecord> tasks;
    for (const auto& record : ctx_.overlay->ListMaterialized(*tx, learner_id, project_id)) {
      if (record.status != status) continue;
      if (auto task = ctx_.graph->FindTask(*tx, record.task_id)) {
        tasks.push_back(std::move(*task));
      }
    }
    tx->Commit();

    std::sort(tasks.begin(), tasks.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
    return tasks;
  });
}

} // namespace trailmap::service
