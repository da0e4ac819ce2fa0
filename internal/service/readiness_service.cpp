#include "internal/service/readiness_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/service/observe_call.hpp"

namespace trailmap::service {

using trailmap::model::TaskStatus;

ReadinessService::ReadinessService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

blocking::BlockingStatus ReadinessService::IsTaskBlocked(const std::string& task_id, const std::string& learner_id) {
  return ObserveCall("ReadinessService.IsTaskBlocked", task_id, [&] {
    auto tx     = ctx_.repository->Begin();
    auto status = ctx_.blocking->IsBlocked(*tx, task_id, learner_id);
    tx->Commit();
    return status;
  });
}

std::vector<std::string> ReadinessService::GetBlockingChain(const std::string& task_id, const std::string& learner_id) {
  return ObserveCall("ReadinessService.GetBlockingChain", task_id, [&] {
    auto tx    = ctx_.repository->Begin();
    auto chain = ctx_.blocking->BlockingChain(*tx, task_id, learner_id);
    tx->Commit();
    return chain;
  });
}

bool ReadinessService::IsTaskReady(const std::string& task_id, const std::string& learner_id) {
  return ObserveCall("ReadinessService.IsTaskReady", task_id, [&] {
    auto       tx    = ctx_.repository->Begin();
    const bool ready = ctx_.ranker->IsReady(*tx, task_id, learner_id);
    tx->Commit();
    return ready;
  });
}

std::vector<readiness::RankedTask> ReadinessService::GetReadyWork(const readiness::ReadyQuery& query) {
  return ObserveCall("ReadinessService.GetReadyWork", {}, [&] {
    auto effective = query;
    if (effective.limit == 0) {
      effective.limit = ctx_.default_ready_limit;
    }

    auto tx    = ctx_.repository->Begin();
    auto ready = ctx_.ranker->ReadyWork(*tx, effective);
    tx->Commit();
    return ready;
  });
}

std::vector<BlockedTask> ReadinessService::GetBlockedTasks(const std::string& project_id, const std::string& learner_id) {
  return ObserveCall("ReadinessService.GetBlockedTasks", {}, [&] {
    auto tx = ctx_.repository->Begin();

    progress::LearnerStatusView view(*ctx_.overlay, *tx, learner_id);
    view.Preload();
    blocking::BlockingResolver::Evaluation evaluation(*ctx_.blocking, *tx, view);

    std::vector<BlockedTask> blocked;
    for (const auto& task : ctx_.graph->TasksInProject(*tx, project_id)) {
      if (view.StatusOf(task.id) == TaskStatus::kClosed) continue;

      if (evaluation.Blocked(task.id)) {
        blocked.push_back(BlockedTask{task, evaluation.Status(task.id).blockers, std::nullopt});
      } else if (view.StatusOf(task.id) == TaskStatus::kBlocked) {
        // marked blocked by the learner; blockers may be empty
        blocked.push_back(BlockedTask{task, evaluation.Status(task.id).blockers, std::nullopt});
      } else if (auto ancestor = evaluation.BlockedAncestor(task)) {
        blocked.push_back(BlockedTask{task, evaluation.Status(ancestor->id).blockers, ancestor->id});
      }
    }

    tx->Commit();
    return blocked;
  });
}

} // namespace trailmap::service
