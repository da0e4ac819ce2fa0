#include "internal/progress/status_machine.hpp"

#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace trailmap::progress {

using trailmap::model::TaskStatus;

StatusMachine::StatusMachine(std::shared_ptr<graph::GraphStore> graph, std::shared_ptr<ProgressOverlay> overlay,
                             std::shared_ptr<CloseValidator> validator)
    : graph_(std::move(graph)), overlay_(std::move(overlay)), validator_(validator ? std::move(validator) : std::make_shared<AllowAllValidator>()) {
}

db::model::TaskRecord StatusMachine::Check(db::Transaction& tx, const TransitionRequest& request) {
  auto       task    = graph_->GetTask(tx, request.task_id);
  const auto current = overlay_->GetOrDefault(tx, request.task_id, request.learner_id).status;

  if (request.reopen && current != TaskStatus::kClosed) {
    throw util::InvalidTransition(current, request.target);
  }
  if (!model::CanTransition(current, request.target)) {
    throw util::InvalidTransition(current, request.target);
  }

  if (model::IsReopen(current, request.target) && (!request.reason || request.reason->empty())) {
    throw util::InvalidArgument("reopening " + request.task_id + " requires a reason");
  }

  if (request.target == TaskStatus::kClosed) {
    std::vector<std::string> open_children;
    for (const auto& child_id : graph_->ChildrenOf(tx, request.task_id)) {
      if (overlay_->GetOrDefault(tx, child_id, request.learner_id).status != TaskStatus::kClosed) {
        open_children.push_back(child_id);
      }
    }
    if (!open_children.empty()) {
      throw util::BlockedClosure(request.task_id, std::move(open_children));
    }
  }
  return task;
}

CloseDecision StatusMachine::Consult(const db::model::TaskRecord& task, const std::string& learner_id) {
  if (task.type != model::TaskType::kSubtask) {
    return {};
  }
  return validator_->MayClose(task, learner_id);
}

db::model::ProgressRecord StatusMachine::Apply(db::Transaction& tx, const TransitionRequest& request) {
  const auto task    = Check(tx, request);
  auto       current = overlay_->GetOrDefault(tx, request.task_id, request.learner_id);

  if (request.target == TaskStatus::kClosed && task.type == model::TaskType::kSubtask) {
    auto decision = request.decision ? *request.decision : Consult(task, request.learner_id);
    if (!decision.allowed) {
      throw util::ValidationRequired(request.task_id, decision.reason);
    }
  }

  const bool reopen = model::IsReopen(current.status, request.target);

  const auto now = util::NowMillis();

  auto next   = current;
  next.status = request.target;
  if (request.target == TaskStatus::kInProgress && !next.started_at_ms) {
    next.started_at_ms = now;
  }
  if (request.target == TaskStatus::kClosed) {
    next.completed_at_ms = now;
    next.close_reason    = request.reason;
  }
  if (reopen) {
    next.completed_at_ms.reset();
    next.close_reason.reset();
    next.reopen_reason = request.reason;
  }
  next.updated_at_ms = now;

  overlay_->Write(tx, next);
  return next;
}

} // namespace trailmap::progress
