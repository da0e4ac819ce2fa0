#include "internal/readiness/readiness_ranker.hpp"

#include <algorithm>
#include <tuple>

namespace trailmap::readiness {

using trailmap::model::TaskStatus;

namespace {

bool Workable(TaskStatus status) {
  return status == TaskStatus::kOpen || status == TaskStatus::kInProgress;
}

} // namespace

ReadinessRanker::ReadinessRanker(std::shared_ptr<graph::GraphStore> graph, std::shared_ptr<progress::ProgressOverlay> overlay,
                                 std::shared_ptr<blocking::BlockingResolver> resolver)
    : graph_(std::move(graph)), overlay_(std::move(overlay)), resolver_(std::move(resolver)) {
}

bool ReadinessRanker::Precedes(const RankedTask& a, const RankedTask& b) {
  const int a_rank = a.status == TaskStatus::kInProgress ? 0 : 1;
  const int b_rank = b.status == TaskStatus::kInProgress ? 0 : 1;
  return std::tie(a_rank, a.task.priority, a.depth, a.task.created_at_ms, a.task.id) <
         std::tie(b_rank, b.task.priority, b.depth, b.task.created_at_ms, b.task.id);
}

std::vector<RankedTask> ReadinessRanker::ReadyWork(db::Transaction& tx, const ReadyQuery& query) {
  const auto tasks = graph_->TasksInProject(tx, query.project_id);

  progress::LearnerStatusView view(*overlay_, tx, query.learner_id);
  view.Preload();
  blocking::BlockingResolver::Evaluation evaluation(*resolver_, tx, view);

  std::vector<RankedTask> ready;
  for (const auto& task : tasks) {
    if (query.type && task.type != *query.type) continue;

    const auto status = view.StatusOf(task.id);
    if (!Workable(status)) continue;
    if (evaluation.Blocked(task.id)) continue;
    if (evaluation.BlockedAncestor(task)) continue;

    ready.push_back(RankedTask{task, status, graph_->DepthOf(tx, task.id)});
  }

  std::sort(ready.begin(), ready.end(), Precedes);
  if (query.limit > 0 && ready.size() > query.limit) {
    ready.resize(query.limit);
  }
  return ready;
}

bool ReadinessRanker::IsReady(db::Transaction& tx, const std::string& task_id, const std::string& learner_id) {
  const auto task = graph_->GetTask(tx, task_id);

  progress::LearnerStatusView            view(*overlay_, tx, learner_id);
  blocking::BlockingResolver::Evaluation evaluation(*resolver_, tx, view);

  return Workable(view.StatusOf(task_id)) && !evaluation.Blocked(task_id) && !evaluation.BlockedAncestor(task);
}

} // namespace trailmap::readiness
