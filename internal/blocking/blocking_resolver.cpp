#include "internal/blocking/blocking_resolver.hpp"

#include <deque>

namespace trailmap::blocking {

using trailmap::model::DependencyType;
using trailmap::model::TaskStatus;

BlockingResolver::BlockingResolver(std::shared_ptr<graph::GraphStore> graph, std::shared_ptr<progress::ProgressOverlay> overlay)
    : graph_(std::move(graph)), overlay_(std::move(overlay)) {
}

BlockingStatus BlockingResolver::IsBlocked(db::Transaction& tx, const std::string& task_id, const std::string& learner_id) {
  graph_->GetTask(tx, task_id);

  progress::LearnerStatusView view(*overlay_, tx, learner_id);
  Evaluation                  evaluation(*this, tx, view);
  return evaluation.Status(task_id);
}

std::vector<std::string> BlockingResolver::BlockingChain(db::Transaction& tx, const std::string& task_id, const std::string& learner_id) {
  graph_->GetTask(tx, task_id);

  progress::LearnerStatusView view(*overlay_, tx, learner_id);
  Evaluation                  evaluation(*this, tx, view);
  return evaluation.Chain(task_id);
}

// ------------------------------------------------------------------
// Evaluation
// ------------------------------------------------------------------

BlockingResolver::Evaluation::Evaluation(const BlockingResolver& resolver, db::Transaction& tx, progress::LearnerStatusView& view)
    : resolver_(resolver), tx_(tx), view_(view) {
}

std::vector<std::string> BlockingResolver::Evaluation::BlocksTargets(const std::string& task_id) {
  std::vector<std::string> targets;
  for (const auto& edge : resolver_.graph_->DependenciesOf(tx_, task_id, DependencyType::kBlocks)) {
    targets.push_back(edge.depends_on_id);
  }
  return targets;
}

BlockingStatus BlockingResolver::Evaluation::Status(const std::string& task_id) {
  BlockingStatus status;
  for (const auto& dep : BlocksTargets(task_id)) {
    if (view_.StatusOf(dep) != TaskStatus::kClosed) {
      status.blockers.push_back(dep);
    }
  }

  if (status.blockers.empty() && Blocked(task_id)) {
    status.blockers = Chain(task_id);
  }
  status.blocked = !status.blockers.empty();
  return status;
}

bool BlockingResolver::Evaluation::Blocked(const std::string& task_id) {
  if (auto it = blocked_.find(task_id); it != blocked_.end()) {
    return it->second;
  }
  // a revisit can only happen on a corrupted (cyclic) graph; stop there
  if (!visiting_.insert(task_id).second) {
    return false;
  }

  const auto deps    = BlocksTargets(task_id);
  bool       blocked = false;
  for (const auto& dep : deps) {
    if (view_.StatusOf(dep) != TaskStatus::kClosed) {
      blocked = true;
      break;
    }
  }
  if (!blocked) {
    for (const auto& dep : deps) {
      if (Blocked(dep)) {
        blocked = true;
        break;
      }
    }
  }

  visiting_.erase(task_id);
  blocked_.emplace(task_id, blocked);
  return blocked;
}

std::vector<std::string> BlockingResolver::Evaluation::Chain(const std::string& task_id) {
  std::vector<std::string>        chain;
  std::unordered_set<std::string> seen{task_id};
  std::deque<std::string>         queue;

  for (auto& dep : BlocksTargets(task_id)) {
    if (seen.insert(dep).second) queue.push_back(std::move(dep));
  }

  while (!queue.empty()) {
    auto current = std::move(queue.front());
    queue.pop_front();

    if (view_.StatusOf(current) != TaskStatus::kClosed) {
      chain.push_back(current);
    }
    for (auto& dep : BlocksTargets(current)) {
      if (seen.insert(dep).second) queue.push_back(std::move(dep));
    }
  }
  return chain;
}

std::optional<db::model::TaskRecord> BlockingResolver::Evaluation::BlockedAncestor(const db::model::TaskRecord& task) {
  std::unordered_set<std::string> seen{task.id};

  auto parent_id = task.parent_id;
  while (parent_id && seen.insert(*parent_id).second) {
    auto parent = resolver_.graph_->FindTask(tx_, *parent_id);
    if (!parent) break;
    if (Blocked(parent->id)) {
      return parent;
    }
    parent_id = parent->parent_id;
  }
  return std::nullopt;
}

} // namespace trailmap::blocking
