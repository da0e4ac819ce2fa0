#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/graph/graph_store.hpp"
#include "internal/progress/progress_overlay.hpp"

namespace trailmap::blocking {

struct BlockingStatus {
  bool                     blocked = false;
  std::vector<std::string> blockers;
};

/*
  BlockingResolver

  Learner-scoped blocking over BLOCKS edges only.

  A task is blocked for a learner when one of its BLOCKS dependencies is not
  closed for that learner, or is closed but itself blocked. Statuses come
  from a LearnerStatusView built per call; nothing is remembered between
  calls or shared between learners.
*/
class BlockingResolver {
 public:
  BlockingResolver(std::shared_ptr<graph::GraphStore> graph, std::shared_ptr<progress::ProgressOverlay> overlay);

  // Direct blockers when there are any; otherwise, for a task held back only
  // through closed dependencies, the unclosed tasks further down the chain.
  BlockingStatus IsBlocked(db::Transaction& tx, const std::string& task_id, const std::string& learner_id);

  // Every unclosed task reachable over BLOCKS edges, BFS order.
  std::vector<std::string> BlockingChain(db::Transaction& tx, const std::string& task_id, const std::string& learner_id);

  /*
    One learner, one transaction. Memoizes per-task results so a ranking
    pass over a whole project walks each edge once.
  */
  class Evaluation {
   public:
    Evaluation(const BlockingResolver& resolver, db::Transaction& tx, progress::LearnerStatusView& view);

    BlockingStatus           Status(const std::string& task_id);
    bool                     Blocked(const std::string& task_id);
    std::vector<std::string> Chain(const std::string& task_id);

    // nearest ancestor that is blocked, if any
    std::optional<db::model::TaskRecord> BlockedAncestor(const db::model::TaskRecord& task);

    progress::LearnerStatusView& View() {
      return view_;
    }

   private:
    std::vector<std::string> BlocksTargets(const std::string& task_id);

    const BlockingResolver&                  resolver_;
    db::Transaction&                         tx_;
    progress::LearnerStatusView&             view_;
    std::unordered_map<std::string, bool>    blocked_;
    std::unordered_set<std::string>          visiting_;
  };

 private:
  std::shared_ptr<graph::GraphStore>         graph_;
  std::shared_ptr<progress::ProgressOverlay> overlay_;
};

} // namespace trailmap::blocking
