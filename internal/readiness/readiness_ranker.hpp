#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/blocking/blocking_resolver.hpp"

namespace trailmap::readiness {

struct ReadyQuery {
  std::string                             project_id;
  std::string                             learner_id;
  std::optional<trailmap::model::TaskType> type;
  std::size_t                             limit = 0; // 0 = no limit
};

struct RankedTask {
  db::model::TaskRecord       task;
  trailmap::model::TaskStatus status = trailmap::model::TaskStatus::kOpen;
  std::size_t                 depth  = 0;
};

/*
  ReadinessRanker

  A task is ready for a learner when its status is open or in_progress, it
  is not blocked, and no ancestor is blocked. Ready tasks are ordered by:

    in_progress before open
    priority ascending
    depth ascending
    created_at ascending
    id ascending

  The id step makes the order total, so an unchanged graph always ranks the
  same way.
*/
class ReadinessRanker {
 public:
  ReadinessRanker(std::shared_ptr<graph::GraphStore> graph, std::shared_ptr<progress::ProgressOverlay> overlay,
                  std::shared_ptr<blocking::BlockingResolver> resolver);

  std::vector<RankedTask> ReadyWork(db::Transaction& tx, const ReadyQuery& query);

  bool IsReady(db::Transaction& tx, const std::string& task_id, const std::string& learner_id);

  static bool Precedes(const RankedTask& a, const RankedTask& b);

 private:
  std::shared_ptr<graph::GraphStore>          graph_;
  std::shared_ptr<progress::ProgressOverlay>  overlay_;
  std::shared_ptr<blocking::BlockingResolver> resolver_;
};

} // namespace trailmap::readiness
