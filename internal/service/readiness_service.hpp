#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/blocking/blocking_resolver.hpp"
#include "internal/readiness/readiness_ranker.hpp"
#include "internal/service/service_context.hpp"

namespace trailmap::service {

struct BlockedTask {
  db::model::TaskRecord    task;
  std::vector<std::string> blockers;

  // set when the task is held back only because an ancestor is blocked;
  // blockers are then that ancestor's
  std::optional<std::string> inherited_from;
};

/*
  Learner-facing read path: blocking, readiness and ranked ready work.
  Every call evaluates one learner inside one transaction.
*/
class ReadinessService {
 public:
  explicit ReadinessService(ServiceContext ctx);

  blocking::BlockingStatus IsTaskBlocked(const std::string& task_id, const std::string& learner_id);

  std::vector<std::string> GetBlockingChain(const std::string& task_id, const std::string& learner_id);

  bool IsTaskReady(const std::string& task_id, const std::string& learner_id);

  std::vector<readiness::RankedTask> GetReadyWork(const readiness::ReadyQuery& query);

  // unclosed tasks in the project that are blocked by a dependency, inherit a
  // block from an ancestor, or carry the learner's own blocked status
  std::vector<BlockedTask> GetBlockedTasks(const std::string& project_id, const std::string& learner_id);

 private:
  ServiceContext ctx_;
};

} // namespace trailmap::service
