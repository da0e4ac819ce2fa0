#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/progress_record.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/progress/status_machine.hpp"
#include "internal/service/service_context.hpp"

namespace trailmap::service {

/*
  Learner status writes and reads. Every write goes through StatusMachine;
  the convenience calls are thin wrappers over UpdateStatus, except that
  ReopenTask only accepts a closed task.

  A close checks the request in one transaction, asks the CloseValidator
  with none open, then re-checks and writes in a second.
*/
class ProgressService {
 public:
  explicit ProgressService(ServiceContext ctx);

  db::model::ProgressRecord UpdateStatus(const std::string& task_id, const std::string& learner_id, trailmap::model::TaskStatus status,
                                         const std::optional<std::string>& reason = std::nullopt);

  db::model::ProgressRecord StartTask(const std::string& task_id, const std::string& learner_id);
  db::model::ProgressRecord CloseTask(const std::string& task_id, const std::string& learner_id,
                                      const std::optional<std::string>& reason = std::nullopt);
  db::model::ProgressRecord ReopenTask(const std::string& task_id, const std::string& learner_id, const std::string& reason);

  db::model::ProgressRecord GetProgress(const std::string& task_id, const std::string& learner_id);

  // tasks whose stored record for the learner is in `status`, ordered by id
  std::vector<db::model::TaskRecord> ListLearnerTasksByStatus(const std::string& learner_id, trailmap::model::TaskStatus status,
                                                              const std::optional<std::string>& project_id = std::nullopt);

 private:
  db::model::ProgressRecord Transition(progress::TransitionRequest request);

  ServiceContext ctx_;
};

} // namespace trailmap::service
