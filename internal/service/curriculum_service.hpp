#pragma once

#include <string>
#include <vector>

#include "internal/db/model/task_record.hpp"
#include "internal/service/service_context.hpp"

namespace trailmap::service {

/*
  Read access to the template layer, plus the task insert used by whatever
  authoring process feeds the graph.
*/
class CurriculumService {
 public:
  explicit CurriculumService(ServiceContext ctx);

  db::model::TaskRecord AddTask(const db::model::TaskRecord& task);

  db::model::TaskRecord GetTask(const std::string& task_id);

  std::vector<db::model::TaskRecord> Children(const std::string& task_id);

  // nearest first
  std::vector<db::model::TaskRecord> Ancestors(const std::string& task_id);

  std::vector<db::model::TaskRecord> TasksInProject(const std::string& project_id);

  std::vector<std::string> Projects();

 private:
  ServiceContext ctx_;
};

} // namespace trailmap::service
