#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/task_type.hpp"

namespace trailmap::db::model {

/*
  Template-layer work item. Shared by every learner and never mutated by
  the engine once inserted.
*/

struct TaskRecord {
  std::string                id;
  std::optional<std::string> parent_id; // tree parent, none for a project root
  std::string                project_id;

  trailmap::model::TaskType type     = trailmap::model::TaskType::kTask;
  int                       priority = 2;

  std::string title;

  // epoch ms
  uint64_t created_at_ms = 0;
};

} // namespace trailmap::db::model
