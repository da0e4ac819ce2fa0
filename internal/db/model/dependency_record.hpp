#pragma once

#include <cstdint>
#include <string>

#include "internal/model/dependency_type.hpp"

namespace trailmap::db::model {

/*
  Typed directed edge.

    task_id ---depends on---> depends_on_id

  BLOCKS: task_id stays blocked until depends_on_id is closed.
  PARENT_CHILD: task_id is the parent, depends_on_id the child.
  RELATED: informational.

  Identity is (task_id, depends_on_id, type).
*/

struct DependencyRecord {
  std::string task_id;
  std::string depends_on_id;

  trailmap::model::DependencyType type = trailmap::model::DependencyType::kBlocks;

  uint64_t    created_at_ms = 0;
  std::string created_by;
};

} // namespace trailmap::db::model
