#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/task_status.hpp"

namespace trailmap::db::model {

/*
  Per-learner status of one task. Keyed by (task_id, learner_id).

  Rows exist only for pairs a learner has touched. A missing row means
  "open"; ProgressOverlay is the only place that applies that rule.
*/

struct ProgressRecord {
  std::string task_id;
  std::string learner_id;

  trailmap::model::TaskStatus status = trailmap::model::TaskStatus::kOpen;

  std::optional<uint64_t> started_at_ms;
  std::optional<uint64_t> completed_at_ms;

  std::optional<std::string> close_reason;
  std::optional<std::string> reopen_reason;

  uint64_t updated_at_ms = 0;
};

} // namespace trailmap::db::model
