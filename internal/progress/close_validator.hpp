#pragma once

#include <string>

#include "internal/db/model/task_record.hpp"

namespace trailmap::progress {

struct CloseDecision {
  bool        allowed = true;
  std::string reason;
};

/*
  External gate consulted before a learner closes a subtask, typically a
  submission check owned by another system. ProgressService calls it with
  no transaction open, so an implementation may read back through the
  engine's services.
*/
class CloseValidator {
 public:
  virtual ~CloseValidator() = default;

  virtual CloseDecision MayClose(const db::model::TaskRecord& task, const std::string& learner_id) = 0;
};

class AllowAllValidator final : public CloseValidator {
 public:
  CloseDecision MayClose(const db::model::TaskRecord&, const std::string&) override {
    return {};
  }
};

} // namespace trailmap::progress
