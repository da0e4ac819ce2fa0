#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/graph/graph_store.hpp"
#include "internal/progress/close_validator.hpp"
#include "internal/progress/progress_overlay.hpp"

namespace trailmap::progress {

struct TransitionRequest {
  std::string                 task_id;
  std::string                 learner_id;
  trailmap::model::TaskStatus target = trailmap::model::TaskStatus::kOpen;

  // close reason when closing, required reopen reason when reopening
  std::optional<std::string> reason;

  // set by an explicit reopen: only a closed record may take it
  bool reopen = false;

  // validator answer gathered before the write transaction; Apply asks the
  // validator itself when it is missing
  std::optional<CloseDecision> decision;
};

/*
  StatusMachine

  Gatekeeper for every progress write. Checks, in order:

    1. an explicit reopen starts from closed            -> InvalidTransition
    2. the transition table (model::CanTransition)      -> InvalidTransition
    3. a reopen carries a non-empty reason              -> InvalidArgument
    4. closing: every direct child is closed            -> BlockedClosure
    5. closing a subtask: CloseValidator allows it      -> ValidationRequired

  Check runs 1-4 and returns the task. Consult runs 5 and touches no
  transaction, so callers can hold it outside one. A rejected request
  leaves the stored record untouched. Parents are never closed
  automatically when their last child closes.
*/
class StatusMachine {
 public:
  StatusMachine(std::shared_ptr<graph::GraphStore> graph, std::shared_ptr<ProgressOverlay> overlay, std::shared_ptr<CloseValidator> validator);

  db::model::TaskRecord Check(db::Transaction& tx, const TransitionRequest& request);

  CloseDecision Consult(const db::model::TaskRecord& task, const std::string& learner_id);

  db::model::ProgressRecord Apply(db::Transaction& tx, const TransitionRequest& request);

 private:
  std::shared_ptr<graph::GraphStore> graph_;
  std::shared_ptr<ProgressOverlay>   overlay_;
  std::shared_ptr<CloseValidator>    validator_;
};

} // namespace trailmap::progress
