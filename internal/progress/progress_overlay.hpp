#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace trailmap::progress {

class StatusMachine;

/*
  ProgressOverlay

  The only reader and writer of learner progress rows.

  Resolve() is the single place where "no row" becomes "open"; every read
  path goes through it, including LearnerStatusView. Write() is reserved for
  StatusMachine so no status lands without a transition check.
*/
class ProgressOverlay {
 public:
  explicit ProgressOverlay(std::shared_ptr<db::Repository> repository);

  static db::model::ProgressRecord Resolve(const std::optional<db::model::ProgressRecord>& stored, const std::string& task_id,
                                           const std::string& learner_id);

  db::model::ProgressRecord GetOrDefault(db::Transaction& tx, const std::string& task_id, const std::string& learner_id) const;

  bool IsMaterialized(db::Transaction& tx, const std::string& task_id, const std::string& learner_id) const;

  // rows the learner has touched, optionally in one project
  std::vector<db::model::ProgressRecord> ListMaterialized(db::Transaction& tx, const std::string& learner_id,
                                                          const std::optional<std::string>& project_id = std::nullopt) const;

 private:
  friend class StatusMachine;

  void Write(db::Transaction& tx, const db::model::ProgressRecord& record);

  std::shared_ptr<db::Repository> repository_;
};

/*
  Request-scoped, single-learner status lookup with memoization.
  Never outlives the transaction it reads through and is never shared
  between learners.
*/
class LearnerStatusView {
 public:
  LearnerStatusView(const ProgressOverlay& overlay, db::Transaction& tx, std::string learner_id);

  // Loads every materialized row for the learner in one query; tasks not
  // loaded afterwards resolve to the default without touching the store.
  void Preload();

  trailmap::model::TaskStatus StatusOf(const std::string& task_id);

  const std::string& LearnerId() const {
    return learner_id_;
  }

 private:
  const ProgressOverlay&                                       overlay_;
  db::Transaction&                                             tx_;
  std::string                                                  learner_id_;
  std::unordered_map<std::string, trailmap::model::TaskStatus> memo_;
  bool                                                         preloaded_ = false;
};

} // namespace trailmap::progress
