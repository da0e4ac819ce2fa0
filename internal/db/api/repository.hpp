#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/dependency_record.hpp"
#include "internal/db/model/progress_record.hpp"
#include "internal/db/model/task_record.hpp"

namespace trailmap::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Dependency identity (task_id, depends_on_id, type) is unique;
    a second insert returns AlreadyExists
  - Progress rows are upserted, never deleted

  The DB is the source of truth for:
    template tasks
    typed dependency edges
    per-learner progress

  List results are ordered by id so callers get deterministic output
  regardless of backend.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------
  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::string_view BackendName() const = 0;

  // ---------------------------------------------------------------------
  // Tasks (template layer)
  // ---------------------------------------------------------------------
  virtual Result                           InsertTask(Transaction&, const model::TaskRecord&)                = 0;
  virtual std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& id)                     = 0;
  virtual std::vector<model::TaskRecord>   ListTasksByProject(Transaction&, const std::string& project_id) = 0;
  virtual std::vector<model::TaskRecord>   ListChildTasks(Transaction&, const std::string& parent_id)      = 0;
  virtual std::vector<std::string>         ListProjects(Transaction&)                                       = 0;

  // ---------------------------------------------------------------------
  // Dependencies
  // ---------------------------------------------------------------------
  virtual Result InsertDependency(Transaction&, const model::DependencyRecord&) = 0;
  virtual Result DeleteDependency(Transaction&, const std::string& task_id, const std::string& depends_on_id,
                                  trailmap::model::DependencyType type)         = 0;

  // edges whose task_id is the given task, ordered by (depends_on_id, type)
  virtual std::vector<model::DependencyRecord> GetDependencies(Transaction&, const std::string& task_id) = 0;

  // edges whose depends_on_id is the given task, ordered by (task_id, type)
  virtual std::vector<model::DependencyRecord> GetDependents(Transaction&, const std::string& depends_on_id) = 0;

  // edges whose source task belongs to the project
  virtual std::vector<model::DependencyRecord> ListDependenciesByProject(Transaction&, const std::string& project_id) = 0;

  // Serializes graph writers on one project until the transaction ends.
  virtual Result LockProjectGraph(Transaction&, const std::string& project_id) = 0;

  // ---------------------------------------------------------------------
  // Learner progress (instance layer)
  // ---------------------------------------------------------------------
  virtual std::optional<model::ProgressRecord> GetProgress(Transaction&, const std::string& task_id, const std::string& learner_id) = 0;
  virtual Result                               UpsertProgress(Transaction&, const model::ProgressRecord&)                          = 0;

  // materialized rows only, optionally restricted to one project
  virtual std::vector<model::ProgressRecord> ListProgressByLearner(Transaction&, const std::string& learner_id,
                                                                   const std::optional<std::string>& project_id) = 0;
};

} // namespace trailmap::db
