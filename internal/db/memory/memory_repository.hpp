#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace trailmap::db::memory {

class MemoryTransaction;

/*
  In-process repository. Used for tests and for deployments that do not
  need persistence. Transactions are exclusive: Begin() blocks until the
  previous transaction on this repository has finished.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::string_view             BackendName() const override {
    return "memory";
  }

  Result                           InsertTask(Transaction&, const model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& id) override;
  std::vector<model::TaskRecord>   ListTasksByProject(Transaction&, const std::string& project_id) override;
  std::vector<model::TaskRecord>   ListChildTasks(Transaction&, const std::string& parent_id) override;
  std::vector<std::string>         ListProjects(Transaction&) override;

  Result InsertDependency(Transaction&, const model::DependencyRecord&) override;
  Result DeleteDependency(Transaction&, const std::string& task_id, const std::string& depends_on_id,
                          trailmap::model::DependencyType type) override;
  std::vector<model::DependencyRecord> GetDependencies(Transaction&, const std::string& task_id) override;
  std::vector<model::DependencyRecord> GetDependents(Transaction&, const std::string& depends_on_id) override;
  std::vector<model::DependencyRecord> ListDependenciesByProject(Transaction&, const std::string& project_id) override;
  Result                               LockProjectGraph(Transaction&, const std::string& project_id) override;

  std::optional<model::ProgressRecord> GetProgress(Transaction&, const std::string& task_id, const std::string& learner_id) override;
  Result                               UpsertProgress(Transaction&, const model::ProgressRecord&) override;
  std::vector<model::ProgressRecord>   ListProgressByLearner(Transaction&, const std::string& learner_id,
                                                             const std::optional<std::string>& project_id) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::TaskRecord>     tasks;
    std::map<std::string, std::set<std::string>> children_by_parent;
    std::map<std::string, std::set<std::string>> tasks_by_project;

    // both sides kept sorted by (other endpoint, type)
    std::map<std::string, std::vector<model::DependencyRecord>> dependencies; // by task_id
    std::map<std::string, std::vector<model::DependencyRecord>> dependents;   // by depends_on_id

    // learner -> task -> record
    std::map<std::string, std::map<std::string, model::ProgressRecord>> progress;
  };

  std::mutex tx_mutex_; // held for the lifetime of a transaction
  State      committed_;
};

} // namespace trailmap::db::memory
