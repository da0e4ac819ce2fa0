#pragma once

#include <exception>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace trailmap::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;
  std::string_view             BackendName() const override {
    return "postgres";
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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace trailmap::db::postgres
