#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace trailmap::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::string_view             BackendName() const override {
    return "sqlite";
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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace trailmap::db::sqlite
