#include "pg_schema.hpp"

namespace trailmap::db::postgres {

void BootstrapSchema(const std::shared_ptr<PgPool>& pool) {
  // byte-order collation keeps ORDER BY id identical to the other backends
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec(
      "CREATE TABLE IF NOT EXISTS tasks (id TEXT COLLATE \"C\" PRIMARY KEY, parent_id TEXT COLLATE \"C\" REFERENCES tasks(id), project_id TEXT COLLATE \"C\" NOT NULL, "
      "task_type SMALLINT NOT NULL, priority SMALLINT NOT NULL CHECK (priority BETWEEN 0 AND 4), title TEXT NOT NULL DEFAULT '', "
      "created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_tasks_project ON tasks(project_id);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_tasks_parent ON tasks(parent_id);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS dependencies (task_id TEXT COLLATE \"C\" NOT NULL REFERENCES tasks(id), depends_on_id TEXT COLLATE \"C\" NOT NULL REFERENCES tasks(id), "
      "dependency_type SMALLINT NOT NULL, created_at_ms BIGINT NOT NULL, created_by TEXT NOT NULL, "
      "PRIMARY KEY (task_id, depends_on_id, dependency_type));");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_dependencies_target ON dependencies(depends_on_id);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS learner_task_progress (task_id TEXT COLLATE \"C\" NOT NULL REFERENCES tasks(id), learner_id TEXT COLLATE \"C\" NOT NULL, "
      "status SMALLINT NOT NULL, started_at_ms BIGINT, completed_at_ms BIGINT, close_reason TEXT, reopen_reason TEXT, "
      "updated_at_ms BIGINT NOT NULL, PRIMARY KEY (task_id, learner_id));");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_progress_learner ON learner_task_progress(learner_id, status);");
  tx.commit();
}

} // namespace trailmap::db::postgres
