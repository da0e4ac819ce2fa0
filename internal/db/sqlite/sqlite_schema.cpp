#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace trailmap::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS tasks (id TEXT PRIMARY KEY, parent_id TEXT REFERENCES tasks(id), project_id TEXT NOT NULL, "
      "task_type INTEGER NOT NULL, priority INTEGER NOT NULL CHECK (priority BETWEEN 0 AND 4), title TEXT NOT NULL DEFAULT '', "
      "created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_project ON tasks(project_id);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_parent ON tasks(parent_id);",
      "CREATE TABLE IF NOT EXISTS dependencies (task_id TEXT NOT NULL REFERENCES tasks(id), depends_on_id TEXT NOT NULL REFERENCES tasks(id), "
      "dependency_type INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, created_by TEXT NOT NULL, "
      "PRIMARY KEY (task_id, depends_on_id, dependency_type));",
      "CREATE INDEX IF NOT EXISTS idx_dependencies_target ON dependencies(depends_on_id);",
      "CREATE TABLE IF NOT EXISTS learner_task_progress (task_id TEXT NOT NULL REFERENCES tasks(id), learner_id TEXT NOT NULL, "
      "status INTEGER NOT NULL, started_at_ms INTEGER, completed_at_ms INTEGER, close_reason TEXT, reopen_reason TEXT, "
      "updated_at_ms INTEGER NOT NULL, PRIMARY KEY (task_id, learner_id));",
      "CREATE INDEX IF NOT EXISTS idx_progress_learner ON learner_task_progress(learner_id, status);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace trailmap::db::sqlite
