#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace trailmap::db::sqlite {

using trailmap::db::ErrorCode;
using trailmap::db::Result;
using trailmap::model::DependencyType;
using trailmap::model::TaskStatus;
using trailmap::model::TaskType;

namespace {

constexpr const char* kTaskColumns       = "id,parent_id,project_id,task_type,priority,title,created_at_ms";
constexpr const char* kDependencyColumns = "task_id,depends_on_id,dependency_type,created_at_ms,created_by";
constexpr const char* kProgressColumns =
    "task_id,learner_id,status,started_at_ms,completed_at_ms,close_reason,reopen_reason,updated_at_ms";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

sqlite3_stmt* PrepareOrThrow(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return st;
}

// Steps st to completion, finalizes it, and throws on a step error.
template <typename Row, typename Reader>
std::vector<Row> CollectRows(sqlite3* db, sqlite3_stmt* st, Reader read) {
  std::vector<Row> rows;
  int              rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    rows.push_back(read(st));
  }
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return rows;
}

model::TaskRecord ReadTask(sqlite3_stmt* st) {
  model::TaskRecord r;
  r.id            = ColText(st, 0);
  r.parent_id     = ColOptText(st, 1);
  r.project_id    = ColText(st, 2);
  r.type          = static_cast<TaskType>(ColI32(st, 3));
  r.priority      = ColI32(st, 4);
  r.title         = ColText(st, 5);
  r.created_at_ms = ColU64(st, 6);
  return r;
}

model::DependencyRecord ReadDependency(sqlite3_stmt* st) {
  model::DependencyRecord r;
  r.task_id       = ColText(st, 0);
  r.depends_on_id = ColText(st, 1);
  r.type          = static_cast<DependencyType>(ColI32(st, 2));
  r.created_at_ms = ColU64(st, 3);
  r.created_by    = ColText(st, 4);
  return r;
}

model::ProgressRecord ReadProgress(sqlite3_stmt* st) {
  model::ProgressRecord r;
  r.task_id         = ColText(st, 0);
  r.learner_id      = ColText(st, 1);
  r.status          = static_cast<TaskStatus>(ColI32(st, 2));
  r.started_at_ms   = ColOptU64(st, 3);
  r.completed_at_ms = ColOptU64(st, 4);
  r.close_reason    = ColOptText(st, 5);
  r.reopen_reason   = ColOptText(st, 6);
  r.updated_at_ms   = ColU64(st, 7);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result SqliteRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO tasks(id,parent_id,project_id,task_type,priority,title,created_at_ms) "
      "VALUES(?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.id);
  BindOptText(st, 2, r.parent_id);
  BindText(st, 3, r.project_id);
  BindI32(st, 4, static_cast<int>(r.type));
  BindI32(st, 5, r.priority);
  BindText(st, 6, r.title);
  BindU64(st, 7, r.created_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::optional<model::TaskRecord> SqliteRepository::GetTask(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE id=?;");
  BindText(st, 1, id);

  auto rows = CollectRows<model::TaskRecord>(db, st, ReadTask);
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::vector<model::TaskRecord> SqliteRepository::ListTasksByProject(Transaction& t, const std::string& project_id) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE project_id=? ORDER BY id;");
  BindText(st, 1, project_id);
  return CollectRows<model::TaskRecord>(db, st, ReadTask);
}

std::vector<model::TaskRecord> SqliteRepository::ListChildTasks(Transaction& t, const std::string& parent_id) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE parent_id=? ORDER BY id;");
  BindText(st, 1, parent_id);
  return CollectRows<model::TaskRecord>(db, st, ReadTask);
}

std::vector<std::string> SqliteRepository::ListProjects(Transaction& t) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, "SELECT DISTINCT project_id FROM tasks ORDER BY project_id;");
  return CollectRows<std::string>(db, st, [](sqlite3_stmt* row) { return ColText(row, 0); });
}

// ------------------------------------------------------------------
// Dependencies
// ------------------------------------------------------------------

Result SqliteRepository::InsertDependency(Transaction& t, const model::DependencyRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO dependencies(task_id,depends_on_id,dependency_type,created_at_ms,created_by) "
      "VALUES(?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.task_id);
  BindText(st, 2, r.depends_on_id);
  BindI32(st, 3, static_cast<int>(r.type));
  BindU64(st, 4, r.created_at_ms);
  BindText(st, 5, r.created_by);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

Result SqliteRepository::DeleteDependency(Transaction& t, const std::string& task_id, const std::string& depends_on_id,
                                          DependencyType type) {
  auto* db = TX(t).Handle();

  const char*   sql = "DELETE FROM dependencies WHERE task_id=? AND depends_on_id=? AND dependency_type=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, task_id);
  BindText(st, 2, depends_on_id);
  BindI32(st, 3, static_cast<int>(type));

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (result && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "dependency not found: " + task_id + " -> " + depends_on_id);
  }
  return result;
}

std::vector<model::DependencyRecord> SqliteRepository::GetDependencies(Transaction& t, const std::string& task_id) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, std::string("SELECT ") + kDependencyColumns +
                                    " FROM dependencies WHERE task_id=? ORDER BY depends_on_id, dependency_type;");
  BindText(st, 1, task_id);
  return CollectRows<model::DependencyRecord>(db, st, ReadDependency);
}

std::vector<model::DependencyRecord> SqliteRepository::GetDependents(Transaction& t, const std::string& depends_on_id) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, std::string("SELECT ") + kDependencyColumns +
                                    " FROM dependencies WHERE depends_on_id=? ORDER BY task_id, dependency_type;");
  BindText(st, 1, depends_on_id);
  return CollectRows<model::DependencyRecord>(db, st, ReadDependency);
}

std::vector<model::DependencyRecord> SqliteRepository::ListDependenciesByProject(Transaction& t, const std::string& project_id) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db,
                            "SELECT d.task_id,d.depends_on_id,d.dependency_type,d.created_at_ms,d.created_by "
                            "FROM dependencies d JOIN tasks t ON t.id = d.task_id WHERE t.project_id=? "
                            "ORDER BY d.task_id, d.depends_on_id, d.dependency_type;");
  BindText(st, 1, project_id);
  return CollectRows<model::DependencyRecord>(db, st, ReadDependency);
}

Result SqliteRepository::LockProjectGraph(Transaction&, const std::string&) {
  // BEGIN IMMEDIATE already holds the database write lock
  return Result::Ok();
}

// ------------------------------------------------------------------
// Progress
// ------------------------------------------------------------------

std::optional<model::ProgressRecord> SqliteRepository::GetProgress(Transaction& t, const std::string& task_id, const std::string& learner_id) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, std::string("SELECT ") + kProgressColumns + " FROM learner_task_progress WHERE task_id=? AND learner_id=?;");
  BindText(st, 1, task_id);
  BindText(st, 2, learner_id);

  auto rows = CollectRows<model::ProgressRecord>(db, st, ReadProgress);
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

Result SqliteRepository::UpsertProgress(Transaction& t, const model::ProgressRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO learner_task_progress(task_id,learner_id,status,started_at_ms,completed_at_ms,close_reason,reopen_reason,updated_at_ms) "
      "VALUES(?,?,?,?,?,?,?,?) "
      "ON CONFLICT(task_id,learner_id) DO UPDATE SET status=excluded.status, started_at_ms=excluded.started_at_ms, "
      "completed_at_ms=excluded.completed_at_ms, close_reason=excluded.close_reason, reopen_reason=excluded.reopen_reason, "
      "updated_at_ms=excluded.updated_at_ms;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.task_id);
  BindText(st, 2, r.learner_id);
  BindI32(st, 3, static_cast<int>(r.status));
  BindOptU64(st, 4, r.started_at_ms);
  BindOptU64(st, 5, r.completed_at_ms);
  BindOptText(st, 6, r.close_reason);
  BindOptText(st, 7, r.reopen_reason);
  BindU64(st, 8, r.updated_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::vector<model::ProgressRecord> SqliteRepository::ListProgressByLearner(Transaction& t, const std::string& learner_id,
                                                                           const std::optional<std::string>& project_id) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* st = nullptr;
  if (project_id) {
    st = PrepareOrThrow(db,
                        "SELECT p.task_id,p.learner_id,p.status,p.started_at_ms,p.completed_at_ms,p.close_reason,p.reopen_reason,p.updated_at_ms "
                        "FROM learner_task_progress p JOIN tasks t ON t.id = p.task_id "
                        "WHERE p.learner_id=? AND t.project_id=? ORDER BY p.task_id;");
    BindText(st, 1, learner_id);
    BindText(st, 2, *project_id);
  } else {
    st = PrepareOrThrow(db, std::string("SELECT ") + kProgressColumns + " FROM learner_task_progress WHERE learner_id=? ORDER BY task_id;");
    BindText(st, 1, learner_id);
  }
  return CollectRows<model::ProgressRecord>(db, st, ReadProgress);
}

} // namespace trailmap::db::sqlite
