#include "pg_repository.hpp"

namespace trailmap::db::postgres {

using trailmap::model::DependencyType;
using trailmap::model::TaskStatus;
using trailmap::model::TaskType;

namespace {

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<uint64_t>();
}

model::TaskRecord ReadTask(const pqxx::row& row) {
  model::TaskRecord r;
  r.id            = row[0].c_str();
  r.parent_id     = OptText(row[1]);
  r.project_id    = row[2].c_str();
  r.type          = static_cast<TaskType>(row[3].as<int>());
  r.priority      = row[4].as<int>();
  r.title         = row[5].c_str();
  r.created_at_ms = row[6].as<uint64_t>();
  return r;
}

model::DependencyRecord ReadDependency(const pqxx::row& row) {
  model::DependencyRecord r;
  r.task_id       = row[0].c_str();
  r.depends_on_id = row[1].c_str();
  r.type          = static_cast<DependencyType>(row[2].as<int>());
  r.created_at_ms = row[3].as<uint64_t>();
  r.created_by    = row[4].c_str();
  return r;
}

model::ProgressRecord ReadProgress(const pqxx::row& row) {
  model::ProgressRecord r;
  r.task_id         = row[0].c_str();
  r.learner_id      = row[1].c_str();
  r.status          = static_cast<TaskStatus>(row[2].as<int>());
  r.started_at_ms   = OptU64(row[3]);
  r.completed_at_ms = OptU64(row[4]);
  r.close_reason    = OptText(row[5]);
  r.reopen_reason   = OptText(row[6]);
  r.updated_at_ms   = row[7].as<uint64_t>();
  return r;
}

template <typename Record, typename Reader>
std::vector<Record> ReadAll(const pqxx::result& res, Reader read) {
  std::vector<Record> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(read(row));
  }
  return records;
}

// A failed statement aborts the enclosing pqxx::work; a savepoint keeps
// the caller's transaction usable after a rejected write.
template <typename Fn>
void InSavepoint(pqxx::work& work, Fn&& fn) {
  pqxx::subtransaction sub(work, "repository_write");
  fn(sub);
  sub.commit();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result PgRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  try {
    InSavepoint(TX(t).Work(), [&](pqxx::subtransaction& sub) {
      sub.exec_params("INSERT INTO tasks(id,parent_id,project_id,task_type,priority,title,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7);", r.id,
                      r.parent_id, r.project_id, static_cast<int>(r.type), r.priority, r.title, r.created_at_ms);
    });
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TaskRecord> PgRepository::GetTask(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_task", id);
  if (res.empty()) return std::nullopt;
  return ReadTask(res[0]);
}

std::vector<model::TaskRecord> PgRepository::ListTasksByProject(Transaction& t, const std::string& project_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,parent_id,project_id,task_type,priority,title,created_at_ms FROM tasks WHERE project_id=$1 ORDER BY id;", project_id);
  return ReadAll<model::TaskRecord>(res, ReadTask);
}

std::vector<model::TaskRecord> PgRepository::ListChildTasks(Transaction& t, const std::string& parent_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,parent_id,project_id,task_type,priority,title,created_at_ms FROM tasks WHERE parent_id=$1 ORDER BY id;", parent_id);
  return ReadAll<model::TaskRecord>(res, ReadTask);
}

std::vector<std::string> PgRepository::ListProjects(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT DISTINCT project_id FROM tasks ORDER BY project_id;");
  return ReadAll<std::string>(res, [](const pqxx::row& row) { return std::string(row[0].c_str()); });
}

// ------------------------------------------------------------------
// Dependencies
// ------------------------------------------------------------------

Result PgRepository::InsertDependency(Transaction& t, const model::DependencyRecord& r) {
  try {
    InSavepoint(TX(t).Work(), [&](pqxx::subtransaction& sub) {
      sub.exec_params("INSERT INTO dependencies(task_id,depends_on_id,dependency_type,created_at_ms,created_by) VALUES($1,$2,$3,$4,$5);",
                      r.task_id, r.depends_on_id, static_cast<int>(r.type), r.created_at_ms, r.created_by);
    });
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteDependency(Transaction& t, const std::string& task_id, const std::string& depends_on_id, DependencyType type) {
  try {
    pqxx::result::size_type removed = 0;
    InSavepoint(TX(t).Work(), [&](pqxx::subtransaction& sub) {
      removed = sub.exec_params("DELETE FROM dependencies WHERE task_id=$1 AND depends_on_id=$2 AND dependency_type=$3;", task_id, depends_on_id,
                                static_cast<int>(type))
                    .affected_rows();
    });
    if (removed == 0) {
      return Result::Err(ErrorCode::NotFound, "dependency not found: " + task_id + " -> " + depends_on_id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::DependencyRecord> PgRepository::GetDependencies(Transaction& t, const std::string& task_id) {
  return ReadAll<model::DependencyRecord>(TX(t).Work().exec_prepared("get_dependencies", task_id), ReadDependency);
}

std::vector<model::DependencyRecord> PgRepository::GetDependents(Transaction& t, const std::string& depends_on_id) {
  return ReadAll<model::DependencyRecord>(TX(t).Work().exec_prepared("get_dependents", depends_on_id), ReadDependency);
}

std::vector<model::DependencyRecord> PgRepository::ListDependenciesByProject(Transaction& t, const std::string& project_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT d.task_id,d.depends_on_id,d.dependency_type,d.created_at_ms,d.created_by "
      "FROM dependencies d JOIN tasks t ON t.id = d.task_id WHERE t.project_id=$1 "
      "ORDER BY d.task_id, d.depends_on_id, d.dependency_type;",
      project_id);
  return ReadAll<model::DependencyRecord>(res, ReadDependency);
}

Result PgRepository::LockProjectGraph(Transaction& t, const std::string& project_id) {
  try {
    TX(t).Work().exec_prepared("lock_project_graph", project_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Progress
// ------------------------------------------------------------------

std::optional<model::ProgressRecord> PgRepository::GetProgress(Transaction& t, const std::string& task_id, const std::string& learner_id) {
  auto res = TX(t).Work().exec_prepared("get_progress", task_id, learner_id);
  if (res.empty()) return std::nullopt;
  return ReadProgress(res[0]);
}

Result PgRepository::UpsertProgress(Transaction& t, const model::ProgressRecord& r) {
  try {
    InSavepoint(TX(t).Work(), [&](pqxx::subtransaction& sub) {
      sub.exec_prepared("upsert_progress", r.task_id, r.learner_id, static_cast<int>(r.status), r.started_at_ms, r.completed_at_ms, r.close_reason,
                        r.reopen_reason, r.updated_at_ms);
    });
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ProgressRecord> PgRepository::ListProgressByLearner(Transaction& t, const std::string& learner_id,
                                                                       const std::optional<std::string>& project_id) {
  pqxx::result res;
  if (project_id) {
    res = TX(t).Work().exec_params(
        "SELECT p.task_id,p.learner_id,p.status,p.started_at_ms,p.completed_at_ms,p.close_reason,p.reopen_reason,p.updated_at_ms "
        "FROM learner_task_progress p JOIN tasks t ON t.id = p.task_id "
        "WHERE p.learner_id=$1 AND t.project_id=$2 ORDER BY p.task_id;",
        learner_id, *project_id);
  } else {
    res = TX(t).Work().exec_params(
        "SELECT task_id,learner_id,status,started_at_ms,completed_at_ms,close_reason,reopen_reason,updated_at_ms "
        "FROM learner_task_progress WHERE learner_id=$1 ORDER BY task_id;",
        learner_id);
  }
  return ReadAll<model::ProgressRecord>(res, ReadProgress);
}

} // namespace trailmap::db::postgres
