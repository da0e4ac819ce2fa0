#include "pg_pool.hpp"

namespace trailmap::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_task",
               "SELECT id,parent_id,project_id,task_type,priority,title,created_at_ms "
               "FROM tasks WHERE id=$1");

  conn.prepare("get_dependencies",
               "SELECT task_id,depends_on_id,dependency_type,created_at_ms,created_by "
               "FROM dependencies WHERE task_id=$1 ORDER BY depends_on_id, dependency_type");

  conn.prepare("get_dependents",
               "SELECT task_id,depends_on_id,dependency_type,created_at_ms,created_by "
               "FROM dependencies WHERE depends_on_id=$1 ORDER BY task_id, dependency_type");

  conn.prepare("get_progress",
               "SELECT task_id,learner_id,status,started_at_ms,completed_at_ms,close_reason,reopen_reason,updated_at_ms "
               "FROM learner_task_progress WHERE task_id=$1 AND learner_id=$2");

  conn.prepare("upsert_progress",
               "INSERT INTO learner_task_progress(task_id,learner_id,status,started_at_ms,completed_at_ms,close_reason,reopen_reason,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8) "
               "ON CONFLICT(task_id,learner_id) DO UPDATE SET status=EXCLUDED.status, started_at_ms=EXCLUDED.started_at_ms, "
               "completed_at_ms=EXCLUDED.completed_at_ms, close_reason=EXCLUDED.close_reason, reopen_reason=EXCLUDED.reopen_reason, "
               "updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("lock_project_graph", "SELECT pg_advisory_xact_lock(hashtext($1))");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
    } else {
      idle_.emplace_back(conn);
    }
  }
  cv_.notify_one();
}

} // namespace trailmap::db::postgres
