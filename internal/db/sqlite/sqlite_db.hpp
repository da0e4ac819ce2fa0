#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace trailmap::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction of a repository, so the
  handle also carries the mutex that keeps transactions from interleaving.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace trailmap::db::sqlite
