#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace credit::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per database. Transactions on it are serialized through
  TxMutex(); SQLite does not nest BEGIN on a single connection.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/bootstrap)
  void Exec(const std::string& sql);

  // Create ledger tables if missing and seed the counters row.
  void Bootstrap();

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace credit::db::sqlite
