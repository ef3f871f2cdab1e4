#pragma once

#include <sqlite3.h>

#include <chrono>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace nove::db::sqlite {

/*
  The license database file (nove_os.db by default).

  One serialized sqlite3 connection is shared by every transaction.
  TxMutex() is held by a SqliteTransaction for its whole lifetime, so
  activation admission from concurrent requests runs one at a time
  inside this process; BEGIN IMMEDIATE covers other processes.

  Opening applies WAL, foreign_keys=ON (activations reference
  licenses) and a busy timeout. The schema is installed separately
  through RunMigrations(db, SqliteSchema()).
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(const std::string& path, std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Runs one or more statements; throws std::runtime_error with the sqlite message.
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

 private:
  void Configure(std::chrono::milliseconds busy_timeout);

  sqlite3*   db_ = nullptr;
  std::mutex tx_mutex_;
};

} // namespace nove::db::sqlite
