#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace nove::db::sqlite {

/*
  SQLite transaction wrapper.

  Takes the connection's transaction mutex, then BEGIN IMMEDIATE:
    - serializes writers inside this process
    - grabs the database write lock early against other processes
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;

 private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  bool finished_ = false;
};

} // namespace nove::db::sqlite
