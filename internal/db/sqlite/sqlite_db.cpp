#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace nove::db::sqlite {

SqliteDB::SqliteDB(const std::string& path, std::chrono::milliseconds busy_timeout) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int rc    = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open license database " + path + ": " + msg);
  }

  try {
    Configure(busy_timeout);
  } catch (const std::exception& e) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot configure license database " + path + ": " + e.what());
  }
}

SqliteDB::~SqliteDB() {
  if (db_ != nullptr && sqlite3_close(db_) != SQLITE_OK) {
    NOVE_LOG_WARN("sqlite close failed", {observability::StringField("error", sqlite3_errmsg(db_))});
  }
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err != nullptr ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure(std::chrono::milliseconds busy_timeout) {
  // ":memory:" databases answer "memory" to journal_mode=WAL.
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");

  if (sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())) != SQLITE_OK) {
    throw std::runtime_error(std::string("busy_timeout: ") + sqlite3_errmsg(db_));
  }
}

} // namespace nove::db::sqlite
