#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace nove::db::sqlite {

using nove::db::ErrorCode;
using nove::db::Result;

namespace {

constexpr const char* kLicenseColumns =
    "id,license_key,plan,customer_name,customer_email,server_limit,valid_from,valid_until,is_active,note,created_at_ms";

constexpr const char* kActivationColumns = "license_key,machine_id,activated_at_ms,last_seen_ms";

constexpr const char* kContactColumns = "id,user_type,name,email,company,plan,message,created_at_ms";

} // namespace

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

// Reads propagate driver failures; an empty result must only mean "no row".
static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return st;
}

static void ThrowIfStepFailed(sqlite3* db, sqlite3_stmt* st, int rc) {
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    std::string msg = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("sqlite step: " + msg);
  }
}

static model::LicenseRecord ReadLicense(sqlite3_stmt* st) {
  model::LicenseRecord r;
  r.id             = ColI64(st, 0);
  r.license_key    = ColText(st, 1);
  r.plan           = ColText(st, 2);
  r.customer_name  = ColText(st, 3);
  r.customer_email = ColText(st, 4);
  r.server_limit   = static_cast<uint32_t>(sqlite3_column_int64(st, 5));
  r.valid_from     = ColText(st, 6);
  r.valid_until    = ColText(st, 7);
  r.is_active      = sqlite3_column_int(st, 8) != 0;
  r.note           = ColText(st, 9);
  r.created_at_ms  = ColU64(st, 10);
  return r;
}

static model::ActivationRecord ReadActivation(sqlite3_stmt* st) {
  model::ActivationRecord r;
  r.license_key     = ColText(st, 0);
  r.machine_id      = ColText(st, 1);
  r.activated_at_ms = ColU64(st, 2);
  r.last_seen_ms    = ColU64(st, 3);
  return r;
}

static model::ContactRecord ReadContact(sqlite3_stmt* st) {
  model::ContactRecord r;
  r.id            = ColI64(st, 0);
  r.user_type     = ColText(st, 1);
  r.name          = ColText(st, 2);
  r.email         = ColText(st, 3);
  r.company       = ColText(st, 4);
  r.plan          = ColText(st, 5);
  r.message       = ColText(st, 6);
  r.created_at_ms = ColU64(st, 7);
  return r;
}

template <typename Row, typename Reader>
static std::vector<Row> QueryAll(sqlite3* db, sqlite3_stmt* st, Reader read) {
  std::vector<Row> out;
  int              rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  ThrowIfStepFailed(db, st, rc);
  sqlite3_finalize(st);
  return out;
}

template <typename Row, typename Reader>
static std::optional<Row> QueryOne(sqlite3* db, sqlite3_stmt* st, Reader read) {
  int rc = sqlite3_step(st);
  ThrowIfStepFailed(db, st, rc);
  if (rc != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }
  Row row = read(st);
  sqlite3_finalize(st);
  return row;
}

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

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::Unavailable, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Licenses
// ------------------------------------------------------------------

Result SqliteRepository::InsertLicense(Transaction& t, model::LicenseRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO licenses(license_key,plan,customer_name,customer_email,server_limit,valid_from,valid_until,is_active,note,created_at_ms) "
      "VALUES(?,?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.license_key);
  BindText(st, 2, r.plan);
  BindText(st, 3, r.customer_name);
  BindText(st, 4, r.customer_email);
  BindU64(st, 5, r.server_limit);
  BindText(st, 6, r.valid_from);
  BindText(st, 7, r.valid_until);
  BindI32(st, 8, r.is_active ? 1 : 0);
  BindText(st, 9, r.note);
  BindU64(st, 10, r.created_at_ms);

  int         rc  = sqlite3_step(st);
  std::string msg = sqlite3_errmsg(db);
  auto        result = Translate(db, rc);
  sqlite3_finalize(st);

  if (rc == SQLITE_CONSTRAINT) {
    // Both the key and the trial index are UNIQUE; the message names the column.
    if (msg.find("licenses.license_key") != std::string::npos) {
      return Result::Err(ErrorCode::AlreadyExists, msg);
    }
    return Result::Err(ErrorCode::ConstraintViolation, msg);
  }

  if (result) r.id = sqlite3_last_insert_rowid(db);
  return result;
}

std::optional<model::LicenseRecord> SqliteRepository::GetLicense(Transaction& t, const std::string& license_key) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, std::string("SELECT ") + kLicenseColumns + " FROM licenses WHERE license_key=?;");
  BindText(st, 1, license_key);
  return QueryOne<model::LicenseRecord>(db, st, ReadLicense);
}

std::optional<model::LicenseRecord> SqliteRepository::LockLicense(Transaction& t, const std::string& license_key) {
  // BEGIN IMMEDIATE plus the connection mutex already exclude other writers.
  return GetLicense(t, license_key);
}

std::vector<model::LicenseRecord> SqliteRepository::ListLicenses(Transaction& t) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, std::string("SELECT ") + kLicenseColumns + " FROM licenses ORDER BY created_at_ms DESC, id DESC;");
  return QueryAll<model::LicenseRecord>(db, st, ReadLicense);
}

std::optional<model::LicenseRecord> SqliteRepository::FindTrialByEmail(Transaction& t, const std::string& customer_email) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, std::string("SELECT ") + kLicenseColumns + " FROM licenses WHERE plan=? AND customer_email=? LIMIT 1;");
  BindText(st, 1, model::kTrialPlan);
  BindText(st, 2, customer_email);
  return QueryOne<model::LicenseRecord>(db, st, ReadLicense);
}

Result SqliteRepository::SetLicenseActive(Transaction& t, const std::string& license_key, bool is_active) {
  auto* db = TX(t).Handle();

  const char*   sql = "UPDATE licenses SET is_active=? WHERE license_key=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st, 1, is_active ? 1 : 0);
  BindText(st, 2, license_key);

  int  rc     = sqlite3_step(st);
  auto result = Translate(db, rc);
  sqlite3_finalize(st);

  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

// ------------------------------------------------------------------
// Activations
// ------------------------------------------------------------------

Result SqliteRepository::InsertActivation(Transaction& t, const model::ActivationRecord& r) {
  auto* db = TX(t).Handle();

  const char*   sql = "INSERT INTO activations(license_key,machine_id,activated_at_ms,last_seen_ms) VALUES(?,?,?,?);";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.license_key);
  BindText(st, 2, r.machine_id);
  BindU64(st, 3, r.activated_at_ms);
  BindU64(st, 4, r.last_seen_ms);

  int  rc     = sqlite3_step(st);
  auto result = Translate(db, rc);
  sqlite3_finalize(st);
  return result;
}

std::optional<model::ActivationRecord> SqliteRepository::GetActivation(Transaction& t, const std::string& license_key,
                                                                       const std::string& machine_id) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, std::string("SELECT ") + kActivationColumns + " FROM activations WHERE license_key=? AND machine_id=?;");
  BindText(st, 1, license_key);
  BindText(st, 2, machine_id);
  return QueryOne<model::ActivationRecord>(db, st, ReadActivation);
}

Result SqliteRepository::TouchActivation(Transaction& t, const std::string& license_key, const std::string& machine_id,
                                         uint64_t last_seen_ms) {
  auto* db = TX(t).Handle();

  const char*   sql = "UPDATE activations SET last_seen_ms=? WHERE license_key=? AND machine_id=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, last_seen_ms);
  BindText(st, 2, license_key);
  BindText(st, 3, machine_id);

  int  rc     = sqlite3_step(st);
  auto result = Translate(db, rc);
  sqlite3_finalize(st);

  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

Result SqliteRepository::DeleteActivation(Transaction& t, const std::string& license_key, const std::string& machine_id) {
  auto* db = TX(t).Handle();

  const char*   sql = "DELETE FROM activations WHERE license_key=? AND machine_id=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, license_key);
  BindText(st, 2, machine_id);

  int  rc     = sqlite3_step(st);
  auto result = Translate(db, rc);
  sqlite3_finalize(st);
  return result;
}

uint32_t SqliteRepository::CountActivations(Transaction& t, const std::string& license_key) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, "SELECT COUNT(*) FROM activations WHERE license_key=?;");
  BindText(st, 1, license_key);
  auto count = QueryOne<uint32_t>(db, st, [](sqlite3_stmt* s) { return static_cast<uint32_t>(sqlite3_column_int64(s, 0)); });
  return count.value_or(0);
}

std::unordered_map<std::string, uint32_t> SqliteRepository::CountAllActivations(Transaction& t) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, "SELECT license_key, COUNT(*) FROM activations GROUP BY license_key;");

  std::unordered_map<std::string, uint32_t> counts;
  int                                       rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    counts[ColText(st, 0)] = static_cast<uint32_t>(sqlite3_column_int64(st, 1));
  }
  ThrowIfStepFailed(db, st, rc);
  sqlite3_finalize(st);
  return counts;
}

std::vector<model::ActivationRecord> SqliteRepository::ListActivations(Transaction& t, const std::string& license_key) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(
      db, std::string("SELECT ") + kActivationColumns + " FROM activations WHERE license_key=? ORDER BY activated_at_ms ASC, machine_id ASC;");
  BindText(st, 1, license_key);
  return QueryAll<model::ActivationRecord>(db, st, ReadActivation);
}

// ------------------------------------------------------------------
// Contacts
// ------------------------------------------------------------------

Result SqliteRepository::InsertContact(Transaction& t, model::ContactRecord& r) {
  auto* db = TX(t).Handle();

  const char*   sql = "INSERT INTO contacts(user_type,name,email,company,plan,message,created_at_ms) VALUES(?,?,?,?,?,?,?);";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.user_type);
  BindText(st, 2, r.name);
  BindText(st, 3, r.email);
  BindText(st, 4, r.company);
  BindText(st, 5, r.plan);
  BindText(st, 6, r.message);
  BindU64(st, 7, r.created_at_ms);

  int  rc     = sqlite3_step(st);
  auto result = Translate(db, rc);
  sqlite3_finalize(st);

  if (result) r.id = sqlite3_last_insert_rowid(db);
  return result;
}

std::vector<model::ContactRecord> SqliteRepository::ListContacts(Transaction& t) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, std::string("SELECT ") + kContactColumns + " FROM contacts ORDER BY created_at_ms DESC, id DESC;");
  return QueryAll<model::ContactRecord>(db, st, ReadContact);
}

} // namespace nove::db::sqlite
