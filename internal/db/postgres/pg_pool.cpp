#include "pg_pool.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"

namespace nove::db::postgres {

namespace {

class WorkExecutor final : public sql::MigrationExecutor {
 public:
  explicit WorkExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

} // namespace

void PgPool::InstallSchema(const std::string& conninfo) {
  pqxx::connection conn(conninfo);
  pqxx::work       tx(conn);
  WorkExecutor     executor(tx);
  sql::RunMigrations(executor, sql::PostgresSchema());
  tx.commit();
}

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(std::max<std::size_t>(1, max_connections)) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  // Reserve the slot, then connect without holding the lock.
  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception& e) {
    Forget();
    throw std::runtime_error(std::string("postgres connect failed: ") + e.what());
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  static constexpr const char* kLicenseColumns =
      "id,license_key,plan,customer_name,customer_email,server_limit,valid_from,valid_until,is_active,note,created_at_ms";

  conn.prepare("insert_license",
               "INSERT INTO licenses(license_key,plan,customer_name,customer_email,server_limit,valid_from,valid_until,is_active,note,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) RETURNING id");

  conn.prepare("get_license", std::string("SELECT ") + kLicenseColumns + " FROM licenses WHERE license_key=$1");

  conn.prepare("lock_license", std::string("SELECT ") + kLicenseColumns + " FROM licenses WHERE license_key=$1 FOR UPDATE");

  conn.prepare("list_licenses", std::string("SELECT ") + kLicenseColumns + " FROM licenses ORDER BY created_at_ms DESC, id DESC");

  conn.prepare("find_trial_by_email",
               std::string("SELECT ") + kLicenseColumns + " FROM licenses WHERE plan='trial14' AND customer_email=$1 LIMIT 1");

  conn.prepare("set_license_active", "UPDATE licenses SET is_active=$2 WHERE license_key=$1");

  conn.prepare("insert_activation", "INSERT INTO activations(license_key,machine_id,activated_at_ms,last_seen_ms) VALUES($1,$2,$3,$4)");

  conn.prepare("get_activation",
               "SELECT license_key,machine_id,activated_at_ms,last_seen_ms FROM activations WHERE license_key=$1 AND machine_id=$2");

  conn.prepare("touch_activation", "UPDATE activations SET last_seen_ms=$3 WHERE license_key=$1 AND machine_id=$2");

  conn.prepare("delete_activation", "DELETE FROM activations WHERE license_key=$1 AND machine_id=$2");

  conn.prepare("count_activations", "SELECT COUNT(*) FROM activations WHERE license_key=$1");

  conn.prepare("count_all_activations", "SELECT license_key, COUNT(*) FROM activations GROUP BY license_key");

  conn.prepare("list_activations",
               "SELECT license_key,machine_id,activated_at_ms,last_seen_ms FROM activations WHERE license_key=$1 "
               "ORDER BY activated_at_ms ASC, machine_id ASC");

  conn.prepare("insert_contact",
               "INSERT INTO contacts(user_type,name,email,company,plan,message,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7) RETURNING id");

  conn.prepare("list_contacts",
               "SELECT id,user_type,name,email,company,plan,message,created_at_ms FROM contacts ORDER BY created_at_ms DESC, id DESC");
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
  std::unique_ptr<pqxx::connection> owned(conn);
  if (!owned->is_open()) {
    NOVE_LOG_WARN("dropping closed postgres connection");
    Forget();
    return;
  }
  {
    std::lock_guard lock(mutex_);
    idle_.push_back(std::move(owned));
  }
  cv_.notify_one();
}

void PgPool::Forget() {
  {
    std::lock_guard lock(mutex_);
    --live_connections_;
  }
  cv_.notify_one();
}

} // namespace nove::db::postgres
