#include "migrations.hpp"

namespace nove::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS contacts (id INTEGER PRIMARY KEY AUTOINCREMENT, user_type TEXT NOT NULL, name TEXT NOT NULL, email TEXT NOT NULL, "
      "company TEXT, plan TEXT, message TEXT, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS licenses (id INTEGER PRIMARY KEY AUTOINCREMENT, license_key TEXT UNIQUE NOT NULL, plan TEXT NOT NULL, "
      "customer_name TEXT NOT NULL, customer_email TEXT NOT NULL, server_limit INTEGER NOT NULL, valid_from TEXT NOT NULL, valid_until TEXT NOT NULL, "
      "is_active INTEGER NOT NULL DEFAULT 1, note TEXT, created_at_ms INTEGER NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS licenses_one_trial_per_email ON licenses(customer_email) WHERE plan = 'trial14';",
      "CREATE TABLE IF NOT EXISTS activations (license_key TEXT NOT NULL REFERENCES licenses(license_key), machine_id TEXT NOT NULL, "
      "activated_at_ms INTEGER NOT NULL, last_seen_ms INTEGER NOT NULL, PRIMARY KEY (license_key, machine_id));",
      "CREATE INDEX IF NOT EXISTS contacts_created_at ON contacts(created_at_ms);",
      "CREATE INDEX IF NOT EXISTS licenses_created_at ON licenses(created_at_ms);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS contacts (id BIGSERIAL PRIMARY KEY, user_type TEXT NOT NULL, name TEXT NOT NULL, email TEXT NOT NULL, "
      "company TEXT, plan TEXT, message TEXT, created_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS licenses (id BIGSERIAL PRIMARY KEY, license_key TEXT UNIQUE NOT NULL, plan TEXT NOT NULL, "
      "customer_name TEXT NOT NULL, customer_email TEXT NOT NULL, server_limit INTEGER NOT NULL CHECK (server_limit >= 0), valid_from TEXT NOT NULL, "
      "valid_until TEXT NOT NULL, is_active BOOLEAN NOT NULL DEFAULT TRUE, note TEXT, created_at_ms BIGINT NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS licenses_one_trial_per_email ON licenses(customer_email) WHERE plan = 'trial14';",
      "CREATE TABLE IF NOT EXISTS activations (license_key TEXT NOT NULL REFERENCES licenses(license_key), machine_id TEXT NOT NULL, "
      "activated_at_ms BIGINT NOT NULL, last_seen_ms BIGINT NOT NULL, PRIMARY KEY (license_key, machine_id));",
      "CREATE INDEX IF NOT EXISTS contacts_created_at ON contacts(created_at_ms);",
      "CREATE INDEX IF NOT EXISTS licenses_created_at ON licenses(created_at_ms);"};
  return kSchema;
}

} // namespace nove::db::sql
