#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/core/license_key.hpp"
#include "internal/core/plan_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/notify/fallback_notifier.hpp"
#include "internal/notify/mail_api_notifier.hpp"
#include "internal/notify/notification_queue.hpp"
#include "internal/notify/smtp_notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if NOVE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if NOVE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace nove::factory {

using nove::runtime::config::RuntimeConfig;
using observability::StringField;

namespace {

std::shared_ptr<notify::FallbackNotifier> BuildNotifier(const RuntimeConfig& config) {
  const auto&                     notification = config.notification();
  const std::chrono::milliseconds timeout{notification.timeout_ms()};

  notify::SmtpOptions smtp;
  smtp.host         = notification.smtp().host();
  smtp.port         = notification.smtp().port();
  smtp.username     = notification.smtp().username();
  smtp.password     = notification.smtp().password();
  smtp.from_address = notification.from_address();
  smtp.starttls     = !notification.smtp().has_starttls() || notification.smtp().starttls();
  smtp.timeout      = timeout;

  notify::MailApiOptions mail_api;
  mail_api.endpoint     = notification.mail_api().endpoint();
  mail_api.api_key      = notification.mail_api().api_key();
  mail_api.from_address = notification.from_address().empty() ? smtp.username : notification.from_address();
  mail_api.timeout      = timeout;

  // The mail API is tried first; SMTP is the fallback.
  std::vector<std::shared_ptr<notify::Notifier>> channels;
  channels.push_back(std::make_shared<notify::MailApiNotifier>(std::move(mail_api)));
  channels.push_back(std::make_shared<notify::SmtpNotifier>(std::move(smtp)));

  auto notifier = std::make_shared<notify::FallbackNotifier>(std::move(channels));
  if (!notifier->AnyConfigured()) {
    NOVE_LOG_WARN("no mail channel configured; notifications will be skipped");
  }
  return notifier;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if NOVE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    NOVE_LOG_INFO("database ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if NOVE_DB_POSTGRES
    db::postgres::PgPool::InstallSchema(database.postgres().connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    NOVE_LOG_INFO("database ready", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  NOVE_LOG_WARN("using in-memory database; data is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

http::ServerOptions ToServerOptions(const RuntimeConfig& config) {
  http::ServerOptions options;
  options.bind_address    = config.server().bind_address();
  options.port            = static_cast<std::uint16_t>(config.server().port());
  options.threads         = config.server().threads();
  options.request_timeout = std::chrono::milliseconds(config.server().request_timeout_ms());
  options.max_body_bytes  = config.server().max_body_bytes();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence and core
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  const std::string key_prefix = config.license().key_prefix();
  app.registry                 = std::make_shared<core::LicenseRegistry>(
      app.repository, core::PlanCatalog::Default(), [key_prefix](std::string_view plan) { return core::GenerateLicenseKey(key_prefix, plan); });

  // ------------------------------------------------------------------
  // Notifications
  // ------------------------------------------------------------------
  auto queue        = std::make_shared<notify::NotificationQueue>(config.notification().queue_capacity());
  app.notifications = std::make_shared<notify::NotificationWorker>(std::move(queue), BuildNotifier(config));
  app.notifications->Start(config.notification().worker_threads());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.registry                 = app.registry;
  ctx.repository               = app.repository;
  ctx.notifier                 = app.notifications;
  ctx.operator_address         = config.notification().operator_address();
  ctx.install_command_template = config.license().install_command_template();

  app.license_service = std::make_shared<service::LicenseService>(ctx);
  app.contact_service = std::make_shared<service::ContactService>(ctx);

  // ------------------------------------------------------------------
  // HTTP
  // ------------------------------------------------------------------
  http::ApiOptions api;
  api.admin_token = config.admin().token();
  api.allowed_origins.assign(config.cors().allowed_origins().begin(), config.cors().allowed_origins().end());
  if (api.admin_token.empty()) {
    NOVE_LOG_WARN("admin token is empty; admin routes will reject every request");
  }

  app.handler = std::make_shared<const http::ApiHandler>(app.license_service, app.contact_service, std::move(api));

  return app;
}

} // namespace nove::factory
