#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/license_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/http/api_routes.hpp"
#include "internal/http/server.hpp"
#include "internal/notify/notification_worker.hpp"
#include "internal/service/contact_service.hpp"
#include "internal/service/license_service.hpp"

namespace nove::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<core::LicenseRegistry>      registry;
  std::shared_ptr<notify::NotificationWorker> notifications;

  std::shared_ptr<service::LicenseService> license_service;
  std::shared_ptr<service::ContactService> contact_service;

  std::shared_ptr<const http::ApiHandler> handler;
};

/*
  Build

  Constructs the entire backend based on runtime config and starts
  the notification workers.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and mail types.
*/
Application Build(const nove::runtime::config::RuntimeConfig& config);

// Repository for config.database(); runs the schema migrations.
std::shared_ptr<db::Repository> BuildRepository(const nove::runtime::config::RuntimeConfig& config);

http::ServerOptions ToServerOptions(const nove::runtime::config::RuntimeConfig& config);

} // namespace nove::factory
