#pragma once

#include <memory>
#include <string>

namespace nove::core {
class LicenseRegistry;
}
namespace nove::db {
class Repository;
}
namespace nove::notify {
class NotificationSink;
}

namespace nove::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<nove::core::LicenseRegistry>    registry;
  std::shared_ptr<nove::db::Repository>           repository;
  std::shared_ptr<nove::notify::NotificationSink> notifier;

  // Recipient of operator notices; empty disables them.
  std::string operator_address;

  // "{key}" is replaced with the trial license key.
  std::string install_command_template;
};

} // namespace nove::service
