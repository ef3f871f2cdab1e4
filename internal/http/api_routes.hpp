#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cors.hpp"
#include "router.hpp"

namespace nove::service {
class LicenseService;
class ContactService;
} // namespace nove::service

namespace nove::http {

inline constexpr const char* kAdminTokenHeader = "X-Admin-Token";

struct ApiOptions {
  // Shared secret for admin routes; empty rejects every admin request.
  std::string              admin_token;
  std::vector<std::string> allowed_origins;
};

/*
  Maps HTTP requests onto the services.

  Handle() never throws: every failure becomes a JSON error response.
  It also applies CORS, the Server header, access logging and request
  metrics, so it can be exercised without a socket.
*/
class ApiHandler {
 public:
  ApiHandler(std::shared_ptr<service::LicenseService> licenses, std::shared_ptr<service::ContactService> contacts, ApiOptions options);

  Response Handle(const Request& request) const;

  bool IsAuthorized(const Request& request) const;

 private:
  void     RegisterRoutes();
  Response Dispatch(const Request& request, std::string& route_name, std::string& error) const;

  std::shared_ptr<service::LicenseService> licenses_;
  std::shared_ptr<service::ContactService> contacts_;
  std::string                              admin_token_;
  CorsPolicy                               cors_;
  Router                                   router_;
};

} // namespace nove::http
