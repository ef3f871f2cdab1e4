#pragma once

#include <string>

#include "nove/v1.hpp"
#include "service_context.hpp"

namespace nove::service {

/*
  License endpoints: wire messages in, wire messages out.

  Business rules live in core::LicenseRegistry; this layer maps
  messages, builds the notification mails and counts activation
  outcomes.
*/
class LicenseService {
 public:
  explicit LicenseService(ServiceContext ctx);

  nove::v1::GenerateLicenseResponse Generate(const nove::v1::GenerateLicenseRequest& request);
  nove::v1::TrialResponse           RequestTrial(const nove::v1::TrialRequest& request);

  nove::v1::ActivateResponse Activate(const nove::v1::ActivateRequest& request);
  nove::v1::License          Validate(const std::string& license_key);

  nove::v1::LicenseList    List();
  nove::v1::ActivationList ListActivations(const std::string& license_key);
  nove::v1::StatusResponse RemoveActivation(const std::string& license_key, const std::string& machine_id);
  nove::v1::StatusResponse Revoke(const std::string& license_key);

  std::string InstallCommand(const std::string& license_key) const;

 private:
  ServiceContext ctx_;
};

} // namespace nove::service
