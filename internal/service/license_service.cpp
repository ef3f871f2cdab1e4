#include "license_service.hpp"

#include <fmt/format.h>

#include "internal/core/license_registry.hpp"
#include "internal/notify/mail_templates.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe.hpp"

namespace nove::service {

using namespace nove::v1;

namespace {

std::string FormatMillis(uint64_t ms) {
  return util::FormatTimestamp(util::FromUnixMillis(ms));
}

License ToLicense(const core::LicenseStatus& status, const core::PlanCatalog& catalog) {
  const auto& record = status.record;

  License out;
  out.set_id(record.id);
  out.set_license_key(record.license_key);
  out.set_plan(record.plan);
  if (const auto* plan = catalog.Find(record.plan)) {
    out.set_plan_name(plan->display_name);
  }
  out.set_customer_name(record.customer_name);
  out.set_customer_email(record.customer_email);
  out.set_server_limit(record.server_limit);
  out.set_valid_from(record.valid_from);
  out.set_valid_until(record.valid_until);
  out.set_is_active(record.is_active);
  out.set_note(record.note);
  out.set_created_at(FormatMillis(record.created_at_ms));
  out.set_is_expired(status.is_expired);
  out.set_is_valid(status.is_valid);
  out.set_activated_count(status.activated_count);
  return out;
}

StatusResponse Ok(std::string message) {
  StatusResponse out;
  out.set_status("ok");
  out.set_message(std::move(message));
  return out;
}

} // namespace

LicenseService::LicenseService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::string LicenseService::InstallCommand(const std::string& license_key) const {
  std::string command = ctx_.install_command_template;
  for (auto pos = command.find("{key}"); pos != std::string::npos; pos = command.find("{key}", pos + license_key.size())) {
    command.replace(pos, 5, license_key);
  }
  return command;
}

GenerateLicenseResponse LicenseService::Generate(const GenerateLicenseRequest& request) {
  return ObserveCall("LicenseService.Generate", [&] {
    core::IssueRequest issue;
    issue.plan           = request.plan();
    issue.customer_name  = request.customer_name();
    issue.customer_email = request.customer_email();
    if (request.has_months()) issue.months = request.months();
    issue.note = request.note();

    const auto  record = ctx_.registry->Issue(issue);
    const auto& plan   = ctx_.registry->Catalog().Get(record.plan);

    ctx_.notifier->Notify(notify::LicenseCustomerMail(record, plan));
    if (!ctx_.operator_address.empty()) {
      ctx_.notifier->Notify(notify::LicenseOperatorMail(record, plan, ctx_.operator_address));
    }

    GenerateLicenseResponse resp;
    resp.set_status("ok");
    resp.set_license_key(record.license_key);
    resp.set_plan(record.plan);
    resp.set_plan_name(plan.display_name);
    resp.set_customer_email(record.customer_email);
    resp.set_valid_from(record.valid_from);
    resp.set_valid_until(record.valid_until);
    resp.set_server_limit(record.server_limit);
    return resp;
  });
}

TrialResponse LicenseService::RequestTrial(const TrialRequest& request) {
  return ObserveCall("LicenseService.RequestTrial", [&] {
    core::TrialRequest trial{request.name(), request.email(), request.company()};

    const auto record  = ctx_.registry->IssueTrial(trial);
    const auto command = InstallCommand(record.license_key);

    ctx_.notifier->Notify(notify::TrialCustomerMail(record, command));
    if (!ctx_.operator_address.empty()) {
      ctx_.notifier->Notify(notify::TrialOperatorMail(record, request.company(), ctx_.operator_address));
    }

    TrialResponse resp;
    resp.set_status("ok");
    resp.set_license_key(record.license_key);
    resp.set_plan(record.plan);
    resp.set_valid_from(record.valid_from);
    resp.set_valid_until(record.valid_until);
    resp.set_server_limit(record.server_limit);
    resp.set_install_command(command);
    return resp;
  });
}

ActivateResponse LicenseService::Activate(const ActivateRequest& request) {
  return ObserveCall("LicenseService.Activate", [&] {
    auto& metrics = observability::Metrics::Instance();

    core::ActivationResult result;
    try {
      result = ctx_.registry->Activate(request.license_key(), request.machine_id());
    } catch (const util::Forbidden& e) {
      metrics.RecordActivation(util::ToString(e.reason()));
      throw;
    } catch (const util::NotFound&) {
      metrics.RecordActivation("not_found");
      throw;
    }
    metrics.RecordActivation(core::ToString(result.status));

    ActivateResponse resp;
    resp.set_is_valid(true);
    resp.set_status(std::string(core::ToString(result.status)));
    resp.set_plan(result.record.plan);
    resp.set_customer_name(result.record.customer_name);
    resp.set_valid_until(result.record.valid_until);
    resp.set_server_limit(result.record.server_limit);
    resp.set_activated_count(result.activated_count);
    return resp;
  });
}

License LicenseService::Validate(const std::string& license_key) {
  return ObserveCall("LicenseService.Validate", [&] { return ToLicense(ctx_.registry->Validate(license_key), ctx_.registry->Catalog()); });
}

LicenseList LicenseService::List() {
  return ObserveCall("LicenseService.List", [&] {
    LicenseList resp;
    for (const auto& status : ctx_.registry->ListLicenses()) {
      *resp.add_licenses() = ToLicense(status, ctx_.registry->Catalog());
    }
    return resp;
  });
}

ActivationList LicenseService::ListActivations(const std::string& license_key) {
  return ObserveCall("LicenseService.ListActivations", [&] {
    const auto status = ctx_.registry->Validate(license_key);

    ActivationList resp;
    resp.set_license_key(license_key);
    resp.set_server_limit(status.record.server_limit);
    for (const auto& record : ctx_.registry->ListActivations(license_key)) {
      auto* activation = resp.add_activations();
      activation->set_machine_id(record.machine_id);
      activation->set_activated_at(FormatMillis(record.activated_at_ms));
      activation->set_last_seen(FormatMillis(record.last_seen_ms));
    }
    return resp;
  });
}

StatusResponse LicenseService::RemoveActivation(const std::string& license_key, const std::string& machine_id) {
  return ObserveCall("LicenseService.RemoveActivation", [&] {
    ctx_.registry->RemoveActivation(license_key, machine_id);
    return Ok(fmt::format("{} の {} を解除しました", license_key, machine_id));
  });
}

StatusResponse LicenseService::Revoke(const std::string& license_key) {
  return ObserveCall("LicenseService.Revoke", [&] {
    ctx_.registry->Revoke(license_key);
    return Ok(fmt::format("{} を無効化しました", license_key));
  });
}

} // namespace nove::service
