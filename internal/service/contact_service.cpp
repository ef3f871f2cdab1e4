#include "contact_service.hpp"

#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/notify/mail_templates.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/util/email.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe.hpp"

namespace nove::service {

using namespace nove::v1;

namespace {

void RequireField(const std::string& value, const char* field) {
  if (util::Trim(value).empty()) {
    throw util::ValidationError(std::string(field) + " is required");
  }
}

} // namespace

ContactService::ContactService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatusResponse ContactService::Submit(const ContactForm& form) {
  return ObserveCall("ContactService.Submit", [&] {
    RequireField(form.user_type(), "user_type");
    RequireField(form.name(), "name");
    RequireField(form.message(), "message");

    const auto email = util::NormalizeEmail(form.email());
    if (!util::IsValidEmail(email)) {
      throw util::ValidationError("email is not a valid email address");
    }
    if (form.has_servers() && form.servers() < 0) {
      throw util::ValidationError("servers must not be negative");
    }

    const auto now = util::Now();

    db::model::ContactRecord record;
    record.user_type     = util::Trim(form.user_type());
    record.name          = util::Trim(form.name());
    record.email         = email;
    record.company       = form.company().empty() ? form.business_name() : form.company();
    record.plan          = form.plan();
    record.message       = form.message();
    record.created_at_ms = util::ToUnixMillis(now);

    auto tx     = ctx_.repository->Begin();
    auto result = ctx_.repository->InsertContact(*tx, record);
    if (!result) {
      throw std::runtime_error("insert contact: " + result.message);
    }
    tx->Commit();

    notify::ContactDetails details;
    details.user_type = record.user_type;
    details.name      = record.name;
    details.email     = record.email;
    details.company   = record.company;
    details.plan      = record.plan;
    details.servers   = form.has_servers() ? std::to_string(form.servers()) : std::string();
    details.timeline  = form.timeline();
    details.message   = record.message;

    if (!ctx_.operator_address.empty()) {
      ctx_.notifier->Notify(notify::ContactOperatorMail(details, ctx_.operator_address, now));
    }
    ctx_.notifier->Notify(notify::ContactAutoReplyMail(details));

    StatusResponse resp;
    resp.set_status("ok");
    resp.set_message("送信完了しました");
    return resp;
  });
}

ContactList ContactService::List() {
  return ObserveCall("ContactService.List", [&] {
    auto tx      = ctx_.repository->Begin();
    auto records = ctx_.repository->ListContacts(*tx);
    tx->Rollback();

    ContactList resp;
    for (const auto& record : records) {
      auto* contact = resp.add_contacts();
      contact->set_id(record.id);
      contact->set_user_type(record.user_type);
      contact->set_name(record.name);
      contact->set_email(record.email);
      contact->set_company(record.company);
      contact->set_plan(record.plan);
      contact->set_message(record.message);
      contact->set_created_at(util::FormatTimestamp(util::FromUnixMillis(record.created_at_ms)));
    }
    return resp;
  });
}

} // namespace nove::service
