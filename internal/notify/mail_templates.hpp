#pragma once

#include <string>
#include <string_view>

#include "email_message.hpp"
#include "internal/core/plan_catalog.hpp"
#include "internal/db/model/license_record.hpp"
#include "internal/util/time.hpp"

namespace nove::notify {

/*
  HTML mail bodies. All user-supplied text is escaped.
*/

struct ContactDetails {
  std::string user_type;
  std::string name;
  std::string email;
  std::string company; // company or business name
  std::string plan;
  std::string servers; // empty when not given
  std::string timeline;
  std::string message;
};

std::string EscapeHtml(std::string_view text);

EmailMessage ContactOperatorMail(const ContactDetails& contact, const std::string& operator_address, util::TimePoint received_at);
EmailMessage ContactAutoReplyMail(const ContactDetails& contact);

EmailMessage LicenseCustomerMail(const db::model::LicenseRecord& license, const core::PlanInfo& plan);
EmailMessage LicenseOperatorMail(const db::model::LicenseRecord& license, const core::PlanInfo& plan, const std::string& operator_address);

EmailMessage TrialCustomerMail(const db::model::LicenseRecord& license, const std::string& install_command);
EmailMessage TrialOperatorMail(const db::model::LicenseRecord& license, const std::string& company, const std::string& operator_address);

} // namespace nove::notify
