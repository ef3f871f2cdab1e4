#include "license_registry.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/email.hpp"
#include "internal/util/errors.hpp"

namespace nove::core {

namespace {

constexpr const char* kLicenseNotFound = "ライセンスキーが見つかりません";

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message);
  }
}

void RequireNonEmpty(const std::string& value, const char* field) {
  if (util::Trim(value).empty()) {
    throw util::ValidationError(std::string(field) + " is required");
  }
}

std::string RequireEmail(const std::string& value, const char* field) {
  auto normalized = util::NormalizeEmail(value);
  if (!util::IsValidEmail(normalized)) {
    throw util::ValidationError(std::string(field) + " is not a valid email address");
  }
  return normalized;
}

} // namespace

std::string_view ToString(ActivationStatus status) {
  switch (status) {
    case ActivationStatus::kActivated:
      return "activated";
    case ActivationStatus::kValid:
      return "valid";
  }
  return "unknown";
}

LicenseRegistry::LicenseRegistry(std::shared_ptr<db::Repository> repository, const PlanCatalog& catalog, KeyGenerator key_generator,
                                 ClockFn clock)
    : repository_(std::move(repository)), catalog_(catalog), key_generator_(std::move(key_generator)), clock_(std::move(clock)) {
  if (!repository_) {
    throw std::invalid_argument("LicenseRegistry requires a repository");
  }
  if (!key_generator_ || !clock_) {
    throw std::invalid_argument("LicenseRegistry requires a key generator and a clock");
  }
}

util::Date LicenseRegistry::Today() const {
  return util::ToDate(clock_());
}

LicenseStatus LicenseRegistry::Evaluate(db::model::LicenseRecord record, std::uint32_t activated_count, const std::string& today) const {
  LicenseStatus status;
  status.is_expired      = record.valid_until < today;
  status.is_valid        = record.is_active && !status.is_expired;
  status.activated_count = activated_count;
  status.record          = std::move(record);
  return status;
}

void LicenseRegistry::InsertLicense(db::Transaction& tx, db::model::LicenseRecord& record) {
  auto result = repository_->InsertLicense(tx, record);
  if (result.code == db::ErrorCode::AlreadyExists) {
    // Key collision; the caller may simply retry.
    throw util::Conflict("キー生成に失敗しました。再試行してください。");
  }
  if (result.code == db::ErrorCode::ConstraintViolation && record.plan == db::model::kTrialPlan) {
    throw util::DuplicateTrial("このメールアドレスには既にトライアルライセンスが発行されています");
  }
  ThrowIfDbError(result, "insert license");
}

// ------------------------------------------------------------------
// Issuance
// ------------------------------------------------------------------

db::model::LicenseRecord LicenseRegistry::Issue(const IssueRequest& request) {
  const auto& plan = catalog_.Get(request.plan);
  RequireNonEmpty(request.customer_name, "customer_name");
  auto email = RequireEmail(request.customer_email, "customer_email");

  const int months = request.months.value_or(kDefaultMonths);
  if (months < 1 || months > kMaxMonths) {
    throw util::ValidationError("months must be between 1 and " + std::to_string(kMaxMonths));
  }

  // trial14 always runs for the fixed trial window; months does not apply.
  const bool trial       = plan.id == db::model::kTrialPlan;
  const int  window_days = trial ? kTrialPeriodDays : kDaysPerMonth * months;

  const auto now   = clock_();
  const auto today = util::ToDate(now);

  db::model::LicenseRecord record;
  record.license_key    = key_generator_(plan.id);
  record.plan           = plan.id;
  record.customer_name  = util::Trim(request.customer_name);
  record.customer_email = std::move(email);
  record.server_limit   = plan.server_limit;
  record.valid_from     = util::FormatDate(today);
  record.valid_until    = util::FormatDate(util::AddDays(today, window_days));
  record.is_active      = true;
  record.note           = request.note;
  record.created_at_ms  = util::ToUnixMillis(now);

  auto tx = repository_->Begin();
  if (trial && repository_->FindTrialByEmail(*tx, record.customer_email)) {
    throw util::DuplicateTrial("このメールアドレスには既にトライアルライセンスが発行されています");
  }
  InsertLicense(*tx, record);
  tx->Commit();

  NOVE_LOG_INFO("license issued", {observability::StringField("license_key", record.license_key),
                                   observability::StringField("plan", record.plan),
                                   observability::StringField("valid_until", record.valid_until)});
  return record;
}

db::model::LicenseRecord LicenseRegistry::IssueTrial(const TrialRequest& request) {
  RequireNonEmpty(request.name, "name");
  auto email = RequireEmail(request.email, "email");

  const auto& plan  = catalog_.Get(db::model::kTrialPlan);
  const auto  now   = clock_();
  const auto  today = util::ToDate(now);

  db::model::LicenseRecord record;
  record.license_key    = key_generator_(plan.id);
  record.plan           = plan.id;
  record.customer_name  = util::Trim(request.name);
  record.customer_email = email;
  record.server_limit   = plan.server_limit;
  record.valid_from     = util::FormatDate(today);
  record.valid_until    = util::FormatDate(util::AddDays(today, kTrialPeriodDays));
  record.is_active      = true;
  record.note           = request.company.empty() ? std::string() : "company: " + request.company;
  record.created_at_ms  = util::ToUnixMillis(now);

  db::model::ContactRecord contact;
  contact.user_type     = "trial";
  contact.name          = record.customer_name;
  contact.email         = std::move(email);
  contact.company       = request.company;
  contact.plan          = plan.id;
  contact.message       = plan.display_name + " 申込";
  contact.created_at_ms = record.created_at_ms;

  auto tx = repository_->Begin();
  if (repository_->FindTrialByEmail(*tx, record.customer_email)) {
    throw util::DuplicateTrial("このメールアドレスには既にトライアルライセンスが発行されています");
  }
  InsertLicense(*tx, record);
  ThrowIfDbError(repository_->InsertContact(*tx, contact), "insert trial contact");
  tx->Commit();

  NOVE_LOG_INFO("trial issued", {observability::StringField("license_key", record.license_key),
                                 observability::StringField("valid_until", record.valid_until)});
  return record;
}

// ------------------------------------------------------------------
// Validation gate
// ------------------------------------------------------------------

LicenseStatus LicenseRegistry::Validate(const std::string& license_key) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetLicense(*tx, license_key);
  if (!record) {
    throw util::NotFound(kLicenseNotFound);
  }
  const auto count = repository_->CountActivations(*tx, license_key);
  tx->Rollback();

  return Evaluate(std::move(*record), count, util::FormatDate(Today()));
}

// ------------------------------------------------------------------
// Activation ledger
// ------------------------------------------------------------------

ActivationResult LicenseRegistry::Activate(const std::string& license_key, const std::string& machine_id) {
  RequireNonEmpty(license_key, "license_key");
  RequireNonEmpty(machine_id, "machine_id");

  const auto now   = clock_();
  const auto today = util::FormatDate(util::ToDate(now));
  const auto ms    = util::ToUnixMillis(now);

  auto tx     = repository_->Begin();
  auto record = repository_->LockLicense(*tx, license_key);
  if (!record) {
    throw util::NotFound(kLicenseNotFound);
  }
  if (!record->is_active) {
    throw util::Forbidden(util::ForbiddenReason::kRevoked, "このライセンスは無効化されています");
  }
  if (record->valid_until < today) {
    throw util::Forbidden(util::ForbiddenReason::kExpired, "ライセンスの有効期限が切れています", record->valid_until);
  }

  ActivationResult result;
  if (repository_->GetActivation(*tx, license_key, machine_id)) {
    ThrowIfDbError(repository_->TouchActivation(*tx, license_key, machine_id, ms), "touch activation");
    result.status = ActivationStatus::kValid;
  } else {
    const auto count = repository_->CountActivations(*tx, license_key);
    if (record->server_limit > 0 && count >= record->server_limit) {
      throw util::Forbidden(util::ForbiddenReason::kLimitReached, "サーバー台数の上限に達しています", {}, record->server_limit);
    }

    db::model::ActivationRecord activation;
    activation.license_key     = license_key;
    activation.machine_id      = machine_id;
    activation.activated_at_ms = ms;
    activation.last_seen_ms    = ms;
    ThrowIfDbError(repository_->InsertActivation(*tx, activation), "insert activation");
    result.status = ActivationStatus::kActivated;
  }

  result.activated_count = repository_->CountActivations(*tx, license_key);
  tx->Commit();

  if (result.status == ActivationStatus::kActivated) {
    NOVE_LOG_INFO("machine activated", {observability::StringField("license_key", license_key),
                                        observability::StringField("machine_id", machine_id),
                                        observability::IntField("activated_count", result.activated_count)});
  }
  result.record = std::move(*record);
  return result;
}

std::vector<db::model::ActivationRecord> LicenseRegistry::ListActivations(const std::string& license_key) {
  auto tx = repository_->Begin();
  if (!repository_->GetLicense(*tx, license_key)) {
    throw util::NotFound(kLicenseNotFound);
  }
  auto activations = repository_->ListActivations(*tx, license_key);
  tx->Rollback();
  return activations;
}

void LicenseRegistry::RemoveActivation(const std::string& license_key, const std::string& machine_id) {
  auto tx = repository_->Begin();
  if (!repository_->LockLicense(*tx, license_key)) {
    throw util::NotFound(kLicenseNotFound);
  }
  ThrowIfDbError(repository_->DeleteActivation(*tx, license_key, machine_id), "delete activation");
  tx->Commit();

  NOVE_LOG_INFO("activation removed", {observability::StringField("license_key", license_key),
                                       observability::StringField("machine_id", machine_id)});
}

void LicenseRegistry::Revoke(const std::string& license_key) {
  auto tx = repository_->Begin();
  if (!repository_->LockLicense(*tx, license_key)) {
    throw util::NotFound(kLicenseNotFound);
  }
  ThrowIfDbError(repository_->SetLicenseActive(*tx, license_key, false), "revoke license");
  tx->Commit();

  NOVE_LOG_INFO("license revoked", {observability::StringField("license_key", license_key)});
}

std::vector<LicenseStatus> LicenseRegistry::ListLicenses() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListLicenses(*tx);
  auto counts  = repository_->CountAllActivations(*tx);
  tx->Rollback();

  const auto today = util::FormatDate(Today());

  std::vector<LicenseStatus> out;
  out.reserve(records.size());
  for (auto& record : records) {
    auto it    = counts.find(record.license_key);
    auto count = it == counts.end() ? 0u : it->second;
    out.push_back(Evaluate(std::move(record), count, today));
  }
  return out;
}

} // namespace nove::core
