#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/plan_catalog.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace nove::core {

struct IssueRequest {
  std::string        plan;
  std::string        customer_name;
  std::string        customer_email;
  std::optional<int> months; // 12 when absent
  std::string        note;
};

struct TrialRequest {
  std::string name;
  std::string email;
  std::string company;
};

struct LicenseStatus {
  db::model::LicenseRecord record;
  bool                     is_expired      = false;
  bool                     is_valid        = false;
  std::uint32_t            activated_count = 0;
};

enum class ActivationStatus {
  kActivated, // new machine bound
  kValid,     // machine already bound; last_seen refreshed
};

struct ActivationResult {
  ActivationStatus         status = ActivationStatus::kActivated;
  db::model::LicenseRecord record;
  std::uint32_t            activated_count = 0;
};

std::string_view ToString(ActivationStatus status);

/*
  License issuance, validation and activation ledger.

  Every mutating call runs in a single repository transaction. Activate
  locks the license row first, so count-then-insert admission cannot
  over-admit under concurrent callers.

  Errors are reported with the util:: exception types:
    NotFound, Conflict, DuplicateTrial, ValidationError, Forbidden.
*/
class LicenseRegistry {
 public:
  static constexpr int kDefaultMonths   = 12;
  static constexpr int kMaxMonths       = 1200;
  static constexpr int kDaysPerMonth    = 30;
  static constexpr int kTrialPeriodDays = 14;

  using KeyGenerator = std::function<std::string(std::string_view plan)>;
  using ClockFn      = std::function<util::TimePoint()>;

  LicenseRegistry(std::shared_ptr<db::Repository> repository, const PlanCatalog& catalog, KeyGenerator key_generator,
                  ClockFn clock = util::Now);

  db::model::LicenseRecord Issue(const IssueRequest& request);
  db::model::LicenseRecord IssueTrial(const TrialRequest& request);

  LicenseStatus Validate(const std::string& license_key);

  ActivationResult Activate(const std::string& license_key, const std::string& machine_id);

  std::vector<db::model::ActivationRecord> ListActivations(const std::string& license_key);
  void                                     RemoveActivation(const std::string& license_key, const std::string& machine_id);

  void Revoke(const std::string& license_key);

  // Newest first.
  std::vector<LicenseStatus> ListLicenses();

  const PlanCatalog& Catalog() const {
    return catalog_;
  }

 private:
  util::Date    Today() const;
  LicenseStatus Evaluate(db::model::LicenseRecord record, std::uint32_t activated_count, const std::string& today) const;
  void          InsertLicense(db::Transaction& tx, db::model::LicenseRecord& record);

  std::shared_ptr<db::Repository> repository_;
  const PlanCatalog&              catalog_;
  KeyGenerator                    key_generator_;
  ClockFn                         clock_;
};

} // namespace nove::core
