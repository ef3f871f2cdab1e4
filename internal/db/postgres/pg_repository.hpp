#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace nove::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertLicense(Transaction&, model::LicenseRecord&) override;
  std::optional<model::LicenseRecord> GetLicense(Transaction&, const std::string&) override;
  std::optional<model::LicenseRecord> LockLicense(Transaction&, const std::string&) override;
  std::vector<model::LicenseRecord> ListLicenses(Transaction&) override;
  std::optional<model::LicenseRecord> FindTrialByEmail(Transaction&, const std::string&) override;
  Result SetLicenseActive(Transaction&, const std::string&, bool) override;

  Result InsertActivation(Transaction&, const model::ActivationRecord&) override;
  std::optional<model::ActivationRecord> GetActivation(Transaction&, const std::string&, const std::string&) override;
  Result TouchActivation(Transaction&, const std::string&, const std::string&, uint64_t) override;
  Result DeleteActivation(Transaction&, const std::string&, const std::string&) override;
  uint32_t CountActivations(Transaction&, const std::string&) override;
  std::unordered_map<std::string, uint32_t> CountAllActivations(Transaction&) override;
  std::vector<model::ActivationRecord> ListActivations(Transaction&, const std::string&) override;

  Result InsertContact(Transaction&, model::ContactRecord&) override;
  std::vector<model::ContactRecord> ListContacts(Transaction&) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

} // namespace nove::db::postgres
