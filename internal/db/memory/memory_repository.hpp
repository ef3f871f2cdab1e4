#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace nove::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::LicenseRecord> licenses;
    // license_key -> machine_id -> activation
    std::unordered_map<std::string, std::map<std::string, model::ActivationRecord>> activations;
    std::vector<model::ContactRecord> contacts;

    int64_t next_license_id = 1;
    int64_t next_contact_id = 1;
  };

  // Held by a MemoryTransaction for its whole lifetime.
  std::mutex mutex_;
  State committed_;
};

} // namespace nove::db::memory
