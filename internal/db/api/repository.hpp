#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/activation_record.hpp"
#include "internal/db/model/contact_record.hpp"
#include "internal/db/model/license_record.hpp"

namespace nove::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - A transaction that called LockLicense() excludes every other
    writer of that license until it commits or rolls back
  - Activation admission (count then insert) relies on this behavior

  Uniqueness enforced by every backend:
    licenses.license_key                       -> AlreadyExists
    (activations.license_key, machine_id)      -> AlreadyExists
    one plan='trial14' license per email       -> ConstraintViolation

  The DB is the source of truth for:
    licenses
    activations
    contacts
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Licenses
  // ---------------------------------------------------------------------

  // Assigns record.id on success.
  virtual Result InsertLicense(Transaction&, model::LicenseRecord& record) = 0;

  virtual std::optional<model::LicenseRecord> GetLicense(Transaction&, const std::string& license_key) = 0;

  // Same as GetLicense, and takes the row lock used for activation admission.
  virtual std::optional<model::LicenseRecord> LockLicense(Transaction&, const std::string& license_key) = 0;

  // Newest first.
  virtual std::vector<model::LicenseRecord> ListLicenses(Transaction&) = 0;

  virtual std::optional<model::LicenseRecord> FindTrialByEmail(Transaction&, const std::string& customer_email) = 0;

  virtual Result SetLicenseActive(Transaction&, const std::string& license_key, bool is_active) = 0;

  // ---------------------------------------------------------------------
  // Activations
  // ---------------------------------------------------------------------

  virtual Result InsertActivation(Transaction&, const model::ActivationRecord& record) = 0;

  virtual std::optional<model::ActivationRecord> GetActivation(Transaction&, const std::string& license_key,
                                                               const std::string& machine_id) = 0;

  virtual Result TouchActivation(Transaction&, const std::string& license_key, const std::string& machine_id, uint64_t last_seen_ms) = 0;

  virtual Result DeleteActivation(Transaction&, const std::string& license_key, const std::string& machine_id) = 0;

  virtual uint32_t CountActivations(Transaction&, const std::string& license_key) = 0;

  // license_key -> number of bound machines, for every license with at least one.
  virtual std::unordered_map<std::string, uint32_t> CountAllActivations(Transaction&) = 0;

  // Oldest activation first.
  virtual std::vector<model::ActivationRecord> ListActivations(Transaction&, const std::string& license_key) = 0;

  // ---------------------------------------------------------------------
  // Contacts
  // ---------------------------------------------------------------------

  // Assigns record.id on success.
  virtual Result InsertContact(Transaction&, model::ContactRecord& record) = 0;

  // Newest first.
  virtual std::vector<model::ContactRecord> ListContacts(Transaction&) = 0;
};

} // namespace nove::db
