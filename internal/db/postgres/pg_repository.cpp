#include "pg_repository.hpp"

#include <string_view>

namespace nove::db::postgres {

namespace {

model::LicenseRecord ReadLicense(const pqxx::row& row) {
  model::LicenseRecord r;
  r.id             = row[0].as<int64_t>();
  r.license_key    = row[1].c_str();
  r.plan           = row[2].c_str();
  r.customer_name  = row[3].c_str();
  r.customer_email = row[4].c_str();
  r.server_limit   = row[5].as<uint32_t>();
  r.valid_from     = row[6].c_str();
  r.valid_until    = row[7].c_str();
  r.is_active      = row[8].as<bool>();
  r.note           = row[9].is_null() ? "" : row[9].c_str();
  r.created_at_ms  = row[10].as<uint64_t>();
  return r;
}

model::ActivationRecord ReadActivation(const pqxx::row& row) {
  model::ActivationRecord r;
  r.license_key     = row[0].c_str();
  r.machine_id      = row[1].c_str();
  r.activated_at_ms = row[2].as<uint64_t>();
  r.last_seen_ms    = row[3].as<uint64_t>();
  return r;
}

model::ContactRecord ReadContact(const pqxx::row& row) {
  model::ContactRecord r;
  r.id            = row[0].as<int64_t>();
  r.user_type     = row[1].c_str();
  r.name          = row[2].c_str();
  r.email         = row[3].c_str();
  r.company       = row[4].is_null() ? "" : row[4].c_str();
  r.plan          = row[5].is_null() ? "" : row[5].c_str();
  r.message       = row[6].is_null() ? "" : row[6].c_str();
  r.created_at_ms = row[7].as<uint64_t>();
  return r;
}

std::optional<model::LicenseRecord> FirstLicense(const pqxx::result& res) {
  if (res.empty()) return std::nullopt;
  return ReadLicense(res[0]);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    if (std::string_view(e.what()).find("licenses_one_trial_per_email") != std::string_view::npos) {
      return Result::Err(ErrorCode::ConstraintViolation, e.what());
    }
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Licenses
// ------------------------------------------------------------------

Result PgRepository::InsertLicense(Transaction& t, model::LicenseRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_license", r.license_key, r.plan, r.customer_name, r.customer_email, r.server_limit,
                                          r.valid_from, r.valid_until, r.is_active, r.note, r.created_at_ms);
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LicenseRecord> PgRepository::GetLicense(Transaction& t, const std::string& license_key) {
  return FirstLicense(TX(t).Work().exec_prepared("get_license", license_key));
}

std::optional<model::LicenseRecord> PgRepository::LockLicense(Transaction& t, const std::string& license_key) {
  return FirstLicense(TX(t).Work().exec_prepared("lock_license", license_key));
}

std::vector<model::LicenseRecord> PgRepository::ListLicenses(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_licenses");

  std::vector<model::LicenseRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadLicense(row));
  }
  return out;
}

std::optional<model::LicenseRecord> PgRepository::FindTrialByEmail(Transaction& t, const std::string& customer_email) {
  return FirstLicense(TX(t).Work().exec_prepared("find_trial_by_email", customer_email));
}

Result PgRepository::SetLicenseActive(Transaction& t, const std::string& license_key, bool is_active) {
  try {
    auto res = TX(t).Work().exec_prepared("set_license_active", license_key, is_active);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Activations
// ------------------------------------------------------------------

Result PgRepository::InsertActivation(Transaction& t, const model::ActivationRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_activation", r.license_key, r.machine_id, r.activated_at_ms, r.last_seen_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ActivationRecord> PgRepository::GetActivation(Transaction& t, const std::string& license_key,
                                                                   const std::string& machine_id) {
  auto res = TX(t).Work().exec_prepared("get_activation", license_key, machine_id);
  if (res.empty()) return std::nullopt;
  return ReadActivation(res[0]);
}

Result PgRepository::TouchActivation(Transaction& t, const std::string& license_key, const std::string& machine_id,
                                     uint64_t last_seen_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("touch_activation", license_key, machine_id, last_seen_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteActivation(Transaction& t, const std::string& license_key, const std::string& machine_id) {
  try {
    TX(t).Work().exec_prepared("delete_activation", license_key, machine_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint32_t PgRepository::CountActivations(Transaction& t, const std::string& license_key) {
  auto res = TX(t).Work().exec_prepared("count_activations", license_key);
  return res[0][0].as<uint32_t>();
}

std::unordered_map<std::string, uint32_t> PgRepository::CountAllActivations(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("count_all_activations");

  std::unordered_map<std::string, uint32_t> counts;
  for (const auto& row : res) {
    counts[row[0].c_str()] = row[1].as<uint32_t>();
  }
  return counts;
}

std::vector<model::ActivationRecord> PgRepository::ListActivations(Transaction& t, const std::string& license_key) {
  auto res = TX(t).Work().exec_prepared("list_activations", license_key);

  std::vector<model::ActivationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadActivation(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Contacts
// ------------------------------------------------------------------

Result PgRepository::InsertContact(Transaction& t, model::ContactRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_contact", r.user_type, r.name, r.email, r.company, r.plan, r.message, r.created_at_ms);
    r.id     = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ContactRecord> PgRepository::ListContacts(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_contacts");

  std::vector<model::ContactRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadContact(row));
  }
  return out;
}

} // namespace nove::db::postgres
