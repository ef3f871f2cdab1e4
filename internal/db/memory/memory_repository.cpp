#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace nove::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Licenses
// ------------------------------------------------------------------

Result MemoryRepository::InsertLicense(Transaction& t, model::LicenseRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.licenses.contains(r.license_key)) {
    return Result::Err(ErrorCode::AlreadyExists, "license_key already exists");
  }
  if (r.plan == model::kTrialPlan) {
    for (const auto& [_, existing] : s.licenses) {
      if (existing.plan == model::kTrialPlan && existing.customer_email == r.customer_email) {
        return Result::Err(ErrorCode::ConstraintViolation, "trial already issued for customer_email");
      }
    }
  }
  r.id                     = s.next_license_id++;
  s.licenses[r.license_key] = r;
  return Result::Ok();
}

std::optional<model::LicenseRecord> MemoryRepository::GetLicense(Transaction& t, const std::string& license_key) {
  const auto& s  = TX(t).View();
  auto        it = s.licenses.find(license_key);
  if (it == s.licenses.end()) return std::nullopt;
  return it->second;
}

std::optional<model::LicenseRecord> MemoryRepository::LockLicense(Transaction& t, const std::string& license_key) {
  // The transaction already holds the repository lock.
  return GetLicense(t, license_key);
}

std::vector<model::LicenseRecord> MemoryRepository::ListLicenses(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::LicenseRecord> records;
  records.reserve(s.licenses.size());
  for (const auto& [_, record] : s.licenses) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id > b.id;
  });
  return records;
}

std::optional<model::LicenseRecord> MemoryRepository::FindTrialByEmail(Transaction& t, const std::string& customer_email) {
  for (const auto& [_, record] : TX(t).View().licenses) {
    if (record.plan == model::kTrialPlan && record.customer_email == customer_email) {
      return record;
    }
  }
  return std::nullopt;
}

Result MemoryRepository::SetLicenseActive(Transaction& t, const std::string& license_key, bool is_active) {
  auto& s  = TX(t).Mutable();
  auto  it = s.licenses.find(license_key);
  if (it == s.licenses.end()) return Result::Err(ErrorCode::NotFound);
  it->second.is_active = is_active;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Activations
// ------------------------------------------------------------------

Result MemoryRepository::InsertActivation(Transaction& t, const model::ActivationRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.licenses.contains(r.license_key)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown license_key");
  }
  auto& machines = s.activations[r.license_key];
  if (machines.contains(r.machine_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "machine already bound");
  }
  machines[r.machine_id] = r;
  return Result::Ok();
}

std::optional<model::ActivationRecord> MemoryRepository::GetActivation(Transaction& t, const std::string& license_key,
                                                                       const std::string& machine_id) {
  const auto& s  = TX(t).View();
  auto        it = s.activations.find(license_key);
  if (it == s.activations.end()) return std::nullopt;
  auto machine = it->second.find(machine_id);
  if (machine == it->second.end()) return std::nullopt;
  return machine->second;
}

Result MemoryRepository::TouchActivation(Transaction& t, const std::string& license_key, const std::string& machine_id,
                                         uint64_t last_seen_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.activations.find(license_key);
  if (it == s.activations.end()) return Result::Err(ErrorCode::NotFound);
  auto machine = it->second.find(machine_id);
  if (machine == it->second.end()) return Result::Err(ErrorCode::NotFound);
  machine->second.last_seen_ms = last_seen_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteActivation(Transaction& t, const std::string& license_key, const std::string& machine_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.activations.find(license_key);
  if (it != s.activations.end()) {
    it->second.erase(machine_id);
    if (it->second.empty()) s.activations.erase(it);
  }
  return Result::Ok();
}

uint32_t MemoryRepository::CountActivations(Transaction& t, const std::string& license_key) {
  const auto& s  = TX(t).View();
  auto        it = s.activations.find(license_key);
  return it == s.activations.end() ? 0 : static_cast<uint32_t>(it->second.size());
}

std::unordered_map<std::string, uint32_t> MemoryRepository::CountAllActivations(Transaction& t) {
  std::unordered_map<std::string, uint32_t> counts;
  for (const auto& [license_key, machines] : TX(t).View().activations) {
    if (!machines.empty()) counts[license_key] = static_cast<uint32_t>(machines.size());
  }
  return counts;
}

std::vector<model::ActivationRecord> MemoryRepository::ListActivations(Transaction& t, const std::string& license_key) {
  std::vector<model::ActivationRecord> out;
  const auto&                          s  = TX(t).View();
  auto                                 it = s.activations.find(license_key);
  if (it == s.activations.end()) return out;

  out.reserve(it->second.size());
  for (const auto& [_, record] : it->second) {
    out.push_back(record);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.activated_at_ms < b.activated_at_ms; });
  return out;
}

// ------------------------------------------------------------------
// Contacts
// ------------------------------------------------------------------

Result MemoryRepository::InsertContact(Transaction& t, model::ContactRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_contact_id++;
  s.contacts.push_back(r);
  return Result::Ok();
}

std::vector<model::ContactRecord> MemoryRepository::ListContacts(Transaction& t) {
  auto out = TX(t).View().contacts;
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id > b.id;
  });
  return out;
}

} // namespace nove::db::memory
