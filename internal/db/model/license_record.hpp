#pragma once

#include <cstdint>
#include <string>

namespace nove::db::model {

// Plan whose licenses are limited to one per customer_email.
inline constexpr const char* kTrialPlan = "trial14";

/*
  Persistent license row.

  IMPORTANT:
  - license_key is unique and never changes once issued.
  - is_active is the only mutable column (revocation).
  - valid_from / valid_until are ISO "YYYY-MM-DD"; valid_until is inclusive.
*/

struct LicenseRecord {
  int64_t     id = 0;
  std::string license_key;
  std::string plan;
  std::string customer_name;
  std::string customer_email;

  // 0 = unlimited
  uint32_t server_limit = 0;

  std::string valid_from;
  std::string valid_until;
  bool        is_active = true;
  std::string note;

  uint64_t created_at_ms = 0;
};

} // namespace nove::db::model
