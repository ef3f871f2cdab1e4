#pragma once

#include <cstdint>
#include <string>

namespace nove::db::model {

// One machine bound to a license. (license_key, machine_id) is unique.
struct ActivationRecord {
  std::string license_key;
  std::string machine_id;
  uint64_t    activated_at_ms = 0;
  uint64_t    last_seen_ms    = 0;
};

} // namespace nove::db::model
