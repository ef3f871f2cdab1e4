#pragma once

#include <cstdint>
#include <string>

namespace nove::db::model {

struct ContactRecord {
  int64_t     id = 0;
  std::string user_type;
  std::string name;
  std::string email;
  std::string company;
  std::string plan;
  std::string message;
  uint64_t    created_at_ms = 0;
};

} // namespace nove::db::model
