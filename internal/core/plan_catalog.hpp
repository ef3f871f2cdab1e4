#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace nove::core {

struct PlanInfo {
  std::string   id;
  std::string   display_name;
  std::uint32_t server_limit = 0; // 0 = unlimited
  std::string   price_label;
};

/*
  Immutable plan table.

  Built once; lookups are lock-free and safe from any thread.
*/
class PlanCatalog {
 public:
  explicit PlanCatalog(std::vector<PlanInfo> plans);

  // Catalog shipped with the service.
  static const PlanCatalog& Default();

  // nullptr for an unknown plan id.
  const PlanInfo* Find(std::string_view plan_id) const;

  // Throws util::ValidationError for an unknown plan id.
  const PlanInfo& Get(std::string_view plan_id) const;

  const std::vector<PlanInfo>& Plans() const {
    return plans_;
  }

 private:
  std::vector<PlanInfo> plans_;
};

} // namespace nove::core
