#include "plan_catalog.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/db/model/license_record.hpp"
#include "internal/util/errors.hpp"

namespace nove::core {

PlanCatalog::PlanCatalog(std::vector<PlanInfo> plans) : plans_(std::move(plans)) {
  for (auto it = plans_.begin(); it != plans_.end(); ++it) {
    if (it->id.empty()) {
      throw std::invalid_argument("plan id must not be empty");
    }
    if (std::find_if(plans_.begin(), it, [&](const PlanInfo& p) { return p.id == it->id; }) != it) {
      throw std::invalid_argument("duplicate plan id: " + it->id);
    }
  }
}

const PlanCatalog& PlanCatalog::Default() {
  static const PlanCatalog catalog({
      {"personal", "パーソナル", 3, "¥5,000/月"},
      {"academic", "アカデミック", 10, "¥50,000/月"},
      {"startup", "スタートアップ", 50, "¥200,000/月"},
      {"standard", "スタンダード", 500, "¥1,000,000/月"},
      {"enterprise", "エンタープライズ", 99999, "¥1,500,000~/月"},
      {"beta", "ベータテスト", 50, "50%割引"},
      {db::model::kTrialPlan, "14日間トライアル", 1, "無料"},
      {"trial", "お試し相談", 0, "無料"},
      {"consultation", "無料相談", 0, "無料"},
      {"other", "その他", 0, "-"},
  });
  return catalog;
}

const PlanInfo* PlanCatalog::Find(std::string_view plan_id) const {
  for (const auto& plan : plans_) {
    if (plan.id == plan_id) return &plan;
  }
  return nullptr;
}

const PlanInfo& PlanCatalog::Get(std::string_view plan_id) const {
  if (const auto* plan = Find(plan_id)) {
    return *plan;
  }
  throw util::ValidationError("不明なプランです: " + std::string(plan_id));
}

} // namespace nove::core
