#include "license_key.hpp"

#include <fmt/format.h>

#include <cctype>

namespace nove::core {

std::string FormatLicenseKey(std::string_view prefix, std::string_view plan, const util::Token128& token) {
  std::string plan_tag(plan.substr(0, 3));
  for (auto& c : plan_tag) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }

  const auto hex = util::ToHexUpper(token);
  return fmt::format("{}-{}-{}-{}-{}", prefix, plan_tag, hex.substr(0, 4), hex.substr(4, 4), hex.substr(8, 4));
}

std::string GenerateLicenseKey(std::string_view prefix, std::string_view plan) {
  return FormatLicenseKey(prefix, plan, util::GenerateToken128());
}

} // namespace nove::core
