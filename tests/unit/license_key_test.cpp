#include <cassert>

#include <cctype>
#include <iostream>
#include <set>
#include <string>

#include "internal/core/license_key.hpp"
#include "internal/util/random.hpp"

namespace {

using nove::core::FormatLicenseKey;
using nove::core::GenerateLicenseKey;

bool IsUpperHex(const std::string& text) {
  for (char c : text) {
    if (!std::isxdigit(static_cast<unsigned char>(c)) || std::islower(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

void TestFormatIsDeterministic() {
  nove::util::Token128 token{};
  for (std::size_t i = 0; i < token.size(); ++i) {
    token[i] = static_cast<uint8_t>(0x10 + i);
  }
  assert(FormatLicenseKey("NOVE", "startup", token) == "NOVE-STA-1011-1213-1415");
  assert(FormatLicenseKey("NOVE", "trial14", token) == "NOVE-TRI-1011-1213-1415");
}

void TestShortPlanTag() {
  nove::util::Token128 token{};
  token.fill(0xAB);
  assert(FormatLicenseKey("X", "ab", token) == "X-AB-ABAB-ABAB-ABAB");
}

void TestGeneratedKeysHaveShapeAndDiffer() {
  std::set<std::string> keys;
  for (int i = 0; i < 256; ++i) {
    const auto key = GenerateLicenseKey("NOVE", "enterprise");
    assert(key.size() == std::string("NOVE-ENT-XXXX-XXXX-XXXX").size());
    assert(key.rfind("NOVE-ENT-", 0) == 0);
    assert(key[13] == '-' && key[18] == '-');
    assert(IsUpperHex(key.substr(9, 4)) && IsUpperHex(key.substr(14, 4)) && IsUpperHex(key.substr(19, 4)));
    keys.insert(key);
  }
  assert(keys.size() == 256);
}

void TestTokenHex() {
  nove::util::Token128 token{};
  token[0]  = 0x0F;
  token[15] = 0xF0;
  const auto hex = nove::util::ToHexUpper(token);
  assert(hex.size() == 32);
  assert(hex.substr(0, 2) == "0F");
  assert(hex.substr(30, 2) == "F0");
}

} // namespace

int main() {
  TestFormatIsDeterministic();
  TestShortPlanTag();
  TestGeneratedKeysHaveShapeAndDiffer();
  TestTokenHex();

  std::cout << "nove_unit_license_key: pass\n";
  return 0;
}
