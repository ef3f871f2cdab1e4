#pragma once

#include <string>
#include <string_view>

#include "internal/util/random.hpp"

namespace nove::core {

/*
  License keys look like NOVE-STA-1A2B-3C4D-5E6F.

  The middle group is the first three characters of the plan id,
  upper-cased; it only helps humans recognise the plan. The last three
  groups come from a 128-bit CSPRNG token. Keys carry no signature.
*/

std::string FormatLicenseKey(std::string_view prefix, std::string_view plan, const util::Token128& token);

// Throws std::runtime_error if the entropy source fails.
std::string GenerateLicenseKey(std::string_view prefix, std::string_view plan);

} // namespace nove::core
