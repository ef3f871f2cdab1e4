#pragma once

#include <string>
#include <string_view>

namespace nove::util {

// Syntactic address check: one '@', non-empty local part, dotted domain.
bool IsValidEmail(std::string_view address);

// Trimmed and lower-cased address used for storage and comparison.
std::string NormalizeEmail(std::string_view address);

std::string Trim(std::string_view text);

} // namespace nove::util
