#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace nove::util {

/*
  Random helpers backed by the OpenSSL CSPRNG.
*/

using Token128 = std::array<uint8_t, 16>;

// Throws std::runtime_error if the entropy source fails.
Token128 GenerateToken128();

std::string ToHexUpper(const Token128& token);

} // namespace nove::util
