#include "random.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace nove::util {

Token128 GenerateToken128() {
  Token128 token{};
  if (RAND_bytes(token.data(), static_cast<int>(token.size())) != 1) {
    char buffer[256];
    ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
    throw std::runtime_error(std::string("RAND_bytes failed: ") + buffer);
  }
  return token;
}

std::string ToHexUpper(const Token128& token) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(token.size() * 2);
  for (uint8_t b : token) {
    out.push_back(kHex[(b >> 4) & 0x0F]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

} // namespace nove::util
