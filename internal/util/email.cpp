#include "email.hpp"

#include <algorithm>
#include <cctype>

namespace nove::util {

namespace {

constexpr std::size_t kMaxAddressLength = 254;
constexpr std::size_t kMaxLocalLength   = 64;

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsLocalChar(char c) {
  if (std::isalnum(static_cast<unsigned char>(c))) return true;
  static constexpr std::string_view kAllowed = "!#$%&'*+-/=?^_`{|}~.";
  return kAllowed.find(c) != std::string_view::npos || static_cast<unsigned char>(c) >= 0x80;
}

bool IsDomainLabelValid(std::string_view label) {
  if (label.empty() || label.size() > 63) return false;
  if (label.front() == '-' || label.back() == '-') return false;
  return std::all_of(label.begin(), label.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || static_cast<unsigned char>(c) >= 0x80;
  });
}

} // namespace

std::string Trim(std::string_view text) {
  while (!text.empty() && IsSpace(text.front())) text.remove_prefix(1);
  while (!text.empty() && IsSpace(text.back())) text.remove_suffix(1);
  return std::string(text);
}

bool IsValidEmail(std::string_view address) {
  if (address.empty() || address.size() > kMaxAddressLength) return false;

  const auto at = address.find('@');
  if (at == std::string_view::npos || address.find('@', at + 1) != std::string_view::npos) return false;

  const auto local  = address.substr(0, at);
  const auto domain = address.substr(at + 1);
  if (local.empty() || local.size() > kMaxLocalLength) return false;
  if (local.front() == '.' || local.back() == '.' || local.find("..") != std::string_view::npos) return false;
  if (!std::all_of(local.begin(), local.end(), IsLocalChar)) return false;

  if (domain.find('.') == std::string_view::npos) return false;

  std::size_t start = 0;
  while (start <= domain.size()) {
    auto end = domain.find('.', start);
    if (end == std::string_view::npos) end = domain.size();
    if (!IsDomainLabelValid(domain.substr(start, end - start))) return false;
    start = end + 1;
  }
  return true;
}

std::string NormalizeEmail(std::string_view address) {
  auto out = Trim(address);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace nove::util
