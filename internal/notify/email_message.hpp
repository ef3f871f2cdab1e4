#pragma once

#include <string>

namespace nove::notify {

struct EmailMessage {
  std::string to;
  std::string subject;
  std::string html;
};

} // namespace nove::notify
