#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "internal/util/time.hpp"
#include "notifier.hpp"

namespace nove::notify {

struct SmtpOptions {
  std::string               host;
  std::uint32_t             port = 587;
  std::string               username;
  std::string               password;
  std::string               from_address; // username when empty
  bool                      starttls = true;
  std::chrono::milliseconds timeout{10000};
};

/*
  SMTP relay channel (STARTTLS + LOGIN) through libcurl.
*/
class SmtpNotifier final : public Notifier {
 public:
  explicit SmtpNotifier(SmtpOptions options);

  std::string_view Name() const override {
    return "smtp";
  }

  bool Configured() const override;
  void Send(const EmailMessage& message) override;

  const std::string& FromAddress() const;

 private:
  SmtpOptions options_;
};

// RFC 5322 message with a base64 text/html UTF-8 body and an RFC 2047 subject.
std::string BuildMimeMessage(const std::string& from, const EmailMessage& message, util::TimePoint date);

} // namespace nove::notify
