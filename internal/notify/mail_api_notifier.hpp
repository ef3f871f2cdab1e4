#pragma once

#include <chrono>
#include <string>

#include "notifier.hpp"

namespace nove::notify {

struct MailApiOptions {
  std::string               endpoint; // e.g. https://api.resend.com/emails
  std::string               api_key;
  std::string               from_address;
  std::chrono::milliseconds timeout{10000};
};

/*
  HTTPS JSON mail API (bearer token), sent with libcurl.
*/
class MailApiNotifier final : public Notifier {
 public:
  explicit MailApiNotifier(MailApiOptions options);

  std::string_view Name() const override {
    return "mail_api";
  }

  bool Configured() const override;
  void Send(const EmailMessage& message) override;

  // JSON request body for message.
  std::string BuildRequestBody(const EmailMessage& message) const;

 private:
  MailApiOptions options_;
};

} // namespace nove::notify
