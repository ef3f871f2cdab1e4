#pragma once

#include <string_view>

#include "email_message.hpp"

namespace nove::notify {

/*
  One outbound mail channel.

  Send() throws on any delivery failure; callers decide whether to
  fall back to another channel.
*/
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual std::string_view Name() const = 0;

  // false when credentials or endpoint are missing; Send() is then never called.
  virtual bool Configured() const = 0;

  virtual void Send(const EmailMessage& message) = 0;
};

/*
  Fire-and-forget entry point used by request handlers.

  Notify() never throws and never waits for delivery.
*/
class NotificationSink {
 public:
  virtual ~NotificationSink() = default;

  virtual void Notify(EmailMessage message) = 0;
};

} // namespace nove::notify
