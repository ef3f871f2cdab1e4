#pragma once

#include <memory>
#include <vector>

#include "notifier.hpp"

namespace nove::notify {

/*
  Tries each configured channel in order until one succeeds.

  Deliver() never throws: channel errors are logged and counted, and
  the next channel is attempted. Unconfigured channels are skipped.
*/
class FallbackNotifier {
 public:
  explicit FallbackNotifier(std::vector<std::shared_ptr<Notifier>> channels);

  // true if some channel accepted the message.
  bool Deliver(const EmailMessage& message);

  bool AnyConfigured() const;

 private:
  std::vector<std::shared_ptr<Notifier>> channels_;
};

} // namespace nove::notify
