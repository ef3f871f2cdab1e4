#include "fallback_notifier.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace nove::notify {

using observability::StringField;

FallbackNotifier::FallbackNotifier(std::vector<std::shared_ptr<Notifier>> channels) : channels_(std::move(channels)) {
  channels_.erase(std::remove(channels_.begin(), channels_.end(), nullptr), channels_.end());
}

bool FallbackNotifier::AnyConfigured() const {
  return std::any_of(channels_.begin(), channels_.end(), [](const auto& channel) { return channel->Configured(); });
}

bool FallbackNotifier::Deliver(const EmailMessage& message) {
  if (!AnyConfigured()) {
    NOVE_LOG_INFO("mail skipped", {StringField("to", message.to), StringField("subject", message.subject)});
    return false;
  }

  observability::SpanScope span("notify.deliver");
  for (const auto& channel : channels_) {
    if (!channel->Configured()) continue;

    try {
      channel->Send(message);
      observability::Metrics::Instance().RecordNotification(channel->Name(), true);
      NOVE_LOG_INFO("mail sent", {StringField("channel", channel->Name()), StringField("to", message.to)});
      return true;
    } catch (const std::exception& e) {
      observability::Metrics::Instance().RecordNotification(channel->Name(), false);
      span.RecordException(e.what());
      NOVE_LOG_WARN("mail channel failed",
                    {StringField("channel", channel->Name()), StringField("to", message.to), StringField("error", e.what())});
    }
  }

  NOVE_LOG_ERROR("mail delivery failed on every channel", {StringField("to", message.to), StringField("subject", message.subject)});
  return false;
}

} // namespace nove::notify
