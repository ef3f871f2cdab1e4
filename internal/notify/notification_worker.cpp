#include "notification_worker.hpp"

#include "internal/observability/logging.hpp"

namespace nove::notify {

using observability::StringField;

NotificationWorker::NotificationWorker(std::shared_ptr<NotificationQueue> queue, std::shared_ptr<FallbackNotifier> notifier)
    : queue_(std::move(queue)), notifier_(std::move(notifier)) {
}

NotificationWorker::~NotificationWorker() {
  Stop();
}

void NotificationWorker::Notify(EmailMessage message) {
  if (message.to.empty()) {
    NOVE_LOG_WARN("mail without recipient dropped", {StringField("subject", message.subject)});
    return;
  }

  const auto to      = message.to;
  const auto subject = message.subject;
  if (!queue_->TryEnqueue(std::move(message))) {
    NOVE_LOG_WARN("notification dropped (queue full or stopped)", {StringField("to", to), StringField("subject", subject)});
  }
}

void NotificationWorker::Start(std::size_t threads) {
  if (running_.exchange(true)) return;

  if (threads == 0) threads = 1;
  threads_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    threads_.emplace_back(&NotificationWorker::Run, this);
  }
}

void NotificationWorker::Stop() {
  queue_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
  running_ = false;
}

void NotificationWorker::Run() {
  while (auto message = queue_->Dequeue()) {
    try {
      notifier_->Deliver(*message);
    } catch (const std::exception& e) {
      NOVE_LOG_ERROR("notification worker failed", {StringField("to", message->to), StringField("error", e.what())});
    }
  }
}

} // namespace nove::notify
