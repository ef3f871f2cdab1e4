#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "fallback_notifier.hpp"
#include "notification_queue.hpp"
#include "notifier.hpp"

namespace nove::notify {

/*
  Asynchronous NotificationSink.

  Notify() only enqueues. Background threads drain the queue through
  the fallback chain. Stop() delivers what is already queued, then
  joins the threads.
*/
class NotificationWorker final : public NotificationSink {
 public:
  NotificationWorker(std::shared_ptr<NotificationQueue> queue, std::shared_ptr<FallbackNotifier> notifier);
  ~NotificationWorker() override;

  void Notify(EmailMessage message) override;

  void Start(std::size_t threads);
  void Stop();

 private:
  void Run();

  std::shared_ptr<NotificationQueue> queue_;
  std::shared_ptr<FallbackNotifier>  notifier_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace nove::notify
