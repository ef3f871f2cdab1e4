#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "email_message.hpp"

namespace nove::notify {

/*
  Bounded blocking queue feeding the notification workers.
*/
class NotificationQueue {
 public:
  explicit NotificationQueue(std::size_t capacity);

  // false when full or shut down; the message is not queued.
  bool TryEnqueue(EmailMessage message);

  // Blocks until a message is available. nullopt once shut down and drained.
  std::optional<EmailMessage> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  const std::size_t        capacity_;
  mutable std::mutex       mutex_;
  std::condition_variable  cv_;
  std::deque<EmailMessage> queue_;
  bool                     shutdown_ = false;
};

} // namespace nove::notify
