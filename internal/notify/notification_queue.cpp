#include "notification_queue.hpp"

namespace nove::notify {

NotificationQueue::NotificationQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool NotificationQueue::TryEnqueue(EmailMessage message) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || queue_.size() >= capacity_) return false;
    queue_.push_back(std::move(message));
  }
  cv_.notify_one();
  return true;
}

std::optional<EmailMessage> NotificationQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  EmailMessage message = std::move(queue_.front());
  queue_.pop_front();
  return message;
}

void NotificationQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t NotificationQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace nove::notify
