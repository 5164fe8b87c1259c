#include "subscription.hpp"

namespace codereview::service {

Subscription::Subscription(std::string task_id, std::string client_id, std::size_t capacity)
    : task_id_(std::move(task_id)), client_id_(std::move(client_id)), capacity_(capacity) {
}

bool Subscription::Push(const broker::ProgressEvent& event) {
  {
    std::lock_guard lock(mutex_);
    if (closed_ || queue_.size() >= capacity_) {
      return false;
    }
    queue_.push_back(event);
  }
  cv_.notify_one();
  return true;
}

void Subscription::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool Subscription::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

Subscription::WaitResult Subscription::Next(broker::ProgressEvent* out, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });

  if (!queue_.empty()) {
    *out = std::move(queue_.front());
    queue_.pop_front();
    return WaitResult::kEvent;
  }
  return closed_ ? WaitResult::kClosed : WaitResult::kTimeout;
}

} // namespace codereview::service
