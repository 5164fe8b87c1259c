#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

#include "internal/broker/progress_event.hpp"

namespace codereview::service {

/*
  Bounded hand-off between the broker (any thread) and the transport thread
  that owns the connection.

  Push never blocks: it fails once the queue is full or the subscription
  is closed, which makes the broker drop a consumer that cannot keep up.
  Events queued before Close() are still handed out by Next().
*/
class Subscription {
 public:
  static constexpr std::size_t kDefaultCapacity = 256;

  enum class WaitResult {
    kEvent,
    kTimeout,
    kClosed,
  };

  Subscription(std::string task_id, std::string client_id, std::size_t capacity = kDefaultCapacity);

  const std::string& TaskId() const {
    return task_id_;
  }

  const std::string& ClientId() const {
    return client_id_;
  }

  bool Push(const broker::ProgressEvent& event);

  void Close();
  bool IsClosed() const;

  WaitResult Next(broker::ProgressEvent* out, std::chrono::milliseconds timeout);

 private:
  const std::string task_id_;
  const std::string client_id_;
  const std::size_t capacity_;

  mutable std::mutex                mutex_;
  std::condition_variable           cv_;
  std::deque<broker::ProgressEvent> queue_;
  bool                              closed_ = false;
};

} // namespace codereview::service
