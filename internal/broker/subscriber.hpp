#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

#include "internal/broker/progress_event.hpp"
#include "internal/util/time.hpp"

namespace codereview::broker {

/*
  Transport side of a subscription.

  send returns false (or throws) when the event could not be delivered.
  close is invoked exactly once when the broker drops the subscriber, for
  whatever reason; the transport then tears the connection down.
*/
struct SubscriberHandle {
  std::function<bool(const ProgressEvent&)> send;
  std::function<void()>                     close;
};

class Subscriber {
 public:
  Subscriber(std::string task_id, std::string client_id, SubscriberHandle handle, util::TimePoint now);

  Subscriber(const Subscriber&)            = delete;
  Subscriber& operator=(const Subscriber&) = delete;

  const std::string& TaskId() const {
    return task_id_;
  }

  const std::string& ClientId() const {
    return client_id_;
  }

  // Serialized per subscriber. Throws util::DeliveryFailure on a false
  // return, an exception from the transport, or after Close().
  void Send(const ProgressEvent& event, util::TimePoint now);

  void            Touch(util::TimePoint now);
  util::TimePoint LastActive() const;

  // Idempotent; runs the close callback on the first call only.
  void Close();
  bool IsClosed() const;

 private:
  const std::string task_id_;
  const std::string client_id_;
  SubscriberHandle  handle_;

  std::mutex                    send_mutex_;
  std::atomic<bool>             closed_{false};
  std::atomic<util::Clock::rep> last_active_;
};

} // namespace codereview::broker
