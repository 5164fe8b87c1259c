#include "subscriber.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace codereview::broker {

Subscriber::Subscriber(std::string task_id, std::string client_id, SubscriberHandle handle, util::TimePoint now)
    : task_id_(std::move(task_id)), client_id_(std::move(client_id)), handle_(std::move(handle)), last_active_(now.time_since_epoch().count()) {
}

void Subscriber::Send(const ProgressEvent& event, util::TimePoint now) {
  std::lock_guard lock(send_mutex_);
  if (closed_) {
    throw util::DeliveryFailure("subscriber " + client_id_ + " is closed");
  }

  bool delivered = false;
  try {
    delivered = handle_.send && handle_.send(event);
  } catch (const util::DeliveryFailure&) {
    throw;
  } catch (const std::exception& e) {
    throw util::DeliveryFailure("send to " + client_id_ + " failed: " + e.what());
  } catch (...) {
    throw util::DeliveryFailure("send to " + client_id_ + " failed: unknown exception");
  }

  if (!delivered) {
    throw util::DeliveryFailure("send to " + client_id_ + " rejected");
  }
  last_active_.store(now.time_since_epoch().count());
}

void Subscriber::Touch(util::TimePoint now) {
  last_active_.store(now.time_since_epoch().count());
}

util::TimePoint Subscriber::LastActive() const {
  return util::TimePoint(util::Clock::duration(last_active_.load()));
}

void Subscriber::Close() {
  std::lock_guard lock(send_mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;

  if (!handle_.close) {
    return;
  }
  try {
    handle_.close();
  } catch (const std::exception& e) {
    CODEREVIEW_LOG_WARN("subscriber close callback failed",
                        {observability::StringField("task_id", task_id_), observability::StringField("client_id", client_id_),
                         observability::StringField("error", e.what())});
  } catch (...) {
    CODEREVIEW_LOG_WARN("subscriber close callback failed",
                        {observability::StringField("task_id", task_id_), observability::StringField("client_id", client_id_),
                         observability::StringField("error", "unknown exception")});
  }
}

bool Subscriber::IsClosed() const {
  return closed_.load();
}

} // namespace codereview::broker
