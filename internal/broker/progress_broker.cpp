#include "progress_broker.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace codereview::broker {

using codereview::observability::StringField;

ProgressBroker::ProgressBroker(ClockFn clock) : clock_(std::move(clock)) {
}

ProgressBroker::~ProgressBroker() {
  CloseAll();
}

ProgressBroker::Shard& ProgressBroker::ShardFor(const std::string& task_id) {
  return shards_[std::hash<std::string>{}(task_id) % kShardCount];
}

const ProgressBroker::Shard& ProgressBroker::ShardFor(const std::string& task_id) const {
  return shards_[std::hash<std::string>{}(task_id) % kShardCount];
}

void ProgressBroker::PublishCount() {
  observability::Metrics::Instance().SetActiveSubscribers(total_.load());
}

void ProgressBroker::Register(const std::string& task_id, const std::string& client_id, SubscriberHandle handle) {
  if (task_id.empty() || client_id.empty()) {
    throw util::InvalidArgument("task_id and client_id are required");
  }

  auto subscriber = std::make_shared<Subscriber>(task_id, client_id, std::move(handle), clock_());

  std::shared_ptr<Subscriber> replaced;
  {
    auto&           shard = ShardFor(task_id);
    std::lock_guard lock(shard.mutex);
    auto&           clients = shard.tasks[task_id];
    auto [it, inserted]     = clients.try_emplace(client_id, subscriber);
    if (!inserted) {
      replaced   = std::move(it->second);
      it->second = subscriber;
    } else {
      total_.fetch_add(1);
    }
  }

  if (replaced) {
    replaced->Close();
    CODEREVIEW_LOG_INFO("subscriber replaced", {StringField("task_id", task_id), StringField("client_id", client_id)});
  } else {
    CODEREVIEW_LOG_INFO("subscriber registered", {StringField("task_id", task_id), StringField("client_id", client_id)});
  }
  PublishCount();
}

void ProgressBroker::Unregister(const std::string& task_id, const std::string& client_id) {
  std::shared_ptr<Subscriber> removed;
  {
    auto&           shard = ShardFor(task_id);
    std::lock_guard lock(shard.mutex);
    auto            task_it = shard.tasks.find(task_id);
    if (task_it == shard.tasks.end()) {
      return;
    }
    auto client_it = task_it->second.find(client_id);
    if (client_it == task_it->second.end()) {
      return;
    }
    removed = std::move(client_it->second);
    task_it->second.erase(client_it);
    if (task_it->second.empty()) {
      shard.tasks.erase(task_it);
    }
    total_.fetch_sub(1);
  }

  removed->Close();
  CODEREVIEW_LOG_INFO("subscriber unregistered", {StringField("task_id", task_id), StringField("client_id", client_id)});
  PublishCount();
}

bool ProgressBroker::RemoveIfCurrent(const std::shared_ptr<Subscriber>& subscriber) {
  auto&           shard = ShardFor(subscriber->TaskId());
  std::lock_guard lock(shard.mutex);
  auto            task_it = shard.tasks.find(subscriber->TaskId());
  if (task_it == shard.tasks.end()) {
    return false;
  }
  auto client_it = task_it->second.find(subscriber->ClientId());
  if (client_it == task_it->second.end() || client_it->second != subscriber) {
    return false;
  }
  task_it->second.erase(client_it);
  if (task_it->second.empty()) {
    shard.tasks.erase(task_it);
  }
  total_.fetch_sub(1);
  return true;
}

bool ProgressBroker::Touch(const std::string& task_id, const std::string& client_id) {
  auto&           shard = ShardFor(task_id);
  std::lock_guard lock(shard.mutex);
  auto            task_it = shard.tasks.find(task_id);
  if (task_it == shard.tasks.end()) {
    return false;
  }
  auto client_it = task_it->second.find(client_id);
  if (client_it == task_it->second.end()) {
    return false;
  }
  client_it->second->Touch(clock_());
  return true;
}

bool ProgressBroker::Deliver(const std::shared_ptr<Subscriber>& subscriber, const ProgressEvent& event) noexcept {
  try {
    subscriber->Send(event, clock_());
    return true;
  } catch (const util::DeliveryFailure& e) {
    CODEREVIEW_LOG_WARN("progress delivery failed", {StringField("task_id", subscriber->TaskId()), StringField("client_id", subscriber->ClientId()),
                                                     StringField("event", EventTypeName(event.type)), StringField("error", e.what())});
  } catch (const std::exception& e) {
    CODEREVIEW_LOG_ERROR("progress delivery error", {StringField("task_id", subscriber->TaskId()), StringField("client_id", subscriber->ClientId()),
                                                     StringField("error", e.what())});
  } catch (...) {
    CODEREVIEW_LOG_ERROR("progress delivery error", {StringField("task_id", subscriber->TaskId()), StringField("client_id", subscriber->ClientId()),
                                                     StringField("error", "unknown exception")});
  }

  if (RemoveIfCurrent(subscriber)) {
    PublishCount();
  }
  subscriber->Close();
  return false;
}

std::size_t ProgressBroker::Broadcast(const std::string& task_id, const ProgressEvent& event) noexcept {
  std::vector<std::shared_ptr<Subscriber>> targets;
  {
    auto&           shard = ShardFor(task_id);
    std::lock_guard lock(shard.mutex);
    auto            it = shard.tasks.find(task_id);
    if (it == shard.tasks.end()) {
      return 0;
    }
    targets.reserve(it->second.size());
    for (const auto& [client_id, subscriber] : it->second) {
      targets.push_back(subscriber);
    }
  }

  std::size_t delivered_count = 0;
  for (const auto& subscriber : targets) {
    if (Deliver(subscriber, event)) {
      ++delivered_count;
    }
  }
  return delivered_count;
}

bool ProgressBroker::SendTo(const std::string& task_id, const std::string& client_id, const ProgressEvent& event) noexcept {
  std::shared_ptr<Subscriber> target;
  {
    auto&           shard = ShardFor(task_id);
    std::lock_guard lock(shard.mutex);
    auto            task_it = shard.tasks.find(task_id);
    if (task_it == shard.tasks.end()) {
      return false;
    }
    auto client_it = task_it->second.find(client_id);
    if (client_it == task_it->second.end()) {
      return false;
    }
    target = client_it->second;
  }

  return Deliver(target, event);
}

std::size_t ProgressBroker::EvictIdle(std::chrono::milliseconds timeout) {
  const auto cutoff = clock_() - timeout;

  std::vector<std::shared_ptr<Subscriber>> evicted;
  for (auto& shard : shards_) {
    std::lock_guard lock(shard.mutex);
    for (auto task_it = shard.tasks.begin(); task_it != shard.tasks.end();) {
      auto& clients = task_it->second;
      for (auto client_it = clients.begin(); client_it != clients.end();) {
        if (client_it->second->LastActive() < cutoff) {
          evicted.push_back(std::move(client_it->second));
          client_it = clients.erase(client_it);
          total_.fetch_sub(1);
        } else {
          ++client_it;
        }
      }
      if (clients.empty()) {
        task_it = shard.tasks.erase(task_it);
      } else {
        ++task_it;
      }
    }
  }

  for (const auto& subscriber : evicted) {
    subscriber->Close();
    CODEREVIEW_LOG_INFO("idle subscriber evicted", {StringField("task_id", subscriber->TaskId()), StringField("client_id", subscriber->ClientId())});
  }
  if (!evicted.empty()) {
    PublishCount();
  }
  return evicted.size();
}

void ProgressBroker::CloseAll() {
  std::vector<std::shared_ptr<Subscriber>> closing;
  for (auto& shard : shards_) {
    std::lock_guard lock(shard.mutex);
    for (auto& [task_id, clients] : shard.tasks) {
      for (auto& [client_id, subscriber] : clients) {
        closing.push_back(std::move(subscriber));
      }
    }
    shard.tasks.clear();
  }
  total_.store(0);

  for (const auto& subscriber : closing) {
    subscriber->Close();
  }
}

std::size_t ProgressBroker::SubscriberCount(const std::string& task_id) const {
  const auto&     shard = ShardFor(task_id);
  std::lock_guard lock(shard.mutex);
  auto            it = shard.tasks.find(task_id);
  return it == shard.tasks.end() ? 0 : it->second.size();
}

std::size_t ProgressBroker::TotalSubscribers() const {
  return total_.load();
}

std::vector<std::string> ProgressBroker::ConnectedTasks() const {
  std::vector<std::string> tasks;
  for (const auto& shard : shards_) {
    std::lock_guard lock(shard.mutex);
    for (const auto& [task_id, clients] : shard.tasks) {
      tasks.push_back(task_id);
    }
  }
  return tasks;
}

} // namespace codereview::broker
