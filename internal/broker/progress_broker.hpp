#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/broker/subscriber.hpp"

namespace codereview::broker {

/*
  Per-task fan-out of progress events to live subscribers.

  Locking strategy:
    - the registry is sharded by task id; a shard mutex is held only while
      the subscriber maps are read or changed
    - delivery runs on a snapshot, outside any shard lock
    - each Subscriber serializes its own sends, so events to one client
      keep the order in which Broadcast was called

  Delivery is best-effort: a subscriber whose send fails is unregistered
  and closed, and never sees later events.
*/
class ProgressBroker {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  explicit ProgressBroker(ClockFn clock = util::Now);
  ~ProgressBroker();

  ProgressBroker(const ProgressBroker&)            = delete;
  ProgressBroker& operator=(const ProgressBroker&) = delete;

  // Replaces (and closes) an existing subscriber with the same client id.
  // Throws util::InvalidArgument on empty ids.
  void Register(const std::string& task_id, const std::string& client_id, SubscriberHandle handle);

  // Idempotent.
  void Unregister(const std::string& task_id, const std::string& client_id);

  // Heartbeat. Returns false when the subscriber is not registered.
  bool Touch(const std::string& task_id, const std::string& client_id);

  // Never throws. Returns the number of subscribers that accepted the event.
  std::size_t Broadcast(const std::string& task_id, const ProgressEvent& event) noexcept;

  // Returns false when the subscriber is unknown or the send failed (in
  // which case it is unregistered).
  bool SendTo(const std::string& task_id, const std::string& client_id, const ProgressEvent& event) noexcept;

  // Removes subscribers whose last activity is strictly older than timeout.
  std::size_t EvictIdle(std::chrono::milliseconds timeout);

  // Closes every subscriber; used on shutdown.
  void CloseAll();

  std::size_t              SubscriberCount(const std::string& task_id) const;
  std::size_t              TotalSubscribers() const;
  std::vector<std::string> ConnectedTasks() const;

 private:
  static constexpr std::size_t kShardCount = 16;

  using ClientMap = std::unordered_map<std::string, std::shared_ptr<Subscriber>>;

  struct Shard {
    mutable std::mutex                         mutex;
    std::unordered_map<std::string, ClientMap> tasks;
  };

  Shard&       ShardFor(const std::string& task_id);
  const Shard& ShardFor(const std::string& task_id) const;

  // Removes the subscriber only if it is still the registered instance.
  bool RemoveIfCurrent(const std::shared_ptr<Subscriber>& subscriber);

  // On failure the subscriber is unregistered and closed.
  bool Deliver(const std::shared_ptr<Subscriber>& subscriber, const ProgressEvent& event) noexcept;

  void PublishCount();

  ClockFn                         clock_;
  std::array<Shard, kShardCount> shards_;
  std::atomic<std::size_t>        total_{0};
};

} // namespace codereview::broker
