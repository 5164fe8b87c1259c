#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

namespace codereview::broker {
class ProgressBroker;
}
namespace codereview::core {
class TaskStore;
}

namespace codereview::runtime {

/*
  Background worker for periodic housekeeping.

  Every interval:
      evict idle subscribers → enforce task retention
*/
class MaintenanceWorker {
 public:
  struct Options {
    std::chrono::milliseconds interval{30000};
    std::chrono::milliseconds idle_timeout{60000};
    std::size_t               max_tasks = 0;
  };

  MaintenanceWorker(std::shared_ptr<codereview::broker::ProgressBroker> broker, std::shared_ptr<codereview::core::TaskStore> store, Options options);
  ~MaintenanceWorker();

  void Start();
  void Stop();

  // One housekeeping pass in the calling thread.
  void RunOnce();

 private:
  void Run();

  std::shared_ptr<codereview::broker::ProgressBroker> broker_;
  std::shared_ptr<codereview::core::TaskStore>        store_;
  Options                                             options_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wake_mutex_;
  std::condition_variable wake_cv_;
};

} // namespace codereview::runtime
