#include "internal/runtime/maintenance_worker.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/broker/progress_broker.hpp"
#include "internal/core/task_store.hpp"

namespace {

using codereview::broker::ProgressBroker;
using codereview::runtime::MaintenanceWorker;

struct FakeClock {
  std::mutex                  mutex;
  codereview::util::TimePoint now = codereview::util::FromUnixMillis(1'700'000'000'000);

  void Advance(std::chrono::milliseconds delta) {
    std::lock_guard lock(mutex);
    now += delta;
  }

  ProgressBroker::ClockFn Fn() {
    return [this] {
      std::lock_guard lock(mutex);
      return now;
    };
  }
};

codereview::broker::SubscriberHandle CountingHandle(std::atomic<int>* closes) {
  codereview::broker::SubscriberHandle handle;
  handle.send  = [](const codereview::broker::ProgressEvent&) { return true; };
  handle.close = [closes] { ++*closes; };
  return handle;
}

std::string FinishedTask(codereview::core::TaskStore& store, const std::string& name) {
  auto task = store.Create(name, "/src/" + name, 1);
  store.BeginRun(task.id);
  store.Finalize(task.id, codereview::model::TaskError{codereview::model::Stage::kArchitect, "boom"});
  return task.id;
}

void TestRunOnceEvictsIdleSubscribers() {
  FakeClock        clock;
  auto             broker = std::make_shared<ProgressBroker>(clock.Fn());
  auto             store  = std::make_shared<codereview::core::TaskStore>(nullptr);
  std::atomic<int> closes{0};

  broker->Register("task", "stale", CountingHandle(&closes));
  clock.Advance(std::chrono::seconds(50));
  broker->Register("task", "fresh", CountingHandle(&closes));
  clock.Advance(std::chrono::seconds(20));

  MaintenanceWorker::Options options;
  options.idle_timeout = std::chrono::seconds(60);
  MaintenanceWorker worker(broker, store, options);
  worker.RunOnce();

  assert(broker->SubscriberCount("task") == 1);
  assert(closes == 1);
  assert(!broker->Touch("task", "stale"));
  assert(broker->Touch("task", "fresh"));
}

void TestRunOnceEnforcesRetention() {
  auto broker = std::make_shared<ProgressBroker>();
  auto store  = std::make_shared<codereview::core::TaskStore>(nullptr);

  const auto oldest = FinishedTask(*store, "a.cpp");
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  FinishedTask(*store, "b.cpp");
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  auto pending = store->Create("c.cpp", "/src/c.cpp", 1);

  MaintenanceWorker::Options options;
  options.max_tasks = 2;
  MaintenanceWorker worker(broker, store, options);
  worker.RunOnce();

  assert(store->Count() == 2);
  assert(!store->Contains(oldest));
  assert(store->Contains(pending.id));
}

void TestZeroRetentionKeepsEverything() {
  auto broker = std::make_shared<ProgressBroker>();
  auto store  = std::make_shared<codereview::core::TaskStore>(nullptr);
  for (int i = 0; i < 5; ++i) {
    FinishedTask(*store, "f.cpp");
  }

  MaintenanceWorker worker(broker, store, MaintenanceWorker::Options{});
  worker.RunOnce();
  assert(store->Count() == 5);
}

void TestBackgroundLoopRunsAndStops() {
  FakeClock        clock;
  auto             broker = std::make_shared<ProgressBroker>(clock.Fn());
  auto             store  = std::make_shared<codereview::core::TaskStore>(nullptr);
  std::atomic<int> closes{0};

  broker->Register("task", "idle", CountingHandle(&closes));
  clock.Advance(std::chrono::minutes(5));

  MaintenanceWorker::Options options;
  options.interval     = std::chrono::milliseconds(10);
  options.idle_timeout = std::chrono::seconds(60);
  MaintenanceWorker worker(broker, store, options);
  worker.Start();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (broker->TotalSubscribers() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  assert(broker->TotalSubscribers() == 0);

  worker.Stop();
  // a second stop is harmless
  worker.Stop();
}

} // namespace

int main() {
  TestRunOnceEvictsIdleSubscribers();
  TestRunOnceEnforcesRetention();
  TestZeroRetentionKeepsEverything();
  TestBackgroundLoopRunsAndStops();

  std::cout << "codereview_unit_maintenance_worker: pass\n";
  return 0;
}
