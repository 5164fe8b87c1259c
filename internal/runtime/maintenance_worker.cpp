#include "maintenance_worker.hpp"

#include <exception>

#include "internal/broker/progress_broker.hpp"
#include "internal/core/task_store.hpp"
#include "internal/observability/logging.hpp"

namespace codereview::runtime {

MaintenanceWorker::MaintenanceWorker(std::shared_ptr<codereview::broker::ProgressBroker> broker, std::shared_ptr<codereview::core::TaskStore> store,
                                     Options options)
    : broker_(std::move(broker)), store_(std::move(store)), options_(options) {}

MaintenanceWorker::~MaintenanceWorker() {
  Stop();
}

void MaintenanceWorker::Start() {
  if (running_.exchange(true))
    return;
  thread_ = std::thread(&MaintenanceWorker::Run, this);
}

void MaintenanceWorker::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    running_ = false;
  }
  wake_cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void MaintenanceWorker::RunOnce() {
  const auto evicted = broker_->EvictIdle(options_.idle_timeout);
  const auto retired = store_->EnforceRetention(options_.max_tasks);
  if (evicted > 0 || retired > 0) {
    CODEREVIEW_LOG_DEBUG("maintenance pass", {observability::IntField("evicted_subscribers", static_cast<int64_t>(evicted)),
                                              observability::IntField("retired_tasks", static_cast<int64_t>(retired))});
  }
}

void MaintenanceWorker::Run() {
  std::unique_lock lock(wake_mutex_);
  while (running_) {
    wake_cv_.wait_for(lock, options_.interval, [this] { return !running_; });
    if (!running_)
      break;

    lock.unlock();
    try {
      RunOnce();
    }
    catch (const std::exception& e) {
      CODEREVIEW_LOG_ERROR("maintenance pass failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

}
