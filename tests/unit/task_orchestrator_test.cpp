#include "internal/core/task_orchestrator.hpp"

#include <array>
#include <atomic>
#include <cassert>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_task_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using codereview::broker::EventType;
using codereview::broker::ProgressBroker;
using codereview::broker::ProgressEvent;
using codereview::core::TaskOrchestrator;
using codereview::core::TaskStore;
using codereview::model::Stage;
using codereview::model::StageIndex;
using codereview::model::StageStatus;
using codereview::model::TaskStatus;
using codereview::stage::StageContext;
using codereview::stage::StageResult;

class MemorySourceStore final : public codereview::storage::SourceStore {
 public:
  std::string Load(const std::string& file_path) override {
    std::lock_guard lock(mutex_);
    auto            it = sources_.find(file_path);
    if (it == sources_.end()) {
      throw std::runtime_error("no such file: " + file_path);
    }
    return it->second;
  }

  std::string SaveFixed(const std::string& task_id, const std::string& file_name, const std::string& content) override {
    std::lock_guard lock(mutex_);
    const auto      path = "/fixed/" + task_id + "/" + file_name;
    saved_[path]         = content;
    return path;
  }

  void Put(const std::string& path, const std::string& content) {
    std::lock_guard lock(mutex_);
    sources_[path] = content;
  }

  std::string Saved(const std::string& path) {
    std::lock_guard lock(mutex_);
    return saved_.at(path);
  }

 private:
  std::mutex                         mutex_;
  std::map<std::string, std::string> sources_;
  std::map<std::string, std::string> saved_;
};

// Runner driven by a callback; records every context it was given.
class FakeRunner final : public codereview::stage::StageRunner {
 public:
  using Fn = std::function<StageResult(const StageContext&)>;

  explicit FakeRunner(Fn fn) : fn_(std::move(fn)) {
  }

  StageResult Run(const StageContext& context) override {
    {
      std::lock_guard lock(mutex_);
      contexts_.push_back(context);
    }
    ++calls;
    return fn_(context);
  }

  std::vector<StageContext> Contexts() {
    std::lock_guard lock(mutex_);
    return contexts_;
  }

  std::atomic<int> calls{0};

 private:
  Fn                        fn_;
  std::mutex                mutex_;
  std::vector<StageContext> contexts_;
};

StageResult Report(const std::string& text) {
  StageResult result;
  result.report = text;
  return result;
}

struct Harness {
  std::shared_ptr<TaskStore>                 store   = std::make_shared<TaskStore>(std::make_shared<codereview::db::memory::MemoryTaskRepository>());
  std::shared_ptr<ProgressBroker>            broker  = std::make_shared<ProgressBroker>();
  std::shared_ptr<MemorySourceStore>         sources = std::make_shared<MemorySourceStore>();
  std::array<std::shared_ptr<FakeRunner>, 4> runners;

  Harness() {
    runners[0] = std::make_shared<FakeRunner>([](const StageContext&) {
      auto result                    = Report("layout is fine");
      result.metrics["complexity"]   = 3.0;
      return result;
    });
    runners[1] = std::make_shared<FakeRunner>([](const StageContext&) { return Report("two issues"); });
    runners[2] = std::make_shared<FakeRunner>([](const StageContext& context) {
      auto result          = Report("applied fixes");
      result.fixed_content = context.current_content + "// reviewed\n";
      return result;
    });
    runners[3] = std::make_shared<FakeRunner>([this](const StageContext& context) {
      StageResult result;
      result.artifact_path = sources->SaveFixed(context.task_id, context.file_name, context.current_content);
      result.report        = "saved";
      return result;
    });
    sources->Put("/src/main.cpp", "int main() {}\n");
  }

  std::shared_ptr<TaskOrchestrator> Orchestrator() {
    codereview::stage::StageRunners stage_runners;
    for (std::size_t i = 0; i < runners.size(); ++i) {
      stage_runners[i] = runners[i];
    }
    return std::make_shared<TaskOrchestrator>(store, broker, sources, stage_runners);
  }
};

// Subscriber side that keeps every delivered event.
struct EventLog {
  std::mutex                 mutex;
  std::vector<ProgressEvent> events;

  codereview::broker::SubscriberHandle Handle() {
    codereview::broker::SubscriberHandle handle;
    handle.send = [this](const ProgressEvent& event) {
      std::lock_guard lock(mutex);
      events.push_back(event);
      return true;
    };
    handle.close = [] {};
    return handle;
  }

  std::vector<ProgressEvent> Snapshot() {
    std::lock_guard lock(mutex);
    return events;
  }
};

void TestAllStagesSucceed() {
  Harness harness;
  auto    orchestrator = harness.Orchestrator();
  auto    task         = harness.store->Create("main.cpp", "/src/main.cpp", 14);

  auto finished = orchestrator->Run(task.id);

  assert(finished.status == TaskStatus::kCompleted);
  assert(finished.overall_progress == 100.0);
  for (const auto& state : finished.stage_states) {
    assert(state.status == StageStatus::kCompleted);
    assert(state.progress == 100.0);
  }
  assert(finished.stage_cursor == 3);
  assert(finished.result.has_value());
  assert(!finished.error.has_value());

  const auto& result = *finished.result;
  assert(result.original_content == "int main() {}\n");
  assert(result.fixed_content == "int main() {}\n// reviewed\n");
  assert(result.reports.size() == 4);
  assert(result.reports[0].metrics.at("complexity") == 3.0);
  assert(result.diff.lines_unchanged == 1);
  assert(result.diff.lines_added == 1);
  assert(result.diff.lines_removed == 0);
  assert(result.saved_file_path == "/fixed/" + task.id + "/main.cpp");
  assert(harness.sources->Saved(result.saved_file_path) == result.fixed_content);

  assert(harness.store->Get(task.id).status == TaskStatus::kCompleted);
}

void TestContextAccumulatesAcrossStages() {
  Harness harness;
  auto    orchestrator = harness.Orchestrator();
  auto    task         = harness.store->Create("main.cpp", "/src/main.cpp", 14, {{"style", "google"}});

  orchestrator->Run(task.id);

  auto reviewer = harness.runners[1]->Contexts();
  assert(reviewer.size() == 1);
  assert(reviewer[0].stage == Stage::kReviewer);
  assert(reviewer[0].prior_reports.size() == 1);
  assert(reviewer[0].prior_reports[0].report == "layout is fine");
  assert(reviewer[0].options.at("style") == "google");

  // the save stage sees the optimizer's rewrite
  auto save = harness.runners[3]->Contexts();
  assert(save[0].original_content == "int main() {}\n");
  assert(save[0].current_content == "int main() {}\n// reviewed\n");
  assert(save[0].prior_reports.size() == 3);
}

void TestSecondStageFailure() {
  Harness harness;
  harness.runners[1] = std::make_shared<FakeRunner>([](const StageContext& context) -> StageResult {
    throw codereview::util::StageError(context.stage, "model timed out");
  });
  auto orchestrator = harness.Orchestrator();
  auto task         = harness.store->Create("main.cpp", "/src/main.cpp", 14);

  auto finished = orchestrator->Run(task.id);

  assert(finished.status == TaskStatus::kFailed);
  assert(finished.error.has_value());
  assert(finished.error->stage == Stage::kReviewer);
  assert(finished.error->message == "Reviewer: model timed out");
  assert(finished.stage_states[StageIndex(Stage::kReviewer)].message == "model timed out");
  assert(!finished.result.has_value());

  assert(finished.stage_states[StageIndex(Stage::kArchitect)].status == StageStatus::kCompleted);
  assert(finished.stage_states[StageIndex(Stage::kReviewer)].status == StageStatus::kFailed);
  assert(finished.stage_states[StageIndex(Stage::kOptimizer)].status == StageStatus::kIdle);
  assert(finished.stage_states[StageIndex(Stage::kSave)].status == StageStatus::kIdle);
  assert(finished.overall_progress == 25.0);
  assert(harness.runners[2]->calls == 0);
  assert(harness.runners[3]->calls == 0);
}

void TestForeignExceptionsBecomeStageErrors() {
  Harness harness;
  harness.runners[2] = std::make_shared<FakeRunner>([](const StageContext&) -> StageResult { throw std::out_of_range("bad patch offset"); });
  auto orchestrator = harness.Orchestrator();
  auto task         = harness.store->Create("main.cpp", "/src/main.cpp", 14);

  auto finished = orchestrator->Run(task.id);

  assert(finished.status == TaskStatus::kFailed);
  assert(finished.error->stage == Stage::kOptimizer);
  assert(finished.error->message == "Optimizer: bad patch offset");
}

void TestNonStandardThrowFailsStageInRun() {
  Harness harness;
  harness.runners[1] = std::make_shared<FakeRunner>([](const StageContext&) -> StageResult { throw 42; });
  auto     orchestrator = harness.Orchestrator();
  auto     task         = harness.store->Create("main.cpp", "/src/main.cpp", 14);
  EventLog log;
  harness.broker->Register(task.id, "client", log.Handle());

  auto finished = orchestrator->Run(task.id);

  assert(finished.status == TaskStatus::kFailed);
  assert(finished.error->stage == Stage::kReviewer);
  assert(finished.error->message == "Reviewer: unknown exception");
  assert(harness.store->Get(task.id).status == TaskStatus::kFailed);
  assert(harness.runners[2]->calls == 0);

  const auto events = log.Snapshot();
  assert(events.back().type == EventType::kFailed);
  assert(events.back().error->stage == Stage::kReviewer);
}

void TestNonStandardThrowFailsStageOnWorker() {
  Harness harness;
  harness.runners[1] = std::make_shared<FakeRunner>([](const StageContext&) -> StageResult { throw 42; });
  auto     orchestrator = harness.Orchestrator();
  auto     task         = harness.store->Create("main.cpp", "/src/main.cpp", 14);
  EventLog log;
  harness.broker->Register(task.id, "client", log.Handle());

  orchestrator->Start(task.id);
  orchestrator->WaitIdle();

  auto finished = harness.store->Get(task.id);
  assert(finished.status == TaskStatus::kFailed);
  assert(finished.error->stage == Stage::kReviewer);

  const auto events    = log.Snapshot();
  std::size_t terminal = 0;
  for (const auto& event : events) {
    if (event.type != EventType::kStageUpdate) {
      ++terminal;
    }
  }
  assert(terminal == 1);
  assert(events.back().type == EventType::kFailed);
}

// A source store that throws something other than std::exception.
class BrokenSourceStore final : public codereview::storage::SourceStore {
 public:
  std::string Load(const std::string&) override {
    throw 3;
  }

  std::string SaveFixed(const std::string&, const std::string&, const std::string&) override {
    return {};
  }
};

void TestNonStandardThrowFromSourceStoreFailsFirstStage() {
  Harness                         harness;
  codereview::stage::StageRunners stage_runners;
  for (std::size_t i = 0; i < harness.runners.size(); ++i) {
    stage_runners[i] = harness.runners[i];
  }
  TaskOrchestrator orchestrator(harness.store, harness.broker, std::make_shared<BrokenSourceStore>(), stage_runners);
  auto             task = harness.store->Create("main.cpp", "/src/main.cpp", 14);

  orchestrator.Start(task.id);
  orchestrator.WaitIdle();

  auto finished = harness.store->Get(task.id);
  assert(finished.status == TaskStatus::kFailed);
  assert(finished.error->stage == Stage::kArchitect);
  assert(finished.error->message == "Architect: failed to load source: unknown exception");
  assert(harness.runners[0]->calls == 0);
}

void TestUnreadableSourceFailsFirstStage() {
  Harness harness;
  auto    orchestrator = harness.Orchestrator();
  auto    task         = harness.store->Create("gone.cpp", "/src/gone.cpp", 0);

  auto finished = orchestrator->Run(task.id);

  assert(finished.status == TaskStatus::kFailed);
  assert(finished.error->stage == Stage::kArchitect);
  assert(finished.error->message.find("Architect: failed to load source") == 0);
  assert(harness.runners[0]->calls == 0);
}

void TestSubscribersSeeIdenticalOrderedStreams() {
  Harness  harness;
  auto     orchestrator = harness.Orchestrator();
  auto     task         = harness.store->Create("main.cpp", "/src/main.cpp", 14);
  EventLog first;
  EventLog second;
  harness.broker->Register(task.id, "first", first.Handle());
  harness.broker->Register(task.id, "second", second.Handle());

  orchestrator->Run(task.id);

  const auto a = first.Snapshot();
  const auto b = second.Snapshot();
  assert(a.size() == b.size());
  for (std::size_t i = 0; i < a.size(); ++i) {
    assert(a[i].type == b[i].type);
    assert(a[i].stage == b[i].stage);
    assert(a[i].status == b[i].status);
    assert(a[i].overall_progress == b[i].overall_progress);
  }

  // running + completed per stage, then one terminal event
  assert(a.size() == 9);
  std::size_t stage_completions = 0;
  double      last_progress     = 0.0;
  for (std::size_t i = 0; i + 1 < a.size(); ++i) {
    assert(a[i].type == EventType::kStageUpdate);
    assert(*a[i].stage == codereview::model::kStageSequence[i / 2]);
    assert(*a[i].status == (i % 2 == 0 ? StageStatus::kRunning : StageStatus::kCompleted));
    assert(a[i].overall_progress >= last_progress);
    last_progress = a[i].overall_progress;
    if (*a[i].status == StageStatus::kCompleted) {
      ++stage_completions;
    }
  }
  assert(stage_completions == 4);
  assert(a.back().type == EventType::kCompleted);
  assert(a.back().task.has_value());
  assert(a.back().task->status == TaskStatus::kCompleted);
}

void TestFailureBroadcastsOneTerminalEvent() {
  Harness harness;
  harness.runners[0] = std::make_shared<FakeRunner>([](const StageContext& context) -> StageResult {
    throw codereview::util::StageError(context.stage, "unparseable source");
  });
  auto     orchestrator = harness.Orchestrator();
  auto     task         = harness.store->Create("main.cpp", "/src/main.cpp", 14);
  EventLog log;
  harness.broker->Register(task.id, "client", log.Handle());

  orchestrator->Run(task.id);

  const auto events    = log.Snapshot();
  std::size_t terminal = 0;
  for (const auto& event : events) {
    if (event.type != EventType::kStageUpdate) {
      ++terminal;
    }
  }
  assert(terminal == 1);
  assert(events.back().type == EventType::kFailed);
  assert(events.back().error->stage == Stage::kArchitect);
  assert(events.back().error->message == "Architect: unparseable source");
}

void TestLateSubscriberStillReadsFinalRecord() {
  Harness harness;
  auto    orchestrator = harness.Orchestrator();
  auto    task         = harness.store->Create("main.cpp", "/src/main.cpp", 14);

  orchestrator->Run(task.id);

  EventLog late;
  harness.broker->Register(task.id, "late", late.Handle());
  assert(late.Snapshot().empty());

  auto record = harness.store->Get(task.id);
  assert(record.status == TaskStatus::kCompleted);
  assert(record.result.has_value());
  assert(record.result->reports.size() == 4);
  assert(!record.result->saved_file_path.empty());
}

void TestConcurrentRunExecutesOnce() {
  Harness harness;

  // hold the first stage until both callers have raced
  std::mutex              gate_mutex;
  std::condition_variable gate_cv;
  bool                    open = false;
  harness.runners[0]           = std::make_shared<FakeRunner>([&](const StageContext&) {
    std::unique_lock lock(gate_mutex);
    gate_cv.wait(lock, [&] { return open; });
    return Report("ok");
  });

  auto orchestrator = harness.Orchestrator();
  auto task         = harness.store->Create("main.cpp", "/src/main.cpp", 14);

  std::atomic<int> rejected{0};
  std::atomic<int> completed{0};
  auto             call = [&] {
    try {
      auto finished = orchestrator->Run(task.id);
      if (finished.status == TaskStatus::kCompleted) {
        ++completed;
      }
    } catch (const codereview::util::InvalidState&) {
      ++rejected;
      std::lock_guard lock(gate_mutex);
      open = true;
      gate_cv.notify_all();
    }
  };

  std::thread first(call);
  std::thread second(call);
  first.join();
  second.join();

  assert(rejected == 1);
  assert(completed == 1);
  assert(harness.runners[0]->calls == 1);
  assert(harness.runners[3]->calls == 1);
}

void TestRunRejectsUnknownAndFinishedTasks() {
  Harness harness;
  auto    orchestrator = harness.Orchestrator();

  bool threw = false;
  try {
    orchestrator->Run("missing");
  } catch (const codereview::util::TaskNotFound&) {
    threw = true;
  }
  assert(threw);

  auto task = harness.store->Create("main.cpp", "/src/main.cpp", 14);
  orchestrator->Run(task.id);

  threw = false;
  try {
    orchestrator->Run(task.id);
  } catch (const codereview::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestStartRunsOnWorkerThread() {
  Harness harness;
  auto    orchestrator = harness.Orchestrator();

  std::vector<std::string> ids;
  for (int i = 0; i < 4; ++i) {
    auto task = harness.store->Create("main.cpp", "/src/main.cpp", 14);
    auto running = orchestrator->Start(task.id);
    assert(running.status == TaskStatus::kRunning);
    ids.push_back(task.id);
  }

  orchestrator->WaitIdle();
  assert(orchestrator->ActiveRuns() == 0);
  for (const auto& id : ids) {
    assert(harness.store->Get(id).status == TaskStatus::kCompleted);
  }

  // a started task cannot be started again
  bool threw = false;
  try {
    orchestrator->Start(ids.front());
  } catch (const codereview::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestStartAfterShutdownIsRejected() {
  Harness harness;
  auto    orchestrator = harness.Orchestrator();
  auto    task         = harness.store->Create("main.cpp", "/src/main.cpp", 14);

  orchestrator->Shutdown();

  bool threw = false;
  try {
    orchestrator->Start(task.id);
  } catch (const codereview::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(harness.store->Get(task.id).status == TaskStatus::kPending);
}

void TestMissingRunnerFailsStage() {
  Harness harness;
  codereview::stage::StageRunners stage_runners;
  stage_runners[0] = harness.runners[0];
  TaskOrchestrator orchestrator(harness.store, harness.broker, harness.sources, stage_runners);
  auto             task = harness.store->Create("main.cpp", "/src/main.cpp", 14);

  auto finished = orchestrator.Run(task.id);
  assert(finished.status == TaskStatus::kFailed);
  assert(finished.error->stage == Stage::kReviewer);
  assert(finished.error->message == "Reviewer: no runner configured");
}

} // namespace

int main() {
  TestAllStagesSucceed();
  TestContextAccumulatesAcrossStages();
  TestSecondStageFailure();
  TestForeignExceptionsBecomeStageErrors();
  TestNonStandardThrowFailsStageInRun();
  TestNonStandardThrowFailsStageOnWorker();
  TestNonStandardThrowFromSourceStoreFailsFirstStage();
  TestUnreadableSourceFailsFirstStage();
  TestSubscribersSeeIdenticalOrderedStreams();
  TestFailureBroadcastsOneTerminalEvent();
  TestLateSubscriberStillReadsFinalRecord();
  TestConcurrentRunExecutesOnce();
  TestRunRejectsUnknownAndFinishedTasks();
  TestStartRunsOnWorkerThread();
  TestStartAfterShutdownIsRejected();
  TestMissingRunnerFailsStage();

  std::cout << "codereview_unit_task_orchestrator: pass\n";
  return 0;
}
