#include "internal/core/task_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_task_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using codereview::core::TaskStore;
using codereview::model::Stage;
using codereview::model::StageIndex;
using codereview::model::StageStatus;
using codereview::model::TaskError;
using codereview::model::TaskResult;
using codereview::model::TaskStatus;

// Repository that accepts transactions but rejects every write.
class RejectingRepository final : public codereview::db::TaskRepository {
 public:
  class NoopTransaction final : public codereview::db::Transaction {
   public:
    void Commit() override {
      committed_ = true;
    }
    void Rollback() override {
    }
    bool IsCommitted() const override {
      return committed_;
    }

   private:
    bool committed_ = false;
  };

  std::unique_ptr<codereview::db::Transaction> Begin() override {
    return std::make_unique<NoopTransaction>();
  }

  codereview::db::Result UpsertTask(codereview::db::Transaction&, const codereview::db::model::TaskRecord&) override {
    ++rejected;
    return codereview::db::Result::Err(codereview::db::ErrorCode::IOError, "disk full");
  }

  std::optional<codereview::db::model::TaskRecord> GetTask(codereview::db::Transaction&, const std::string&) override {
    return std::nullopt;
  }

  std::vector<codereview::db::model::TaskRecord> ListTasks(codereview::db::Transaction&) override {
    return {};
  }

  codereview::db::Result DeleteTask(codereview::db::Transaction&, const std::string&) override {
    return codereview::db::Result::Err(codereview::db::ErrorCode::IOError, "disk full");
  }

  int rejected = 0;
};

std::shared_ptr<TaskStore> MakeStore() {
  return std::make_shared<TaskStore>(std::make_shared<codereview::db::memory::MemoryTaskRepository>());
}

void TestCreateStartsPendingWithIdleStages() {
  auto store = MakeStore();
  auto task  = store->Create("main.py", "/src/main.py", 120, {{"language", "python"}});

  assert(!task.id.empty());
  assert(task.status == TaskStatus::kPending);
  assert(task.overall_progress == 0.0);
  assert(task.stage_cursor == 0);
  assert(task.options.at("language") == "python");
  for (std::size_t i = 0; i < task.stage_states.size(); ++i) {
    assert(task.stage_states[i].stage == codereview::model::kStageSequence[i]);
    assert(task.stage_states[i].status == StageStatus::kIdle);
  }
  assert(!task.result.has_value());
  assert(!task.error.has_value());

  auto fetched = store->Get(task.id);
  assert(fetched.file_name == "main.py");
  assert(fetched.file_size == 120);
}

void TestCreateRejectsEmptyFileName() {
  auto store = MakeStore();
  bool threw = false;
  try {
    store->Create("", "/src/x", 0);
  } catch (const codereview::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(store->Count() == 0);
}

void TestGetUnknownTaskThrowsNotFound() {
  auto store = MakeStore();
  bool threw = false;
  try {
    store->Get("missing");
  } catch (const codereview::util::TaskNotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    store->UpdateStage("missing", Stage::kArchitect, StageStatus::kRunning, "", 0.0);
  } catch (const codereview::util::TaskNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestUpdateStageMovesForwardOnly() {
  auto store = MakeStore();
  auto task  = store->Create("a.cpp", "/src/a.cpp", 1);
  store->BeginRun(task.id);

  auto running = store->UpdateStage(task.id, Stage::kArchitect, StageStatus::kRunning, "Architect running", 250.0);
  assert(running.has_value());
  assert(running->stage_states[0].progress == 100.0);

  auto done = store->UpdateStage(task.id, Stage::kArchitect, StageStatus::kCompleted, "done", 100.0);
  assert(done.has_value());
  assert(done->overall_progress == 25.0);

  // completed -> running is a backward move
  auto backward = store->UpdateStage(task.id, Stage::kArchitect, StageStatus::kRunning, "again", 0.0);
  assert(!backward.has_value());
  assert(store->Get(task.id).stage_states[0].status == StageStatus::kCompleted);

  auto reviewer = store->UpdateStage(task.id, Stage::kReviewer, StageStatus::kRunning, "Reviewer running", -5.0);
  assert(reviewer.has_value());
  assert(reviewer->stage_states[1].progress == 0.0);
  assert(reviewer->stage_cursor == 1);

  // a late update on an earlier stage never moves the cursor back
  auto late = store->UpdateStage(task.id, Stage::kArchitect, StageStatus::kCompleted, "late", 100.0);
  assert(!late.has_value());
  assert(store->Get(task.id).stage_cursor == 1);
}

void TestOverallProgressIsNonDecreasing() {
  auto store = MakeStore();
  auto task  = store->Create("b.cpp", "/src/b.cpp", 1);
  store->BeginRun(task.id);

  double last = 0.0;
  for (const auto stage : codereview::model::kStageSequence) {
    auto running = store->UpdateStage(task.id, stage, StageStatus::kRunning, "", 0.0);
    assert(running && running->overall_progress >= last);
    last = running->overall_progress;

    auto done = store->UpdateStage(task.id, stage, StageStatus::kCompleted, "", 100.0);
    assert(done && done->overall_progress >= last);
    last = done->overall_progress;
  }
  assert(last == 100.0);
}

void TestBeginRunOnlyOnce() {
  auto store = MakeStore();
  auto task  = store->Create("c.cpp", "/src/c.cpp", 1);

  auto running = store->BeginRun(task.id);
  assert(running.status == TaskStatus::kRunning);
  assert(running.started_at.has_value());

  bool threw = false;
  try {
    store->BeginRun(task.id);
  } catch (const codereview::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestFinalizeIsIdempotent() {
  auto store = MakeStore();
  auto task  = store->Create("d.cpp", "/src/d.cpp", 1);
  store->BeginRun(task.id);

  TaskResult result;
  result.original_content = "x\n";
  result.fixed_content    = "y\n";

  auto completed = store->Finalize(task.id, result);
  assert(completed.has_value());
  assert(completed->status == TaskStatus::kCompleted);
  assert(completed->completed_at.has_value());
  assert(completed->result->fixed_content == "y\n");

  // nothing after a terminal state changes the record
  assert(!store->Finalize(task.id, TaskError{Stage::kSave, "late failure"}).has_value());
  assert(!store->Finalize(task.id, TaskResult{}).has_value());
  assert(!store->UpdateStage(task.id, Stage::kSave, StageStatus::kRunning, "", 0.0).has_value());

  auto after = store->Get(task.id);
  assert(after.status == TaskStatus::kCompleted);
  assert(!after.error.has_value());
  assert(after.result->fixed_content == "y\n");
  assert(after.stage_states[StageIndex(Stage::kSave)].status == StageStatus::kIdle);
}

void TestCompletingPendingTaskIsRejected() {
  auto store = MakeStore();
  auto task  = store->Create("e.cpp", "/src/e.cpp", 1);

  bool threw = false;
  try {
    store->Finalize(task.id, TaskResult{});
  } catch (const codereview::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  // failing is allowed from any non-terminal state
  auto failed = store->Finalize(task.id, TaskError{Stage::kArchitect, "source missing"});
  assert(failed.has_value());
  assert(failed->status == TaskStatus::kFailed);
  assert(failed->error->stage == Stage::kArchitect);
}

void TestListIsNewestFirstWithPaging() {
  auto store = MakeStore();
  std::vector<std::string> ids;
  for (int i = 0; i < 5; ++i) {
    ids.push_back(store->Create("f" + std::to_string(i) + ".cpp", "/src/f.cpp", 1).id);
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  auto all = store->List();
  assert(all.size() == 5);
  assert(all.front().id == ids.back());
  assert(all.back().id == ids.front());

  auto page = store->List(1, 2);
  assert(page.size() == 2);
  assert(page[0].id == ids[3]);
  assert(page[1].id == ids[2]);

  assert(store->List(10, 2).empty());
  assert(store->Count() == 5);
}

void TestRetentionEvictsOldestTerminalOnly() {
  auto store = MakeStore();

  auto oldest_running = store->Create("r.cpp", "/src/r.cpp", 1);
  store->BeginRun(oldest_running.id);
  std::this_thread::sleep_for(std::chrono::milliseconds(2));

  std::vector<std::string> done;
  for (int i = 0; i < 3; ++i) {
    auto task = store->Create("t" + std::to_string(i) + ".cpp", "/src/t.cpp", 1);
    store->Finalize(task.id, TaskError{Stage::kArchitect, "boom"});
    done.push_back(task.id);
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  assert(store->EnforceRetention(0) == 0);
  assert(store->EnforceRetention(2) == 2);
  assert(store->Count() == 2);
  assert(store->Contains(oldest_running.id));
  assert(!store->Contains(done[0]));
  assert(!store->Contains(done[1]));
  assert(store->Contains(done[2]));
}

void TestHydrateFailsInterruptedTasks() {
  auto repository = std::make_shared<codereview::db::memory::MemoryTaskRepository>();

  std::string interrupted_id;
  std::string completed_id;
  {
    TaskStore first(repository);
    auto      interrupted = first.Create("g.cpp", "/src/g.cpp", 1);
    first.BeginRun(interrupted.id);
    first.UpdateStage(interrupted.id, Stage::kArchitect, StageStatus::kCompleted, "done", 100.0);
    first.UpdateStage(interrupted.id, Stage::kReviewer, StageStatus::kRunning, "Reviewer running", 40.0);
    interrupted_id = interrupted.id;

    auto completed = first.Create("h.cpp", "/src/h.cpp", 1);
    first.BeginRun(completed.id);
    TaskResult result;
    result.fixed_content = "fixed";
    first.Finalize(completed.id, result);
    completed_id = completed.id;
  }

  TaskStore second(repository);
  assert(second.Hydrate() == 2);

  auto interrupted = second.Get(interrupted_id);
  assert(interrupted.status == TaskStatus::kFailed);
  assert(interrupted.error->stage == Stage::kReviewer);
  assert(interrupted.error->message == "interrupted by restart");
  assert(interrupted.stage_states[0].status == StageStatus::kCompleted);
  assert(interrupted.stage_states[1].status == StageStatus::kFailed);
  assert(interrupted.stage_states[1].progress == 40.0);
  assert(interrupted.overall_progress == 25.0);

  auto completed = second.Get(completed_id);
  assert(completed.status == TaskStatus::kCompleted);
  assert(completed.result->fixed_content == "fixed");

  // the failure was written back, so a third start sees it as terminal
  TaskStore third(repository);
  third.Hydrate();
  assert(third.Get(interrupted_id).status == TaskStatus::kFailed);
}

void TestPersistenceFailureKeepsMemoryAuthoritative() {
  auto      repository = std::make_shared<RejectingRepository>();
  TaskStore store(repository);

  auto task = store.Create("i.cpp", "/src/i.cpp", 1);
  store.BeginRun(task.id);
  auto updated = store.UpdateStage(task.id, Stage::kArchitect, StageStatus::kRunning, "", 10.0);

  assert(updated.has_value());
  assert(store.Get(task.id).status == TaskStatus::kRunning);
  assert(repository->rejected == 3);
}

void TestStoreWithoutRepository() {
  TaskStore store(nullptr);
  auto      task = store.Create("j.cpp", "/src/j.cpp", 1);
  assert(store.Hydrate() == 0);
  assert(store.Get(task.id).status == TaskStatus::kPending);
}

} // namespace

int main() {
  TestCreateStartsPendingWithIdleStages();
  TestCreateRejectsEmptyFileName();
  TestGetUnknownTaskThrowsNotFound();
  TestUpdateStageMovesForwardOnly();
  TestOverallProgressIsNonDecreasing();
  TestBeginRunOnlyOnce();
  TestFinalizeIsIdempotent();
  TestCompletingPendingTaskIsRejected();
  TestListIsNewestFirstWithPaging();
  TestRetentionEvictsOldestTerminalOnly();
  TestHydrateFailsInterruptedTasks();
  TestPersistenceFailureKeepsMemoryAuthoritative();
  TestStoreWithoutRepository();

  std::cout << "codereview_unit_task_store: pass\n";
  return 0;
}
