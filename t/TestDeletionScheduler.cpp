#include "media_relay/deletion_scheduler.hpp"
#include "media_relay/errors.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace media_relay;
using namespace media_relay::test;
using namespace std::chrono_literals;

namespace {

/// Deleter recording the targets it was handed, in execution order
class RecordingDeleter {
public:
  Deleter deleter() {
    return [this](const std::string &target) {
      std::lock_guard<std::mutex> lock(mutex_);
      targets_.push_back(target);
      return DeletionOutcome::Deleted;
    };
  }

  std::vector<std::string> targets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return targets_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::string> targets_;
};

} // namespace

TEST(DeletionScheduler, ZeroDelayDeletesPromptly) {
  TempDir dir;
  const fs::path file = dir / "expired.mp4";
  write_file(file, "media");

  DeletionScheduler scheduler;
  const long before = scheduler.pending_count();

  ScheduledDeletion receipt = scheduler.schedule_deletion(file.string(), 0ms);
  EXPECT_FALSE(receipt.task_id.empty());

  EXPECT_TRUE(wait_until([&] { return !fs::exists(file); }, 2s));
  EXPECT_TRUE(wait_until(
      [&] { return scheduler.pending_count() == before; }, 1s));
  EXPECT_EQ(scheduler.executed_count(), 1u);
}

TEST(DeletionScheduler, CancelledTaskNeverRuns) {
  TempDir dir;
  const fs::path file = dir / "kept.mp4";
  write_file(file, "media");

  DeletionScheduler scheduler;
  ScheduledDeletion receipt = scheduler.schedule_deletion(file.string(), 200ms);
  EXPECT_TRUE(scheduler.cancel_deletion(receipt.task_id));

  /// Well past the original fire time
  std::this_thread::sleep_for(500ms);
  EXPECT_TRUE(fs::exists(file));
  EXPECT_EQ(scheduler.executed_count(), 0u);
  EXPECT_EQ(scheduler.pending_count(), 0);
}

TEST(DeletionScheduler, CancelSucceedsOnlyOnce) {
  DeletionScheduler scheduler;
  ScheduledDeletion receipt =
      scheduler.schedule_deletion("/nonexistent/a", std::chrono::hours(1));

  EXPECT_TRUE(scheduler.cancel_deletion(receipt.task_id));
  EXPECT_FALSE(scheduler.cancel_deletion(receipt.task_id));
  EXPECT_FALSE(scheduler.cancel_deletion("no-such-task"));
}

TEST(DeletionScheduler, CancelAfterExecutionFails) {
  RecordingDeleter recorder;
  DeletionScheduler scheduler(recorder.deleter());

  ScheduledDeletion receipt = scheduler.schedule_deletion("gone", 0ms);
  ASSERT_TRUE(wait_until([&] { return scheduler.executed_count() == 1; }, 2s));
  EXPECT_FALSE(scheduler.cancel_deletion(receipt.task_id));
}

TEST(DeletionScheduler, ExecutesInFireTimeOrder) {
  RecordingDeleter recorder;
  DeletionScheduler scheduler(recorder.deleter());

  scheduler.schedule_deletion("c", 300ms);
  scheduler.schedule_deletion("a", 100ms);
  scheduler.schedule_deletion("e", 500ms);
  scheduler.schedule_deletion("b", 200ms);
  scheduler.schedule_deletion("d", 400ms);

  ASSERT_TRUE(wait_until([&] { return scheduler.executed_count() == 5; }, 3s));
  EXPECT_EQ(recorder.targets(),
            (std::vector<std::string>{"a", "b", "c", "d", "e"}));
}

TEST(DeletionScheduler, SameDelayRunsInSchedulingOrder) {
  RecordingDeleter recorder;
  /// Block the worker until all tasks are queued
  std::mutex gate;
  std::unique_lock<std::mutex> hold(gate);
  Deleter gated = [&gate, inner = recorder.deleter()](const std::string &t) {
    std::lock_guard<std::mutex> lock(gate);
    return inner(t);
  };
  DeletionScheduler scheduler(gated);

  scheduler.schedule_deletion("first", 0ms);
  ASSERT_TRUE(wait_until([&] { return scheduler.pending_count() == 0; }, 1s));
  for (const char *name : {"second", "third", "fourth"})
    scheduler.schedule_deletion(name, 0ms);
  hold.unlock();

  ASSERT_TRUE(wait_until([&] { return scheduler.executed_count() == 4; }, 2s));
  EXPECT_EQ(recorder.targets(),
            (std::vector<std::string>{"first", "second", "third", "fourth"}));
}

TEST(DeletionScheduler, EarlierTaskPreemptsSleepingWorker) {
  RecordingDeleter recorder;
  DeletionScheduler scheduler(recorder.deleter());

  scheduler.schedule_deletion("late", std::chrono::hours(1));
  std::this_thread::sleep_for(50ms);
  scheduler.schedule_deletion("soon", 0ms);

  EXPECT_TRUE(wait_until([&] { return scheduler.executed_count() == 1; }, 1s));
  EXPECT_EQ(recorder.targets(), std::vector<std::string>{"soon"});
  EXPECT_EQ(scheduler.pending_count(), 1);
}

TEST(DeletionScheduler, FailedDeletionDoesNotBlockLaterTasks) {
  RecordingSink failures;
  RecordingDeleter recorder;
  Deleter flaky = [inner = recorder.deleter()](const std::string &target) {
    if (target == "bad")
      throw std::runtime_error("permission denied");
    return inner(target);
  };
  DeletionScheduler scheduler(flaky);

  scheduler.schedule_deletion("bad", 0ms, failures.sink());
  scheduler.schedule_deletion("good", 50ms);

  ASSERT_TRUE(wait_until([&] { return scheduler.executed_count() == 2; }, 2s));
  EXPECT_EQ(recorder.targets(), std::vector<std::string>{"good"});
  EXPECT_TRUE(failures.contains(LogLevel::Error, "Failed to auto-delete file bad"));
  EXPECT_TRUE(failures.contains(LogLevel::Error, "permission denied"));
}

TEST(DeletionScheduler, UnknownThrownTypeIsReportedAndWorkerSurvives) {
  RecordingSink failures;
  RecordingDeleter recorder;
  Deleter odd = [inner = recorder.deleter()](
                    const std::string &target) -> DeletionOutcome {
    if (target == "odd")
      throw 7;
    return inner(target);
  };
  DeletionScheduler scheduler(odd);

  scheduler.schedule_deletion("odd", 0ms, failures.sink());
  scheduler.schedule_deletion("after", 50ms);

  ASSERT_TRUE(wait_until([&] { return scheduler.executed_count() == 2; }, 2s));
  EXPECT_TRUE(scheduler.is_running());
  EXPECT_EQ(recorder.targets(), std::vector<std::string>{"after"});
  EXPECT_TRUE(failures.contains(LogLevel::Error,
                                "Failed to auto-delete file odd: unknown error"));
}

TEST(DeletionScheduler, MissingFileIsReportedAsAlreadyDeleted) {
  TempDir dir;
  RecordingSink sink;
  DeletionScheduler scheduler;

  const std::string missing = (dir / "never-existed.mp4").string();
  scheduler.schedule_deletion(missing, 0ms, sink.sink());

  ASSERT_TRUE(wait_until([&] { return scheduler.executed_count() == 1; }, 2s));
  EXPECT_TRUE(sink.contains(LogLevel::Info, "File already deleted: " + missing));
}

TEST(DeletionScheduler, SuccessfulDeletionIsReportedToSink) {
  TempDir dir;
  const fs::path file = dir / "clip.webm";
  write_file(file, "media");

  RecordingSink sink;
  DeletionScheduler scheduler;
  scheduler.schedule_deletion(file.string(), 0ms, sink.sink());

  ASSERT_TRUE(wait_until([&] { return scheduler.executed_count() == 1; }, 2s));
  EXPECT_TRUE(
      sink.contains(LogLevel::Info, "Auto-deleted file: " + file.string()));
}

TEST(DeletionScheduler, PendingCountExcludesCancelledTasks) {
  DeletionScheduler scheduler;
  auto a = scheduler.schedule_deletion("a", std::chrono::hours(1));
  scheduler.schedule_deletion("b", std::chrono::hours(1));
  scheduler.schedule_deletion("c", std::chrono::hours(1));
  EXPECT_EQ(scheduler.pending_count(), 3);

  scheduler.cancel_deletion(a.task_id);
  EXPECT_EQ(scheduler.pending_count(), 2);
}

TEST(DeletionScheduler, ShutdownRefusesNewTasksAndDropsPending) {
  TempDir dir;
  const fs::path file = dir / "survivor.mp4";
  write_file(file, "media");

  DeletionScheduler scheduler;
  scheduler.schedule_deletion(file.string(), std::chrono::hours(1));
  EXPECT_TRUE(scheduler.is_running());

  scheduler.shutdown(1s);
  scheduler.shutdown(1s);

  EXPECT_FALSE(scheduler.is_running());
  EXPECT_TRUE(fs::exists(file));
  EXPECT_THROW(scheduler.schedule_deletion(file.string(), 0ms),
               SchedulerShutdown);
}

TEST(DeletionScheduler, ReceiptCarriesWallClockFireTime) {
  DeletionScheduler scheduler;
  auto before = std::chrono::system_clock::now();
  ScheduledDeletion receipt =
      scheduler.schedule_deletion("x", std::chrono::hours(2));
  auto after = std::chrono::system_clock::now();

  EXPECT_GE(receipt.fire_time, before + std::chrono::hours(2));
  EXPECT_LE(receipt.fire_time, after + std::chrono::hours(2));
  EXPECT_EQ(receipt.task_id.size(), 36u);
}
