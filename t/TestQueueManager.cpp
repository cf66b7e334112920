#include "media_relay/errors.hpp"
#include "media_relay/queue_manager.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace media_relay;
using media_relay::test::wait_until;
using namespace std::chrono_literals;

namespace {

QueueOptions options(int workers, int max_concurrent,
                     std::chrono::milliseconds timeout = std::chrono::minutes(1)) {
  QueueOptions opts;
  opts.workers = workers;
  opts.max_concurrent = max_concurrent;
  opts.default_job_timeout = timeout;
  return opts;
}

/// Task that idles until released, observing cancellation meanwhile
JobTask held_task(const std::atomic<bool> &released) {
  return [&released](JobContext &context) {
    while (!released)
      context.sleep_for(10ms);
    return nlohmann::json{{"job", context.job_id()}};
  };
}

JobTask endless_task() {
  return [](JobContext &context) -> nlohmann::json {
    while (true)
      context.sleep_for(10ms);
  };
}

} // namespace

TEST(QueueManager, RunsJobAndHandsOutResultOnce) {
  QueueManager queue(options(2, 2));
  queue.start();

  auto handle = queue.submit("job-a", [](JobContext &context) {
    context.sleep_for(100ms);
    return nlohmann::json{{"value", 42}};
  });

  EXPECT_TRUE(wait_until(
      [&] {
        auto info = queue.status("job-a");
        return info && info->running;
      },
      1s));

  ASSERT_TRUE(handle->wait(2s));
  EXPECT_EQ(handle->status(), JobState::Completed);

  JobStatusInfo info = handle->info();
  EXPECT_TRUE(info.done);
  EXPECT_FALSE(info.cancelled);
  ASSERT_TRUE(info.success.has_value());
  EXPECT_TRUE(*info.success);

  EXPECT_EQ(handle->take_result()["value"], 42);
  EXPECT_THROW(handle->take_result(), std::logic_error);

  /// Finished jobs leave the active table
  EXPECT_FALSE(queue.status("job-a").has_value());
  EXPECT_EQ(queue.stats().active, 0u);
  EXPECT_EQ(queue.stats().total_succeeded, 1u);
}

TEST(QueueManager, ResultOfUnfinishedJobIsALogicError) {
  QueueManager queue(options(1, 1));
  queue.start();

  std::atomic<bool> released{false};
  auto handle = queue.submit("held", held_task(released));
  EXPECT_THROW(handle->take_result(), std::logic_error);

  released = true;
  ASSERT_TRUE(handle->wait(2s));
  EXPECT_EQ(handle->take_result()["job"], "held");
}

TEST(QueueManager, SubmitBeforeStartIsRefused) {
  QueueManager queue(options(1, 1));
  EXPECT_THROW(queue.submit("early", endless_task()), SchedulerShutdown);
  EXPECT_FALSE(queue.is_healthy());
}

TEST(QueueManager, StartIsIdempotent) {
  QueueManager queue(options(2, 3));
  queue.start();
  queue.start();

  QueueStats stats = queue.stats();
  EXPECT_TRUE(stats.started);
  EXPECT_EQ(stats.max_workers, 2);
  EXPECT_EQ(stats.max_concurrent, 3);
  EXPECT_TRUE(queue.is_healthy());
}

TEST(QueueManager, RefusesSubmissionAtTwiceTheConcurrencyLimit) {
  QueueManager queue(options(1, 2));
  queue.start();

  std::atomic<bool> released{false};
  std::vector<std::shared_ptr<JobHandle>> jobs;

  /// One job held running, then the C-th submission is still accepted
  jobs.push_back(queue.submit("held-0", held_task(released)));
  ASSERT_TRUE(wait_until(
      [&] { return jobs[0]->status() == JobState::Running; }, 1s));
  EXPECT_NO_THROW(jobs.push_back(queue.submit("held-1", held_task(released))));

  /// Up to 2*C active jobs are admitted
  jobs.push_back(queue.submit("held-2", held_task(released)));
  jobs.push_back(queue.submit("held-3", held_task(released)));
  EXPECT_EQ(queue.stats().active, 4u);

  try {
    queue.submit("overflow", held_task(released));
    FAIL() << "expected QueueFull";
  } catch (const QueueFull &e) {
    EXPECT_EQ(e.kind(), ErrorKind::QueueFull);
    EXPECT_EQ(e.http_status(), 503);
  }

  released = true;
  for (const auto &job : jobs)
    ASSERT_TRUE(job->wait(5s));

  auto later = queue.submit("later", held_task(released));
  EXPECT_TRUE(later->wait(2s));
  EXPECT_EQ(queue.stats().total_submitted, 5u);
}

TEST(QueueManager, ConcurrencyLimitBoundsExecution) {
  QueueManager queue(options(4, 2));
  queue.start();

  std::atomic<int> current{0};
  std::atomic<int> peak{0};
  JobTask task = [&](JobContext &context) {
    int now = ++current;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
    context.sleep_for(100ms);
    --current;
    return nlohmann::json::object();
  };

  std::vector<std::shared_ptr<JobHandle>> jobs;
  for (int i = 0; i < 4; ++i)
    jobs.push_back(queue.submit("limited-" + std::to_string(i), task));
  for (const auto &job : jobs)
    ASSERT_TRUE(job->wait(5s));

  EXPECT_LE(peak.load(), 2);
  EXPECT_GE(peak.load(), 1);
}

TEST(QueueManager, CancelPendingJob) {
  QueueManager queue(options(1, 1));
  queue.start();

  std::atomic<bool> released{false};
  auto first = queue.submit("first", held_task(released));
  auto second = queue.submit("second", held_task(released));
  ASSERT_TRUE(wait_until(
      [&] { return first->status() == JobState::Running; }, 1s));

  EXPECT_TRUE(queue.cancel("second"));
  ASSERT_TRUE(second->wait(1s));
  EXPECT_EQ(second->status(), JobState::Cancelled);
  EXPECT_TRUE(second->info().cancelled);
  EXPECT_FALSE(second->info().success.has_value());
  EXPECT_THROW(second->take_result(), JobCancelled);

  EXPECT_FALSE(queue.cancel("second"));
  EXPECT_FALSE(queue.cancel("unknown"));

  released = true;
  ASSERT_TRUE(first->wait(2s));
  EXPECT_EQ(first->status(), JobState::Completed);
  EXPECT_FALSE(queue.cancel("first"));
}

TEST(QueueManager, CancelRunningJobIsCooperative) {
  QueueManager queue(options(1, 1));
  queue.start();

  auto handle = queue.submit("endless", endless_task());
  ASSERT_TRUE(wait_until(
      [&] { return handle->status() == JobState::Running; }, 1s));

  EXPECT_TRUE(queue.cancel("endless"));
  EXPECT_FALSE(queue.cancel("endless"));

  ASSERT_TRUE(handle->wait(2s));
  EXPECT_EQ(handle->status(), JobState::Cancelled);
  EXPECT_EQ(handle->info().error_kind, std::string("JobCancelled"));
  EXPECT_THROW(handle->take_result(), JobCancelled);
  EXPECT_EQ(queue.stats().total_failed, 0u);
}

TEST(QueueManager, DeadlineStopsCooperativeTask) {
  QueueManager queue(options(1, 1));
  queue.start();

  auto handle = queue.submit("slow", endless_task(), 100ms);
  ASSERT_TRUE(handle->wait(2s));

  EXPECT_EQ(handle->status(), JobState::Failed);
  JobStatusInfo info = handle->info();
  EXPECT_EQ(info.error_kind, std::string("JobTimeout"));
  ASSERT_TRUE(info.success.has_value());
  EXPECT_FALSE(*info.success);
  EXPECT_THROW(handle->take_result(), JobTimeout);
  EXPECT_EQ(queue.stats().total_failed, 1u);
}

TEST(QueueManager, OverrunningTaskStillFailsWithTimeout) {
  QueueManager queue(options(1, 1));
  queue.start();

  /// Ignores its token entirely and returns a value after the deadline
  auto handle = queue.submit(
      "stubborn",
      [](JobContext &) {
        std::this_thread::sleep_for(200ms);
        return nlohmann::json{{"late", true}};
      },
      50ms);

  ASSERT_TRUE(handle->wait(2s));
  EXPECT_EQ(handle->status(), JobState::Failed);
  EXPECT_THROW(handle->take_result(), JobTimeout);
}

TEST(QueueManager, OverrunningTaskIsAbandonedAtItsDeadline) {
  QueueManager queue(options(1, 2));
  queue.start();

  auto returned = std::make_shared<std::atomic<bool>>(false);
  auto handle = queue.submit(
      "stuck",
      [returned](JobContext &) {
        std::this_thread::sleep_for(1500ms);
        *returned = true;
        return nlohmann::json{{"late", true}};
      },
      100ms);

  /// Settled at the deadline, long before the task itself returns
  ASSERT_TRUE(handle->wait(600ms));
  EXPECT_FALSE(*returned);
  EXPECT_EQ(handle->status(), JobState::Failed);
  EXPECT_EQ(handle->info().error_kind, std::string("JobTimeout"));
  EXPECT_FALSE(queue.status("stuck").has_value());
  EXPECT_EQ(queue.stats().active, 0u);
  EXPECT_EQ(queue.stats().total_failed, 1u);

  /// The worker is free again while the abandoned task keeps its slot
  auto next = queue.submit("next", [](JobContext &) {
    return nlohmann::json{{"ok", true}};
  });
  ASSERT_TRUE(next->wait(500ms));
  EXPECT_EQ(next->status(), JobState::Completed);
  EXPECT_FALSE(*returned);

  /// The late result is dropped
  ASSERT_TRUE(wait_until([&] { return returned->load(); }, 3s));
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(handle->status(), JobState::Failed);
  EXPECT_THROW(handle->take_result(), JobTimeout);
  EXPECT_EQ(queue.stats().total_succeeded, 1u);
}

TEST(QueueManager, TaskErrorIsRethrownByTakeResult) {
  QueueManager queue(options(1, 1));
  queue.start();

  auto handle = queue.submit("broken", [](JobContext &) -> nlohmann::json {
    throw ExtractionFailed(1, "ERROR: video unavailable");
  });
  ASSERT_TRUE(handle->wait(2s));

  JobStatusInfo info = handle->info();
  EXPECT_EQ(info.state, JobState::Failed);
  EXPECT_EQ(info.error_kind, std::string("ExtractionFailed"));

  try {
    handle->take_result();
    FAIL() << "expected ExtractionFailed";
  } catch (const ExtractionFailed &e) {
    EXPECT_EQ(e.exit_code(), 1);
    EXPECT_EQ(e.details(), "ERROR: video unavailable");
  }
}

TEST(QueueManager, UntypedTaskErrorIsReported) {
  QueueManager queue(options(1, 1));
  queue.start();

  auto handle = queue.submit("plain", [](JobContext &) -> nlohmann::json {
    throw std::runtime_error("disk on fire");
  });
  ASSERT_TRUE(handle->wait(2s));

  JobStatusInfo info = handle->info();
  EXPECT_EQ(info.state, JobState::Failed);
  EXPECT_EQ(info.error, std::string("disk on fire"));
  EXPECT_FALSE(info.error_kind.has_value());
  EXPECT_THROW(handle->take_result(), std::runtime_error);
}

TEST(QueueManager, CompletionCallbackSeesFinalState) {
  QueueManager queue(options(1, 1));
  queue.start();

  std::promise<JobState> done;
  auto future = done.get_future();
  queue.submit(
      "callback", [](JobContext &) { return nlohmann::json{{"ok", true}}; },
      0ms, [&done](const JobHandle &handle) { done.set_value(handle.status()); });

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(future.get(), JobState::Completed);
}

TEST(QueueManager, WaitForCapacity) {
  QueueManager queue(options(2, 1));
  queue.start();
  EXPECT_TRUE(queue.wait_for_capacity(100ms));

  std::atomic<bool> released{false};
  auto handle = queue.submit("holder", held_task(released));
  ASSERT_TRUE(wait_until(
      [&] { return queue.stats().running == 1; }, 1s));
  EXPECT_FALSE(queue.wait_for_capacity(100ms));

  released = true;
  ASSERT_TRUE(handle->wait(2s));
  EXPECT_TRUE(queue.wait_for_capacity(100ms));
}

TEST(QueueManager, ShutdownRefusesNewJobs) {
  QueueManager queue(options(1, 1));
  queue.start();

  auto handle = queue.submit("quick", [](JobContext &) {
    return nlohmann::json{{"ok", true}};
  });
  queue.shutdown(true, 2s);

  EXPECT_TRUE(handle->wait(0ms));
  EXPECT_EQ(handle->status(), JobState::Completed);
  EXPECT_THROW(queue.submit("late", endless_task()), SchedulerShutdown);
  EXPECT_FALSE(queue.is_healthy());

  QueueStats stats = queue.stats();
  EXPECT_FALSE(stats.started);
  EXPECT_TRUE(stats.shutdown_pending);

  /// No restart after shutdown
  queue.start();
  EXPECT_FALSE(queue.is_healthy());
}

TEST(QueueManager, ShutdownWithoutWaitCancelsActiveJobs) {
  QueueManager queue(options(1, 1));
  queue.start();

  auto running = queue.submit("running", endless_task());
  auto pending = queue.submit("pending", endless_task());
  ASSERT_TRUE(wait_until(
      [&] { return running->status() == JobState::Running; }, 1s));

  queue.shutdown(false, 2s);

  ASSERT_TRUE(running->wait(0ms));
  ASSERT_TRUE(pending->wait(0ms));
  EXPECT_EQ(running->status(), JobState::Cancelled);
  EXPECT_EQ(pending->status(), JobState::Cancelled);
  EXPECT_EQ(queue.stats().active, 0u);
}
