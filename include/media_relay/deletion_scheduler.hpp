/**
 * @file deletion_scheduler.hpp
 * @brief Centralized, cancellable executor for deferred artifact deletions
 *
 * @details One worker thread drains a min-heap of deletion tasks ordered by
 *          fire time:
 *
 *          - schedule_deletion() pushes a task and wakes the worker when the
 *            new task becomes the head
 *
 *          - cancel_deletion() marks a queued task; the worker drops marked
 *            tasks when they reach the head
 *
 *          - a failed deletion is logged and never blocks later tasks
 *
 * @note The composition root owns exactly one instance and passes it by
 *       reference to every consumer (FileManager, CLI).
 */

#ifndef MEDIA_RELAY_DELETION_SCHEDULER_HPP
#define MEDIA_RELAY_DELETION_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "cancellation.hpp"
#include "logging.hpp"

namespace media_relay {

/// What a deletion action found
enum class DeletionOutcome { Deleted, AlreadyGone };

/**
 * @brief Action removing one artifact.
 * @note Reports failure by throwing; the scheduler logs and moves on.
 */
using Deleter = std::function<DeletionOutcome(const std::string &target)>;

/// Deleter removing a file from the local filesystem
Deleter local_file_deleter();

/**
 * @struct ScheduledDeletion
 * @brief Receipt returned by schedule_deletion().
 */
struct ScheduledDeletion {
  std::string task_id;                              //< Random UUID
  std::chrono::system_clock::time_point fire_time; //< Wall-clock due time
};

/**
 * @class DeletionScheduler
 * @brief Single-worker timer heap for one-shot deletions.
 *
 * @attention GUARANTEES:
 *
 * - Tasks execute in fire-time order; ties run in scheduling order
 *
 * - A task is executed at most once
 *
 * - Cancellation is checked when a task is popped, so a task cancelled
 *   before it reaches the head is never executed
 *
 * - Every wait is bounded: the worker sleeps at most max_sleep at a time and
 *   shutdown() gives up on the worker after its timeout
 */
class DeletionScheduler {
public:
  /**
   * @brief Start the scheduler and its worker thread.
   * @param deleter Action run for each due task
   * @param max_sleep Longest single sleep of the worker
   */
  explicit DeletionScheduler(
      Deleter deleter = local_file_deleter(),
      std::chrono::milliseconds max_sleep = std::chrono::seconds(60));

  /// Calls shutdown()
  ~DeletionScheduler();

  DeletionScheduler(const DeletionScheduler &) = delete;
  DeletionScheduler &operator=(const DeletionScheduler &) = delete;

  /**
   * @brief Schedule deletion of target after delay.
   * @param target Artifact identifier handed to the deleter
   * @param delay Time until the task fires (0 = next worker cycle)
   * @param sink Optional per-task log sink
   * @throws SchedulerShutdown after shutdown()
   */
  ScheduledDeletion schedule_deletion(const std::string &target,
                                      std::chrono::milliseconds delay,
                                      LogSink sink = {});

  /**
   * @brief Cancel a queued task.
   * @return true if the task was queued and not already cancelled
   */
  bool cancel_deletion(const std::string &task_id);

  /**
   * @brief Stop the worker.
   * @note Pending tasks are dropped. Idempotent.
   * @param timeout Upper bound on waiting for the worker to exit
   */
  void shutdown(std::chrono::milliseconds timeout = std::chrono::seconds(10));

  /**
   * @brief Queued tasks minus outstanding cancellations.
   * @note A diagnostic, not an exact count under concurrent churn.
   */
  long pending_count() const;

  /// Tasks whose deletion action has run (successfully or not)
  uint64_t executed_count() const;

  bool is_running() const;

private:
  struct Task {
    Clock::time_point due;
    uint64_t seq; //< Tie-breaker: scheduling order
    std::string task_id;
    std::string target;
    LogSink sink;
  };

  /// Heap comparator: the earliest task sits at the front
  struct Later {
    bool operator()(const Task &a, const Task &b) const {
      if (a.due != b.due)
        return a.due > b.due;
      return a.seq > b.seq;
    }
  };

  /// State shared with the worker so a detached worker never dangles
  struct Shared {
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::condition_variable stopped_cv;
    std::vector<Task> heap;
    std::unordered_set<std::string> queued;
    std::unordered_set<std::string> cancelled;
    uint64_t next_seq = 0;
    uint64_t executed = 0;
    bool shutdown = false;
    bool stopped = false;
    Deleter deleter;
    std::chrono::milliseconds max_sleep;
  };

  static void worker_loop(std::shared_ptr<Shared> shared);
  static void execute(const Shared &shared, const Task &task);

  std::shared_ptr<Shared> shared_;
  std::thread worker_;
};

} // namespace media_relay

#endif // MEDIA_RELAY_DELETION_SCHEDULER_HPP
