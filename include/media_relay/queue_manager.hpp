/**
 * @file queue_manager.hpp
 * @brief Background job queue: worker pool, concurrency cap, cancellation
 *
 * @details Two independent knobs govern execution:
 *
 *          - workers (W): OS threads spent on jobs
 *
 *          - max_concurrent (C): jobs allowed to execute at the same time;
 *            submission is refused once 2*C jobs are active
 *
 *          Every job gets a CancellationToken carrying its deadline. The
 *          task polls it; nothing is interrupted preemptively.
 */

#ifndef MEDIA_RELAY_QUEUE_MANAGER_HPP
#define MEDIA_RELAY_QUEUE_MANAGER_HPP

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "cancellation.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "work_queue.hpp"

namespace media_relay {

/**
 * @struct QueueOptions
 * @brief Sizing of a QueueManager, filled from Config by the caller.
 */
struct QueueOptions {
  int workers = 2;
  int max_concurrent = 10;
  std::chrono::milliseconds default_job_timeout = std::chrono::hours(2);
};

/**
 * @class JobContext
 * @brief What a running task sees of its job.
 */
class JobContext {
public:
  JobContext(std::string job_id, CancellationToken token)
      : job_id_(std::move(job_id)), token_(std::move(token)) {}

  const std::string &job_id() const { return job_id_; }
  const CancellationToken &token() const { return token_; }

  /// @throws JobCancelled / JobTimeout once the job should stop
  void check() const;

  /// Interruptible sleep; throws like check() when interrupted
  void sleep_for(Clock::duration duration) const;

private:
  std::string job_id_;
  CancellationToken token_;
};

using JobTask = std::function<nlohmann::json(JobContext &)>;

class JobHandle;
using JobCallback = std::function<void(const JobHandle &)>;

/**
 * @class JobHandle
 * @brief Caller-side view of one submitted job.
 *
 * @attention LIFECYCLE:
 *
 * - Pending -> Running -> {Completed | Failed | Cancelled}; a pending job
 *   may go straight to Cancelled
 *
 * - wait() returns only after the job has left the active-job table; a job
 *   whose task overruns its deadline leaves it at the deadline, as Failed
 *   with JobTimeout
 *
 * - take_result() hands out the result (or rethrows the error) exactly once
 */
class JobHandle {
public:
  explicit JobHandle(std::string job_id);

  JobHandle(const JobHandle &) = delete;
  JobHandle &operator=(const JobHandle &) = delete;

  const std::string &job_id() const { return job_id_; }

  JobState status() const;
  JobStatusInfo info() const;

  /// @return true if the job finished within timeout
  bool wait(std::chrono::milliseconds timeout) const;

  /**
   * @brief Retrieve the result of a finished job.
   * @throws std::logic_error if the job is not finished or the result was
   *         already taken; otherwise rethrows the job's error, if any
   */
  nlohmann::json take_result();

private:
  friend class QueueManager;

  enum class CancelOutcome {
    CancelledPending, //< Never started; now terminal
    Signalled,        //< Running; the token was cancelled
    AlreadyRequested, //< Running; cancellation was requested before
    AlreadyDone,
  };

  CancelOutcome cancel();

  /// Pending -> Running; false if the job was cancelled meanwhile
  bool mark_running();

  /// Settle the job; false if it was already terminal
  bool complete(nlohmann::json result);
  bool fail(JobState state, std::exception_ptr error);

  /// @return true if the job became terminal before deadline
  bool wait_settled(Clock::time_point deadline) const;

  /// Wake waiters once the job left the active table
  void publish();

  std::string job_id_;
  CancellationToken token_;
  JobCallback on_done_;

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  JobState state_ = JobState::Pending;
  bool published_ = false;
  bool result_taken_ = false;
  std::optional<nlohmann::json> result_;
  std::exception_ptr error_;
  std::string error_message_;
  std::optional<ErrorKind> error_kind_;
};

/**
 * @class QueueManager
 * @brief Runs submitted jobs on a bounded worker pool.
 *
 * @note Constructed once by the composition root and passed by reference.
 */
class QueueManager {
public:
  explicit QueueManager(QueueOptions options);

  /// Calls shutdown(false) if still running
  ~QueueManager();

  QueueManager(const QueueManager &) = delete;
  QueueManager &operator=(const QueueManager &) = delete;

  /// Create the worker pool and the limiter. Idempotent.
  void start();

  /**
   * @brief Queue a job.
   *
   * @param job_id Caller-assigned identifier
   * @param task Work to run on a worker thread
   * @param timeout Job deadline, measured from the start of execution
   *                (zero = default_job_timeout)
   * @param on_done Optional callback run after the job finished
   *
   * @throws QueueFull when 2*max_concurrent jobs are already active
   * @throws SchedulerShutdown before start() or after shutdown()
   */
  std::shared_ptr<JobHandle>
  submit(const std::string &job_id, JobTask task,
         std::chrono::milliseconds timeout = std::chrono::milliseconds::zero(),
         JobCallback on_done = {});

  /**
   * @brief Request cancellation of an active job.
   * @note A pending job is cancelled at once; a running job is signalled
   *       through its token.
   * @return false if the job is unknown or already finished
   */
  bool cancel(const std::string &job_id);

  /// Snapshot of an active job; nullopt once it left the table
  std::optional<JobStatusInfo> status(const std::string &job_id) const;

  QueueStats stats() const;

  /// Started and accepting submissions
  bool is_healthy() const;

  /// @return true if an execution slot became free within timeout
  bool wait_for_capacity(std::chrono::milliseconds timeout);

  /**
   * @brief Stop the manager.
   * @param wait Wait for active jobs; when false they are cancelled first
   * @param timeout Upper bound on each waiting phase
   * @note Submissions are refused from the first instruction on.
   */
  void shutdown(bool wait = true,
                std::chrono::milliseconds timeout = std::chrono::seconds(30));

private:
  struct State {
    QueueOptions options;
    mutable std::mutex mutex;
    std::condition_variable idle_cv;
    std::unordered_map<std::string, std::shared_ptr<JobHandle>> active;
    bool started = false;
    bool shutdown = false;
    ConcurrencyLimiter limiter;
    PaddedAtomic<uint64_t> total_submitted;
    PaddedAtomic<uint64_t> total_succeeded;
    PaddedAtomic<uint64_t> total_failed;

    explicit State(QueueOptions opts)
        : options(opts), limiter(opts.max_concurrent) {}
  };

  static void run_job(const std::shared_ptr<State> &state,
                      const std::shared_ptr<JobHandle> &handle,
                      const JobTask &task,
                      std::chrono::milliseconds timeout);

  /// Body of the per-job runner thread; owns everything it touches
  static void execute_task(std::shared_ptr<State> state,
                           std::shared_ptr<JobHandle> handle, JobTask task,
                           std::chrono::milliseconds timeout);

  /// Remove from the active table, wake waiters, run the callback
  static void finalize(State &state, const std::shared_ptr<JobHandle> &handle);

  void cancel_all();
  bool wait_until_idle(std::chrono::milliseconds timeout);

  std::shared_ptr<State> state_;
  std::unique_ptr<WorkerPool> pool_;
  std::mutex lifecycle_mutex_;
};

} // namespace media_relay

#endif // MEDIA_RELAY_QUEUE_MANAGER_HPP
