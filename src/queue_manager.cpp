/**
 * @file queue_manager.cpp
 * @brief Background job queue implementation
 *
 * @details Provides implementations for:
 *
 *          - JobContext / JobHandle: per-job state shared between the caller
 *            and the worker executing it
 *
 *          - QueueManager: submission, cancellation, status and shutdown
 *
 * @note Lock order is State::mutex, then JobHandle::mutex_, then the token.
 *       Completion callbacks run with no lock held.
 *
 * @attention A worker runs each task on a dedicated thread and waits for it
 *            until the job deadline at most. An overrunning task is detached
 *            and whatever it returns later is dropped.
 */

#include "media_relay/queue_manager.hpp"

#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

#include <fmt/core.h>

#include "media_relay/logging.hpp"

namespace media_relay {

// **----- JobContext -----**

void JobContext::check() const { throw_if_stopped(token_, "job " + job_id_); }

void JobContext::sleep_for(Clock::duration duration) const {
  if (token_.wait_for(duration))
    check();
}

// **----- JobHandle -----**

JobHandle::JobHandle(std::string job_id) : job_id_(std::move(job_id)) {}

JobState JobHandle::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

JobStatusInfo JobHandle::info() const {
  std::lock_guard<std::mutex> lock(mutex_);

  JobStatusInfo info;
  info.job_id = job_id_;
  info.state = state_;
  info.running = state_ == JobState::Running;
  info.done = is_terminal(state_);
  info.cancelled = state_ == JobState::Cancelled;

  if (info.done && !info.cancelled)
    info.success = state_ == JobState::Completed;
  if (error_) {
    info.error = error_message_;
    if (error_kind_)
      info.error_kind = error_kind_name(*error_kind_);
  }
  return info;
}

bool JobHandle::wait(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return published_; });
}

nlohmann::json JobHandle::take_result() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!is_terminal(state_))
    throw std::logic_error("job " + job_id_ + " has not finished");
  if (result_taken_)
    throw std::logic_error("result of job " + job_id_ + " was already taken");
  result_taken_ = true;

  if (error_)
    std::rethrow_exception(error_);

  nlohmann::json result = std::move(*result_);
  result_.reset();
  return result;
}

JobHandle::CancelOutcome JobHandle::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (is_terminal(state_))
    return CancelOutcome::AlreadyDone;
  if (token_.cancel_requested())
    return CancelOutcome::AlreadyRequested;

  token_.request_cancel();
  if (state_ != JobState::Pending)
    return CancelOutcome::Signalled;

  JobCancelled error("job " + job_id_ + " was cancelled before it started");
  state_ = JobState::Cancelled;
  error_message_ = error.what();
  error_kind_ = error.kind();
  error_ = std::make_exception_ptr(error);
  return CancelOutcome::CancelledPending;
}

bool JobHandle::mark_running() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != JobState::Pending)
    return false;
  state_ = JobState::Running;
  return true;
}

bool JobHandle::complete(nlohmann::json result) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal(state_))
      return false;
    state_ = JobState::Completed;
    result_ = std::move(result);
  }
  cv_.notify_all();
  return true;
}

bool JobHandle::fail(JobState state, std::exception_ptr error) {
  std::string message;
  std::optional<ErrorKind> kind;
  try {
    std::rethrow_exception(error);
  } catch (const RelayError &e) {
    message = e.what();
    kind = e.kind();
  } catch (const std::exception &e) {
    message = e.what();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal(state_))
      return false;
    state_ = state;
    error_ = std::move(error);
    error_message_ = std::move(message);
    error_kind_ = kind;
  }
  cv_.notify_all();
  return true;
}

bool JobHandle::wait_settled(Clock::time_point deadline) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_until(lock, deadline, [this] { return is_terminal(state_); });
}

void JobHandle::publish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    published_ = true;
  }
  cv_.notify_all();
}

// **----- QueueManager: lifecycle -----**

QueueManager::QueueManager(QueueOptions options)
    : state_(std::make_shared<State>(options)) {}

QueueManager::~QueueManager() {
  bool started;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    started = state_->started;
  }
  if (started)
    shutdown(false, std::chrono::seconds(10));
}

void QueueManager::start() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->started) {
      LOG_WARN("Queue manager already started");
      return;
    }
    if (state_->shutdown) {
      LOG_WARN("Queue manager was shut down; not restarting");
      return;
    }
  }

  const auto &opts = state_->options;
  LOG_INFO("Starting queue manager with {} workers, max {} concurrent "
           "downloads",
           opts.workers, opts.max_concurrent);

  pool_ = std::make_unique<WorkerPool>(opts.workers, "download-worker");

  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->started = true;
  }
  LOG_INFO("Queue manager started successfully");
}

void QueueManager::shutdown(bool wait, std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->started) {
      LOG_WARN("Queue manager not started");
      return;
    }
    state_->shutdown = true;
  }

  LOG_INFO("Shutting down queue manager...");

  if (!wait)
    cancel_all();

  if (!wait_until_idle(timeout)) {
    LOG_WARN("Jobs still active after {}ms, cancelling them",
             timeout.count());
    cancel_all();
    wait_until_idle(timeout);
  }

  pool_->join(timeout);
  pool_.reset();
  LOG_INFO("Thread pool shutdown complete");

  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->started = false;
  }
  LOG_INFO("Queue manager shutdown complete");
}

void QueueManager::cancel_all() {
  std::vector<std::shared_ptr<JobHandle>> handles;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    handles.reserve(state_->active.size());
    for (const auto &[id, handle] : state_->active)
      handles.push_back(handle);
  }

  LOG_INFO("Cancelling {} active jobs", handles.size());
  for (const auto &handle : handles) {
    if (handle->cancel() == JobHandle::CancelOutcome::CancelledPending)
      finalize(*state_, handle);
    LOG_DEBUG("Cancelled job {}", handle->job_id());
  }
}

bool QueueManager::wait_until_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_->mutex);
  return state_->idle_cv.wait_for(lock, timeout,
                                  [this] { return state_->active.empty(); });
}

// **----- QueueManager: jobs -----**

std::shared_ptr<JobHandle> QueueManager::submit(const std::string &job_id,
                                                JobTask task,
                                                std::chrono::milliseconds timeout,
                                                JobCallback on_done) {
  if (timeout <= std::chrono::milliseconds::zero())
    timeout = state_->options.default_job_timeout;

  auto handle = std::make_shared<JobHandle>(job_id);
  handle->on_done_ = std::move(on_done);

  size_t active;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->shutdown)
      throw SchedulerShutdown("queue manager is shutting down");
    if (!state_->started)
      throw SchedulerShutdown("queue manager not started");

    /// Overflow guard on queued jobs, distinct from the execution limiter
    const size_t capacity =
        static_cast<size_t>(state_->options.max_concurrent) * 2;
    if (state_->active.size() >= capacity) {
      LOG_WARN("Queue at capacity: {} active jobs", state_->active.size());
      throw QueueFull(state_->active.size());
    }

    auto state = state_;
    bool queued = pool_->submit([state, handle, task = std::move(task),
                                 timeout] {
      run_job(state, handle, task, timeout);
    });
    if (!queued)
      throw SchedulerShutdown("worker pool no longer accepts jobs");

    state_->active[job_id] = handle;
    ++state_->total_submitted;
    active = state_->active.size();
  }

  LOG_INFO("Submitted job {} to queue ({} active jobs)", job_id, active);
  return handle;
}

void QueueManager::run_job(const std::shared_ptr<State> &state,
                           const std::shared_ptr<JobHandle> &handle,
                           const JobTask &task,
                           std::chrono::milliseconds timeout) {
  if (!handle->mark_running()) {
    LOG_DEBUG("Job {} was cancelled before it started", handle->job_id());
    return;
  }

  const auto deadline = Clock::now() + timeout;
  handle->token_.set_deadline(deadline);

  LOG_DEBUG("Running job {} in worker thread", handle->job_id());
  TIMER_START(job);

  /// The task gets its own thread so this worker can give up at the deadline
  std::thread runner;
  try {
    runner = std::thread(execute_task, state, handle, task, timeout);
  } catch (const std::system_error &e) {
    LOG_ERROR("Job {} could not start: {}", handle->job_id(), e.what());
    if (handle->fail(JobState::Failed, std::current_exception()))
      ++state->total_failed;
  }

  if (runner.joinable()) {
    if (handle->wait_settled(deadline)) {
      runner.join();
    } else {
      JobTimeout error(fmt::format("job {} exceeded its {}ms timeout",
                                   handle->job_id(), timeout.count()));
      if (handle->fail(JobState::Failed, std::make_exception_ptr(error))) {
        ++state->total_failed;
        LOG_ERROR("Job {} failed: {}; abandoning its task", handle->job_id(),
                  error.what());
        runner.detach();
      } else {
        /// Settled right at the deadline
        runner.join();
      }
    }
  }

  TIMER_END(job);
  finalize(*state, handle);
}

void QueueManager::execute_task(std::shared_ptr<State> state,
                                std::shared_ptr<JobHandle> handle,
                                JobTask task,
                                std::chrono::milliseconds timeout) {
  const std::string what = "job " + handle->job_id();
  JobContext context(handle->job_id(), handle->token_);

  try {
    nlohmann::json result;
    {
      LimiterSlot slot(state->limiter, context.token(), what);
      result = task(context);
    }

    /// A task that ignored its deadline still fails
    if (context.token().state() == CancellationToken::State::Expired)
      throw JobTimeout(
          fmt::format("{} exceeded its {}ms timeout", what, timeout.count()));

    if (handle->complete(std::move(result))) {
      ++state->total_succeeded;
      LOG_DEBUG("Job {} completed successfully", handle->job_id());
    }
  } catch (const JobCancelled &e) {
    if (handle->fail(JobState::Cancelled, std::current_exception()))
      LOG_INFO("Job {} cancelled: {}", handle->job_id(), e.what());
  } catch (const std::exception &e) {
    if (handle->fail(JobState::Failed, std::current_exception())) {
      ++state->total_failed;
      LOG_ERROR("Job {} failed: {}", handle->job_id(), e.what());
    } else {
      LOG_DEBUG("Job {} ended after its timeout: {}", handle->job_id(),
                e.what());
    }
  }
}

void QueueManager::finalize(State &state,
                            const std::shared_ptr<JobHandle> &handle) {
  {
    std::lock_guard<std::mutex> lock(state.mutex);
    auto it = state.active.find(handle->job_id());
    if (it != state.active.end() && it->second == handle) {
      state.active.erase(it);
      LOG_DEBUG("Cleaned up job {} ({} active jobs remaining)",
                handle->job_id(), state.active.size());
    }
  }
  state.idle_cv.notify_all();
  handle->publish();

  if (!handle->on_done_)
    return;
  try {
    handle->on_done_(*handle);
  } catch (const std::exception &e) {
    LOG_WARN("Completion callback of job {} raised: {}", handle->job_id(),
             e.what());
  }
}

bool QueueManager::cancel(const std::string &job_id) {
  std::shared_ptr<JobHandle> handle;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->active.find(job_id);
    if (it == state_->active.end()) {
      LOG_WARN("Job {} not found for cancellation", job_id);
      return false;
    }
    handle = it->second;
  }

  switch (handle->cancel()) {
  case JobHandle::CancelOutcome::CancelledPending:
    LOG_INFO("Cancelled job {}", job_id);
    finalize(*state_, handle);
    return true;
  case JobHandle::CancelOutcome::Signalled:
    LOG_INFO("Cancellation requested for running job {}", job_id);
    return true;
  case JobHandle::CancelOutcome::AlreadyRequested:
    LOG_WARN("Cancellation of job {} already requested", job_id);
    return false;
  case JobHandle::CancelOutcome::AlreadyDone:
    LOG_WARN("Job {} already completed", job_id);
    return false;
  }
  return false;
}

std::optional<JobStatusInfo>
QueueManager::status(const std::string &job_id) const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  auto it = state_->active.find(job_id);
  if (it == state_->active.end())
    return std::nullopt;
  return it->second->info();
}

QueueStats QueueManager::stats() const {
  std::lock_guard<std::mutex> lock(state_->mutex);

  QueueStats stats;
  stats.started = state_->started;
  stats.max_workers = state_->options.workers;
  stats.max_concurrent = state_->options.max_concurrent;
  stats.active = state_->active.size();
  for (const auto &[id, handle] : state_->active) {
    JobState s = handle->status();
    if (s == JobState::Running)
      ++stats.running;
    else if (is_terminal(s))
      ++stats.completed;
  }
  stats.total_submitted = state_->total_submitted.load();
  stats.total_succeeded = state_->total_succeeded.load();
  stats.total_failed = state_->total_failed.load();
  stats.shutdown_pending = state_->shutdown;
  return stats;
}

bool QueueManager::is_healthy() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->started && !state_->shutdown;
}

bool QueueManager::wait_for_capacity(std::chrono::milliseconds timeout) {
  if (!is_healthy())
    return false;

  if (!state_->limiter.try_acquire_for(timeout)) {
    LOG_WARN("Timeout waiting for queue capacity after {}ms",
             timeout.count());
    return false;
  }
  state_->limiter.release();
  return true;
}

} // namespace media_relay
