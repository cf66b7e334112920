/**
 * @file deletion_scheduler.cpp
 * @brief Deletion scheduler implementation
 *
 * @details The worker owns no state of its own: everything lives in Shared,
 *          protected by one mutex. Deletion actions run with the mutex
 *          released so scheduling and cancelling never wait on I/O.
 */

#include "media_relay/deletion_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>

#include <fmt/core.h>

#include "media_relay/errors.hpp"
#include "media_relay/system.hpp"

namespace media_relay {

namespace fs = std::filesystem;

namespace {

const std::string TAG = "[deletion]";

} // anonymous namespace

Deleter local_file_deleter() {
  return [](const std::string &target) {
    /// Throws fs::filesystem_error on permission problems and the like
    return fs::remove(fs::path(target)) ? DeletionOutcome::Deleted
                                        : DeletionOutcome::AlreadyGone;
  };
}

// **---- Lifecycle ----**

DeletionScheduler::DeletionScheduler(Deleter deleter,
                                     std::chrono::milliseconds max_sleep)
    : shared_(std::make_shared<Shared>()) {
  shared_->deleter = std::move(deleter);
  shared_->max_sleep = max_sleep;
  worker_ = std::thread(&DeletionScheduler::worker_loop, shared_);
  LOG_INFO("{} Scheduler worker started", TAG);
}

DeletionScheduler::~DeletionScheduler() { shutdown(); }

void DeletionScheduler::shutdown(std::chrono::milliseconds timeout) {
  size_t dropped;
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (shared_->shutdown && !worker_.joinable())
      return;
    shared_->shutdown = true;
    dropped = shared_->heap.size() - shared_->cancelled.size();
  }
  shared_->cv.notify_all();

  if (!worker_.joinable())
    return;

  LOG_INFO("{} Shutting down scheduler", TAG);

  bool stopped;
  {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    stopped = shared_->stopped_cv.wait_for(
        lock, timeout, [this] { return shared_->stopped; });
  }

  if (stopped) {
    worker_.join();
  } else {
    /// A deletion action is hanging; the worker only touches Shared
    LOG_WARN("{} Worker did not stop within {}ms, detaching", TAG,
             timeout.count());
    worker_.detach();
  }

  if (dropped > 0)
    LOG_WARN("{} {} pending deletion(s) dropped at shutdown", TAG, dropped);
  LOG_INFO("{} Scheduler shut down", TAG);
}

// **---- Public API ----**

ScheduledDeletion
DeletionScheduler::schedule_deletion(const std::string &target,
                                     std::chrono::milliseconds delay,
                                     LogSink sink) {
  if (delay.count() < 0)
    delay = std::chrono::milliseconds(0);

  ScheduledDeletion receipt{make_uuid(),
                            std::chrono::system_clock::now() + delay};
  Task task{Clock::now() + delay, 0, receipt.task_id, target, std::move(sink)};

  bool wake;
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (shared_->shutdown)
      throw SchedulerShutdown("deletion scheduler is shut down");

    task.seq = shared_->next_seq++;
    wake = shared_->heap.empty() || Later{}(shared_->heap.front(), task);

    shared_->queued.insert(task.task_id);
    shared_->heap.push_back(std::move(task));
    std::push_heap(shared_->heap.begin(), shared_->heap.end(), Later{});
  }
  if (wake)
    shared_->cv.notify_one();

  LOG_DEBUG("{} Scheduled deletion of {} in {}ms (task {})", TAG, target,
            delay.count(), receipt.task_id);
  return receipt;
}

bool DeletionScheduler::cancel_deletion(const std::string &task_id) {
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (shared_->queued.count(task_id) == 0)
      return false;
    if (!shared_->cancelled.insert(task_id).second)
      return false;
  }
  shared_->cv.notify_one();
  LOG_DEBUG("{} Cancelled deletion task {}", TAG, task_id);
  return true;
}

long DeletionScheduler::pending_count() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return static_cast<long>(shared_->heap.size()) -
         static_cast<long>(shared_->cancelled.size());
}

uint64_t DeletionScheduler::executed_count() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->executed;
}

bool DeletionScheduler::is_running() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return !shared_->shutdown;
}

// **---- Worker ----**

void DeletionScheduler::worker_loop(std::shared_ptr<Shared> shared) {
  std::unique_lock<std::mutex> lock(shared->mutex);

  while (!shared->shutdown) {
    if (shared->heap.empty()) {
      shared->cv.wait(lock,
                      [&] { return !shared->heap.empty() || shared->shutdown; });
      continue;
    }

    /// Discard cancelled tasks sitting at the head
    while (!shared->heap.empty() &&
           shared->cancelled.count(shared->heap.front().task_id)) {
      std::pop_heap(shared->heap.begin(), shared->heap.end(), Later{});
      const std::string id = shared->heap.back().task_id;
      shared->heap.pop_back();
      shared->cancelled.erase(id);
      shared->queued.erase(id);
      LOG_DEBUG("{} Skipped cancelled task {}", TAG, id);
    }
    if (shared->heap.empty())
      continue;

    auto now = Clock::now();
    const Task &head = shared->heap.front();
    if (head.due > now) {
      auto wake_at = std::min(head.due, now + shared->max_sleep);
      shared->cv.wait_until(lock, wake_at);
      continue;
    }

    std::pop_heap(shared->heap.begin(), shared->heap.end(), Later{});
    Task task = std::move(shared->heap.back());
    shared->heap.pop_back();
    shared->queued.erase(task.task_id);

    lock.unlock();
    execute(*shared, task);
    lock.lock();

    ++shared->executed;
  }

  shared->stopped = true;
  shared->stopped_cv.notify_all();
}

void DeletionScheduler::execute(const Shared &shared, const Task &task) {
  try {
    switch (shared.deleter(task.target)) {
    case DeletionOutcome::Deleted:
      emit(task.sink, LogLevel::Info, TAG,
           fmt::format("Auto-deleted file: {}", task.target));
      break;
    case DeletionOutcome::AlreadyGone:
      emit(task.sink, LogLevel::Info, TAG,
           fmt::format("File already deleted: {}", task.target));
      break;
    }
  } catch (const std::exception &e) {
    emit(task.sink, LogLevel::Error, TAG,
         fmt::format("Failed to auto-delete file {}: {}", task.target,
                     e.what()));
  } catch (...) {
    emit(task.sink, LogLevel::Error, TAG,
         fmt::format("Failed to auto-delete file {}: unknown error",
                     task.target));
  }
}

} // namespace media_relay
