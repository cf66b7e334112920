/**
 * @file work_queue.cpp
 * @brief Thread pool primitives implementation
 *
 * @details Provides implementations for:
 *
 *          - TaskQueue: blocking FIFO of closures
 *
 *          - WorkerPool: worker threads with a bounded join
 *
 *          - ConcurrencyLimiter: counting semaphore
 */

#include "media_relay/work_queue.hpp"

#include <algorithm>
#include <exception>

#include "media_relay/logging.hpp"

namespace media_relay {

namespace {

/// Granularity at which a limiter wait re-checks its cancellation token
constexpr std::chrono::milliseconds LIMITER_POLL{50};

} // anonymous namespace

// **----- TaskQueue Implementation -----**

bool TaskQueue::push(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (done)
      return false;
    tasks.push(std::move(task));
  }
  cv.notify_one();
  return true;
}

bool TaskQueue::pop(std::function<void()> &task) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !tasks.empty() || done; });
  if (tasks.empty())
    return false;
  task = std::move(tasks.front());
  tasks.pop();
  return true;
}

void TaskQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done = true;
  }
  cv.notify_all();
}

size_t TaskQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex);
  return tasks.size();
}

// **----- WorkerPool Implementation -----**

WorkerPool::WorkerPool(int threads, std::string name)
    : shared_(std::make_shared<Shared>()), name_(std::move(name)) {
  threads = std::max(threads, 1);
  threads_.reserve(threads);
  for (int i = 0; i < threads; ++i)
    threads_.emplace_back(&WorkerPool::worker_loop, shared_);
  LOG_DEBUG("{} pool started with {} threads", name_, threads);
}

WorkerPool::~WorkerPool() { join(DEFAULT_JOIN_TIMEOUT); }

bool WorkerPool::submit(std::function<void()> task) {
  return shared_->queue.push(std::move(task));
}

void WorkerPool::worker_loop(std::shared_ptr<Shared> shared) {
  std::function<void()> task;
  while (shared->queue.pop(task)) {
    /// Closures report their own failures; nothing may escape a worker
    try {
      task();
    } catch (const std::exception &e) {
      LOG_ERROR("Worker task raised: {}", e.what());
    }
    task = nullptr;
  }

  {
    std::lock_guard<std::mutex> lock(shared->mutex);
    ++shared->exited;
  }
  shared->exited_cv.notify_all();
}

bool WorkerPool::join(std::chrono::milliseconds timeout) {
  if (threads_.empty())
    return true;

  shared_->queue.finish();

  const int total = static_cast<int>(threads_.size());
  bool all_exited;
  {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    all_exited = shared_->exited_cv.wait_for(
        lock, timeout, [&] { return shared_->exited == total; });
  }

  for (auto &t : threads_) {
    if (all_exited)
      t.join();
    else
      t.detach();
  }
  threads_.clear();

  if (!all_exited)
    LOG_WARN("{} pool: workers still busy after {}ms, detached", name_,
             timeout.count());
  return all_exited;
}

// **----- ConcurrencyLimiter Implementation -----**

ConcurrencyLimiter::ConcurrencyLimiter(int slots)
    : capacity_(std::max(slots, 1)), available_(capacity_) {}

void ConcurrencyLimiter::acquire(const CancellationToken &token,
                                 const std::string &what) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (available_ == 0) {
    if (token.stop_requested()) {
      lock.unlock();
      throw_if_stopped(token, what);
      lock.lock();
      continue;
    }
    cv_.wait_for(lock, LIMITER_POLL);
  }
  --available_;
}

bool ConcurrencyLimiter::try_acquire_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this] { return available_ > 0; }))
    return false;
  --available_;
  return true;
}

void ConcurrencyLimiter::release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (available_ < capacity_)
      ++available_;
  }
  cv_.notify_one();
}

int ConcurrencyLimiter::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return available_;
}

} // namespace media_relay
