/**
 * @file work_queue.hpp
 * @brief Thread pool primitives behind the Queue Manager
 *
 * @details Provides:
 *          - TaskQueue: blocking FIFO of closures shared by the workers
 *
 *          - WorkerPool: fixed set of OS threads draining a TaskQueue
 *
 *          - ConcurrencyLimiter: counting semaphore bounding how many jobs
 *            execute at once, independent of the thread count
 */

#ifndef MEDIA_RELAY_WORK_QUEUE_HPP
#define MEDIA_RELAY_WORK_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "cancellation.hpp"

namespace media_relay {

/**
 * @class TaskQueue
 * @brief Thread-safe FIFO shared by the worker threads.
 *
 * @attention DESIGN:
 *
 * - Workers pop closures from one shared queue
 *
 * - A long-running job occupies one worker; the others keep draining
 *
 * - After finish() the remaining closures are still handed out, then pop()
 *   reports exhaustion
 */
class TaskQueue {
  std::queue<std::function<void()>> tasks;
  mutable std::mutex mutex;
  std::condition_variable cv;
  bool done = false;

public:
  /**
   * @brief Add a closure to the queue.
   * @note Thread-safe; notifies one waiting worker.
   * @return false if finish() was already called
   */
  bool push(std::function<void()> task);

  /**
   * @brief Pop a closure from the queue.
   * @note Blocks until a closure is available or the queue is finished.
   * @return true if a closure was retrieved, false if empty and finished
   */
  bool pop(std::function<void()> &task);

  /**
   * @brief Signal that no more closures will be added.
   * @note Wakes all waiting workers so they can exit.
   */
  void finish();

  size_t size() const;
};

/**
 * @class WorkerPool
 * @brief Fixed number of threads executing closures from a TaskQueue.
 *
 * @note The threads share ownership of the queue, so join() can give up on a
 *       hung closure and detach without leaving dangling state behind.
 */
class WorkerPool {
public:
  /**
   * @param threads Number of worker threads (at least 1)
   * @param name Label used in log lines
   */
  WorkerPool(int threads, std::string name);

  /// Joins with DEFAULT_JOIN_TIMEOUT
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// @return false once the pool stopped accepting work
  bool submit(std::function<void()> task);

  /**
   * @brief Stop accepting work, drain the queue and join the threads.
   * @param timeout Upper bound for all threads to exit
   * @return true if every thread exited; stragglers are detached otherwise
   */
  bool join(std::chrono::milliseconds timeout);

  int size() const { return static_cast<int>(threads_.size()); }
  size_t queued() const { return shared_->queue.size(); }

  static constexpr std::chrono::milliseconds DEFAULT_JOIN_TIMEOUT{10000};

private:
  struct Shared {
    TaskQueue queue;
    std::mutex mutex;
    std::condition_variable exited_cv;
    int exited = 0;
  };

  static void worker_loop(std::shared_ptr<Shared> shared);

  std::shared_ptr<Shared> shared_;
  std::vector<std::thread> threads_;
  std::string name_;
};

/**
 * @class ConcurrencyLimiter
 * @brief Counting semaphore with bounded, cancellable acquisition.
 */
class ConcurrencyLimiter {
public:
  explicit ConcurrencyLimiter(int slots);

  /**
   * @brief Wait for a free slot.
   * @note The wait ends at the token's deadline or on cancellation.
   * @throws JobCancelled / JobTimeout when the token stops first
   */
  void acquire(const CancellationToken &token, const std::string &what);

  /// @return true if a slot was taken within timeout
  bool try_acquire_for(std::chrono::milliseconds timeout);

  void release();

  int capacity() const { return capacity_; }
  int available() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  int capacity_;
  int available_;
};

/**
 * @class LimiterSlot
 * @brief RAII holder of one ConcurrencyLimiter slot.
 */
class LimiterSlot {
public:
  LimiterSlot(ConcurrencyLimiter &limiter, const CancellationToken &token,
              const std::string &what)
      : limiter_(limiter) {
    limiter_.acquire(token, what);
  }
  ~LimiterSlot() { limiter_.release(); }

  LimiterSlot(const LimiterSlot &) = delete;
  LimiterSlot &operator=(const LimiterSlot &) = delete;

private:
  ConcurrencyLimiter &limiter_;
};

} // namespace media_relay

#endif // MEDIA_RELAY_WORK_QUEUE_HPP
