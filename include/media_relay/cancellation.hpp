/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation token with an optional deadline
 *
 * @details A CancellationToken is a cheap, copyable handle onto shared state.
 *          The Queue Manager hands one to every job; the Streaming Pipeline
 *          polls it on each monitoring iteration. Nothing is interrupted
 *          preemptively, so cleanup code always gets to run.
 */

#ifndef MEDIA_RELAY_CANCELLATION_HPP
#define MEDIA_RELAY_CANCELLATION_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace media_relay {

using Clock = std::chrono::steady_clock;

/**
 * @class CancellationToken
 * @brief Shared stop flag plus deadline.
 *
 * @attention Copies observe the same state: cancelling one copy cancels all.
 */
class CancellationToken {
public:
  enum class State {
    Active,    //< Neither cancelled nor past the deadline
    Cancelled, //< request_cancel() was called
    Expired,   //< The deadline has passed
  };

  CancellationToken();

  /// Ask the owner of the token to stop; wakes sleepers in wait_for()
  void request_cancel();

  /// Set (or move) the deadline after which the token reads as Expired
  void set_deadline(Clock::time_point deadline);

  std::optional<Clock::time_point> deadline() const;

  /// Cancellation wins over expiry when both apply
  State state() const;

  bool stop_requested() const { return state() != State::Active; }

  bool cancel_requested() const;

  /**
   * @brief Interruptible sleep.
   * @param duration Upper bound of the sleep
   * @return true if the token stopped (cancel or deadline) during the wait
   */
  bool wait_for(Clock::duration duration) const;

private:
  struct Shared {
    mutable std::mutex mutex;
    mutable std::condition_variable cv;
    bool cancelled = false;
    std::optional<Clock::time_point> deadline;
  };

  std::shared_ptr<Shared> shared_;
};

/**
 * @brief Throw JobCancelled or JobTimeout if the token has stopped.
 * @param token Token to inspect
 * @param what Name of the work being stopped, used in the message
 */
void throw_if_stopped(const CancellationToken &token, const std::string &what);

} // namespace media_relay

#endif // MEDIA_RELAY_CANCELLATION_HPP
