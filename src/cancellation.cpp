/**
 * @file cancellation.cpp
 * @brief Cooperative cancellation token implementation
 */

#include "media_relay/cancellation.hpp"

#include "media_relay/errors.hpp"

namespace media_relay {

CancellationToken::CancellationToken() : shared_(std::make_shared<Shared>()) {}

void CancellationToken::request_cancel() {
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->cancelled = true;
  }
  shared_->cv.notify_all();
}

void CancellationToken::set_deadline(Clock::time_point deadline) {
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->deadline = deadline;
  }
  shared_->cv.notify_all();
}

std::optional<Clock::time_point> CancellationToken::deadline() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->deadline;
}

CancellationToken::State CancellationToken::state() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  if (shared_->cancelled)
    return State::Cancelled;
  if (shared_->deadline && Clock::now() >= *shared_->deadline)
    return State::Expired;
  return State::Active;
}

bool CancellationToken::cancel_requested() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->cancelled;
}

bool CancellationToken::wait_for(Clock::duration duration) const {
  auto until = Clock::now() + duration;

  std::unique_lock<std::mutex> lock(shared_->mutex);
  if (shared_->deadline && *shared_->deadline < until)
    until = *shared_->deadline;

  shared_->cv.wait_until(lock, until, [this] { return shared_->cancelled; });

  if (shared_->cancelled)
    return true;
  return shared_->deadline && Clock::now() >= *shared_->deadline;
}

void throw_if_stopped(const CancellationToken &token, const std::string &what) {
  switch (token.state()) {
  case CancellationToken::State::Active:
    return;
  case CancellationToken::State::Cancelled:
    throw JobCancelled(what + " was cancelled");
  case CancellationToken::State::Expired:
    throw JobTimeout(what + " exceeded its deadline");
  }
}

} // namespace media_relay
