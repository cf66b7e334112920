#include "media_relay/cancellation.hpp"
#include "media_relay/errors.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace media_relay;
using namespace std::chrono_literals;

TEST(Cancellation, FreshTokenIsActive) {
  CancellationToken token;
  EXPECT_EQ(token.state(), CancellationToken::State::Active);
  EXPECT_FALSE(token.stop_requested());
  EXPECT_FALSE(token.deadline().has_value());
  EXPECT_NO_THROW(throw_if_stopped(token, "work"));
}

TEST(Cancellation, CopiesShareState) {
  CancellationToken token;
  CancellationToken copy = token;
  copy.request_cancel();

  EXPECT_TRUE(token.cancel_requested());
  EXPECT_EQ(token.state(), CancellationToken::State::Cancelled);
  EXPECT_THROW(throw_if_stopped(token, "work"), JobCancelled);
}

TEST(Cancellation, DeadlineExpires) {
  CancellationToken token;
  token.set_deadline(Clock::now() - 1ms);
  EXPECT_EQ(token.state(), CancellationToken::State::Expired);
  EXPECT_THROW(throw_if_stopped(token, "work"), JobTimeout);
}

TEST(Cancellation, CancelWinsOverExpiry) {
  CancellationToken token;
  token.set_deadline(Clock::now() - 1ms);
  token.request_cancel();
  EXPECT_EQ(token.state(), CancellationToken::State::Cancelled);
}

TEST(Cancellation, WaitForEndsEarlyOnCancel) {
  CancellationToken token;
  std::thread canceller([token]() mutable {
    std::this_thread::sleep_for(50ms);
    token.request_cancel();
  });

  auto start = Clock::now();
  EXPECT_TRUE(token.wait_for(10s));
  EXPECT_LT(Clock::now() - start, 5s);
  canceller.join();
}

TEST(Cancellation, WaitForStopsAtDeadline) {
  CancellationToken token;
  token.set_deadline(Clock::now() + 50ms);

  auto start = Clock::now();
  EXPECT_TRUE(token.wait_for(10s));
  EXPECT_LT(Clock::now() - start, 5s);
}

TEST(Cancellation, WaitForTimesOutQuietly) {
  CancellationToken token;
  EXPECT_FALSE(token.wait_for(20ms));
  EXPECT_FALSE(token.stop_requested());
}

TEST(Cancellation, MessageNamesTheWork) {
  CancellationToken token;
  token.request_cancel();
  try {
    throw_if_stopped(token, "job 42");
    FAIL() << "expected JobCancelled";
  } catch (const JobCancelled &e) {
    EXPECT_STREQ(e.what(), "job 42 was cancelled");
    EXPECT_EQ(e.http_status(), 499);
  }
}
