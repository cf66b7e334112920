#include "media_relay/errors.hpp"
#include "media_relay/logging.hpp"
#include "media_relay/subprocess.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>
#include <utility>

#include <unistd.h>

using namespace media_relay;
using namespace media_relay::test;
using namespace std::chrono_literals;

// **---- LineBuffer ----**

TEST(LineBuffer, SplitsOnNewlineAndCarriageReturn) {
  LineBuffer buffer;
  const std::string data = "first\r\nsecond\rthird\npart";
  buffer.append(data.data(), data.size());

  EXPECT_EQ(buffer.take_lines(),
            (std::vector<std::string>{"first", "second", "third"}));
  EXPECT_TRUE(buffer.take_lines().empty());
  EXPECT_EQ(buffer.take_partial(), std::optional<std::string>("part"));
  EXPECT_FALSE(buffer.take_partial().has_value());
  EXPECT_EQ(buffer.total_bytes(), data.size());
}

TEST(LineBuffer, JoinsLinesAcrossReads) {
  LineBuffer buffer;
  buffer.append("[down", 5);
  EXPECT_TRUE(buffer.take_lines().empty());
  buffer.append("load] 5%\n", 9);
  EXPECT_EQ(buffer.take_lines(),
            std::vector<std::string>{"[download] 5%"});
}

TEST(LineBuffer, KeepsBoundedTail) {
  LineBuffer buffer(8);
  const std::string data = "0123456789abcdef";
  buffer.append(data.data(), data.size());
  EXPECT_EQ(buffer.tail(), "89abcdef");
}

// **---- UniqueFd / pipes ----**

TEST(Subprocess, PipeDeliversDataAndEof) {
  Pipe pipe = make_pipe();
  set_nonblocking(pipe.read.get());

  LineBuffer buffer;
  EXPECT_TRUE(read_available(pipe.read.get(), buffer));

  ASSERT_EQ(::write(pipe.write.get(), "line\n", 5), 5);
  pipe.write.reset();
  EXPECT_FALSE(pipe.write.is_valid());

  EXPECT_FALSE(read_available(pipe.read.get(), buffer));
  EXPECT_EQ(buffer.take_lines(), std::vector<std::string>{"line"});
}

TEST(Subprocess, UniqueFdMoves) {
  Pipe pipe = make_pipe();
  int raw = pipe.read.get();
  UniqueFd moved = std::move(pipe.read);
  EXPECT_EQ(moved.get(), raw);
  EXPECT_FALSE(pipe.read.is_valid());
}

// **---- ChildProcess ----**

TEST(Subprocess, ReportsExitCode) {
  ChildProcess child = ChildProcess::spawn({"/bin/sh", "-c", "exit 3"});
  EXPECT_TRUE(wait_until([&] { return child.poll().has_value(); }, 2s));
  EXPECT_EQ(child.exit_code(), 3);
  EXPECT_FALSE(child.running());
}

TEST(Subprocess, TerminateStopsChildAndGroup) {
  TempDir dir;
  const fs::path pids = dir / "pids";
  ChildProcess child = ChildProcess::spawn(
      {"/bin/sh", "-c",
       "sleep 30 & echo $! > '" + pids.string() + "'; wait"});

  ASSERT_TRUE(wait_until([&] { return read_pids(pids).size() == 1; }, 2s));
  pid_t grandchild = read_pids(pids)[0];
  EXPECT_TRUE(child.running());

  EXPECT_FALSE(child.terminate(2s));
  EXPECT_FALSE(child.running());
  EXPECT_EQ(child.exit_code(), 128 + SIGTERM);

  /// The grandchild got the same signal; init reaps it
  EXPECT_TRUE(wait_until([&] { return !process_alive(grandchild); }, 2s));
}

TEST(Subprocess, TerminateEscalatesToKill) {
  TempDir dir;
  const fs::path ready = dir / "ready";
  ChildProcess child = ChildProcess::spawn(
      {"/bin/sh", "-c",
       "trap '' TERM; touch '" + ready.string() +
           "'; while true; do sleep 0.05; done"});

  ASSERT_TRUE(wait_until([&] { return fs::exists(ready); }, 2s));
  EXPECT_TRUE(child.terminate(200ms));
  EXPECT_EQ(child.exit_code(), 128 + SIGKILL);
}

TEST(Subprocess, FailedLogWriteStaysInsideNoexceptPaths) {
  static_assert(noexcept(std::declval<ChildProcess &>().terminate(
                    std::declval<std::chrono::milliseconds>())),
                "terminate is used from destructors");

  testing::internal::CaptureStderr();
  EXPECT_NO_THROW(log_noexcept([] { throw std::runtime_error("disk full"); }));
  std::string err = testing::internal::GetCapturedStderr();
  EXPECT_NE(err.find("log write failed: disk full"), std::string::npos);
}

TEST(Subprocess, SpawnFailureThrows) {
  EXPECT_THROW(ChildProcess::spawn({"/nonexistent/tool"}), SpawnError);
  EXPECT_THROW(ChildProcess::spawn({}), SpawnError);
}

// **---- run_capture ----**

TEST(Subprocess, CaptureCollectsOutput) {
  CaptureResult r = run_capture(
      {"/bin/sh", "-c", "echo out; echo err >&2; exit 2"}, 5s);
  EXPECT_EQ(r.exit_code, 2);
  EXPECT_EQ(r.out, "out\n");
  EXPECT_EQ(r.err, "err\n");
  EXPECT_FALSE(r.timed_out);
}

TEST(Subprocess, CaptureTimesOut) {
  auto start = Clock::now();
  CaptureResult r = run_capture({"/bin/sh", "-c", "exec sleep 30"}, 200ms);
  EXPECT_TRUE(r.timed_out);
  EXPECT_NE(r.exit_code, 0);
  EXPECT_LT(Clock::now() - start, 5s);
}

TEST(Subprocess, CaptureObservesCancellation) {
  CancellationToken token;
  std::thread canceller([token]() mutable {
    std::this_thread::sleep_for(100ms);
    token.request_cancel();
  });

  EXPECT_THROW(run_capture({"/bin/sh", "-c", "exec sleep 30"}, 10s, &token),
               JobCancelled);
  canceller.join();
}
