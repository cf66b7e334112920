/**
 * @file subprocess.cpp
 * @brief Child process management implementation
 *
 * @details Provides implementations for:
 *
 *          - UniqueFd / make_pipe / set_nonblocking
 *
 *          - ChildProcess: posix_spawnp in a new process group, reaping,
 *            SIGTERM-then-SIGKILL termination
 *
 *          - LineBuffer and read_available
 *
 *          - run_capture: poll()-driven capture of stdout and stderr
 */

#include "media_relay/subprocess.hpp"

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include "media_relay/errors.hpp"
#include "media_relay/logging.hpp"

extern char **environ;

namespace media_relay {

namespace {

/// Decode a waitpid() status into an exit code
int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

/// Signal the child's process group, falling back to the child itself
void signal_group(pid_t pid, int sig) {
  if (kill(-pid, sig) == -1 && errno == ESRCH)
    kill(pid, sig);
}

/// Owns posix_spawn file actions and attributes for the scope of a spawn
struct SpawnSetup {
  posix_spawn_file_actions_t actions;
  posix_spawnattr_t attr;

  SpawnSetup() {
    posix_spawn_file_actions_init(&actions);
    posix_spawnattr_init(&attr);
  }
  ~SpawnSetup() {
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
  }

  SpawnSetup(const SpawnSetup &) = delete;
  SpawnSetup &operator=(const SpawnSetup &) = delete;

  int wire(int fd, int target, int null_flags) {
    if (fd >= 0)
      return posix_spawn_file_actions_adddup2(&actions, fd, target);
    return posix_spawn_file_actions_addopen(&actions, target, "/dev/null",
                                            null_flags, 0);
  }
};

/// Hand everything currently readable to sink; false on EOF
template <typename Sink> bool read_chunks(int fd, Sink &&sink) {
  char buf[PIPE_READ_SIZE];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      sink(buf, static_cast<size_t>(n));
      continue;
    }
    if (n == 0)
      return false;
    if (errno == EINTR)
      continue;
    /// EAGAIN: drained for now; anything else is treated as EOF
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

} // anonymous namespace

// **---- UniqueFd ----**

UniqueFd::~UniqueFd() { reset(); }

UniqueFd::UniqueFd(UniqueFd &&other) noexcept : fd_(other.fd_) {
  other.fd_ = -1;
}

UniqueFd &UniqueFd::operator=(UniqueFd &&other) noexcept {
  if (this != &other) {
    reset();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void UniqueFd::reset() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

Pipe make_pipe() {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1)
    throw std::system_error(errno, std::generic_category(), "pipe2");
  return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

void set_nonblocking(int fd) {
  int flags = fcntl(fd, F_GETFL);
  if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
    throw std::system_error(errno, std::generic_category(), "fcntl");
}

// **---- ChildProcess ----**

ChildProcess::~ChildProcess() {
  if (is_valid() && !exit_code_)
    terminate(DEFAULT_TERMINATE_GRACE);
}

ChildProcess::ChildProcess(ChildProcess &&other) noexcept
    : pid_(other.pid_), name_(std::move(other.name_)),
      exit_code_(other.exit_code_) {
  other.pid_ = -1;
  other.exit_code_.reset();
}

ChildProcess &ChildProcess::operator=(ChildProcess &&other) noexcept {
  if (this != &other) {
    if (is_valid() && !exit_code_)
      terminate(DEFAULT_TERMINATE_GRACE);
    pid_ = other.pid_;
    name_ = std::move(other.name_);
    exit_code_ = other.exit_code_;
    other.pid_ = -1;
    other.exit_code_.reset();
  }
  return *this;
}

ChildProcess ChildProcess::spawn(const std::vector<std::string> &argv,
                                 const SpawnOptions &options) {
  if (argv.empty())
    throw SpawnError("<empty command>", EINVAL);

  SpawnSetup setup;

  int err = setup.wire(options.stdin_fd, STDIN_FILENO, O_RDONLY);
  if (err == 0)
    err = setup.wire(options.stdout_fd, STDOUT_FILENO, O_WRONLY);
  if (err == 0)
    err = setup.wire(options.stderr_fd, STDERR_FILENO, O_WRONLY);
  if (err != 0)
    throw SpawnError(argv[0], err);

  /// New process group, default signal dispositions, empty signal mask
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  sigaddset(&default_signals, SIGTERM);
  sigaddset(&default_signals, SIGINT);
  sigset_t empty_mask;
  sigemptyset(&empty_mask);

  posix_spawnattr_setflags(&setup.attr, POSIX_SPAWN_SETPGROUP |
                                            POSIX_SPAWN_SETSIGDEF |
                                            POSIX_SPAWN_SETSIGMASK);
  posix_spawnattr_setpgroup(&setup.attr, 0);
  posix_spawnattr_setsigdefault(&setup.attr, &default_signals);
  posix_spawnattr_setsigmask(&setup.attr, &empty_mask);

  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &arg : argv)
    cargv.push_back(const_cast<char *>(arg.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = -1;
  err = posix_spawnp(&pid, cargv[0], &setup.actions, &setup.attr,
                     cargv.data(), environ);
  if (err != 0)
    throw SpawnError(argv[0], err);

  LOG_DEBUG("Spawned {} (pid {})", argv[0], pid);
  return ChildProcess(pid, argv[0]);
}

std::optional<int> ChildProcess::poll() {
  if (exit_code_ || !is_valid())
    return exit_code_;

  int status = 0;
  pid_t r;
  do {
    r = waitpid(pid_, &status, WNOHANG);
  } while (r == -1 && errno == EINTR);

  if (r == pid_) {
    exit_code_ = decode_status(status);
  } else if (r == -1 && errno == ECHILD) {
    /// Reaped elsewhere; nothing left to wait for
    exit_code_ = -1;
  }
  return exit_code_;
}

bool ChildProcess::terminate(std::chrono::milliseconds grace) noexcept {
  if (!is_valid() || poll())
    return false;

  signal_group(pid_, SIGTERM);

  auto deadline = Clock::now() + grace;
  while (Clock::now() < deadline) {
    if (poll())
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  signal_group(pid_, SIGKILL);
  log_noexcept([this] {
    LOG_WARN("{} (pid {}) ignored SIGTERM, sent SIGKILL", name_, pid_);
  });

  int status = 0;
  pid_t r;
  do {
    r = waitpid(pid_, &status, 0);
  } while (r == -1 && errno == EINTR);
  exit_code_ = (r == pid_) ? decode_status(status) : -1;
  return true;
}

// **---- LineBuffer ----**

void LineBuffer::append(const char *data, size_t size) {
  total_ += size;
  pending_.append(data, size);

  tail_.append(data, size);
  if (tail_.size() > tail_limit_)
    tail_.erase(0, tail_.size() - tail_limit_);
}

std::vector<std::string> LineBuffer::take_lines() {
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    size_t end = pending_.find_first_of("\r\n", start);
    if (end == std::string::npos)
      break;
    if (end > start)
      lines.emplace_back(pending_, start, end - start);
    start = end + 1;
  }
  pending_.erase(0, start);
  return lines;
}

std::optional<std::string> LineBuffer::take_partial() {
  if (pending_.empty())
    return std::nullopt;
  std::string rest;
  rest.swap(pending_);
  return rest;
}

bool read_available(int fd, LineBuffer &buffer) {
  return read_chunks(fd, [&buffer](const char *data, size_t size) {
    buffer.append(data, size);
  });
}

// **---- run_capture ----**

CaptureResult run_capture(const std::vector<std::string> &argv,
                          std::chrono::milliseconds timeout,
                          const CancellationToken *token) {
  Pipe out = make_pipe();
  Pipe err = make_pipe();
  set_nonblocking(out.read.get());
  set_nonblocking(err.read.get());

  SpawnOptions options;
  options.stdout_fd = out.write.get();
  options.stderr_fd = err.write.get();
  ChildProcess child = ChildProcess::spawn(argv, options);

  /// Keep only the read ends so EOF arrives when the child exits
  out.write.reset();
  err.write.reset();

  CaptureResult result;
  LineBuffer err_buffer;
  bool out_open = true;
  bool err_open = true;
  auto deadline = Clock::now() + timeout;

  while (out_open || err_open) {
    if (token && token->stop_requested()) {
      child.terminate(DEFAULT_TERMINATE_GRACE);
      throw_if_stopped(*token, argv[0]);
    }

    auto now = Clock::now();
    if (now >= deadline) {
      result.timed_out = true;
      break;
    }

    pollfd fds[2];
    nfds_t n = 0;
    if (out_open)
      fds[n++] = {out.read.get(), POLLIN, 0};
    if (err_open)
      fds[n++] = {err.read.get(), POLLIN, 0};

    auto slice = std::min<Clock::duration>(deadline - now,
                                           std::chrono::milliseconds(100));
    int wait_ms = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(slice).count());
    if (::poll(fds, n, std::max(wait_ms, 1)) == -1 && errno != EINTR)
      throw std::system_error(errno, std::generic_category(), "poll");

    if (out_open)
      out_open = read_chunks(out.read.get(),
                             [&result](const char *data, size_t size) {
                               result.out.append(data, size);
                             });
    if (err_open)
      err_open = read_available(err.read.get(), err_buffer);
  }

  if (result.timed_out) {
    child.terminate(DEFAULT_TERMINATE_GRACE);
  } else {
    /// Pipes closed; the child is exiting. Reap it within the remaining time.
    while (!child.poll()) {
      if (Clock::now() >= deadline) {
        result.timed_out = true;
        child.terminate(DEFAULT_TERMINATE_GRACE);
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  result.exit_code = child.exit_code().value_or(-1);
  result.err = err_buffer.tail();
  return result;
}

} // namespace media_relay
