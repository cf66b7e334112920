/**
 * @file subprocess.hpp
 * @brief Child process management: descriptors, pipes, spawning, capture
 *
 * @details Provides:
 *          - UniqueFd: RAII owner of a file descriptor
 *
 *          - make_pipe(): close-on-exec pipe pair
 *
 *          - ChildProcess: RAII handle to a child spawned in its own process
 *            group, with non-blocking reaping and graceful termination
 *
 *          - LineBuffer: splits non-blocking reads into lines and keeps a
 *            bounded tail for error reports
 *
 *          - run_capture(): run a child to completion with a hard timeout
 *
 * @note Children are started with posix_spawnp(); there is no shell in
 *       between, so arguments never need quoting.
 */

#ifndef MEDIA_RELAY_SUBPROCESS_HPP
#define MEDIA_RELAY_SUBPROCESS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>

#include "cancellation.hpp"
#include "types.hpp"

namespace media_relay {

/**
 * @class UniqueFd
 * @brief RAII wrapper for a file descriptor.
 * @note Supports move semantics but not copy.
 */
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd();

  /// Disable copy
  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;

  /// Enable move
  UniqueFd(UniqueFd &&other) noexcept;
  UniqueFd &operator=(UniqueFd &&other) noexcept;

  int get() const { return fd_; }
  bool is_valid() const { return fd_ >= 0; }

  /// Close now; safe to call repeatedly
  void reset();

private:
  int fd_ = -1;
};

/**
 * @struct Pipe
 * @brief Both ends of an OS pipe, close-on-exec.
 */
struct Pipe {
  UniqueFd read;
  UniqueFd write;
};

/// @throws std::system_error if pipe2() fails
Pipe make_pipe();

/// @throws std::system_error if fcntl() fails
void set_nonblocking(int fd);

/**
 * @struct SpawnOptions
 * @brief Standard stream wiring of a child. -1 means /dev/null.
 * @note Descriptors are duplicated into the child; the caller keeps
 *       ownership and must close its copies to let EOF propagate.
 */
struct SpawnOptions {
  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
};

/**
 * @class ChildProcess
 * @brief RAII handle to a spawned child process.
 *
 * @attention LIFETIME:
 *
 * - The child leads its own process group so terminate() also reaches
 *   grandchildren (e.g. ffmpeg started by the extraction tool)
 *
 * - The destructor terminates a child that is still running
 *
 * - Exit code is the exit status, or 128 + signal number when killed
 */
class ChildProcess {
public:
  ChildProcess() = default;
  ~ChildProcess();

  /// Disable copy
  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  /// Enable move
  ChildProcess(ChildProcess &&other) noexcept;
  ChildProcess &operator=(ChildProcess &&other) noexcept;

  /**
   * @brief Start a child.
   * @param argv Program (looked up in PATH) followed by its arguments
   * @param options Standard stream wiring
   * @throws SpawnError if the program cannot be started
   */
  static ChildProcess spawn(const std::vector<std::string> &argv,
                            const SpawnOptions &options = {});

  pid_t pid() const { return pid_; }
  bool is_valid() const { return pid_ > 0; }
  const std::string &name() const { return name_; }

  /**
   * @brief Reap the child if it has exited, without blocking.
   * @return Exit code once known
   */
  std::optional<int> poll();

  bool running() { return is_valid() && !poll().has_value(); }

  std::optional<int> exit_code() const { return exit_code_; }

  /**
   * @brief Stop a running child.
   *
   * @note Sends SIGTERM to the process group, waits up to grace, then sends
   *       SIGKILL and reaps. Never throws; returns immediately for a child
   *       that already exited.
   *
   * @return true if SIGKILL was needed
   */
  bool terminate(std::chrono::milliseconds grace) noexcept;

private:
  ChildProcess(pid_t pid, std::string name) : pid_(pid), name_(std::move(name)) {}

  pid_t pid_ = -1;
  std::string name_;
  std::optional<int> exit_code_;
};

/**
 * @class LineBuffer
 * @brief Accumulates raw reads and hands out complete lines.
 * @note '\n' and '\r' both terminate a line (progress output rewrites the
 *       current line with '\r'). Empty lines are dropped.
 */
class LineBuffer {
public:
  explicit LineBuffer(size_t tail_limit = STDERR_TAIL_BYTES)
      : tail_limit_(tail_limit) {}

  void append(const char *data, size_t size);

  /// Complete lines received since the last call
  std::vector<std::string> take_lines();

  /// Unterminated remainder, emitted as a line at EOF
  std::optional<std::string> take_partial();

  /// The last tail_limit bytes ever appended
  const std::string &tail() const { return tail_; }

  /// Bytes appended so far
  uint64_t total_bytes() const { return total_; }

private:
  std::string pending_;
  std::string tail_;
  size_t tail_limit_;
  uint64_t total_ = 0;
};

/**
 * @brief Drain a non-blocking descriptor into a LineBuffer.
 * @return false once the writer side is closed (EOF)
 */
bool read_available(int fd, LineBuffer &buffer);

/**
 * @struct CaptureResult
 * @brief Outcome of run_capture().
 */
struct CaptureResult {
  int exit_code = -1;
  std::string out;
  std::string err;
  bool timed_out = false;
};

/**
 * @brief Run a child to completion, capturing stdout and stderr.
 *
 * @param argv Program and arguments
 * @param timeout Hard limit; the child is terminated when it is reached
 * @param token Optional cancellation; a stop terminates the child and
 *              throws JobCancelled / JobTimeout
 *
 * @note stdout is kept in full, stderr only up to STDERR_TAIL_BYTES.
 * @throws SpawnError if the program cannot be started
 */
CaptureResult run_capture(const std::vector<std::string> &argv,
                          std::chrono::milliseconds timeout,
                          const CancellationToken *token = nullptr);

/// Grace period used by destructors and run_capture()
constexpr std::chrono::milliseconds DEFAULT_TERMINATE_GRACE{5000};

} // namespace media_relay

#endif // MEDIA_RELAY_SUBPROCESS_HPP
