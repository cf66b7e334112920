/**
 * @file errors.hpp
 * @brief Typed error hierarchy for jobs, pipelines and the deletion scheduler
 *
 * @details Every failure leaving a component is a RelayError carrying an
 *          ErrorKind, so callers branch on kind() and never parse what().
 *          http_status() maps a kind onto the status-equivalent reported at
 *          the API boundary.
 */

#ifndef MEDIA_RELAY_ERRORS_HPP
#define MEDIA_RELAY_ERRORS_HPP

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace media_relay {

enum class ErrorKind {
  MetadataError,       //< Probe failed, timed out or returned no record
  PathResolutionError, //< Destination template could not be rendered
  ExtractionFailed,    //< Extraction tool exited non-zero
  UploadFailed,        //< Upload tool exited non-zero
  PipelineTimeout,     //< Total pipeline budget exceeded
  ProgressTimeout,     //< No progress line within the stall timeout
  ContentTooLarge,     //< Advertised size above max_content_length
  QueueFull,           //< Too many active jobs
  JobTimeout,          //< Job overran its declared timeout
  JobCancelled,        //< Job observed a cancellation request
  SchedulerShutdown,   //< Component no longer accepts work
  StorageError,        //< Path escapes the storage root or I/O failed
  SpawnError,          //< A child process could not be started
};

/// Stable identifier, e.g. "ProgressTimeout"
const char *error_kind_name(ErrorKind kind);

/**
 * @brief Status-equivalent at the API boundary.
 * @note Timeouts 408, queue full 503, cancelled 499, too large 413,
 *       metadata 422, everything else 500.
 */
int http_status(ErrorKind kind);

/**
 * @class RelayError
 * @brief Base of all errors raised by media_relay components.
 */
class RelayError : public std::runtime_error {
public:
  RelayError(ErrorKind kind, const std::string &message,
             std::string details = {});

  ErrorKind kind() const noexcept { return kind_; }

  /// Extra context, e.g. captured stderr of a failed child
  const std::string &details() const noexcept { return details_; }

  int http_status() const noexcept { return media_relay::http_status(kind_); }

private:
  ErrorKind kind_;
  std::string details_;
};

// **---- PIPELINE ----**

class MetadataError : public RelayError {
public:
  explicit MetadataError(const std::string &message, std::string details = {})
      : RelayError(ErrorKind::MetadataError, message, std::move(details)) {}
};

class PathResolutionError : public RelayError {
public:
  explicit PathResolutionError(const std::string &message)
      : RelayError(ErrorKind::PathResolutionError, message) {}
};

/**
 * @class ProcessFailed
 * @brief Common base for a child process exiting with a non-zero code.
 * @note details() holds the tail of the child's stderr.
 */
class ProcessFailed : public RelayError {
public:
  ProcessFailed(ErrorKind kind, const std::string &tool, int exit_code,
                std::string stderr_tail);

  int exit_code() const noexcept { return exit_code_; }

private:
  int exit_code_;
};

class ExtractionFailed : public ProcessFailed {
public:
  ExtractionFailed(int exit_code, std::string stderr_tail)
      : ProcessFailed(ErrorKind::ExtractionFailed, "extraction", exit_code,
                      std::move(stderr_tail)) {}
};

class UploadFailed : public ProcessFailed {
public:
  UploadFailed(int exit_code, std::string stderr_tail)
      : ProcessFailed(ErrorKind::UploadFailed, "upload", exit_code,
                      std::move(stderr_tail)) {}
};

class PipelineTimeout : public RelayError {
public:
  explicit PipelineTimeout(std::chrono::milliseconds limit);
};

class ProgressTimeout : public RelayError {
public:
  explicit ProgressTimeout(std::chrono::milliseconds limit);
};

class ContentTooLarge : public RelayError {
public:
  ContentTooLarge(long long size, long long max_size);
};

class SpawnError : public RelayError {
public:
  SpawnError(const std::string &program, int err);
};

// **---- QUEUE / SCHEDULER ----**

class QueueFull : public RelayError {
public:
  explicit QueueFull(std::size_t active);
};

class JobTimeout : public RelayError {
public:
  explicit JobTimeout(const std::string &what)
      : RelayError(ErrorKind::JobTimeout, what) {}
};

class JobCancelled : public RelayError {
public:
  explicit JobCancelled(const std::string &what)
      : RelayError(ErrorKind::JobCancelled, what) {}
};

class SchedulerShutdown : public RelayError {
public:
  explicit SchedulerShutdown(const std::string &what)
      : RelayError(ErrorKind::SchedulerShutdown, what) {}
};

class StorageError : public RelayError {
public:
  StorageError(const std::string &message, std::string path)
      : RelayError(ErrorKind::StorageError, message, std::move(path)) {}
};

} // namespace media_relay

#endif // MEDIA_RELAY_ERRORS_HPP
