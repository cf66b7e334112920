/**
 * @file errors.cpp
 * @brief Error kind names, status mapping and message formatting
 */

#include "media_relay/errors.hpp"

#include <cstring>

#include <fmt/core.h>

namespace media_relay {

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::MetadataError:
    return "MetadataError";
  case ErrorKind::PathResolutionError:
    return "PathResolutionError";
  case ErrorKind::ExtractionFailed:
    return "ExtractionFailed";
  case ErrorKind::UploadFailed:
    return "UploadFailed";
  case ErrorKind::PipelineTimeout:
    return "PipelineTimeout";
  case ErrorKind::ProgressTimeout:
    return "ProgressTimeout";
  case ErrorKind::ContentTooLarge:
    return "ContentTooLarge";
  case ErrorKind::QueueFull:
    return "QueueFull";
  case ErrorKind::JobTimeout:
    return "JobTimeout";
  case ErrorKind::JobCancelled:
    return "JobCancelled";
  case ErrorKind::SchedulerShutdown:
    return "SchedulerShutdown";
  case ErrorKind::StorageError:
    return "StorageError";
  case ErrorKind::SpawnError:
    return "SpawnError";
  }
  return "Unknown";
}

int http_status(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::PipelineTimeout:
  case ErrorKind::ProgressTimeout:
  case ErrorKind::JobTimeout:
    return 408;
  case ErrorKind::QueueFull:
  case ErrorKind::SchedulerShutdown:
    return 503;
  case ErrorKind::JobCancelled:
    return 499;
  case ErrorKind::ContentTooLarge:
    return 413;
  case ErrorKind::MetadataError:
    return 422;
  default:
    return 500;
  }
}

RelayError::RelayError(ErrorKind kind, const std::string &message,
                       std::string details)
    : std::runtime_error(message), kind_(kind), details_(std::move(details)) {}

ProcessFailed::ProcessFailed(ErrorKind kind, const std::string &tool,
                             int exit_code, std::string stderr_tail)
    : RelayError(kind,
                 fmt::format("{} process failed (exit {})", tool, exit_code),
                 std::move(stderr_tail)),
      exit_code_(exit_code) {}

PipelineTimeout::PipelineTimeout(std::chrono::milliseconds limit)
    : RelayError(ErrorKind::PipelineTimeout,
                 fmt::format("pipeline timed out after {:.1f}s",
                             limit.count() / 1000.0)) {}

ProgressTimeout::ProgressTimeout(std::chrono::milliseconds limit)
    : RelayError(ErrorKind::ProgressTimeout,
                 fmt::format("no progress for {:.1f}s",
                             limit.count() / 1000.0)) {}

ContentTooLarge::ContentTooLarge(long long size, long long max_size)
    : RelayError(ErrorKind::ContentTooLarge,
                 fmt::format("content size {} exceeds limit {}", size,
                             max_size)) {}

SpawnError::SpawnError(const std::string &program, int err)
    : RelayError(ErrorKind::SpawnError,
                 fmt::format("failed to start {}: {}", program,
                             std::strerror(err))) {}

QueueFull::QueueFull(std::size_t active)
    : RelayError(ErrorKind::QueueFull,
                 fmt::format("queue is full ({} active jobs)", active)) {}

} // namespace media_relay
