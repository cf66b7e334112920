/**
 * @file pipeline.hpp
 * @brief Streaming pipeline: extraction tool piped into the upload tool
 *
 * @details The StreamingPipeline class runs one media transfer:
 *
 *          1. Probe metadata (extraction tool, no download)
 *
 *          2. Render and validate the destination path
 *
 *          3. Spawn extractor | uploader connected by an OS pipe
 *
 *          4. Monitor stderr of both for progress, stall and total timeout
 *
 *          5. Check exit codes, report bytes transferred
 *
 *          6. Clean up both processes on every exit path
 *
 * @note The media never touches local disk unless the upload target is the
 *       local storage root itself.
 */

#ifndef MEDIA_RELAY_PIPELINE_HPP
#define MEDIA_RELAY_PIPELINE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cancellation.hpp"
#include "file_manager.hpp"
#include "logging.hpp"
#include "subprocess.hpp"
#include "types.hpp"

namespace media_relay {

/**
 * @struct PipelineRequest
 * @brief What to transfer and under which limits.
 */
struct PipelineRequest {
  std::string request_id;
  std::string source_url;
  std::string format_selector = "bv*+ba/best";
  std::string destination_template = "videos/{safe_title}-{id}.{ext}";
  std::chrono::milliseconds timeout = std::chrono::minutes(30);
  std::chrono::milliseconds stall_timeout = std::chrono::minutes(5);
  int64_t max_content_length = 10LL * 1024 * 1024 * 1024; //< 0 = unlimited
  std::optional<std::string> cookies_file;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string content_type; //< Empty: derived from the extension
};

/**
 * @struct PipelineOptions
 * @brief Tool locations and monitoring knobs shared by all runs.
 */
struct PipelineOptions {
  std::string extractor_bin = "yt-dlp";
  std::string uploader_bin = "rclone";
  std::string remote; //< Upload tool remote; empty = local storage root
  std::chrono::milliseconds metadata_timeout = std::chrono::seconds(60);
  std::chrono::milliseconds poll_interval = std::chrono::seconds(1);
  std::chrono::milliseconds terminate_grace = DEFAULT_TERMINATE_GRACE;
  int upload_retries = 3;
};

/**
 * @struct PipelineResult
 * @brief Outcome of a successful run.
 */
struct PipelineResult {
  std::string object_path;   //< Relative to the storage root / remote
  std::string upload_target; //< Argument handed to the upload tool
  uint64_t bytes_transferred = 0;
  Metadata metadata;
  std::chrono::milliseconds elapsed{0};

  nlohmann::json to_json() const;
};

/// id, title, ext, uploader, duration and webpage_url of a metadata record
nlohmann::json metadata_summary(const Metadata &metadata);

/// MIME type guessed from a media extension
std::string content_type_for(const std::string &ext);

/**
 * @class StreamingPipeline
 * @brief One execution of extractor | uploader.
 *
 * @attention GUARANTEES:
 *
 * - Metadata extraction and path resolution finish before any process is
 *   spawned
 *
 * - Both processes are terminated (SIGTERM, grace, SIGKILL) before execute()
 *   returns or throws
 *
 * - Failures surface as typed RelayError subclasses
 *
 * @note Not reusable: construct one instance per run. The instance is owned
 *       by the worker thread executing it; only cancel() may be called from
 *       another thread.
 */
class StreamingPipeline {
public:
  /**
   * @param request Transfer description
   * @param options Tool locations and knobs
   * @param resolver Renders and validates the destination path
   * @param sink Optional per-run log sink
   * @param token Cancellation / deadline of the owning job
   */
  StreamingPipeline(PipelineRequest request, PipelineOptions options,
                    const PathResolver &resolver, LogSink sink = {},
                    CancellationToken token = {});

  StreamingPipeline(const StreamingPipeline &) = delete;
  StreamingPipeline &operator=(const StreamingPipeline &) = delete;

  /**
   * @brief Run the pipeline to completion.
   * @throws MetadataError, PathResolutionError, StorageError, SpawnError,
   *         ExtractionFailed, UploadFailed, ProgressTimeout, PipelineTimeout,
   *         ContentTooLarge, JobCancelled, JobTimeout
   */
  PipelineResult execute();

  /// Request a stop; observed on the next monitoring iteration
  void cancel() { token_.request_cancel(); }

  /// Probe only; also used by the relay_probe tool
  Metadata extract_metadata();

  std::vector<std::string> probe_command() const;
  std::vector<std::string> extract_command() const;
  std::vector<std::string> upload_command(const std::string &target,
                                          const std::string &ext) const;

  /// PIDs of the spawned processes (-1 before spawning), for diagnostics
  pid_t extractor_pid() const { return extractor_.pid(); }
  pid_t uploader_pid() const { return uploader_.pid(); }

private:
  PipelineResult run_stages();
  void spawn_processes(const std::string &target, const std::string &ext);
  void monitor();
  void drain_streams(int wait_ms);
  void handle_extractor_line(const std::string &line);
  void handle_uploader_line(const std::string &line);
  void check_exit_codes();

  /// Terminate both children and close the pipes. Never throws.
  void cleanup() noexcept;

  /// Remove a partially written local artifact after a failure
  void discard_partial() noexcept;

  void log(LogLevel level, const std::string &message) const;

  PipelineRequest request_;
  PipelineOptions options_;
  const PathResolver &resolver_;
  LogSink sink_;
  CancellationToken token_;
  std::string prefix_; //< "[request_id]"

  ChildProcess extractor_;
  ChildProcess uploader_;
  UniqueFd extractor_err_;
  UniqueFd uploader_err_;
  LineBuffer extractor_lines_;
  LineBuffer uploader_lines_;

  Clock::time_point last_progress_;
  uint64_t bytes_transferred_ = 0;
  std::string local_path_; //< Set when uploading into the local root
};

} // namespace media_relay

#endif // MEDIA_RELAY_PIPELINE_HPP
