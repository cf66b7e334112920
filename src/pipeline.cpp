/**
 * @file pipeline.cpp
 * @brief Streaming pipeline implementation
 *
 * @details Runs one transfer through the states:
 *
 *          1. Metadata extraction (probe mode, short timeout)
 *
 *          2. Path resolution via the PathResolver
 *
 *          3. Process spawn: extractor stdout -> pipe -> uploader stdin
 *
 *          4. Monitoring: poll() on both stderr pipes at poll_interval
 *
 *          5. Exit code inspection
 *
 *          6. Cleanup
 *
 * @note All log messages are prefixed with [request_id].
 */

#include "media_relay/pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <exception>
#include <filesystem>
#include <string_view>
#include <system_error>

#include <poll.h>
#include <signal.h>

#include <fmt/core.h>

#include "media_relay/errors.hpp"
#include "media_relay/system.hpp"

namespace media_relay {

namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

/// Extraction tool progress output, e.g. "[download]  42.0% of ~12.3MiB"
bool is_progress_line(const std::string &line) {
  std::string lower = to_lower(line);
  return lower.find("[download]") != std::string::npos ||
         lower.find('%') != std::string::npos ||
         lower.find("downloading") != std::string::npos ||
         lower.find("progress") != std::string::npos;
}

/// Advertised total size from a progress line ("% of ~ 1.20GiB at ...")
std::optional<uint64_t> advertised_size(const std::string &line) {
  size_t pos = line.find("% of");
  if (pos == std::string::npos)
    return std::nullopt;
  pos += 4;
  while (pos < line.size() && (line[pos] == ' ' || line[pos] == '~'))
    ++pos;
  size_t end = line.find(' ', pos);
  return parse_size(std::string_view(line).substr(pos, end - pos));
}

/// Byte count from an upload summary line ("Transferred: 1.2 MiB / ...")
std::optional<uint64_t> transferred_bytes(const std::string &line) {
  size_t pos = line.find("Transferred:");
  if (pos == std::string::npos)
    return std::nullopt;
  pos += 12;
  size_t end = line.find_first_of("/,", pos);
  return parse_size(std::string_view(line).substr(pos, end - pos));
}

std::string metadata_string(const Metadata &metadata, const char *key,
                            const std::string &fallback) {
  auto it = metadata.find(key);
  if (it != metadata.end() && it->is_string())
    return it->get<std::string>();
  return fallback;
}

} // anonymous namespace

// **---- Result helpers ----**

nlohmann::json metadata_summary(const Metadata &metadata) {
  nlohmann::json summary = nlohmann::json::object();
  for (const char *key :
       {"id", "title", "ext", "uploader", "duration", "webpage_url"}) {
    auto it = metadata.find(key);
    if (it != metadata.end() && !it->is_null())
      summary[key] = *it;
  }
  return summary;
}

nlohmann::json PipelineResult::to_json() const {
  return {
      {"object_path", object_path},
      {"upload_target", upload_target},
      {"bytes_transferred", bytes_transferred},
      {"size", format_bytes(bytes_transferred)},
      {"elapsed_sec", elapsed.count() / 1000.0},
      {"metadata", metadata_summary(metadata)},
  };
}

std::string content_type_for(const std::string &ext) {
  static const std::vector<std::pair<std::string, std::string>> types = {
      {"mp4", "video/mp4"},        {"m4v", "video/mp4"},
      {"webm", "video/webm"},      {"mkv", "video/x-matroska"},
      {"mov", "video/quicktime"},  {"flv", "video/x-flv"},
      {"m4a", "audio/mp4"},        {"mp3", "audio/mpeg"},
      {"opus", "audio/ogg"},       {"ogg", "audio/ogg"},
      {"wav", "audio/wav"},        {"flac", "audio/flac"},
  };
  std::string lower = to_lower(ext);
  for (const auto &[e, type] : types)
    if (e == lower)
      return type;
  return "application/octet-stream";
}

// **---- Constructor ----**

StreamingPipeline::StreamingPipeline(PipelineRequest request,
                                     PipelineOptions options,
                                     const PathResolver &resolver,
                                     LogSink sink, CancellationToken token)
    : request_(std::move(request)), options_(std::move(options)),
      resolver_(resolver), sink_(std::move(sink)), token_(std::move(token)),
      prefix_("[" + request_.request_id + "]") {}

void StreamingPipeline::log(LogLevel level, const std::string &message) const {
  emit(sink_, level, prefix_, message);
}

// **---- Command lines ----**

std::vector<std::string> StreamingPipeline::probe_command() const {
  std::vector<std::string> cmd = {options_.extractor_bin, "--dump-json",
                                  "--no-warnings", "--format",
                                  request_.format_selector};
  if (request_.cookies_file) {
    cmd.push_back("--cookies");
    cmd.push_back(*request_.cookies_file);
  }
  cmd.push_back(request_.source_url);
  return cmd;
}

std::vector<std::string> StreamingPipeline::extract_command() const {
  std::vector<std::string> cmd = {options_.extractor_bin,
                                  "--no-warnings",
                                  "--newline",
                                  "--format",
                                  request_.format_selector,
                                  "--output",
                                  "-",
                                  "--no-part",
                                  "--no-playlist"};
  if (request_.max_content_length > 0) {
    cmd.push_back("--max-filesize");
    cmd.push_back(std::to_string(request_.max_content_length));
  }
  if (request_.cookies_file) {
    cmd.push_back("--cookies");
    cmd.push_back(*request_.cookies_file);
  }
  cmd.push_back(request_.source_url);
  return cmd;
}

std::vector<std::string>
StreamingPipeline::upload_command(const std::string &target,
                                  const std::string &ext) const {
  std::vector<std::string> cmd = {options_.uploader_bin, "rcat", target};

  bool has_content_type = false;
  for (const auto &[key, value] : request_.headers) {
    if (to_lower(key) == "content-type")
      has_content_type = true;
    cmd.push_back("--header");
    cmd.push_back(key + ": " + value);
  }
  if (!has_content_type) {
    std::string type = request_.content_type.empty() ? content_type_for(ext)
                                                     : request_.content_type;
    cmd.push_back("--header");
    cmd.push_back("Content-Type: " + type);
  }

  cmd.push_back("--retries");
  cmd.push_back(std::to_string(options_.upload_retries));
  cmd.insert(cmd.end(), {"--low-level-retries", "10", "--transfers", "1",
                         "--stats", "0", "-v"});
  return cmd;
}

// **---- Main Processing ----**

PipelineResult StreamingPipeline::execute() {
  TIMER_START(pipeline);

  PipelineResult result;
  try {
    result = run_stages();
  } catch (const std::exception &e) {
    log(LogLevel::Error, fmt::format("Transfer failed: {}", e.what()));
    cleanup();
    discard_partial();
    throw;
  }
  cleanup();

  TIMER_END(pipeline);
  return result;
}

PipelineResult StreamingPipeline::run_stages() {
  const auto start = Clock::now();

  // **----- PHASE 1: METADATA -----**

  Metadata metadata = extract_metadata();
  const std::string ext = metadata_string(metadata, "ext", "mp4");

  // **----- PHASE 2: PATH RESOLUTION -----**

  std::string object_path =
      resolver_.render(request_.destination_template, metadata);

  std::string target;
  if (options_.remote.empty()) {
    fs::path local = resolver_.validate(object_path);
    std::error_code ec;
    fs::create_directories(local.parent_path(), ec);
    if (ec)
      throw StorageError("Cannot create directory: " + ec.message(),
                         local.parent_path().string());
    target = local.string();
  } else {
    object_path = confine_object_path(object_path);
    target = options_.remote + ":" + object_path;
  }
  log(LogLevel::Info, fmt::format("Target path: {}", target));

  throw_if_stopped(token_, "pipeline " + request_.request_id);

  // **----- PHASE 3: SPAWN -----**

  log(LogLevel::Info, "Starting transfer...");
  spawn_processes(target, ext);
  if (options_.remote.empty())
    local_path_ = target;

  // **----- PHASE 4: MONITOR -----**

  TIMER_START(transfer);
  monitor();
  TIMER_END(transfer);

  // **----- PHASE 5: RESULT -----**

  check_exit_codes();

  if (bytes_transferred_ == 0 && !local_path_.empty()) {
    std::error_code ec;
    auto size = fs::file_size(local_path_, ec);
    if (!ec)
      bytes_transferred_ = size;
  }

  PipelineResult result;
  result.object_path = std::move(object_path);
  result.upload_target = std::move(target);
  result.bytes_transferred = bytes_transferred_;
  result.metadata = std::move(metadata);
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::now() - start);

  log(LogLevel::Info,
      fmt::format("Transfer completed: {} in {}",
                  format_bytes(result.bytes_transferred),
                  format_time(result.elapsed.count() / 1000.0)));
  local_path_.clear();
  return result;
}

// **---- Metadata ----**

Metadata StreamingPipeline::extract_metadata() {
  log(LogLevel::Info, "Extracting metadata...");
  TIMER_START(metadata);

  CaptureResult probe =
      run_capture(probe_command(), options_.metadata_timeout, &token_);

  if (probe.timed_out)
    throw MetadataError("Metadata extraction timed out", probe.err);
  if (probe.exit_code != 0)
    throw MetadataError(
        fmt::format("Metadata extraction failed (exit {})", probe.exit_code),
        probe.err);

  /// One JSON object per line; the first non-playlist entry wins
  size_t pos = 0;
  while (pos < probe.out.size()) {
    size_t end = probe.out.find('\n', pos);
    if (end == std::string::npos)
      end = probe.out.size();
    std::string line = probe.out.substr(pos, end - pos);
    pos = end + 1;

    auto record = nlohmann::json::parse(line, nullptr, false);
    if (record.is_discarded() || !record.is_object())
      continue;
    if (metadata_string(record, "_type", "") == "playlist")
      continue;

    TIMER_END(metadata);
    log(LogLevel::Info,
        fmt::format("Extracted metadata for: {}",
                    metadata_string(record, "title", "Unknown")));
    return record;
  }

  throw MetadataError("No valid metadata found in extractor output",
                      probe.err);
}

// **---- Processes ----**

void StreamingPipeline::spawn_processes(const std::string &target,
                                        const std::string &ext) {
  Pipe media = make_pipe();
  Pipe extractor_err = make_pipe();
  Pipe uploader_err = make_pipe();
  set_nonblocking(extractor_err.read.get());
  set_nonblocking(uploader_err.read.get());

  SpawnOptions extractor_io;
  extractor_io.stdout_fd = media.write.get();
  extractor_io.stderr_fd = extractor_err.write.get();
  extractor_ = ChildProcess::spawn(extract_command(), extractor_io);

  SpawnOptions uploader_io;
  uploader_io.stdin_fd = media.read.get();
  uploader_io.stderr_fd = uploader_err.write.get();
  uploader_ = ChildProcess::spawn(upload_command(target, ext), uploader_io);

  /// Drop our copies so EOF and SIGPIPE propagate between the two children
  media.read.reset();
  media.write.reset();
  extractor_err.write.reset();
  uploader_err.write.reset();

  extractor_err_ = std::move(extractor_err.read);
  uploader_err_ = std::move(uploader_err.read);

  log(LogLevel::Debug, fmt::format("Spawned extractor (pid {}) | uploader "
                                   "(pid {})",
                                   extractor_.pid(), uploader_.pid()));
}

void StreamingPipeline::drain_streams(int wait_ms) {
  pollfd fds[2];
  nfds_t n = 0;
  if (extractor_err_.is_valid())
    fds[n++] = {extractor_err_.get(), POLLIN, 0};
  if (uploader_err_.is_valid())
    fds[n++] = {uploader_err_.get(), POLLIN, 0};

  if (n == 0) {
    /// Both streams at EOF: the children are exiting, reap them promptly
    token_.wait_for(std::min<std::chrono::milliseconds>(
        options_.poll_interval, std::chrono::milliseconds(20)));
    return;
  }

  if (::poll(fds, n, wait_ms) == -1 && errno != EINTR)
    throw std::system_error(errno, std::generic_category(), "poll");

  if (extractor_err_.is_valid()) {
    bool open = read_available(extractor_err_.get(), extractor_lines_);
    for (const auto &line : extractor_lines_.take_lines())
      handle_extractor_line(line);
    if (!open) {
      if (auto rest = extractor_lines_.take_partial())
        handle_extractor_line(*rest);
      extractor_err_.reset();
    }
  }

  if (uploader_err_.is_valid()) {
    bool open = read_available(uploader_err_.get(), uploader_lines_);
    for (const auto &line : uploader_lines_.take_lines())
      handle_uploader_line(line);
    if (!open) {
      if (auto rest = uploader_lines_.take_partial())
        handle_uploader_line(*rest);
      uploader_err_.reset();
    }
  }
}

void StreamingPipeline::handle_extractor_line(const std::string &line) {
  if (!is_progress_line(line)) {
    log(LogLevel::Debug, line);
    return;
  }

  last_progress_ = Clock::now();
  log(LogLevel::Info, fmt::format("Progress: {}", line));

  if (request_.max_content_length <= 0)
    return;
  auto size = advertised_size(line);
  if (size && *size > static_cast<uint64_t>(request_.max_content_length)) {
    log(LogLevel::Warning,
        fmt::format("Advertised size {} exceeds limit {}",
                    format_bytes(*size),
                    format_bytes(request_.max_content_length)));
    throw ContentTooLarge(static_cast<long long>(*size),
                          request_.max_content_length);
  }
}

void StreamingPipeline::handle_uploader_line(const std::string &line) {
  log(LogLevel::Debug, fmt::format("upload: {}", line));
  /// Summaries list bytes and file counts; the byte total is the larger
  if (auto bytes = transferred_bytes(line))
    bytes_transferred_ = std::max(bytes_transferred_, *bytes);
}

void StreamingPipeline::monitor() {
  const std::string what = "pipeline " + request_.request_id;
  const auto start = Clock::now();
  last_progress_ = start;
  const int wait_ms = static_cast<int>(options_.poll_interval.count());

  bool extractor_done = false;

  while (true) {
    throw_if_stopped(token_, what);

    drain_streams(wait_ms);
    const auto now = Clock::now();

    auto extractor_exit = extractor_.poll();
    auto uploader_exit = uploader_.poll();

    if (extractor_exit && !extractor_done) {
      extractor_done = true;
      /// The uploader is flushing; do not count that as a stall
      last_progress_ = now;
      log(LogLevel::Debug,
          fmt::format("Extractor exited with {}", *extractor_exit));
    }

    if (extractor_exit && uploader_exit)
      break;
    /// A failed side makes waiting for the other pointless
    if (extractor_exit && *extractor_exit != 0)
      break;
    if (uploader_exit && *uploader_exit != 0)
      break;

    if (now - last_progress_ > request_.stall_timeout) {
      log(LogLevel::Warning,
          fmt::format("No progress for {}, aborting",
                      format_time(request_.stall_timeout.count() / 1000.0)));
      throw ProgressTimeout(request_.stall_timeout);
    }

    if (now - start > request_.timeout) {
      log(LogLevel::Error,
          fmt::format("Transfer timed out after {}",
                      format_time(request_.timeout.count() / 1000.0)));
      throw PipelineTimeout(request_.timeout);
    }
  }

  /// Collect whatever stderr is still buffered for error reports
  if (extractor_err_.is_valid())
    read_available(extractor_err_.get(), extractor_lines_);
  if (uploader_err_.is_valid())
    read_available(uploader_err_.get(), uploader_lines_);
}

void StreamingPipeline::check_exit_codes() {
  auto extractor_exit = extractor_.exit_code();
  auto uploader_exit = uploader_.exit_code();
  const int broken_pipe = 128 + SIGPIPE;

  /// An extractor killed by SIGPIPE is a symptom of a failed uploader
  if (extractor_exit && *extractor_exit != 0 && *extractor_exit != broken_pipe)
    throw ExtractionFailed(*extractor_exit, extractor_lines_.tail());
  if (uploader_exit && *uploader_exit != 0)
    throw UploadFailed(*uploader_exit, uploader_lines_.tail());
  if (extractor_exit && *extractor_exit != 0)
    throw ExtractionFailed(*extractor_exit, extractor_lines_.tail());
}

// **---- Cleanup ----**

void StreamingPipeline::cleanup() noexcept {
  ChildProcess *children[] = {&extractor_, &uploader_};
  for (ChildProcess *child : children) {
    if (!child->running())
      continue;
    log_noexcept([this, child] {
      log(LogLevel::Info,
          fmt::format("Terminating {} process (pid {})...", child->name(),
                      child->pid()));
    });
    if (child->terminate(options_.terminate_grace))
      log_noexcept([this, child] {
        LOG_WARN("{} Force killed {} (pid {})", prefix_, child->name(),
                 child->pid());
      });
  }

  extractor_err_.reset();
  uploader_err_.reset();
}

void StreamingPipeline::discard_partial() noexcept {
  if (local_path_.empty())
    return;

  std::error_code ec;
  bool removed = fs::remove(local_path_, ec);
  log_noexcept([&] {
    if (removed)
      LOG_INFO("{} Cleaned up partial file {}", prefix_, local_path_);
    else if (ec)
      LOG_WARN("{} Failed to clean up partial file {}: {}", prefix_,
               local_path_, ec.message());
  });
  local_path_.clear();
}

} // namespace media_relay
