/**
 * @file file_manager.cpp
 * @brief Storage-root management implementation
 *
 * @details Provides implementations for:
 *
 *          - Path template expansion and filename sanitizing
 *
 *          - Path validation against the storage root
 *
 *          - Deletion scheduling, deletion and housekeeping
 *
 *          - Remote object deleter
 */

#include "media_relay/file_manager.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <system_error>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include "media_relay/errors.hpp"
#include "media_relay/subprocess.hpp"
#include "media_relay/system.hpp"

namespace media_relay {

namespace fs = std::filesystem;

namespace {

constexpr size_t MAX_FILENAME_BYTES = 200;

/// String view of a metadata field; numbers are printed, null is missing
std::optional<std::string> field(const Metadata &metadata, const char *key) {
  auto it = metadata.find(key);
  if (it == metadata.end() || it->is_null())
    return std::nullopt;
  if (it->is_string())
    return it->get<std::string>();
  if (it->is_number() || it->is_boolean())
    return it->dump();
  return std::nullopt;
}

std::string field_or(const Metadata &metadata, const char *key,
                     const std::string &fallback) {
  return field(metadata, key).value_or(fallback);
}

std::string today_utc() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  return fmt::format("{:%Y-%m-%d}", tm);
}

/// "20240131" -> "2024-01-31"; nullopt when not a plausible date
std::optional<std::string> format_upload_date(const std::string &raw) {
  if (raw.size() != 8 ||
      !std::all_of(raw.begin(), raw.end(),
                   [](unsigned char c) { return std::isdigit(c); }))
    return std::nullopt;

  int month = std::stoi(raw.substr(4, 2));
  int day = std::stoi(raw.substr(6, 2));
  if (month < 1 || month > 12 || day < 1 || day > 31)
    return std::nullopt;

  return raw.substr(0, 4) + "-" + raw.substr(4, 2) + "-" + raw.substr(6, 2);
}

/// Collapse runs of '/' and strip them at both ends
std::string normalize_slashes(const std::string &path) {
  std::string out;
  out.reserve(path.size());
  for (char c : path) {
    if (c == '/' && (out.empty() || out.back() == '/'))
      continue;
    out.push_back(c);
  }
  while (!out.empty() && out.back() == '/')
    out.pop_back();
  return out;
}

bool is_within(const fs::path &root, const fs::path &path) {
  auto mismatch =
      std::mismatch(root.begin(), root.end(), path.begin(), path.end());
  return mismatch.first == root.end();
}

} // anonymous namespace

nlohmann::json to_json(const StorageStats &stats) {
  return {
      {"storage_dir", stats.storage_dir},
      {"total_files", stats.total_files},
      {"total_size_bytes", stats.total_bytes},
      {"total_size", format_bytes(stats.total_bytes)},
  };
}

// **----- Construction -----**

FileManager::FileManager(fs::path storage_root, DeletionScheduler &scheduler,
                         std::chrono::milliseconds retention,
                         std::string remote)
    : scheduler_(scheduler), retention_(retention),
      remote_(std::move(remote)) {
  std::error_code ec;
  fs::create_directories(storage_root, ec);
  if (ec)
    throw StorageError("Cannot create storage directory: " + ec.message(),
                       storage_root.string());

  root_ = fs::weakly_canonical(storage_root, ec);
  if (ec)
    throw StorageError("Cannot resolve storage directory: " + ec.message(),
                       storage_root.string());
}

// **----- Path templates -----**

std::string FileManager::sanitize_filename(const std::string &name) {
  static const std::string forbidden = "<>:\"/\\|?*";

  std::string safe;
  safe.reserve(name.size());
  for (unsigned char c : name) {
    bool replace = c < 0x20 || forbidden.find(static_cast<char>(c)) !=
                                   std::string::npos;
    bool blank = replace || c == '_' || std::isspace(c);

    /// Runs of whitespace and underscores become one underscore
    if (blank) {
      if (safe.empty() || safe.back() != '_')
        safe.push_back('_');
      continue;
    }
    safe.push_back(static_cast<char>(c));
  }

  auto strip = [](char c) { return c == '_' || c == '.'; };
  size_t begin = 0;
  while (begin < safe.size() && strip(safe[begin]))
    ++begin;
  size_t end = safe.size();
  while (end > begin && strip(safe[end - 1]))
    --end;
  safe = safe.substr(begin, end - begin);

  if (safe.size() > MAX_FILENAME_BYTES) {
    size_t cut = MAX_FILENAME_BYTES;
    /// Never split a UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(safe[cut]) & 0xC0) == 0x80)
      --cut;
    safe.resize(cut);
  }

  return safe.empty() ? "unknown" : safe;
}

std::string FileManager::expand_path_template(const std::string &path_template,
                                              const Metadata &metadata) const {
  const std::string uploader = field_or(metadata, "uploader", "unknown");

  int playlist_index = 0;
  auto index_it = metadata.find("playlist_index");
  if (index_it != metadata.end() && index_it->is_number_integer())
    playlist_index = index_it->get<int>();

  std::string upload_date = today_utc();
  if (auto raw = field(metadata, "upload_date")) {
    if (auto formatted = format_upload_date(*raw))
      upload_date = *formatted;
  }

  auto value_of = [&](const std::string &token) -> std::optional<std::string> {
    if (token == "id")
      return field_or(metadata, "id", "unknown");
    if (token == "title")
      return field_or(metadata, "title", "Unknown Title");
    if (token == "safe_title")
      return sanitize_filename(field_or(metadata, "title", "Unknown Title"));
    if (token == "ext")
      return field_or(metadata, "ext", "mp4");
    if (token == "uploader")
      return sanitize_filename(uploader);
    if (token == "channel")
      return sanitize_filename(field_or(metadata, "channel", uploader));
    if (token == "channel_id")
      return field(metadata, "channel_id")
          .value_or(field_or(metadata, "uploader_id", "unknown"));
    if (token == "upload_date")
      return upload_date;
    if (token == "date")
      return today_utc();
    if (token == "random")
      return random_hex(4);
    if (token == "playlist")
      return sanitize_filename(field_or(metadata, "playlist", "unknown"));
    if (token == "playlist_index")
      return std::to_string(playlist_index);
    if (token == "playlist_index:03d")
      return fmt::format("{:03d}", playlist_index);
    return std::nullopt;
  };

  /// Single pass: substituted values are never re-scanned for tokens
  std::string expanded;
  expanded.reserve(path_template.size() + 64);
  size_t pos = 0;
  while (pos < path_template.size()) {
    size_t open = path_template.find('{', pos);
    if (open == std::string::npos) {
      expanded.append(path_template, pos, std::string::npos);
      break;
    }
    expanded.append(path_template, pos, open - pos);

    size_t close = path_template.find('}', open);
    if (close == std::string::npos) {
      expanded.append(path_template, open, std::string::npos);
      break;
    }

    std::string token = path_template.substr(open + 1, close - open - 1);
    if (auto value = value_of(token))
      expanded += *value;
    else
      expanded.append(path_template, open, close - open + 1);
    pos = close + 1;
  }

  std::string normalized = normalize_slashes(expanded);
  if (normalized.empty())
    throw PathResolutionError("Path template '" + path_template +
                              "' rendered to an empty path");
  return normalized;
}

// **----- Validation -----**

fs::path FileManager::validate_path(const fs::path &path) const {
  fs::path candidate = path.is_absolute() ? path : root_ / path;

  std::error_code ec;
  if (fs::is_symlink(candidate, ec))
    throw StorageError("Symlinks not allowed for security", candidate.string());

  fs::path resolved = fs::weakly_canonical(candidate, ec);
  if (ec)
    throw StorageError("Invalid path: " + ec.message(), candidate.string());

  if (!is_within(root_, resolved))
    throw StorageError("Path traversal detected", candidate.string());

  return resolved;
}

std::string confine_object_path(const std::string &path) {
  fs::path normal = fs::path(path).lexically_normal();
  if (normal.is_absolute() || normal.has_root_name())
    throw StorageError("Path traversal detected", path);

  std::string rel = normal.generic_string();
  while (!rel.empty() && rel.back() == '/')
    rel.pop_back();
  if (rel.empty() || rel == "." || rel == ".." || rel.rfind("../", 0) == 0)
    throw StorageError("Path traversal detected", path);
  return rel;
}

std::string FileManager::relative_path(const fs::path &path) const {
  return validate_path(path).lexically_relative(root_).generic_string();
}

// **----- Deletion -----**

ScheduledDeletion
FileManager::schedule_deletion(const fs::path &path,
                               std::optional<std::chrono::milliseconds> delay,
                               LogSink sink) {
  fs::path validated = validate_path(path);
  auto wait = delay.value_or(retention_);

  /// Remote objects are addressed relative to the remote root
  std::string target =
      remote_.empty() ? validated.string()
                      : validated.lexically_relative(root_).generic_string();

  ScheduledDeletion receipt =
      scheduler_.schedule_deletion(target, wait, std::move(sink));

  LOG_INFO("Scheduled deletion of {} in {} (task: {})", target,
           format_time(std::chrono::duration<double>(wait).count()),
           receipt.task_id);
  return receipt;
}

bool FileManager::cancel_deletion(const std::string &task_id) {
  bool success = scheduler_.cancel_deletion(task_id);
  if (success)
    LOG_INFO("Cancelled deletion task: {}", task_id);
  else
    LOG_WARN("Deletion task not found: {}", task_id);
  return success;
}

bool FileManager::delete_file(const fs::path &path) {
  fs::path validated = validate_path(path);

  std::error_code ec;
  if (!fs::exists(validated, ec)) {
    LOG_WARN("File not found for deletion: {}", path.string());
    return false;
  }
  if (!fs::is_regular_file(validated, ec))
    throw StorageError("Path is not a file", path.string());

  if (!fs::remove(validated, ec) && ec)
    throw StorageError("Failed to delete file: " + ec.message(),
                       path.string());

  LOG_INFO("Deleted file: {}", validated.string());
  return true;
}

// **----- Housekeeping -----**

StorageStats FileManager::storage_stats() const {
  StorageStats stats;
  stats.storage_dir = root_.string();

  std::error_code ec;
  fs::recursive_directory_iterator it(
      root_, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec))
      continue;
    ++stats.total_files;
    auto size = it->file_size(entry_ec);
    if (!entry_ec)
      stats.total_bytes += size;
  }
  if (ec)
    LOG_ERROR("Failed to scan storage directory {}: {}", stats.storage_dir,
              ec.message());
  return stats;
}

int FileManager::cleanup_old_files(std::chrono::seconds max_age) {
  const auto cutoff = fs::file_time_type::clock::now() - max_age;
  int deleted = 0;

  std::error_code ec;
  fs::recursive_directory_iterator it(
      root_, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec))
      continue;

    auto modified = it->last_write_time(entry_ec);
    if (entry_ec || modified >= cutoff)
      continue;

    if (fs::remove(it->path(), entry_ec)) {
      ++deleted;
      LOG_INFO("Cleaned up old file: {}", it->path().string());
    } else if (entry_ec) {
      LOG_WARN("Failed to delete {}: {}", it->path().string(),
               entry_ec.message());
    }
  }
  if (ec)
    LOG_ERROR("Cleanup scan of {} failed: {}", root_.string(), ec.message());

  LOG_INFO("Cleanup complete: deleted {} files", deleted);
  return deleted;
}

// **----- Remote deleter -----**

Deleter make_remote_deleter(std::string uploader_bin, std::string remote,
                            std::chrono::milliseconds timeout) {
  return [uploader_bin = std::move(uploader_bin), remote = std::move(remote),
          timeout](const std::string &target) {
    const std::string object = remote + ":" + target;
    CaptureResult r =
        run_capture({uploader_bin, "deletefile", object}, timeout);

    if (r.timed_out)
      throw StorageError("deletefile timed out", object);
    if (r.exit_code == 0)
      return DeletionOutcome::Deleted;

    std::string lowered = r.err;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lowered.find("not found") != std::string::npos)
      return DeletionOutcome::AlreadyGone;

    throw StorageError(fmt::format("deletefile exited with {}: {}",
                                   r.exit_code, r.err),
                       object);
  };
}

} // namespace media_relay
