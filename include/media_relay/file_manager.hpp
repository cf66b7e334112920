/**
 * @file file_manager.hpp
 * @brief Storage-root management: path templates, validation, expiry
 *
 * @details Provides:
 *          - PathResolver: the seam the Streaming Pipeline renders and
 *            validates destination paths through
 *
 *          - FileManager: PathResolver over a storage root, plus deletion
 *            scheduling and housekeeping of stored artifacts
 *
 *          - make_remote_deleter(): Deleter for objects living on an upload
 *            tool remote instead of the local filesystem
 */

#ifndef MEDIA_RELAY_FILE_MANAGER_HPP
#define MEDIA_RELAY_FILE_MANAGER_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "deletion_scheduler.hpp"
#include "logging.hpp"
#include "types.hpp"

namespace media_relay {

/**
 * @class PathResolver
 * @brief Renders and validates destination paths.
 */
class PathResolver {
public:
  virtual ~PathResolver() = default;

  /**
   * @brief Render a destination template against a metadata record.
   * @return Path relative to the storage root, without leading slash
   * @throws PathResolutionError if nothing usable remains
   */
  virtual std::string render(const std::string &path_template,
                             const Metadata &metadata) const = 0;

  /**
   * @brief Resolve a path against the storage root.
   * @throws StorageError on symlinks or paths escaping the root
   */
  virtual std::filesystem::path
  validate(const std::filesystem::path &path) const = 0;
};

/**
 * @brief Lexically confine a rendered path below a root that cannot be
 *        inspected locally, such as an upload remote.
 * @return The normalized relative path
 * @throws StorageError if the path is absolute, empty or climbs out with ".."
 */
std::string confine_object_path(const std::string &path);

/**
 * @struct StorageStats
 * @brief Totals over every regular file below the storage root.
 */
struct StorageStats {
  std::string storage_dir;
  uint64_t total_files = 0;
  uint64_t total_bytes = 0;
};

nlohmann::json to_json(const StorageStats &stats);

/**
 * @class FileManager
 * @brief Owns the layout of the storage root.
 *
 * @note Deletions are handed to the shared DeletionScheduler; with a remote
 *       configured, targets are remote object paths (relative), otherwise
 *       absolute local paths.
 */
class FileManager : public PathResolver {
public:
  /**
   * @param storage_root Directory all artifacts live under (created)
   * @param scheduler Shared deletion scheduler
   * @param retention Default delay of schedule_deletion()
   * @param remote Upload tool remote name; empty for local storage
   * @throws StorageError if the root cannot be created
   */
  FileManager(std::filesystem::path storage_root, DeletionScheduler &scheduler,
              std::chrono::milliseconds retention, std::string remote = {});

  std::string render(const std::string &path_template,
                     const Metadata &metadata) const override {
    return expand_path_template(path_template, metadata);
  }

  std::filesystem::path
  validate(const std::filesystem::path &path) const override {
    return validate_path(path);
  }

  /**
   * @brief Substitute metadata tokens into a path template.
   *
   * @note Tokens: {id} {title} {safe_title} {ext} {uploader} {channel}
   *       {channel_id} {upload_date} {date} {random} {playlist}
   *       {playlist_index} {playlist_index:03d}. Unknown tokens are kept
   *       verbatim. Repeated slashes collapse; leading and trailing slashes
   *       are stripped.
   */
  std::string expand_path_template(const std::string &path_template,
                                   const Metadata &metadata) const;

  /// Make a single path component safe; "unknown" when nothing remains
  static std::string sanitize_filename(const std::string &name);

  std::filesystem::path validate_path(const std::filesystem::path &path) const;

  /// Path relative to the storage root
  std::string relative_path(const std::filesystem::path &path) const;

  /**
   * @brief Schedule expiry of a stored artifact.
   * @param path Artifact path (relative to the root or absolute inside it)
   * @param delay Defaults to the configured retention
   * @param sink Optional log sink of the deletion task
   * @throws StorageError for invalid paths, SchedulerShutdown after shutdown
   */
  ScheduledDeletion
  schedule_deletion(const std::filesystem::path &path,
                    std::optional<std::chrono::milliseconds> delay = {},
                    LogSink sink = {});

  bool cancel_deletion(const std::string &task_id);

  /**
   * @brief Remove a local file now.
   * @return false if it did not exist
   * @throws StorageError if the path is invalid, not a file, or removal fails
   */
  bool delete_file(const std::filesystem::path &path);

  StorageStats storage_stats() const;

  /// Remove regular files older than max_age; returns how many were removed
  int cleanup_old_files(std::chrono::seconds max_age);

  const std::filesystem::path &storage_root() const { return root_; }

private:
  std::filesystem::path root_; //< Canonical storage root
  DeletionScheduler &scheduler_;
  std::chrono::milliseconds retention_;
  std::string remote_;
};

/**
 * @brief Deleter removing objects through the upload tool.
 * @note Runs "<uploader_bin> deletefile <remote>:<target>". A "not found"
 *       answer reads as AlreadyGone; any other failure throws StorageError.
 */
Deleter make_remote_deleter(std::string uploader_bin, std::string remote,
                            std::chrono::milliseconds timeout);

} // namespace media_relay

#endif // MEDIA_RELAY_FILE_MANAGER_HPP
