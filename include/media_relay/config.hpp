/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Only the composition root (main.cpp, tools) reads these; the
 *          components receive plain option structs.
 *
 */

#ifndef MEDIA_RELAY_CONFIG_HPP
#define MEDIA_RELAY_CONFIG_HPP

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace media_relay {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoi(val) : default_val;
}

/**
 * @brief Get a 64-bit integer value from environment variable.
 */
inline int64_t get_env_int64(const char *name, int64_t default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoll(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @note An empty variable counts as unset.
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/**
 * @brief Get a boolean value from environment variable.
 * @note Accepts 1/0, true/false, yes/no, on/off.
 */
inline bool get_env_bool(const char *name, bool default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  std::string s(val);
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (s == "1" || s == "true" || s == "yes" || s == "on")
    return true;
  if (s == "0" || s == "false" || s == "no" || s == "off")
    return false;
  return default_val;
}

// **---- GENERAL ----**

/// Enable LOG_DEBUG output
inline bool debug() {
  static bool val = get_env_bool("DEBUG", false);
  return val;
}

// **---- QUEUE MANAGER ----**

/**
 * @brief Worker threads in the job pool (0 = cgroup-aware CPU count)
 * @note Bounds OS threads only; see max_concurrent_downloads().
 */
inline int workers() {
  static int val = get_env_int("WORKERS", 2);
  return val;
}

/**
 * @brief Business-level cap on simultaneously running pipelines
 * @note The queue refuses new jobs once 2x this many are active.
 */
inline int max_concurrent_downloads() {
  static int val = get_env_int("MAX_CONCURRENT_DOWNLOADS", 10);
  return val;
}

/// Upper bound a worker waits on a single job
inline int job_timeout_sec() {
  static int val = get_env_int("JOB_TIMEOUT_SEC", 7200);
  return val;
}

// **---- STREAMING PIPELINE ----**

/// Total wall-clock budget of one pipeline run
inline int default_timeout_sec() {
  static int val = get_env_int("DEFAULT_TIMEOUT_SEC", 1800);
  return val;
}

/// Maximum gap between progress lines before a run counts as stalled
inline int progress_timeout_sec() {
  static int val = get_env_int("PROGRESS_TIMEOUT_SEC", 300);
  return val;
}

/// Budget of the metadata probe, independent of the job timeout
inline int metadata_timeout_sec() {
  static int val = get_env_int("METADATA_TIMEOUT_SEC", 60);
  return val;
}

/// Largest artifact accepted, in bytes (default 10 GiB)
inline int64_t max_content_length() {
  static int64_t val =
      get_env_int64("MAX_CONTENT_LENGTH", int64_t{10} * 1024 * 1024 * 1024);
  return val;
}

inline std::string ytdlp_format() {
  static std::string val = get_env_string("YTDLP_FORMAT", "bv*+ba/best");
  return val;
}

inline std::string ytdlp_bin() {
  static std::string val = get_env_string("YTDLP_BIN", "yt-dlp");
  return val;
}

inline std::string rclone_bin() {
  static std::string val = get_env_string("RCLONE_BIN", "rclone");
  return val;
}

/**
 * @brief rclone remote name artifacts are uploaded to
 * @note Empty = upload into STORAGE_DIR on the local filesystem.
 */
inline std::string rclone_remote() {
  static std::string val = get_env_string("RCLONE_REMOTE", "");
  return val;
}

/// Netscape cookie file handed to the extraction tool (empty = none)
inline std::string cookies_file() {
  static std::string val = get_env_string("COOKIES_FILE", "");
  return val;
}

// **---- STORAGE ----**

inline std::string storage_dir() {
  static std::string val =
      get_env_string("STORAGE_DIR", "/tmp/railway-downloads");
  return val;
}

inline std::string path_template() {
  static std::string val =
      get_env_string("PATH_TEMPLATE", "videos/{safe_title}-{id}.{ext}");
  return val;
}

/// Artifact lifetime before the deletion scheduler removes it
inline double file_retention_hours() {
  static double val = get_env_double("FILE_RETENTION_HOURS", 1.0);
  return val;
}

} // namespace Config
} // namespace media_relay

#endif // MEDIA_RELAY_CONFIG_HPP
