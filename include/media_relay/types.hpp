/**
 * @file types.hpp
 * @brief Core data types and constants for media_relay
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Cache alignment and I/O buffer constants
 *
 *          - PaddedAtomic for counters shared between worker threads
 *
 *          - Job lifecycle states and status snapshots
 *
 *          - Metadata alias for extracted media records
 */

#ifndef MEDIA_RELAY_TYPES_HPP
#define MEDIA_RELAY_TYPES_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace media_relay {

// **----- CONSTANTS -----**

/**
 * @brief Size of a single non-blocking read from a child's stderr pipe.
 */
constexpr size_t PIPE_READ_SIZE = 4096;

/**
 * @brief Bytes of a child's stderr retained for error reports.
 * @note Only the tail is kept; long downloads print megabytes of progress.
 */
constexpr size_t STDERR_TAIL_BYTES = 4096;

/**
 * @brief CPU cache line size for alignment.
 * @note Most modern CPUs use 64-byte cache lines.
 */
constexpr size_t CACHE_LINE_SIZE = 64;

// **----- DATA STRUCTURES -----**

/**
 * @brief Metadata record produced by the extraction tool's probe mode.
 * @note Immutable once captured; used to render the destination path.
 */
using Metadata = nlohmann::json;

/**
 * @struct PaddedAtomic
 * @brief Cache-line aligned atomic to prevent false sharing.
 * @note Worker threads bump lifetime counters concurrently; each counter
 *       lives on its own cache line.
 */
template <typename T> struct alignas(CACHE_LINE_SIZE) PaddedAtomic {
  std::atomic<T> value{0};

  PaddedAtomic() = default;
  explicit PaddedAtomic(T v) : value(v) {}

  T load(std::memory_order order = std::memory_order_seq_cst) const {
    return value.load(order);
  }
  void store(T v, std::memory_order order = std::memory_order_seq_cst) {
    value.store(v, order);
  }
  T operator++() { return ++value; }
  T operator++(int) { return value++; }
  PaddedAtomic &operator+=(T v) {
    value += v;
    return *this;
  }
};

/**
 * @brief Lifecycle of a submitted job.
 * @note pending -> running -> {completed | failed | cancelled}; a pending job
 *       may also go straight to cancelled.
 */
enum class JobState { Pending, Running, Completed, Failed, Cancelled };

const char *job_state_name(JobState state);

inline bool is_terminal(JobState state) {
  return state == JobState::Completed || state == JobState::Failed ||
         state == JobState::Cancelled;
}

/**
 * @struct JobStatusInfo
 * @brief Snapshot returned by QueueManager::status().
 */
struct JobStatusInfo {
  std::string job_id;
  JobState state = JobState::Pending;
  bool running = false;
  bool done = false;
  bool cancelled = false;
  std::optional<bool> success;           //< Set once done and not cancelled
  std::optional<std::string> error;      //< what() of the terminal error
  std::optional<std::string> error_kind; //< error_kind_name() if typed
};

/**
 * @struct QueueStats
 * @brief Snapshot returned by QueueManager::stats().
 */
struct QueueStats {
  bool started = false;
  int max_workers = 0;
  int max_concurrent = 0;
  size_t active = 0;    //< Jobs in the active table
  size_t running = 0;   //< Of those, currently executing
  size_t completed = 0; //< Of those, terminal but not yet removed
  uint64_t total_submitted = 0;
  uint64_t total_succeeded = 0;
  uint64_t total_failed = 0;
  bool shutdown_pending = false;
};

nlohmann::json to_json(const JobStatusInfo &info);
nlohmann::json to_json(const QueueStats &stats);

} // namespace media_relay

#endif // MEDIA_RELAY_TYPES_HPP
