/**
 * @file logging.hpp
 * @brief Logging macros, log sinks and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - LogSink: optional per-job (message, level) callback
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for aggregating phase durations
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so they interleave correctly with child process output.
 *
 */

#ifndef MEDIA_RELAY_LOGGING_HPP
#define MEDIA_RELAY_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace media_relay {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/// Run-time switch for LOG_DEBUG, initialised from Config::debug()
bool debug_enabled();

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (media_relay::debug_enabled()) {                                        \
      std::lock_guard<std::mutex> lock(media_relay::log_mutex);                \
      fmt::print(fg(fmt::color::gray), "[DEBUG] " format_str "\n",             \
                 ##__VA_ARGS__);                                               \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_relay::log_mutex);                  \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_relay::log_mutex);                  \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_relay::log_mutex);                  \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_relay::log_mutex);                  \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_relay::log_mutex);                  \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_DEBUG(...) ((void)0)
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

/**
 * @brief Run a logging statement from a noexcept path.
 * @note A failed write is reported with a raw stderr line instead of
 *       propagating out of the caller.
 */
template <typename Fn> void log_noexcept(Fn &&fn) noexcept {
  try {
    fn();
  } catch (const std::exception &e) {
    std::fprintf(stderr, "[media_relay] log write failed: %s\n", e.what());
  }
}

// **----- LOG SINKS -----**

enum class LogLevel { Debug, Info, Warning, Error };

/// Name used both in process logs and when forwarding to a sink
const char *log_level_name(LogLevel level);

/**
 * @brief Optional (message, level) callback attached to a job or deletion.
 * @note An empty sink is valid and simply drops messages.
 */
using LogSink = std::function<void(const std::string &, LogLevel)>;

/**
 * @brief Write a message to the process log and forward it to a sink.
 *
 * @param sink Destination for the un-prefixed message (may be empty)
 * @param level Severity
 * @param prefix Tag prepended in the process log only, e.g. "[job-42]"
 * @param message Message text
 *
 * @attention Exceptions thrown by the sink are caught and logged; a broken
 *            sink never interrupts the caller.
 */
void emit(const LogSink &sink, LogLevel level, const std::string &prefix,
          const std::string &message);

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 * @note Stores the phase name and duration in microseconds.
 */
struct TimingEntry {
  std::string name;  //< Function or phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe collector for phase timing measurements.
 * @note All worker threads can safely record their timings here.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Function or phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Print collected timings aggregated per phase.
   *        Called at program end for summary.
   */
  static void print_summary();

  /**
   * @brief Clear all collected timings.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    media_relay::TimingCollector::record(#name, timer_duration_##name);        \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace media_relay

#endif // MEDIA_RELAY_LOGGING_HPP
