/**
 * @file logging.cpp
 * @brief Logging, log sink and timing utilities implementation
 *
 * @details Provides:
 *          - Global log mutex
 *
 *          - emit(): process log + sink forwarding
 *
 *          - TimingCollector static members and methods
 */

#include "media_relay/logging.hpp"

#include <algorithm>
#include <exception>
#include <map>

#include <fmt/color.h>
#include <fmt/core.h>

#include "media_relay/config.hpp"

namespace media_relay {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

bool debug_enabled() {
  static const bool enabled = Config::debug();
  return enabled;
}

// **----- LOG SINKS -----**

const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

void emit(const LogSink &sink, LogLevel level, const std::string &prefix,
          const std::string &message) {
  switch (level) {
  case LogLevel::Debug:
    LOG_DEBUG("{} {}", prefix, message);
    break;
  case LogLevel::Info:
    LOG_INFO("{} {}", prefix, message);
    break;
  case LogLevel::Warning:
    LOG_WARN("{} {}", prefix, message);
    break;
  case LogLevel::Error:
    LOG_ERROR("{} {}", prefix, message);
    break;
  }

  if (!sink)
    return;

  try {
    sink(message, level);
  } catch (const std::exception &e) {
    LOG_WARN("{} Log sink failed: {}", prefix, e.what());
  }
}

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  /// Jobs run concurrently, so aggregate per phase instead of listing
  struct Aggregate {
    long count = 0;
    long total_us = 0;
    long max_us = 0;
  };
  std::map<std::string, Aggregate> phases;
  for (const auto &e : entries) {
    auto &a = phases[e.name];
    ++a.count;
    a.total_us += e.microseconds;
    a.max_us = std::max(a.max_us, e.microseconds);
  }

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "======================= TIMING SUMMARY =======================\n");
  fmt::print("{:<24} {:>6} {:>14} {:>14}\n", "Phase", "Count", "Avg [sec]",
             "Max [sec]");
  fmt::print("{:-<24} {:-<6} {:-<14} {:-<14}\n", "", "", "", "");

  for (const auto &[name, a] : phases) {
    double avg = a.total_us / 1000000.0 / a.count;
    double max = a.max_us / 1000000.0;
    fmt::print("{:<24} {:>6} {:>13.2f}s {:>13.2f}s\n", name, a.count, avg, max);
  }
  fmt::print(fg(fmt::color::cyan),
             "==============================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace media_relay
