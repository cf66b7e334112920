/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers
 *
 *          - Time, byte-count and size-string helpers
 *
 *          - Random identifiers
 */

#include "media_relay/system.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <fmt/core.h>

namespace media_relay {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Helper to count CPUs in a cpuset string like "0,2,4-7"
int count_cpuset_string(const std::string &line) {
  int count = 0;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t end = line.find(',', pos);
    if (end == std::string::npos)
      end = line.size();

    std::string item = line.substr(pos, end - pos);
    size_t dash = item.find('-');
    char *tail = nullptr;
    if (dash == std::string::npos) {
      std::strtol(item.c_str(), &tail, 10);
      if (tail != item.c_str())
        ++count;
    } else {
      long first = std::strtol(item.substr(0, dash).c_str(), nullptr, 10);
      long last = std::strtol(item.substr(dash + 1).c_str(), nullptr, 10);
      if (last >= first)
        count += static_cast<int>(last - first + 1);
    }
    pos = end + 1;
  }
  return count;
}

/// Helper to count CPUs from a cpuset file
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  int n = count_cpuset_string(line);
  return n > 0 ? n : -1;
}

std::mt19937_64 &thread_rng() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !period_str.empty()) {
        long quota = std::strtol(quota_str.c_str(), nullptr, 10);
        long period = std::strtol(period_str.c_str(), nullptr, 10);
        if (quota > 0 && period > 0) {
          limit = static_cast<int>((quota + period - 1) / period);
        }
      }
    }
  }

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Try cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0) {
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;

  return limit;
}

int resolve_worker_count(int configured) {
  if (configured > 0)
    return configured;

  /// Pipelines are I/O-bound; two threads per CPU keeps the pool busy
  return std::max(2, detect_cpu_limit() * 2);
}

// **---- Formatting ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_bytes(uint64_t bytes) {
  static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < std::size(units)) {
    value /= 1024.0;
    ++unit;
  }
  if (unit == 0)
    return fmt::format("{} B", bytes);
  return fmt::format("{:.1f} {}", value, units[unit]);
}

std::optional<uint64_t> parse_size(std::string_view text) {
  size_t pos = 0;
  while (pos < text.size() &&
         (std::isspace(static_cast<unsigned char>(text[pos])) ||
          text[pos] == '~'))
    ++pos;

  size_t num_start = pos;
  while (pos < text.size() &&
         (std::isdigit(static_cast<unsigned char>(text[pos])) ||
          text[pos] == '.'))
    ++pos;
  if (pos == num_start)
    return std::nullopt;

  std::string number(text.substr(num_start, pos - num_start));
  char *end = nullptr;
  double value = std::strtod(number.c_str(), &end);
  if (end == number.c_str() || value < 0)
    return std::nullopt;

  while (pos < text.size() &&
         std::isspace(static_cast<unsigned char>(text[pos])))
    ++pos;

  std::string unit;
  while (pos < text.size() &&
         std::isalpha(static_cast<unsigned char>(text[pos]))) {
    unit += static_cast<char>(
        std::tolower(static_cast<unsigned char>(text[pos])));
    ++pos;
  }

  double multiplier;
  if (unit.empty() || unit == "b" || unit == "bytes" || unit == "byte")
    multiplier = 1;
  else if (unit == "kib")
    multiplier = 1024.0;
  else if (unit == "mib")
    multiplier = 1024.0 * 1024;
  else if (unit == "gib")
    multiplier = 1024.0 * 1024 * 1024;
  else if (unit == "tib")
    multiplier = 1024.0 * 1024 * 1024 * 1024;
  else if (unit == "kb" || unit == "k")
    multiplier = 1e3;
  else if (unit == "mb" || unit == "m")
    multiplier = 1e6;
  else if (unit == "gb" || unit == "g")
    multiplier = 1e9;
  else if (unit == "tb" || unit == "t")
    multiplier = 1e12;
  else
    return std::nullopt;

  return static_cast<uint64_t>(std::llround(value * multiplier));
}

// **---- Identifiers ----**

std::string random_hex(size_t bytes) {
  std::uniform_int_distribution<int> dist(0, 255);
  std::string out;
  out.reserve(bytes * 2);
  for (size_t i = 0; i < bytes; ++i)
    out += fmt::format("{:02x}", dist(thread_rng()));
  return out;
}

std::string make_uuid() {
  std::uniform_int_distribution<int> dist(0, 255);
  unsigned char b[16];
  for (auto &byte : b)
    byte = static_cast<unsigned char>(dist(thread_rng()));

  b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40); //< version 4
  b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80); //< variant 10

  return fmt::format("{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-"
                     "{:02x}{:02x}-{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
                     b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7], b[8],
                     b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
}

} // namespace media_relay
