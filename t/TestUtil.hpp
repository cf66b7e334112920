/**
 * @file TestUtil.hpp
 * @brief Helpers shared by the test executables
 *
 * @details Temporary directories, polling waits, fake tool scripts and
 *          process liveness checks.
 */

#ifndef MEDIA_RELAY_TEST_UTIL_HPP
#define MEDIA_RELAY_TEST_UTIL_HPP

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <signal.h>
#include <sys/types.h>

#include "media_relay/logging.hpp"

namespace media_relay::test {

namespace fs = std::filesystem;

/**
 * @class TempDir
 * @brief Fresh directory below /tmp, removed recursively on destruction.
 */
class TempDir {
public:
  TempDir() {
    char pattern[] = "/tmp/media_relay_test.XXXXXX";
    if (mkdtemp(pattern) == nullptr)
      throw std::runtime_error("mkdtemp failed");
    path_ = pattern;
  }

  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }
  fs::path operator/(const std::string &name) const { return path_ / name; }

private:
  fs::path path_;
};

/// Poll pred every 10ms until it holds or timeout passes
template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline)
      return pred();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}

inline void write_file(const fs::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

/// Executable /bin/sh script standing in for an external tool
inline fs::path write_script(const fs::path &path, const std::string &body) {
  write_file(path, "#!/bin/sh\n" + body + "\n");
  fs::permissions(path, fs::perms::owner_all);
  return path;
}

/// PIDs a fake tool appended to its pid file, one per line
inline std::vector<pid_t> read_pids(const fs::path &path) {
  std::vector<pid_t> pids;
  std::ifstream in(path);
  long pid;
  while (in >> pid)
    pids.push_back(static_cast<pid_t>(pid));
  return pids;
}

/// Running or stopped; a zombie waiting to be reaped counts as gone
inline bool process_alive(pid_t pid) {
  if (pid <= 0 || (kill(pid, 0) == -1 && errno != EPERM))
    return false;

  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  std::string line;
  if (!std::getline(stat, line))
    return false;
  /// State follows the parenthesised command name
  size_t close = line.rfind(')');
  return close == std::string::npos || close + 2 >= line.size() ||
         line[close + 2] != 'Z';
}

/**
 * @class RecordingSink
 * @brief LogSink target keeping every message for later inspection.
 */
class RecordingSink {
public:
  LogSink sink() {
    return [this](const std::string &message, LogLevel level) {
      std::lock_guard<std::mutex> lock(mutex_);
      entries_.emplace_back(level, message);
    };
  }

  std::vector<std::pair<LogLevel, std::string>> entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
  }

  bool contains(LogLevel level, const std::string &needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[l, message] : entries_)
      if (l == level && message.find(needle) != std::string::npos)
        return true;
    return false;
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::pair<LogLevel, std::string>> entries_;
};

} // namespace media_relay::test

#endif // MEDIA_RELAY_TEST_UTIL_HPP
