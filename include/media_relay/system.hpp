/**
 * @file system.hpp
 * @brief System utilities: CPU detection, formatting and identifiers
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers
 *
 *          - Time, byte-count and size-string helpers for logs and
 *            progress parsing
 *
 *          - Random identifiers for deletion tasks and path templates
 *
 * @note In containers std::thread::hardware_concurrency() reports the host's
 *       cores; detect_cpu_limit() honours the cgroup quota instead.
 */

#ifndef MEDIA_RELAY_SYSTEM_HPP
#define MEDIA_RELAY_SYSTEM_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace media_relay {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note Supports:
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cpuset: `cpuset.cpus.effective` / `cpuset.cpus`
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

/**
 * @brief Worker pool size for a configured value.
 * @param configured WORKERS setting (0 = auto-detect)
 * @return Number of worker threads, at least 1
 */
int resolve_worker_count(int configured);

// **---- Formatting ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Human readable byte count, e.g. "12.3 MiB".
 */
std::string format_bytes(uint64_t bytes);

/**
 * @brief Parse a size as printed by yt-dlp or rclone.
 *
 * @note Accepts an optional leading '~', a decimal number, optional
 *       whitespace and a unit: B, Bytes, KiB/MiB/GiB/TiB (1024-based),
 *       kB/KB/MB/GB/TB (1000-based). A bare number is bytes.
 *
 * @return Size in bytes, or nullopt when the text is not a size
 */
std::optional<uint64_t> parse_size(std::string_view text);

// **---- Identifiers ----**

/// Random lowercase hex string of 2 * bytes characters
std::string random_hex(size_t bytes);

/// Random RFC 4122 version 4 UUID string
std::string make_uuid();

} // namespace media_relay

#endif // MEDIA_RELAY_SYSTEM_HPP
