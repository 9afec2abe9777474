/**
 * @file system.hpp
 * @brief System utilities: CPU detection, disk space and formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Free disk space query for the disk-space gate
 *
 *          - Time and byte-size formatting utilities
 */

#ifndef VIDSHRINK_SYSTEM_HPP
#define VIDSHRINK_SYSTEM_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace vidshrink {

// **----- CPU Detection -----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

// **----- Disk Space -----**

/**
 * @brief Bytes available to this process on the filesystem holding @p dir.
 * @return nullopt if the filesystem cannot be queried
 */
std::optional<uint64_t> free_space_bytes(const std::filesystem::path &dir);

// **----- Utilities -----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/// Current local time as "YYYY-MM-DD HH:MM:SS"
std::string local_timestamp();

/**
 * @brief Format a byte count with a binary unit ("1.50 GB", "420.0 MB").
 */
std::string format_bytes(uint64_t bytes);

} // namespace vidshrink

#endif // VIDSHRINK_SYSTEM_HPP
