/**
 * @file system.hpp
 * @brief System utilities: CPU budget detection and time formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers
 *
 *          - Worker count selection for batch mode
 *
 *          - Clock-time and wall-time formatting
 *
 * @note Inside a container std::thread::hardware_concurrency() reports the
 *       host's cores; the cgroup quota or cpuset is the real budget.
 */

#ifndef VIDPRESS_SYSTEM_HPP
#define VIDPRESS_SYSTEM_HPP

#include <chrono>
#include <string>
#include <vector>

namespace vidpress {

// **---- CPU Detection ----**

/**
 * @brief Number of CPUs this process may use.
 *
 * @note Sources, first hit wins for the quota:
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cgroup v1: `cpu.cfs_quota_us` / `cpu.cfs_period_us`
 *
 *       A cpuset larger than the quota raises the result. Falls back to
 *       hardware_concurrency(), clamped to [1, 64].
 */
int detect_cpu_limit();

/**
 * @brief Parse a cpuset list such as "0-3,8,10-11" into CPU ids.
 * @return Empty on malformed input
 */
std::vector<int> parse_cpuset(const std::string &line);

/**
 * @brief Worker threads for batch mode.
 * @param configured PARALLEL_STREAMS value (0 = auto)
 * @return min(configured, detected) or detected when auto; at least 1
 */
int calculate_parallel_streams(int configured);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 */
std::string format_time(double seconds);

/**
 * @brief Render a wall-clock instant as ISO-8601 UTC ("2024-01-31T12:00:00Z").
 */
std::string format_iso8601_utc(std::chrono::system_clock::time_point tp);

} // namespace vidpress

#endif // VIDPRESS_SYSTEM_HPP
