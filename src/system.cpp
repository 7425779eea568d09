/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Cgroup files are read best-effort; any unreadable or malformed
 *          file simply counts as "no limit from this source".
 */

#include "vidpress/system.hpp"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <thread>

#include <fmt/core.h>

namespace vidpress {

// **---- Internal Helpers ----**

namespace {

constexpr int MAX_CPUS = 64;

/// Parse a whole decimal string; -1 when not a positive number
long parse_positive(const std::string &text) {
  if (text.empty())
    return -1;
  char *end = nullptr;
  long val = std::strtol(text.c_str(), &end, 10);
  if (*end != '\0' || val <= 0)
    return -1;
  return val;
}

/// Parse a CPU id (zero allowed); -1 when malformed
long parse_cpu_id(const std::string &text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
    return -1;
  return std::strtol(text.c_str(), nullptr, 10);
}

std::string read_first_line(const char *path) {
  std::ifstream f(path);
  std::string line;
  if (f) {
    std::getline(f, line);
  }
  return line;
}

/// CPUs granted by a CFS quota, rounded up; -1 when unlimited or unknown
int quota_cpus(long quota, long period) {
  if (quota <= 0 || period <= 0)
    return -1;
  return static_cast<int>((quota + period - 1) / period);
}

int cgroup_v2_quota() {
  std::ifstream f("/sys/fs/cgroup/cpu.max");
  if (!f)
    return -1;
  std::string quota, period;
  f >> quota >> period;
  if (quota == "max")
    return -1;
  return quota_cpus(parse_positive(quota), parse_positive(period));
}

int cgroup_v1_quota() {
  return quota_cpus(
      parse_positive(read_first_line("/sys/fs/cgroup/cpu/cpu.cfs_quota_us")),
      parse_positive(read_first_line("/sys/fs/cgroup/cpu/cpu.cfs_period_us")));
}

int cpuset_count() {
  for (const char *path : {"/sys/fs/cgroup/cpuset.cpus.effective",
                           "/sys/fs/cgroup/cpuset/cpuset.cpus"}) {
    auto cpus = parse_cpuset(read_first_line(path));
    if (!cpus.empty())
      return static_cast<int>(cpus.size());
  }
  return -1;
}

} // anonymous namespace

// **---- CPU Detection ----**

std::vector<int> parse_cpuset(const std::string &line) {
  std::vector<int> cpus;
  std::size_t pos = 0;
  while (pos < line.size()) {
    std::size_t comma = line.find(',', pos);
    if (comma == std::string::npos)
      comma = line.size();
    std::string item = line.substr(pos, comma - pos);
    pos = comma + 1;
    if (item.empty())
      continue;

    std::size_t dash = item.find('-');
    long first = parse_cpu_id(item.substr(0, dash));
    long last = dash == std::string::npos ? first
                                          : parse_cpu_id(item.substr(dash + 1));
    if (first < 0 || last < first)
      return {};

    for (long cpu = first; cpu <= last; ++cpu) {
      cpus.push_back(static_cast<int>(cpu));
    }
  }
  return cpus;
}

int detect_cpu_limit() {
  int limit = cgroup_v2_quota();
  if (limit <= 0) {
    limit = cgroup_v1_quota();
  }

  int cpuset = cpuset_count();
  if (cpuset > limit) {
    limit = cpuset;
  }

  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }
  if (limit <= 0)
    limit = 1;
  return std::min(limit, MAX_CPUS);
}

int calculate_parallel_streams(int configured) {
  int available = detect_cpu_limit();
  if (configured <= 0) {
    return std::max(1, available);
  }
  return std::max(1, std::min(configured, available));
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int total = static_cast<int>(seconds);
  return fmt::format("{:02d}:{:02d}:{:02d}", total / 3600, (total % 3600) / 60,
                     total % 60);
}

std::string format_iso8601_utc(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

} // namespace vidpress
