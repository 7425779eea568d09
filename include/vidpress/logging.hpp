/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - TimingCollector for per-request stage timings
 *
 * @note All logs use fmt::print for type-safe formatting and are written to
 *       stderr, flushed immediately. stdout is reserved for the JSON result.
 *
 */

#ifndef VIDPRESS_LOGGING_HPP
#define VIDPRESS_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "types.hpp"

namespace vidpress {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by VIDPRESS_ENABLE_LOGGING at compile time.
 */
#ifndef VIDPRESS_ENABLE_LOGGING
#define VIDPRESS_ENABLE_LOGGING 1
#endif

#ifndef VIDPRESS_ENABLE_TIMING
#define VIDPRESS_ENABLE_TIMING 1
#endif

/// Serializes every line written to stderr (defined in logging.cpp)
extern std::mutex log_mutex;

namespace detail {

/**
 * @brief Format one message and write it as a single styled stderr line.
 * @note Formatting happens before the lock is taken.
 */
template <typename... Args>
void log_line(const fmt::text_style &style, fmt::format_string<Args...> format,
              Args &&...args) {
  const std::string text = fmt::format(format, std::forward<Args>(args)...);
  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print(stderr, style, "{}\n", text);
  std::fflush(stderr);
}

} // namespace detail

// **----- LOGGING MACROS -----**

#if VIDPRESS_ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  ::vidpress::detail::log_line(fmt::text_style{}, "[INFO] " format_str,       \
                               ##__VA_ARGS__)
#define LOG_WARN(format_str, ...)                                              \
  ::vidpress::detail::log_line(fg(fmt::color::yellow), "[WARN] " format_str,  \
                               ##__VA_ARGS__)
#define LOG_ERROR(format_str, ...)                                             \
  ::vidpress::detail::log_line(fg(fmt::color::red), "[ERROR] " format_str,    \
                               ##__VA_ARGS__)
#define LOG_PHASE(format_str, ...)                                             \
  ::vidpress::detail::log_line(fg(fmt::color::cyan), format_str, ##__VA_ARGS__)
#define LOG_SUCCESS(format_str, ...)                                           \
  ::vidpress::detail::log_line(fg(fmt::color::green), format_str,             \
                               ##__VA_ARGS__)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @class TimingCollector
 * @brief Collects stage timings for a single request.
 * @note One instance per request; requests never share a collector.
 */
class TimingCollector {
  std::vector<TimingEntry> entries_;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Stage name
   * @param us Duration in microseconds
   */
  void record(const std::string &name, long us);

  /// Record the time elapsed since start
  void record_since(const std::string &name,
                    std::chrono::steady_clock::time_point start);

  /**
   * @brief Print all collected timings as a formatted table on stderr.
   */
  void print_summary() const;

  const std::vector<TimingEntry> &entries() const { return entries_; }

  /**
   * @brief Hand the collected entries over, leaving the collector empty.
   */
  std::vector<TimingEntry> extract() {
    std::vector<TimingEntry> out;
    out.swap(entries_);
    return out;
  }
};

/**
 * @brief Print an already-extracted list of timings as a table.
 */
void print_timing_summary(const std::vector<TimingEntry> &entries);

// **----- TIMING MACROS -----**

#if VIDPRESS_ENABLE_TIMING
#define TIMER_START(name)                                                      \
  const auto vidpress_timer_##name = std::chrono::steady_clock::now()
#define TIMER_END(collector, name)                                             \
  (collector).record_since(#name, vidpress_timer_##name)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(collector, name) ((void)0)
#endif

} // namespace vidpress

#endif // VIDPRESS_LOGGING_HPP
