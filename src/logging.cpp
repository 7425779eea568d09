/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides:
 *          - Global log mutex
 *
 *          - TimingCollector methods and the summary table printer
 */

#include "vidpress/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace vidpress {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR -----**

void TimingCollector::record(const std::string &name, long us) {
  entries_.push_back({name, us});
}

void TimingCollector::record_since(
    const std::string &name, std::chrono::steady_clock::time_point start) {
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start)
                .count();
  record(name, static_cast<long>(us));
}

void TimingCollector::print_summary() const { print_timing_summary(entries_); }

void print_timing_summary(const std::vector<TimingEntry> &entries) {
  if (entries.empty())
    return;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print(stderr, "\n");
  fmt::print(stderr, fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print(stderr, "{:<30} {:>20}\n", "Stage", "Time (us) [sec]");
  fmt::print(stderr, "{:-<30} {:-<20}\n", "", "");

  for (const auto &e : entries) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print(stderr, "{:<30} {:>10} [{:.2f}s]\n", e.name, e.microseconds,
               seconds);
  }
  fmt::print(stderr, fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stderr);
}

} // namespace vidpress
