/**
 * @file batch_processor.cpp
 * @brief Parallel compression implementation
 */

#include "vidpress/batch_processor.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <functional>
#include <system_error>
#include <thread>

#include <fmt/color.h>
#include <fmt/core.h>

#include "vidpress/file_validator.hpp"
#include "vidpress/logging.hpp"
#include "vidpress/system.hpp"

namespace vidpress {

namespace fs = std::filesystem;

std::vector<std::string> collect_inputs(const std::string &input_dir,
                                        const Settings &settings) {
  std::vector<std::string> files;
  std::error_code ec;
  for (fs::directory_iterator it(input_dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_regular_file(ec))
      continue;
    const std::string ext = FileValidator::extension_of(it->path().string());
    const auto &allowed = settings.allowed_extensions;
    if (std::find(allowed.begin(), allowed.end(), ext) != allowed.end()) {
      files.push_back(it->path().string());
    }
  }
  if (ec) {
    LOG_ERROR("Cannot list {}: {}", input_dir, ec.message());
  }
  std::sort(files.begin(), files.end());
  return files;
}

BatchProcessor::BatchProcessor(const CompressionService &service,
                               int num_workers)
    : service_(service),
      num_workers_(calculate_parallel_streams(num_workers)) {}

int BatchProcessor::process(const std::vector<std::string> &input_files,
                            const std::string &options_json) {
  if (input_files.empty()) {
    LOG_WARN("No input files to process");
    return 0;
  }

  for (const auto &file : input_files) {
    work_queue_.push(file);
  }
  total_files_ = static_cast<int>(input_files.size());
  files_done_.store(0);

  int workers = std::min(num_workers_, total_files_);

  LOG_PHASE("================== BATCH PROCESSING ==================");
  LOG_INFO("Files to process: {}", total_files_);
  LOG_INFO("Parallel workers: {}", workers);
  LOG_PHASE("=======================================================");

  auto batch_start = std::chrono::steady_clock::now();

  std::vector<std::thread> threads;
  for (int i = 0; i < workers; ++i) {
    threads.emplace_back(&BatchProcessor::worker, this, i,
                         std::cref(options_json));
  }
  for (auto &t : threads) {
    t.join();
  }

  double elapsed_sec = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - batch_start)
                           .count();
  print_batch_summary(elapsed_sec);

  return static_cast<int>(
      std::count_if(results_.begin(), results_.end(),
                    [](const BatchItemResult &r) { return !r.success; }));
}

bool BatchProcessor::get_next_file(std::string &file) {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  if (work_queue_.empty()) {
    return false;
  }
  file = work_queue_.front();
  work_queue_.pop();
  return true;
}

void BatchProcessor::worker(int worker_id, const std::string &options_json) {
  std::string file;
  while (get_next_file(file)) {
    BatchItemResult result;
    result.filename = fs::path(file).filename().string();

    LOG_PHASE("[Worker {}] ----------------------------------------",
              worker_id);
    LOG_INFO("[Worker {}] Processing: {} ({}/{})", worker_id, result.filename,
             files_done_.load() + 1, total_files_);

    auto start_time = std::chrono::steady_clock::now();
    auto outcome = service_.handle(file, options_json);
    result.processing_time_us = static_cast<long>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time)
            .count());

    if (is_error(outcome)) {
      result.success = false;
      result.payload = error_of(outcome);
      LOG_ERROR("[Worker {}] Failed: {}: {}", worker_id, result.filename,
                error_of(outcome).message);
    } else {
      result.success = true;
      result.payload = std::get<CompressionResponse>(outcome);
      LOG_SUCCESS("[Worker {}] Completed: {} ({:.1f}s)", worker_id,
                  result.filename, result.processing_time_us / 1000000.0);
    }
    result.payload["file"] = result.filename;

    {
      std::lock_guard<std::mutex> lock(results_mutex_);
      results_.push_back(std::move(result));
    }
    ++files_done_;
  }

  LOG_INFO("[Worker {}] Finished (no more files)", worker_id);
}

void BatchProcessor::print_batch_summary(double wall_clock_sec) const {
  int total = static_cast<int>(results_.size());
  int success = 0;
  long total_time_us = 0;
  for (const auto &result : results_) {
    if (result.success)
      success++;
    total_time_us += result.processing_time_us;
  }
  int failed = total - success;

  double sum_time_sec = total_time_us / 1000000.0;
  double speedup = (wall_clock_sec > 0) ? sum_time_sec / wall_clock_sec : 1.0;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print(stderr, "\n");
  fmt::print(stderr, fg(fmt::color::cyan),
             "============== BATCH PROCESSING SUMMARY ==============\n");
  fmt::print(stderr, "{:<25} {:>25}\n", "Total files:", total);
  fmt::print(stderr, "{:<25} {:>25}\n", "Successful:", success);
  fmt::print(stderr, "{:<25} {:>25}\n", "Failed:", failed);
  fmt::print(stderr, "{:<25} {:>25}\n", "Parallel workers:", num_workers_);
  fmt::print(stderr, "{:<25} {:>25}\n", "Wall-clock time:",
             format_time(wall_clock_sec));
  fmt::print(stderr, "{:<25} {:>22.1f}s\n", "Sum of file times:",
             sum_time_sec);
  fmt::print(stderr, "{:<25} {:>22.2f}x\n", "Speedup:", speedup);
  if (total > 0) {
    fmt::print(stderr, "{:<25} {:>22.1f}s\n", "Average time per file:",
               sum_time_sec / total);
  }
  fmt::print(stderr, fg(fmt::color::cyan),
             "======================================================\n");

  if (failed > 0) {
    fmt::print(stderr, fg(fmt::color::red), "\nFailed files:\n");
    for (const auto &result : results_) {
      if (!result.success) {
        fmt::print(stderr, fg(fmt::color::red), "  - {}\n", result.filename);
      }
    }
  }
  std::fflush(stderr);
}

} // namespace vidpress
